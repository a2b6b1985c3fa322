#pragma once

#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Supply chain workflow: per-command results of an ordered command list plus
// the state root after the last one.
namespace pharbit::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root;
};

using block_result_t = block_result<1>;

}  // namespace pharbit::schema
