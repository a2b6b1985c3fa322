#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>

// Batch ledger command: hand a batch to the next custodian.
namespace pharbit::schema {

template <uint16_t Version>
struct transfer_custody;

template <>
struct transfer_custody<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  identity_t new_custodian{};
  std::string reason;
  std::string location;
};

using transfer_custody_t = transfer_custody<1>;

}  // namespace pharbit::schema
