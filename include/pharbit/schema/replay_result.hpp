#pragma once

#include <pharbit/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: replay result.
// Supply chain workflow: determinism check of persisted history against the
// committed state root.
namespace pharbit::schema {

template <uint16_t Version>
struct replay_result;

template <>
struct replay_result<1> final {
  uint16_t version{1};
  bool ok{};
  uint64_t tx_count{};
  uint64_t applied_count{};
  hash32_t state_root;
  std::string error;
};

using replay_result_t = replay_result<1>;

}  // namespace pharbit::schema
