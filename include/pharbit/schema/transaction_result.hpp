#pragma once

#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace pharbit::schema {

template <uint16_t Version>
struct transaction_result;

/// Outcome of one command. `code` is 0 on success or an `error_code`;
/// `data` carries SCALE-encoded generated values (record ids, vote outcome).
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  uint64_t sequence{};
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace pharbit::schema
