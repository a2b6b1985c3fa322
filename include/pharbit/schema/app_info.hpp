#pragma once

#include <pharbit/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace pharbit::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"pharbit-ledger"};
  std::string version{"0.1.0"};
  uint64_t last_sequence{};
  timestamp_milliseconds_t last_timestamp{};
  hash32_t state_root;
};

using app_info_t = app_info<1>;

}  // namespace pharbit::schema
