#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>

// Telemetry command: append one validated sensor reading.
namespace pharbit::schema {

template <uint16_t Version>
struct record_telemetry;

template <>
struct record_telemetry<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  int32_t temperature{};
  uint32_t humidity{};
  std::string location;
  timestamp_milliseconds_t recorded_at{};
};

using record_telemetry_t = record_telemetry<1>;

}  // namespace pharbit::schema
