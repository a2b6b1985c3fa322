#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>

// Schema type: telemetry reading.
// Supply chain workflow: one sensor sample. `valid` is computed against the
// bounds in force at ingestion and never recomputed.
namespace pharbit::schema {

template <uint16_t Version>
struct telemetry_reading;

template <>
struct telemetry_reading<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  int32_t temperature{};
  uint32_t humidity{};
  std::string location;
  timestamp_milliseconds_t recorded_at{};
  identity_t device{};
  bool valid{};
};

using telemetry_reading_t = telemetry_reading<1>;

}  // namespace pharbit::schema
