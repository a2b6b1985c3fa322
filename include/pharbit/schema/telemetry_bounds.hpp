#pragma once

#include <cstdint>

// Schema type: telemetry bounds.
// Supply chain workflow: acceptable storage envelope. Temperatures are in
// tenths of a degree Celsius, humidity in tenths of a percent.
namespace pharbit::schema {

inline constexpr uint32_t kMaxHumidityPermille = 1000;

template <uint16_t Version>
struct telemetry_bounds;

template <>
struct telemetry_bounds<1> final {
  uint16_t version{1};
  int32_t min_temperature{20};
  int32_t max_temperature{80};
  uint32_t max_humidity{kMaxHumidityPermille};
};

using telemetry_bounds_t = telemetry_bounds<1>;

}  // namespace pharbit::schema
