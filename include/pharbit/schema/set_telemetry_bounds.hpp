#pragma once

#include <optional>
#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/telemetry_bounds.hpp>

// Telemetry command: replace the global bounds or install a per-batch override.
namespace pharbit::schema {

template <uint16_t Version>
struct set_telemetry_bounds;

template <>
struct set_telemetry_bounds<1> final {
  uint16_t version{1};
  std::optional<batch_id_t> batch_id;
  telemetry_bounds_t bounds;
};

using set_telemetry_bounds_t = set_telemetry_bounds<1>;

}  // namespace pharbit::schema
