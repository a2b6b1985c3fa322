#pragma once

#include <pharbit/schema/primitives.hpp>

// Telemetry command: allow a device to report for one batch.
namespace pharbit::schema {

template <uint16_t Version>
struct bind_sensor;

template <>
struct bind_sensor<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  identity_t device{};
};

using bind_sensor_t = bind_sensor<1>;

}  // namespace pharbit::schema
