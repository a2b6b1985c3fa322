#pragma once

#include <pharbit/schema/primitives.hpp>

// Schema type: ledger parameters.
// Supply chain workflow: administrative knobs changed by admins or by
// executed governance proposals.
namespace pharbit::schema {

template <uint16_t Version>
struct ledger_parameters;

template <>
struct ledger_parameters<1> final {
  uint16_t version{1};
  duration_milliseconds_t telemetry_staleness_window{kMillisecondsPerDay};
  bool require_sensor_binding{};
  bool paused{};
};

using ledger_parameters_t = ledger_parameters<1>;

}  // namespace pharbit::schema
