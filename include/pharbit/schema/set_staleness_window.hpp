#pragma once

#include <pharbit/schema/primitives.hpp>

// Governance action: change the telemetry acceptance window.
namespace pharbit::schema {

template <uint16_t Version>
struct set_staleness_window;

template <>
struct set_staleness_window<1> final {
  uint16_t version{1};
  duration_milliseconds_t window{};
};

using set_staleness_window_t = set_staleness_window<1>;

}  // namespace pharbit::schema
