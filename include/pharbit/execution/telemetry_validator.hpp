#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/execution/outcome.hpp>
#include <pharbit/schema/bind_sensor.hpp>
#include <pharbit/schema/record_telemetry.hpp>
#include <pharbit/schema/set_staleness_window.hpp>
#include <pharbit/schema/set_telemetry_bounds.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace pharbit::execution {

/// min < max and humidity within 0..100.0 percent.
std::optional<command_error> validate_bounds(
    const pharbit::schema::telemetry_bounds_t& bounds);

/// Regulator-gated bounds update, global or per batch.
command_outcome set_telemetry_bounds(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::set_telemetry_bounds_t& command);

command_outcome apply_set_telemetry_bounds(
    ledger_state& state,
    const pharbit::schema::set_telemetry_bounds_t& command);

command_outcome apply_set_staleness_window(
    ledger_state& state,
    const pharbit::schema::set_staleness_window_t& command);

/// Allow a sensor device to report for a batch. Callable by the producer or
/// the current custodian.
command_outcome bind_sensor(ledger_state& state,
                            const command_context& context,
                            const pharbit::schema::bind_sensor_t& command);

/// Append a reading. Validity is computed once against the bounds in force
/// and never revisited.
command_outcome record_telemetry(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::record_telemetry_t& command);

/// Per-batch override when installed, otherwise the global default.
pharbit::schema::telemetry_bounds_t bounds_for(
    const ledger_state& state,
    const pharbit::schema::batch_id_t& batch_id);

/// Fails with `batch_missing` for unknown batches and `telemetry_missing`
/// for batches without readings.
query_outcome<pharbit::schema::telemetry_reading_t> latest_reading(
    const ledger_state& state,
    const pharbit::schema::batch_id_t& batch_id);

/// Readings in insertion order.
query_outcome<std::vector<pharbit::schema::telemetry_reading_t>>
telemetry_history(
    const ledger_state& state,
    const pharbit::schema::batch_id_t& batch_id);

query_outcome<pharbit::schema::telemetry_reading_t> reading_at(
    const ledger_state& state,
    const pharbit::schema::batch_id_t& batch_id,
    std::size_t index);

}  // namespace pharbit::execution
