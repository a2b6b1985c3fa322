#include <spdlog/spdlog.h>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/permissions.hpp>
#include <pharbit/execution/telemetry_validator.hpp>
#include <iterator>
#include <string>

using namespace pharbit::schema;

namespace pharbit::execution {

std::optional<command_error> validate_bounds(const telemetry_bounds_t& bounds) {
  if (bounds.min_temperature >= bounds.max_temperature) {
    return make_error(error_code::invalid_telemetry_bounds,
                      "minimum temperature must be below maximum");
  }
  if (bounds.max_humidity > kMaxHumidityPermille) {
    return make_error(error_code::invalid_telemetry_bounds,
                      "humidity bound exceeds 100 percent");
  }
  return std::nullopt;
}

command_outcome apply_set_telemetry_bounds(
    ledger_state& state,
    const set_telemetry_bounds_t& command) {
  if (auto error = validate_bounds(command.bounds)) {
    return *error;
  }
  auto scope = std::string{"global"};
  if (command.batch_id) {
    if (!state.batches.contains(*command.batch_id)) {
      return make_error(error_code::batch_missing, "batch not found");
    }
    state.batch_bounds[*command.batch_id] = command.bounds;
    scope = *command.batch_id;
  } else {
    state.default_bounds = command.bounds;
  }

  spdlog::info("Telemetry bounds for {} set to [{}, {}] humidity <= {}",
               scope, command.bounds.min_temperature,
               command.bounds.max_temperature, command.bounds.max_humidity);
  return command_effect{
      .type = "telemetry_bounds_updated",
      .entity_id = scope,
      .attributes = {
          make_attribute("scope", scope, true),
          make_attribute("min_temperature",
                         std::to_string(command.bounds.min_temperature)),
          make_attribute("max_temperature",
                         std::to_string(command.bounds.max_temperature)),
          make_attribute("max_humidity",
                         std::to_string(command.bounds.max_humidity))}};
}

command_outcome set_telemetry_bounds(ledger_state& state,
                                     const command_context& context,
                                     const set_telemetry_bounds_t& command) {
  if (!permissions::may_set_telemetry_bounds(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "setting telemetry bounds requires regulator");
  }
  return apply_set_telemetry_bounds(state, command);
}

command_outcome apply_set_staleness_window(
    ledger_state& state,
    const set_staleness_window_t& command) {
  if (command.window == 0) {
    return make_error(error_code::invalid_governance_action,
                      "staleness window must be positive");
  }
  state.parameters.telemetry_staleness_window = command.window;
  return command_effect{
      .type = "staleness_window_updated",
      .entity_id = "parameters",
      .attributes = {make_attribute("window", std::to_string(command.window))}};
}

command_outcome bind_sensor(ledger_state& state,
                            const command_context& context,
                            const bind_sensor_t& command) {
  auto it = state.batches.find(command.batch_id);
  if (it == std::end(state.batches)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  if (context.caller != it->second.producer &&
      context.caller != it->second.custodian) {
    return make_error(error_code::authorization_denied,
                      "binding sensors requires producer or custodian");
  }
  if (!has_role(state, command.device, role_id_t::sensor_device)) {
    return make_error(error_code::invalid_sensor,
                      "device does not hold sensor_device");
  }
  auto inserted =
      state.sensor_bindings[command.batch_id].insert(command.device).second;
  return command_effect{
      .type = "sensor_bound",
      .entity_id = command.batch_id,
      .attributes = {make_attribute("batch_id", command.batch_id, true),
                     make_attribute("device", to_hex(command.device), true),
                     make_attribute("changed", inserted ? "true" : "false")}};
}

command_outcome record_telemetry(ledger_state& state,
                                 const command_context& context,
                                 const record_telemetry_t& command) {
  if (!permissions::may_record_telemetry(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "recording telemetry requires sensor_device");
  }
  if (!state.batches.contains(command.batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  if (state.parameters.require_sensor_binding) {
    auto bound = state.sensor_bindings.find(command.batch_id);
    if (bound == std::end(state.sensor_bindings) ||
        !bound->second.contains(context.caller)) {
      return make_error(error_code::sensor_not_bound,
                        "device is not bound to batch");
    }
  }
  if (command.location.empty()) {
    return make_error(error_code::invalid_telemetry,
                      "location must not be empty");
  }
  if (command.humidity > kMaxHumidityPermille) {
    return make_error(error_code::invalid_telemetry,
                      "humidity exceeds 100 percent");
  }
  // Zero stands for "measured now".
  auto recorded_at =
      command.recorded_at == 0 ? context.now : command.recorded_at;
  if (recorded_at > context.now) {
    return make_error(error_code::invalid_telemetry,
                      "reading timestamp lies in the future");
  }
  if (context.now - recorded_at >
      state.parameters.telemetry_staleness_window) {
    return make_error(error_code::stale_telemetry,
                      "reading is older than the staleness window");
  }

  auto bounds = bounds_for(state, command.batch_id);
  auto reading = telemetry_reading_t{};
  reading.batch_id = command.batch_id;
  reading.temperature = command.temperature;
  reading.humidity = command.humidity;
  reading.location = command.location;
  reading.recorded_at = recorded_at;
  reading.device = context.caller;
  reading.valid = command.temperature >= bounds.min_temperature &&
                  command.temperature <= bounds.max_temperature &&
                  command.humidity <= bounds.max_humidity;

  auto& readings = state.telemetry[command.batch_id];
  readings.push_back(reading);
  if (!reading.valid) {
    spdlog::warn("Batch '{}' reading out of bounds: {} / {}",
                 command.batch_id, command.temperature, command.humidity);
  }
  return command_effect{
      .type = "telemetry_recorded",
      .entity_id = command.batch_id,
      .attributes = {
          make_attribute("batch_id", command.batch_id, true),
          make_attribute("index", std::to_string(readings.size() - 1)),
          make_attribute("temperature", std::to_string(command.temperature)),
          make_attribute("humidity", std::to_string(command.humidity)),
          make_attribute("location", command.location),
          make_attribute("valid", reading.valid ? "true" : "false")}};
}

telemetry_bounds_t bounds_for(const ledger_state& state,
                              const batch_id_t& batch_id) {
  auto it = state.batch_bounds.find(batch_id);
  if (it != std::end(state.batch_bounds)) {
    return it->second;
  }
  return state.default_bounds;
}

query_outcome<telemetry_reading_t> latest_reading(const ledger_state& state,
                                                  const batch_id_t& batch_id) {
  if (!state.batches.contains(batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  auto it = state.telemetry.find(batch_id);
  if (it == std::end(state.telemetry) || it->second.empty()) {
    return make_error(error_code::telemetry_missing,
                      "no telemetry recorded for batch");
  }
  return it->second.back();
}

query_outcome<std::vector<telemetry_reading_t>> telemetry_history(
    const ledger_state& state,
    const batch_id_t& batch_id) {
  if (!state.batches.contains(batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  auto it = state.telemetry.find(batch_id);
  if (it == std::end(state.telemetry)) {
    return std::vector<telemetry_reading_t>{};
  }
  return it->second;
}

query_outcome<telemetry_reading_t> reading_at(const ledger_state& state,
                                              const batch_id_t& batch_id,
                                              std::size_t index) {
  if (!state.batches.contains(batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  auto it = state.telemetry.find(batch_id);
  if (it == std::end(state.telemetry) || index >= it->second.size()) {
    return make_error(error_code::telemetry_index_out_of_bounds,
                      "telemetry index out of bounds");
  }
  return it->second[index];
}

}  // namespace pharbit::execution
