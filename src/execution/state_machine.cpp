#include <spdlog/spdlog.h>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/batch_ledger.hpp>
#include <pharbit/execution/compliance_engine.hpp>
#include <pharbit/execution/governance.hpp>
#include <pharbit/execution/permissions.hpp>
#include <pharbit/execution/stakeholder_directory.hpp>
#include <pharbit/execution/state_machine.hpp>
#include <pharbit/execution/telemetry_validator.hpp>

using namespace pharbit::schema;

namespace {

using pharbit::execution::command_context;
using pharbit::execution::command_effect;
using pharbit::execution::command_outcome;
using pharbit::execution::ledger_state;
using pharbit::execution::make_attribute;
using pharbit::execution::make_error;

command_outcome apply_set_paused(ledger_state& state,
                                 const command_context& context,
                                 const set_paused_t& command) {
  if (!pharbit::execution::permissions::may_pause(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "pausing the ledger requires admin");
  }
  auto changed = state.parameters.paused != command.paused;
  state.parameters.paused = command.paused;
  spdlog::warn("Ledger {} by {}", command.paused ? "paused" : "resumed",
               to_hex(context.caller));
  return command_effect{
      .type = command.paused ? "ledger_paused" : "ledger_resumed",
      .entity_id = "parameters",
      .attributes = {
          make_attribute("paused", command.paused ? "true" : "false"),
          make_attribute("changed", changed ? "true" : "false")}};
}

command_outcome dispatch(ledger_state& state,
                         const command_context& context,
                         const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [&](const grant_role_t& command) {
            return pharbit::execution::grant_role(state, context, command);
          },
          [&](const revoke_role_t& command) {
            return pharbit::execution::revoke_role(state, context, command);
          },
          [&](const register_stakeholder_t& command) {
            return pharbit::execution::register_stakeholder(state, context,
                                                            command);
          },
          [&](const set_kyc_t& command) {
            return pharbit::execution::set_kyc(state, context, command);
          },
          [&](const set_stakeholder_active_t& command) {
            return pharbit::execution::set_stakeholder_active(state, context,
                                                              command);
          },
          [&](const create_batch_t& command) {
            return pharbit::execution::create_batch(state, context, command);
          },
          [&](const update_batch_status_t& command) {
            return pharbit::execution::update_batch_status(state, context,
                                                           command);
          },
          [&](const transfer_custody_t& command) {
            return pharbit::execution::transfer_custody(state, context,
                                                        command);
          },
          [&](const set_telemetry_bounds_t& command) {
            return pharbit::execution::set_telemetry_bounds(state, context,
                                                            command);
          },
          [&](const bind_sensor_t& command) {
            return pharbit::execution::bind_sensor(state, context, command);
          },
          [&](const record_telemetry_t& command) {
            return pharbit::execution::record_telemetry(state, context,
                                                        command);
          },
          [&](const add_compliance_check_t& command) {
            return pharbit::execution::add_compliance_check(state, context,
                                                            command);
          },
          [&](const update_compliance_status_t& command) {
            return pharbit::execution::update_compliance_status(state, context,
                                                                command);
          },
          [&](const record_audit_t& command) {
            return pharbit::execution::record_audit(state, context, command);
          },
          [&](const add_owner_t& command) {
            return pharbit::execution::add_owner(state, context, command);
          },
          [&](const remove_owner_t& command) {
            return pharbit::execution::remove_owner(state, context, command);
          },
          [&](const set_quorum_t& command) {
            return pharbit::execution::set_quorum(state, context, command);
          },
          [&](const create_proposal_t& command) {
            return pharbit::execution::create_proposal(state, context, command);
          },
          [&](const cast_vote_t& command) {
            return pharbit::execution::cast_vote(state, context, command);
          },
          [&](const execute_proposal_t& command) {
            return pharbit::execution::execute_proposal(state, context,
                                                        command);
          },
          [&](const set_paused_t& command) {
            return apply_set_paused(state, context, command);
          }},
      payload);
}

}  // namespace

namespace pharbit::execution {

transition_outcome apply_transaction(const ledger_state& state,
                                     const transaction_t& tx) {
  if (tx.version != 1) {
    return make_error(error_code::unsupported_transaction_version,
                      "expected transaction version 1");
  }
  if (state.parameters.paused &&
      !std::holds_alternative<set_paused_t>(tx.payload)) {
    return make_error(error_code::engine_paused, "ledger is paused");
  }

  auto next = state;
  auto context = command_context{.caller = tx.caller, .now = tx.timestamp};
  auto outcome = dispatch(next, context, tx.payload);
  if (auto* error = std::get_if<command_error>(&outcome)) {
    spdlog::debug("{} rejected: {}", command_name(tx.payload), error->message);
    return *error;
  }
  return state_transition{
      .state = std::move(next),
      .effect = std::get<command_effect>(std::move(outcome))};
}

std::string_view command_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const grant_role_t&) -> std::string_view { return "grant_role"; },
          [](const revoke_role_t&) -> std::string_view {
            return "revoke_role";
          },
          [](const register_stakeholder_t&) -> std::string_view {
            return "register_stakeholder";
          },
          [](const set_kyc_t&) -> std::string_view { return "set_kyc"; },
          [](const set_stakeholder_active_t&) -> std::string_view {
            return "set_stakeholder_active";
          },
          [](const create_batch_t&) -> std::string_view {
            return "create_batch";
          },
          [](const update_batch_status_t&) -> std::string_view {
            return "update_batch_status";
          },
          [](const transfer_custody_t&) -> std::string_view {
            return "transfer_custody";
          },
          [](const set_telemetry_bounds_t&) -> std::string_view {
            return "set_telemetry_bounds";
          },
          [](const bind_sensor_t&) -> std::string_view {
            return "bind_sensor";
          },
          [](const record_telemetry_t&) -> std::string_view {
            return "record_telemetry";
          },
          [](const add_compliance_check_t&) -> std::string_view {
            return "add_compliance_check";
          },
          [](const update_compliance_status_t&) -> std::string_view {
            return "update_compliance_status";
          },
          [](const record_audit_t&) -> std::string_view {
            return "record_audit";
          },
          [](const add_owner_t&) -> std::string_view { return "add_owner"; },
          [](const remove_owner_t&) -> std::string_view {
            return "remove_owner";
          },
          [](const set_quorum_t&) -> std::string_view { return "set_quorum"; },
          [](const create_proposal_t&) -> std::string_view {
            return "create_proposal";
          },
          [](const cast_vote_t&) -> std::string_view { return "cast_vote"; },
          [](const execute_proposal_t&) -> std::string_view {
            return "execute_proposal";
          },
          [](const set_paused_t&) -> std::string_view { return "set_paused"; }},
      payload);
}

std::string_view codespace_of(const transaction_payload_t& payload) {
  constexpr std::string_view access = "pharbit.access";
  constexpr std::string_view stakeholders = "pharbit.stakeholders";
  constexpr std::string_view batches = "pharbit.batches";
  constexpr std::string_view telemetry = "pharbit.telemetry";
  constexpr std::string_view compliance = "pharbit.compliance";
  constexpr std::string_view governance = "pharbit.governance";
  return std::visit(
      overloaded{
          [&](const grant_role_t&) { return access; },
          [&](const revoke_role_t&) { return access; },
          [&](const register_stakeholder_t&) { return stakeholders; },
          [&](const set_kyc_t&) { return stakeholders; },
          [&](const set_stakeholder_active_t&) { return stakeholders; },
          [&](const create_batch_t&) { return batches; },
          [&](const update_batch_status_t&) { return batches; },
          [&](const transfer_custody_t&) { return batches; },
          [&](const set_telemetry_bounds_t&) { return telemetry; },
          [&](const bind_sensor_t&) { return telemetry; },
          [&](const record_telemetry_t&) { return telemetry; },
          [&](const add_compliance_check_t&) { return compliance; },
          [&](const update_compliance_status_t&) { return compliance; },
          [&](const record_audit_t&) { return compliance; },
          [&](const add_owner_t&) { return governance; },
          [&](const remove_owner_t&) { return governance; },
          [&](const set_quorum_t&) { return governance; },
          [&](const create_proposal_t&) { return governance; },
          [&](const cast_vote_t&) { return governance; },
          [&](const execute_proposal_t&) { return governance; },
          [](const set_paused_t&) {
            return std::string_view{"pharbit.ledger"};
          }},
      payload);
}

}  // namespace pharbit::execution
