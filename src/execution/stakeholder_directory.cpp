#include <spdlog/spdlog.h>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/permissions.hpp>
#include <pharbit/execution/stakeholder_directory.hpp>
#include <iterator>
#include <string>

using namespace pharbit::schema;

namespace {

bool is_registrable_role(role_id_t role) {
  switch (role) {
    case role_id_t::admin:
    case role_id_t::registrar:
    case role_id_t::governance_owner:
      return false;
    default:
      return true;
  }
}

std::string bool_string(bool value) {
  return value ? "true" : "false";
}

}  // namespace

namespace pharbit::execution {

command_outcome register_stakeholder(ledger_state& state,
                                     const command_context& context,
                                     const register_stakeholder_t& command) {
  if (!permissions::may_manage_stakeholders(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "registering stakeholders requires registrar");
  }
  if (state.stakeholders.contains(command.subject)) {
    return make_error(error_code::stakeholder_already_registered,
                      "stakeholder already registered");
  }
  if (command.name.empty()) {
    return make_error(error_code::invalid_stakeholder,
                      "stakeholder name must not be empty");
  }
  if (!is_known(command.role)) {
    return make_error(error_code::invalid_role, "unknown role");
  }
  if (!is_registrable_role(command.role)) {
    return make_error(error_code::invalid_stakeholder,
                      "administrative roles are not stakeholder roles");
  }

  auto record = stakeholder_record_t{};
  record.identity = command.subject;
  record.name = command.name;
  record.role = command.role;
  record.registered_at = context.now;
  record.updated_at = context.now;
  state.stakeholders.emplace(command.subject, record);
  assign_role(state, command.subject, command.role);

  spdlog::info("Registered stakeholder '{}' as {}", command.name,
               to_string(command.role));
  return command_effect{
      .type = "stakeholder_registered",
      .entity_id = to_hex(command.subject),
      .attributes = {make_attribute("subject", to_hex(command.subject), true),
                     make_attribute("name", command.name),
                     make_attribute("role",
                                    std::string{to_string(command.role)})}};
}

command_outcome set_kyc(ledger_state& state,
                        const command_context& context,
                        const set_kyc_t& command) {
  if (!permissions::may_manage_stakeholders(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "updating KYC requires registrar");
  }
  auto it = state.stakeholders.find(command.subject);
  if (it == std::end(state.stakeholders)) {
    return make_error(error_code::stakeholder_not_registered,
                      "stakeholder not registered");
  }
  it->second.kyc_completed = command.completed;
  it->second.kyc_reference = command.reference;
  it->second.updated_at = context.now;
  return command_effect{
      .type = "stakeholder_kyc_updated",
      .entity_id = to_hex(command.subject),
      .attributes = {make_attribute("subject", to_hex(command.subject), true),
                     make_attribute("completed",
                                    bool_string(command.completed)),
                     make_attribute("reference", command.reference)}};
}

command_outcome set_stakeholder_active(
    ledger_state& state,
    const command_context& context,
    const set_stakeholder_active_t& command) {
  if (!permissions::may_manage_stakeholders(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "changing stakeholder activity requires registrar");
  }
  auto it = state.stakeholders.find(command.subject);
  if (it == std::end(state.stakeholders)) {
    return make_error(error_code::stakeholder_not_registered,
                      "stakeholder not registered");
  }
  it->second.active = command.active;
  it->second.updated_at = context.now;
  return command_effect{
      .type = "stakeholder_activity_updated",
      .entity_id = to_hex(command.subject),
      .attributes = {make_attribute("subject", to_hex(command.subject), true),
                     make_attribute("active", bool_string(command.active))}};
}

query_outcome<stakeholder_record_t> get_stakeholder(
    const ledger_state& state,
    const identity_t& identity) {
  auto it = state.stakeholders.find(identity);
  if (it == std::end(state.stakeholders)) {
    return make_error(error_code::stakeholder_not_registered,
                      "stakeholder not registered");
  }
  return it->second;
}

std::vector<stakeholder_record_t> list_stakeholders(const ledger_state& state) {
  auto records = std::vector<stakeholder_record_t>{};
  records.reserve(state.stakeholders.size());
  for (const auto& [identity, record] : state.stakeholders) {
    records.push_back(record);
  }
  return records;
}

bool is_verified_stakeholder(const ledger_state& state,
                             const identity_t& identity) {
  auto it = state.stakeholders.find(identity);
  return it != std::end(state.stakeholders) && it->second.active &&
         it->second.kyc_completed;
}

}  // namespace pharbit::execution
