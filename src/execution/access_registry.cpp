#include <spdlog/spdlog.h>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/permissions.hpp>
#include <algorithm>
#include <iterator>
#include <string>

using namespace pharbit::schema;

namespace {

std::string changed_flag(bool changed) {
  return changed ? "true" : "false";
}

}  // namespace

namespace pharbit::execution {

bool has_role(const ledger_state& state,
              const identity_t& identity,
              role_id_t role) {
  auto it = state.roles.find(identity);
  if (it == std::end(state.roles)) {
    return false;
  }
  return it->second.contains(role);
}

bool has_any_role(const ledger_state& state,
                  const identity_t& identity,
                  std::initializer_list<role_id_t> roles) {
  auto it = state.roles.find(identity);
  if (it == std::end(state.roles)) {
    return false;
  }
  return std::any_of(std::begin(roles), std::end(roles),
                     [&](role_id_t role) { return it->second.contains(role); });
}

std::vector<role_id_t> roles_of(const ledger_state& state,
                                const identity_t& identity) {
  auto it = state.roles.find(identity);
  if (it == std::end(state.roles)) {
    return {};
  }
  return {std::begin(it->second), std::end(it->second)};
}

bool assign_role(ledger_state& state,
                 const identity_t& identity,
                 role_id_t role) {
  return state.roles[identity].insert(role).second;
}

bool unassign_role(ledger_state& state,
                   const identity_t& identity,
                   role_id_t role) {
  auto it = state.roles.find(identity);
  if (it == std::end(state.roles)) {
    return false;
  }
  auto erased = it->second.erase(role) > 0;
  if (it->second.empty()) {
    state.roles.erase(it);
  }
  return erased;
}

command_outcome apply_grant_role(ledger_state& state,
                                 const grant_role_t& command) {
  if (!is_known(command.role)) {
    return make_error(error_code::invalid_role, "unknown role");
  }
  if (command.role == role_id_t::governance_owner) {
    return make_error(error_code::protected_role,
                      "governance_owner follows the owner set");
  }
  auto changed = assign_role(state, command.subject, command.role);
  spdlog::debug("Granted role {} to {} (changed={})", to_string(command.role),
                to_hex(command.subject), changed);
  return command_effect{
      .type = "role_granted",
      .entity_id = to_hex(command.subject),
      .attributes = {make_attribute("subject", to_hex(command.subject), true),
                     make_attribute("role",
                                    std::string{to_string(command.role)}),
                     make_attribute("changed", changed_flag(changed))}};
}

command_outcome apply_revoke_role(ledger_state& state,
                                  const revoke_role_t& command) {
  if (!is_known(command.role)) {
    return make_error(error_code::invalid_role, "unknown role");
  }
  if (command.role == role_id_t::governance_owner) {
    return make_error(error_code::protected_role,
                      "governance_owner follows the owner set");
  }
  auto changed = unassign_role(state, command.subject, command.role);
  spdlog::debug("Revoked role {} from {} (changed={})",
                to_string(command.role), to_hex(command.subject), changed);
  return command_effect{
      .type = "role_revoked",
      .entity_id = to_hex(command.subject),
      .attributes = {make_attribute("subject", to_hex(command.subject), true),
                     make_attribute("role",
                                    std::string{to_string(command.role)}),
                     make_attribute("changed", changed_flag(changed))}};
}

command_outcome grant_role(ledger_state& state,
                           const command_context& context,
                           const grant_role_t& command) {
  if (!permissions::may_manage_roles(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "granting roles requires admin");
  }
  return apply_grant_role(state, command);
}

command_outcome revoke_role(ledger_state& state,
                            const command_context& context,
                            const revoke_role_t& command) {
  if (!permissions::may_manage_roles(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "revoking roles requires admin");
  }
  return apply_revoke_role(state, command);
}

}  // namespace pharbit::execution
