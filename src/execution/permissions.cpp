#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/permissions.hpp>
#include <algorithm>
#include <iterator>

using pharbit::schema::batch_status_t;
using pharbit::schema::identity_t;
using pharbit::schema::role_id_t;

namespace pharbit::execution::permissions {

bool may_manage_roles(const ledger_state& state, const identity_t& caller) {
  return has_role(state, caller, role_id_t::admin);
}

bool may_manage_stakeholders(const ledger_state& state,
                             const identity_t& caller) {
  return has_role(state, caller, role_id_t::registrar);
}

bool may_create_batch(const ledger_state& state, const identity_t& caller) {
  return has_role(state, caller, role_id_t::producer);
}

bool may_update_batch_status(const ledger_state& state,
                             const identity_t& caller,
                             batch_status_t target) {
  if (has_any_role(state, caller,
                   {role_id_t::producer, role_id_t::distributor,
                    role_id_t::retailer})) {
    return true;
  }
  // Regulators only pull batches out of circulation.
  return (target == batch_status_t::recalled ||
          target == batch_status_t::destroyed) &&
         has_role(state, caller, role_id_t::regulator);
}

bool may_set_telemetry_bounds(const ledger_state& state,
                              const identity_t& caller) {
  return has_role(state, caller, role_id_t::regulator);
}

bool may_record_telemetry(const ledger_state& state,
                          const identity_t& caller) {
  return has_role(state, caller, role_id_t::sensor_device);
}

bool may_add_compliance_check(const ledger_state& state,
                              const identity_t& caller) {
  return has_any_role(state, caller,
                      {role_id_t::inspector, role_id_t::auditor});
}

bool may_update_compliance_status(const ledger_state& state,
                                  const identity_t& caller) {
  return has_any_role(
      state, caller,
      {role_id_t::inspector, role_id_t::auditor, role_id_t::regulator});
}

bool may_record_audit(const ledger_state& state, const identity_t& caller) {
  return has_role(state, caller, role_id_t::auditor);
}

bool may_manage_owners(const ledger_state& state, const identity_t& caller) {
  return has_role(state, caller, role_id_t::admin);
}

bool may_pause(const ledger_state& state, const identity_t& caller) {
  return has_role(state, caller, role_id_t::admin);
}

bool is_owner(const ledger_state& state, const identity_t& caller) {
  const auto& owners = state.governance.owners;
  return std::find(std::begin(owners), std::end(owners), caller) !=
         std::end(owners);
}

bool may_hold_custody(const ledger_state& state, const identity_t& identity) {
  return has_any_role(state, identity,
                      {role_id_t::producer, role_id_t::distributor,
                       role_id_t::retailer});
}

}  // namespace pharbit::execution::permissions
