#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/schema/batch_status.hpp>

// Pure permission predicates, one per guarded command. They read only the
// role sets and governance owner list of a state snapshot.
namespace pharbit::execution::permissions {

bool may_manage_roles(const ledger_state& state,
                      const pharbit::schema::identity_t& caller);
bool may_manage_stakeholders(const ledger_state& state,
                             const pharbit::schema::identity_t& caller);
bool may_create_batch(const ledger_state& state,
                      const pharbit::schema::identity_t& caller);
bool may_update_batch_status(const ledger_state& state,
                             const pharbit::schema::identity_t& caller,
                             pharbit::schema::batch_status_t target);
bool may_set_telemetry_bounds(const ledger_state& state,
                              const pharbit::schema::identity_t& caller);
bool may_record_telemetry(const ledger_state& state,
                          const pharbit::schema::identity_t& caller);
bool may_add_compliance_check(const ledger_state& state,
                              const pharbit::schema::identity_t& caller);
bool may_update_compliance_status(const ledger_state& state,
                                  const pharbit::schema::identity_t& caller);
bool may_record_audit(const ledger_state& state,
                      const pharbit::schema::identity_t& caller);
bool may_manage_owners(const ledger_state& state,
                       const pharbit::schema::identity_t& caller);
bool may_pause(const ledger_state& state,
               const pharbit::schema::identity_t& caller);

/// Governance participation is decided by the owner list, not the mirrored
/// role.
bool is_owner(const ledger_state& state,
              const pharbit::schema::identity_t& caller);

/// Roles that may hold custody of a batch besides its producer.
bool may_hold_custody(const ledger_state& state,
                      const pharbit::schema::identity_t& identity);

}  // namespace pharbit::execution::permissions
