#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/execution/outcome.hpp>
#include <pharbit/schema/grant_role.hpp>
#include <pharbit/schema/revoke_role.hpp>
#include <initializer_list>
#include <vector>

namespace pharbit::execution {

bool has_role(const ledger_state& state,
              const pharbit::schema::identity_t& identity,
              pharbit::schema::role_id_t role);

bool has_any_role(const ledger_state& state,
                  const pharbit::schema::identity_t& identity,
                  std::initializer_list<pharbit::schema::role_id_t> roles);

/// Roles held by identity in declaration order; empty when none.
std::vector<pharbit::schema::role_id_t> roles_of(
    const ledger_state& state,
    const pharbit::schema::identity_t& identity);

/// Unchecked primitive used by genesis, stakeholder registration and owner
/// management. Returns true when the role set changed.
bool assign_role(ledger_state& state,
                 const pharbit::schema::identity_t& identity,
                 pharbit::schema::role_id_t role);

bool unassign_role(ledger_state& state,
                   const pharbit::schema::identity_t& identity,
                   pharbit::schema::role_id_t role);

/// Admin-gated grant. Granting a held role succeeds without change.
command_outcome grant_role(ledger_state& state,
                           const command_context& context,
                           const pharbit::schema::grant_role_t& command);

/// Admin-gated revoke. Revoking an absent role succeeds without change.
command_outcome revoke_role(ledger_state& state,
                            const command_context& context,
                            const pharbit::schema::revoke_role_t& command);

/// Validation and application shared with governance actions, which are
/// authorised by the vote rather than by the admin role.
command_outcome apply_grant_role(ledger_state& state,
                                 const pharbit::schema::grant_role_t& command);
command_outcome apply_revoke_role(
    ledger_state& state,
    const pharbit::schema::revoke_role_t& command);

}  // namespace pharbit::execution
