#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/execution/outcome.hpp>
#include <pharbit/schema/add_owner.hpp>
#include <pharbit/schema/cast_vote.hpp>
#include <pharbit/schema/create_proposal.hpp>
#include <pharbit/schema/execute_proposal.hpp>
#include <pharbit/schema/remove_owner.hpp>
#include <pharbit/schema/set_quorum.hpp>
#include <vector>

namespace pharbit::execution {

/// Admin-gated owner management. The governance_owner role mirrors the owner
/// list.
command_outcome add_owner(ledger_state& state,
                          const command_context& context,
                          const pharbit::schema::add_owner_t& command);

/// Removing an owner clamps the quorum to the new owner count. Votes the
/// owner already cast stay counted.
command_outcome remove_owner(ledger_state& state,
                             const command_context& context,
                             const pharbit::schema::remove_owner_t& command);

command_outcome set_quorum(ledger_state& state,
                           const command_context& context,
                           const pharbit::schema::set_quorum_t& command);

/// Owner-only. `data` carries the new proposal id.
command_outcome create_proposal(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::create_proposal_t& command);

command_outcome cast_vote(ledger_state& state,
                          const command_context& context,
                          const pharbit::schema::cast_vote_t& command);

/// Decide a proposal once its deadline has passed. The outcome is frozen on
/// the first execution; a passed proposal applies its action in the same
/// command, and a failing action fails the whole command. `data` carries
/// the outcome.
command_outcome execute_proposal(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::execute_proposal_t& command);

/// Structural checks for an action before it is attached to a proposal.
std::optional<command_error> validate_governance_action(
    const ledger_state& state,
    const pharbit::schema::governance_action_t& action);

std::vector<pharbit::schema::identity_t> owners(const ledger_state& state);

uint32_t quorum(const ledger_state& state);

query_outcome<pharbit::schema::proposal_state_t> get_proposal(
    const ledger_state& state,
    pharbit::schema::proposal_id_t proposal_id);

}  // namespace pharbit::execution
