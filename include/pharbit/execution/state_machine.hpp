#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/execution/outcome.hpp>
#include <pharbit/schema/transaction.hpp>
#include <string_view>
#include <variant>

namespace pharbit::execution {

/// Next state plus the single event summary a successful command produces.
struct state_transition final {
  ledger_state state;
  command_effect effect;
};

using transition_outcome = std::variant<state_transition, command_error>;

/// Deterministic transition function. `state` is never modified; on failure
/// the caller keeps the state it passed in.
transition_outcome apply_transaction(
    const ledger_state& state,
    const pharbit::schema::transaction_t& tx);

/// Stable command name used as the event type prefix and in logs.
std::string_view command_name(
    const pharbit::schema::transaction_payload_t& payload);

/// `pharbit.<component>` codespace reported with results.
std::string_view codespace_of(
    const pharbit::schema::transaction_payload_t& payload);

}  // namespace pharbit::execution
