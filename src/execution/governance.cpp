#include <spdlog/spdlog.h>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/governance.hpp>
#include <pharbit/execution/permissions.hpp>
#include <pharbit/execution/telemetry_validator.hpp>
#include <pharbit/schema/encoding/scale/encoder.hpp>
#include <algorithm>
#include <iterator>
#include <string>

using namespace pharbit::schema;

namespace {

using encoder_t = pharbit::schema::encoding::encoder<
    pharbit::schema::encoding::scale_encoder_tag>;

std::string_view action_name(const governance_action_t& action) {
  return std::visit(
      overloaded{
          [](const set_telemetry_bounds_t&) -> std::string_view {
            return "set_telemetry_bounds";
          },
          [](const grant_role_t&) -> std::string_view { return "grant_role"; },
          [](const revoke_role_t&) -> std::string_view {
            return "revoke_role";
          },
          [](const set_staleness_window_t&) -> std::string_view {
            return "set_staleness_window";
          }},
      action);
}

pharbit::execution::command_outcome apply_action(
    pharbit::execution::ledger_state& state,
    const governance_action_t& action) {
  return std::visit(
      overloaded{[&](const set_telemetry_bounds_t& value) {
                   return pharbit::execution::apply_set_telemetry_bounds(
                       state, value);
                 },
                 [&](const grant_role_t& value) {
                   return pharbit::execution::apply_grant_role(state, value);
                 },
                 [&](const revoke_role_t& value) {
                   return pharbit::execution::apply_revoke_role(state, value);
                 },
                 [&](const set_staleness_window_t& value) {
                   return pharbit::execution::apply_set_staleness_window(
                       state, value);
                 }},
      action);
}

}  // namespace

namespace pharbit::execution {

command_outcome add_owner(ledger_state& state,
                          const command_context& context,
                          const add_owner_t& command) {
  if (!permissions::may_manage_owners(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "owner management requires admin");
  }
  if (command.owner == make_zero_hash()) {
    return make_error(error_code::invalid_owner, "owner must not be zero");
  }
  if (permissions::is_owner(state, command.owner)) {
    return make_error(error_code::owner_exists, "identity is already an owner");
  }
  auto& governance = state.governance;
  governance.owners.push_back(command.owner);
  assign_role(state, command.owner, role_id_t::governance_owner);
  if (governance.quorum == 0) {
    governance.quorum = 1;
  }
  spdlog::info("Added governance owner {} ({} owner(s), quorum {})",
               to_hex(command.owner), governance.owners.size(),
               governance.quorum);
  return command_effect{
      .type = "owner_added",
      .entity_id = to_hex(command.owner),
      .attributes = {
          make_attribute("owner", to_hex(command.owner), true),
          make_attribute("owners", std::to_string(governance.owners.size())),
          make_attribute("quorum", std::to_string(governance.quorum))}};
}

command_outcome remove_owner(ledger_state& state,
                             const command_context& context,
                             const remove_owner_t& command) {
  if (!permissions::may_manage_owners(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "owner management requires admin");
  }
  auto& governance = state.governance;
  auto it = std::find(std::begin(governance.owners),
                      std::end(governance.owners), command.owner);
  if (it == std::end(governance.owners)) {
    return make_error(error_code::invalid_owner, "identity is not an owner");
  }
  governance.owners.erase(it);
  unassign_role(state, command.owner, role_id_t::governance_owner);
  governance.quorum = std::min(
      governance.quorum, static_cast<uint32_t>(governance.owners.size()));
  spdlog::info("Removed governance owner {} ({} owner(s), quorum {})",
               to_hex(command.owner), governance.owners.size(),
               governance.quorum);
  return command_effect{
      .type = "owner_removed",
      .entity_id = to_hex(command.owner),
      .attributes = {
          make_attribute("owner", to_hex(command.owner), true),
          make_attribute("owners", std::to_string(governance.owners.size())),
          make_attribute("quorum", std::to_string(governance.quorum))}};
}

command_outcome set_quorum(ledger_state& state,
                           const command_context& context,
                           const set_quorum_t& command) {
  if (!permissions::may_manage_owners(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "quorum changes require admin");
  }
  if (command.quorum == 0 ||
      command.quorum > state.governance.owners.size()) {
    return make_error(error_code::invalid_quorum,
                      "quorum must be between 1 and the owner count");
  }
  state.governance.quorum = command.quorum;
  return command_effect{
      .type = "quorum_updated",
      .entity_id = "governance",
      .attributes = {
          make_attribute("quorum", std::to_string(command.quorum))}};
}

std::optional<command_error> validate_governance_action(
    const ledger_state& state,
    const governance_action_t& action) {
  return std::visit(
      overloaded{
          [&](const set_telemetry_bounds_t& value)
              -> std::optional<command_error> {
            if (validate_bounds(value.bounds)) {
              return make_error(error_code::invalid_governance_action,
                                "proposed telemetry bounds are invalid");
            }
            if (value.batch_id && !state.batches.contains(*value.batch_id)) {
              return make_error(error_code::invalid_governance_action,
                                "proposed bounds name an unknown batch");
            }
            return std::nullopt;
          },
          [](const grant_role_t& value) -> std::optional<command_error> {
            if (!is_known(value.role)) {
              return make_error(error_code::invalid_governance_action,
                                "unknown role");
            }
            if (value.role == role_id_t::governance_owner) {
              return make_error(error_code::invalid_governance_action,
                                "governance_owner follows the owner set");
            }
            return std::nullopt;
          },
          [](const revoke_role_t& value) -> std::optional<command_error> {
            if (!is_known(value.role)) {
              return make_error(error_code::invalid_governance_action,
                                "unknown role");
            }
            if (value.role == role_id_t::governance_owner) {
              return make_error(error_code::invalid_governance_action,
                                "governance_owner follows the owner set");
            }
            return std::nullopt;
          },
          [](const set_staleness_window_t& value)
              -> std::optional<command_error> {
            if (value.window == 0) {
              return make_error(error_code::invalid_governance_action,
                                "staleness window must be positive");
            }
            return std::nullopt;
          }},
      action);
}

command_outcome create_proposal(ledger_state& state,
                                const command_context& context,
                                const create_proposal_t& command) {
  if (!permissions::is_owner(state, context.caller)) {
    return make_error(error_code::not_owner,
                      "only owners may create proposals");
  }
  if (command.description.empty()) {
    return make_error(error_code::invalid_proposal,
                      "proposal description must not be empty");
  }
  if (command.voting_period < kMinVotingPeriod ||
      command.voting_period > kMaxVotingPeriod) {
    return make_error(error_code::invalid_proposal,
                      "voting period must be between 1 minute and 30 days");
  }
  if (command.action) {
    if (auto error = validate_governance_action(state, *command.action)) {
      return *error;
    }
  }

  auto proposal = proposal_state_t{};
  proposal.proposal_id = state.governance.next_proposal_id++;
  proposal.description = command.description;
  proposal.proposer = context.caller;
  proposal.created_at = context.now;
  proposal.deadline = context.now + command.voting_period;
  proposal.action = command.action;
  auto proposal_id = proposal.proposal_id;
  auto deadline = proposal.deadline;
  state.proposals.emplace(proposal_id, std::move(proposal));

  spdlog::info("Proposal {} opened by {} until {}", proposal_id,
               to_hex(context.caller), deadline);
  auto attributes = std::vector<transaction_event_attribute_t>{
      make_attribute("proposal_id", std::to_string(proposal_id), true),
      make_attribute("description", command.description),
      make_attribute("deadline", std::to_string(deadline))};
  if (command.action) {
    attributes.push_back(
        make_attribute("action", std::string{action_name(*command.action)}));
  }
  auto encoder = encoder_t{};
  return command_effect{.type = "proposal_created",
                        .entity_id = std::to_string(proposal_id),
                        .attributes = std::move(attributes),
                        .data = encoder.encode(proposal_id)};
}

command_outcome cast_vote(ledger_state& state,
                          const command_context& context,
                          const cast_vote_t& command) {
  if (!permissions::is_owner(state, context.caller)) {
    return make_error(error_code::not_owner, "only owners may vote");
  }
  auto it = state.proposals.find(command.proposal_id);
  if (it == std::end(state.proposals)) {
    return make_error(error_code::proposal_not_found, "proposal not found");
  }
  auto& proposal = it->second;
  if (proposal.executed || context.now >= proposal.deadline) {
    return make_error(error_code::voting_closed, "voting has closed");
  }
  if (std::find(std::begin(proposal.voters), std::end(proposal.voters),
                context.caller) != std::end(proposal.voters)) {
    return make_error(error_code::already_voted,
                      "owner already voted on proposal");
  }
  proposal.voters.push_back(context.caller);
  if (command.support) {
    ++proposal.yes_votes;
  } else {
    ++proposal.no_votes;
  }
  return command_effect{
      .type = "vote_cast",
      .entity_id = std::to_string(command.proposal_id),
      .attributes = {
          make_attribute("proposal_id", std::to_string(command.proposal_id),
                         true),
          make_attribute("voter", to_hex(context.caller), true),
          make_attribute("support", command.support ? "true" : "false"),
          make_attribute("yes_votes", std::to_string(proposal.yes_votes)),
          make_attribute("no_votes", std::to_string(proposal.no_votes))}};
}

command_outcome execute_proposal(ledger_state& state,
                                 const command_context& context,
                                 const execute_proposal_t& command) {
  if (!permissions::is_owner(state, context.caller)) {
    return make_error(error_code::not_owner,
                      "only owners may execute proposals");
  }
  auto it = state.proposals.find(command.proposal_id);
  if (it == std::end(state.proposals)) {
    return make_error(error_code::proposal_not_found, "proposal not found");
  }
  if (it->second.executed) {
    return make_error(error_code::proposal_already_executed,
                      "proposal already executed");
  }
  if (context.now < it->second.deadline) {
    return make_error(error_code::voting_still_open,
                      "voting period has not ended");
  }

  auto passed = it->second.yes_votes >= state.governance.quorum &&
                it->second.yes_votes > it->second.no_votes;
  it->second.executed = true;
  it->second.passed = passed;

  auto attributes = std::vector<transaction_event_attribute_t>{
      make_attribute("proposal_id", std::to_string(command.proposal_id), true),
      make_attribute("passed", passed ? "true" : "false"),
      make_attribute("yes_votes", std::to_string(it->second.yes_votes)),
      make_attribute("no_votes", std::to_string(it->second.no_votes)),
      make_attribute("quorum", std::to_string(state.governance.quorum))};

  if (passed && it->second.action) {
    const auto& action = *it->second.action;
    auto outcome = apply_action(state, action);
    if (auto* error = std::get_if<command_error>(&outcome)) {
      spdlog::warn("Proposal {} action {} failed: {}", command.proposal_id,
                   action_name(action), error->message);
      return make_error(error->code,
                        "proposal action failed: " + error->message);
    }
    const auto& effect = std::get<command_effect>(outcome);
    attributes.push_back(make_attribute("action", effect.type));
    for (const auto& attribute : effect.attributes) {
      attributes.push_back(make_attribute("action." + attribute.key,
                                          attribute.value, attribute.index));
    }
  }

  spdlog::info("Proposal {} executed: {}", command.proposal_id,
               passed ? "passed" : "rejected");
  auto encoder = encoder_t{};
  return command_effect{.type = "proposal_executed",
                        .entity_id = std::to_string(command.proposal_id),
                        .attributes = std::move(attributes),
                        .data = encoder.encode(passed)};
}

std::vector<identity_t> owners(const ledger_state& state) {
  return state.governance.owners;
}

uint32_t quorum(const ledger_state& state) {
  return state.governance.quorum;
}

query_outcome<proposal_state_t> get_proposal(const ledger_state& state,
                                             proposal_id_t proposal_id) {
  auto it = state.proposals.find(proposal_id);
  if (it == std::end(state.proposals)) {
    return make_error(error_code::proposal_not_found, "proposal not found");
  }
  return it->second;
}

}  // namespace pharbit::execution
