#pragma once

#include <pharbit/schema/governance_action.hpp>
#include <pharbit/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: proposal state.
// Supply chain workflow: open until the deadline, then awaiting execution,
// then executed with an outcome that is never reconsidered.
namespace pharbit::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  std::string description;
  identity_t proposer{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t deadline{};
  uint32_t yes_votes{};
  uint32_t no_votes{};
  std::vector<identity_t> voters;
  std::optional<governance_action_t> action;
  bool executed{};
  bool passed{};
};

using proposal_state_t = proposal_state<1>;

}  // namespace pharbit::schema
