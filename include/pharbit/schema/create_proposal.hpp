#pragma once

#include <pharbit/schema/governance_action.hpp>
#include <pharbit/schema/primitives.hpp>
#include <optional>
#include <string>

// Governance command: open a proposal for owner voting.
namespace pharbit::schema {

inline constexpr duration_milliseconds_t kMinVotingPeriod =
    kMillisecondsPerMinute;
inline constexpr duration_milliseconds_t kMaxVotingPeriod =
    30 * kMillisecondsPerDay;

template <uint16_t Version>
struct create_proposal;

template <>
struct create_proposal<1> final {
  uint16_t version{1};
  std::string description;
  duration_milliseconds_t voting_period{};
  std::optional<governance_action_t> action;
};

using create_proposal_t = create_proposal<1>;

}  // namespace pharbit::schema
