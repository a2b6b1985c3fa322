#pragma once

#include <pharbit/schema/primitives.hpp>

// Governance command: one owner vote on an open proposal.
namespace pharbit::schema {

template <uint16_t Version>
struct cast_vote;

template <>
struct cast_vote<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  bool support{};
};

using cast_vote_t = cast_vote<1>;

}  // namespace pharbit::schema
