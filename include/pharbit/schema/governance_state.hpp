#pragma once

#include <pharbit/schema/primitives.hpp>
#include <vector>

// Schema type: governance state.
// Supply chain workflow: the multi-signature owner set and its quorum.
namespace pharbit::schema {

template <uint16_t Version>
struct governance_state;

template <>
struct governance_state<1> final {
  uint16_t version{1};
  std::vector<identity_t> owners;
  uint32_t quorum{};
  proposal_id_t next_proposal_id{1};
};

using governance_state_t = governance_state<1>;

}  // namespace pharbit::schema
