#pragma once

#include <pharbit/schema/primitives.hpp>

// Governance command: settle a closed proposal exactly once.
namespace pharbit::schema {

template <uint16_t Version>
struct execute_proposal;

template <>
struct execute_proposal<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using execute_proposal_t = execute_proposal<1>;

}  // namespace pharbit::schema
