#pragma once

#include <pharbit/schema/primitives.hpp>

// Governance command: change the affirmative vote threshold.
namespace pharbit::schema {

template <uint16_t Version>
struct set_quorum;

template <>
struct set_quorum<1> final {
  uint16_t version{1};
  uint32_t quorum{};
};

using set_quorum_t = set_quorum<1>;

}  // namespace pharbit::schema
