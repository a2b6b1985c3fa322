#pragma once

#include <pharbit/schema/primitives.hpp>

// Governance command: admit a multi-signature owner.
namespace pharbit::schema {

template <uint16_t Version>
struct add_owner;

template <>
struct add_owner<1> final {
  uint16_t version{1};
  identity_t owner{};
};

using add_owner_t = add_owner<1>;

}  // namespace pharbit::schema
