#pragma once

#include <pharbit/schema/primitives.hpp>

// Governance command: drop a multi-signature owner.
namespace pharbit::schema {

template <uint16_t Version>
struct remove_owner;

template <>
struct remove_owner<1> final {
  uint16_t version{1};
  identity_t owner{};
};

using remove_owner_t = remove_owner<1>;

}  // namespace pharbit::schema
