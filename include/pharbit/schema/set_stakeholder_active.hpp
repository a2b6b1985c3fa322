#pragma once

#include <pharbit/schema/primitives.hpp>

// Stakeholder directory command: activate or deactivate a record.
namespace pharbit::schema {

template <uint16_t Version>
struct set_stakeholder_active;

template <>
struct set_stakeholder_active<1> final {
  uint16_t version{1};
  identity_t subject{};
  bool active{};
};

using set_stakeholder_active_t = set_stakeholder_active<1>;

}  // namespace pharbit::schema
