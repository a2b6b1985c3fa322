#pragma once

#include <pharbit/schema/primitives.hpp>

// Administrative command: stop or resume all mutations.
namespace pharbit::schema {

template <uint16_t Version>
struct set_paused;

template <>
struct set_paused<1> final {
  uint16_t version{1};
  bool paused{};
};

using set_paused_t = set_paused<1>;

}  // namespace pharbit::schema
