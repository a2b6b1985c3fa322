#pragma once

#include <pharbit/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Supply chain workflow: ordered committed transaction bytes kept for replay
// and export.
namespace pharbit::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_milliseconds_t timestamp{};
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace pharbit::schema
