#pragma once

#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: ledger event.
// Supply chain workflow: one immutable entry of the ordered event feed.
// `digest` chains to `previous_digest`; the newest digest is the state root.
namespace pharbit::schema {

template <uint16_t Version>
struct ledger_event;

template <>
struct ledger_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::string type;
  std::string entity_id;
  identity_t caller{};
  timestamp_milliseconds_t timestamp{};
  std::vector<transaction_event_attribute_t> attributes;
  hash32_t previous_digest{};
  hash32_t digest{};
};

using ledger_event_t = ledger_event<1>;

}  // namespace pharbit::schema
