#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>

// Schema type: custody transfer.
// Supply chain workflow: append-only hand-over log of a batch.
namespace pharbit::schema {

template <uint16_t Version>
struct custody_transfer;

template <>
struct custody_transfer<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  identity_t previous_custodian{};
  identity_t new_custodian{};
  std::string reason;
  std::string location;
  timestamp_milliseconds_t transferred_at{};
};

using custody_transfer_t = custody_transfer<1>;

}  // namespace pharbit::schema
