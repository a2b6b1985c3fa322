#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>

// Batch ledger command: register a newly manufactured batch.
namespace pharbit::schema {

template <uint16_t Version>
struct create_batch;

template <>
struct create_batch<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  std::string product_name;
  identity_t producer{};
  uint64_t quantity{};
  timestamp_milliseconds_t manufacture_date{};
  timestamp_milliseconds_t expiry_date{};
  identity_t custodian{};
};

using create_batch_t = create_batch<1>;

}  // namespace pharbit::schema
