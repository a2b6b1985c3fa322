#pragma once

#include <pharbit/schema/batch_status.hpp>
#include <pharbit/schema/primitives.hpp>
#include <string>

// Schema type: batch state.
// Supply chain workflow: one manufactured lot. Status and custodian are the
// only fields that change after creation.
namespace pharbit::schema {

template <uint16_t Version>
struct batch_state;

template <>
struct batch_state<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  std::string product_name;
  identity_t producer{};
  uint64_t quantity{};
  timestamp_milliseconds_t manufacture_date{};
  timestamp_milliseconds_t expiry_date{};
  batch_status_t status{batch_status_t::produced};
  identity_t custodian{};
  std::string status_reason;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using batch_state_t = batch_state<1>;

}  // namespace pharbit::schema
