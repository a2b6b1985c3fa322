#pragma once

#include <pharbit/schema/batch_status.hpp>
#include <pharbit/schema/primitives.hpp>
#include <string>

// Batch ledger command: move a batch along the status graph.
namespace pharbit::schema {

template <uint16_t Version>
struct update_batch_status;

template <>
struct update_batch_status<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  batch_status_t status{batch_status_t::produced};
  std::string reason;
};

using update_batch_status_t = update_batch_status<1>;

}  // namespace pharbit::schema
