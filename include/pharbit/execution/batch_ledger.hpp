#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/execution/outcome.hpp>
#include <pharbit/schema/batch_status.hpp>
#include <pharbit/schema/create_batch.hpp>
#include <pharbit/schema/transfer_custody.hpp>
#include <pharbit/schema/update_batch_status.hpp>
#include <vector>

namespace pharbit::execution {

/// Directed status graph. Forward steps follow the physical flow; recalled
/// and expired leave any non-terminal status; destroyed follows only
/// recalled or expired.
constexpr bool is_transition_allowed(pharbit::schema::batch_status_t from,
                                     pharbit::schema::batch_status_t to) {
  using pharbit::schema::batch_status_t;
  switch (from) {
    case batch_status_t::produced:
      return to == batch_status_t::in_transit ||
             to == batch_status_t::recalled || to == batch_status_t::expired;
    case batch_status_t::in_transit:
      return to == batch_status_t::at_distributor ||
             to == batch_status_t::recalled || to == batch_status_t::expired;
    case batch_status_t::at_distributor:
      return to == batch_status_t::at_pharmacy ||
             to == batch_status_t::recalled || to == batch_status_t::expired;
    case batch_status_t::at_pharmacy:
      return to == batch_status_t::dispensed ||
             to == batch_status_t::recalled || to == batch_status_t::expired;
    case batch_status_t::recalled:
    case batch_status_t::expired:
      return to == batch_status_t::destroyed;
    case batch_status_t::dispensed:
    case batch_status_t::destroyed:
      return false;
  }
  return false;
}

/// Terminal for ordinary movement: no custody transfer, no forward step.
constexpr bool is_terminal(pharbit::schema::batch_status_t status) {
  using pharbit::schema::batch_status_t;
  return status == batch_status_t::dispensed ||
         status == batch_status_t::recalled ||
         status == batch_status_t::expired ||
         status == batch_status_t::destroyed;
}

command_outcome create_batch(ledger_state& state,
                             const command_context& context,
                             const pharbit::schema::create_batch_t& command);

command_outcome update_batch_status(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::update_batch_status_t& command);

/// Move custody to a verified distributor or retailer. Only the current
/// custodian may hand a batch over.
command_outcome transfer_custody(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::transfer_custody_t& command);

query_outcome<pharbit::schema::batch_state_t> get_batch(
    const ledger_state& state,
    const pharbit::schema::batch_id_t& batch_id);

/// Custody hand-overs of a batch, oldest first.
query_outcome<std::vector<pharbit::schema::custody_transfer_t>>
custody_transfers(const ledger_state& state,
                  const pharbit::schema::batch_id_t& batch_id);

std::vector<pharbit::schema::batch_state_t> batches_by_custodian(
    const ledger_state& state,
    const pharbit::schema::identity_t& custodian);

query_outcome<bool> is_expired(const ledger_state& state,
                               const pharbit::schema::batch_id_t& batch_id,
                               pharbit::schema::timestamp_milliseconds_t now);

}  // namespace pharbit::execution
