#include <spdlog/spdlog.h>
#include <pharbit/common/critical.hpp>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/batch_ledger.hpp>
#include <pharbit/execution/permissions.hpp>
#include <pharbit/execution/stakeholder_directory.hpp>
#include <algorithm>
#include <iterator>
#include <string>

using namespace pharbit::schema;

namespace {

// A stored batch without a producer or quantity can only come from a bug in
// an earlier command; the ledger must not keep running on top of it.
void require_well_formed(const batch_state_t& batch) {
  if (batch.producer == make_zero_hash() || batch.quantity == 0) {
    spdlog::critical("Batch '{}' violates structural invariants",
                     batch.batch_id);
    pharbit::common::critical("corrupted batch state");
  }
}

}  // namespace

namespace pharbit::execution {

command_outcome create_batch(ledger_state& state,
                             const command_context& context,
                             const create_batch_t& command) {
  if (!permissions::may_create_batch(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "creating batches requires producer");
  }
  if (command.producer != context.caller) {
    return make_error(error_code::producer_mismatch,
                      "producer must be the caller");
  }
  if (command.batch_id.empty()) {
    return make_error(error_code::invalid_batch, "batch id must not be empty");
  }
  if (command.product_name.empty()) {
    return make_error(error_code::invalid_batch,
                      "product name must not be empty");
  }
  if (state.batches.contains(command.batch_id)) {
    return make_error(error_code::batch_exists, "batch already exists");
  }
  if (command.quantity == 0) {
    return make_error(error_code::invalid_batch,
                      "quantity must be greater than zero");
  }
  if (command.expiry_date <= std::max(command.manufacture_date, context.now)) {
    return make_error(error_code::invalid_batch,
                      "expiry date must follow manufacture date and now");
  }
  if (command.custodian != command.producer) {
    auto it = state.stakeholders.find(command.custodian);
    if (it == std::end(state.stakeholders) || !it->second.active ||
        !permissions::may_hold_custody(state, command.custodian)) {
      return make_error(error_code::invalid_custodian,
                        "custodian must be an active custody stakeholder");
    }
  }

  auto batch = batch_state_t{};
  batch.batch_id = command.batch_id;
  batch.product_name = command.product_name;
  batch.producer = command.producer;
  batch.quantity = command.quantity;
  batch.manufacture_date = command.manufacture_date;
  batch.expiry_date = command.expiry_date;
  batch.status = batch_status_t::produced;
  batch.custodian = command.custodian;
  batch.created_at = context.now;
  batch.updated_at = context.now;
  state.batches.emplace(command.batch_id, std::move(batch));

  spdlog::info("Created batch '{}' of '{}' (quantity {})", command.batch_id,
               command.product_name, command.quantity);
  return command_effect{
      .type = "batch_created",
      .entity_id = command.batch_id,
      .attributes = {
          make_attribute("batch_id", command.batch_id, true),
          make_attribute("product_name", command.product_name),
          make_attribute("producer", to_hex(command.producer), true),
          make_attribute("quantity", std::to_string(command.quantity)),
          make_attribute("expiry_date", std::to_string(command.expiry_date)),
          make_attribute("custodian", to_hex(command.custodian), true),
          make_attribute("status",
                         std::string{to_string(batch_status_t::produced)})}};
}

command_outcome update_batch_status(ledger_state& state,
                                    const command_context& context,
                                    const update_batch_status_t& command) {
  if (!permissions::may_update_batch_status(state, context.caller,
                                            command.status)) {
    return make_error(error_code::authorization_denied,
                      "caller may not change batch status");
  }
  if (!is_known(command.status)) {
    return make_error(error_code::invalid_batch, "unknown batch status");
  }
  auto it = state.batches.find(command.batch_id);
  if (it == std::end(state.batches)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  auto& batch = it->second;
  require_well_formed(batch);
  if (!is_transition_allowed(batch.status, command.status)) {
    return make_error(error_code::invalid_status_transition,
                      "cannot move batch from " +
                          std::string{to_string(batch.status)} + " to " +
                          std::string{to_string(command.status)});
  }

  auto previous = batch.status;
  batch.status = command.status;
  batch.status_reason = command.reason;
  batch.updated_at = context.now;

  spdlog::info("Batch '{}' moved {} -> {}", command.batch_id,
               to_string(previous), to_string(command.status));
  return command_effect{
      .type = "batch_status_updated",
      .entity_id = command.batch_id,
      .attributes = {
          make_attribute("batch_id", command.batch_id, true),
          make_attribute("previous_status", std::string{to_string(previous)}),
          make_attribute("status", std::string{to_string(command.status)}),
          make_attribute("reason", command.reason)}};
}

command_outcome transfer_custody(ledger_state& state,
                                 const command_context& context,
                                 const transfer_custody_t& command) {
  auto it = state.batches.find(command.batch_id);
  if (it == std::end(state.batches)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  auto& batch = it->second;
  require_well_formed(batch);
  if (batch.custodian != context.caller) {
    return make_error(error_code::not_custodian,
                      "only the current custodian may transfer custody");
  }
  if (is_terminal(batch.status)) {
    return make_error(error_code::invalid_status_transition,
                      "batch is " + std::string{to_string(batch.status)});
  }
  if (context.now >= batch.expiry_date) {
    return make_error(error_code::batch_expired, "batch is past expiry");
  }
  if (command.new_custodian == batch.custodian) {
    return make_error(error_code::invalid_custodian,
                      "new custodian is the current custodian");
  }
  if (!is_verified_stakeholder(state, command.new_custodian)) {
    return make_error(error_code::invalid_custodian,
                      "new custodian must be registered, active and KYC "
                      "verified");
  }
  if (!has_any_role(state, command.new_custodian,
                    {role_id_t::distributor, role_id_t::retailer})) {
    return make_error(error_code::invalid_custodian,
                      "new custodian must be a distributor or retailer");
  }
  if (command.location.empty()) {
    return make_error(error_code::invalid_custodian,
                      "transfer location must not be empty");
  }

  auto transfer = custody_transfer_t{};
  transfer.batch_id = command.batch_id;
  transfer.previous_custodian = batch.custodian;
  transfer.new_custodian = command.new_custodian;
  transfer.reason = command.reason;
  transfer.location = command.location;
  transfer.transferred_at = context.now;
  state.transfers[command.batch_id].push_back(transfer);

  batch.custodian = command.new_custodian;
  batch.updated_at = context.now;

  spdlog::info("Batch '{}' custody {} -> {}", command.batch_id,
               to_hex(transfer.previous_custodian),
               to_hex(transfer.new_custodian));
  return command_effect{
      .type = "custody_transferred",
      .entity_id = command.batch_id,
      .attributes = {
          make_attribute("batch_id", command.batch_id, true),
          make_attribute("previous_custodian",
                         to_hex(transfer.previous_custodian), true),
          make_attribute("new_custodian", to_hex(transfer.new_custodian),
                         true),
          make_attribute("reason", command.reason),
          make_attribute("location", command.location)}};
}

query_outcome<batch_state_t> get_batch(const ledger_state& state,
                                       const batch_id_t& batch_id) {
  auto it = state.batches.find(batch_id);
  if (it == std::end(state.batches)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  return it->second;
}

query_outcome<std::vector<custody_transfer_t>> custody_transfers(
    const ledger_state& state,
    const batch_id_t& batch_id) {
  if (!state.batches.contains(batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  auto it = state.transfers.find(batch_id);
  if (it == std::end(state.transfers)) {
    return std::vector<custody_transfer_t>{};
  }
  return it->second;
}

std::vector<batch_state_t> batches_by_custodian(const ledger_state& state,
                                                const identity_t& custodian) {
  auto batches = std::vector<batch_state_t>{};
  for (const auto& [batch_id, batch] : state.batches) {
    if (batch.custodian == custodian) {
      batches.push_back(batch);
    }
  }
  return batches;
}

query_outcome<bool> is_expired(const ledger_state& state,
                               const batch_id_t& batch_id,
                               timestamp_milliseconds_t now) {
  auto it = state.batches.find(batch_id);
  if (it == std::end(state.batches)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  return it->second.status == batch_status_t::expired ||
         now >= it->second.expiry_date;
}

}  // namespace pharbit::execution
