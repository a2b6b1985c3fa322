#include <spdlog/spdlog.h>
#include <pharbit/execution/compliance_engine.hpp>
#include <pharbit/execution/permissions.hpp>
#include <pharbit/schema/encoding/scale/encoder.hpp>
#include <algorithm>
#include <iterator>
#include <string>

using namespace pharbit::schema;

namespace {

using encoder_t = pharbit::schema::encoding::encoder<
    pharbit::schema::encoding::scale_encoder_tag>;

}  // namespace

namespace pharbit::execution {

command_outcome add_compliance_check(ledger_state& state,
                                     const command_context& context,
                                     const add_compliance_check_t& command) {
  if (!permissions::may_add_compliance_check(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "compliance checks require inspector or auditor");
  }
  if (!state.batches.contains(command.batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  if (command.check_type.empty()) {
    return make_error(error_code::invalid_compliance_check,
                      "check type must not be empty");
  }

  auto record = compliance_record_t{};
  record.record_id = state.next_compliance_record_id++;
  record.batch_id = command.batch_id;
  record.check_type = command.check_type;
  record.status = compliance_status_t::pending;
  record.auditor = context.caller;
  record.notes = command.notes;
  record.findings = command.findings;
  record.corrective_actions = command.corrective_actions;
  record.evidence = command.evidence;
  record.created_at = context.now;
  record.updated_at = context.now;
  state.compliance_by_batch[command.batch_id].push_back(record.record_id);
  auto record_id = record.record_id;
  state.compliance_records.emplace(record_id, std::move(record));

  auto encoder = encoder_t{};
  return command_effect{
      .type = "compliance_check_added",
      .entity_id = std::to_string(record_id),
      .attributes = {make_attribute("record_id", std::to_string(record_id),
                                    true),
                     make_attribute("batch_id", command.batch_id, true),
                     make_attribute("check_type", command.check_type)},
      .data = encoder.encode(record_id)};
}

command_outcome update_compliance_status(
    ledger_state& state,
    const command_context& context,
    const update_compliance_status_t& command) {
  if (!permissions::may_update_compliance_status(state, context.caller)) {
    return make_error(
        error_code::authorization_denied,
        "compliance review requires inspector, auditor or regulator");
  }
  if (!is_known(command.status)) {
    return make_error(error_code::invalid_compliance_check,
                      "unknown compliance status");
  }
  auto it = state.compliance_records.find(command.record_id);
  if (it == std::end(state.compliance_records)) {
    return make_error(error_code::compliance_record_missing,
                      "compliance record not found");
  }
  auto& record = it->second;
  auto previous = record.status;
  record.status = command.status;
  record.passed = command.passed;
  record.notes = command.notes;
  record.updated_at = context.now;

  spdlog::info("Compliance record {} for batch '{}' moved {} -> {}",
               command.record_id, record.batch_id, to_string(previous),
               to_string(command.status));
  return command_effect{
      .type = "compliance_status_updated",
      .entity_id = std::to_string(command.record_id),
      .attributes = {
          make_attribute("record_id", std::to_string(command.record_id),
                         true),
          make_attribute("batch_id", record.batch_id, true),
          make_attribute("previous_status", std::string{to_string(previous)}),
          make_attribute("status", std::string{to_string(command.status)}),
          make_attribute("passed", command.passed ? "true" : "false")}};
}

command_outcome record_audit(ledger_state& state,
                             const command_context& context,
                             const record_audit_t& command) {
  if (!permissions::may_record_audit(state, context.caller)) {
    return make_error(error_code::authorization_denied,
                      "audit entries require auditor");
  }
  if (!state.batches.contains(command.batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  if (command.audit_type.empty()) {
    return make_error(error_code::invalid_audit_entry,
                      "audit type must not be empty");
  }

  auto entry = audit_entry_t{};
  entry.entry_id = state.next_audit_entry_id++;
  entry.batch_id = command.batch_id;
  entry.auditor = context.caller;
  entry.audit_type = command.audit_type;
  entry.findings = command.findings;
  entry.recommendations = command.recommendations;
  entry.result = command.result;
  entry.evidence = command.evidence;
  entry.created_at = context.now;
  auto entry_id = entry.entry_id;
  state.audit_entries[command.batch_id].push_back(std::move(entry));

  auto encoder = encoder_t{};
  return command_effect{
      .type = "audit_recorded",
      .entity_id = std::to_string(entry_id),
      .attributes = {make_attribute("entry_id", std::to_string(entry_id),
                                    true),
                     make_attribute("batch_id", command.batch_id, true),
                     make_attribute("audit_type", command.audit_type),
                     make_attribute("result", command.result)},
      .data = encoder.encode(entry_id)};
}

bool is_batch_compliant(const ledger_state& state,
                        const batch_id_t& batch_id) {
  auto ids = state.compliance_by_batch.find(batch_id);
  if (ids == std::end(state.compliance_by_batch)) {
    return false;
  }
  auto any_passed = false;
  for (auto record_id : ids->second) {
    const auto& record = state.compliance_records.at(record_id);
    if (record.status == compliance_status_t::failed) {
      return false;
    }
    any_passed = any_passed || record.status == compliance_status_t::passed;
  }
  return any_passed;
}

query_outcome<compliance_record_t> get_compliance_record(
    const ledger_state& state,
    record_id_t record_id) {
  auto it = state.compliance_records.find(record_id);
  if (it == std::end(state.compliance_records)) {
    return make_error(error_code::compliance_record_missing,
                      "compliance record not found");
  }
  return it->second;
}

query_outcome<std::vector<compliance_record_t>> compliance_records(
    const ledger_state& state,
    const batch_id_t& batch_id) {
  if (!state.batches.contains(batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  auto records = std::vector<compliance_record_t>{};
  auto ids = state.compliance_by_batch.find(batch_id);
  if (ids == std::end(state.compliance_by_batch)) {
    return records;
  }
  records.reserve(ids->second.size());
  for (auto record_id : ids->second) {
    records.push_back(state.compliance_records.at(record_id));
  }
  return records;
}

query_outcome<std::vector<audit_entry_t>> audit_trail(
    const ledger_state& state,
    const batch_id_t& batch_id) {
  if (!state.batches.contains(batch_id)) {
    return make_error(error_code::batch_missing, "batch not found");
  }
  auto it = state.audit_entries.find(batch_id);
  if (it == std::end(state.audit_entries)) {
    return std::vector<audit_entry_t>{};
  }
  return it->second;
}

}  // namespace pharbit::execution
