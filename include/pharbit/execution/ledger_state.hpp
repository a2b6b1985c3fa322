#pragma once

#include <pharbit/execution/outcome.hpp>
#include <pharbit/schema/audit_entry.hpp>
#include <pharbit/schema/batch_state.hpp>
#include <pharbit/schema/compliance_record.hpp>
#include <pharbit/schema/custody_transfer.hpp>
#include <pharbit/schema/genesis.hpp>
#include <pharbit/schema/governance_state.hpp>
#include <pharbit/schema/ledger_parameters.hpp>
#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/proposal_state.hpp>
#include <pharbit/schema/role_id.hpp>
#include <pharbit/schema/stakeholder_record.hpp>
#include <pharbit/schema/telemetry_bounds.hpp>
#include <pharbit/schema/telemetry_reading.hpp>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace pharbit::execution {

/// The single aggregate every command transitions. Values are copied per
/// command and published as immutable snapshots, so nothing in here may
/// hold references into another snapshot.
struct ledger_state final {
  // Access registry.
  std::map<pharbit::schema::identity_t, std::set<pharbit::schema::role_id_t>>
      roles;

  // Stakeholder directory.
  std::map<pharbit::schema::identity_t, pharbit::schema::stakeholder_record_t>
      stakeholders;

  // Batch ledger.
  std::map<pharbit::schema::batch_id_t, pharbit::schema::batch_state_t>
      batches;
  std::map<pharbit::schema::batch_id_t,
           std::vector<pharbit::schema::custody_transfer_t>>
      transfers;

  // Telemetry validator.
  pharbit::schema::telemetry_bounds_t default_bounds;
  std::map<pharbit::schema::batch_id_t, pharbit::schema::telemetry_bounds_t>
      batch_bounds;
  std::map<pharbit::schema::batch_id_t, std::set<pharbit::schema::identity_t>>
      sensor_bindings;
  std::map<pharbit::schema::batch_id_t,
           std::vector<pharbit::schema::telemetry_reading_t>>
      telemetry;

  // Compliance and audit.
  std::map<pharbit::schema::record_id_t, pharbit::schema::compliance_record_t>
      compliance_records;
  std::map<pharbit::schema::batch_id_t,
           std::vector<pharbit::schema::record_id_t>>
      compliance_by_batch;
  std::map<pharbit::schema::batch_id_t,
           std::vector<pharbit::schema::audit_entry_t>>
      audit_entries;
  pharbit::schema::record_id_t next_compliance_record_id{1};
  pharbit::schema::record_id_t next_audit_entry_id{1};

  // Governance.
  pharbit::schema::governance_state_t governance;
  std::map<pharbit::schema::proposal_id_t, pharbit::schema::proposal_state_t>
      proposals;

  pharbit::schema::ledger_parameters_t parameters;
};

/// Check bootstrap principals and parameters before they seed a ledger.
std::optional<command_error> validate_genesis(
    const pharbit::schema::genesis_t& genesis);

/// Build the initial state from a validated genesis.
ledger_state make_genesis_state(const pharbit::schema::genesis_t& genesis);

}  // namespace pharbit::execution
