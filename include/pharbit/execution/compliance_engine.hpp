#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/execution/outcome.hpp>
#include <pharbit/schema/add_compliance_check.hpp>
#include <pharbit/schema/record_audit.hpp>
#include <pharbit/schema/update_compliance_status.hpp>
#include <vector>

namespace pharbit::execution {

/// Open a pending compliance check. `data` carries the new record id.
command_outcome add_compliance_check(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::add_compliance_check_t& command);

/// Re-review a record. There is no status graph; any status may follow any
/// other.
command_outcome update_compliance_status(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::update_compliance_status_t& command);

/// Append an immutable audit entry. `data` carries the new entry id.
command_outcome record_audit(ledger_state& state,
                             const command_context& context,
                             const pharbit::schema::record_audit_t& command);

/// At least one passed record and no failed one. Unknown batches are not
/// compliant.
bool is_batch_compliant(const ledger_state& state,
                        const pharbit::schema::batch_id_t& batch_id);

query_outcome<pharbit::schema::compliance_record_t> get_compliance_record(
    const ledger_state& state,
    pharbit::schema::record_id_t record_id);

/// Both fail with `batch_missing` for unknown batches.
query_outcome<std::vector<pharbit::schema::compliance_record_t>>
compliance_records(const ledger_state& state,
                   const pharbit::schema::batch_id_t& batch_id);

query_outcome<std::vector<pharbit::schema::audit_entry_t>> audit_trail(
    const ledger_state& state,
    const pharbit::schema::batch_id_t& batch_id);

}  // namespace pharbit::execution
