#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/execution/telemetry_validator.hpp>
#include <set>

using namespace pharbit::schema;

namespace pharbit::execution {

std::optional<command_error> validate_genesis(const genesis_t& genesis) {
  auto distinct = std::set<identity_t>{std::begin(genesis.owners),
                                       std::end(genesis.owners)};
  if (distinct.size() != genesis.owners.size()) {
    return make_error(error_code::invalid_owner,
                      "genesis owners must be distinct");
  }
  if (distinct.contains(make_zero_hash())) {
    return make_error(error_code::invalid_owner,
                      "genesis owners must not be zero");
  }
  if (genesis.owners.empty() ? genesis.quorum != 0
                             : (genesis.quorum == 0 ||
                                genesis.quorum > genesis.owners.size())) {
    return make_error(error_code::invalid_quorum,
                      "genesis quorum must be between 1 and the owner count");
  }
  if (auto error = validate_bounds(genesis.telemetry_bounds)) {
    return error;
  }
  if (genesis.parameters.telemetry_staleness_window == 0) {
    return make_error(error_code::invalid_transaction,
                      "telemetry staleness window must be positive");
  }
  return std::nullopt;
}

ledger_state make_genesis_state(const genesis_t& genesis) {
  auto state = ledger_state{};
  for (const auto& admin : genesis.admins) {
    assign_role(state, admin, role_id_t::admin);
  }
  for (const auto& registrar : genesis.registrars) {
    assign_role(state, registrar, role_id_t::registrar);
  }
  for (const auto& owner : genesis.owners) {
    assign_role(state, owner, role_id_t::governance_owner);
  }
  state.governance.owners = genesis.owners;
  state.governance.quorum = genesis.quorum;
  state.default_bounds = genesis.telemetry_bounds;
  state.parameters = genesis.parameters;
  return state;
}

}  // namespace pharbit::execution
