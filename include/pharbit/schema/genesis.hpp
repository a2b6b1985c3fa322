#pragma once

#include <pharbit/schema/ledger_parameters.hpp>
#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/telemetry_bounds.hpp>
#include <vector>

// Schema type: genesis.
// Supply chain workflow: bootstrap principals and parameters. Persisted on
// first start so history replays against the same origin.
namespace pharbit::schema {

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  std::vector<identity_t> admins;
  std::vector<identity_t> registrars;
  std::vector<identity_t> owners;
  uint32_t quorum{};
  telemetry_bounds_t telemetry_bounds;
  ledger_parameters_t parameters;
};

using genesis_t = genesis<1>;

}  // namespace pharbit::schema
