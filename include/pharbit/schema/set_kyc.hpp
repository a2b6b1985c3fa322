#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>

// Stakeholder directory command: record KYC completion.
namespace pharbit::schema {

template <uint16_t Version>
struct set_kyc;

template <>
struct set_kyc<1> final {
  uint16_t version{1};
  identity_t subject{};
  bool completed{};
  std::string reference;
};

using set_kyc_t = set_kyc<1>;

}  // namespace pharbit::schema
