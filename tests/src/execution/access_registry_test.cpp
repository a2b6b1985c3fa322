#include <gtest/gtest.h>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/testing/ledger_fixture.hpp>

#include <vector>

namespace {

using pharbit::schema::error_code;
using pharbit::schema::role_id_t;

}  // namespace

TEST(access_registry, admin_grants_and_revokes_roles) {
  auto fixture = pharbit::testing::ledger_fixture{};
  const auto& who = fixture.who();

  auto granted = fixture.ok(
      who.admin, pharbit::schema::grant_role_t{.subject = who.outsider,
                                               .role = role_id_t::inspector});
  EXPECT_EQ(granted.type, "role_granted");
  EXPECT_TRUE(pharbit::execution::has_role(fixture.state(), who.outsider,
                                           role_id_t::inspector));

  auto revoked = fixture.ok(
      who.admin, pharbit::schema::revoke_role_t{.subject = who.outsider,
                                                .role = role_id_t::inspector});
  EXPECT_EQ(revoked.type, "role_revoked");
  EXPECT_TRUE(
      pharbit::execution::roles_of(fixture.state(), who.outsider).empty());
  EXPECT_FALSE(fixture.state().roles.contains(who.outsider));
}

TEST(access_registry, grant_is_idempotent) {
  auto fixture = pharbit::testing::ledger_fixture{};
  const auto& who = fixture.who();
  auto grant = pharbit::schema::grant_role_t{.subject = who.outsider,
                                             .role = role_id_t::auditor};
  fixture.ok(who.admin, grant);
  auto again = fixture.ok(who.admin, grant);
  ASSERT_EQ(again.attributes.size(), 3u);
  EXPECT_EQ(again.attributes[2].key, "changed");
  EXPECT_EQ(again.attributes[2].value, "false");
  EXPECT_EQ(pharbit::execution::roles_of(fixture.state(), who.outsider),
            (std::vector<role_id_t>{role_id_t::auditor}));

  auto revoke_absent = fixture.ok(
      who.admin, pharbit::schema::revoke_role_t{.subject = who.outsider,
                                                .role = role_id_t::retailer});
  EXPECT_EQ(revoke_absent.attributes[2].value, "false");
}

TEST(access_registry, non_admin_cannot_manage_roles) {
  auto fixture = pharbit::testing::ledger_fixture{};
  const auto& who = fixture.who();
  EXPECT_EQ(fixture.fails(who.registrar,
                          pharbit::schema::grant_role_t{
                              .subject = who.outsider,
                              .role = role_id_t::producer}),
            error_code::authorization_denied);
  EXPECT_EQ(fixture.fails(who.outsider,
                          pharbit::schema::revoke_role_t{
                              .subject = who.admin, .role = role_id_t::admin}),
            error_code::authorization_denied);
  EXPECT_TRUE(pharbit::execution::has_role(fixture.state(), who.admin,
                                           role_id_t::admin));
}

TEST(access_registry, governance_owner_role_is_protected) {
  auto fixture = pharbit::testing::ledger_fixture{};
  const auto& who = fixture.who();
  EXPECT_EQ(fixture.fails(who.admin,
                          pharbit::schema::grant_role_t{
                              .subject = who.outsider,
                              .role = role_id_t::governance_owner}),
            error_code::protected_role);
  EXPECT_EQ(fixture.fails(who.admin,
                          pharbit::schema::revoke_role_t{
                              .subject = who.owner_a,
                              .role = role_id_t::governance_owner}),
            error_code::protected_role);
}

TEST(access_registry, unknown_roles_are_rejected) {
  auto fixture = pharbit::testing::ledger_fixture{};
  const auto& who = fixture.who();
  const auto bogus = static_cast<role_id_t>(42);
  EXPECT_EQ(fixture.fails(who.admin, pharbit::schema::grant_role_t{
                                         .subject = who.outsider,
                                         .role = bogus}),
            error_code::invalid_role);
  EXPECT_EQ(fixture.fails(who.admin, pharbit::schema::revoke_role_t{
                                         .subject = who.outsider,
                                         .role = bogus}),
            error_code::invalid_role);
  EXPECT_TRUE(
      pharbit::execution::roles_of(fixture.state(), who.outsider).empty());
  EXPECT_EQ(pharbit::schema::kind_of(error_code::invalid_role),
            pharbit::schema::error_kind::bad_input);
}

TEST(access_registry, roles_are_not_exclusive) {
  auto fixture = pharbit::testing::ledger_fixture{};
  const auto& who = fixture.who();
  fixture.ok(who.admin, pharbit::schema::grant_role_t{
                            .subject = who.outsider,
                            .role = role_id_t::distributor});
  fixture.ok(who.admin, pharbit::schema::grant_role_t{
                            .subject = who.outsider,
                            .role = role_id_t::producer});
  EXPECT_EQ(pharbit::execution::roles_of(fixture.state(), who.outsider),
            (std::vector<role_id_t>{role_id_t::producer,
                                    role_id_t::distributor}));
  EXPECT_TRUE(pharbit::execution::has_any_role(
      fixture.state(), who.outsider,
      {role_id_t::retailer, role_id_t::distributor}));
}
