#include <bootforge/common/disk_lock.hpp>
#include <bootforge/safety/gate.hpp>
#include <bootforge/safety/token_ledger.hpp>
#include <bootforge/schema/gate_state.hpp>
#include <bootforge/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using bootforge::schema::error_code_t;
using bootforge::schema::gate_state_t;

constexpr auto kOperation = "apply-image";

// Provider, ledger, locks and gate wired over the fixture graph.
struct gate_fixture final {
  gate_fixture()
      : directory{"bootforge_gate"},
        provider{bootforge::testing::make_fixture_provider(directory.path())},
        gate{provider, ledger, locks} {}

  bootforge::safety::gate_request request(
      const std::string& disk_id,
      const bool force,
      std::optional<std::string> token) const {
    return bootforge::safety::gate_request{.disk_id = disk_id,
                                           .operation = kOperation,
                                           .force = force,
                                           .confirmation_token = std::move(token)};
  }

  bootforge::testing::temp_dir directory;
  bootforge::host::static_host_provider provider;
  bootforge::safety::memory_token_ledger ledger;
  bootforge::common::disk_lock_registry locks;
  bootforge::safety::safety_gate gate;
};

std::string target() {
  return std::string{bootforge::testing::kTargetDiskId};
}

}  // namespace

TEST(safety_gate, without_force_denies_even_with_valid_token) {
  auto fixture = gate_fixture{};
  auto token = bootforge::safety::mint_token(fixture.ledger, target(), kOperation);

  auto decision = fixture.gate.evaluate(fixture.request(target(), false, token));
  EXPECT_FALSE(decision.authorized());
  EXPECT_EQ(decision.reason, error_code_t::force_mode_required);
  EXPECT_FALSE(decision.grant.has_value());
  EXPECT_EQ(decision.trail,
            (std::vector<gate_state_t>{gate_state_t::requested,
                                       gate_state_t::classified,
                                       gate_state_t::denied}));

  // The denial left the token usable.
  auto record = fixture.ledger.find(bootforge::safety::token_digest(token));
  ASSERT_TRUE(record.has_value());
  EXPECT_FALSE(record->consumed);
}

TEST(safety_gate, system_disk_without_force_is_protected) {
  auto fixture = gate_fixture{};
  auto system = std::string{bootforge::testing::kSystemDiskId};
  auto token = bootforge::safety::mint_token(fixture.ledger, system, kOperation);

  auto decision = fixture.gate.evaluate(fixture.request(system, false, token));
  EXPECT_FALSE(decision.authorized());
  EXPECT_EQ(decision.reason, error_code_t::system_disk_protected);
}

TEST(safety_gate, force_without_token_needs_confirmation) {
  auto fixture = gate_fixture{};
  auto decision = fixture.gate.evaluate(fixture.request(target(), true, std::nullopt));
  EXPECT_FALSE(decision.authorized());
  EXPECT_EQ(decision.reason, error_code_t::missing_confirmation_token);
  EXPECT_EQ(decision.trail.back(), gate_state_t::denied);

  decision = fixture.gate.evaluate(fixture.request(target(), true, std::string{}));
  EXPECT_EQ(decision.reason, error_code_t::missing_confirmation_token);
}

TEST(safety_gate, unknown_token_is_rejected) {
  auto fixture = gate_fixture{};
  auto decision = fixture.gate.evaluate(
      fixture.request(target(), true, std::string{"BF-00000000000000000000000000000000"}));
  EXPECT_FALSE(decision.authorized());
  EXPECT_EQ(decision.reason, error_code_t::missing_confirmation_token);
}

TEST(safety_gate, token_bound_to_other_disk_or_operation_is_rejected) {
  auto fixture = gate_fixture{};
  auto other_disk = bootforge::safety::mint_token(
      fixture.ledger, std::string{bootforge::testing::kSystemDiskId}, kOperation);
  auto other_operation =
      bootforge::safety::mint_token(fixture.ledger, target(), "stage-bootloader");

  auto decision = fixture.gate.evaluate(fixture.request(target(), true, other_disk));
  EXPECT_EQ(decision.reason, error_code_t::missing_confirmation_token);
  decision = fixture.gate.evaluate(fixture.request(target(), true, other_operation));
  EXPECT_EQ(decision.reason, error_code_t::missing_confirmation_token);
}

TEST(safety_gate, valid_token_authorizes_exactly_once) {
  auto fixture = gate_fixture{};
  auto token = bootforge::safety::mint_token(fixture.ledger, target(), kOperation);

  {
    auto decision = fixture.gate.evaluate(fixture.request(target(), true, token));
    ASSERT_TRUE(decision.authorized()) << decision.message;
    ASSERT_TRUE(decision.grant.has_value());
    EXPECT_EQ(decision.grant->disk_id(), target());
    EXPECT_EQ(decision.grant->operation(), kOperation);
    EXPECT_FALSE(decision.grant->graph_id().empty());
    EXPECT_EQ(decision.trail,
              (std::vector<gate_state_t>{
                  gate_state_t::requested, gate_state_t::classified,
                  gate_state_t::pending_confirmation, gate_state_t::confirmed,
                  gate_state_t::authorized}));
    EXPECT_TRUE(fixture.locks.is_held(target()));
  }
  // The lock goes with the authorization.
  EXPECT_FALSE(fixture.locks.is_held(target()));

  auto replay = fixture.gate.evaluate(fixture.request(target(), true, token));
  EXPECT_FALSE(replay.authorized());
  EXPECT_EQ(replay.reason, error_code_t::missing_confirmation_token);
}

TEST(safety_gate, system_disk_with_force_and_token_is_authorized) {
  auto fixture = gate_fixture{};
  auto system = std::string{bootforge::testing::kSystemDiskId};
  auto token = bootforge::safety::mint_token(fixture.ledger, system, kOperation);

  auto decision = fixture.gate.evaluate(fixture.request(system, true, token));
  EXPECT_TRUE(decision.authorized()) << decision.message;
}

TEST(safety_gate, unknown_disk_is_not_found) {
  auto fixture = gate_fixture{};
  auto token =
      bootforge::safety::mint_token(fixture.ledger, "PhysicalDrive9", kOperation);
  auto decision =
      fixture.gate.evaluate(fixture.request("PhysicalDrive9", true, token));
  EXPECT_FALSE(decision.authorized());
  EXPECT_EQ(decision.reason, error_code_t::disk_not_found);
  EXPECT_EQ(decision.trail,
            (std::vector<gate_state_t>{gate_state_t::requested,
                                       gate_state_t::denied}));
}

TEST(safety_gate, disk_removed_after_minting_is_not_found) {
  auto fixture = gate_fixture{};
  auto token = bootforge::safety::mint_token(fixture.ledger, target(), kOperation);

  auto graph = bootforge::testing::make_fixture_graph();
  graph.disks.pop_back();
  fixture.provider.set_graph(graph);

  auto decision = fixture.gate.evaluate(fixture.request(target(), true, token));
  EXPECT_EQ(decision.reason, error_code_t::disk_not_found);
}

TEST(safety_gate, locked_disk_is_busy_and_keeps_token) {
  auto fixture = gate_fixture{};
  auto token = bootforge::safety::mint_token(fixture.ledger, target(), kOperation);

  auto error = bootforge::schema::error_t{};
  auto held = fixture.locks.try_acquire(target(), error);
  ASSERT_TRUE(held.has_value());

  auto decision = fixture.gate.evaluate(fixture.request(target(), true, token));
  EXPECT_FALSE(decision.authorized());
  EXPECT_EQ(decision.reason, error_code_t::device_busy);
  auto record = fixture.ledger.find(bootforge::safety::token_digest(token));
  ASSERT_TRUE(record.has_value());
  EXPECT_FALSE(record->consumed);

  held.reset();
  decision = fixture.gate.evaluate(fixture.request(target(), true, token));
  EXPECT_TRUE(decision.authorized()) << decision.message;
}

TEST(safety_gate, enumeration_failure_denies) {
  auto provider = bootforge::host::unsupported_host_provider{};
  auto ledger = bootforge::safety::memory_token_ledger{};
  auto locks = bootforge::common::disk_lock_registry{};
  auto gate = bootforge::safety::safety_gate{provider, ledger, locks};

  auto decision = gate.evaluate(bootforge::safety::gate_request{
      .disk_id = "sdb", .operation = kOperation, .force = true});
  EXPECT_FALSE(decision.authorized());
  EXPECT_EQ(decision.reason, error_code_t::enumeration_error);
}
