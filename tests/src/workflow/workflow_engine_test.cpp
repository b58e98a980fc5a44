#include <bootforge/crypto/sha256.hpp>
#include <bootforge/report/manager.hpp>
#include <bootforge/schema/encoding/document.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/step_status.hpp>
#include <bootforge/testing/common.hpp>
#include <bootforge/testing/workflow.hpp>
#include <bootforge/workflow/engine.hpp>
#include <bootforge/workflow/registry.hpp>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using bootforge::schema::error_code_t;
using bootforge::schema::run_status_t;
using bootforge::schema::step_status_t;
using bootforge::testing::make_step;
using bootforge::testing::make_workflow;

std::string target() {
  return std::string{bootforge::testing::kTargetDiskId};
}

bootforge::schema::workflow_step_t hash_step(const std::string& id,
                                             const std::string& disk_id) {
  return make_step(id, "disk-hash-report",
                   {{"target_disk_id", disk_id}, {"chunk_size_bytes", 4096}});
}

error_code_t validation_error(const bootforge::schema::workflow_t& workflow) {
  auto registry = bootforge::workflow::make_default_registry();
  auto error = bootforge::schema::error_t{};
  EXPECT_FALSE(bootforge::workflow::validate_workflow(workflow, registry, error));
  return error.code;
}

nlohmann::json read_run_json(const std::filesystem::path& bundle) {
  return nlohmann::json::parse(bootforge::testing::read_text(
      bundle / std::string{bootforge::report::kRunFile}));
}

}  // namespace

TEST(workflow_validation, accepts_well_formed_workflow) {
  auto registry = bootforge::workflow::make_default_registry();
  auto workflow = make_workflow(
      "hash", {hash_step("one", "sdb"),
               make_step("two", "report-verify", {{"report_path", "reports/x"}})});
  auto error = bootforge::schema::error_t{};
  EXPECT_TRUE(bootforge::workflow::validate_workflow(workflow, registry, error))
      << error.message;
}

TEST(workflow_validation, rejects_structural_problems) {
  EXPECT_EQ(validation_error(make_workflow("empty", {})),
            error_code_t::invalid_document);
  EXPECT_EQ(validation_error(make_workflow("", {hash_step("one", "sdb")})),
            error_code_t::invalid_document);
  EXPECT_EQ(validation_error(make_workflow(
                "dupes", {hash_step("one", "sdb"), hash_step("one", "sdc")})),
            error_code_t::invalid_document);
  EXPECT_EQ(validation_error(make_workflow("no-id", {hash_step("", "sdb")})),
            error_code_t::invalid_document);

  auto future = make_workflow("future", {hash_step("one", "sdb")});
  future.schema_version = "2.0.0";
  EXPECT_EQ(validation_error(future), error_code_t::schema_version_mismatch);
}

TEST(workflow_validation, rejects_unknown_actions_and_bad_params) {
  EXPECT_EQ(validation_error(make_workflow(
                "unknown", {make_step("one", "format-everything", {})})),
            error_code_t::unsupported_action);
  EXPECT_EQ(validation_error(make_workflow(
                "missing", {make_step("one", "disk-hash-report", {})})),
            error_code_t::invalid_step_params);
  EXPECT_EQ(validation_error(make_workflow(
                "undeclared", {make_step("one", "disk-hash-report",
                                         {{"target_disk_id", "sdb"},
                                          {"colour", "blue"}})})),
            error_code_t::invalid_step_params);
  EXPECT_EQ(validation_error(make_workflow(
                "zero-chunk", {make_step("one", "disk-hash-report",
                                         {{"target_disk_id", "sdb"},
                                          {"chunk_size_bytes", 0}})})),
            error_code_t::invalid_step_params);
  EXPECT_EQ(validation_error(make_workflow(
                "typed", {make_step("one", "apply-image",
                                    {{"target_disk_id", "sdb"},
                                     {"image_path", "a.img"},
                                     {"force", "yes"}})})),
            error_code_t::invalid_step_params);
}

TEST(workflow_validation, destructive_action_needs_a_target) {
  auto registry = bootforge::workflow::action_registry{};
  registry.add(bootforge::workflow::action_descriptor{
      .kind = bootforge::schema::action_kind_t::apply_image,
      .destructive = true,
      .handler = [](const auto&, auto&) {
        return bootforge::workflow::make_success("nothing");
      }});
  auto workflow = make_workflow("untargeted", {make_step("one", "apply-image", {})});
  auto error = bootforge::schema::error_t{};
  EXPECT_FALSE(bootforge::workflow::validate_workflow(workflow, registry, error));
  EXPECT_EQ(error.code, error_code_t::invalid_step_params);

  // Registration adds the gate parameters to destructive actions.
  workflow.steps[0].params = {{"target_disk_id", "sdb"}, {"force", true},
                              {"confirmation_token", "BF-x"}};
  EXPECT_TRUE(bootforge::workflow::validate_workflow(workflow, registry, error))
      << error.message;
}

TEST(action_registry, default_registry_holds_every_action) {
  auto registry = bootforge::workflow::make_default_registry();
  EXPECT_EQ(registry.names(),
            (std::vector<std::string>{
                "apply-image", "disk-hash-report", "disk-image-and-stage",
                "installer-usb-build-linux", "installer-usb-build-macos",
                "installer-usb-build-windows", "report-verify",
                "stage-bootloader"}));
  ASSERT_NE(registry.find("apply-image"), nullptr);
  EXPECT_TRUE(registry.find("apply-image")->destructive);
  EXPECT_FALSE(registry.find("disk-hash-report")->destructive);
  EXPECT_EQ(registry.find("Apply-Image"), nullptr);
}

TEST(workflow_engine, failing_step_stops_the_run) {
  auto fixture = bootforge::testing::engine_fixture{};
  bootforge::testing::write_bytes(fixture.target_image(),
                                  bootforge::testing::make_pattern(10000));

  auto workflow = make_workflow(
      "hash-then-fail",
      {hash_step("good", target()), hash_step("bad", "PhysicalDrive9"),
       hash_step("after", target())});
  auto result = fixture.run(workflow);

  EXPECT_EQ(result.status, run_status_t::failed);
  ASSERT_EQ(result.steps.size(), 3u);
  EXPECT_EQ(result.steps[0].status, step_status_t::success);
  EXPECT_EQ(result.steps[0].artifacts,
            (std::vector<std::string>{"artifacts/good/disk.sha256.json"}));
  EXPECT_EQ(result.steps[1].status, step_status_t::failed);
  EXPECT_TRUE(result.steps[1].error.has_value());
  EXPECT_EQ(result.steps[2].status, step_status_t::not_run);
  EXPECT_FALSE(result.steps[2].started_at_utc.has_value());
  EXPECT_NE(result.error.code, error_code_t::ok);

  ASSERT_TRUE(result.report_path.has_value());
  auto verified = bootforge::report::verify_report(*result.report_path, std::nullopt);
  EXPECT_TRUE(verified.ok) << verified.error.message;

  auto run = read_run_json(*result.report_path);
  EXPECT_EQ(run["status"], "failed");
  ASSERT_EQ(run["steps"].size(), 3u);
  EXPECT_EQ(run["steps"][2]["status"], "not_run");

  auto artifact = nlohmann::json::parse(bootforge::testing::read_text(
      *result.report_path / "artifacts/good/disk.sha256.json"));
  auto expected = bootforge::crypto::sha256(bootforge::schema::make_bytes_view(
      bootforge::testing::make_pattern(10000)));
  EXPECT_EQ(artifact["sha256"], bootforge::schema::to_hex(expected));
  EXPECT_EQ(artifact["bytes_processed"], 10000);
}

TEST(workflow_engine, successful_run_is_recorded) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto result = fixture.run(make_workflow(
      "hash-both", {hash_step("system", std::string{bootforge::testing::kSystemDiskId}),
                    hash_step("target", target())}));

  EXPECT_EQ(result.status, run_status_t::succeeded);
  EXPECT_EQ(result.error.code, error_code_t::ok);
  EXPECT_FALSE(result.run_id.empty());
  ASSERT_TRUE(result.report_path.has_value());
  EXPECT_EQ(result.report_path->parent_path(), fixture.reports());
  for (const auto& step : result.steps) {
    EXPECT_EQ(step.status, step_status_t::success) << step.message;
    EXPECT_TRUE(step.finished_at_utc.has_value());
  }
  EXPECT_EQ(read_run_json(*result.report_path)["status"], "succeeded");
  EXPECT_NE(bootforge::testing::read_text(*result.report_path / "logs.txt")
                .find("step 'target' succeeded"),
            std::string::npos);
}

TEST(workflow_engine, invalid_workflow_creates_no_bundle) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto result = fixture.run(make_workflow(
      "broken", {hash_step("one", target()), make_step("two", "nuke", {})}));

  EXPECT_EQ(result.status, run_status_t::failed);
  EXPECT_EQ(result.error.code, error_code_t::unsupported_action);
  EXPECT_FALSE(result.report_path.has_value());
  ASSERT_EQ(result.steps.size(), 2u);
  EXPECT_EQ(result.steps[0].status, step_status_t::not_run);
  EXPECT_EQ(result.steps[1].status, step_status_t::not_run);

  auto ec = std::error_code{};
  EXPECT_FALSE(std::filesystem::exists(fixture.reports(), ec));
}

TEST(workflow_engine, cancelled_before_first_step) {
  auto fixture = bootforge::testing::engine_fixture{};
  fixture.cancel.cancel();
  auto result = fixture.run(
      make_workflow("cancelled", {hash_step("one", target()), hash_step("two", target())}));

  EXPECT_EQ(result.status, run_status_t::cancelled);
  EXPECT_EQ(result.error.code, error_code_t::cancelled);
  for (const auto& step : result.steps) {
    EXPECT_EQ(step.status, step_status_t::not_run);
  }
  ASSERT_TRUE(result.report_path.has_value());
  EXPECT_TRUE(bootforge::report::verify_report(*result.report_path, std::nullopt).ok);
  EXPECT_EQ(read_run_json(*result.report_path)["status"], "cancelled");
}

TEST(workflow_engine, cancel_during_step_stops_it_and_skips_the_rest) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto cancel = fixture.cancel;
  auto engine = bootforge::workflow::workflow_engine{
      fixture.registry, fixture.provider, fixture.gate,
      bootforge::workflow::run_options{
          .reports_dir = fixture.reports(),
          .progress = [cancel](uint64_t processed, uint64_t) {
            if (processed >= 8192) {
              cancel.cancel();
            }
          }}};

  auto result = engine.run(
      make_workflow("interrupted", {hash_step("a", target()), hash_step("b", target())}),
      fixture.cancel);
  EXPECT_EQ(result.status, run_status_t::cancelled);
  EXPECT_EQ(result.error.code, error_code_t::cancelled);
  ASSERT_EQ(result.steps.size(), 2u);
  EXPECT_EQ(result.steps[0].status, step_status_t::cancelled);
  EXPECT_EQ(result.steps[0].error, std::optional<error_code_t>{error_code_t::cancelled});
  EXPECT_TRUE(result.steps[0].artifacts.empty());
  EXPECT_EQ(result.steps[1].status, step_status_t::not_run);

  ASSERT_TRUE(result.report_path.has_value());
  EXPECT_FALSE(std::filesystem::exists(*result.report_path / "artifacts/a"));
  EXPECT_TRUE(bootforge::report::verify_report(*result.report_path, std::nullopt).ok);
  auto run = read_run_json(*result.report_path);
  EXPECT_EQ(run["status"], "cancelled");
  EXPECT_EQ(run["steps"][0]["status"], "cancelled");
  EXPECT_EQ(run["steps"][1]["status"], "not_run");
}

TEST(workflow_engine, handler_exception_fails_the_step) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto registry = bootforge::workflow::action_registry{};
  registry.add(bootforge::workflow::action_descriptor{
      .kind = bootforge::schema::action_kind_t::disk_hash_report,
      .required = {{.name = "target_disk_id"}},
      .optional = {{.name = "chunk_size_bytes",
                    .type = bootforge::workflow::param_type_t::positive_integer}},
      .handler = [](const auto&, auto&) -> bootforge::workflow::step_outcome {
        throw std::runtime_error{"boom"};
      }});
  auto engine = bootforge::workflow::workflow_engine{
      registry, fixture.provider, fixture.gate,
      bootforge::workflow::run_options{.reports_dir = fixture.reports()}};

  auto result = engine.run(make_workflow("throws", {hash_step("one", target())}),
                           fixture.cancel);
  EXPECT_EQ(result.status, run_status_t::failed);
  ASSERT_EQ(result.steps.size(), 1u);
  EXPECT_EQ(result.steps[0].error, std::optional<error_code_t>{error_code_t::io_error});
  EXPECT_NE(result.steps[0].message.find("boom"), std::string::npos);
}

TEST(workflow_engine, signed_run_verifies_only_with_key) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto key = bootforge::schema::make_bytes(std::string{"run signing key"});
  auto engine = bootforge::workflow::workflow_engine{
      fixture.registry, fixture.provider, fixture.gate,
      bootforge::workflow::run_options{.reports_dir = fixture.reports(),
                                       .signing_key = key}};

  auto result = engine.run(make_workflow("signed", {hash_step("one", target())}),
                           fixture.cancel);
  ASSERT_EQ(result.status, run_status_t::succeeded);
  ASSERT_TRUE(result.report_path.has_value());
  EXPECT_TRUE(bootforge::report::verify_report(*result.report_path, key).ok);
  EXPECT_FALSE(bootforge::report::verify_report(*result.report_path, std::nullopt).ok);
}
