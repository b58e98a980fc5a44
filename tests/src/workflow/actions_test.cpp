#include <bootforge/crypto/sha256.hpp>
#include <bootforge/safety/token_ledger.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/step_status.hpp>
#include <bootforge/testing/common.hpp>
#include <bootforge/testing/workflow.hpp>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <optional>
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

bootforge::schema::bytes_t head_of(const std::filesystem::path& path,
                                   const std::size_t size) {
  auto bytes = bootforge::testing::read_bytes(path);
  bytes.resize(std::min(bytes.size(), size));
  return bytes;
}

std::string sha256_hex(const bootforge::schema::bytes_t& bytes) {
  return bootforge::schema::to_hex(
      bootforge::crypto::sha256(bootforge::schema::make_bytes_view(bytes)));
}

// ISO 9660 primary volume descriptor signature at sector 16.
bootforge::schema::bytes_t make_iso(const std::size_t size) {
  auto iso = bootforge::testing::make_pattern(size, 3);
  const auto* identifier = "CD001";
  std::copy(identifier, identifier + 5, std::begin(iso) + 16 * 2048 + 1);
  return iso;
}

bootforge::schema::step_result_t single_step(
    bootforge::testing::engine_fixture& fixture,
    bootforge::schema::workflow_step_t step) {
  auto result = fixture.run(make_workflow("single", {std::move(step)}));
  EXPECT_EQ(result.steps.size(), 1u);
  return result.steps.empty() ? bootforge::schema::step_result_t{}
                              : result.steps.front();
}

}  // namespace

TEST(apply_image, writes_and_verifies_with_confirmed_token) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto image = bootforge::testing::make_pattern(20000);
  bootforge::testing::write_bytes(fixture.directory / "image.bin", image);
  auto token = fixture.mint("apply-image");

  auto step = make_step("write", "apply-image",
                        {{"target_disk_id", target()},
                         {"image_path", (fixture.directory / "image.bin").string()},
                         {"chunk_size_bytes", 4096},
                         {"force", true},
                         {"confirmation_token", token}});
  auto result = fixture.run(make_workflow("apply", {step}));

  ASSERT_EQ(result.status, run_status_t::succeeded) << result.error.message;
  EXPECT_EQ(head_of(fixture.target_image(), image.size()), image);
  EXPECT_EQ(bootforge::testing::read_bytes(fixture.target_image()).size(), 65536u);
  ASSERT_TRUE(result.report_path.has_value());
  auto apply = nlohmann::json::parse(bootforge::testing::read_text(
      *result.report_path / "artifacts/write/apply.json"));
  EXPECT_EQ(apply["bytes_written"], 20000);
  EXPECT_EQ(apply["image_sha256"], sha256_hex(image));
  EXPECT_EQ(apply["readback_sha256"], sha256_hex(image));
  EXPECT_EQ(apply["target_disk_id"], target());

  // Tokens are single use.
  auto replay = fixture.run(make_workflow("apply-again", {step}));
  EXPECT_EQ(replay.status, run_status_t::failed);
  EXPECT_EQ(replay.steps[0].error,
            std::optional<error_code_t>{error_code_t::missing_confirmation_token});
}

TEST(apply_image, without_force_leaves_disk_untouched) {
  auto fixture = bootforge::testing::engine_fixture{};
  bootforge::testing::write_bytes(fixture.directory / "image.bin",
                                  bootforge::testing::make_pattern(4096));
  auto token = fixture.mint("apply-image");

  auto outcome = single_step(
      fixture, make_step("write", "apply-image",
                         {{"target_disk_id", target()},
                          {"image_path", (fixture.directory / "image.bin").string()},
                          {"confirmation_token", token}}));
  EXPECT_EQ(outcome.status, step_status_t::failed);
  EXPECT_EQ(outcome.error,
            std::optional<error_code_t>{error_code_t::force_mode_required});
  EXPECT_EQ(bootforge::testing::read_bytes(fixture.target_image()),
            bootforge::schema::bytes_t(65536, 0));
  auto record = fixture.ledger.find(bootforge::safety::token_digest(token));
  ASSERT_TRUE(record.has_value());
  EXPECT_FALSE(record->consumed);
}

TEST(apply_image, system_disk_needs_force) {
  auto fixture = bootforge::testing::engine_fixture{};
  bootforge::testing::write_bytes(fixture.directory / "image.bin",
                                  bootforge::testing::make_pattern(4096));
  auto system = std::string{bootforge::testing::kSystemDiskId};

  auto outcome = single_step(
      fixture, make_step("write", "apply-image",
                         {{"target_disk_id", system},
                          {"image_path", (fixture.directory / "image.bin").string()},
                          {"confirmation_token", fixture.mint("apply-image", system)}}));
  EXPECT_EQ(outcome.error,
            std::optional<error_code_t>{error_code_t::system_disk_protected});
  EXPECT_EQ(bootforge::testing::read_bytes(fixture.directory / "system.img"),
            bootforge::schema::bytes_t(8192, 0x11));
}

TEST(apply_image, image_larger_than_disk_is_rejected) {
  auto fixture = bootforge::testing::engine_fixture{};
  bootforge::testing::write_bytes(fixture.directory / "image.bin",
                                  bootforge::testing::make_pattern(70000));

  auto outcome = single_step(
      fixture, make_step("write", "apply-image",
                         {{"target_disk_id", target()},
                          {"image_path", (fixture.directory / "image.bin").string()},
                          {"force", true},
                          {"confirmation_token", fixture.mint("apply-image")}}));
  EXPECT_EQ(outcome.error, std::optional<error_code_t>{error_code_t::invalid_argument});
  EXPECT_EQ(bootforge::testing::read_bytes(fixture.target_image()),
            bootforge::schema::bytes_t(65536, 0));
}

TEST(installer_usb_build_windows, stages_tree_onto_mount) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto source = fixture.directory / "win";
  bootforge::testing::write_text(source / "sources/install.wim", "wim payload");
  bootforge::testing::write_text(source / "boot/boot.sdi", "sdi");

  auto result = fixture.run(make_workflow(
      "windows",
      {make_step("stage", "installer-usb-build-windows",
                 {{"source_path", source.string()},
                  {"target_mount", fixture.mount().string()},
                  {"force", true},
                  {"confirmation_token",
                   fixture.mint("installer-usb-build-windows")}})}));

  ASSERT_EQ(result.status, run_status_t::succeeded) << result.error.message;
  EXPECT_EQ(bootforge::testing::read_text(fixture.mount() / "sources/install.wim"),
            "wim payload");
  EXPECT_EQ(bootforge::testing::read_text(fixture.mount() / "boot/boot.sdi"), "sdi");
  EXPECT_EQ(result.steps[0].artifacts,
            (std::vector<std::string>{"artifacts/stage/staged.sha256"}));

  auto listing = bootforge::testing::read_text(
      *result.report_path / "artifacts/stage/staged.sha256");
  EXPECT_EQ(listing,
            sha256_hex(bootforge::schema::make_bytes(std::string{"sdi"})) +
                "  boot/boot.sdi\n" +
                sha256_hex(bootforge::schema::make_bytes(std::string{"wim payload"})) +
                "  sources/install.wim\n");
}

TEST(installer_usb_build_windows, requires_install_image) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto source = fixture.directory / "win";
  bootforge::testing::write_text(source / "setup.exe", "MZ");

  auto outcome = single_step(
      fixture, make_step("stage", "installer-usb-build-windows",
                         {{"source_path", source.string()},
                          {"target_mount", fixture.mount().string()},
                          {"force", true},
                          {"confirmation_token",
                           fixture.mint("installer-usb-build-windows")}}));
  EXPECT_EQ(outcome.error,
            std::optional<error_code_t>{error_code_t::invalid_step_params});
  EXPECT_TRUE(std::filesystem::is_empty(fixture.mount()));
}

TEST(installer_usb_build_windows, unknown_mount_is_not_found) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto source = fixture.directory / "win";
  bootforge::testing::write_text(source / "sources/install.esd", "esd");
  auto elsewhere = fixture.directory / "elsewhere";
  std::filesystem::create_directories(elsewhere);

  auto outcome = single_step(
      fixture, make_step("stage", "installer-usb-build-windows",
                         {{"source_path", source.string()},
                          {"target_mount", elsewhere.string()},
                          {"force", true},
                          {"confirmation_token",
                           fixture.mint("installer-usb-build-windows")}}));
  EXPECT_EQ(outcome.error, std::optional<error_code_t>{error_code_t::disk_not_found});
}

TEST(installer_usb_build_windows, mount_and_disk_id_must_agree) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto source = fixture.directory / "win";
  bootforge::testing::write_text(source / "sources/install.wim", "wim");

  auto outcome = single_step(
      fixture,
      make_step("stage", "installer-usb-build-windows",
                {{"source_path", source.string()},
                 {"target_mount", fixture.mount().string()},
                 {"target_disk_id", std::string{bootforge::testing::kSystemDiskId}},
                 {"force", true},
                 {"confirmation_token", fixture.mint("installer-usb-build-windows")}}));
  EXPECT_EQ(outcome.error,
            std::optional<error_code_t>{error_code_t::invalid_step_params});
}

TEST(installer_usb_build_linux, writes_iso_image) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto iso = make_iso(40960);
  bootforge::testing::write_bytes(fixture.directory / "distro.iso", iso);

  auto result = fixture.run(make_workflow(
      "linux", {make_step("usb", "installer-usb-build-linux",
                          {{"target_disk_id", target()},
                           {"iso_path", (fixture.directory / "distro.iso").string()},
                           {"force", true},
                           {"confirmation_token",
                            fixture.mint("installer-usb-build-linux")}})}));

  ASSERT_EQ(result.status, run_status_t::succeeded) << result.error.message;
  EXPECT_EQ(head_of(fixture.target_image(), iso.size()), iso);
  EXPECT_EQ(result.steps[0].artifacts,
            (std::vector<std::string>{"artifacts/usb/installer.json"}));
}

TEST(installer_usb_build_linux, rejects_non_iso_source) {
  auto fixture = bootforge::testing::engine_fixture{};
  bootforge::testing::write_bytes(fixture.directory / "random.iso",
                                  bootforge::testing::make_pattern(40960));

  auto outcome = single_step(
      fixture, make_step("usb", "installer-usb-build-linux",
                         {{"target_disk_id", target()},
                          {"iso_path", (fixture.directory / "random.iso").string()},
                          {"force", true},
                          {"confirmation_token",
                           fixture.mint("installer-usb-build-linux")}}));
  EXPECT_EQ(outcome.error,
            std::optional<error_code_t>{error_code_t::invalid_step_params});
  EXPECT_EQ(bootforge::testing::read_bytes(fixture.target_image()),
            bootforge::schema::bytes_t(65536, 0));
}

TEST(installer_usb_build_macos, stages_installer_with_support_image) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto source = fixture.directory / "mac";
  bootforge::testing::write_text(
      source / "Install macOS.app/Contents/SharedSupport/SharedSupport.dmg", "dmg");
  bootforge::testing::write_text(source / "Install macOS.app/Contents/Info.plist",
                                 "<plist/>");

  auto step = make_step("mac", "installer-usb-build-macos",
                        {{"source_path", source.string()},
                         {"target_mount", fixture.mount().string()},
                         {"force", true},
                         {"confirmation_token", fixture.mint("installer-usb-build-macos")}});
  auto result = fixture.run(make_workflow("macos", {step}));
  ASSERT_EQ(result.status, run_status_t::succeeded) << result.error.message;
  EXPECT_EQ(bootforge::testing::read_text(
                fixture.mount() /
                "Install macOS.app/Contents/SharedSupport/SharedSupport.dmg"),
            "dmg");

  std::filesystem::remove_all(source / "Install macOS.app/Contents/SharedSupport");
  step.params["confirmation_token"] = fixture.mint("installer-usb-build-macos");
  auto missing = fixture.run(make_workflow("macos", {step}));
  EXPECT_EQ(missing.steps[0].error,
            std::optional<error_code_t>{error_code_t::invalid_step_params});
}

TEST(stage_bootloader, stages_efi_loader_in_any_case) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto source = fixture.directory / "efi";
  bootforge::testing::write_text(source / "efi/boot/bootx64.efi", "loader");
  bootforge::testing::write_text(source / "efi/boot/grub.cfg", "menuentry");

  auto result = fixture.run(make_workflow(
      "bootloader", {make_step("boot", "stage-bootloader",
                               {{"source_path", source.string()},
                                {"target_mount", fixture.mount().string()},
                                {"force", true},
                                {"confirmation_token",
                                 fixture.mint("stage-bootloader")}})}));
  ASSERT_EQ(result.status, run_status_t::succeeded) << result.error.message;
  EXPECT_EQ(bootforge::testing::read_text(fixture.mount() / "efi/boot/bootx64.efi"),
            "loader");
  EXPECT_EQ(result.steps[0].artifacts,
            (std::vector<std::string>{"artifacts/boot/bootloader.sha256"}));
}

TEST(stage_bootloader, requires_default_boot_path) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto source = fixture.directory / "efi";
  bootforge::testing::write_text(source / "EFI/ubuntu/shimx64.efi", "shim");

  auto outcome = single_step(
      fixture, make_step("boot", "stage-bootloader",
                         {{"source_path", source.string()},
                          {"target_mount", fixture.mount().string()},
                          {"force", true},
                          {"confirmation_token", fixture.mint("stage-bootloader")}}));
  EXPECT_EQ(outcome.error,
            std::optional<error_code_t>{error_code_t::invalid_step_params});
}

TEST(disk_image_and_stage, images_disk_with_sidecar) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto content = bootforge::testing::make_pattern(65536, 9);
  bootforge::testing::write_bytes(fixture.target_image(), content);
  auto output = fixture.directory / "backup.img";

  auto result = fixture.run(make_workflow(
      "image", {make_step("image", "disk-image-and-stage",
                          {{"source_disk_id", target()},
                           {"output_path", output.string()},
                           {"chunk_size_bytes", 8192}})}));
  ASSERT_EQ(result.status, run_status_t::succeeded) << result.error.message;
  EXPECT_EQ(bootforge::testing::read_bytes(output), content);
  EXPECT_EQ(bootforge::testing::read_text(fixture.directory / "backup.img.sha256"),
            sha256_hex(content) + "  backup.img\n");

  // A second run refuses to overwrite the image.
  auto again = fixture.run(make_workflow(
      "image", {make_step("image", "disk-image-and-stage",
                          {{"source_disk_id", target()},
                           {"output_path", output.string()}})}));
  EXPECT_EQ(again.status, run_status_t::failed);
}

TEST(disk_image_and_stage, output_on_source_disk_is_rejected) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto outcome = single_step(
      fixture, make_step("image", "disk-image-and-stage",
                         {{"source_disk_id", target()},
                          {"output_path", (fixture.mount() / "self.img").string()}}));
  EXPECT_EQ(outcome.error,
            std::optional<error_code_t>{error_code_t::invalid_step_params});
  EXPECT_FALSE(std::filesystem::exists(fixture.mount() / "self.img"));
}

TEST(report_verify, checks_earlier_bundle) {
  auto fixture = bootforge::testing::engine_fixture{};
  auto hashed = fixture.run(make_workflow(
      "hash", {make_step("hash", "disk-hash-report", {{"target_disk_id", target()}})}));
  ASSERT_EQ(hashed.status, run_status_t::succeeded) << hashed.error.message;
  ASSERT_TRUE(hashed.report_path.has_value());

  auto verify = make_workflow(
      "verify", {make_step("check", "report-verify",
                           {{"report_path", hashed.report_path->string()}})});
  auto good = fixture.run(verify);
  ASSERT_EQ(good.status, run_status_t::succeeded) << good.error.message;
  auto document = nlohmann::json::parse(bootforge::testing::read_text(
      *good.report_path / "artifacts/check/verification.json"));
  EXPECT_EQ(document["ok"], true);
  EXPECT_EQ(document["signature_checked"], false);

  bootforge::testing::write_text(
      *hashed.report_path / "artifacts/hash/disk.sha256.json", "{}\n");
  auto bad = fixture.run(verify);
  EXPECT_EQ(bad.status, run_status_t::failed);
  EXPECT_EQ(bad.steps[0].error,
            std::optional<error_code_t>{error_code_t::integrity_violation});
  EXPECT_NE(bad.steps[0].message.find("artifacts/hash/disk.sha256.json"),
            std::string::npos);
}

TEST(report_verify, tree_mode_and_required_signature) {
  auto fixture = bootforge::testing::engine_fixture{};
  for (const auto* name : {"first", "second"}) {
    auto run = fixture.run(make_workflow(
        name, {make_step("hash", "disk-hash-report", {{"target_disk_id", target()}})}));
    ASSERT_EQ(run.status, run_status_t::succeeded) << run.error.message;
  }

  // Runs its own bundle inside a separate reports root.
  auto checker = bootforge::workflow::workflow_engine{
      fixture.registry, fixture.provider, fixture.gate,
      bootforge::workflow::run_options{.reports_dir = fixture.directory / "checks"}};
  auto tree = checker.run(
      make_workflow("verify-tree",
                    {make_step("check", "report-verify",
                               {{"report_path", fixture.reports().string()},
                                {"tree", true}})}),
      fixture.cancel);
  ASSERT_EQ(tree.status, run_status_t::succeeded) << tree.error.message;
  auto document = nlohmann::json::parse(bootforge::testing::read_text(
      *tree.report_path / "artifacts/check/verification.json"));
  EXPECT_EQ(document["reports"].size(), 2u);

  auto signed_only = checker.run(
      make_workflow("verify-signed",
                    {make_step("check", "report-verify",
                               {{"report_path", fixture.reports().string()},
                                {"tree", true},
                                {"require_signature", true}})}),
      fixture.cancel);
  EXPECT_EQ(signed_only.steps[0].error,
            std::optional<error_code_t>{error_code_t::integrity_violation});
}
