#include <bootforge/pack/pack.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/step_status.hpp>
#include <bootforge/testing/archive.hpp>
#include <bootforge/testing/common.hpp>
#include <bootforge/testing/workflow.hpp>
#include <bootforge/workflow/registry.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace {

using bootforge::schema::error_code_t;
using bootforge::schema::run_status_t;

constexpr auto kManifest = R"(schema_version: "1.0.0"
name: rescue-kit
version: "2.1.0"
description: Hash the stick, then check the evidence
workflows:
  - workflows/hash.yaml
  - workflows/verify.json
assets: assets
)";

constexpr auto kHashWorkflow = R"(schema_version: "1.0.0"
name: hash-stick
steps:
  - id: hash
    action: disk-hash-report
    params:
      target_disk_id: PhysicalDrive1
)";

constexpr auto kBrokenRunWorkflow = R"({
  "schema_version": "1.0.0",
  "name": "hash-missing",
  "steps": [
    {"id": "hash", "action": "disk-hash-report",
     "params": {"target_disk_id": "PhysicalDrive9"}}
  ]
})";

// Writes a pack whose second workflow hashes a disk that does not exist.
std::filesystem::path write_pack(const std::filesystem::path& root) {
  bootforge::testing::write_text(root / "pack.yaml", kManifest);
  bootforge::testing::write_text(root / "workflows/hash.yaml", kHashWorkflow);
  bootforge::testing::write_text(root / "workflows/verify.json", kBrokenRunWorkflow);
  bootforge::testing::write_text(root / "assets/README.txt", "rescue kit\n");
  bootforge::testing::write_text(root / "assets/images/rescue.img", "IMG");
  return root / "pack.yaml";
}

std::vector<std::string> member_names(const std::filesystem::path& archive) {
  auto error = bootforge::schema::error_t{};
  auto members = bootforge::testing::read_tar_gz(archive, error);
  EXPECT_TRUE(members.has_value()) << error.message;
  auto names = std::vector<std::string>{};
  if (members) {
    for (const auto& member : *members) {
      names.push_back(member.name);
    }
  }
  std::sort(std::begin(names), std::end(names));
  return names;
}

}  // namespace

TEST(pack, loads_manifest_and_workflows) {
  auto directory = bootforge::testing::temp_dir{"bootforge_pack_load"};
  auto manifest = write_pack(directory.path());
  auto registry = bootforge::workflow::make_default_registry();

  auto error = bootforge::schema::error_t{};
  auto pack = bootforge::pack::load_pack(manifest, registry, error);
  ASSERT_TRUE(pack.has_value()) << error.message;
  EXPECT_EQ(pack->manifest.name, "rescue-kit");
  EXPECT_EQ(pack->manifest.version, "2.1.0");
  EXPECT_EQ(pack->base_directory, directory.path());
  ASSERT_EQ(pack->workflows.size(), 2u);
  EXPECT_EQ(pack->workflows[0].first, "workflows/hash.yaml");
  EXPECT_EQ(pack->workflows[0].second.name, "hash-stick");
  EXPECT_EQ(pack->workflows[1].second.name, "hash-missing");

  auto listing = bootforge::pack::content_listing(*pack, error);
  ASSERT_TRUE(listing.has_value()) << error.message;
  EXPECT_EQ(std::count(std::begin(*listing), std::end(*listing), '\n'), 5);
  EXPECT_EQ(listing->rfind("assets/README.txt  ", 0), 0u);
}

TEST(pack, rejects_paths_outside_the_pack) {
  auto directory = bootforge::testing::temp_dir{"bootforge_pack_escape"};
  auto registry = bootforge::workflow::make_default_registry();
  bootforge::testing::write_text(directory / "outside.yaml", kHashWorkflow);
  bootforge::testing::write_text(
      directory / "kit/pack.json",
      R"({"schema_version": "1.0.0", "name": "kit", "version": "1",
          "workflows": ["../outside.yaml"]})");

  auto error = bootforge::schema::error_t{};
  EXPECT_FALSE(
      bootforge::pack::load_pack(directory / "kit/pack.json", registry, error)
          .has_value());
  EXPECT_EQ(error.code, error_code_t::invalid_document);

  bootforge::testing::write_text(
      directory / "kit/absolute.json",
      R"({"schema_version": "1.0.0", "name": "kit", "version": "1",
          "workflows": ["/etc/workflow.yaml"]})");
  EXPECT_FALSE(
      bootforge::pack::load_pack(directory / "kit/absolute.json", registry, error)
          .has_value());
  EXPECT_EQ(error.code, error_code_t::invalid_document);
}

TEST(pack, rejects_invalid_member_workflow) {
  auto directory = bootforge::testing::temp_dir{"bootforge_pack_invalid"};
  auto manifest = write_pack(directory.path());
  bootforge::testing::write_text(
      directory / "workflows/hash.yaml",
      "schema_version: \"1.0.0\"\nname: bad\nsteps:\n  - id: a\n    action: shred\n");
  auto registry = bootforge::workflow::make_default_registry();

  auto error = bootforge::schema::error_t{};
  EXPECT_FALSE(bootforge::pack::load_pack(manifest, registry, error).has_value());
  EXPECT_EQ(error.code, error_code_t::unsupported_action);
  EXPECT_NE(error.message.find("workflows/hash.yaml"), std::string::npos);
}

TEST(pack, signature_detects_tampering) {
  auto directory = bootforge::testing::temp_dir{"bootforge_pack_sign"};
  auto manifest = write_pack(directory.path());
  auto registry = bootforge::workflow::make_default_registry();
  auto key = bootforge::schema::make_bytes(std::string{"pack key"});

  auto error = bootforge::schema::error_t{};
  auto pack = bootforge::pack::load_pack(manifest, registry, error);
  ASSERT_TRUE(pack.has_value()) << error.message;

  EXPECT_FALSE(bootforge::pack::verify_pack(*pack, key, error));
  EXPECT_EQ(error.code, error_code_t::integrity_violation);

  auto signature = bootforge::pack::sign_pack(*pack, key, error);
  ASSERT_TRUE(signature.has_value()) << error.message;
  EXPECT_EQ(*signature, directory / "pack.sig");
  EXPECT_TRUE(bootforge::pack::verify_pack(*pack, key, error)) << error.message;

  auto other_key = bootforge::schema::make_bytes(std::string{"other key"});
  EXPECT_FALSE(bootforge::pack::verify_pack(*pack, other_key, error));
  EXPECT_EQ(error.code, error_code_t::integrity_violation);

  bootforge::testing::write_text(directory / "assets/images/rescue.img", "IMH");
  EXPECT_FALSE(bootforge::pack::verify_pack(*pack, key, error));
  EXPECT_EQ(error.code, error_code_t::integrity_violation);
}

TEST(pack, export_includes_every_member) {
  auto directory = bootforge::testing::temp_dir{"bootforge_pack_export"};
  auto manifest = write_pack(directory / "kit");
  auto registry = bootforge::workflow::make_default_registry();
  auto key = bootforge::schema::make_bytes(std::string{"pack key"});

  auto error = bootforge::schema::error_t{};
  auto pack = bootforge::pack::load_pack(manifest, registry, error);
  ASSERT_TRUE(pack.has_value()) << error.message;
  ASSERT_TRUE(bootforge::pack::sign_pack(*pack, key, error).has_value());

  auto archive = directory / "rescue-kit.tar.gz";
  ASSERT_TRUE(bootforge::pack::export_pack(*pack, archive, error)) << error.message;
  EXPECT_EQ(member_names(archive),
            (std::vector<std::string>{"assets/README.txt", "assets/images/rescue.img",
                                      "pack.sig", "pack.yaml", "workflows/hash.yaml",
                                      "workflows/verify.json"}));
}

TEST(pack, run_stops_at_first_failed_workflow) {
  auto fixture = bootforge::testing::engine_fixture{"bootforge_pack_run"};
  auto manifest = write_pack(fixture.directory / "kit");
  bootforge::testing::write_text(
      fixture.directory / "kit/pack.yaml",
      "schema_version: \"1.0.0\"\nname: rescue-kit\nversion: \"2.1.0\"\n"
      "workflows:\n  - workflows/hash.yaml\n  - workflows/verify.json\n"
      "  - workflows/hash.yaml\n");

  auto error = bootforge::schema::error_t{};
  auto pack = bootforge::pack::load_pack(manifest, fixture.registry, error);
  ASSERT_TRUE(pack.has_value()) << error.message;
  ASSERT_EQ(pack->workflows.size(), 3u);

  auto result = bootforge::pack::run_pack(*pack, fixture.engine, fixture.cancel);
  EXPECT_EQ(result.status, run_status_t::failed);
  ASSERT_EQ(result.runs.size(), 2u);
  EXPECT_EQ(result.runs[0].status, run_status_t::succeeded);
  EXPECT_EQ(result.runs[1].status, run_status_t::failed);
  EXPECT_NE(result.error.message.find("workflows/verify.json"), std::string::npos);
}
