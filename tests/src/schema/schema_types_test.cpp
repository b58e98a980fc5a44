#include <bootforge/schema/device_graph.hpp>
#include <bootforge/schema/encoding/document.hpp>
#include <bootforge/schema/encoding/json/encoder.hpp>
#include <bootforge/schema/encoding/yaml/document.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <bootforge/schema/schema_version.hpp>
#include <bootforge/schema/workflow.hpp>
#include <bootforge/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using encoder_t =
    bootforge::schema::encoding::encoder<bootforge::schema::encoding::json_encoder_tag>;

}  // namespace

TEST(schema_types, defaults_are_fail_safe) {
  auto disk = bootforge::schema::disk_t{};
  EXPECT_TRUE(disk.is_system_disk);
  EXPECT_FALSE(disk.removable);
  EXPECT_TRUE(disk.partitions.empty());

  auto workflow = bootforge::schema::workflow_t{};
  EXPECT_EQ(workflow.schema_version, bootforge::schema::kWorkflowSchemaVersion);
  EXPECT_TRUE(workflow.steps.empty());
}

TEST(schema_types, device_graph_json_round_trips) {
  auto graph = bootforge::testing::make_fixture_graph();
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(graph);

  auto decoded = encoder.try_decode<bootforge::schema::device_graph_t>(
      bootforge::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->graph_id, graph.graph_id);
  EXPECT_EQ(decoded->schema_version, bootforge::schema::kDeviceGraphSchemaVersion);
  EXPECT_EQ(decoded->host.os, "linux");
  ASSERT_EQ(decoded->disks.size(), 2u);
  EXPECT_TRUE(decoded->disks[0].is_system_disk);
  EXPECT_FALSE(decoded->disks[1].is_system_disk);
  ASSERT_EQ(decoded->disks[1].partitions.size(), 1u);
  EXPECT_EQ(decoded->disks[1].partitions[0].fs, std::optional<std::string>{"vfat"});
  EXPECT_EQ(decoded->disks[1].partitions[0].mount_points.count("/media/usb"), 1u);

  // Deterministic output: encoding again yields identical bytes.
  EXPECT_EQ(encoder.encode(*decoded), encoded);
}

TEST(schema_types, missing_system_flag_decodes_as_system_disk) {
  auto text = std::string{R"({"id":"sdb","friendly_name":"stick",
                              "size_bytes":1024,"removable":true})"};
  auto encoder = encoder_t{};
  auto disk = encoder.try_decode<bootforge::schema::disk_t>(
      bootforge::schema::make_bytes_view(text));
  ASSERT_TRUE(disk.has_value());
  EXPECT_TRUE(disk->is_system_disk);
}

TEST(schema_types, malformed_json_is_invalid_document) {
  auto text = std::string{"{not json"};
  auto encoder = encoder_t{};
  auto error = bootforge::schema::error_t{};
  auto workflow = encoder.try_decode<bootforge::schema::workflow_t>(
      bootforge::schema::make_bytes_view(text), error);
  EXPECT_FALSE(workflow.has_value());
  EXPECT_EQ(error.code, bootforge::schema::error_code_t::invalid_document);
}

TEST(schema_types, workflow_step_params_must_be_mapping) {
  auto text = std::string{R"({"schema_version":"1.0.0","name":"w",
      "steps":[{"id":"a","action":"disk-hash-report","params":[1,2]}]})"};
  auto encoder = encoder_t{};
  auto error = bootforge::schema::error_t{};
  auto workflow = encoder.try_decode<bootforge::schema::workflow_t>(
      bootforge::schema::make_bytes_view(text), error);
  EXPECT_FALSE(workflow.has_value());
  EXPECT_EQ(error.code, bootforge::schema::error_code_t::invalid_document);
}

TEST(schema_types, yaml_workflow_parses_with_typed_scalars) {
  auto text = std::string{
      "schema_version: \"1.0.0\"\n"
      "name: hash-usb\n"
      "steps:\n"
      "  - id: hash\n"
      "    action: disk-hash-report\n"
      "    params:\n"
      "      target_disk_id: \"1234\"\n"
      "      chunk_size_bytes: 4096\n"
      "      per_chunk: true\n"};
  auto error = bootforge::schema::error_t{};
  auto document = bootforge::schema::encoding::yaml::try_parse(text, error);
  ASSERT_TRUE(document.has_value()) << error.message;

  auto encoder = encoder_t{};
  auto workflow =
      encoder.try_from_document<bootforge::schema::workflow_t>(*document, error);
  ASSERT_TRUE(workflow.has_value()) << error.message;
  ASSERT_EQ(workflow->steps.size(), 1u);
  const auto& params = workflow->steps[0].params;
  EXPECT_TRUE(params.at("target_disk_id").is_string());
  EXPECT_EQ(params.at("chunk_size_bytes").get<uint64_t>(), 4096u);
  EXPECT_TRUE(params.at("per_chunk").get<bool>());
}

TEST(schema_types, yaml_rejects_multiple_documents) {
  auto error = bootforge::schema::error_t{};
  auto document = bootforge::schema::encoding::yaml::try_parse(
      "name: a\n---\nname: b\n", error);
  EXPECT_FALSE(document.has_value());
  EXPECT_EQ(error.code, bootforge::schema::error_code_t::invalid_document);
}

TEST(schema_types, read_document_selects_codec_by_extension) {
  auto directory = bootforge::testing::temp_dir{"bootforge_schema_docs"};
  bootforge::testing::write_text(directory / "w.yml", "name: from-yaml\n");
  bootforge::testing::write_text(directory / "w.json", R"({"name":"from-json"})");

  auto error = bootforge::schema::error_t{};
  auto yaml = bootforge::schema::encoding::read_document(directory / "w.yml", error);
  ASSERT_TRUE(yaml.has_value()) << error.message;
  EXPECT_EQ(yaml->at("name").get<std::string>(), "from-yaml");

  auto json = bootforge::schema::encoding::read_document(directory / "w.json", error);
  ASSERT_TRUE(json.has_value()) << error.message;
  EXPECT_EQ(json->at("name").get<std::string>(), "from-json");

  auto missing =
      bootforge::schema::encoding::read_document(directory / "none.json", error);
  EXPECT_FALSE(missing.has_value());
  EXPECT_EQ(error.code, bootforge::schema::error_code_t::not_found);
}

TEST(schema_types, schema_version_requires_same_major) {
  auto error = bootforge::schema::error_t{};
  EXPECT_TRUE(bootforge::schema::check_schema_version("workflow", "1.0.0",
                                                      "1.4.2", error));
  EXPECT_FALSE(bootforge::schema::check_schema_version("workflow", "1.0.0",
                                                       "2.0.0", error));
  EXPECT_EQ(error.code, bootforge::schema::error_code_t::schema_version_mismatch);
  EXPECT_FALSE(bootforge::schema::check_schema_version("workflow", "1.0.0",
                                                       "one", error));
  EXPECT_EQ(error.code, bootforge::schema::error_code_t::schema_version_mismatch);
}

TEST(schema_types, device_graph_lookup_by_mount) {
  auto graph = bootforge::testing::make_fixture_graph("/media/usb");
  const auto* disk = bootforge::schema::find_disk_by_mount(graph, "/media/usb/");
  ASSERT_NE(disk, nullptr);
  EXPECT_EQ(disk->id, bootforge::testing::kTargetDiskId);
  EXPECT_EQ(bootforge::schema::find_disk_by_mount(graph, "/media"), nullptr);
  EXPECT_EQ(bootforge::schema::find_disk(graph, "PhysicalDrive9"), nullptr);
}

TEST(schema_types, device_graph_validation_catches_duplicates) {
  auto graph = bootforge::testing::make_fixture_graph();
  auto error = bootforge::schema::error_t{};
  EXPECT_TRUE(bootforge::schema::validate_device_graph(graph, error));

  graph.disks.push_back(graph.disks.front());
  EXPECT_FALSE(bootforge::schema::validate_device_graph(graph, error));
  EXPECT_EQ(error.code, bootforge::schema::error_code_t::invalid_document);
}

TEST(schema_types, fresh_graphs_get_distinct_ids) {
  auto first = bootforge::testing::make_fixture_graph();
  auto second = bootforge::testing::make_fixture_graph();
  EXPECT_TRUE(bootforge::schema::is_uuid(first.graph_id));
  EXPECT_NE(first.graph_id, second.graph_id);
}

TEST(primitives, hex_round_trips_and_rejects_garbage) {
  auto bytes = bootforge::schema::bytes_t{0x00, 0xAB, 0x10, 0xFF};
  auto hex = bootforge::schema::to_hex(bootforge::schema::make_bytes_view(bytes));
  EXPECT_EQ(hex, "00ab10ff");
  EXPECT_EQ(bootforge::schema::try_from_hex(hex), bytes);
  EXPECT_EQ(bootforge::schema::try_from_hex("00AB10FF"), bytes);
  EXPECT_FALSE(bootforge::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(bootforge::schema::try_from_hex("zz").has_value());
}

TEST(primitives, timestamps_are_utc) {
  auto now = bootforge::schema::now_utc_rfc3339();
  ASSERT_FALSE(now.empty());
  EXPECT_EQ(now.back(), 'Z');
  EXPECT_EQ(now[10], 'T');
}

TEST(primitives, error_codes_map_to_strings) {
  EXPECT_EQ(bootforge::schema::to_string(
                bootforge::schema::error_code_t::system_disk_protected),
            "system_disk_protected");
  EXPECT_EQ(bootforge::schema::try_from_string<bootforge::schema::error_code_t>(
                "device_busy"),
            bootforge::schema::error_code_t::device_busy);
  EXPECT_TRUE(bootforge::schema::is_safety_denial(
      bootforge::schema::error_code_t::force_mode_required));
  EXPECT_FALSE(bootforge::schema::is_safety_denial(
      bootforge::schema::error_code_t::io_error));
}
