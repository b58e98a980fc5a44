#include <bootforge/workflow/actions/actions.hpp>

#include <bootforge/imaging/engine.hpp>
#include <bootforge/schema/encoding/document.hpp>
#include <bootforge/schema/encoding/json/chunk_plan.hpp>

#include <nlohmann/json.hpp>

namespace bootforge::workflow::actions {

namespace {

using bootforge::schema::error_code_t;

bool lies_under(const std::filesystem::path& path,
                const std::filesystem::path& directory) {
  auto relative = path.lexically_relative(directory);
  return !relative.empty() && *std::begin(relative) != "..";
}

// The image must not land on the disk it is read from.
bool output_on_source(const std::filesystem::path& output,
                      const bootforge::schema::disk_t& source) {
  auto ec = std::error_code{};
  auto resolved = std::filesystem::weakly_canonical(
      std::filesystem::absolute(output, ec), ec);
  for (const auto& partition : source.partitions) {
    for (const auto& mount_point : partition.mount_points) {
      if (lies_under(resolved, std::filesystem::path{mount_point})) {
        return true;
      }
    }
  }
  return false;
}

step_outcome image_disk(const bootforge::schema::step_params_t& params,
                        step_context& context) {
  auto error = bootforge::schema::error_t{};
  auto disk_id = *string_param(params, "source_disk_id");
  auto output = std::filesystem::path{*string_param(params, "output_path")};

  auto graph = context.provider.device_graph(error);
  if (!graph) {
    return make_failure(std::move(error));
  }
  const auto* disk = bootforge::schema::find_disk(*graph, disk_id);
  if (disk == nullptr) {
    return make_failure(bootforge::schema::make_error(
        error_code_t::disk_not_found,
        "disk '" + disk_id + "' is not in the device graph"));
  }
  if (output_on_source(output, *disk)) {
    return make_failure(bootforge::schema::make_error(
        error_code_t::invalid_step_params,
        output.string() + " lies on a mount of the source disk " + disk_id));
  }

  auto reader =
      bootforge::imaging::open_read_only(context.provider, disk_id, error);
  if (!reader) {
    return make_failure(std::move(error));
  }
  auto plan = bootforge::imaging::plan_chunks(
      reader->size_bytes(), context.chunk_size(params), error);
  if (!plan) {
    return make_failure(std::move(error));
  }
  context.bundle.logger()->info("imaging {} into {} ({} bytes)", disk_id,
                                output.string(), plan->total_size_bytes);
  auto copied = bootforge::imaging::copy_to_file(
      *reader, *plan, output, context.make_stream_options(), error);
  if (!copied) {
    return make_failure(std::move(error));
  }

  auto hex = bootforge::schema::to_hex(copied->digest);
  auto sidecar = hex + "  " + output.filename().string() + "\n";
  auto sidecar_path = output;
  sidecar_path += ".sha256";
  if (!bootforge::schema::encoding::write_file(
          sidecar_path, bootforge::schema::make_bytes_view(sidecar), error)) {
    return make_failure(std::move(error));
  }

  auto document = nlohmann::json::object();
  document["source_disk_id"] = disk_id;
  document["graph_id"] = graph->graph_id;
  document["output_path"] = output.string();
  document["chunk_plan"] = *plan;
  document["bytes_written"] = copied->bytes_processed;
  document["sha256"] = hex;
  auto text = document.dump(2);
  text.push_back('\n');
  auto artifact = context.bundle.write_artifact(
      context.step.id + "/image.json",
      bootforge::schema::make_bytes_view(text), error);
  if (!artifact) {
    return make_failure(std::move(error));
  }
  return make_success("imaged " + disk_id + " to " + output.string() +
                          " (sha256 " + hex + ")",
                      {*artifact});
}

}  // namespace

action_descriptor make_disk_image_and_stage() {
  return action_descriptor{
      .kind = bootforge::schema::action_kind_t::disk_image_and_stage,
      .destructive = false,
      .required = {{.name = "source_disk_id", .type = param_type_t::string},
                   {.name = "output_path", .type = param_type_t::string}},
      .optional = {{.name = "chunk_size_bytes",
                    .type = param_type_t::positive_integer}},
      .handler = image_disk};
}

}  // namespace bootforge::workflow::actions
