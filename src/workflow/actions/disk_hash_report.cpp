#include <bootforge/workflow/actions/actions.hpp>

#include <bootforge/imaging/engine.hpp>
#include <bootforge/schema/encoding/json/chunk_plan.hpp>

#include <nlohmann/json.hpp>

namespace bootforge::workflow::actions {

namespace {

step_outcome hash_disk(const bootforge::schema::step_params_t& params,
                       step_context& context) {
  auto error = bootforge::schema::error_t{};
  auto disk_id = *string_param(params, "target_disk_id");
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

  auto options = context.make_stream_options();
  options.per_chunk_digests = bool_param(params, "per_chunk", false);
  context.bundle.logger()->info("hashing {} ({} bytes in {} chunks)", disk_id,
                                plan->total_size_bytes, plan->chunk_count);
  auto digest = bootforge::imaging::hash_stream(*reader, *plan, options, error);
  if (!digest) {
    return make_failure(std::move(error));
  }

  auto document = nlohmann::json::object();
  document["disk_id"] = disk_id;
  document["device_path"] = reader->path().string();
  document["chunk_plan"] = *plan;
  document["bytes_processed"] = digest->bytes_processed;
  document["sha256"] = bootforge::schema::to_hex(digest->digest);
  if (options.per_chunk_digests) {
    auto chunks = nlohmann::json::array();
    for (const auto& chunk : digest->chunk_digests) {
      chunks.push_back(bootforge::schema::to_hex(chunk));
    }
    document["chunk_sha256"] = std::move(chunks);
  }
  document["computed_at_utc"] = bootforge::schema::now_utc_rfc3339();
  auto text = document.dump(2);
  text.push_back('\n');

  auto artifact = context.bundle.write_artifact(
      context.step.id + "/disk.sha256.json",
      bootforge::schema::make_bytes_view(text), error);
  if (!artifact) {
    return make_failure(std::move(error));
  }
  return make_success("sha256 " + bootforge::schema::to_hex(digest->digest) +
                          " over " + std::to_string(digest->bytes_processed) +
                          " bytes of " + disk_id,
                      {*artifact});
}

}  // namespace

action_descriptor make_disk_hash_report() {
  return action_descriptor{
      .kind = bootforge::schema::action_kind_t::disk_hash_report,
      .destructive = false,
      .required = {{.name = "target_disk_id", .type = param_type_t::string}},
      .optional = {{.name = "chunk_size_bytes",
                    .type = param_type_t::positive_integer},
                   {.name = "per_chunk", .type = param_type_t::boolean}},
      .handler = hash_disk};
}

}  // namespace bootforge::workflow::actions
