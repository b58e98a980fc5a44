#include <bootforge/workflow/actions/raw_write.hpp>

#include <bootforge/common/critical.hpp>
#include <bootforge/imaging/engine.hpp>
#include <bootforge/imaging/writer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace bootforge::workflow::actions {

using bootforge::schema::error_code_t;

std::optional<raw_write_result> write_image(
    step_context& context,
    const bootforge::imaging::disk_reader& image,
    const uint64_t chunk_size_bytes,
    const bool verify,
    bootforge::schema::error_t& error) {
  if (context.grant == nullptr) {
    bootforge::common::critical("raw write of step '{}' without authorization",
                                context.step.id);
  }
  auto plan = bootforge::imaging::plan_chunks(image.size_bytes(),
                                              chunk_size_bytes, error);
  if (!plan) {
    return std::nullopt;
  }
  auto writer =
      bootforge::imaging::open_for_write(context.provider, *context.grant, error);
  if (!writer) {
    return std::nullopt;
  }

  auto logger = context.bundle.logger();
  logger->info("writing {} ({} bytes, {} chunks) to {}", image.path().string(),
               plan->total_size_bytes, plan->chunk_count,
               context.grant->disk_id());
  auto copied = bootforge::imaging::copy_to_disk(
      image, *plan, *writer, context.make_stream_options(), error);
  if (!copied) {
    logger->error("write to {} stopped: {}", context.grant->disk_id(),
                  error.message);
    return std::nullopt;
  }

  auto result = raw_write_result{.bytes_written = copied->bytes_processed,
                                 .source_digest = copied->digest};
  if (!verify) {
    return result;
  }

  auto target = bootforge::imaging::open_read_only(
      context.provider, context.grant->disk_id(), error);
  if (!target) {
    return std::nullopt;
  }
  auto readback = bootforge::imaging::hash_stream(
      *target, *plan, context.make_stream_options(), error);
  if (!readback) {
    return std::nullopt;
  }
  result.readback_digest = readback->digest;
  if (readback->digest != copied->digest) {
    error = bootforge::schema::make_error(
        error_code_t::integrity_violation,
        context.grant->disk_id() + " reads back differently from " +
            image.path().string());
    return std::nullopt;
  }
  logger->info("read-back of {} matches sha256 {}", context.grant->disk_id(),
               bootforge::schema::to_hex(copied->digest));
  return result;
}

bootforge::schema::bytes_t describe_raw_write(
    const step_context& context,
    const bootforge::imaging::disk_reader& image,
    const raw_write_result& result) {
  auto document = nlohmann::json::object();
  document["image_path"] = image.path().string();
  document["target_disk_id"] = context.grant->disk_id();
  document["graph_id"] = context.grant->graph_id();
  document["bytes_written"] = result.bytes_written;
  document["image_sha256"] = bootforge::schema::to_hex(result.source_digest);
  if (result.readback_digest) {
    document["readback_sha256"] =
        bootforge::schema::to_hex(*result.readback_digest);
  } else {
    document["readback_sha256"] = nullptr;
  }
  auto text = document.dump(2);
  text.push_back('\n');
  return bootforge::schema::make_bytes(text);
}

}  // namespace bootforge::workflow::actions
