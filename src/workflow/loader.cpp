#include <bootforge/workflow/loader.hpp>

#include <bootforge/schema/encoding/document.hpp>

#include <spdlog/spdlog.h>

namespace bootforge::workflow {

std::optional<bootforge::schema::workflow_t> load_workflow(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error) {
  auto workflow = bootforge::schema::encoding::read_typed_document<
      bootforge::schema::workflow_t>(path, error);
  if (!workflow) {
    error.message = path.string() + ": " + error.message;
    return std::nullopt;
  }
  spdlog::debug("loaded workflow '{}' ({} steps) from {}", workflow->name,
                workflow->steps.size(), path.string());
  return workflow;
}

}  // namespace bootforge::workflow
