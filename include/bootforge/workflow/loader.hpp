#pragma once
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/workflow.hpp>
#include <filesystem>
#include <optional>

namespace bootforge::workflow {

/// Parse a workflow document (`.yaml`/`.yml` as YAML, anything else JSON).
/// Structure only; see `validate_workflow` for the semantic checks.
std::optional<bootforge::schema::workflow_t> load_workflow(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error);

}  // namespace bootforge::workflow
