#pragma once
#include <bootforge/schema/device_graph.hpp>
#include <bootforge/schema/primitives.hpp>
#include <bootforge/schema/step_result.hpp>
#include <bootforge/schema/step_status.hpp>
#include <bootforge/schema/workflow.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::schema {

inline constexpr auto kReportSchemaVersion = std::string_view{"1.0.0"};

/// Contents of `run.json` in an evidence bundle.
template <uint16_t Version>
struct run_metadata;

template <>
struct run_metadata<1> final {
  std::string schema_version{kReportSchemaVersion};
  std::string run_id;
  std::string workflow_name;
  std::string workflow_schema_version{kWorkflowSchemaVersion};
  std::string device_graph_schema_version{kDeviceGraphSchemaVersion};
  timestamp_utc_t created_at_utc;
  std::optional<timestamp_utc_t> finished_at_utc;
  run_status_t status{run_status_t::running};
  std::vector<step_result_t> steps;
};

using run_metadata_t = run_metadata<1>;

}  // namespace bootforge::schema
