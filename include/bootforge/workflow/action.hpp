#pragma once
#include <bootforge/common/cancellation.hpp>
#include <bootforge/host/provider.hpp>
#include <bootforge/imaging/engine.hpp>
#include <bootforge/report/manager.hpp>
#include <bootforge/safety/gate.hpp>
#include <bootforge/schema/action_kind.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <bootforge/schema/step_status.hpp>
#include <bootforge/schema/workflow.hpp>
#include <bootforge/workflow/params.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bootforge::workflow {

/// Per-invocation settings. Passed explicitly into every run; nothing here is
/// read from process-wide state.
struct run_options final {
  std::filesystem::path reports_dir{"reports"};
  // Signs `manifest.sig` and checks signed bundles in `report-verify`.
  std::optional<bootforge::schema::bytes_t> signing_key;
  uint64_t default_chunk_size_bytes{bootforge::schema::kDefaultChunkSizeBytes};
  bootforge::imaging::progress_callback_t progress;
};

/// What an action handler reports back to the engine.
struct step_outcome final {
  bootforge::schema::step_status_t status{
      bootforge::schema::step_status_t::failed};
  bootforge::schema::error_t error;
  std::string message;
  // Bundle-relative artifact paths.
  std::vector<std::string> artifacts;
};

step_outcome make_success(std::string message,
                          std::vector<std::string> artifacts = {});
step_outcome make_failure(bootforge::schema::error_t error);

/// Everything a handler may touch while executing one step.
struct step_context final {
  const bootforge::schema::workflow_step_t& step;
  const bootforge::host::host_provider& provider;
  bootforge::report::report_bundle& bundle;
  const bootforge::common::cancel_signal& cancel;
  const run_options& options;
  // Set for destructive actions only, after the gate authorized the step.
  const bootforge::safety::authorization* grant{nullptr};

  /// Chunk size from `chunk_size_bytes` or the run default.
  uint64_t chunk_size(const bootforge::schema::step_params_t& params) const;

  /// Stream options wired to the run's cancel signal and progress callback.
  bootforge::imaging::stream_options make_stream_options() const;
};

using action_handler_t =
    std::function<step_outcome(const bootforge::schema::step_params_t&,
                               step_context&)>;

struct action_descriptor final {
  bootforge::schema::action_kind_t kind;
  // Destructive actions pass the safety gate before the handler runs and
  // must name their target through `target_disk_id` and/or `target_mount`.
  bool destructive{false};
  std::vector<param_spec> required;
  std::vector<param_spec> optional;
  action_handler_t handler;
};

}  // namespace bootforge::workflow
