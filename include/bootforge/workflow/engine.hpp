#pragma once
#include <bootforge/common/cancellation.hpp>
#include <bootforge/host/provider.hpp>
#include <bootforge/safety/gate.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/step_result.hpp>
#include <bootforge/schema/step_status.hpp>
#include <bootforge/schema/workflow.hpp>
#include <bootforge/workflow/action.hpp>
#include <bootforge/workflow/registry.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bootforge::workflow {

/// Structural checks run before any device is touched: supported schema
/// version, non-empty name, at least one step, unique non-empty step ids,
/// registered actions, declared parameters of the right types, and a target
/// for every destructive step.
bool validate_workflow(const bootforge::schema::workflow_t& workflow,
                       const action_registry& registry,
                       bootforge::schema::error_t& error);

struct run_result final {
  std::string run_id;
  bootforge::schema::run_status_t status{
      bootforge::schema::run_status_t::failed};
  std::vector<bootforge::schema::step_result_t> steps;
  // Bundle directory; absent when the run stopped before one was created.
  std::optional<std::filesystem::path> report_path;
  // First fault of the run, `ok` on success.
  bootforge::schema::error_t error;
};

/// Executes workflows step by step in declaration order.
///
/// A run validates the whole document first, then opens an evidence bundle
/// and executes steps one at a time. Destructive steps resolve their target
/// against a fresh device graph and pass the safety gate immediately before
/// the handler runs. The first failing step aborts the run and every later
/// step is recorded `not_run`. Cancellation ends the current step as
/// `cancelled`. The bundle is finalized whatever the outcome.
class workflow_engine final {
 public:
  workflow_engine(const action_registry& registry,
                  const bootforge::host::host_provider& provider,
                  bootforge::safety::safety_gate& gate,
                  run_options options);

  run_result run(const bootforge::schema::workflow_t& workflow,
                 const bootforge::common::cancel_signal& cancel);

 private:
  bootforge::schema::step_result_t run_step(
      const bootforge::schema::workflow_step_t& step,
      bootforge::report::report_bundle& bundle,
      const bootforge::common::cancel_signal& cancel);

  step_outcome execute(const bootforge::schema::workflow_step_t& step,
                       const action_descriptor& descriptor,
                       bootforge::report::report_bundle& bundle,
                       const bootforge::common::cancel_signal& cancel);

  std::optional<bootforge::schema::disk_id_t> resolve_target(
      const bootforge::schema::step_params_t& params,
      bootforge::schema::error_t& error) const;

  const action_registry& registry_;
  const bootforge::host::host_provider& provider_;
  bootforge::safety::safety_gate& gate_;
  run_options options_;
};

}  // namespace bootforge::workflow
