#include <bootforge/workflow/engine.hpp>

#include <bootforge/common/logging.hpp>
#include <bootforge/schema/schema_version.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <set>
#include <utility>

namespace bootforge::workflow {

namespace {

using bootforge::schema::error_code_t;
using bootforge::schema::run_status_t;
using bootforge::schema::step_status_t;

bootforge::schema::step_result_t not_run(
    const bootforge::schema::workflow_step_t& step) {
  auto result = bootforge::schema::step_result_t{};
  result.id = step.id;
  result.action = step.action;
  result.status = step_status_t::not_run;
  return result;
}

std::string describe_trail(const bootforge::safety::gate_decision& decision) {
  auto trail = std::string{};
  for (const auto& state : decision.trail) {
    if (!trail.empty()) {
      trail += " -> ";
    }
    trail += bootforge::schema::to_string(state);
  }
  return trail;
}

}  // namespace

bool validate_workflow(const bootforge::schema::workflow_t& workflow,
                       const action_registry& registry,
                       bootforge::schema::error_t& error) {
  if (!bootforge::schema::check_schema_version(
          "workflow", bootforge::schema::kWorkflowSchemaVersion,
          workflow.schema_version, error)) {
    return false;
  }
  if (workflow.name.empty()) {
    error = bootforge::schema::make_error(error_code_t::invalid_document,
                                          "workflow name is empty");
    return false;
  }
  if (workflow.steps.empty()) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_document,
        "workflow '" + workflow.name + "' has no steps");
    return false;
  }

  auto ids = std::set<std::string>{};
  for (const auto& step : workflow.steps) {
    if (step.id.empty()) {
      error = bootforge::schema::make_error(error_code_t::invalid_document,
                                            "a step has an empty id");
      return false;
    }
    if (!ids.insert(step.id).second) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_document, "duplicate step id '" + step.id + "'");
      return false;
    }
    const auto* descriptor = registry.find(step.action);
    if (descriptor == nullptr) {
      error = bootforge::schema::make_error(
          error_code_t::unsupported_action,
          "step '" + step.id + "': unsupported action '" + step.action + "'");
      return false;
    }
    if (!validate_params(step.id, step.params, descriptor->required,
                         descriptor->optional, error)) {
      return false;
    }
    if (descriptor->destructive && !step.params.contains("target_disk_id") &&
        !step.params.contains("target_mount")) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_step_params,
          "step '" + step.id + "': destructive action '" + step.action +
              "' needs target_disk_id or target_mount");
      return false;
    }
  }
  return true;
}

workflow_engine::workflow_engine(const action_registry& registry,
                                 const bootforge::host::host_provider& provider,
                                 bootforge::safety::safety_gate& gate,
                                 run_options options)
    : registry_{registry},
      provider_{provider},
      gate_{gate},
      options_{std::move(options)} {}

run_result workflow_engine::run(const bootforge::schema::workflow_t& workflow,
                                const bootforge::common::cancel_signal& cancel) {
  auto result = run_result{};
  auto abort_before_start = [&](bootforge::schema::error_t error) {
    spdlog::error("workflow '{}' not started: {}", workflow.name, error.message);
    for (const auto& step : workflow.steps) {
      result.steps.push_back(not_run(step));
    }
    result.status = run_status_t::failed;
    result.error = std::move(error);
    return result;
  };

  auto error = bootforge::schema::error_t{};
  if (!validate_workflow(workflow, registry_, error)) {
    return abort_before_start(std::move(error));
  }
  auto graph = provider_.device_graph(error);
  if (!graph) {
    return abort_before_start(std::move(error));
  }
  auto bundle = bootforge::report::report_bundle::create(
      options_.reports_dir, *graph, workflow.name, error);
  if (!bundle) {
    return abort_before_start(std::move(error));
  }
  result.run_id = bundle->run_id();
  result.report_path = bundle->root();
  result.status = run_status_t::succeeded;

  {
    auto scoped = bootforge::common::scoped_default_logger{bundle->logger()};
    spdlog::info("workflow '{}' run {} started with {} steps on {}",
                 workflow.name, result.run_id, workflow.steps.size(),
                 provider_.name());

    auto stopped = false;
    for (const auto& step : workflow.steps) {
      if (!stopped && cancel.cancelled()) {
        spdlog::warn("run {} cancelled before step '{}'", result.run_id,
                     step.id);
        result.status = run_status_t::cancelled;
        result.error = bootforge::schema::make_error(error_code_t::cancelled,
                                                     "run cancelled");
        stopped = true;
      }
      auto step_result =
          stopped ? not_run(step) : run_step(step, *bundle, cancel);

      if (!stopped && step_result.status != step_status_t::success) {
        stopped = true;
        result.status = step_result.status == step_status_t::cancelled
                            ? run_status_t::cancelled
                            : run_status_t::failed;
        result.error = bootforge::schema::make_error(
            step_result.error.value_or(error_code_t::io_error),
            "step '" + step.id + "': " + step_result.message);
      }

      // Recorded only once the step is over.
      if (!bundle->append_step(step_result, error)) {
        spdlog::error("cannot record step '{}': {}", step.id, error.message);
        if (!stopped) {
          stopped = true;
          result.status = run_status_t::failed;
          result.error = error;
        }
      }
      result.steps.push_back(std::move(step_result));
    }
    spdlog::info("workflow '{}' run {} ended: {}", workflow.name,
                 result.run_id, bootforge::schema::to_string(result.status));
  }

  if (!bundle->finalize(result.status, options_.signing_key, error)) {
    spdlog::error("cannot finalize evidence bundle {}: {}", result.run_id,
                  error.message);
    if (result.status == run_status_t::succeeded) {
      result.status = run_status_t::failed;
      result.error = error;
    }
  }
  return result;
}

bootforge::schema::step_result_t workflow_engine::run_step(
    const bootforge::schema::workflow_step_t& step,
    bootforge::report::report_bundle& bundle,
    const bootforge::common::cancel_signal& cancel) {
  auto result = bootforge::schema::step_result_t{};
  result.id = step.id;
  result.action = step.action;
  result.started_at_utc = bootforge::schema::now_utc_rfc3339();
  auto started = std::chrono::steady_clock::now();
  spdlog::info("step '{}' ({}) started", step.id, step.action);

  auto outcome = step_outcome{};
  const auto* descriptor = registry_.find(step.action);
  if (descriptor == nullptr) {
    outcome = make_failure(bootforge::schema::make_error(
        error_code_t::unsupported_action,
        "unsupported action '" + step.action + "'"));
  } else {
    outcome = execute(step, *descriptor, bundle, cancel);
  }

  result.finished_at_utc = bootforge::schema::now_utc_rfc3339();
  result.duration_ms = static_cast<bootforge::schema::duration_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count());
  result.status = outcome.status;
  result.message = std::move(outcome.message);
  result.artifacts = std::move(outcome.artifacts);
  if (outcome.status != step_status_t::success) {
    result.error = outcome.error.code;
    spdlog::error("step '{}' {}: {} ({})", step.id,
                  bootforge::schema::to_string(result.status), result.message,
                  bootforge::schema::to_string(outcome.error.code));
  } else {
    spdlog::info("step '{}' succeeded in {} ms: {}", step.id,
                 result.duration_ms, result.message);
  }
  return result;
}

step_outcome workflow_engine::execute(
    const bootforge::schema::workflow_step_t& step,
    const action_descriptor& descriptor,
    bootforge::report::report_bundle& bundle,
    const bootforge::common::cancel_signal& cancel) {
  auto context = step_context{.step = step,
                              .provider = provider_,
                              .bundle = bundle,
                              .cancel = cancel,
                              .options = options_};

  // Keeps the disk lock until the handler has returned.
  auto decision = std::optional<bootforge::safety::gate_decision>{};
  if (descriptor.destructive) {
    auto error = bootforge::schema::error_t{};
    auto target = resolve_target(step.params, error);
    if (!target) {
      return make_failure(std::move(error));
    }
    decision = gate_.evaluate(bootforge::safety::gate_request{
        .disk_id = *target,
        .operation = step.action,
        .force = bool_param(step.params, "force", false),
        .confirmation_token = string_param(step.params, "confirmation_token")});
    spdlog::info("step '{}' gate trail: {}", step.id, describe_trail(*decision));
    if (!decision->authorized() || !decision->grant) {
      return make_failure(
          bootforge::schema::make_error(decision->reason, decision->message));
    }
    context.grant = &*decision->grant;
  }

  try {
    return descriptor.handler(step.params, context);
  } catch (const std::exception& e) {
    return make_failure(bootforge::schema::make_error(
        error_code_t::io_error,
        "action '" + step.action + "' raised: " + e.what()));
  }
}

std::optional<bootforge::schema::disk_id_t> workflow_engine::resolve_target(
    const bootforge::schema::step_params_t& params,
    bootforge::schema::error_t& error) const {
  auto disk_id = string_param(params, "target_disk_id");
  auto mount = string_param(params, "target_mount");
  if (!mount) {
    if (!disk_id) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_step_params,
          "destructive step needs target_disk_id or target_mount");
      return std::nullopt;
    }
    return disk_id;
  }

  auto graph = provider_.device_graph(error);
  if (!graph) {
    return std::nullopt;
  }
  const auto* owner = bootforge::schema::find_disk_by_mount(*graph, *mount);
  if (owner == nullptr) {
    error = bootforge::schema::make_error(
        error_code_t::disk_not_found,
        "no disk in graph " + graph->graph_id + " is mounted at " + *mount);
    return std::nullopt;
  }
  if (disk_id && *disk_id != owner->id) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_step_params,
        *mount + " belongs to '" + owner->id + "', not '" + *disk_id + "'");
    return std::nullopt;
  }
  return owner->id;
}

}  // namespace bootforge::workflow
