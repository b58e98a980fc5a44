#include <bootforge/workflow/action.hpp>

#include <utility>

namespace bootforge::workflow {

step_outcome make_success(std::string message,
                          std::vector<std::string> artifacts) {
  auto outcome = step_outcome{};
  outcome.status = bootforge::schema::step_status_t::success;
  outcome.message = std::move(message);
  outcome.artifacts = std::move(artifacts);
  return outcome;
}

step_outcome make_failure(bootforge::schema::error_t error) {
  auto outcome = step_outcome{};
  outcome.status = error.code == bootforge::schema::error_code_t::cancelled
                       ? bootforge::schema::step_status_t::cancelled
                       : bootforge::schema::step_status_t::failed;
  outcome.message = error.message;
  outcome.error = std::move(error);
  return outcome;
}

uint64_t step_context::chunk_size(
    const bootforge::schema::step_params_t& params) const {
  return uint_param(params, "chunk_size_bytes")
      .value_or(options.default_chunk_size_bytes);
}

bootforge::imaging::stream_options step_context::make_stream_options() const {
  auto opts = bootforge::imaging::stream_options{};
  opts.progress = options.progress;
  opts.cancel = &cancel;
  return opts;
}

}  // namespace bootforge::workflow
