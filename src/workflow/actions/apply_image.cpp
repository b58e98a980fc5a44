#include <bootforge/workflow/actions/actions.hpp>

#include <bootforge/imaging/reader.hpp>
#include <bootforge/workflow/actions/raw_write.hpp>

namespace bootforge::workflow::actions {

namespace {

step_outcome apply(const bootforge::schema::step_params_t& params,
                   step_context& context) {
  auto error = bootforge::schema::error_t{};
  auto image = bootforge::imaging::disk_reader::open(
      *string_param(params, "image_path"), error);
  if (!image) {
    return make_failure(std::move(error));
  }
  auto written = write_image(context, *image, context.chunk_size(params),
                             bool_param(params, "verify", true), error);
  if (!written) {
    return make_failure(std::move(error));
  }
  auto body = describe_raw_write(context, *image, *written);
  auto artifact = context.bundle.write_artifact(
      context.step.id + "/apply.json", bootforge::schema::make_bytes_view(body),
      error);
  if (!artifact) {
    return make_failure(std::move(error));
  }
  return make_success(
      "wrote " + std::to_string(written->bytes_written) + " bytes to " +
          context.grant->disk_id() +
          (written->readback_digest ? " (read-back verified)" : ""),
      {*artifact});
}

}  // namespace

action_descriptor make_apply_image() {
  return action_descriptor{
      .kind = bootforge::schema::action_kind_t::apply_image,
      .destructive = true,
      .required = {{.name = "target_disk_id", .type = param_type_t::string},
                   {.name = "image_path", .type = param_type_t::string}},
      .optional = {{.name = "chunk_size_bytes",
                    .type = param_type_t::positive_integer},
                   {.name = "verify", .type = param_type_t::boolean}},
      .handler = apply};
}

}  // namespace bootforge::workflow::actions
