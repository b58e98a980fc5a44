#include <bootforge/workflow/actions/actions.hpp>

#include <bootforge/imaging/engine.hpp>
#include <bootforge/imaging/reader.hpp>
#include <bootforge/workflow/actions/raw_write.hpp>

#include <algorithm>
#include <array>

namespace bootforge::workflow::actions {

namespace {

using bootforge::schema::error_code_t;

// Primary volume descriptor at sector 16, standard identifier after the
// type byte.
constexpr auto kIso9660IdentifierOffset = uint64_t{16 * 2048 + 1};
constexpr auto kIso9660Identifier = std::array<uint8_t, 5>{'C', 'D', '0', '0', '1'};

bool is_iso9660(const bootforge::imaging::disk_reader& image,
                bootforge::schema::error_t& error) {
  auto identifier = bootforge::imaging::read_exact(
      image, kIso9660IdentifierOffset, kIso9660Identifier.size(), error);
  return identifier &&
         std::equal(std::begin(*identifier), std::end(*identifier),
                    std::begin(kIso9660Identifier));
}

step_outcome build(const bootforge::schema::step_params_t& params,
                   step_context& context) {
  auto error = bootforge::schema::error_t{};
  auto iso_path = *string_param(params, "iso_path");
  auto image = bootforge::imaging::disk_reader::open(iso_path, error);
  if (!image) {
    return make_failure(std::move(error));
  }
  if (!is_iso9660(*image, error)) {
    return make_failure(bootforge::schema::make_error(
        error_code_t::invalid_step_params,
        iso_path + " is not an ISO 9660 image"));
  }
  auto written =
      write_image(context, *image, context.chunk_size(params), true, error);
  if (!written) {
    return make_failure(std::move(error));
  }
  auto body = describe_raw_write(context, *image, *written);
  auto artifact = context.bundle.write_artifact(
      context.step.id + "/installer.json",
      bootforge::schema::make_bytes_view(body), error);
  if (!artifact) {
    return make_failure(std::move(error));
  }
  return make_success("Linux installer written to " + context.grant->disk_id(),
                      {*artifact});
}

}  // namespace

action_descriptor make_installer_usb_build_linux() {
  return action_descriptor{
      .kind = bootforge::schema::action_kind_t::installer_usb_build_linux,
      .destructive = true,
      .required = {{.name = "target_disk_id", .type = param_type_t::string},
                   {.name = "iso_path", .type = param_type_t::string}},
      .optional = {{.name = "chunk_size_bytes",
                    .type = param_type_t::positive_integer}},
      .handler = build};
}

}  // namespace bootforge::workflow::actions
