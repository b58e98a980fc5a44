#pragma once

#include <bootforge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Built-in workflow actions. Documents name actions by the mapped string.
namespace bootforge::schema {

enum class action_kind_t : uint8_t {
  disk_hash_report = 0,
  report_verify = 1,
  disk_image_and_stage = 2,
  apply_image = 3,
  installer_usb_build_windows = 4,
  installer_usb_build_linux = 5,
  installer_usb_build_macos = 6,
  stage_bootloader = 7
};

inline constexpr auto kActionKindMappings = std::array{
    std::pair<std::string_view, action_kind_t>{
        "disk-hash-report", action_kind_t::disk_hash_report},
    std::pair<std::string_view, action_kind_t>{"report-verify",
                                               action_kind_t::report_verify},
    std::pair<std::string_view, action_kind_t>{
        "disk-image-and-stage", action_kind_t::disk_image_and_stage},
    std::pair<std::string_view, action_kind_t>{"apply-image",
                                               action_kind_t::apply_image},
    std::pair<std::string_view, action_kind_t>{
        "installer-usb-build-windows",
        action_kind_t::installer_usb_build_windows},
    std::pair<std::string_view, action_kind_t>{
        "installer-usb-build-linux", action_kind_t::installer_usb_build_linux},
    std::pair<std::string_view, action_kind_t>{
        "installer-usb-build-macos", action_kind_t::installer_usb_build_macos},
    std::pair<std::string_view, action_kind_t>{
        "stage-bootloader", action_kind_t::stage_bootloader}};

template <>
inline std::optional<action_kind_t> try_from_string<action_kind_t>(
    const std::string_view value) {
  return from_string(value, kActionKindMappings);
}

inline constexpr std::string_view to_string(const action_kind_t value) {
  return to_string(value, kActionKindMappings).value_or("unknown");
}

}  // namespace bootforge::schema
