#include <bootforge/workflow/registry.hpp>

#include <bootforge/common/critical.hpp>
#include <bootforge/workflow/actions/actions.hpp>

#include <algorithm>
#include <utility>

namespace bootforge::workflow {

void action_registry::add(action_descriptor descriptor) {
  auto name = std::string{bootforge::schema::to_string(descriptor.kind)};
  if (actions_.contains(name)) {
    bootforge::common::critical("action '{}' registered twice", name);
  }
  if (!descriptor.handler) {
    bootforge::common::critical("action '{}' has no handler", name);
  }
  if (descriptor.destructive) {
    descriptor.optional.push_back(
        param_spec{.name = "force", .type = param_type_t::boolean});
    descriptor.optional.push_back(
        param_spec{.name = "confirmation_token", .type = param_type_t::string});
  }
  actions_.emplace(std::move(name), std::move(descriptor));
}

const action_descriptor* action_registry::find(std::string_view name) const {
  auto it = actions_.find(name);
  return it == std::end(actions_) ? nullptr : &it->second;
}

std::vector<std::string> action_registry::names() const {
  auto names = std::vector<std::string>{};
  names.reserve(actions_.size());
  for (const auto& [name, _] : actions_) {
    names.push_back(name);
  }
  return names;
}

action_registry make_default_registry() {
  auto registry = action_registry{};
  registry.add(actions::make_disk_hash_report());
  registry.add(actions::make_report_verify());
  registry.add(actions::make_disk_image_and_stage());
  registry.add(actions::make_apply_image());
  registry.add(actions::make_installer_usb_build_linux());
  registry.add(actions::make_installer_usb_build_windows());
  registry.add(actions::make_installer_usb_build_macos());
  registry.add(actions::make_stage_bootloader());
  return registry;
}

}  // namespace bootforge::workflow
