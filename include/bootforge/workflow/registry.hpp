#pragma once
#include <bootforge/schema/action_kind.hpp>
#include <bootforge/workflow/action.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::workflow {

/// Action name to descriptor. Documents select actions only through this
/// table; the engine never branches on action names itself.
class action_registry final {
 public:
  /// Register `descriptor` under its kind's document name. Destructive
  /// actions additionally accept `force` and `confirmation_token`.
  void add(action_descriptor descriptor);

  const action_descriptor* find(std::string_view name) const;
  std::vector<std::string> names() const;

 private:
  std::map<std::string, action_descriptor, std::less<>> actions_;
};

/// Registry holding every built-in action.
action_registry make_default_registry();

}  // namespace bootforge::workflow
