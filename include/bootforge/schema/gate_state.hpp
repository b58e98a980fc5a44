#pragma once

#include <bootforge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bootforge::schema {

enum class gate_state_t : uint8_t {
  requested = 0,
  classified = 1,
  pending_confirmation = 2,
  confirmed = 3,
  authorized = 4,
  denied = 5
};

inline constexpr auto kGateStateMappings = std::array{
    std::pair<std::string_view, gate_state_t>{"requested",
                                              gate_state_t::requested},
    std::pair<std::string_view, gate_state_t>{"classified",
                                              gate_state_t::classified},
    std::pair<std::string_view, gate_state_t>{
        "pending_confirmation", gate_state_t::pending_confirmation},
    std::pair<std::string_view, gate_state_t>{"confirmed",
                                              gate_state_t::confirmed},
    std::pair<std::string_view, gate_state_t>{"authorized",
                                              gate_state_t::authorized},
    std::pair<std::string_view, gate_state_t>{"denied", gate_state_t::denied}};

template <>
inline std::optional<gate_state_t> try_from_string<gate_state_t>(
    const std::string_view value) {
  return from_string(value, kGateStateMappings);
}

inline constexpr std::string_view to_string(const gate_state_t value) {
  return to_string(value, kGateStateMappings).value_or("unknown");
}

}  // namespace bootforge::schema
