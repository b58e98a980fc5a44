#pragma once
#include <bootforge/common/disk_lock.hpp>
#include <bootforge/host/provider.hpp>
#include <bootforge/safety/token_ledger.hpp>
#include <bootforge/schema/disk.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/gate_state.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bootforge::safety {

/// One destructive intent presented to the gate.
struct gate_request final {
  bootforge::schema::disk_id_t disk_id;
  std::string operation;
  bool force{};
  std::optional<std::string> confirmation_token;
};

/// Proof that the gate authorized one destructive operation.
///
/// Move-only. Holds the exclusive disk lock until destroyed, so the target
/// cannot be authorized for a second writer while this object lives.
class authorization final {
 public:
  authorization(authorization&&) noexcept = default;
  authorization& operator=(authorization&&) noexcept = default;
  authorization(const authorization&) = delete;
  authorization& operator=(const authorization&) = delete;

  const bootforge::schema::disk_id_t& disk_id() const {
    return lock_.disk_id();
  }
  const std::string& operation() const { return operation_; }
  const std::string& graph_id() const { return graph_id_; }
  const bootforge::schema::disk_t& disk() const { return disk_; }

 private:
  friend class safety_gate;
  authorization(bootforge::common::disk_lock lock,
                std::string operation,
                std::string graph_id,
                bootforge::schema::disk_t disk);

  bootforge::common::disk_lock lock_;
  std::string operation_;
  std::string graph_id_;
  bootforge::schema::disk_t disk_;
};

struct gate_decision final {
  bootforge::schema::gate_state_t state{bootforge::schema::gate_state_t::denied};
  bootforge::schema::error_code_t reason{bootforge::schema::error_code_t::ok};
  std::string message;
  // Every state visited, in order.
  std::vector<bootforge::schema::gate_state_t> trail;
  std::optional<authorization> grant;

  bool authorized() const {
    return state == bootforge::schema::gate_state_t::authorized;
  }
};

/// Sole authority for destructive operations on a disk.
///
/// Each evaluation walks
/// `requested -> classified -> pending_confirmation -> confirmed ->
/// authorized`, leaving for `denied` at the first failed check:
///
/// - the disk must exist in a freshly queried device graph,
/// - `force` must be set (system disks report `system_disk_protected`, all
///   others `force_mode_required`),
/// - the token must be known, unconsumed and bound to this disk and
///   operation (`missing_confirmation_token` otherwise),
/// - the disk lock must be free (`device_busy`; the token stays unused).
///
/// Only then is the token consumed. Nothing is cached between evaluations.
class safety_gate final {
 public:
  safety_gate(const bootforge::host::host_provider& provider,
              token_ledger& ledger,
              bootforge::common::disk_lock_registry& locks);

  gate_decision evaluate(const gate_request& request);

 private:
  const bootforge::host::host_provider& provider_;
  token_ledger& ledger_;
  bootforge::common::disk_lock_registry& locks_;
};

}  // namespace bootforge::safety
