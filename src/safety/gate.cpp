#include <bootforge/crypto/hmac.hpp>
#include <bootforge/safety/gate.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace bootforge::safety {

namespace {

using bootforge::schema::error_code_t;
using bootforge::schema::gate_state_t;

gate_decision& deny(gate_decision& decision,
                    const error_code_t reason,
                    std::string message) {
  decision.trail.push_back(gate_state_t::denied);
  decision.state = gate_state_t::denied;
  decision.reason = reason;
  decision.message = std::move(message);
  spdlog::warn("safety gate denied: {} ({})", decision.message,
               bootforge::schema::to_string(reason));
  return decision;
}

}  // namespace

authorization::authorization(bootforge::common::disk_lock lock,
                             std::string operation,
                             std::string graph_id,
                             bootforge::schema::disk_t disk)
    : lock_{std::move(lock)},
      operation_{std::move(operation)},
      graph_id_{std::move(graph_id)},
      disk_{std::move(disk)} {}

safety_gate::safety_gate(const bootforge::host::host_provider& provider,
                         token_ledger& ledger,
                         bootforge::common::disk_lock_registry& locks)
    : provider_{provider}, ledger_{ledger}, locks_{locks} {}

gate_decision safety_gate::evaluate(const gate_request& request) {
  auto decision = gate_decision{};
  decision.trail.push_back(gate_state_t::requested);
  spdlog::info("safety gate: {} requested on disk '{}' (force={})",
               request.operation, request.disk_id, request.force);

  auto error = bootforge::schema::error_t{};
  auto graph = provider_.device_graph(error);
  if (!graph) {
    deny(decision, error.code, "device graph unavailable: " + error.message);
    return decision;
  }
  const auto* disk = bootforge::schema::find_disk(*graph, request.disk_id);
  if (disk == nullptr) {
    deny(decision, error_code_t::disk_not_found,
         "disk '" + request.disk_id + "' is not present in graph " +
             graph->graph_id);
    return decision;
  }
  decision.trail.push_back(gate_state_t::classified);

  if (!request.force) {
    if (disk->is_system_disk) {
      deny(decision, error_code_t::system_disk_protected,
           "disk '" + disk->id + "' hosts the running system");
    } else {
      deny(decision, error_code_t::force_mode_required,
           "destructive " + request.operation + " on '" + disk->id +
               "' requires force");
    }
    return decision;
  }
  decision.trail.push_back(gate_state_t::pending_confirmation);

  if (!request.confirmation_token || request.confirmation_token->empty()) {
    deny(decision, error_code_t::missing_confirmation_token,
         "no confirmation token supplied for '" + disk->id + "'");
    return decision;
  }
  auto digest = token_digest(*request.confirmation_token);
  auto record = ledger_.find(digest);
  if (!record ||
      !bootforge::crypto::constant_time_equal(
          bootforge::schema::make_bytes_view(record->token_digest),
          bootforge::schema::make_bytes_view(digest))) {
    deny(decision, error_code_t::missing_confirmation_token,
         "confirmation token is not recognized");
    return decision;
  }
  if (record->disk_id != disk->id || record->operation != request.operation) {
    deny(decision, error_code_t::missing_confirmation_token,
         "confirmation token was issued for " + record->operation + " on '" +
             record->disk_id + "'");
    return decision;
  }
  if (record->consumed) {
    deny(decision, error_code_t::missing_confirmation_token,
         "confirmation token was already used");
    return decision;
  }
  decision.trail.push_back(gate_state_t::confirmed);

  auto lock_error = bootforge::schema::error_t{};
  auto lock = locks_.try_acquire(disk->id, lock_error);
  if (!lock) {
    deny(decision, lock_error.code, lock_error.message);
    return decision;
  }
  if (!ledger_.consume(digest, bootforge::schema::now_utc_rfc3339())) {
    deny(decision, error_code_t::missing_confirmation_token,
         "confirmation token was consumed concurrently");
    return decision;
  }

  decision.trail.push_back(gate_state_t::authorized);
  decision.state = gate_state_t::authorized;
  decision.message = "authorized " + request.operation + " on '" + disk->id + "'";
  decision.grant = authorization{std::move(*lock), request.operation,
                                 graph->graph_id, *disk};
  spdlog::info("safety gate: {}", decision.message);
  return decision;
}

}  // namespace bootforge::safety
