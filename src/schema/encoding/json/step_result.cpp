#include <bootforge/schema/encoding/json/fields.hpp>
#include <bootforge/schema/encoding/json/step_result.hpp>

using namespace bootforge::schema::encoding::json;

namespace bootforge::schema {

void to_json(nlohmann::json& document, const step_result<1>& o) {
  document = nlohmann::json{{"id", o.id},
                            {"action", o.action},
                            {"status", std::string{to_string(o.status)}},
                            {"duration_ms", o.duration_ms},
                            {"message", o.message},
                            {"artifacts", o.artifacts}};
  put_optional(document, "started_at_utc", o.started_at_utc);
  put_optional(document, "finished_at_utc", o.finished_at_utc);
  if (o.error) {
    document["error"] = std::string{to_string(*o.error)};
  } else {
    document["error"] = nullptr;
  }
}

void from_json(const nlohmann::json& document, step_result<1>& o) {
  document.at("id").get_to(o.id);
  document.at("action").get_to(o.action);
  o.status = enum_field<step_status_t>(document, "status");
  document.at("duration_ms").get_to(o.duration_ms);
  o.message = document.value("message", std::string{});
  o.started_at_utc = optional_field<std::string>(document, "started_at_utc");
  o.finished_at_utc = optional_field<std::string>(document, "finished_at_utc");
  o.error = std::nullopt;
  if (auto it = document.find("error"); it != document.end() && !it->is_null()) {
    o.error = enum_field<error_code_t>(document, "error");
  }
  o.artifacts.clear();
  if (auto it = document.find("artifacts"); it != document.end()) {
    it->get_to(o.artifacts);
  }
}

}  // namespace bootforge::schema
