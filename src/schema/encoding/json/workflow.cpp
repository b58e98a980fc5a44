#include <bootforge/schema/encoding/json/fields.hpp>
#include <bootforge/schema/encoding/json/workflow.hpp>

using namespace bootforge::schema::encoding::json;

namespace bootforge::schema {

void to_json(nlohmann::json& document, const workflow_step<1>& o) {
  document = nlohmann::json{
      {"id", o.id}, {"action", o.action}, {"params", o.params}};
}

void from_json(const nlohmann::json& document, workflow_step<1>& o) {
  document.at("id").get_to(o.id);
  document.at("action").get_to(o.action);
  o.params = nlohmann::json::object();
  if (auto it = document.find("params");
      it != document.end() && !it->is_null()) {
    if (!it->is_object()) {
      throw_invalid_field("params", "expected a mapping");
    }
    o.params = *it;
  }
}

void to_json(nlohmann::json& document, const workflow<1>& o) {
  document = nlohmann::json{{"schema_version", o.schema_version},
                            {"name", o.name},
                            {"steps", o.steps}};
}

void from_json(const nlohmann::json& document, workflow<1>& o) {
  document.at("schema_version").get_to(o.schema_version);
  document.at("name").get_to(o.name);
  document.at("steps").get_to(o.steps);
}

}  // namespace bootforge::schema
