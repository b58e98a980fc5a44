#include <bootforge/schema/encoding/json/fields.hpp>
#include <bootforge/schema/encoding/json/run_metadata.hpp>
#include <bootforge/schema/encoding/json/step_result.hpp>

using namespace bootforge::schema::encoding::json;

namespace bootforge::schema {

void to_json(nlohmann::json& document, const run_metadata<1>& o) {
  document = nlohmann::json{
      {"schema_version", o.schema_version},
      {"run_id", o.run_id},
      {"workflow_name", o.workflow_name},
      {"workflow_schema_version", o.workflow_schema_version},
      {"device_graph_schema_version", o.device_graph_schema_version},
      {"created_at_utc", o.created_at_utc},
      {"status", std::string{to_string(o.status)}},
      {"steps", o.steps}};
  put_optional(document, "finished_at_utc", o.finished_at_utc);
}

void from_json(const nlohmann::json& document, run_metadata<1>& o) {
  document.at("schema_version").get_to(o.schema_version);
  document.at("run_id").get_to(o.run_id);
  document.at("workflow_name").get_to(o.workflow_name);
  document.at("workflow_schema_version").get_to(o.workflow_schema_version);
  document.at("device_graph_schema_version")
      .get_to(o.device_graph_schema_version);
  document.at("created_at_utc").get_to(o.created_at_utc);
  o.finished_at_utc = optional_field<std::string>(document, "finished_at_utc");
  o.status = enum_field<run_status_t>(document, "status");
  document.at("steps").get_to(o.steps);
}

}  // namespace bootforge::schema
