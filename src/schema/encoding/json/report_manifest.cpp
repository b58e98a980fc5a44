#include <bootforge/schema/encoding/json/report_manifest.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const report_manifest<1>& o) {
  document = nlohmann::json{{"schema_version", o.schema_version},
                            {"run_id", o.run_id},
                            {"files", o.files}};
}

void from_json(const nlohmann::json& document, report_manifest<1>& o) {
  document.at("schema_version").get_to(o.schema_version);
  document.at("run_id").get_to(o.run_id);
  document.at("files").get_to(o.files);
}

}  // namespace bootforge::schema
