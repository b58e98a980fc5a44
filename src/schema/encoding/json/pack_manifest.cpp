#include <bootforge/schema/encoding/json/fields.hpp>
#include <bootforge/schema/encoding/json/pack_manifest.hpp>

using namespace bootforge::schema::encoding::json;

namespace bootforge::schema {

void to_json(nlohmann::json& document, const pack_manifest<1>& o) {
  document = nlohmann::json{{"schema_version", o.schema_version},
                            {"name", o.name},
                            {"version", o.version},
                            {"description", o.description},
                            {"workflows", o.workflows}};
  put_optional(document, "assets", o.assets);
}

void from_json(const nlohmann::json& document, pack_manifest<1>& o) {
  document.at("schema_version").get_to(o.schema_version);
  document.at("name").get_to(o.name);
  document.at("version").get_to(o.version);
  o.description = document.value("description", std::string{});
  document.at("workflows").get_to(o.workflows);
  o.assets = optional_field<std::string>(document, "assets");
}

}  // namespace bootforge::schema
