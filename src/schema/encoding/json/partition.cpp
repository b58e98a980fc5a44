#include <bootforge/schema/encoding/json/fields.hpp>
#include <bootforge/schema/encoding/json/partition.hpp>

using namespace bootforge::schema::encoding::json;

namespace bootforge::schema {

void to_json(nlohmann::json& document, const partition<1>& o) {
  document = nlohmann::json{{"id", o.id},
                            {"size_bytes", o.size_bytes},
                            {"mount_points", o.mount_points}};
  put_optional(document, "label", o.label);
  put_optional(document, "fs", o.fs);
}

void from_json(const nlohmann::json& document, partition<1>& o) {
  document.at("id").get_to(o.id);
  document.at("size_bytes").get_to(o.size_bytes);
  o.label = optional_field<std::string>(document, "label");
  o.fs = optional_field<std::string>(document, "fs");
  o.mount_points.clear();
  if (auto it = document.find("mount_points"); it != document.end()) {
    for (const auto& mount : *it) {
      o.mount_points.insert(mount.get<std::string>());
    }
  }
}

}  // namespace bootforge::schema
