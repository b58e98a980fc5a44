#include <bootforge/schema/encoding/json/device_graph.hpp>
#include <bootforge/schema/encoding/json/disk.hpp>
#include <bootforge/schema/encoding/json/host_info.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const device_graph<1>& o) {
  document = nlohmann::json{{"schema_version", o.schema_version},
                            {"graph_id", o.graph_id},
                            {"generated_at_utc", o.generated_at_utc},
                            {"host", o.host},
                            {"disks", o.disks}};
}

void from_json(const nlohmann::json& document, device_graph<1>& o) {
  document.at("schema_version").get_to(o.schema_version);
  document.at("graph_id").get_to(o.graph_id);
  document.at("generated_at_utc").get_to(o.generated_at_utc);
  document.at("host").get_to(o.host);
  document.at("disks").get_to(o.disks);
}

}  // namespace bootforge::schema
