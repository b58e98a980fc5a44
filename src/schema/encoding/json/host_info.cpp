#include <bootforge/schema/encoding/json/host_info.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const host_info<1>& o) {
  document = nlohmann::json{
      {"os", o.os}, {"os_version", o.os_version}, {"machine", o.machine}};
}

void from_json(const nlohmann::json& document, host_info<1>& o) {
  document.at("os").get_to(o.os);
  document.at("os_version").get_to(o.os_version);
  document.at("machine").get_to(o.machine);
}

}  // namespace bootforge::schema
