#include <bootforge/schema/encoding/json/disk.hpp>
#include <bootforge/schema/encoding/json/partition.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const disk<1>& o) {
  document = nlohmann::json{{"id", o.id},
                            {"friendly_name", o.friendly_name},
                            {"size_bytes", o.size_bytes},
                            {"removable", o.removable},
                            {"is_system_disk", o.is_system_disk},
                            {"partitions", o.partitions}};
}

void from_json(const nlohmann::json& document, disk<1>& o) {
  document.at("id").get_to(o.id);
  document.at("friendly_name").get_to(o.friendly_name);
  document.at("size_bytes").get_to(o.size_bytes);
  document.at("removable").get_to(o.removable);
  // A document that omits the flag cannot prove the disk is safe.
  o.is_system_disk = document.value("is_system_disk", true);
  o.partitions.clear();
  if (auto it = document.find("partitions"); it != document.end()) {
    it->get_to(o.partitions);
  }
}

}  // namespace bootforge::schema
