#include <bootforge/schema/encoding/json/chunk_plan.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const chunk_plan<1>& o) {
  document = nlohmann::json{{"chunk_size_bytes", o.chunk_size_bytes},
                            {"total_size_bytes", o.total_size_bytes},
                            {"chunk_count", o.chunk_count}};
}

void from_json(const nlohmann::json& document, chunk_plan<1>& o) {
  document.at("chunk_size_bytes").get_to(o.chunk_size_bytes);
  document.at("total_size_bytes").get_to(o.total_size_bytes);
  document.at("chunk_count").get_to(o.chunk_count);
}

}  // namespace bootforge::schema
