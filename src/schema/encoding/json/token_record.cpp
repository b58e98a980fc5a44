#include <bootforge/schema/encoding/json/fields.hpp>
#include <bootforge/schema/encoding/json/token_record.hpp>

using namespace bootforge::schema::encoding::json;

namespace bootforge::schema {

void to_json(nlohmann::json& document, const token_record<1>& o) {
  document = nlohmann::json{{"token_digest", o.token_digest},
                            {"disk_id", o.disk_id},
                            {"operation", o.operation},
                            {"minted_at_utc", o.minted_at_utc},
                            {"consumed", o.consumed}};
  put_optional(document, "consumed_at_utc", o.consumed_at_utc);
}

void from_json(const nlohmann::json& document, token_record<1>& o) {
  document.at("token_digest").get_to(o.token_digest);
  document.at("disk_id").get_to(o.disk_id);
  document.at("operation").get_to(o.operation);
  document.at("minted_at_utc").get_to(o.minted_at_utc);
  document.at("consumed").get_to(o.consumed);
  o.consumed_at_utc = optional_field<std::string>(document, "consumed_at_utc");
}

}  // namespace bootforge::schema
