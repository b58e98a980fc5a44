#pragma once
#include <bootforge/schema/run_metadata.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace bootforge::schema {

/// Contents of `manifest.json`: bundle-relative path to SHA-256 hex digest.
///
/// `manifest.json` and `manifest.sig` never list themselves.
template <uint16_t Version>
struct report_manifest;

template <>
struct report_manifest<1> final {
  std::string schema_version{kReportSchemaVersion};
  std::string run_id;
  std::map<std::string, std::string> files;
};

using report_manifest_t = report_manifest<1>;

}  // namespace bootforge::schema
