#include "conclave/version.hpp"

#include <sstream>

#include "conclave/hash.hpp"

namespace conclave {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = ENGINE_SEMVER;
  m.hash_primitive = "blake3";
  m.hash_backend = hash_backend_version();
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"report_format\":" << m.report_format
    << ",\"event_schema\":" << m.event_schema
    << ",\"audit_log\":" << m.audit_log
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_backend\":\"" << m.hash_backend << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace conclave
