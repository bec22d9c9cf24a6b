#pragma once

// conclave/version.hpp — Version manifest for every serialized surface.
//
// Every reader of a versioned format (report JSON, event JSONL, audit NDJSON)
// checks the constant here. Bump before changing a field's meaning or removing
// a field; adding optional fields does not require a bump.

#include <cstdint>
#include <string>

namespace conclave {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// REPORT_FORMAT_VERSION
// Layout of RunReport JSON (report_to_json).
// Version 2 = current: per-ticket reason + review summary block.
// ---------------------------------------------------------------------------
constexpr uint32_t REPORT_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// EVENT_SCHEMA_VERSION
// Lifecycle event lines: {seq, t, type, entity_id, data}.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Audit NDJSON records with BLAKE3 chaining ("audit:" domain).
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex-encoded to 64 chars.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t report_format{REPORT_FORMAT_VERSION};
  uint32_t event_schema{EVENT_SCHEMA_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string hash_backend;  // blake3_version() of the linked library
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace conclave
