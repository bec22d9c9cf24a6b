#pragma once

// conclave/audit.hpp — Append-only audit log of ticket transitions and verdicts.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: records are never modified or deleted.
//   2. SEQUENTIAL: each record carries a monotonically increasing seq, from 1.
//      A log opened on an existing file resumes seq and prev from its last
//      record, so runs sharing one path form a single chain. An unparseable
//      last record disables the log (failure_count() = 1) rather than fork it.
//   3. STRUCTURED: every record is a single-line JSON object (NDJSON).
//   4. CHAINED: prev = BLAKE3("audit:" || previous line). The first record's
//      prev is 64 zeros.
//   5. FAIL-SAFE: write failures never abort a run; they increment
//      failure_count().
//
// The log is write-only from the engine's point of view. verify_audit_chain()
// exists for operators and tests; the orchestrator never reads the log back.
//
// EXTENSION_POINT: remote_audit_sink
//   Current: local file, fflush per record.
//   Upgrade path: forward records to an immutable log service. The on-disk
//   layout (AUDIT_LOG_VERSION) must be bumped before changing any field.

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "conclave/types.hpp"

namespace conclave {

inline constexpr const char* kAuditGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

struct AuditRecord {
  uint64_t sequence{0};            // assigned by AuditLog::append
  std::string previous_digest;     // assigned by AuditLog::append
  uint64_t timestamp_unix_ms{0};   // assigned by AuditLog::append
  std::string run_id;
  std::string kind;                // "transition" | "verdict" | "phase"
  std::string entity_id;
  std::map<std::string, std::string> fields;
};

std::string audit_record_to_json(const AuditRecord& r);

class AuditLog {
 public:
  // Empty path disables the log: append() succeeds without writing.
  explicit AuditLog(const std::string& path = "");
  ~AuditLog();

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  bool enabled() const;

  // Assigns sequence, previous_digest and timestamp in place. Returns false if
  // the record was not written. Thread-safe.
  bool append(AuditRecord& record);

  bool record_transition(const std::string& run_id, const std::string& ticket_id,
                         TicketStatus from, TicketStatus to, const std::string& reason);
  bool record_verdict(const std::string& run_id, const ReviewVerdict& verdict);
  bool record_phase(const std::string& run_id, const std::string& phase);

  // Records written through this instance.
  uint64_t entry_count() const;
  uint64_t failure_count() const;
  std::string last_digest() const;

  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

struct AuditChainCheck {
  bool ok{false};
  uint64_t records{0};
  uint64_t first_bad_seq{0};  // 0 when ok
  std::string error_message;
};

// Re-reads an audit file and checks seq continuity and prev links.
AuditChainCheck verify_audit_chain(const std::string& path);

}  // namespace conclave
