#include "conclave/audit.hpp"

#include <cstdio>
#include <fstream>
#include <mutex>
#include <optional>

#include "conclave/hash.hpp"
#include "conclave/jsonlite.hpp"
#include "conclave/version.hpp"

namespace conclave {

std::string audit_record_to_json(const AuditRecord& r) {
  jsonlite::Object o;
  o["v"] = static_cast<std::uint64_t>(version::AUDIT_LOG_VERSION);
  o["seq"] = r.sequence;
  o["prev"] = r.previous_digest;
  o["t"] = r.timestamp_unix_ms;
  o["run_id"] = r.run_id;
  o["kind"] = r.kind;
  o["entity_id"] = r.entity_id;
  jsonlite::Object fields;
  for (const auto& [k, v] : r.fields) fields[k] = v;
  o["fields"] = std::move(fields);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// AuditLog
// ---------------------------------------------------------------------------

struct AuditLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kAuditGenesisDigest};
};

namespace {

// Position of an existing log: seq and chain digest of its last record.
// Returns false when the last record cannot be parsed.
bool read_chain_tail(const std::string& path, uint64_t* seq, std::string* digest) {
  std::ifstream in(path);
  if (!in) return true;  // no file yet: start at genesis
  std::string line;
  std::string last;
  while (std::getline(in, line)) {
    if (!line.empty()) last = line;
  }
  if (last.empty()) return true;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(last, &err);
  if (err) return false;
  *seq = jsonlite::get_u64(obj, "seq");
  if (*seq == 0) return false;
  *digest = hash_domain("audit:", last);
  return true;
}

}  // namespace

AuditLog::AuditLog(const std::string& path) : path_(path), impl_(std::make_unique<Impl>()) {
  if (path_.empty()) return;
  // Appending to an existing log continues its chain.
  if (!read_chain_tail(path_, &impl_->seq, &impl_->last_digest)) {
    impl_->failure_count = 1;
    return;
  }
  impl_->file = std::fopen(path_.c_str(), "a");
  if (!impl_->file) impl_->failure_count = 1;
}

AuditLog::~AuditLog() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool AuditLog::enabled() const { return !path_.empty(); }

bool AuditLog::append(AuditRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (path_.empty()) return true;
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  record.timestamp_unix_ms = now_unix_ms();

  const std::string line = audit_record_to_json(record);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  std::fflush(impl_->file);

  if (!written) {
    ++impl_->failure_count;
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 &&
      post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++impl_->failure_count;
    return false;
  }
  // The chain only advances over records that actually reached the file.
  impl_->seq = record.sequence;
  impl_->last_digest = hash_domain("audit:", line);
  ++impl_->entry_count;
  return true;
}

bool AuditLog::record_transition(const std::string& run_id, const std::string& ticket_id,
                                 TicketStatus from, TicketStatus to, const std::string& reason) {
  AuditRecord r;
  r.run_id = run_id;
  r.kind = "transition";
  r.entity_id = ticket_id;
  r.fields["from"] = to_string(from);
  r.fields["to"] = to_string(to);
  if (!reason.empty()) r.fields["reason"] = reason;
  return append(r);
}

bool AuditLog::record_verdict(const std::string& run_id, const ReviewVerdict& verdict) {
  AuditRecord r;
  r.run_id = run_id;
  r.kind = "verdict";
  r.entity_id = verdict.ticket_id;
  r.fields["approved"] = verdict.approved ? "true" : "false";
  r.fields["alignment_score"] = jsonlite::format_double(verdict.alignment_score);
  r.fields["follow_ups"] = std::to_string(verdict.follow_ups.size());
  r.fields["risks"] = std::to_string(verdict.risks.size());
  return append(r);
}

bool AuditLog::record_phase(const std::string& run_id, const std::string& phase) {
  AuditRecord r;
  r.run_id = run_id;
  r.kind = "phase";
  r.entity_id = run_id;
  r.fields["phase"] = phase;
  return append(r);
}

uint64_t AuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t AuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

std::string AuditLog::last_digest() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->last_digest;
}

// ---------------------------------------------------------------------------
// Chain verification
// ---------------------------------------------------------------------------

AuditChainCheck verify_audit_chain(const std::string& path) {
  AuditChainCheck out;
  std::ifstream in(path);
  if (!in) {
    out.error_message = "cannot open audit log: " + path;
    return out;
  }

  std::string expected_prev = kAuditGenesisDigest;
  uint64_t expected_seq = 1;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object obj = jsonlite::parse(line, &err);
    if (err) {
      out.first_bad_seq = expected_seq;
      out.error_message = "unparseable record: " + err->message;
      return out;
    }
    const uint64_t seq = jsonlite::get_u64(obj, "seq");
    if (seq != expected_seq) {
      out.first_bad_seq = expected_seq;
      out.error_message = "sequence gap: expected " + std::to_string(expected_seq) + ", found " +
                          std::to_string(seq);
      return out;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      out.first_bad_seq = seq;
      out.error_message = "broken chain link at seq " + std::to_string(seq);
      return out;
    }
    expected_prev = hash_domain("audit:", line);
    ++expected_seq;
    ++out.records;
  }
  out.ok = true;
  return out;
}

}  // namespace conclave
