#pragma once

// conclave/hash.hpp — BLAKE3 digests.
//
// Domain prefixes (part of the audit/report schema, never change silently):
//   "diff:"  ExecutionResult::diff_digest
//   "snap:"  BaseSnapshot::digest
//   "audit:" AuditLog chain links
//   "run:"   RunReport::run_id

#include <memory>
#include <string>
#include <string_view>

namespace conclave {

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string diff_digest(std::string_view diff);

// Version string reported by the linked BLAKE3 library.
std::string hash_backend_version();

// Incremental hasher for multi-part payloads (repository snapshots).
class Blake3Stream {
 public:
  explicit Blake3Stream(std::string_view domain = {});
  ~Blake3Stream();
  Blake3Stream(const Blake3Stream&) = delete;
  Blake3Stream& operator=(const Blake3Stream&) = delete;

  void update(std::string_view bytes);

  // Streams the file in 64 KB chunks. Returns false if it cannot be read.
  bool update_file(const std::string& path);

  std::string finalize_hex() const;

 private:
  struct State;
  std::unique_ptr<State> state_;
};

}  // namespace conclave
