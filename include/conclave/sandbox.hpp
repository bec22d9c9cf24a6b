#pragma once

// conclave/sandbox.hpp — Isolated workspaces for ticket execution.
//
// LIFECYCLE:
//   capture_snapshot(repo)             once per run, at PLANNING
//   SandboxManager::acquire(ticket)    per execution, on the worker thread
//     <root>/<ticket>-<seq>/repo       copy of the repository (ignore rules below),
//                                      verified against the snapshot digest
//     <root>/<ticket>-<seq>/work       private scratch directory
//   The orchestrator gives every run its own root: <sandbox_root>/<run_id>.
//   SandboxLease destructor / release  removes the directory, frees the slot
//
// INVARIANTS:
//   - A ticket holds at most one live lease.
//   - A sandbox directory is created exclusively. Existing directories under
//     the root (another manager's, or left by a crashed process) are skipped.
//   - A lease whose copy differs from the snapshot digest is never handed out
//     (sandbox_acquisition_failed).
//   - At most max_sandboxes leases are live at once.
//   - Every sandbox path stays under the configured root.
//   - release() is idempotent; a lease releases itself on every exit path.
//   - The manager must outlive every lease it hands out.
//
// IGNORE RULES (copy and snapshot digest):
//   dot-entries except .gitignore, __pycache__, node_modules, venv, env, *.pyc
//
// EXTENSION_POINT: copy_on_write_workspaces
//   Current: full recursive copy per acquisition.
//   Upgrade path: reflink (FICLONE) or overlayfs mounts. The lease contract
//   (exclusive, released on every exit path) must not change.

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "conclave/types.hpp"

namespace conclave {

// True when a directory entry with this name is excluded from copies and
// snapshot digests.
bool is_ignored_entry(const std::string& name);

struct BaseSnapshot {
  bool ok{false};
  std::string path;          // absolute repository path
  uint64_t file_count{0};
  uint64_t total_bytes{0};
  std::string digest;        // BLAKE3 "snap:" over sorted relative paths + contents
  std::string error_message;
};

BaseSnapshot capture_snapshot(const std::string& repo_path);

class SandboxManager;

class SandboxLease {
 public:
  SandboxLease() = default;
  ~SandboxLease() { release(); }

  SandboxLease(const SandboxLease&) = delete;
  SandboxLease& operator=(const SandboxLease&) = delete;
  SandboxLease(SandboxLease&& other) noexcept;
  SandboxLease& operator=(SandboxLease&& other) noexcept;

  bool valid() const { return manager_ != nullptr; }
  const std::string& ticket_id() const { return ticket_id_; }
  const std::string& root() const { return root_; }
  const std::string& repo_path() const { return repo_path_; }
  const std::string& work_path() const { return work_path_; }
  uint64_t sequence() const { return sequence_; }

  void release();

 private:
  friend class SandboxManager;

  SandboxManager* manager_{nullptr};
  std::string ticket_id_;
  std::string root_;
  std::string repo_path_;
  std::string work_path_;
  uint64_t sequence_{0};
};

struct AcquireResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  SandboxLease lease;
};

class SandboxManager {
 public:
  SandboxManager(std::string root, uint32_t max_sandboxes);
  ~SandboxManager() = default;

  SandboxManager(const SandboxManager&) = delete;
  SandboxManager& operator=(const SandboxManager&) = delete;

  // Thread-safe. The copy runs outside the manager lock.
  AcquireResult acquire(const std::string& ticket_id, const BaseSnapshot& snapshot);

  // Idempotent.
  void release(SandboxLease& lease) { lease.release(); }

  bool holds(const std::string& ticket_id) const;
  size_t live_count() const;
  uint64_t acquired_total() const;
  uint64_t released_total() const;
  uint64_t cleanup_failures() const;

  const std::string& root() const { return root_; }
  uint32_t max_sandboxes() const { return max_sandboxes_; }

 private:
  friend class SandboxLease;
  void release_slot(const std::string& ticket_id, const std::string& dir);

  const std::string root_;
  const uint32_t max_sandboxes_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::string> live_;  // ticket id -> sandbox dir
  uint64_t next_seq_{0};
  uint64_t acquired_{0};
  uint64_t released_{0};
  uint64_t cleanup_failures_{0};
};

// ---------------------------------------------------------------------------
// Process execution (POSIX).
// ---------------------------------------------------------------------------

struct ProcessSpec {
  std::string command;  // absolute path, passed to execve
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;  // added on top of the parent's when inherit_env
  bool inherit_env{true};
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{65536};
};

struct ProcessResult {
  bool spawned{false};
  int exit_code{0};  // 124 on timeout, 128+N when killed by signal N
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;
};

ProcessResult run_process(const ProcessSpec& spec);

}  // namespace conclave
