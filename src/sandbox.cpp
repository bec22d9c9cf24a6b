#include "conclave/sandbox.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "conclave/hash.hpp"

namespace conclave {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const char* suffix) {
  const std::string_view sv(suffix);
  return s.size() >= sv.size() && s.compare(s.size() - sv.size(), sv.size(), sv) == 0;
}

bool path_within(const fs::path& child, const fs::path& parent) {
  auto c = child.begin();
  for (auto p = parent.begin(); p != parent.end(); ++p, ++c) {
    if (p->empty()) continue;
    if (c == child.end() || *c != *p) return false;
  }
  return true;
}

struct Entry {
  std::string rel;  // generic format, '/' separated
  fs::path abs;
  fs::file_type type{fs::file_type::none};
};

// Depth-first walk honouring is_ignored_entry; entries sorted by relative path.
bool collect_entries(const fs::path& root, std::vector<Entry>* out, std::string* error) {
  std::vector<fs::path> pending{root};
  while (!pending.empty()) {
    const fs::path dir = pending.back();
    pending.pop_back();
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      const fs::directory_entry& de = *it;
      const std::string name = de.path().filename().string();
      if (is_ignored_entry(name)) continue;
      const fs::file_status st = de.symlink_status(ec);
      if (ec) {
        *error = "cannot stat " + de.path().string() + ": " + ec.message();
        return false;
      }
      Entry e;
      e.abs = de.path();
      e.rel = de.path().lexically_relative(root).generic_string();
      e.type = st.type();
      if (e.type == fs::file_type::directory) pending.push_back(de.path());
      out->push_back(std::move(e));
    }
    if (ec) {
      *error = "cannot read directory " + dir.string() + ": " + ec.message();
      return false;
    }
  }
  std::sort(out->begin(), out->end(),
            [](const Entry& a, const Entry& b) { return a.rel < b.rel; });
  return true;
}

bool copy_tree(const fs::path& from, const fs::path& to, std::string* error) {
  std::vector<Entry> entries;
  if (!collect_entries(from, &entries, error)) return false;
  std::error_code ec;
  fs::create_directories(to, ec);
  if (ec) {
    *error = "cannot create " + to.string() + ": " + ec.message();
    return false;
  }
  // Sorted order guarantees a directory precedes its contents.
  for (const auto& e : entries) {
    const fs::path dst = to / fs::path(e.rel);
    switch (e.type) {
      case fs::file_type::directory:
        fs::create_directory(dst, ec);
        break;
      case fs::file_type::regular:
        fs::copy_file(e.abs, dst, fs::copy_options::overwrite_existing, ec);
        break;
      case fs::file_type::symlink:
        fs::copy_symlink(e.abs, dst, ec);
        break;
      default:
        continue;  // sockets, fifos and devices are not part of a workspace
    }
    if (ec) {
      *error = "cannot copy " + e.rel + ": " + ec.message();
      return false;
    }
  }
  return true;
}

constexpr int kMaxNameAttempts = 64;

std::string sandbox_dir_name(const std::string& ticket_id, uint64_t seq) {
  return ticket_id + "-" + std::to_string(seq);
}

// Fills digest, file_count and total_bytes of `snap` from the tree at `root`.
bool digest_tree(const fs::path& root, BaseSnapshot* snap) {
  std::vector<Entry> entries;
  if (!collect_entries(root, &entries, &snap->error_message)) return false;

  std::error_code ec;
  Blake3Stream stream("snap:");
  for (const auto& e : entries) {
    if (e.type == fs::file_type::regular) {
      stream.update("F:");
      stream.update(e.rel);
      stream.update(std::string_view("\0", 1));
      if (!stream.update_file(e.abs.string())) {
        snap->error_message = "cannot read " + e.rel;
        return false;
      }
      stream.update(std::string_view("\0", 1));
      snap->total_bytes += fs::file_size(e.abs, ec);
      ++snap->file_count;
    } else if (e.type == fs::file_type::symlink) {
      stream.update("L:");
      stream.update(e.rel);
      stream.update(std::string_view("\0", 1));
      stream.update(fs::read_symlink(e.abs, ec).generic_string());
      stream.update(std::string_view("\0", 1));
    }
  }
  snap->digest = stream.finalize_hex();
  return true;
}

}  // namespace

bool is_ignored_entry(const std::string& name) {
  if (name.empty()) return true;
  if (name[0] == '.') return name != ".gitignore";
  if (name == "__pycache__" || name == "node_modules" || name == "venv" || name == "env") {
    return true;
  }
  return ends_with(name, ".pyc");
}

BaseSnapshot capture_snapshot(const std::string& repo_path) {
  BaseSnapshot snap;
  std::error_code ec;
  const fs::path root = fs::weakly_canonical(fs::absolute(repo_path, ec), ec);
  if (ec || !fs::is_directory(root, ec)) {
    snap.error_message = "repository path is not a directory: " + repo_path;
    return snap;
  }
  snap.path = root.string();
  if (!digest_tree(root, &snap)) return snap;
  snap.ok = true;
  return snap;
}

// ---------------------------------------------------------------------------
// SandboxLease
// ---------------------------------------------------------------------------

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : manager_(other.manager_),
      ticket_id_(std::move(other.ticket_id_)),
      root_(std::move(other.root_)),
      repo_path_(std::move(other.repo_path_)),
      work_path_(std::move(other.work_path_)),
      sequence_(other.sequence_) {
  other.manager_ = nullptr;
}

SandboxLease& SandboxLease::operator=(SandboxLease&& other) noexcept {
  if (this != &other) {
    release();
    manager_ = other.manager_;
    ticket_id_ = std::move(other.ticket_id_);
    root_ = std::move(other.root_);
    repo_path_ = std::move(other.repo_path_);
    work_path_ = std::move(other.work_path_);
    sequence_ = other.sequence_;
    other.manager_ = nullptr;
  }
  return *this;
}

void SandboxLease::release() {
  if (!manager_) return;
  SandboxManager* m = manager_;
  manager_ = nullptr;
  m->release_slot(ticket_id_, root_);
}

// ---------------------------------------------------------------------------
// SandboxManager
// ---------------------------------------------------------------------------

SandboxManager::SandboxManager(std::string root, uint32_t max_sandboxes)
    : root_(std::move(root)), max_sandboxes_(max_sandboxes) {}

AcquireResult SandboxManager::acquire(const std::string& ticket_id, const BaseSnapshot& snapshot) {
  AcquireResult r;
  auto fail = [&r](std::string message) {
    r.ok = false;
    r.error_code = ErrorCode::sandbox_acquisition_failed;
    r.error_message = std::move(message);
    return std::move(r);
  };

  if (!snapshot.ok) return fail("base snapshot unavailable");

  std::error_code ec;
  fs::create_directories(root_, ec);
  const fs::path root = fs::weakly_canonical(fs::absolute(root_, ec), ec);
  if (ec) return fail("sandbox root unusable: " + root_);

  uint64_t seq = 0;
  fs::path dir;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (live_.count(ticket_id)) return fail("ticket " + ticket_id + " already holds a sandbox");
    if (live_.size() >= max_sandboxes_) {
      return fail("sandbox limit reached (" + std::to_string(max_sandboxes_) + " live)");
    }
    // The directory is created exclusively; a name left behind by another
    // manager or an earlier process is skipped, never reused.
    bool created = false;
    for (int attempt = 0; attempt < kMaxNameAttempts && !created; ++attempt) {
      seq = ++next_seq_;
      dir = (root / sandbox_dir_name(ticket_id, seq)).lexically_normal();
      if (ticket_id.empty() || !path_within(dir, root) || dir.parent_path() != root) {
        return fail("sandbox path escapes root for ticket '" + ticket_id + "'");
      }
      created = fs::create_directory(dir, ec);
      if (ec) return fail("cannot create sandbox " + dir.string() + ": " + ec.message());
    }
    if (!created) return fail("no free sandbox directory for ticket '" + ticket_id + "'");
    live_.emplace(ticket_id, dir.string());
    ++acquired_;
  }

  // From here the slot is reserved; any failure must give it back.
  SandboxLease lease;
  lease.manager_ = this;
  lease.ticket_id_ = ticket_id;
  lease.root_ = dir.string();
  lease.repo_path_ = (dir / "repo").string();
  lease.work_path_ = (dir / "work").string();
  lease.sequence_ = seq;

  std::string error;
  if (!copy_tree(snapshot.path, lease.repo_path_, &error)) {
    lease.release();
    return fail(error);
  }
  // The copy must match the base captured at planning.
  BaseSnapshot copied;
  if (!digest_tree(lease.repo_path_, &copied)) {
    lease.release();
    return fail(copied.error_message);
  }
  if (copied.digest != snapshot.digest) {
    lease.release();
    return fail("repository changed since snapshot " + snapshot.digest.substr(0, 16));
  }
  fs::create_directories(lease.work_path_, ec);
  if (ec) {
    lease.release();
    return fail("cannot create work directory: " + ec.message());
  }

  r.ok = true;
  r.lease = std::move(lease);
  return r;
}

void SandboxManager::release_slot(const std::string& ticket_id, const std::string& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  std::lock_guard<std::mutex> lk(mu_);
  if (ec) ++cleanup_failures_;
  auto it = live_.find(ticket_id);
  if (it != live_.end() && it->second == dir) {
    live_.erase(it);
    ++released_;
  }
}

bool SandboxManager::holds(const std::string& ticket_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.count(ticket_id) != 0;
}

size_t SandboxManager::live_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.size();
}

uint64_t SandboxManager::acquired_total() const {
  std::lock_guard<std::mutex> lk(mu_);
  return acquired_;
}

uint64_t SandboxManager::released_total() const {
  std::lock_guard<std::mutex> lk(mu_);
  return released_;
}

uint64_t SandboxManager::cleanup_failures() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cleanup_failures_;
}

}  // namespace conclave
