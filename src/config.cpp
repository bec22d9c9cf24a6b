#include "conclave/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <system_error>

namespace conclave {

namespace fs = std::filesystem;

namespace {

bool parse_u64(const char* s, uint64_t* out) {
  if (!s || !s[0]) return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0' || s[0] == '-') return false;
  *out = static_cast<uint64_t>(v);
  return true;
}

bool parse_unit_double(const char* s, double* out) {
  if (!s || !s[0]) return false;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (errno != 0 || end == s || *end != '\0') return false;
  *out = v;
  return true;
}

bool is_within(const fs::path& child, const fs::path& parent) {
  auto c = child.begin();
  for (auto p = parent.begin(); p != parent.end(); ++p, ++c) {
    if (p->empty()) continue;
    if (c == child.end() || *c != *p) return false;
  }
  return true;
}

fs::path normalized(const std::string& path) {
  std::error_code ec;
  fs::path p = fs::weakly_canonical(fs::absolute(path, ec), ec);
  if (ec) p = fs::path(path).lexically_normal();
  return p;
}

}  // namespace

std::string RunConfig::effective_sandbox_root() const {
  if (!sandbox_root.empty()) return sandbox_root;
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  if (ec) tmp = "/tmp";
  return (tmp / "conclave-sandboxes").string();
}

ConfigValidationResult validate_config(const RunConfig& cfg) {
  ConfigValidationResult r;
  if (cfg.repo_path.empty()) r.errors.push_back("repo_path must not be empty");
  if (cfg.max_runners < 1) r.errors.push_back("max_runners must be >= 1");
  if (cfg.ticket_timeout_ms == 0) r.errors.push_back("ticket_timeout_ms must be > 0");
  if (!(cfg.approval_threshold >= 0.0 && cfg.approval_threshold <= 1.0)) {
    r.errors.push_back("approval_threshold must be in [0,1]");
  }
  if (!(cfg.success_approval_rate >= 0.0 && cfg.success_approval_rate <= 1.0)) {
    r.errors.push_back("success_approval_rate must be in [0,1]");
  }
  if (cfg.max_sandboxes < cfg.max_runners) {
    r.errors.push_back("max_sandboxes must be >= max_runners");
  }
  if (!cfg.repo_path.empty() &&
      is_within(normalized(cfg.effective_sandbox_root()), normalized(cfg.repo_path))) {
    r.errors.push_back("sandbox_root must not be inside repo_path");
  }

  if (cfg.cancel_grace_ms == 0) {
    r.warnings.push_back("cancel_grace_ms is 0: uncooperative implementers are abandoned immediately");
  }
  if (cfg.max_followup_depth > 5) {
    r.warnings.push_back("max_followup_depth > 5 may generate a large number of follow-up tickets");
  }
  if (cfg.approval_threshold < 0.3) {
    r.warnings.push_back("approval_threshold below 0.3 approves results without any criteria met");
  }
  r.ok = r.errors.empty();
  return r;
}

RunConfig parse_run_config_json(const std::string& json,
                                std::optional<jsonlite::JsonError>* error) {
  RunConfig cfg;
  std::optional<jsonlite::JsonError> parse_err;
  const jsonlite::Object obj = jsonlite::parse(json, &parse_err);
  if (parse_err) {
    if (error) *error = parse_err;
    return cfg;
  }

  struct Expect {
    const char* key;
    const char* type;
  };
  static const Expect kExpected[] = {
      {"repo_path", "string"},          {"sandbox_root", "string"},
      {"max_runners", "u64"},           {"ticket_timeout_ms", "u64"},
      {"cancel_grace_ms", "u64"},       {"approval_threshold", "number"},
      {"max_followup_depth", "u64"},    {"max_sandboxes", "u64"},
      {"success_approval_rate", "number"}, {"event_log_path", "string"},
      {"audit_log_path", "string"},     {"integrate_command", "array"},
      {"final_test_command", "array"},  {"final_test_timeout_ms", "u64"},
  };
  for (const auto& e : kExpected) {
    if (jsonlite::has_wrong_type(obj, e.key, e.type)) {
      if (error) {
        *error = jsonlite::JsonError{to_string(ErrorCode::config_invalid),
                                     std::string(e.key) + " must be of type " + e.type};
      }
      return RunConfig{};
    }
  }

  for (const char* key : {"max_runners", "max_followup_depth", "max_sandboxes"}) {
    if (jsonlite::get_u64(obj, key, 0) > std::numeric_limits<uint32_t>::max()) {
      if (error) {
        *error = jsonlite::JsonError{to_string(ErrorCode::config_invalid),
                                     std::string(key) + " out of range"};
      }
      return RunConfig{};
    }
  }

  cfg.repo_path = jsonlite::get_string(obj, "repo_path", cfg.repo_path);
  cfg.sandbox_root = jsonlite::get_string(obj, "sandbox_root", cfg.sandbox_root);
  cfg.max_runners = static_cast<uint32_t>(jsonlite::get_u64(obj, "max_runners", cfg.max_runners));
  cfg.ticket_timeout_ms = jsonlite::get_u64(obj, "ticket_timeout_ms", cfg.ticket_timeout_ms);
  cfg.cancel_grace_ms = jsonlite::get_u64(obj, "cancel_grace_ms", cfg.cancel_grace_ms);
  cfg.approval_threshold = jsonlite::get_double(obj, "approval_threshold", cfg.approval_threshold);
  cfg.max_followup_depth =
      static_cast<uint32_t>(jsonlite::get_u64(obj, "max_followup_depth", cfg.max_followup_depth));
  cfg.max_sandboxes =
      static_cast<uint32_t>(jsonlite::get_u64(obj, "max_sandboxes", cfg.max_sandboxes));
  cfg.success_approval_rate =
      jsonlite::get_double(obj, "success_approval_rate", cfg.success_approval_rate);
  cfg.event_log_path = jsonlite::get_string(obj, "event_log_path");
  cfg.audit_log_path = jsonlite::get_string(obj, "audit_log_path");
  cfg.integrate_command = jsonlite::get_string_array(obj, "integrate_command");
  cfg.final_test_command = jsonlite::get_string_array(obj, "final_test_command");
  cfg.final_test_timeout_ms =
      jsonlite::get_u64(obj, "final_test_timeout_ms", cfg.final_test_timeout_ms);
  return cfg;
}

Objective parse_objective_json(const std::string& json,
                               std::optional<jsonlite::JsonError>* error) {
  Objective o;
  std::optional<jsonlite::JsonError> parse_err;
  const jsonlite::Object obj = jsonlite::parse(json, &parse_err);
  if (parse_err) {
    if (error) *error = parse_err;
    return o;
  }
  if (jsonlite::has_wrong_type(obj, "description", "string") ||
      jsonlite::has_wrong_type(obj, "requirements", "array") ||
      jsonlite::has_wrong_type(obj, "constraints", "array") ||
      jsonlite::has_wrong_type(obj, "success_metrics", "array") ||
      jsonlite::has_wrong_type(obj, "metadata", "object")) {
    if (error) {
      *error = jsonlite::JsonError{to_string(ErrorCode::planning_error),
                                   "objective document has a field of the wrong type"};
    }
    return o;
  }
  o.description = jsonlite::get_string(obj, "description");
  o.requirements = jsonlite::get_string_array(obj, "requirements");
  o.constraints = jsonlite::get_string_array(obj, "constraints");
  o.success_metrics = jsonlite::get_string_array(obj, "success_metrics");
  o.metadata = jsonlite::get_string_map(obj, "metadata");
  return o;
}

std::vector<std::string> apply_env_overrides(RunConfig& cfg) {
  std::vector<std::string> warnings;
  auto bad = [&warnings](const char* name, const char* value) {
    warnings.push_back(std::string("ignoring ") + name + "=" + value + ": not a valid value");
  };

  if (const char* e = std::getenv("CONCLAVE_MAX_RUNNERS"); e && e[0]) {
    uint64_t v = 0;
    if (parse_u64(e, &v) && v >= 1 && v <= 1024) {
      cfg.max_runners = static_cast<uint32_t>(v);
      if (cfg.max_sandboxes < cfg.max_runners) cfg.max_sandboxes = cfg.max_runners;
    } else {
      bad("CONCLAVE_MAX_RUNNERS", e);
    }
  }
  if (const char* e = std::getenv("CONCLAVE_TICKET_TIMEOUT_MS"); e && e[0]) {
    uint64_t v = 0;
    if (parse_u64(e, &v) && v > 0) cfg.ticket_timeout_ms = v;
    else bad("CONCLAVE_TICKET_TIMEOUT_MS", e);
  }
  if (const char* e = std::getenv("CONCLAVE_APPROVAL_THRESHOLD"); e && e[0]) {
    double v = 0.0;
    if (parse_unit_double(e, &v) && v >= 0.0 && v <= 1.0) cfg.approval_threshold = v;
    else bad("CONCLAVE_APPROVAL_THRESHOLD", e);
  }
  if (const char* e = std::getenv("CONCLAVE_MAX_FOLLOWUP_DEPTH"); e && e[0]) {
    uint64_t v = 0;
    if (parse_u64(e, &v) && v <= 64) cfg.max_followup_depth = static_cast<uint32_t>(v);
    else bad("CONCLAVE_MAX_FOLLOWUP_DEPTH", e);
  }
  if (const char* e = std::getenv("CONCLAVE_SANDBOX_ROOT"); e && e[0]) cfg.sandbox_root = e;
  if (const char* e = std::getenv("CONCLAVE_EVENT_LOG"); e && e[0]) cfg.event_log_path = e;
  if (const char* e = std::getenv("CONCLAVE_AUDIT_LOG"); e && e[0]) cfg.audit_log_path = e;
  return warnings;
}

std::string run_config_to_json(const RunConfig& cfg) {
  auto strings = [](const std::vector<std::string>& v) {
    jsonlite::Array a;
    for (const auto& s : v) a.emplace_back(s);
    return a;
  };
  jsonlite::Object o;
  o["config_version"] = kConfigVersion;
  o["repo_path"] = cfg.repo_path;
  o["sandbox_root"] = cfg.effective_sandbox_root();
  o["max_runners"] = static_cast<std::uint64_t>(cfg.max_runners);
  o["ticket_timeout_ms"] = cfg.ticket_timeout_ms;
  o["cancel_grace_ms"] = cfg.cancel_grace_ms;
  o["approval_threshold"] = cfg.approval_threshold;
  o["max_followup_depth"] = static_cast<std::uint64_t>(cfg.max_followup_depth);
  o["max_sandboxes"] = static_cast<std::uint64_t>(cfg.max_sandboxes);
  o["success_approval_rate"] = cfg.success_approval_rate;
  o["event_log_path"] = cfg.event_log_path;
  o["audit_log_path"] = cfg.audit_log_path;
  o["integrate_command"] = strings(cfg.integrate_command);
  o["final_test_command"] = strings(cfg.final_test_command);
  o["final_test_timeout_ms"] = cfg.final_test_timeout_ms;
  return jsonlite::to_json(o);
}

}  // namespace conclave
