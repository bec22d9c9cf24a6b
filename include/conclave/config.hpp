#pragma once

// conclave/config.hpp — Run configuration.
//
// Sources, lowest to highest precedence:
//   1. RunConfig defaults below.
//   2. parse_run_config_json(): a flat JSON object using the field names.
//   3. apply_env_overrides(): CONCLAVE_* environment variables.
//
// The orchestrator calls validate_config() before planning and refuses to run
// (ErrorCode::config_invalid) when it reports errors.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "conclave/jsonlite.hpp"
#include "conclave/types.hpp"

namespace conclave {

inline constexpr const char* kConfigVersion = "1";

struct RunConfig {
  std::string repo_path{"."};
  std::string sandbox_root;  // empty = <temp_directory_path>/conclave-sandboxes
  uint32_t max_runners{4};
  uint64_t ticket_timeout_ms{300000};
  uint64_t cancel_grace_ms{1000};
  double approval_threshold{0.7};
  uint32_t max_followup_depth{1};
  uint32_t max_sandboxes{64};
  double success_approval_rate{0.8};
  std::string event_log_path;
  std::string audit_log_path;
  std::vector<std::string> integrate_command;   // empty = NullIntegrator
  std::vector<std::string> final_test_command;  // empty = NullFinalTest
  uint64_t final_test_timeout_ms{600000};

  // sandbox_root with the default applied.
  std::string effective_sandbox_root() const;
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version{kConfigVersion};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const RunConfig& cfg);

// Missing keys keep their defaults. A key with the wrong type, or unparseable
// JSON, sets *error (code "config_invalid" or the jsonlite code) and returns
// the defaults.
RunConfig parse_run_config_json(const std::string& json, std::optional<jsonlite::JsonError>* error);

// {description, requirements, constraints, success_metrics, metadata}
Objective parse_objective_json(const std::string& json, std::optional<jsonlite::JsonError>* error);

// Reads CONCLAVE_MAX_RUNNERS, CONCLAVE_TICKET_TIMEOUT_MS,
// CONCLAVE_APPROVAL_THRESHOLD, CONCLAVE_MAX_FOLLOWUP_DEPTH,
// CONCLAVE_SANDBOX_ROOT, CONCLAVE_EVENT_LOG and CONCLAVE_AUDIT_LOG.
// Unparseable values are skipped and reported in the returned warnings.
std::vector<std::string> apply_env_overrides(RunConfig& cfg);

std::string run_config_to_json(const RunConfig& cfg);

}  // namespace conclave
