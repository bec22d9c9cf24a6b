#pragma once

// conclave/types.hpp — Core data structures for the Conclave orchestration engine.
//
// OWNERSHIP:
//   - Objective is immutable once a run starts; the orchestrator only holds it as const.
//   - Ticket values live in TicketGraph. Everything handed to workers is a copy.
//   - ExecutionResult / ReviewVerdict are value types. Once recorded by the
//     orchestrator they are never modified and may be shared read-only.
//
// STATUS STATE MACHINE:
//   pending -> in_progress -> needs_review -> {approved, rejected}
//   pending -> blocked          (a dependency ended non-approved)
//   in_progress -> cancelled    (external cancellation)
//   in_progress -> failed       (execution error, timeout, sandbox failure)
//   Terminal: approved, rejected, blocked, cancelled, failed.
//
// EXTENSION_POINT: ticket_estimation
//   Tickets carry no effort estimate. A planner that produces one should store
//   it in metadata first; promote it to a field only once the scheduler uses it.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace conclave {

enum class ErrorCode {
  none,
  planning_error,
  dependency_cycle,
  sandbox_acquisition_failed,
  execution_timeout,
  execution_failure,
  review_rejection,
  integration_failure,
  cancelled,
  invalid_transition,
  duplicate_ticket,
  config_invalid,
  internal_error,
};

std::string to_string(ErrorCode code);
ErrorCode error_code_from_string(const std::string& s);

enum class TicketPriority { low, medium, high, critical };

std::string to_string(TicketPriority p);

enum class TicketStatus {
  pending,
  in_progress,
  needs_review,
  approved,
  rejected,
  blocked,
  cancelled,
  failed,
};

std::string to_string(TicketStatus s);

bool is_terminal(TicketStatus s);

// Terminal and not approved: dependents of such a ticket can never run.
bool is_terminal_failure(TicketStatus s);

// Encodes the state machine above. Same-state transitions are not allowed.
bool transition_allowed(TicketStatus from, TicketStatus to);

struct Objective {
  std::string description;
  std::vector<std::string> requirements;
  std::vector<std::string> constraints;
  std::vector<std::string> success_metrics;
  std::map<std::string, std::string> metadata;
};

struct AcceptanceCriterion {
  std::string description;
  bool met{false};
  std::string evidence;
};

// Metadata keys written by the planner and the review gate.
namespace meta {
inline constexpr const char* kFollowUp = "follow_up";
inline constexpr const char* kParentTicketId = "parent_ticket_id";
inline constexpr const char* kFollowUpReason = "follow_up_reason";
inline constexpr const char* kObjective = "objective";
inline constexpr const char* kRequirementIndex = "requirement_index";
}  // namespace meta

struct Ticket {
  std::string id;
  std::string title;
  std::string description;
  std::vector<AcceptanceCriterion> criteria;
  TicketPriority priority{TicketPriority::medium};
  std::vector<std::string> dependencies;
  TicketStatus status{TicketStatus::pending};
  std::map<std::string, std::string> metadata;
  std::string assigned_runner;
  uint32_t generation{0};  // 0 = planned, parent + 1 for follow-ups

  bool is_follow_up() const;
  std::string parent_id() const;  // "" unless is_follow_up()
  std::size_t criteria_met() const;
  bool all_criteria_met() const;
};

struct LogEntry {
  uint64_t timestamp_unix_ms{0};
  std::string message;
};

struct TestSummary {
  uint32_t passed{0};
  uint32_t failed{0};
  uint32_t skipped{0};

  uint32_t total() const { return passed + failed + skipped; }
};

struct ExecutionResult {
  std::string ticket_id;
  bool success{false};
  std::string diff;
  std::string diff_digest;  // BLAKE3 "diff:" domain, stamped by the coordinator
  std::vector<LogEntry> logs;
  std::optional<TestSummary> tests;
  std::vector<AcceptanceCriterion> criteria;  // implementer's report
  std::string error_code;                     // to_string(ErrorCode), "" on success
  std::string error_message;
  uint64_t duration_ms{0};
  std::string runner_id;
  bool cancelled{false};
};

struct ReviewVerdict {
  std::string ticket_id;
  bool approved{false};
  double alignment_score{0.0};
  std::string feedback;
  std::vector<std::string> risks;
  std::vector<Ticket> follow_ups;
  std::vector<std::string> suggestions;
};

uint64_t now_unix_ms();

}  // namespace conclave
