#include "conclave/types.hpp"

#include <chrono>

namespace conclave {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::planning_error: return "planning_error";
    case ErrorCode::dependency_cycle: return "dependency_cycle";
    case ErrorCode::sandbox_acquisition_failed: return "sandbox_acquisition_failed";
    case ErrorCode::execution_timeout: return "execution_timeout";
    case ErrorCode::execution_failure: return "execution_failure";
    case ErrorCode::review_rejection: return "review_rejection";
    case ErrorCode::integration_failure: return "integration_failure";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::invalid_transition: return "invalid_transition";
    case ErrorCode::duplicate_ticket: return "duplicate_ticket";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::internal_error: return "internal_error";
  }
  return "";
}

ErrorCode error_code_from_string(const std::string& s) {
  static const ErrorCode kAll[] = {
      ErrorCode::planning_error,      ErrorCode::dependency_cycle,
      ErrorCode::sandbox_acquisition_failed, ErrorCode::execution_timeout,
      ErrorCode::execution_failure,   ErrorCode::review_rejection,
      ErrorCode::integration_failure, ErrorCode::cancelled,
      ErrorCode::invalid_transition,  ErrorCode::duplicate_ticket,
      ErrorCode::config_invalid,      ErrorCode::internal_error,
  };
  for (ErrorCode c : kAll) {
    if (to_string(c) == s) return c;
  }
  return ErrorCode::none;
}

std::string to_string(TicketPriority p) {
  switch (p) {
    case TicketPriority::low: return "low";
    case TicketPriority::medium: return "medium";
    case TicketPriority::high: return "high";
    case TicketPriority::critical: return "critical";
  }
  return "medium";
}

std::string to_string(TicketStatus s) {
  switch (s) {
    case TicketStatus::pending: return "pending";
    case TicketStatus::in_progress: return "in_progress";
    case TicketStatus::needs_review: return "needs_review";
    case TicketStatus::approved: return "approved";
    case TicketStatus::rejected: return "rejected";
    case TicketStatus::blocked: return "blocked";
    case TicketStatus::cancelled: return "cancelled";
    case TicketStatus::failed: return "failed";
  }
  return "pending";
}

bool is_terminal(TicketStatus s) {
  switch (s) {
    case TicketStatus::approved:
    case TicketStatus::rejected:
    case TicketStatus::blocked:
    case TicketStatus::cancelled:
    case TicketStatus::failed:
      return true;
    default:
      return false;
  }
}

bool is_terminal_failure(TicketStatus s) {
  return is_terminal(s) && s != TicketStatus::approved;
}

bool transition_allowed(TicketStatus from, TicketStatus to) {
  switch (from) {
    case TicketStatus::pending:
      return to == TicketStatus::in_progress || to == TicketStatus::blocked;
    case TicketStatus::in_progress:
      return to == TicketStatus::needs_review || to == TicketStatus::cancelled ||
             to == TicketStatus::failed;
    case TicketStatus::needs_review:
      return to == TicketStatus::approved || to == TicketStatus::rejected;
    default:
      return false;
  }
}

bool Ticket::is_follow_up() const {
  auto it = metadata.find(meta::kFollowUp);
  return it != metadata.end() && it->second == "true";
}

std::string Ticket::parent_id() const {
  if (!is_follow_up()) return "";
  auto it = metadata.find(meta::kParentTicketId);
  return it == metadata.end() ? "" : it->second;
}

std::size_t Ticket::criteria_met() const {
  std::size_t n = 0;
  for (const auto& c : criteria) {
    if (c.met) ++n;
  }
  return n;
}

bool Ticket::all_criteria_met() const { return criteria_met() == criteria.size(); }

uint64_t now_unix_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

}  // namespace conclave
