#pragma once

// conclave/report.hpp — Final run report.
//
// A RunReport is produced for every run() call, including runs that fail
// during PLANNING (empty ticket list, fatal_reason set) and runs interrupted
// by an internal error (partial rows, error_code internal_error).
//
// JSON layout is versioned by REPORT_FORMAT_VERSION ("format" key). Objects
// are key-sorted, so two reports of identical runs serialize identically
// apart from run_id, timestamps and durations.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "conclave/ports.hpp"
#include "conclave/review_gate.hpp"
#include "conclave/types.hpp"

namespace conclave {

enum class RunPhase { idle, planning, executing, reviewing, integrating, completed, failed };

std::string to_string(RunPhase p);

struct TicketReportRow {
  std::string id;
  std::string title;
  TicketStatus status{TicketStatus::pending};
  std::string reason;
  std::optional<uint32_t> wave;
  uint32_t generation{0};
  std::string parent_id;
  std::optional<double> alignment_score;  // absent when never reviewed
  std::string error_code;                 // from the execution result
  std::string runner_id;
  uint64_t duration_ms{0};
};

// Review outcome of one generation (planned tickets, then each follow-up round).
struct GenerationSummary {
  uint32_t generation{0};
  ReviewSummary review;
  uint64_t follow_ups_created{0};
};

struct RunReport {
  std::string run_id;
  RunPhase phase{RunPhase::idle};
  bool success{false};
  bool stopped{false};
  ErrorCode error_code{ErrorCode::none};
  std::string fatal_reason;

  std::vector<TicketReportRow> tickets;  // creation order
  std::map<std::string, uint64_t> counts_by_status;
  ReviewSummary review;
  double aggregate_alignment{0.0};  // mean of each reviewed ticket's score
  std::vector<GenerationSummary> generations;
  uint32_t waves{0};

  std::optional<IntegrationOutcome> integration;
  std::optional<FinalTestOutcome> final_test;

  std::string snapshot_digest;
  std::vector<std::string> config_warnings;
  uint64_t duration_ms{0};
  uint64_t events_published{0};
  uint64_t events_dropped{0};
  uint64_t audit_records{0};
  uint64_t audit_failures{0};
  std::string audit_head;  // last chain digest, "" when the log is disabled
  std::string stats_json;  // RunStats::to_json()

  const TicketReportRow* find(const std::string& id) const;
  uint64_t count(TicketStatus s) const;
};

std::string report_to_json(const RunReport& report);

// Multi-line summary for terminals and logs.
std::string render_text(const RunReport& report);

}  // namespace conclave
