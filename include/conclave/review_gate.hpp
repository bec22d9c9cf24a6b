#pragma once

// conclave/review_gate.hpp — Scoring, approval and follow-up synthesis.
//
// SCORE (deterministic, recomputed on every review):
//   success   0.30 if result.success, else 0
//   criteria  0.40 * met / total          (0.40 when the ticket declares none)
//   tests     0.30 * passed / total()     when a summary with total() > 0 exists
//             0.15                        otherwise (no evidence)
//   total     clamped to [0, 1]
//
// APPROVAL requires all of: score >= approval_threshold, result.success, and
// every declared criterion met. Criteria state is read from the ticket; the
// orchestrator merges the implementer's report into it before reviewing.
//
// FOLLOW-UPS (id "<parent>-FU-<n>", n from 1, depends on the parent only):
//   - one per unmet criterion
//   - one for failing tests
//   - one per log line carrying "TODO" or "follow-up"
//   - one retry when rejected and none of the above applied
//   Cancelled results produce none.
//
// Risks are advisory and never affect the score.

#include <cstdint>
#include <string>
#include <vector>

#include "conclave/ports.hpp"
#include "conclave/types.hpp"

namespace conclave {

struct ReviewPolicy {
  double approval_threshold{0.7};
  uint64_t long_execution_ms{300000};  // above this, suggest splitting the ticket
};

struct ScoreBreakdown {
  double success_term{0.0};
  double criteria_term{0.0};
  double tests_term{0.0};
  double total{0.0};
};

ScoreBreakdown score_breakdown(const Ticket& ticket, const ExecutionResult& result);
double alignment_score(const Ticket& ticket, const ExecutionResult& result);

struct DiffStats {
  uint64_t added{0};
  uint64_t removed{0};
  bool debug_statements{false};
  bool unresolved_markers{false};  // TODO / FIXME / XXX
};

// Unified-diff line counts; "+++"/"---" headers are not counted.
DiffStats analyze_diff(const std::string& diff);

struct ReviewSummary {
  uint64_t total_reviews{0};
  uint64_t approved{0};
  uint64_t rejected{0};
  double approval_rate{0.0};
  double average_alignment{0.0};
  uint64_t follow_up_count{0};
};

ReviewSummary summarize(const std::vector<ReviewVerdict>& verdicts);
std::string summary_to_json(const ReviewSummary& s);

class ReviewGate : public ReviewerPort {
 public:
  explicit ReviewGate(ReviewPolicy policy = {}, std::string objective = "")
      : policy_(policy), objective_(std::move(objective)) {}

  ReviewVerdict review(const Ticket& ticket, const ExecutionResult& result) override;

  const ReviewPolicy& policy() const { return policy_; }

 private:
  std::vector<Ticket> synthesize_follow_ups(const Ticket& ticket, const ExecutionResult& result,
                                            bool approved) const;
  std::vector<std::string> find_risks(const ExecutionResult& result, const DiffStats& diff) const;
  std::vector<std::string> suggestions(const ExecutionResult& result, bool approved) const;

  ReviewPolicy policy_;
  std::string objective_;
};

}  // namespace conclave
