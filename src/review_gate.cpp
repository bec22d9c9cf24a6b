#include "conclave/review_gate.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "conclave/jsonlite.hpp"

namespace conclave {

namespace {

constexpr double kSuccessWeight = 0.30;
constexpr double kCriteriaWeight = 0.40;
constexpr double kTestsWeight = 0.30;
constexpr double kNoTestEvidence = 0.15;
constexpr size_t kLogExcerptChars = 100;

bool contains(const std::string& s, const char* needle) { return s.find(needle) != std::string::npos; }

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string format_score(double v) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

Ticket follow_up_base(const Ticket& parent, size_t n, const char* reason) {
  Ticket t;
  t.id = parent.id + "-FU-" + std::to_string(n);
  t.dependencies = {parent.id};
  t.priority = parent.priority;
  t.generation = parent.generation + 1;
  t.metadata[meta::kFollowUp] = "true";
  t.metadata[meta::kParentTicketId] = parent.id;
  t.metadata[meta::kFollowUpReason] = reason;
  auto obj = parent.metadata.find(meta::kObjective);
  if (obj != parent.metadata.end()) t.metadata[meta::kObjective] = obj->second;
  return t;
}

}  // namespace

ScoreBreakdown score_breakdown(const Ticket& ticket, const ExecutionResult& result) {
  ScoreBreakdown s;
  s.success_term = result.success ? kSuccessWeight : 0.0;

  if (ticket.criteria.empty()) {
    s.criteria_term = kCriteriaWeight;
  } else {
    const double ratio =
        static_cast<double>(ticket.criteria_met()) / static_cast<double>(ticket.criteria.size());
    s.criteria_term = kCriteriaWeight * std::clamp(ratio, 0.0, 1.0);
  }

  if (result.tests && result.tests->total() > 0) {
    const double ratio =
        static_cast<double>(result.tests->passed) / static_cast<double>(result.tests->total());
    s.tests_term = kTestsWeight * std::clamp(ratio, 0.0, 1.0);
  } else {
    s.tests_term = kNoTestEvidence;
  }

  s.total = std::clamp(s.success_term + s.criteria_term + s.tests_term, 0.0, 1.0);
  return s;
}

double alignment_score(const Ticket& ticket, const ExecutionResult& result) {
  return score_breakdown(ticket, result).total;
}

DiffStats analyze_diff(const std::string& diff) {
  DiffStats d;
  size_t pos = 0;
  while (pos <= diff.size()) {
    size_t end = diff.find('\n', pos);
    if (end == std::string::npos) end = diff.size();
    const std::string line = diff.substr(pos, end - pos);
    pos = end + 1;
    if (line.rfind("+++", 0) == 0 || line.rfind("---", 0) == 0) continue;
    if (!line.empty() && line[0] == '+') {
      ++d.added;
      if (contains(line, "print(") || contains(line, "console.log(") ||
          contains(line, "printf(") || contains(line, "std::cout")) {
        d.debug_statements = true;
      }
      if (contains(line, "TODO") || contains(line, "FIXME") || contains(line, "XXX")) {
        d.unresolved_markers = true;
      }
    } else if (!line.empty() && line[0] == '-') {
      ++d.removed;
    }
    if (end == diff.size()) break;
  }
  return d;
}

ReviewVerdict ReviewGate::review(const Ticket& ticket, const ExecutionResult& result) {
  ReviewVerdict v;
  v.ticket_id = ticket.id;

  const ScoreBreakdown score = score_breakdown(ticket, result);
  v.alignment_score = score.total;
  v.approved = result.success && !result.cancelled && ticket.all_criteria_met() &&
               score.total >= policy_.approval_threshold;

  const DiffStats diff = analyze_diff(result.diff);
  std::vector<std::string> lines;
  lines.push_back(v.approved ? "review passed: ticket approved" : "review failed: needs revision");
  if (!result.success) {
    lines.push_back("execution failed: " +
                    (result.error_message.empty() ? result.error_code : result.error_message));
  }
  lines.push_back("acceptance criteria: " + std::to_string(ticket.criteria_met()) + "/" +
                  std::to_string(ticket.criteria.size()) + " met");
  if (!ticket.all_criteria_met()) {
    std::string unmet;
    for (const auto& c : ticket.criteria) {
      if (c.met) continue;
      if (!unmet.empty()) unmet += ", ";
      unmet += c.description;
    }
    lines.push_back("unmet criteria: " + unmet);
  }
  if (result.tests) {
    lines.push_back("tests: " + std::to_string(result.tests->passed) + "/" +
                    std::to_string(result.tests->total()) + " passed");
  } else {
    lines.push_back("tests: no evidence");
  }
  lines.push_back("alignment score: " + format_score(score.total));
  if (score.total < policy_.approval_threshold) {
    lines.push_back("below approval threshold " + format_score(policy_.approval_threshold));
  }
  if (!result.diff.empty()) {
    lines.push_back("changes: +" + std::to_string(diff.added) + " -" +
                    std::to_string(diff.removed) + " lines");
  }

  if (!result.cancelled) v.follow_ups = synthesize_follow_ups(ticket, result, v.approved);
  if (!v.follow_ups.empty()) {
    lines.push_back("identified " + std::to_string(v.follow_ups.size()) + " follow-up task(s)");
  }

  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) v.feedback += '\n';
    v.feedback += lines[i];
  }
  v.risks = find_risks(result, diff);
  v.suggestions = suggestions(result, v.approved);
  return v;
}

std::vector<Ticket> ReviewGate::synthesize_follow_ups(const Ticket& ticket,
                                                      const ExecutionResult& result,
                                                      bool approved) const {
  std::vector<Ticket> out;

  for (const auto& c : ticket.criteria) {
    if (c.met) continue;
    Ticket t = follow_up_base(ticket, out.size() + 1, "unmet_criterion");
    t.title = "Meet criterion for " + ticket.title;
    t.description = "Criterion not met by " + ticket.id + ": " + c.description;
    t.criteria = {AcceptanceCriterion{c.description, false, ""}};
    out.push_back(std::move(t));
  }

  if (result.tests && result.tests->failed > 0) {
    Ticket t = follow_up_base(ticket, out.size() + 1, "failing_tests");
    t.title = "Fix test failures for " + ticket.title;
    t.description = "Address " + std::to_string(result.tests->failed) + " failing test(s)";
    t.criteria = {AcceptanceCriterion{"All tests pass", false, ""}};
    t.priority = TicketPriority::high;
    out.push_back(std::move(t));
  }

  for (const auto& entry : result.logs) {
    if (!contains(entry.message, "TODO") && !contains(lower(entry.message), "follow-up")) continue;
    Ticket t = follow_up_base(ticket, out.size() + 1, "log_marker");
    t.title = "Follow-up for " + ticket.title;
    t.description = "Address item from logs: " + entry.message.substr(0, kLogExcerptChars);
    t.criteria = {AcceptanceCriterion{"Complete follow-up work", false, ""}};
    t.priority = TicketPriority::medium;
    out.push_back(std::move(t));
  }

  if (!approved && out.empty()) {
    Ticket t = follow_up_base(ticket, 1, "rejection");
    t.title = "Retry " + ticket.title;
    t.description = "Retry of " + ticket.id + " after rejection";
    if (!result.error_code.empty()) t.description += " (" + result.error_code + ")";
    t.description += ": " + ticket.description;
    t.criteria = ticket.criteria;
    for (auto& c : t.criteria) {
      c.met = false;
      c.evidence.clear();
    }
    out.push_back(std::move(t));
  }
  return out;
}

std::vector<std::string> ReviewGate::find_risks(const ExecutionResult& result,
                                                const DiffStats& diff) const {
  std::vector<std::string> risks;
  if (!result.success) {
    std::string r = "execution reported success=false";
    if (!result.error_code.empty()) r += " (" + result.error_code + ")";
    risks.push_back(r);
  }
  if (result.tests && result.tests->failed > 0) {
    risks.push_back(std::to_string(result.tests->failed) + " failing test(s)");
  }
  if (result.tests && result.tests->skipped > 0) {
    risks.push_back(std::to_string(result.tests->skipped) + " skipped test(s)");
  }
  if (result.diff.empty() && !result.cancelled) risks.push_back("no code changes detected");
  if (diff.debug_statements) risks.push_back("debug statements in added lines");
  if (diff.unresolved_markers) risks.push_back("unresolved TODO/FIXME/XXX markers in added lines");
  return risks;
}

std::vector<std::string> ReviewGate::suggestions(const ExecutionResult& result,
                                                 bool approved) const {
  std::vector<std::string> out;
  if (!approved) {
    out.push_back("Review the acceptance criteria and ensure all are met");
    out.push_back("Check test results and fix any failing tests");
  }
  if (result.duration_ms > policy_.long_execution_ms) {
    out.push_back("Consider breaking down into smaller tasks for faster execution");
  }
  if (!objective_.empty()) {
    out.push_back("Ensure changes align with objective: " + objective_);
  }
  return out;
}

ReviewSummary summarize(const std::vector<ReviewVerdict>& verdicts) {
  ReviewSummary s;
  double score_sum = 0.0;
  for (const auto& v : verdicts) {
    ++s.total_reviews;
    if (v.approved) ++s.approved;
    score_sum += v.alignment_score;
    s.follow_up_count += v.follow_ups.size();
  }
  s.rejected = s.total_reviews - s.approved;
  if (s.total_reviews > 0) {
    s.approval_rate = static_cast<double>(s.approved) / static_cast<double>(s.total_reviews);
    s.average_alignment = score_sum / static_cast<double>(s.total_reviews);
  }
  return s;
}

std::string summary_to_json(const ReviewSummary& s) {
  jsonlite::Object o;
  o["total_reviews"] = s.total_reviews;
  o["approved"] = s.approved;
  o["rejected"] = s.rejected;
  o["approval_rate"] = s.approval_rate;
  o["average_alignment"] = s.average_alignment;
  o["follow_up_count"] = s.follow_up_count;
  return jsonlite::to_json(o);
}

}  // namespace conclave
