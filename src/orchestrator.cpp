#include "conclave/orchestrator.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>

#include "conclave/adapters.hpp"
#include "conclave/hash.hpp"
#include "conclave/planner.hpp"

namespace conclave {

namespace {

constexpr const char* kRunStopped = "run stopped";
constexpr const char* kDepthExhausted = "regeneration depth exhausted";
constexpr const char* kUnknownException = "non-standard exception";

std::string join(const std::vector<std::string>& v, const char* sep) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += sep;
    out += v[i];
  }
  return out;
}

std::string format_score(double v) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

// Unique across runs and processes; not meant to be reproducible.
std::string make_run_id(const Objective& objective) {
  static std::atomic<uint64_t> counter{0};
  std::string payload = objective.description;
  payload += '\n';
  payload += join(objective.requirements, "\n");
  payload += '\n';
  payload += std::to_string(now_unix_ms());
  payload += '#';
  payload += std::to_string(static_cast<long>(getpid()));
  payload += '#';
  payload += std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
  return "run-" + hash_domain("run:", payload).substr(0, 16);
}

std::string result_reason(const ExecutionResult& r) {
  std::string reason = r.error_code.empty() ? to_string(ErrorCode::execution_failure) : r.error_code;
  if (!r.error_message.empty()) reason += ": " + r.error_message;
  return reason;
}

}  // namespace

RunContext::RunContext(std::string id, const Objective& obj, const RunConfig& cfg)
    : run_id(std::move(id)),
      objective(obj),
      config(cfg),
      audit(cfg.audit_log_path),
      graph(&events),
      sandboxes((std::filesystem::path(cfg.effective_sandbox_root()) / run_id).string(),
                cfg.max_sandboxes) {}

Orchestrator::Orchestrator(RunConfig config, OrchestratorPorts ports)
    : config_(std::move(config)), ports_(std::move(ports)) {}

Orchestrator::ResolvedPorts Orchestrator::resolve_ports(const Objective& objective) const {
  ResolvedPorts p;
  p.planner = ports_.planner ? ports_.planner : std::make_shared<HeuristicPlanner>();
  p.implementer = ports_.implementer;
  if (ports_.reviewer) {
    p.reviewer = ports_.reviewer;
  } else {
    ReviewPolicy policy;
    policy.approval_threshold = config_.approval_threshold;
    policy.long_execution_ms = config_.ticket_timeout_ms;
    p.reviewer = std::make_shared<ReviewGate>(policy, objective.description);
  }
  if (ports_.integrator) {
    p.integrator = ports_.integrator;
  } else if (!config_.integrate_command.empty()) {
    p.integrator = std::make_shared<CommandIntegrator>(config_.repo_path, config_.integrate_command);
  } else {
    p.integrator = std::make_shared<NullIntegrator>();
  }
  if (ports_.final_test) {
    p.final_test = ports_.final_test;
  } else if (!config_.final_test_command.empty()) {
    p.final_test =
        std::make_shared<CommandFinalTest>(config_.final_test_command, config_.final_test_timeout_ms);
  } else {
    p.final_test = std::make_shared<NullFinalTest>();
  }
  return p;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

RunReport Orchestrator::run(const Objective& objective) {
  RunReport report;
  uint64_t duration_ms = 0;
  auto ctx = std::make_unique<RunContext>(make_run_id(objective), objective, config_);
  {
    ScopeTimer timer(duration_ms);

    for (const auto& sink : ports_.event_sinks) {
      if (sink) ctx->events.subscribe(sink);
    }
    if (!config_.event_log_path.empty()) {
      ctx->events.subscribe(std::make_shared<JsonlEventSink>(config_.event_log_path));
    }
    RunContext* raw = ctx.get();
    ctx->graph.set_transition_observer([raw](const Ticket& t, const StatusChange& change) {
      raw->audit.record_transition(raw->run_id, t.id, change.from, change.to, change.reason);
    });
    {
      std::lock_guard<std::mutex> lk(mu_);
      active_ = raw;
    }

    const ResolvedPorts ports = resolve_ports(objective);
    const ConfigValidationResult validation = validate_config(config_);
    report.config_warnings = validation.warnings;

    set_phase(*ctx, RunPhase::planning);
    if (!validation.ok) {
      ctx->planning_failed = true;
      fail(*ctx, ErrorCode::config_invalid, join(validation.errors, "; "));
    } else if (!ports.implementer) {
      ctx->planning_failed = true;
      fail(*ctx, ErrorCode::config_invalid, "no implementer configured");
    } else if (plan(*ctx, ports)) {
      try {
        execute_generations(*ctx, ports);
        if (ctx->phase != RunPhase::failed) integrate(*ctx, ports, report);
      } catch (const std::exception& e) {
        fail_in_flight(*ctx, std::string("internal_error: ") + e.what());
        fail(*ctx, ErrorCode::internal_error, e.what());
      } catch (...) {
        fail_in_flight(*ctx, std::string("internal_error: ") + kUnknownException);
        fail(*ctx, ErrorCode::internal_error, kUnknownException);
      }
    }
  }

  report.duration_ms = duration_ms;
  report = build_report(*ctx, std::move(report));
  // Every lease is released by now; the per-run root is removed once empty.
  std::error_code ec;
  std::filesystem::remove(ctx->sandboxes.root(), ec);
  {
    std::lock_guard<std::mutex> lk(mu_);
    active_ = nullptr;
    stop_requested_ = false;
    early_cancels_.clear();
  }
  return report;
}

void Orchestrator::stop() {
  std::lock_guard<std::mutex> lk(mu_);
  stop_requested_ = true;
  if (active_ && active_->coordinator) active_->coordinator->cancel_all(kRunStopped);
}

void Orchestrator::cancel(const std::string& ticket_id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (active_ && active_->coordinator) {
    active_->coordinator->cancel(ticket_id);
  } else {
    early_cancels_.push_back(ticket_id);
  }
}

bool Orchestrator::stop_requested() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stop_requested_;
}

// ---------------------------------------------------------------------------
// PLANNING
// ---------------------------------------------------------------------------

bool Orchestrator::plan(RunContext& ctx, const ResolvedPorts& ports) {
  auto planning_failure = [&](ErrorCode code, const std::string& reason) {
    ctx.planning_failed = true;
    fail(ctx, code == ErrorCode::none ? ErrorCode::planning_error : code, reason);
    return false;
  };

  const PlanResult valid = validate_objective(ctx.objective);
  if (!valid.ok) return planning_failure(valid.error_code, valid.error_message);

  ctx.snapshot = capture_snapshot(ctx.config.repo_path);
  if (!ctx.snapshot.ok) {
    return planning_failure(ErrorCode::planning_error,
                            "repository snapshot failed: " + ctx.snapshot.error_message);
  }

  PlanResult planned;
  try {
    planned = ports.planner->plan(ctx.objective, ctx.snapshot);
  } catch (const std::exception& e) {
    return planning_failure(ErrorCode::planning_error, std::string("planner threw: ") + e.what());
  } catch (...) {
    return planning_failure(ErrorCode::planning_error,
                            std::string("planner threw: ") + kUnknownException);
  }
  if (!planned.ok) return planning_failure(planned.error_code, planned.error_message);
  if (planned.tickets.empty()) {
    return planning_failure(ErrorCode::planning_error, "planner produced no tickets");
  }

  for (auto& t : planned.tickets) {
    const GraphResult added = ctx.graph.add_ticket(std::move(t));
    if (!added.ok) return planning_failure(added.error_code, added.error_message);
  }
  const GraphResult valid_graph = ctx.graph.validate();
  if (!valid_graph.ok) return planning_failure(valid_graph.error_code, valid_graph.error_message);
  return true;
}

// ---------------------------------------------------------------------------
// EXECUTING / REVIEWING
// ---------------------------------------------------------------------------

void Orchestrator::execute_generations(RunContext& ctx, const ResolvedPorts& ports) {
  CoordinatorOptions options;
  options.ticket_timeout_ms = ctx.config.ticket_timeout_ms;
  options.cancel_grace_ms = ctx.config.cancel_grace_ms;
  options.objective = ctx.objective.description;
  options.constraints = ctx.objective.constraints;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ctx.coordinator = std::make_unique<ExecutionCoordinator>(ctx.sandboxes, ctx.snapshot, options,
                                                             &ctx.events, &ctx.stats);
    for (const auto& id : early_cancels_) ctx.coordinator->cancel(id);
    early_cancels_.clear();
    if (stop_requested_) ctx.coordinator->cancel_all(kRunStopped);
  }

  for (;;) {
    set_phase(ctx, RunPhase::executing);
    std::vector<Ticket> follow_ups;
    std::vector<ReviewVerdict> generation_verdicts;
    while (!stop_requested()) {
      const WavePlan wave = ctx.graph.next_wave(ctx.completed);
      if (wave.empty()) break;
      run_wave(ctx, wave, ports, follow_ups, generation_verdicts);
    }

    set_phase(ctx, RunPhase::reviewing);
    GenerationSummary summary;
    summary.generation = ctx.generation;
    summary.review = summarize(generation_verdicts);

    if (stop_requested()) {
      ctx.generations.push_back(summary);
      ctx.stopped = true;
      for (const auto& t : ctx.graph.tickets()) {
        if (t.status == TicketStatus::pending) ctx.graph.set_reason(t.id, kRunStopped);
      }
      fail(ctx, ErrorCode::cancelled, kRunStopped);
      return;
    }

    std::vector<std::string> added;
    for (auto& t : follow_ups) {
      const std::string id = t.id;
      const GraphResult r = ctx.graph.add_ticket(std::move(t));
      if (r.ok) added.push_back(id);
    }
    summary.follow_ups_created = added.size();
    ctx.generations.push_back(summary);
    if (added.empty()) return;

    if (ctx.generation >= ctx.config.max_followup_depth) {
      for (const auto& id : added) ctx.graph.set_reason(id, kDepthExhausted);
      return;
    }

    const GraphResult valid = ctx.graph.validate();
    if (!valid.ok) {
      for (const auto& id : added) ctx.graph.set_reason(id, "not dispatched: " + valid.error_message);
      fail(ctx, valid.error_code, valid.error_message);
      return;
    }
    ++ctx.generation;
  }
}

void Orchestrator::run_wave(RunContext& ctx, const WavePlan& wave, const ResolvedPorts& ports,
                            std::vector<Ticket>& follow_ups,
                            std::vector<ReviewVerdict>& generation_verdicts) {
  ctx.stats.waves.fetch_add(1, std::memory_order_relaxed);
  const std::string wave_id = std::to_string(wave.index);

  std::vector<Ticket> tickets;
  tickets.reserve(wave.tickets.size());
  for (const auto& id : wave.tickets) {
    ctx.graph.set_status(id, TicketStatus::in_progress, "wave " + wave_id);
    tickets.push_back(*ctx.graph.get(id));
  }
  ctx.events.publish(make_event(EventType::wave_started, wave_id,
                                {{"generation", std::to_string(ctx.generation)},
                                 {"size", std::to_string(tickets.size())},
                                 {"tickets", join(wave.tickets, ",")}}));

  std::map<std::string, ExecutionResult> results =
      ctx.coordinator->run_wave(tickets, ports.implementer, ctx.config.max_runners);

  size_t succeeded = 0;
  for (const auto& [id, r] : results) {
    if (r.success) ++succeeded;
  }
  ctx.events.publish(make_event(EventType::wave_ended, wave_id,
                                {{"size", std::to_string(results.size())},
                                 {"succeeded", std::to_string(succeeded)}}));

  for (const auto& id : wave.tickets) {
    auto it = results.find(id);
    ExecutionResult r;
    if (it != results.end()) {
      r = std::move(it->second);
    } else {
      r.ticket_id = id;
      r.error_code = to_string(ErrorCode::internal_error);
      r.error_message = "no result recorded";
    }
    apply_result(ctx, id, std::move(r), *ports.reviewer, follow_ups, generation_verdicts);
  }
}

void Orchestrator::apply_result(RunContext& ctx, const std::string& id, ExecutionResult result,
                                ReviewerPort& reviewer, std::vector<Ticket>& follow_ups,
                                std::vector<ReviewVerdict>& generation_verdicts) {
  ctx.graph.assign_runner(id, result.runner_id);
  if (!result.criteria.empty()) ctx.graph.apply_criteria(id, result.criteria);

  if (result.cancelled) {
    ctx.graph.set_status(id, TicketStatus::cancelled, result.error_message);
    ctx.results[id] = std::move(result);
    return;
  }

  if (!result.success) {
    ctx.graph.set_status(id, TicketStatus::failed, result_reason(result));
    ReviewVerdict verdict = review(ctx, reviewer, id, result);
    for (auto& t : verdict.follow_ups) follow_ups.push_back(t);
    generation_verdicts.push_back(verdict);
    ctx.verdicts[id] = std::move(verdict);
    ctx.results[id] = std::move(result);
    return;
  }

  ctx.graph.set_status(id, TicketStatus::needs_review);
  ReviewVerdict verdict = review(ctx, reviewer, id, result);
  if (verdict.approved) {
    ctx.graph.set_status(id, TicketStatus::approved,
                         "approved (score " + format_score(verdict.alignment_score) + ")");
    ctx.completed.insert(id);
  } else {
    ctx.graph.set_status(id, TicketStatus::rejected,
                         to_string(ErrorCode::review_rejection) + ": score " +
                             format_score(verdict.alignment_score));
  }
  for (auto& t : verdict.follow_ups) follow_ups.push_back(t);
  generation_verdicts.push_back(verdict);
  ctx.verdicts[id] = std::move(verdict);
  ctx.results[id] = std::move(result);
}

ReviewVerdict Orchestrator::review(RunContext& ctx, ReviewerPort& reviewer, const std::string& id,
                                   const ExecutionResult& result) {
  const Ticket& ticket = *ctx.graph.get(id);
  ReviewVerdict verdict;
  try {
    verdict = reviewer.review(ticket, result);
  } catch (const std::exception& e) {
    verdict = ReviewVerdict{};
    verdict.feedback = std::string("review failed: reviewer threw: ") + e.what();
  } catch (...) {
    verdict = ReviewVerdict{};
    verdict.feedback = std::string("review failed: reviewer threw: ") + kUnknownException;
  }
  verdict.ticket_id = id;
  // Approval is only meaningful for a successful execution.
  if (!result.success) verdict.approved = false;

  ctx.stats.record_verdict(verdict.approved);
  ctx.audit.record_verdict(ctx.run_id, verdict);
  ctx.all_verdicts.push_back(verdict);
  ctx.events.publish(make_event(EventType::review_verdict, id,
                                {{"approved", verdict.approved ? "true" : "false"},
                                 {"alignment_score", format_score(verdict.alignment_score)},
                                 {"follow_ups", std::to_string(verdict.follow_ups.size())}}));
  return verdict;
}

// ---------------------------------------------------------------------------
// INTEGRATING
// ---------------------------------------------------------------------------

void Orchestrator::integrate(RunContext& ctx, const ResolvedPorts& ports, RunReport& report) {
  set_phase(ctx, RunPhase::integrating);

  std::vector<ExecutionResult> approved;
  for (const auto& t : ctx.graph.tickets()) {
    if (t.status != TicketStatus::approved) continue;
    auto it = ctx.results.find(t.id);
    if (it != ctx.results.end()) approved.push_back(it->second);
  }

  IntegrationOutcome outcome = ports.integrator->integrate(approved);
  if (!outcome.ok && outcome.error_message.empty()) {
    outcome.error_message = to_string(ErrorCode::integration_failure);
  }
  report.integration = std::move(outcome);
  report.final_test = ports.final_test->run(ctx.config.repo_path);

  set_phase(ctx, RunPhase::completed);
}

// ---------------------------------------------------------------------------
// Phase bookkeeping
// ---------------------------------------------------------------------------

void Orchestrator::set_phase(RunContext& ctx, RunPhase phase) {
  const RunPhase from = ctx.phase;
  if (from == phase) return;
  ctx.phase = phase;
  phase_.store(phase, std::memory_order_release);
  ctx.events.publish(make_event(EventType::run_phase_changed, ctx.run_id,
                                {{"from", to_string(from)}, {"to", to_string(phase)}}));
  ctx.audit.record_phase(ctx.run_id, to_string(phase));
}

void Orchestrator::fail(RunContext& ctx, ErrorCode code, const std::string& reason) {
  if (ctx.error_code == ErrorCode::none) {
    ctx.error_code = code;
    ctx.fatal_reason = reason;
  }
  set_phase(ctx, RunPhase::failed);
}

// Tickets left mid-flight by an exception are closed so the report shows a
// terminal status for everything that was dispatched.
void Orchestrator::fail_in_flight(RunContext& ctx, const std::string& reason) {
  std::vector<std::string> in_progress;
  std::vector<std::string> in_review;
  for (const auto& t : ctx.graph.tickets()) {
    if (t.status == TicketStatus::in_progress) in_progress.push_back(t.id);
    if (t.status == TicketStatus::needs_review) in_review.push_back(t.id);
  }
  for (const auto& id : in_progress) ctx.graph.set_status(id, TicketStatus::failed, reason);
  for (const auto& id : in_review) ctx.graph.set_status(id, TicketStatus::rejected, reason);
}

// ---------------------------------------------------------------------------
// Report
// ---------------------------------------------------------------------------

RunReport Orchestrator::build_report(RunContext& ctx, RunReport report) const {
  report.run_id = ctx.run_id;
  report.phase = ctx.phase;
  report.error_code = ctx.error_code;
  report.fatal_reason = ctx.fatal_reason;
  report.stopped = ctx.stopped;
  report.snapshot_digest = ctx.snapshot.digest;
  report.waves = ctx.graph.waves_planned();
  report.generations = ctx.generations;
  report.review = summarize(ctx.all_verdicts);

  if (!ctx.planning_failed) {
    double score_sum = 0.0;
    size_t scored = 0;
    for (const auto& t : ctx.graph.tickets()) {
      TicketReportRow row;
      row.id = t.id;
      row.title = t.title;
      row.status = t.status;
      row.reason = ctx.graph.reason_of(t.id);
      row.wave = ctx.graph.wave_of(t.id);
      row.generation = t.generation;
      row.parent_id = t.parent_id();
      row.runner_id = t.assigned_runner;
      if (auto v = ctx.verdicts.find(t.id); v != ctx.verdicts.end()) {
        row.alignment_score = v->second.alignment_score;
        score_sum += v->second.alignment_score;
        ++scored;
      }
      if (auto r = ctx.results.find(t.id); r != ctx.results.end()) {
        row.error_code = r->second.error_code;
        row.duration_ms = r->second.duration_ms;
      }
      report.tickets.push_back(std::move(row));
    }
    if (scored > 0) report.aggregate_alignment = score_sum / static_cast<double>(scored);
    for (const auto& [status, n] : ctx.graph.count_by_status()) {
      report.counts_by_status[to_string(status)] = n;
    }
  }

  report.success = report.phase == RunPhase::completed && report.integration &&
                   report.integration->ok && report.final_test && report.final_test->passed &&
                   report.review.approval_rate >= ctx.config.success_approval_rate;

  ctx.events.flush();
  report.events_published = ctx.events.published();
  report.events_dropped = ctx.events.dropped();
  report.audit_records = ctx.audit.entry_count();
  report.audit_failures = ctx.audit.failure_count();
  report.audit_head = ctx.audit.enabled() ? ctx.audit.last_digest() : "";
  report.stats_json = ctx.stats.to_json();
  return report;
}

}  // namespace conclave
