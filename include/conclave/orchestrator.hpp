#pragma once

// conclave/orchestrator.hpp — Run phase state machine.
//
// PHASES:
//   idle -> planning -> executing <-> reviewing -> integrating -> completed
//   Any phase before completed may end in failed.
//
//   planning     validate objective, snapshot repo, plan, add tickets, validate graph
//   executing    next_wave / run_wave / review each result, until no wave is eligible
//   reviewing    summarize the generation; inject follow-ups while
//                generation < max_followup_depth, else park them as pending
//   integrating  integrator once with approved results (creation order),
//                final test once
//
// OWNERSHIP:
//   Every piece of run state lives in a RunContext created by run() and
//   destroyed before run() returns. Orchestrator itself only keeps the config,
//   the ports, and a pointer to the active context for stop()/cancel().
//
// THREADING:
//   run() executes on the calling thread and mutates the graph between waves
//   only. stop(), cancel() and phase() may be called from any thread.
//
// FAILURE:
//   - config, planning and cycle errors end in failed before any dispatch.
//   - A std::exception escaping EXECUTING/REVIEWING/INTEGRATING ends in failed
//     with internal_error; the partial report is still returned.
//   - stop() ends in failed with error_code cancelled. Integration is skipped.

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "conclave/audit.hpp"
#include "conclave/config.hpp"
#include "conclave/coordinator.hpp"
#include "conclave/observability.hpp"
#include "conclave/ports.hpp"
#include "conclave/report.hpp"
#include "conclave/review_gate.hpp"
#include "conclave/sandbox.hpp"
#include "conclave/ticket_graph.hpp"

namespace conclave {

// Null members are replaced at run() time:
//   planner     -> HeuristicPlanner
//   reviewer    -> ReviewGate with the configured approval threshold
//   integrator  -> CommandIntegrator when integrate_command is set, else NullIntegrator
//   final_test  -> CommandFinalTest when final_test_command is set, else NullFinalTest
// The implementer has no default; a run without one fails with config_invalid.
struct OrchestratorPorts {
  std::shared_ptr<PlannerPort> planner;
  std::shared_ptr<ImplementerPort> implementer;
  std::shared_ptr<ReviewerPort> reviewer;
  std::shared_ptr<IntegratorPort> integrator;
  std::shared_ptr<FinalTestPort> final_test;
  std::vector<std::shared_ptr<EventSink>> event_sinks;  // subscribed to every run's bus
};

// Per-run state. Members are declared in dependency order: the coordinator
// references the sandbox manager, the graph publishes into the bus.
struct RunContext {
  RunContext(std::string id, const Objective& obj, const RunConfig& cfg);

  const std::string run_id;
  const Objective objective;
  const RunConfig config;
  EventBus events;
  AuditLog audit;
  RunStats stats;
  TicketGraph graph;
  SandboxManager sandboxes;
  BaseSnapshot snapshot;
  std::unique_ptr<ExecutionCoordinator> coordinator;

  RunPhase phase{RunPhase::idle};
  uint32_t generation{0};
  std::set<std::string> completed;                 // approved ticket ids
  std::map<std::string, ExecutionResult> results;  // latest per ticket
  std::map<std::string, ReviewVerdict> verdicts;   // latest per ticket
  std::vector<ReviewVerdict> all_verdicts;         // review order
  std::vector<GenerationSummary> generations;
  ErrorCode error_code{ErrorCode::none};
  std::string fatal_reason;
  bool planning_failed{false};  // report lists no tickets
  bool stopped{false};
};

class Orchestrator {
 public:
  Orchestrator(RunConfig config, OrchestratorPorts ports);

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Runs one objective to completion. One run at a time per Orchestrator.
  RunReport run(const Objective& objective);

  // No new wave starts; in-flight tickets are cancelled. Tickets never
  // dispatched stay pending with reason "run stopped". A stop requested
  // before run() applies to the next run.
  void stop();

  // Forwards to the coordinator. A ticket that is not running yet is
  // cancelled when its wave starts.
  void cancel(const std::string& ticket_id);

  RunPhase phase() const { return phase_.load(std::memory_order_acquire); }

  const RunConfig& config() const { return config_; }

 private:
  struct ResolvedPorts {
    std::shared_ptr<PlannerPort> planner;
    std::shared_ptr<ImplementerPort> implementer;
    std::shared_ptr<ReviewerPort> reviewer;
    std::shared_ptr<IntegratorPort> integrator;
    std::shared_ptr<FinalTestPort> final_test;
  };

  ResolvedPorts resolve_ports(const Objective& objective) const;

  bool plan(RunContext& ctx, const ResolvedPorts& ports);
  void execute_generations(RunContext& ctx, const ResolvedPorts& ports);
  void run_wave(RunContext& ctx, const WavePlan& wave, const ResolvedPorts& ports,
                std::vector<Ticket>& follow_ups, std::vector<ReviewVerdict>& generation_verdicts);
  void apply_result(RunContext& ctx, const std::string& id, ExecutionResult result,
                    ReviewerPort& reviewer, std::vector<Ticket>& follow_ups,
                    std::vector<ReviewVerdict>& generation_verdicts);
  ReviewVerdict review(RunContext& ctx, ReviewerPort& reviewer, const std::string& id,
                       const ExecutionResult& result);
  void integrate(RunContext& ctx, const ResolvedPorts& ports, RunReport& report);

  void set_phase(RunContext& ctx, RunPhase phase);
  void fail(RunContext& ctx, ErrorCode code, const std::string& reason);
  void fail_in_flight(RunContext& ctx, const std::string& reason);
  bool stop_requested() const;

  RunReport build_report(RunContext& ctx, RunReport report) const;

  const RunConfig config_;
  const OrchestratorPorts ports_;
  std::atomic<RunPhase> phase_{RunPhase::idle};

  mutable std::mutex mu_;
  RunContext* active_{nullptr};
  bool stop_requested_{false};
  std::vector<std::string> early_cancels_;  // before the coordinator exists
};

}  // namespace conclave
