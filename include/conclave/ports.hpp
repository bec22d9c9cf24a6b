#pragma once

// conclave/ports.hpp — Interfaces to the engine's external collaborators.
//
// DESIGN:
//   The orchestrator talks to everything it does not own through these narrow
//   abstract classes, injected at construction via OrchestratorPorts. Swapping
//   a planner, implementer or integrator means passing another implementation.
//
// THREADING:
//   - PlannerPort, ReviewerPort, IntegratorPort and FinalTestPort are called
//     from the orchestrator thread only.
//   - ImplementerPort::implement() is called concurrently from invocation
//     threads, one per in-flight ticket. An invocation that outlives its
//     cancellation grace period is abandoned: the implementer object must stay
//     valid (it is held by shared_ptr) and must not touch the sandbox paths
//     after observing cancellation.
//
// ERRORS:
//   Ports report failures in their result structs. An exception escaping a
//   port is caught at the boundary and converted into an error code.

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "conclave/sandbox.hpp"
#include "conclave/types.hpp"

namespace conclave {

// Shared cancellation flag. Copies share state; the first cancel() wins.
class CancelToken {
 public:
  CancelToken() : state_(std::make_shared<State>()) {}

  bool cancelled() const;
  std::string reason() const;  // "" until cancelled; "timeout", "cancelled", "run stopped"

  // Waits up to `timeout`. Returns true when cancelled (possibly earlier).
  bool wait_for(std::chrono::milliseconds timeout) const;

  // Returns false if the token was already cancelled.
  bool cancel(const std::string& reason);

 private:
  struct State {
    mutable std::mutex mu;
    std::condition_variable cv;
    bool cancelled{false};
    std::string reason;
  };
  std::shared_ptr<State> state_;
};

struct PlanResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  std::vector<Ticket> tickets;
};

class PlannerPort {
 public:
  virtual ~PlannerPort() = default;
  virtual PlanResult plan(const Objective& objective, const BaseSnapshot& snapshot) = 0;
};

struct ImplementerRequest {
  Ticket ticket;
  std::string objective;
  std::vector<std::string> constraints;
  std::string workspace_path;  // sandbox copy of the repository
  std::string work_path;       // private scratch directory
  std::chrono::steady_clock::time_point deadline;
  std::string runner_id;
  // Publishes an execution_log event for this ticket. Safe from any thread.
  std::function<void(const std::string&)> log;
};

class ImplementerPort {
 public:
  virtual ~ImplementerPort() = default;
  virtual ExecutionResult implement(const ImplementerRequest& request, const CancelToken& cancel) = 0;
};

class ReviewerPort {
 public:
  virtual ~ReviewerPort() = default;
  virtual ReviewVerdict review(const Ticket& ticket, const ExecutionResult& result) = 0;
};

struct IntegrationOutcome {
  bool ok{false};
  std::vector<std::string> applied;  // ticket ids, in application order
  std::vector<std::string> log;
  std::string error_message;
};

class IntegratorPort {
 public:
  virtual ~IntegratorPort() = default;
  // Approved results in ticket creation order. Called once per run.
  virtual IntegrationOutcome integrate(const std::vector<ExecutionResult>& approved) = 0;
};

struct FinalTestOutcome {
  bool passed{false};
  std::string summary;
};

class FinalTestPort {
 public:
  virtual ~FinalTestPort() = default;
  // Called once per run, after integration.
  virtual FinalTestOutcome run(const std::string& repo_path) = 0;
};

}  // namespace conclave
