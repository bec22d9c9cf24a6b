#pragma once

// conclave/coordinator.hpp — Bounded worker pool for one wave of tickets.
//
// DESIGN:
//   run_wave() starts min(pool_size, |tickets|) worker threads that pull
//   tickets from a FIFO queue in wave order. For each ticket a worker:
//     1. acquires a SandboxLease (failure -> sandbox_acquisition_failed),
//     2. calls the implementer on a dedicated invocation thread,
//     3. waits on the ticket's condition variable for completion,
//        cancellation or the ticket deadline,
//     4. releases the lease, then records the ExecutionResult.
//   The calling thread blocks on a count-down barrier until every ticket has a
//   result, then joins the workers.
//
// INVARIANTS:
//   - A cancelled or timed-out ticket is terminal once cancel_grace_ms has
//     passed. An invocation still running then is detached (abandoned) and
//     counted in RunStats::abandoned_invocations; the barrier never waits on it.
//     Its execution_log callback is disconnected at that point.
//   - Cancellation is scoped to one ticket. Siblings keep running.
//   - A ticket cancelled before a worker picks it up never acquires a sandbox.
//   - No retries.
//
// EXTENSION_POINT: warm_worker_pool
//   Current: threads are created per wave and joined after the barrier.
//   Upgrade path: a persistent pool fed per wave. The barrier semantics above
//   (every ticket terminal before run_wave returns) must be kept.

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "conclave/observability.hpp"
#include "conclave/ports.hpp"
#include "conclave/sandbox.hpp"

namespace conclave {

struct CoordinatorOptions {
  uint64_t ticket_timeout_ms{300000};
  uint64_t cancel_grace_ms{1000};
  std::string objective;
  std::vector<std::string> constraints;
};

// Count-down latch: wait() returns once count_down() was called `count` times.
class WaveBarrier {
 public:
  explicit WaveBarrier(size_t count) : remaining_(count) {}
  void count_down();
  void wait();

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  size_t remaining_;
};

class ExecutionCoordinator {
 public:
  // `events` and `stats` are not owned and may be null. `sandboxes` must
  // outlive the coordinator.
  ExecutionCoordinator(SandboxManager& sandboxes, BaseSnapshot snapshot, CoordinatorOptions options,
                       EventSink* events = nullptr, RunStats* stats = nullptr);

  ExecutionCoordinator(const ExecutionCoordinator&) = delete;
  ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

  // Blocks until every ticket has a result. Results are keyed by ticket id.
  std::map<std::string, ExecutionResult> run_wave(const std::vector<Ticket>& tickets,
                                                  std::shared_ptr<ImplementerPort> implementer,
                                                  uint32_t pool_size);

  // Thread-safe. Returns true if the ticket belongs to the running wave. A
  // ticket not yet in a wave is remembered and cancelled when its wave starts.
  bool cancel(const std::string& ticket_id, const std::string& reason = "cancelled");

  // Cancels every ticket of the running wave and every ticket of later waves.
  void cancel_all(const std::string& reason);

  bool stopped() const;

 private:
  struct TicketControl;

  ExecutionResult execute(const Ticket& ticket, const std::shared_ptr<TicketControl>& ctl,
                          const std::shared_ptr<ImplementerPort>& implementer,
                          const std::string& runner_id);
  void finalize(ExecutionResult& r, const Ticket& ticket, const std::string& runner_id,
                uint64_t duration_ms) const;

  SandboxManager& sandboxes_;
  const BaseSnapshot snapshot_;
  const CoordinatorOptions options_;
  EventSink* events_;
  RunStats* stats_;

  mutable std::mutex controls_mu_;
  std::map<std::string, std::shared_ptr<TicketControl>> controls_;  // running wave only
  std::map<std::string, std::string> pending_cancels_;              // id -> reason
  bool stopped_{false};
  std::string stop_reason_;
};

}  // namespace conclave
