#include "conclave/coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <exception>
#include <system_error>
#include <thread>

#include "conclave/hash.hpp"

namespace conclave {

// ---------------------------------------------------------------------------
// CancelToken
// ---------------------------------------------------------------------------

bool CancelToken::cancelled() const {
  std::lock_guard<std::mutex> lk(state_->mu);
  return state_->cancelled;
}

std::string CancelToken::reason() const {
  std::lock_guard<std::mutex> lk(state_->mu);
  return state_->reason;
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(state_->mu);
  return state_->cv.wait_for(lk, timeout, [this] { return state_->cancelled; });
}

bool CancelToken::cancel(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lk(state_->mu);
    if (state_->cancelled) return false;
    state_->cancelled = true;
    state_->reason = reason;
  }
  state_->cv.notify_all();
  return true;
}

// ---------------------------------------------------------------------------
// WaveBarrier
// ---------------------------------------------------------------------------

void WaveBarrier::count_down() {
  std::lock_guard<std::mutex> lk(mu_);
  if (remaining_ > 0 && --remaining_ == 0) cv_.notify_all();
}

void WaveBarrier::wait() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return remaining_ == 0; });
}

// ---------------------------------------------------------------------------
// ExecutionCoordinator
// ---------------------------------------------------------------------------

// Shared between the worker, the invocation thread and cancel(). Outlives the
// wave when an invocation is abandoned.
struct ExecutionCoordinator::TicketControl {
  CancelToken token;
  std::mutex mu;
  std::condition_variable cv;
  bool interrupted{false};  // cancel() observed; guarded by mu
  bool done{false};         // invocation returned; guarded by mu
  bool log_open{true};      // execution_log callback connected; guarded by mu
  ExecutionResult result;   // valid once done
  std::string exception_text;
  bool threw{false};
};

namespace {

using Clock = std::chrono::steady_clock;

uint64_t elapsed_ms(Clock::time_point start) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
}

ExecutionResult failure(ErrorCode code, std::string message) {
  ExecutionResult r;
  r.success = false;
  r.error_code = to_string(code);
  r.error_message = std::move(message);
  return r;
}

ExecutionResult cancelled_result(const std::string& reason) {
  ExecutionResult r = failure(ErrorCode::cancelled, "cancelled: " + reason);
  r.cancelled = true;
  return r;
}

}  // namespace

ExecutionCoordinator::ExecutionCoordinator(SandboxManager& sandboxes, BaseSnapshot snapshot,
                                           CoordinatorOptions options, EventSink* events,
                                           RunStats* stats)
    : sandboxes_(sandboxes),
      snapshot_(std::move(snapshot)),
      options_(std::move(options)),
      events_(events),
      stats_(stats) {}

bool ExecutionCoordinator::cancel(const std::string& ticket_id, const std::string& reason) {
  std::shared_ptr<TicketControl> ctl;
  {
    std::lock_guard<std::mutex> lk(controls_mu_);
    auto it = controls_.find(ticket_id);
    if (it == controls_.end()) {
      pending_cancels_.emplace(ticket_id, reason);
      return false;
    }
    ctl = it->second;
  }
  ctl->token.cancel(reason);
  {
    std::lock_guard<std::mutex> lk(ctl->mu);
    ctl->interrupted = true;
  }
  ctl->cv.notify_all();
  return true;
}

void ExecutionCoordinator::cancel_all(const std::string& reason) {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lk(controls_mu_);
    stopped_ = true;
    stop_reason_ = reason;
    for (const auto& [id, ctl] : controls_) ids.push_back(id);
  }
  for (const auto& id : ids) cancel(id, reason);
}

bool ExecutionCoordinator::stopped() const {
  std::lock_guard<std::mutex> lk(controls_mu_);
  return stopped_;
}

std::map<std::string, ExecutionResult> ExecutionCoordinator::run_wave(
    const std::vector<Ticket>& tickets, std::shared_ptr<ImplementerPort> implementer,
    uint32_t pool_size) {
  std::map<std::string, ExecutionResult> out;
  if (tickets.empty()) return out;

  std::vector<std::shared_ptr<TicketControl>> controls;
  controls.reserve(tickets.size());
  {
    std::lock_guard<std::mutex> lk(controls_mu_);
    for (const auto& t : tickets) {
      auto ctl = std::make_shared<TicketControl>();
      std::string reason;
      if (stopped_) {
        reason = stop_reason_;
      } else if (auto it = pending_cancels_.find(t.id); it != pending_cancels_.end()) {
        reason = it->second;
        pending_cancels_.erase(it);
      }
      if (!reason.empty()) {
        ctl->token.cancel(reason);
        ctl->interrupted = true;
      }
      controls_[t.id] = ctl;
      controls.push_back(std::move(ctl));
    }
  }

  std::vector<ExecutionResult> results(tickets.size());
  std::mutex queue_mu;
  std::deque<size_t> queue;
  for (size_t i = 0; i < tickets.size(); ++i) queue.push_back(i);
  WaveBarrier barrier(tickets.size());

  auto worker_loop = [&](const std::string& runner_id) {
    for (;;) {
      size_t idx = 0;
      {
        std::lock_guard<std::mutex> lk(queue_mu);
        if (queue.empty()) return;
        idx = queue.front();
        queue.pop_front();
      }
      // Every ticket gets a result and a count_down(), whatever execute() does.
      try {
        results[idx] = execute(tickets[idx], controls[idx], implementer, runner_id);
      } catch (const std::exception& e) {
        results[idx] = failure(ErrorCode::execution_failure,
                               std::string("execution aborted: ") + e.what());
        finalize(results[idx], tickets[idx], runner_id, 0);
      } catch (...) {
        results[idx] = failure(ErrorCode::execution_failure,
                               "execution aborted: non-standard exception");
        finalize(results[idx], tickets[idx], runner_id, 0);
      }
      if (stats_) stats_->record_execution(results[idx]);
      barrier.count_down();
    }
  };

  const size_t workers_wanted = std::min<size_t>(std::max<uint32_t>(pool_size, 1), tickets.size());
  std::vector<std::thread> workers;
  workers.reserve(workers_wanted);
  for (size_t w = 0; w < workers_wanted; ++w) {
    try {
      workers.emplace_back(worker_loop, "runner-" + std::to_string(w + 1));
    } catch (const std::system_error&) {
      break;  // run with the workers we have
    }
  }
  if (workers.empty()) worker_loop("runner-inline");

  barrier.wait();
  for (auto& w : workers) w.join();

  {
    std::lock_guard<std::mutex> lk(controls_mu_);
    for (const auto& t : tickets) controls_.erase(t.id);
  }
  for (size_t i = 0; i < tickets.size(); ++i) out[tickets[i].id] = std::move(results[i]);
  return out;
}

ExecutionResult ExecutionCoordinator::execute(const Ticket& ticket,
                                              const std::shared_ptr<TicketControl>& ctl,
                                              const std::shared_ptr<ImplementerPort>& implementer,
                                              const std::string& runner_id) {
  const auto start = Clock::now();

  if (ctl->token.cancelled()) {
    ExecutionResult r = cancelled_result(ctl->token.reason());
    r.error_message = "cancelled before start: " + ctl->token.reason();
    finalize(r, ticket, runner_id, 0);
    return r;
  }
  if (!implementer) {
    ExecutionResult r = failure(ErrorCode::execution_failure, "no implementer configured");
    finalize(r, ticket, runner_id, 0);
    return r;
  }

  AcquireResult acquired = sandboxes_.acquire(ticket.id, snapshot_);
  if (!acquired.ok) {
    ExecutionResult r = failure(ErrorCode::sandbox_acquisition_failed, acquired.error_message);
    finalize(r, ticket, runner_id, elapsed_ms(start));
    return r;
  }
  SandboxLease lease = std::move(acquired.lease);

  ImplementerRequest request;
  request.ticket = ticket;
  request.objective = options_.objective;
  request.constraints = options_.constraints;
  request.workspace_path = lease.repo_path();
  request.work_path = lease.work_path();
  request.deadline = start + std::chrono::milliseconds(options_.ticket_timeout_ms);
  request.runner_id = runner_id;
  {
    EventSink* events = events_;
    std::weak_ptr<TicketControl> weak = ctl;
    const std::string ticket_id = ticket.id;
    request.log = [events, weak, ticket_id, runner_id](const std::string& message) {
      auto c = weak.lock();
      if (!c || !events) return;
      std::lock_guard<std::mutex> lk(c->mu);
      if (!c->log_open) return;
      events->publish(make_event(EventType::execution_log, ticket_id,
                                 {{"message", message}, {"runner_id", runner_id}}));
    };
  }

  std::thread invocation;
  try {
    invocation = std::thread([implementer, request, ctl]() {
      ExecutionResult r;
      std::string what;
      bool threw = false;
      try {
        r = implementer->implement(request, ctl->token);
      } catch (const std::exception& e) {
        threw = true;
        what = e.what();
      } catch (...) {
        threw = true;
        what = "non-standard exception";
      }
      {
        std::lock_guard<std::mutex> lk(ctl->mu);
        ctl->result = std::move(r);
        ctl->threw = threw;
        ctl->exception_text = std::move(what);
        ctl->done = true;
      }
      ctl->cv.notify_all();
    });
  } catch (const std::system_error& e) {
    lease.release();
    ExecutionResult r =
        failure(ErrorCode::execution_failure, std::string("cannot start invocation: ") + e.what());
    finalize(r, ticket, runner_id, elapsed_ms(start));
    return r;
  }

  bool timed_out = false;
  bool interrupted = false;
  bool done = false;
  {
    std::unique_lock<std::mutex> lk(ctl->mu);
    ctl->cv.wait_until(lk, request.deadline, [&] { return ctl->done || ctl->interrupted; });
    interrupted = ctl->interrupted;
    done = ctl->done;
  }
  if (!done && !interrupted) {
    timed_out = true;
    ctl->token.cancel("timeout");
  }
  if (!done) {
    std::unique_lock<std::mutex> lk(ctl->mu);
    ctl->cv.wait_for(lk, std::chrono::milliseconds(options_.cancel_grace_ms),
                     [&] { return ctl->done; });
    done = ctl->done;
    ctl->log_open = done;
  }

  if (done) {
    invocation.join();
  } else {
    invocation.detach();
    if (stats_) stats_->abandoned_invocations.fetch_add(1, std::memory_order_relaxed);
  }

  lease.release();
  const uint64_t duration = elapsed_ms(start);

  ExecutionResult r;
  if (interrupted) {
    r = cancelled_result(ctl->token.reason());
    if (done) r.logs = ctl->result.logs;
  } else if (timed_out) {
    r = failure(ErrorCode::execution_timeout,
                "exceeded ticket timeout of " + std::to_string(options_.ticket_timeout_ms) + "ms");
    if (done) r.logs = ctl->result.logs;
  } else if (ctl->threw) {
    r = failure(ErrorCode::execution_failure, "implementer threw: " + ctl->exception_text);
  } else {
    r = std::move(ctl->result);
    if (!r.success && r.error_code.empty()) r.error_code = to_string(ErrorCode::execution_failure);
    if (r.success) {
      r.error_code.clear();
      r.error_message.clear();
    }
    r.cancelled = false;
  }
  finalize(r, ticket, runner_id, duration);
  return r;
}

void ExecutionCoordinator::finalize(ExecutionResult& r, const Ticket& ticket,
                                    const std::string& runner_id, uint64_t duration_ms) const {
  r.ticket_id = ticket.id;
  r.runner_id = runner_id;
  r.duration_ms = duration_ms;
  r.diff_digest = r.diff.empty() ? std::string() : diff_digest(r.diff);
}

}  // namespace conclave
