#pragma once

// conclave/observability.hpp — Lifecycle events and run statistics.
//
// DESIGN:
//   LifecycleEvent is the canonical observable unit. Components never write to
//   stdout/stderr; they publish events to an EventSink. The orchestrator owns an
//   EventBus that fans each event out to its subscribers:
//     - JsonlEventSink: one JSON object per line, appended to event_log_path
//       (CONCLAVE_EVENT_LOG).
//     - RecentEventsSink: bounded in-memory ring, for embedding hosts and tests.
//     - Any host sink (dashboard, TUI) implementing EventSink.
//
// INVARIANTS:
//   - EventBus::publish() never blocks on a subscriber. Events are queued and
//     delivered by a single dispatcher thread, so a subscriber sees events in
//     seq order.
//   - The queue is bounded. When full, the oldest queued event is dropped and
//     dropped() is incremented.
//   - seq is assigned by the bus under the queue lock: strictly increasing,
//     starting at 1.
//
// EXTENSION_POINT: remote_event_export
//   Current: JSONL file or in-process sinks.
//   Upgrade path: an EventSink that batches events to a collector. It must keep
//   publish() non-blocking and carry only ids, statuses and digests, never diffs.

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "conclave/types.hpp"

namespace conclave {

enum class EventType {
  ticket_created,
  ticket_status_changed,
  wave_started,
  wave_ended,
  execution_log,
  review_verdict,
  run_phase_changed,
};

std::string to_string(EventType t);

struct LifecycleEvent {
  uint64_t seq{0};                // assigned by EventBus
  uint64_t timestamp_unix_ms{0};  // filled by EventBus when 0
  EventType type{EventType::ticket_created};
  std::string entity_id;          // ticket id, wave index or run id
  std::map<std::string, std::string> data;
};

LifecycleEvent make_event(EventType type, std::string entity_id,
                          std::map<std::string, std::string> data = {});

// {"data":{...},"entity_id":"...","schema":1,"seq":N,"t":N,"type":"..."}
std::string event_to_json(const LifecycleEvent& ev);

class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const LifecycleEvent& ev) = 0;
};

// ---------------------------------------------------------------------------
// EventBus — bounded, non-blocking fan-out
// ---------------------------------------------------------------------------
class EventBus : public EventSink {
 public:
  static constexpr size_t kDefaultCapacity = 4096;

  explicit EventBus(size_t capacity = kDefaultCapacity);
  ~EventBus() override;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  void subscribe(std::shared_ptr<EventSink> sink);

  void publish(const LifecycleEvent& ev) override;

  // Blocks until every event queued before the call has been delivered.
  void flush();

  // Delivers what is queued, then stops the dispatcher. Later publishes are
  // counted as dropped. Idempotent.
  void shutdown();

  uint64_t published() const { return published_.load(std::memory_order_relaxed); }
  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
  uint64_t sink_errors() const { return sink_errors_.load(std::memory_order_relaxed); }

 private:
  void dispatch_loop();

  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;       // dispatcher wakeup
  std::condition_variable idle_cv_;  // flush() wakeup
  std::deque<LifecycleEvent> queue_;
  std::vector<std::shared_ptr<EventSink>> sinks_;
  uint64_t next_seq_{1};
  uint64_t delivered_seq_{0};
  bool stopping_{false};
  bool dispatcher_done_{false};
  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> sink_errors_{0};
  std::thread dispatcher_;
};

// Appends event_to_json lines to a file. The file is opened per event in
// append mode; a failed open or write only increments write_failures().
class JsonlEventSink : public EventSink {
 public:
  explicit JsonlEventSink(std::string path) : path_(std::move(path)) {}
  void publish(const LifecycleEvent& ev) override;

  const std::string& path() const { return path_; }
  uint64_t write_failures() const { return write_failures_.load(std::memory_order_relaxed); }

 private:
  std::string path_;
  std::mutex mu_;
  std::atomic<uint64_t> write_failures_{0};
};

// Keeps the last `capacity` events. O(1) circular overwrite.
class RecentEventsSink : public EventSink {
 public:
  explicit RecentEventsSink(size_t capacity = 1000) : capacity_(capacity == 0 ? 1 : capacity) {}
  void publish(const LifecycleEvent& ev) override;

  // Oldest first.
  std::vector<LifecycleEvent> snapshot() const;

 private:
  const size_t capacity_;
  mutable std::mutex mu_;
  std::vector<LifecycleEvent> ring_;
  size_t head_{0};  // next slot to overwrite once full
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Bucket boundaries are part of RunStats::to_json() output; changing them
// requires a bump of EVENT_SCHEMA_VERSION.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;  // top bucket reaches ~6 days

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 without samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// RunStats — per-run counters
// ---------------------------------------------------------------------------
// Thread-safe. Owned by RunContext; workers update it concurrently.
class RunStats {
 public:
  // Called once per recorded ExecutionResult.
  void record_execution(const ExecutionResult& r);
  void record_failure(ErrorCode code);
  void record_verdict(bool approved);

  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> executions{0};
  alignas(64) std::atomic<uint64_t> successes{0};
  alignas(64) std::atomic<uint64_t> failures{0};
  alignas(64) std::atomic<uint64_t> timeouts{0};
  alignas(64) std::atomic<uint64_t> cancellations{0};
  alignas(64) std::atomic<uint64_t> sandbox_failures{0};
  alignas(64) std::atomic<uint64_t> abandoned_invocations{0};
  alignas(64) std::atomic<uint64_t> approvals{0};
  alignas(64) std::atomic<uint64_t> rejections{0};
  alignas(64) std::atomic<uint64_t> waves{0};

  LatencyHistogram execution_latency;

  std::map<std::string, uint64_t> failure_categories() const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failure_categories_;
};

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ms;
  explicit ScopeTimer(uint64_t& out) : out_ms(out) {}
  ~ScopeTimer() {
    out_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
  }
};

}  // namespace conclave
