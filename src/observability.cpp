#include "conclave/observability.hpp"

#include <bit>
#include <cstdio>
#include <exception>

#include "conclave/jsonlite.hpp"
#include "conclave/version.hpp"

namespace conclave {

namespace {

// bit_width gives floor(log2(x)) + 1, which is the bucket index for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

std::string to_string(EventType t) {
  switch (t) {
    case EventType::ticket_created: return "ticket_created";
    case EventType::ticket_status_changed: return "ticket_status_changed";
    case EventType::wave_started: return "wave_started";
    case EventType::wave_ended: return "wave_ended";
    case EventType::execution_log: return "execution_log";
    case EventType::review_verdict: return "review_verdict";
    case EventType::run_phase_changed: return "run_phase_changed";
  }
  return "unknown";
}

LifecycleEvent make_event(EventType type, std::string entity_id,
                          std::map<std::string, std::string> data) {
  LifecycleEvent ev;
  ev.type = type;
  ev.entity_id = std::move(entity_id);
  ev.data = std::move(data);
  return ev;
}

std::string event_to_json(const LifecycleEvent& ev) {
  jsonlite::Object o;
  o["schema"] = static_cast<std::uint64_t>(version::EVENT_SCHEMA_VERSION);
  o["seq"] = ev.seq;
  o["t"] = ev.timestamp_unix_ms;
  o["type"] = to_string(ev.type);
  o["entity_id"] = ev.entity_id;
  jsonlite::Object data;
  for (const auto& [k, v] : ev.data) data[k] = v;
  o["data"] = std::move(data);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// EventBus
// ---------------------------------------------------------------------------

EventBus::EventBus(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), dispatcher_([this] { dispatch_loop(); }) {}

EventBus::~EventBus() { shutdown(); }

void EventBus::subscribe(std::shared_ptr<EventSink> sink) {
  if (!sink) return;
  std::lock_guard<std::mutex> lk(mu_);
  sinks_.push_back(std::move(sink));
}

void EventBus::publish(const LifecycleEvent& ev) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    if (queue_.size() >= capacity_) {
      // Drop-oldest. The dropped seq still counts as delivered for flush().
      delivered_seq_ = queue_.front().seq;
      queue_.pop_front();
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
    LifecycleEvent copy = ev;
    copy.seq = next_seq_++;
    if (copy.timestamp_unix_ms == 0) copy.timestamp_unix_ms = now_unix_ms();
    queue_.push_back(std::move(copy));
  }
  published_.fetch_add(1, std::memory_order_relaxed);
  cv_.notify_one();
}

void EventBus::flush() {
  std::unique_lock<std::mutex> lk(mu_);
  const uint64_t target = next_seq_ - 1;
  idle_cv_.wait(lk, [&] { return delivered_seq_ >= target || dispatcher_done_; });
}

void EventBus::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) return;
    stopping_ = true;
  }
  cv_.notify_all();
  if (dispatcher_.joinable()) dispatcher_.join();
}

void EventBus::dispatch_loop() {
  std::unique_lock<std::mutex> lk(mu_);
  for (;;) {
    cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) {
      if (stopping_) {
        dispatcher_done_ = true;
        idle_cv_.notify_all();
        return;
      }
      continue;
    }
    LifecycleEvent ev = std::move(queue_.front());
    queue_.pop_front();
    std::vector<std::shared_ptr<EventSink>> sinks = sinks_;
    lk.unlock();

    for (const auto& sink : sinks) {
      try {
        sink->publish(ev);
      } catch (const std::exception&) {
        sink_errors_.fetch_add(1, std::memory_order_relaxed);
      }
    }

    lk.lock();
    if (ev.seq > delivered_seq_) delivered_seq_ = ev.seq;
    idle_cv_.notify_all();
  }
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

void JsonlEventSink::publish(const LifecycleEvent& ev) {
  std::string line = event_to_json(ev);
  line += '\n';
  std::lock_guard<std::mutex> lk(mu_);
  FILE* f = std::fopen(path_.c_str(), "a");
  if (!f) {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  const size_t n = std::fwrite(line.data(), 1, line.size(), f);
  if (std::fclose(f) != 0 || n != line.size()) {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
  }
}

void RecentEventsSink::publish(const LifecycleEvent& ev) {
  std::lock_guard<std::mutex> lk(mu_);
  if (ring_.size() < capacity_) {
    ring_.push_back(ev);
    return;
  }
  ring_[head_] = ev;
  head_ = (head_ + 1) % capacity_;
}

std::vector<LifecycleEvent> RecentEventsSink::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<LifecycleEvent> out;
  out.reserve(ring_.size());
  for (size_t i = 0; i < ring_.size(); ++i) {
    out.push_back(ring_[(head_ + i) % ring_.size()]);
  }
  return out;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target && cumulative > 0) {
      // Midpoint of [2^(i-1), 2^i) us; bucket 0 reports 0.5us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"count\":";
  out += std::to_string(count_.load(std::memory_order_relaxed));
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  const double p50 = percentile(0.50);
  const double p95 = percentile(0.95);
  const double p99 = percentile(0.99);
  out += ",\"p50_ms\":";
  append_fixed(out, "%.3f", p50 / 1000.0);
  out += ",\"p95_ms\":";
  append_fixed(out, "%.3f", p95 / 1000.0);
  out += ",\"p99_ms\":";
  append_fixed(out, "%.3f", p99 / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// RunStats
// ---------------------------------------------------------------------------

void RunStats::record_execution(const ExecutionResult& r) {
  executions.fetch_add(1, std::memory_order_relaxed);
  if (r.success) {
    successes.fetch_add(1, std::memory_order_relaxed);
  } else if (r.cancelled) {
    cancellations.fetch_add(1, std::memory_order_relaxed);
  } else {
    failures.fetch_add(1, std::memory_order_relaxed);
    const ErrorCode code = error_code_from_string(r.error_code);
    if (code == ErrorCode::execution_timeout) {
      timeouts.fetch_add(1, std::memory_order_relaxed);
    } else if (code == ErrorCode::sandbox_acquisition_failed) {
      sandbox_failures.fetch_add(1, std::memory_order_relaxed);
    }
    record_failure(code == ErrorCode::none ? ErrorCode::execution_failure : code);
  }
  execution_latency.record(r.duration_ms * 1000000ULL);
}

void RunStats::record_failure(ErrorCode code) {
  std::lock_guard<std::mutex> lk(failure_mu_);
  ++failure_categories_[to_string(code)];
}

void RunStats::record_verdict(bool approved) {
  if (approved) {
    approvals.fetch_add(1, std::memory_order_relaxed);
  } else {
    rejections.fetch_add(1, std::memory_order_relaxed);
  }
}

std::map<std::string, uint64_t> RunStats::failure_categories() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failure_categories_;
}

std::string RunStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += '{';
  field("executions", executions, true);
  field("successes", successes);
  field("failures", failures);
  field("timeouts", timeouts);
  field("cancellations", cancellations);
  field("sandbox_failures", sandbox_failures);
  field("abandoned_invocations", abandoned_invocations);
  field("approvals", approvals);
  field("rejections", rejections);
  field("waves", waves);
  out += ",\"failure_categories\":{";
  bool first = true;
  for (const auto& [name, count] : failure_categories()) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += jsonlite::escape(name);
    out += "\":";
    out += std::to_string(count);
  }
  out += "},\"execution_latency\":";
  out += execution_latency.to_json();
  out += '}';
  return out;
}

}  // namespace conclave
