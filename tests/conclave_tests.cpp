#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "conclave/adapters.hpp"
#include "conclave/audit.hpp"
#include "conclave/config.hpp"
#include "conclave/coordinator.hpp"
#include "conclave/hash.hpp"
#include "conclave/jsonlite.hpp"
#include "conclave/observability.hpp"
#include "conclave/orchestrator.hpp"
#include "conclave/planner.hpp"
#include "conclave/report.hpp"
#include "conclave/review_gate.hpp"
#include "conclave/sandbox.hpp"
#include "conclave/ticket_graph.hpp"
#include "conclave/types.hpp"
#include "conclave/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ============================================================================
// Fixtures
// ============================================================================

fs::path scratch_dir(const std::string& name) {
  const fs::path dir =
      fs::temp_directory_path() / ("conclave-test-" + std::to_string(getpid()) + "-" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_file(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f << content;
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::vector<std::string> lines;
  std::ifstream f(p);
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

// Small repository with entries that the ignore rules must skip.
fs::path make_repo(const fs::path& base) {
  const fs::path repo = base / "repo";
  write_file(repo / "README.md", "# demo\n");
  write_file(repo / "CMakeLists.txt", "project(demo)\n");
  write_file(repo / "src" / "main.cpp", "int main() { return 0; }\n");
  write_file(repo / ".gitignore", "build/\n");
  write_file(repo / ".git" / "HEAD", "ref: refs/heads/main\n");
  write_file(repo / "node_modules" / "left-pad" / "index.js", "module.exports = 1;\n");
  write_file(repo / "tool.pyc", "bytecode");
  return repo;
}

conclave::Ticket make_ticket(const std::string& id, std::vector<std::string> deps = {},
                             size_t criteria = 2) {
  conclave::Ticket t;
  t.id = id;
  t.title = "Ticket " + id;
  t.description = "Work for " + id;
  t.dependencies = std::move(deps);
  for (size_t i = 0; i < criteria; ++i) {
    t.criteria.push_back(conclave::AcceptanceCriterion{id + " criterion " + std::to_string(i + 1),
                                                       false, ""});
  }
  return t;
}

conclave::ExecutionResult passing_result(const conclave::Ticket& ticket) {
  conclave::ExecutionResult r;
  r.ticket_id = ticket.id;
  r.success = true;
  r.diff = "--- a/src/main.cpp\n+++ b/src/main.cpp\n+// " + ticket.id + "\n";
  r.tests = conclave::TestSummary{10, 0, 0};
  r.criteria = ticket.criteria;
  for (auto& c : r.criteria) c.met = true;
  return r;
}

conclave::ExecutionResult failing_result(const conclave::Ticket& ticket) {
  conclave::ExecutionResult r;
  r.ticket_id = ticket.id;
  r.success = false;
  r.error_code = conclave::to_string(conclave::ErrorCode::execution_failure);
  r.error_message = "compiler error";
  return r;
}

// Scripted implementer: per-ticket behaviour, passing_result() otherwise.
class ScriptedImplementer : public conclave::ImplementerPort {
 public:
  using Script = std::function<conclave::ExecutionResult(const conclave::ImplementerRequest&,
                                                         const conclave::CancelToken&)>;

  void on(const std::string& ticket_id, Script script) {
    std::lock_guard<std::mutex> lk(mu_);
    scripts_[ticket_id] = std::move(script);
  }
  void otherwise(Script script) {
    std::lock_guard<std::mutex> lk(mu_);
    fallback_ = std::move(script);
  }

  conclave::ExecutionResult implement(const conclave::ImplementerRequest& req,
                                      const conclave::CancelToken& cancel) override {
    const int now = in_flight.fetch_add(1) + 1;
    int prev = max_in_flight.load();
    while (now > prev && !max_in_flight.compare_exchange_weak(prev, now)) {
    }
    Script script;
    {
      std::lock_guard<std::mutex> lk(mu_);
      calls_.push_back(req.ticket.id);
      generations_.push_back(req.ticket.generation);
      if (fs::exists(req.workspace_path) && fs::exists(req.work_path)) ++workspaces_seen_;
      auto it = scripts_.find(req.ticket.id);
      script = it != scripts_.end() ? it->second : fallback_;
    }
    conclave::ExecutionResult r = script ? script(req, cancel) : passing_result(req.ticket);
    in_flight.fetch_sub(1);
    return r;
  }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lk(mu_);
    return calls_;
  }
  std::vector<uint32_t> generations() const {
    std::lock_guard<std::mutex> lk(mu_);
    return generations_;
  }
  int workspaces_seen() const {
    std::lock_guard<std::mutex> lk(mu_);
    return workspaces_seen_;
  }

  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};

 private:
  mutable std::mutex mu_;
  std::map<std::string, Script> scripts_;
  Script fallback_;
  std::vector<std::string> calls_;
  std::vector<uint32_t> generations_;
  int workspaces_seen_{0};
};

class FailingIntegrator : public conclave::IntegratorPort {
 public:
  conclave::IntegrationOutcome integrate(const std::vector<conclave::ExecutionResult>& approved) override {
    ++calls;
    received = approved.size();
    conclave::IntegrationOutcome out;
    out.ok = false;
    out.error_message = "merge conflict in src/main.cpp";
    return out;
  }
  int calls{0};
  size_t received{0};
};

class ThrowingIntegrator : public conclave::IntegratorPort {
 public:
  conclave::IntegrationOutcome integrate(const std::vector<conclave::ExecutionResult>&) override {
    throw std::runtime_error("integrator exploded");
  }
};

// Reviewer that throws something outside the std::exception hierarchy.
class NonStandardThrowingReviewer : public conclave::ReviewerPort {
 public:
  conclave::ReviewVerdict review(const conclave::Ticket&, const conclave::ExecutionResult&) override {
    throw 42;
  }
};

// Planner returning a fixed ticket list.
class FixedPlanner : public conclave::PlannerPort {
 public:
  explicit FixedPlanner(std::vector<conclave::Ticket> tickets) : tickets_(std::move(tickets)) {}
  conclave::PlanResult plan(const conclave::Objective&, const conclave::BaseSnapshot&) override {
    conclave::PlanResult r;
    r.ok = true;
    r.tickets = tickets_;
    return r;
  }

 private:
  std::vector<conclave::Ticket> tickets_;
};

// Blocks the dispatcher on the first event until release() is called.
class GateSink : public conclave::EventSink {
 public:
  void publish(const conclave::LifecycleEvent&) override {
    entered.store(true);
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return open_; });
  }
  void release() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }
  std::atomic<bool> entered{false};

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{false};
};

conclave::Objective make_objective(std::vector<std::string> requirements) {
  conclave::Objective o;
  o.description = "Add a greeting service";
  o.requirements = std::move(requirements);
  o.constraints = {"keep the public API stable"};
  return o;
}

conclave::RunConfig make_config(const fs::path& base, const fs::path& repo) {
  conclave::RunConfig cfg;
  cfg.repo_path = repo.string();
  cfg.sandbox_root = (base / "sandboxes").string();
  cfg.max_runners = 2;
  cfg.max_sandboxes = 8;
  cfg.ticket_timeout_ms = 5000;
  cfg.cancel_grace_ms = 200;
  return cfg;
}

// Drives a graph to exhaustion, approving every dispatched ticket.
std::map<std::string, uint32_t> drain_waves(conclave::TicketGraph& g) {
  std::set<std::string> completed;
  for (;;) {
    const conclave::WavePlan wave = g.next_wave(completed);
    if (wave.empty()) break;
    for (const auto& id : wave.tickets) {
      g.set_status(id, conclave::TicketStatus::in_progress);
      g.set_status(id, conclave::TicketStatus::needs_review);
      g.set_status(id, conclave::TicketStatus::approved);
      completed.insert(id);
    }
  }
  std::map<std::string, uint32_t> waves;
  for (const auto& t : g.tickets()) {
    if (auto w = g.wave_of(t.id)) waves[t.id] = *w;
  }
  return waves;
}

// ============================================================================
// Hashing, JSON, versions
// ============================================================================

void test_blake3_known_vectors() {
  expect(conclave::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(conclave::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "+added line\n";
  expect(conclave::diff_digest(payload) == conclave::hash_domain("diff:", payload),
         "diff digest uses the diff: domain");
  expect(conclave::hash_domain("diff:", payload) != conclave::hash_domain("snap:", payload),
         "domains must separate");
  expect(conclave::hash_domain("audit:", payload).size() == 64, "digest is 64 hex chars");
}

void test_json_strictness() {
  std::optional<conclave::jsonlite::JsonError> err;
  conclave::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate key rejected");

  err.reset();
  conclave::jsonlite::parse("{\"a\":1} trailing", &err);
  expect(err.has_value(), "trailing data rejected");

  err.reset();
  auto obj = conclave::jsonlite::parse("{\"list\":[\"x\",\"y\"],\"n\":3,\"d\":0.5}", &err);
  expect(!err, "valid document parses");
  expect(conclave::jsonlite::get_string_array(obj, "list").size() == 2, "string array read");
  expect(conclave::jsonlite::get_u64(obj, "n") == 3, "u64 read");
  expect(conclave::jsonlite::get_double(obj, "d") == 0.5, "double read");
  expect(conclave::jsonlite::format_double(0.94) == "0.94", "format_double trims zeros");
}

void test_version_manifest() {
  const auto m = conclave::version::current_manifest();
  expect(m.report_format == conclave::version::REPORT_FORMAT_VERSION, "report format version");
  expect(m.hash_primitive == "blake3", "hash primitive is blake3");
  const std::string json = conclave::version::manifest_to_json(m);
  expect(json.find("\"engine_semver\"") != std::string::npos, "manifest names engine version");
}

// ============================================================================
// Types / state machine
// ============================================================================

void test_transition_table() {
  using S = conclave::TicketStatus;
  const std::vector<S> all = {S::pending,  S::in_progress, S::needs_review, S::approved,
                              S::rejected, S::blocked,     S::cancelled,    S::failed};
  const std::set<std::pair<S, S>> allowed = {
      {S::pending, S::in_progress},      {S::pending, S::blocked},
      {S::in_progress, S::needs_review}, {S::in_progress, S::cancelled},
      {S::in_progress, S::failed},       {S::needs_review, S::approved},
      {S::needs_review, S::rejected},
  };
  for (S from : all) {
    for (S to : all) {
      const bool want = allowed.count({from, to}) != 0;
      expect(conclave::transition_allowed(from, to) == want,
             "transition " + conclave::to_string(from) + " -> " + conclave::to_string(to));
    }
  }
  for (S s : all) {
    const bool terminal = s != S::pending && s != S::in_progress && s != S::needs_review;
    expect(conclave::is_terminal(s) == terminal, "terminal: " + conclave::to_string(s));
    expect(conclave::is_terminal_failure(s) == (terminal && s != S::approved),
           "terminal failure: " + conclave::to_string(s));
  }
}

void test_error_code_strings() {
  using E = conclave::ErrorCode;
  for (E e : {E::planning_error, E::dependency_cycle, E::sandbox_acquisition_failed,
              E::execution_timeout, E::execution_failure, E::review_rejection,
              E::integration_failure, E::cancelled, E::invalid_transition, E::duplicate_ticket,
              E::config_invalid, E::internal_error}) {
    expect(conclave::error_code_from_string(conclave::to_string(e)) == e,
           "error code string is stable: " + conclave::to_string(e));
  }
}

// ============================================================================
// TicketGraph
// ============================================================================

void test_graph_add_ticket_errors() {
  conclave::TicketGraph g;
  expect(!g.add_ticket(make_ticket("")).ok, "empty id rejected");
  expect(g.add_ticket(make_ticket("A")).ok, "A added");
  auto dup = g.add_ticket(make_ticket("A"));
  expect(!dup.ok && dup.error_code == conclave::ErrorCode::duplicate_ticket, "duplicate rejected");
  auto self = g.add_ticket(make_ticket("S", {"S"}));
  expect(!self.ok && self.error_code == conclave::ErrorCode::dependency_cycle,
         "self-dependency rejected");
  expect(g.add_ticket(make_ticket("B", {"A", "A"})).ok, "B added");
  expect(g.get("B")->dependencies.size() == 1, "duplicate dependency collapsed");

  conclave::Ticket forced = make_ticket("C");
  forced.status = conclave::TicketStatus::approved;
  g.add_ticket(forced);
  expect(g.get("C")->status == conclave::TicketStatus::pending, "new tickets start pending");
}

void test_graph_cycle_detection() {
  conclave::TicketGraph g;
  g.add_ticket(make_ticket("A", {"C"}));
  g.add_ticket(make_ticket("B", {"A"}));
  g.add_ticket(make_ticket("C", {"B"}));
  g.add_ticket(make_ticket("D"));
  expect(g.cycles(), "cycle detected");
  const auto cycle = g.find_cycle();
  expect(cycle.size() == 3, "cycle lists three ids");
  const auto v = g.validate();
  expect(!v.ok && v.error_code == conclave::ErrorCode::dependency_cycle, "validate reports cycle");
  for (const char* id : {"A", "B", "C"}) {
    expect(v.error_message.find(id) != std::string::npos,
           std::string("cycle message names ") + id);
  }

  conclave::TicketGraph unknown;
  unknown.add_ticket(make_ticket("X", {"missing"}));
  const auto u = unknown.validate();
  expect(!u.ok && u.error_code == conclave::ErrorCode::planning_error, "unknown dependency");
}

void test_wave_ordering_property() {
  // Diamond plus a chain plus an isolated ticket.
  conclave::TicketGraph g;
  g.add_ticket(make_ticket("A"));
  g.add_ticket(make_ticket("B", {"A"}));
  g.add_ticket(make_ticket("C", {"A"}));
  g.add_ticket(make_ticket("D", {"B", "C"}));
  g.add_ticket(make_ticket("E", {"D"}));
  g.add_ticket(make_ticket("F"));
  g.add_ticket(make_ticket("G", {"F", "C"}));
  expect(g.validate().ok, "graph is acyclic");

  const auto waves = drain_waves(g);
  expect(waves.size() == g.size(), "every ticket assigned to a wave");
  for (const auto& t : g.tickets()) {
    for (const auto& d : t.dependencies) {
      expect(waves.at(t.id) > waves.at(d), t.id + " runs after " + d);
    }
  }
  expect(waves.at("A") == 0 && waves.at("F") == 0, "roots in wave 0");
  expect(waves.at("D") == 2 && waves.at("E") == 3, "chain depth respected");
}

void test_wave_determinism() {
  auto build = [] {
    conclave::TicketGraph g;
    for (int i = 0; i < 12; ++i) {
      std::vector<std::string> deps;
      if (i >= 3) deps.push_back("T" + std::to_string(i % 3));
      if (i >= 6) deps.push_back("T" + std::to_string(i - 3));
      g.add_ticket(make_ticket("T" + std::to_string(i), deps));
    }
    return g;
  };
  conclave::TicketGraph a = build();
  conclave::TicketGraph b = build();
  expect(drain_waves(a) == drain_waves(b), "identical graphs give identical waves");

  conclave::TicketGraph c = build();
  const auto first = c.next_wave({});
  expect(first.tickets == std::vector<std::string>({"T0", "T1", "T2"}),
         "wave members in creation order");
}

void test_failed_dependency_blocks() {
  conclave::TicketGraph g;
  g.add_ticket(make_ticket("A"));
  g.add_ticket(make_ticket("B", {"A"}));
  g.add_ticket(make_ticket("C", {"B"}));

  auto w0 = g.next_wave({});
  expect(w0.tickets == std::vector<std::string>({"A"}), "A alone in wave 0");
  g.set_status("A", conclave::TicketStatus::in_progress);
  g.set_status("A", conclave::TicketStatus::failed, "execution_failure");

  auto w1 = g.next_wave({});
  expect(w1.empty(), "nothing runnable after A failed");
  expect(g.get("B")->status == conclave::TicketStatus::blocked, "B blocked");
  expect(g.get("C")->status == conclave::TicketStatus::blocked, "C blocked transitively");
  expect(g.reason_of("B") == "dependency A failed", "B reason names A");
  expect(!g.wave_of("B").has_value(), "B never assigned a wave");
  expect(w1.newly_blocked.size() == 2, "both reported as newly blocked");
}

void test_follow_up_parent_edge() {
  conclave::TicketGraph g;
  g.add_ticket(make_ticket("A"));
  g.next_wave({});
  g.set_status("A", conclave::TicketStatus::in_progress);
  g.set_status("A", conclave::TicketStatus::failed, "boom");

  conclave::Ticket fu = make_ticket("A-FU-1", {"A"}, 1);
  fu.metadata[conclave::meta::kFollowUp] = "true";
  fu.metadata[conclave::meta::kParentTicketId] = "A";
  fu.generation = 1;
  g.add_ticket(fu);
  g.add_ticket(make_ticket("Z", {"A"}));

  auto w = g.next_wave({});
  expect(w.tickets == std::vector<std::string>({"A-FU-1"}), "follow-up of failed parent runs");
  expect(g.get("Z")->status == conclave::TicketStatus::blocked, "ordinary dependent blocked");
}

void test_status_history_and_criteria() {
  conclave::RecentEventsSink recent;
  conclave::TicketGraph g(&recent);
  std::vector<std::string> observed;
  g.set_transition_observer([&](const conclave::Ticket& t, const conclave::StatusChange& c) {
    observed.push_back(t.id + ":" + conclave::to_string(c.to));
  });
  g.add_ticket(make_ticket("A"));
  expect(g.set_status("A", conclave::TicketStatus::in_progress).ok, "pending -> in_progress");
  auto bad = g.set_status("A", conclave::TicketStatus::approved);
  expect(!bad.ok && bad.error_code == conclave::ErrorCode::invalid_transition,
         "in_progress -> approved rejected");
  expect(g.status_history("A").size() == 1, "rejected change not recorded");
  expect(observed == std::vector<std::string>({"A:in_progress"}), "observer called once");

  std::vector<conclave::AcceptanceCriterion> reported = {
      {"A criterion 2", true, "checked"},
  };
  g.apply_criteria("A", reported);
  expect(g.get("A")->criteria_met() == 1, "criterion matched by description");
  expect(!g.get("A")->criteria[0].met && g.get("A")->criteria[1].met, "right criterion updated");

  const auto events = recent.snapshot();
  expect(events.size() == 2, "created + status changed published");
  expect(events[0].type == conclave::EventType::ticket_created, "first event is creation");
  expect(events[1].data.at("to") == "in_progress", "status event carries target");
}

// ============================================================================
// ReviewGate
// ============================================================================

conclave::Ticket reviewed_ticket(size_t criteria, size_t met) {
  conclave::Ticket t = make_ticket("R", {}, criteria);
  for (size_t i = 0; i < met && i < criteria; ++i) t.criteria[i].met = true;
  return t;
}

void test_score_example() {
  conclave::Ticket t = reviewed_ticket(2, 2);
  conclave::ExecutionResult r;
  r.success = true;
  r.tests = conclave::TestSummary{8, 2, 0};
  r.diff = "+x\n";
  const double score = conclave::alignment_score(t, r);
  expect(std::abs(score - 0.94) < 1e-9, "0.3 + 0.4 + 0.24 = 0.94");

  conclave::ReviewGate gate;
  const auto v = gate.review(t, r);
  expect(v.approved, "0.94 with all criteria met is approved");
  expect(v.feedback.find("alignment score: 0.94") != std::string::npos, "feedback shows score");
  bool failing_follow_up = false;
  for (const auto& fu : v.follow_ups) {
    if (fu.metadata.at(conclave::meta::kFollowUpReason) == "failing_tests") failing_follow_up = true;
  }
  expect(failing_follow_up, "failing tests still produce a follow-up");
}

void test_failure_never_approved() {
  conclave::Ticket t = reviewed_ticket(3, 3);
  conclave::ExecutionResult r;
  r.success = false;
  r.tests = conclave::TestSummary{10, 0, 0};
  const double score = conclave::alignment_score(t, r);
  expect(score <= 0.7 + 1e-9, "failed execution scores at most 0.7");

  conclave::ReviewGate lenient(conclave::ReviewPolicy{0.0, 300000});
  expect(!lenient.review(t, r).approved, "success is a hard gate even at threshold 0");
}

void test_score_bounds() {
  for (bool success : {false, true}) {
    for (size_t criteria = 0; criteria <= 4; ++criteria) {
      for (size_t met = 0; met <= criteria; ++met) {
        for (int tests = 0; tests < 5; ++tests) {
          conclave::Ticket t = reviewed_ticket(criteria, met);
          conclave::ExecutionResult r;
          r.success = success;
          if (tests == 1) r.tests = conclave::TestSummary{0, 0, 0};
          if (tests == 2) r.tests = conclave::TestSummary{0, 7, 0};
          if (tests == 3) r.tests = conclave::TestSummary{5, 5, 5};
          if (tests == 4) r.tests = conclave::TestSummary{9, 0, 0};
          const double s = conclave::alignment_score(t, r);
          expect(s >= 0.0 && s <= 1.0, "score within [0,1]");
        }
      }
    }
  }
  conclave::Ticket none = reviewed_ticket(0, 0);
  conclave::ExecutionResult no_tests;
  no_tests.success = true;
  no_tests.tests = conclave::TestSummary{0, 0, 0};
  expect(std::abs(conclave::alignment_score(none, no_tests) - 0.85) < 1e-9,
         "empty test summary counts as no evidence");
}

void test_follow_up_synthesis() {
  conclave::Ticket t = reviewed_ticket(3, 1);
  t.generation = 0;
  t.metadata[conclave::meta::kObjective] = "objective text";
  conclave::ExecutionResult r;
  r.success = true;
  r.tests = conclave::TestSummary{3, 1, 0};
  r.logs.push_back(conclave::LogEntry{1, "TODO: wire up retries"});
  r.logs.push_back(conclave::LogEntry{2, "needs a Follow-Up for docs"});
  r.logs.push_back(conclave::LogEntry{3, "all good"});

  conclave::ReviewGate gate;
  const auto v = gate.review(t, r);
  expect(!v.approved, "unmet criteria reject");
  expect(v.follow_ups.size() == 5, "2 unmet + 1 failing tests + 2 log markers");
  for (size_t i = 0; i < v.follow_ups.size(); ++i) {
    const auto& fu = v.follow_ups[i];
    expect(fu.id == "R-FU-" + std::to_string(i + 1), "follow-up ids numbered from 1");
    expect(fu.dependencies == std::vector<std::string>({"R"}), "depends on parent only");
    expect(fu.generation == 1, "generation incremented");
    expect(fu.is_follow_up() && fu.parent_id() == "R", "follow-up metadata");
    expect(fu.metadata.at(conclave::meta::kObjective) == "objective text", "objective carried");
  }
  expect(v.follow_ups[2].priority == conclave::TicketPriority::high, "failing tests are high");

  conclave::Ticket full = reviewed_ticket(2, 2);
  conclave::ExecutionResult weak;
  weak.success = true;
  weak.tests = conclave::TestSummary{0, 0, 1};
  conclave::ReviewGate strict(conclave::ReviewPolicy{0.99, 300000});
  const auto retry = strict.review(full, weak);
  expect(!retry.approved, "below threshold");
  expect(retry.follow_ups.size() == 1, "single retry follow-up");
  expect(retry.follow_ups[0].metadata.at(conclave::meta::kFollowUpReason) == "rejection",
         "retry reason");
  expect(retry.follow_ups[0].criteria_met() == 0, "retry criteria reset");

  conclave::ExecutionResult cancelled;
  cancelled.cancelled = true;
  cancelled.error_code = "cancelled";
  expect(gate.review(t, cancelled).follow_ups.empty(), "cancelled results spawn nothing");
}

void test_review_risks_and_summary() {
  conclave::Ticket t = reviewed_ticket(1, 1);
  conclave::ExecutionResult r;
  r.success = true;
  r.diff = "--- a/x.py\n+++ b/x.py\n+print(1)\n+# FIXME later\n-old\n";
  conclave::ReviewGate gate;
  const auto v = gate.review(t, r);
  const auto has = [&](const std::string& needle) {
    return std::any_of(v.risks.begin(), v.risks.end(),
                       [&](const std::string& s) { return s.find(needle) != std::string::npos; });
  };
  expect(has("debug statements"), "debug statement risk");
  expect(has("unresolved"), "marker risk");
  const auto stats = conclave::analyze_diff(r.diff);
  expect(stats.added == 2 && stats.removed == 1, "diff headers not counted");

  conclave::ReviewVerdict a;
  a.approved = true;
  a.alignment_score = 1.0;
  conclave::ReviewVerdict b;
  b.alignment_score = 0.5;
  const auto s = conclave::summarize({a, b});
  expect(s.total_reviews == 2 && s.approved == 1 && s.rejected == 1, "summary counts");
  expect(std::abs(s.approval_rate - 0.5) < 1e-9 && std::abs(s.average_alignment - 0.75) < 1e-9,
         "summary rates");
}

// ============================================================================
// Sandbox
// ============================================================================

void test_ignore_rules() {
  for (const char* name : {".git", ".venv", "__pycache__", "node_modules", "venv", "env", "x.pyc"}) {
    expect(conclave::is_ignored_entry(name), std::string("ignored: ") + name);
  }
  for (const char* name : {".gitignore", "src", "main.py", "environment.yml"}) {
    expect(!conclave::is_ignored_entry(name), std::string("kept: ") + name);
  }
}

void test_snapshot_digest() {
  const fs::path base = scratch_dir("snapshot");
  const fs::path repo = make_repo(base);
  const auto s1 = conclave::capture_snapshot(repo.string());
  expect(s1.ok, "snapshot ok");
  expect(s1.file_count == 4, "ignored entries excluded from snapshot");

  write_file(repo / ".git" / "index", "changed");
  expect(conclave::capture_snapshot(repo.string()).digest == s1.digest,
         "ignored changes do not move the digest");
  write_file(repo / "src" / "main.cpp", "int main() { return 1; }\n");
  expect(conclave::capture_snapshot(repo.string()).digest != s1.digest,
         "content changes move the digest");

  expect(!conclave::capture_snapshot((base / "missing").string()).ok, "missing repo fails");
  fs::remove_all(base);
}

void test_sandbox_lease_lifecycle() {
  const fs::path base = scratch_dir("lease");
  const fs::path repo = make_repo(base);
  const auto snap = conclave::capture_snapshot(repo.string());
  conclave::SandboxManager mgr((base / "sandboxes").string(), 2);

  std::string dir;
  {
    auto a = mgr.acquire("A", snap);
    expect(a.ok, "acquire A");
    dir = a.lease.root();
    expect(fs::exists(fs::path(a.lease.repo_path()) / "src" / "main.cpp"), "repo copied");
    expect(fs::exists(fs::path(a.lease.repo_path()) / ".gitignore"), ".gitignore copied");
    expect(!fs::exists(fs::path(a.lease.repo_path()) / ".git"), ".git not copied");
    expect(!fs::exists(fs::path(a.lease.repo_path()) / "node_modules"), "node_modules not copied");
    expect(fs::is_directory(a.lease.work_path()), "work dir created");

    auto again = mgr.acquire("A", snap);
    expect(!again.ok && again.error_code == conclave::ErrorCode::sandbox_acquisition_failed,
           "one live lease per ticket");

    auto b = mgr.acquire("B", snap);
    auto c = mgr.acquire("C", snap);
    expect(b.ok && !c.ok, "max_sandboxes enforced");

    conclave::SandboxLease moved = std::move(a.lease);
    expect(!a.lease.valid() && moved.valid(), "lease moves");
    expect(mgr.live_count() == 2, "two live");
  }
  expect(mgr.live_count() == 0, "leases released on scope exit");
  expect(!fs::exists(dir), "sandbox directory removed");
  expect(mgr.acquired_total() == 2 && mgr.released_total() == 2, "acquire/release totals");

  auto escape = mgr.acquire("../escape", snap);
  expect(!escape.ok, "path escape rejected");
  fs::remove_all(base);
}

void test_sandbox_names_never_reused() {
  const fs::path base = scratch_dir("names");
  const fs::path repo = make_repo(base);
  const auto snap = conclave::capture_snapshot(repo.string());
  const fs::path root = base / "sandboxes";
  write_file(root / "A-1" / "repo" / "stale.txt", "left over");

  conclave::SandboxManager first(root.string(), 2);
  conclave::SandboxManager second(root.string(), 2);
  auto a1 = first.acquire("A", snap);
  auto a2 = second.acquire("A", snap);
  expect(a1.ok && a2.ok, "both managers acquire A");
  expect(a1.lease.root() != a2.lease.root(), "managers sharing a root get distinct directories");
  expect(fs::path(a1.lease.root()).filename() != "A-1" &&
             fs::path(a2.lease.root()).filename() != "A-1",
         "existing directory skipped");
  expect(!fs::exists(fs::path(a1.lease.repo_path()) / "stale.txt") &&
             !fs::exists(fs::path(a2.lease.repo_path()) / "stale.txt"),
         "no stale files in a fresh sandbox");
  expect(fs::exists(root / "A-1" / "repo" / "stale.txt"), "foreign directory left alone");

  const std::string kept = a2.lease.repo_path();
  a1.lease.release();
  expect(fs::exists(fs::path(kept) / "src" / "main.cpp"),
         "releasing one lease keeps the other workspace");
  a2.lease.release();
  fs::remove_all(base);
}

void test_sandbox_rejects_changed_repo() {
  const fs::path base = scratch_dir("drift");
  const fs::path repo = make_repo(base);
  const auto snap = conclave::capture_snapshot(repo.string());
  write_file(repo / "new.txt", "added after planning\n");

  conclave::SandboxManager mgr((base / "sandboxes").string(), 2);
  auto a = mgr.acquire("A", snap);
  expect(!a.ok && a.error_code == conclave::ErrorCode::sandbox_acquisition_failed,
         "copy that differs from the snapshot is refused");
  expect(a.error_message.find("repository changed since snapshot") == 0, "drift reported");
  expect(mgr.live_count() == 0 && mgr.released_total() == 1, "reserved slot given back");
  expect(fs::is_empty(base / "sandboxes"), "partial copy removed");

  const auto fresh = conclave::capture_snapshot(repo.string());
  auto b = mgr.acquire("A", fresh);
  expect(b.ok && fs::exists(fs::path(b.lease.repo_path()) / "new.txt"),
         "current snapshot acquires");
  fs::remove_all(base);
}

void test_run_process() {
  conclave::ProcessSpec echo;
  echo.command = "/bin/echo";
  echo.argv = {"hello"};
  const auto r = conclave::run_process(echo);
  expect(r.spawned && r.exit_code == 0 && r.stdout_text == "hello\n", "echo runs");

  conclave::ProcessSpec slow;
  slow.command = "/bin/sleep";
  slow.argv = {"5"};
  slow.timeout_ms = 100;
  const auto t = conclave::run_process(slow);
  expect(t.timed_out && t.exit_code == 124, "timeout kills the process");

  conclave::ProcessSpec missing;
  missing.command = "/nonexistent/binary";
  expect(conclave::run_process(missing).exit_code == 127, "exec failure exits 127");

  conclave::ProcessSpec closed;
  closed.command = "/bin/sh";
  closed.argv = {"-c", "echo early; exec 1>&- 2>&-; sleep 0.3"};
  closed.timeout_ms = 5000;
  const auto c = conclave::run_process(closed);
  expect(c.spawned && !c.timed_out && c.exit_code == 0, "child outlives its closed pipes");
  expect(c.stdout_text == "early\n", "output before close kept");
}

// ============================================================================
// ExecutionCoordinator
// ============================================================================

struct CoordinatorFixture {
  explicit CoordinatorFixture(const std::string& name, uint32_t max_sandboxes = 8)
      : base(scratch_dir(name)),
        repo(make_repo(base)),
        snapshot(conclave::capture_snapshot(repo.string())),
        sandboxes((base / "sandboxes").string(), max_sandboxes) {}
  ~CoordinatorFixture() {
    std::error_code ec;
    fs::remove_all(base, ec);
  }

  conclave::CoordinatorOptions options(uint64_t timeout_ms = 5000, uint64_t grace_ms = 200) const {
    conclave::CoordinatorOptions o;
    o.ticket_timeout_ms = timeout_ms;
    o.cancel_grace_ms = grace_ms;
    o.objective = "objective";
    return o;
  }

  fs::path base;
  fs::path repo;
  conclave::BaseSnapshot snapshot;
  conclave::SandboxManager sandboxes;
};

void test_wave_pool_bound() {
  CoordinatorFixture fx("pool");
  conclave::RunStats stats;
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options(), nullptr, &stats);
  auto impl = std::make_shared<ScriptedImplementer>();
  impl->otherwise([](const conclave::ImplementerRequest& req, const conclave::CancelToken&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    return passing_result(req.ticket);
  });

  std::vector<conclave::Ticket> tickets;
  for (int i = 0; i < 6; ++i) tickets.push_back(make_ticket("W" + std::to_string(i)));
  const auto results = coord.run_wave(tickets, impl, 2);

  expect(results.size() == 6, "every ticket has a result");
  for (const auto& [id, r] : results) {
    expect(r.success && r.ticket_id == id, "result for " + id);
    expect(r.runner_id.rfind("runner-", 0) == 0, "runner id stamped");
    expect(r.diff_digest == conclave::diff_digest(r.diff), "diff digest stamped");
  }
  expect(impl->max_in_flight.load() <= 2, "pool size respected");
  expect(impl->workspaces_seen() == 6, "implementer saw a live sandbox");
  expect(fx.sandboxes.live_count() == 0, "all sandboxes released");
  expect(stats.executions.load() == 6 && stats.successes.load() == 6, "stats recorded");
}

void test_cancel_in_flight() {
  CoordinatorFixture fx("cancel");
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options(10000, 500));
  auto impl = std::make_shared<ScriptedImplementer>();
  std::atomic<bool> a_started{false};
  std::atomic<bool> b_done{false};
  impl->on("A", [&](const conclave::ImplementerRequest& req, const conclave::CancelToken& cancel) {
    a_started.store(true);
    cancel.wait_for(std::chrono::milliseconds(10000));
    conclave::ExecutionResult r;
    r.ticket_id = req.ticket.id;
    r.error_code = "cancelled";
    return r;
  });
  impl->on("B", [&](const conclave::ImplementerRequest& req, const conclave::CancelToken&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    b_done.store(true);
    return passing_result(req.ticket);
  });

  std::map<std::string, conclave::ExecutionResult> results;
  std::thread runner([&] { results = coord.run_wave({make_ticket("A"), make_ticket("B")}, impl, 2); });
  while (!a_started.load() || !b_done.load()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  expect(fx.sandboxes.holds("A"), "A holds a sandbox while running");
  expect(coord.cancel("A", "user request"), "cancel reaches the running ticket");
  runner.join();

  expect(results.at("A").cancelled, "A cancelled");
  expect(results.at("A").error_code == "cancelled", "cancelled error code");
  expect(results.at("B").success, "sibling unaffected");
  expect(results.at("B").duration_ms < 1000, "sibling not delayed");
  expect(!fx.sandboxes.holds("A") && fx.sandboxes.live_count() == 0, "A's sandbox released");
  expect(fx.sandboxes.released_total() == 2, "both leases released");
}

void test_cancel_before_start() {
  CoordinatorFixture fx("precancel");
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options());
  auto impl = std::make_shared<ScriptedImplementer>();
  expect(!coord.cancel("A"), "A not running yet");
  const auto results = coord.run_wave({make_ticket("A"), make_ticket("B")}, impl, 2);
  expect(results.at("A").cancelled, "A cancelled when its wave starts");
  expect(results.at("B").success, "B runs");
  expect(impl->calls() == std::vector<std::string>({"B"}), "A never reached the implementer");
  expect(fx.sandboxes.acquired_total() == 1, "A never acquired a sandbox");
}

void test_timeout_cooperative() {
  CoordinatorFixture fx("timeout");
  conclave::RunStats stats;
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options(100, 500), nullptr,
                                       &stats);
  auto impl = std::make_shared<ScriptedImplementer>();
  impl->otherwise([](const conclave::ImplementerRequest& req, const conclave::CancelToken& cancel) {
    cancel.wait_for(std::chrono::milliseconds(5000));
    conclave::ExecutionResult r;
    r.ticket_id = req.ticket.id;
    r.logs.push_back(conclave::LogEntry{1, "stopped on " + cancel.reason()});
    return r;
  });
  const auto results = coord.run_wave({make_ticket("T")}, impl, 1);
  const auto& r = results.at("T");
  expect(!r.success && !r.cancelled, "timeout is a failure, not a cancellation");
  expect(r.error_code == "execution_timeout", "execution_timeout code");
  expect(r.logs.size() == 1 && r.logs[0].message == "stopped on timeout", "token reason timeout");
  expect(stats.timeouts.load() == 1 && stats.abandoned_invocations.load() == 0, "timeout counted");
  expect(fx.sandboxes.live_count() == 0, "sandbox released after timeout");
}

void test_timeout_abandons_uncooperative() {
  CoordinatorFixture fx("abandon");
  conclave::RunStats stats;
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options(50, 50), nullptr,
                                       &stats);
  auto impl = std::make_shared<ScriptedImplementer>();
  impl->otherwise([](const conclave::ImplementerRequest& req, const conclave::CancelToken&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    req.log("still here");
    return passing_result(req.ticket);
  });
  const auto start = std::chrono::steady_clock::now();
  const auto results = coord.run_wave({make_ticket("U")}, impl, 1);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(elapsed < std::chrono::milliseconds(600), "barrier does not wait for abandoned work");
  expect(results.at("U").error_code == "execution_timeout", "abandoned ticket timed out");
  expect(stats.abandoned_invocations.load() == 1, "abandonment counted");
  expect(fx.sandboxes.live_count() == 0, "sandbox released despite abandonment");
  // Let the detached invocation finish before the fixture goes away.
  std::this_thread::sleep_for(std::chrono::milliseconds(900));
}

void test_sandbox_failure_scoped() {
  CoordinatorFixture fx("sbfail", 1);
  conclave::RunStats stats;
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options(), nullptr, &stats);
  auto held = fx.sandboxes.acquire("other", fx.snapshot);
  expect(held.ok, "hold the only slot");
  auto impl = std::make_shared<ScriptedImplementer>();
  const auto results = coord.run_wave({make_ticket("A")}, impl, 1);
  expect(results.at("A").error_code == "sandbox_acquisition_failed", "acquisition failure reported");
  expect(impl->calls().empty(), "implementer not called without a sandbox");
  expect(stats.sandbox_failures.load() == 1, "sandbox failure counted");
}

void test_implementer_exception_contained() {
  CoordinatorFixture fx("throw");
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options());
  auto impl = std::make_shared<ScriptedImplementer>();
  impl->on("X", [](const conclave::ImplementerRequest&, const conclave::CancelToken&)
                    -> conclave::ExecutionResult { throw std::runtime_error("disk full"); });
  const auto results = coord.run_wave({make_ticket("X"), make_ticket("Y")}, impl, 2);
  expect(results.at("X").error_code == "execution_failure", "exception becomes execution_failure");
  expect(results.at("X").error_message.find("disk full") != std::string::npos, "message kept");
  expect(results.at("Y").success, "sibling unaffected by exception");
}

void test_non_standard_exception_contained() {
  CoordinatorFixture fx("throw42");
  conclave::RunStats stats;
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options(), nullptr, &stats);
  auto impl = std::make_shared<ScriptedImplementer>();
  impl->on("X", [](const conclave::ImplementerRequest&, const conclave::CancelToken&)
                    -> conclave::ExecutionResult { throw 42; });
  const auto results = coord.run_wave({make_ticket("X"), make_ticket("Y")}, impl, 2);
  expect(results.at("X").error_code == "execution_failure", "non-std throw is execution_failure");
  expect(results.at("X").error_message == "implementer threw: non-standard exception",
         "non-std throw described");
  expect(results.at("X").ticket_id == "X" && !results.at("X").runner_id.empty(), "result stamped");
  expect(results.at("Y").success, "sibling unaffected");
  expect(fx.sandboxes.live_count() == 0, "sandbox released after non-std throw");
  expect(stats.executions.load() == 2, "both executions recorded");
}

void test_execution_log_events() {
  CoordinatorFixture fx("logs");
  auto recent = std::make_shared<conclave::RecentEventsSink>();
  conclave::EventBus bus;
  bus.subscribe(recent);
  conclave::ExecutionCoordinator coord(fx.sandboxes, fx.snapshot, fx.options(), &bus);
  auto impl = std::make_shared<ScriptedImplementer>();
  impl->otherwise([](const conclave::ImplementerRequest& req, const conclave::CancelToken&) {
    req.log("compiling");
    return passing_result(req.ticket);
  });
  coord.run_wave({make_ticket("L")}, impl, 1);
  bus.flush();
  const auto events = recent->snapshot();
  expect(events.size() == 1, "one execution_log event");
  expect(events[0].type == conclave::EventType::execution_log && events[0].entity_id == "L",
         "log event for ticket");
  expect(events[0].data.at("message") == "compiling", "log message carried");
}

// ============================================================================
// Observability / audit
// ============================================================================

void test_event_ordering() {
  auto recent = std::make_shared<conclave::RecentEventsSink>(100);
  conclave::EventBus bus;
  bus.subscribe(recent);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&bus, t] {
      for (int i = 0; i < 10; ++i) {
        bus.publish(conclave::make_event(conclave::EventType::execution_log, "T" + std::to_string(t)));
      }
    });
  }
  for (auto& th : threads) th.join();
  bus.flush();
  const auto events = recent->snapshot();
  expect(events.size() == 40, "all events delivered");
  for (size_t i = 0; i < events.size(); ++i) {
    expect(events[i].seq == i + 1, "seq strictly increasing from 1");
    expect(events[i].timestamp_unix_ms > 0, "timestamp filled");
  }
  expect(bus.published() == 40 && bus.dropped() == 0, "counters");
}

void test_event_drop_oldest() {
  auto gate = std::make_shared<GateSink>();
  auto recent = std::make_shared<conclave::RecentEventsSink>(100);
  conclave::EventBus bus(4);
  bus.subscribe(gate);
  bus.subscribe(recent);

  bus.publish(conclave::make_event(conclave::EventType::wave_started, "0"));
  while (!gate->entered.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  for (int i = 1; i <= 10; ++i) {
    bus.publish(conclave::make_event(conclave::EventType::execution_log, std::to_string(i)));
  }
  expect(bus.dropped() == 6, "oldest queued events dropped");
  gate->release();
  bus.flush();

  const auto events = recent->snapshot();
  std::vector<uint64_t> seqs;
  for (const auto& e : events) seqs.push_back(e.seq);
  expect(seqs == std::vector<uint64_t>({1, 8, 9, 10, 11}), "newest events survive in order");

  bus.shutdown();
  bus.publish(conclave::make_event(conclave::EventType::wave_ended, "0"));
  expect(bus.dropped() == 7, "publish after shutdown is dropped");
}

void test_jsonl_sink() {
  const fs::path base = scratch_dir("jsonl");
  const fs::path log = base / "events.jsonl";
  {
    conclave::EventBus bus;
    bus.subscribe(std::make_shared<conclave::JsonlEventSink>(log.string()));
    bus.publish(conclave::make_event(conclave::EventType::run_phase_changed, "run-1",
                                     {{"from", "idle"}, {"to", "planning"}}));
    bus.publish(conclave::make_event(conclave::EventType::wave_started, "0"));
  }
  const auto lines = read_lines(log);
  expect(lines.size() == 2, "one line per event");
  std::optional<conclave::jsonlite::JsonError> err;
  const auto obj = conclave::jsonlite::parse(lines[0], &err);
  expect(!err, "event line is JSON");
  expect(conclave::jsonlite::get_string(obj, "type") == "run_phase_changed", "type field");
  expect(conclave::jsonlite::get_u64(obj, "seq") == 1, "seq field");
  expect(conclave::jsonlite::get_u64(obj, "schema") == conclave::version::EVENT_SCHEMA_VERSION,
         "schema field");
  fs::remove_all(base);
}

void test_run_stats_json() {
  conclave::RunStats stats;
  conclave::ExecutionResult ok;
  ok.success = true;
  ok.duration_ms = 12;
  conclave::ExecutionResult timeout;
  timeout.error_code = "execution_timeout";
  stats.record_execution(ok);
  stats.record_execution(timeout);
  stats.record_verdict(true);
  expect(stats.failure_categories().at("execution_timeout") == 1, "failure category");
  std::optional<conclave::jsonlite::JsonError> err;
  const auto obj = conclave::jsonlite::parse(stats.to_json(), &err);
  expect(!err, "stats JSON parses");
  expect(conclave::jsonlite::get_u64(obj, "executions") == 2, "executions");
  expect(conclave::jsonlite::get_u64(obj, "timeouts") == 1, "timeouts");
  expect(stats.execution_latency.count() == 2, "latency samples");
}

void test_audit_chain() {
  const fs::path base = scratch_dir("audit");
  const fs::path path = base / "audit.ndjson";
  {
    conclave::AuditLog log(path.string());
    expect(log.enabled(), "audit enabled with a path");
    log.record_phase("run-1", "planning");
    log.record_transition("run-1", "A", conclave::TicketStatus::pending,
                          conclave::TicketStatus::in_progress, "wave 0");
    conclave::ReviewVerdict v;
    v.ticket_id = "A";
    v.approved = true;
    v.alignment_score = 1.0;
    log.record_verdict("run-1", v);
    expect(log.entry_count() == 3 && log.failure_count() == 0, "three records");
  }
  auto check = conclave::verify_audit_chain(path.string());
  expect(check.ok && check.records == 3, "chain verifies");

  auto lines = read_lines(path);
  std::optional<conclave::jsonlite::JsonError> err;
  auto first = conclave::jsonlite::parse(lines[0], &err);
  expect(conclave::jsonlite::get_string(first, "prev") == conclave::kAuditGenesisDigest,
         "first record links to genesis");

  const auto pos = lines[1].find("wave 0");
  expect(pos != std::string::npos, "reason recorded");
  lines[1].replace(pos, 6, "wave 9");
  {
    std::ofstream f(path, std::ios::trunc);
    for (const auto& l : lines) f << l << "\n";
  }
  check = conclave::verify_audit_chain(path.string());
  expect(!check.ok && check.first_bad_seq == 3, "tampering breaks the next link");

  conclave::AuditLog disabled;
  expect(!disabled.enabled(), "no path disables the log");
  fs::remove_all(base);
}

void test_audit_chain_resumes() {
  const fs::path base = scratch_dir("audit-resume");
  const fs::path path = base / "audit.ndjson";
  {
    conclave::AuditLog log(path.string());
    log.record_phase("run-1", "planning");
    log.record_phase("run-1", "completed");
  }
  {
    conclave::AuditLog log(path.string());
    log.record_phase("run-2", "planning");
    expect(log.entry_count() == 1 && log.failure_count() == 0, "second log appends");
  }
  const auto check = conclave::verify_audit_chain(path.string());
  expect(check.ok && check.records == 3, "chain spans both logs");

  const auto lines = read_lines(path);
  std::optional<conclave::jsonlite::JsonError> err;
  const auto third = conclave::jsonlite::parse(lines[2], &err);
  expect(!err && conclave::jsonlite::get_u64(third, "seq") == 3, "sequence continues");
  expect(conclave::jsonlite::get_string(third, "prev") != conclave::kAuditGenesisDigest,
         "resumed record links to the previous one");

  {
    std::ofstream f(path, std::ios::app);
    f << "{not json\n";
  }
  conclave::AuditLog broken(path.string());
  expect(broken.failure_count() == 1, "unreadable tail disables the log");
  broken.record_phase("run-3", "planning");
  expect(broken.entry_count() == 0, "no record written after an unreadable tail");
  expect(read_lines(path).size() == 4, "nothing appended after an unreadable tail");
  fs::remove_all(base);
}

// ============================================================================
// Config
// ============================================================================

void test_config_validation() {
  conclave::RunConfig cfg;
  expect(conclave::validate_config(cfg).ok, "defaults are valid");

  cfg.max_runners = 0;
  cfg.ticket_timeout_ms = 0;
  cfg.approval_threshold = 1.5;
  auto r = conclave::validate_config(cfg);
  expect(!r.ok && r.errors.size() == 3, "three errors reported");

  conclave::RunConfig nested;
  nested.repo_path = "/srv/repo";
  nested.sandbox_root = "/srv/repo/.sandboxes";
  expect(!conclave::validate_config(nested).ok, "sandbox root inside repo rejected");

  conclave::RunConfig small;
  small.max_runners = 8;
  small.max_sandboxes = 4;
  expect(!conclave::validate_config(small).ok, "max_sandboxes below max_runners rejected");

  conclave::RunConfig warn;
  warn.cancel_grace_ms = 0;
  auto w = conclave::validate_config(warn);
  expect(w.ok && w.warnings.size() == 1, "zero grace warns");
}

void test_config_json() {
  std::optional<conclave::jsonlite::JsonError> err;
  auto cfg = conclave::parse_run_config_json(
      "{\"max_runners\":3,\"approval_threshold\":0.8,\"integrate_command\":[\"/usr/bin/git\",\"apply\"]}",
      &err);
  expect(!err, "config parses");
  expect(cfg.max_runners == 3 && cfg.approval_threshold == 0.8, "fields read");
  expect(cfg.integrate_command.size() == 2, "command vector read");
  expect(cfg.ticket_timeout_ms == 300000, "missing keys keep defaults");

  err.reset();
  conclave::parse_run_config_json("{\"max_runners\":\"four\"}", &err);
  expect(err.has_value() && err->code == "config_invalid", "wrong type rejected");

  for (const std::string key : {"max_runners", "max_followup_depth", "max_sandboxes"}) {
    err.reset();
    auto wide = conclave::parse_run_config_json("{\"" + key + "\":4294967297}", &err);
    expect(err.has_value() && err->code == "config_invalid", key + " above 32 bits rejected");
    expect(wide.max_runners == conclave::RunConfig{}.max_runners, key + " not truncated");
  }
  err.reset();
  auto edge = conclave::parse_run_config_json("{\"max_sandboxes\":4294967295}", &err);
  expect(!err && edge.max_sandboxes == 4294967295u, "32-bit maximum accepted");

  err.reset();
  auto obj = conclave::parse_objective_json(
      "{\"description\":\"d\",\"requirements\":[\"r1\",\"r2\"],\"constraints\":[\"c\"]}", &err);
  expect(!err && obj.requirements.size() == 2 && obj.constraints.size() == 1, "objective parses");

  const std::string round = conclave::run_config_to_json(cfg);
  err.reset();
  auto back = conclave::parse_run_config_json(round, &err);
  expect(!err && back.max_runners == 3, "config serializes to readable JSON");
}

void test_config_env_overrides() {
  setenv("CONCLAVE_MAX_RUNNERS", "6", 1);
  setenv("CONCLAVE_APPROVAL_THRESHOLD", "not-a-number", 1);
  setenv("CONCLAVE_AUDIT_LOG", "/tmp/conclave-audit.ndjson", 1);
  conclave::RunConfig cfg;
  const auto warnings = conclave::apply_env_overrides(cfg);
  unsetenv("CONCLAVE_MAX_RUNNERS");
  unsetenv("CONCLAVE_APPROVAL_THRESHOLD");
  unsetenv("CONCLAVE_AUDIT_LOG");
  expect(cfg.max_runners == 6, "runner override");
  expect(cfg.approval_threshold == 0.7, "bad value skipped");
  expect(cfg.audit_log_path == "/tmp/conclave-audit.ndjson", "audit path override");
  expect(warnings.size() == 1, "bad value reported");
}

// ============================================================================
// Planner / adapters
// ============================================================================

void test_planner_decomposition() {
  const fs::path base = scratch_dir("planner");
  const fs::path repo = make_repo(base);
  conclave::HeuristicPlanner planner;
  auto objective =
      make_objective({"Add greeting endpoint", "Setup logging config", "", "Document the API"});
  const auto plan = planner.plan(objective, conclave::capture_snapshot(repo.string()));
  expect(plan.ok && plan.tickets.size() == 3, "blank requirements skipped");
  expect(plan.tickets[0].id == "TKT-001" && plan.tickets[2].id == "TKT-003", "sequential ids");
  expect(plan.tickets[0].criteria.size() == 3, "three criteria per ticket");
  expect(plan.tickets[1].priority == conclave::TicketPriority::high, "setup ticket raised");
  expect(plan.tickets[0].dependencies.empty(), "earlier ticket independent");
  expect(plan.tickets[2].dependencies == std::vector<std::string>({"TKT-002"}),
         "later ticket depends on setup");
  expect(plan.tickets[0].metadata.at("repo_languages") == "C++", "languages detected");
  expect(plan.tickets[0].metadata.at("repo_frameworks") == "CMake", "frameworks detected");
  expect(plan.tickets[0].description.find("keep the public API stable") != std::string::npos,
         "constraints in description");

  expect(!conclave::validate_objective(make_objective({"  ", ""})).ok, "no requirements");
  conclave::Objective empty = make_objective({"x"});
  empty.description = " ";
  const auto bad = conclave::validate_objective(empty);
  expect(!bad.ok && bad.error_code == conclave::ErrorCode::planning_error, "empty description");
  fs::remove_all(base);
}

void test_command_adapters() {
  const fs::path base = scratch_dir("adapters");
  conclave::CommandFinalTest ok({"/bin/true"}, 1000);
  expect(ok.run(base.string()).passed, "true passes");
  conclave::CommandFinalTest bad({"/bin/false"}, 1000);
  const auto f = bad.run(base.string());
  expect(!f.passed && f.summary.find("exit code 1") != std::string::npos, "false fails");

  // cat accepts the patch path and succeeds, standing in for a patch tool.
  conclave::CommandIntegrator cat(base.string(), {"/bin/cat"});
  conclave::ExecutionResult a;
  a.ticket_id = "A";
  a.diff = "+x\n";
  conclave::ExecutionResult empty;
  empty.ticket_id = "B";
  const auto out = cat.integrate({a, empty});
  expect(out.ok && out.applied == std::vector<std::string>({"A", "B"}), "patches applied in order");

  conclave::CommandIntegrator failing(base.string(), {"/bin/false"});
  const auto failed = failing.integrate({a});
  expect(!failed.ok && failed.applied.empty(), "failed application reported");

  conclave::CommandIntegrator defaulted(base.string());
  expect(defaulted.command() == std::vector<std::string>({"/usr/bin/git", "apply"}),
         "default integrate command");

  conclave::NullIntegrator null_integrator;
  expect(null_integrator.integrate({a}).ok, "null integrator succeeds");
  fs::remove_all(base);
}

// ============================================================================
// Orchestrator
// ============================================================================

void test_orchestrator_happy_path() {
  const fs::path base = scratch_dir("happy");
  const fs::path repo = make_repo(base);
  conclave::RunConfig cfg = make_config(base, repo);
  cfg.event_log_path = (base / "events.jsonl").string();
  cfg.audit_log_path = (base / "audit.ndjson").string();

  auto impl = std::make_shared<ScriptedImplementer>();
  auto recent = std::make_shared<conclave::RecentEventsSink>(10000);
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  ports.event_sinks = {recent};
  conclave::Orchestrator orch(cfg, ports);

  const auto report =
      orch.run(make_objective({"Setup greeting module", "Add greeting endpoint", "Write docs"}));
  expect(report.phase == conclave::RunPhase::completed, "run completed");
  expect(report.success, "run successful");
  expect(report.tickets.size() == 3, "three tickets reported");
  expect(report.count(conclave::TicketStatus::approved) == 3, "all approved");
  expect(report.waves == 2, "setup wave then the rest");
  expect(report.find("TKT-001")->wave == 0u && report.find("TKT-003")->wave == 1u, "wave numbers");
  expect(report.integration && report.integration->applied.size() == 3, "integrated");
  expect(report.final_test && report.final_test->passed, "final test ran");
  expect(std::abs(report.aggregate_alignment - 1.0) < 1e-9, "aggregate alignment");
  expect(orch.phase() == conclave::RunPhase::completed, "phase observable after run");

  const auto check = conclave::verify_audit_chain(cfg.audit_log_path);
  expect(check.ok && check.records == report.audit_records, "audit chain intact");
  expect(report.audit_head.size() == 64, "audit head digest");

  std::vector<std::string> phases;
  size_t waves_started = 0;
  size_t verdicts = 0;
  for (const auto& e : recent->snapshot()) {
    if (e.type == conclave::EventType::run_phase_changed) phases.push_back(e.data.at("to"));
    if (e.type == conclave::EventType::wave_started) ++waves_started;
    if (e.type == conclave::EventType::review_verdict) ++verdicts;
  }
  expect(phases == std::vector<std::string>({"planning", "executing", "reviewing", "integrating",
                                             "completed"}),
         "phase sequence");
  expect(waves_started == 2 && verdicts == 3, "wave and verdict events");
  expect(read_lines(cfg.event_log_path).size() == report.events_published, "event log complete");
  expect(!fs::exists(base / "sandboxes") || fs::is_empty(base / "sandboxes"), "no sandboxes leaked");

  std::optional<conclave::jsonlite::JsonError> err;
  const auto json = conclave::jsonlite::parse(conclave::report_to_json(report), &err);
  expect(!err, "report JSON parses");
  expect(conclave::jsonlite::get_u64(json, "format") == conclave::version::REPORT_FORMAT_VERSION,
         "report format version");
  const auto review_it = json.find("review");
  const auto* review = review_it == json.end()
                           ? nullptr
                           : std::get_if<conclave::jsonlite::Object>(&review_it->second.v);
  expect(review && conclave::jsonlite::get_u64(*review, "total_reviews") == 3 &&
             conclave::jsonlite::get_u64(*review, "approved") == 3,
         "review summary embedded in the report");
  expect(conclave::render_text(report).find("TKT-002 [approved]") != std::string::npos,
         "text report lists tickets");
  fs::remove_all(base);
}

void test_orchestrator_failure_blocks_dependent() {
  const fs::path base = scratch_dir("blocked");
  const fs::path repo = make_repo(base);
  conclave::RunConfig cfg = make_config(base, repo);
  cfg.max_followup_depth = 0;

  auto impl = std::make_shared<ScriptedImplementer>();
  impl->on("TKT-001", [](const conclave::ImplementerRequest& req, const conclave::CancelToken&) {
    return failing_result(req.ticket);
  });
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  conclave::Orchestrator orch(cfg, ports);

  const auto report = orch.run(make_objective({"Setup the project", "Add feature"}));
  const auto* a = report.find("TKT-001");
  const auto* b = report.find("TKT-002");
  expect(a && a->status == conclave::TicketStatus::failed, "A failed");
  expect(a->reason.find("execution_failure") == 0, "A reason carries the error code");
  expect(a->alignment_score.has_value(), "failed result still reviewed");
  expect(b && b->status == conclave::TicketStatus::blocked, "B blocked");
  expect(b->reason == "dependency TKT-001 failed", "B reason");
  expect(!b->wave.has_value(), "B never assigned a wave");
  const auto calls = impl->calls();
  expect(std::find(calls.begin(), calls.end(), "TKT-002") == calls.end(), "B never dispatched");

  bool parked = false;
  for (const auto& row : report.tickets) {
    if (row.parent_id == "TKT-001") {
      parked = true;
      expect(row.status == conclave::TicketStatus::pending, "follow-up left pending");
      expect(row.reason == "regeneration depth exhausted", "follow-up reason");
    }
  }
  expect(parked, "follow-ups shown in report");
  expect(report.phase == conclave::RunPhase::completed && !report.success,
         "run completes without success");
  fs::remove_all(base);
}

void test_orchestrator_planning_error() {
  const fs::path base = scratch_dir("planerr");
  const fs::path repo = make_repo(base);
  auto impl = std::make_shared<ScriptedImplementer>();
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  conclave::Orchestrator orch(make_config(base, repo), ports);

  conclave::Objective objective = make_objective({});
  const auto report = orch.run(objective);
  expect(report.phase == conclave::RunPhase::failed, "planning failure fails the run");
  expect(report.error_code == conclave::ErrorCode::planning_error, "planning_error");
  expect(report.tickets.empty() && !report.fatal_reason.empty(), "empty list with reason");
  expect(impl->calls().empty(), "nothing dispatched");
  fs::remove_all(base);
}

void test_orchestrator_cycle_zero_dispatch() {
  const fs::path base = scratch_dir("cycle");
  const fs::path repo = make_repo(base);
  auto impl = std::make_shared<ScriptedImplementer>();
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  ports.planner = std::make_shared<FixedPlanner>(std::vector<conclave::Ticket>{
      make_ticket("P"), make_ticket("Q", {"R"}), make_ticket("R", {"Q"})});
  conclave::Orchestrator orch(make_config(base, repo), ports);

  const auto report = orch.run(make_objective({"anything"}));
  expect(report.phase == conclave::RunPhase::failed, "cycle fails the run");
  expect(report.error_code == conclave::ErrorCode::dependency_cycle, "dependency_cycle");
  expect(report.fatal_reason.find("Q") != std::string::npos &&
             report.fatal_reason.find("R") != std::string::npos,
         "fatal reason names the cycle");
  expect(impl->calls().empty(), "zero tickets dispatched");
  expect(report.waves == 0, "no wave computed");
  fs::remove_all(base);
}

void test_orchestrator_regeneration_bound() {
  const fs::path base = scratch_dir("regen");
  const fs::path repo = make_repo(base);
  conclave::RunConfig cfg = make_config(base, repo);
  cfg.max_followup_depth = 2;

  auto impl = std::make_shared<ScriptedImplementer>();
  impl->otherwise([](const conclave::ImplementerRequest& req, const conclave::CancelToken&) {
    return failing_result(req.ticket);
  });
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  conclave::Orchestrator orch(cfg, ports);

  const auto report = orch.run(make_objective({"Add feature"}));
  for (uint32_t g : impl->generations()) expect(g <= 2, "no dispatch beyond max depth");
  expect(report.generations.size() == 3, "generations 0..2 executed");

  size_t parked = 0;
  for (const auto& row : report.tickets) {
    if (row.generation == 3) {
      ++parked;
      expect(row.status == conclave::TicketStatus::pending, "depth 3 not dispatched");
      expect(row.reason == "regeneration depth exhausted", "parked reason");
    }
    expect(row.generation <= 3, "follow-ups stop one past the bound");
  }
  expect(parked > 0, "reviewer kept producing follow-ups");
  fs::remove_all(base);
}

void test_orchestrator_stop() {
  const fs::path base = scratch_dir("stop");
  const fs::path repo = make_repo(base);
  auto impl = std::make_shared<ScriptedImplementer>();
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  conclave::Orchestrator orch(make_config(base, repo), ports);

  impl->on("TKT-001", [&orch](const conclave::ImplementerRequest& req,
                              const conclave::CancelToken& cancel) {
    orch.stop();
    cancel.wait_for(std::chrono::milliseconds(5000));
    return passing_result(req.ticket);
  });

  const auto report = orch.run(make_objective({"Setup the project", "Add feature"}));
  expect(report.stopped, "report marks the stop");
  expect(report.phase == conclave::RunPhase::failed, "stopped run ends failed");
  expect(report.error_code == conclave::ErrorCode::cancelled, "cancelled error code");
  expect(report.find("TKT-001")->status == conclave::TicketStatus::cancelled, "in-flight cancelled");
  expect(report.find("TKT-002")->status == conclave::TicketStatus::pending, "undispatched pending");
  expect(report.find("TKT-002")->reason == "run stopped", "undispatched reason");
  expect(!report.integration.has_value(), "integration skipped");
  fs::remove_all(base);
}

void test_orchestrator_cancel_ticket() {
  const fs::path base = scratch_dir("cancelticket");
  const fs::path repo = make_repo(base);
  auto impl = std::make_shared<ScriptedImplementer>();
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  conclave::RunConfig cfg = make_config(base, repo);
  conclave::Orchestrator orch(cfg, ports);

  impl->on("TKT-001", [&orch](const conclave::ImplementerRequest& req,
                              const conclave::CancelToken& cancel) {
    orch.cancel("TKT-001");
    cancel.wait_for(std::chrono::milliseconds(5000));
    return passing_result(req.ticket);
  });

  const auto report = orch.run(make_objective({"Add feature", "Write docs"}));
  expect(report.find("TKT-001")->status == conclave::TicketStatus::cancelled, "ticket cancelled");
  expect(report.find("TKT-002")->status == conclave::TicketStatus::approved, "sibling approved");
  expect(report.phase == conclave::RunPhase::completed, "run continues after a cancel");
  fs::remove_all(base);
}

void test_orchestrator_integration_failure() {
  const fs::path base = scratch_dir("integration");
  const fs::path repo = make_repo(base);
  auto impl = std::make_shared<ScriptedImplementer>();
  auto integrator = std::make_shared<FailingIntegrator>();
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  ports.integrator = integrator;
  conclave::Orchestrator orch(make_config(base, repo), ports);

  const auto report = orch.run(make_objective({"Add feature", "Write docs"}));
  expect(integrator->calls == 1 && integrator->received == 2, "integrator invoked once");
  expect(report.integration && !report.integration->ok, "integration failure recorded");
  expect(report.count(conclave::TicketStatus::approved) == 2, "verdicts unchanged");
  expect(report.phase == conclave::RunPhase::completed && !report.success, "partial success");
  fs::remove_all(base);
}

void test_orchestrator_internal_error() {
  const fs::path base = scratch_dir("internal");
  const fs::path repo = make_repo(base);
  auto impl = std::make_shared<ScriptedImplementer>();
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  ports.integrator = std::make_shared<ThrowingIntegrator>();
  conclave::Orchestrator orch(make_config(base, repo), ports);

  const auto report = orch.run(make_objective({"Add feature"}));
  expect(report.phase == conclave::RunPhase::failed, "exception fails the run");
  expect(report.error_code == conclave::ErrorCode::internal_error, "internal_error");
  expect(report.fatal_reason == "integrator exploded", "exception message kept");
  expect(report.tickets.size() == 1 && report.count(conclave::TicketStatus::approved) == 1,
         "partial report keeps ticket outcomes");
  fs::remove_all(base);
}

void test_orchestrator_reviewer_non_standard_exception() {
  const fs::path base = scratch_dir("review42");
  const fs::path repo = make_repo(base);
  conclave::RunConfig cfg = make_config(base, repo);
  cfg.max_followup_depth = 0;
  auto impl = std::make_shared<ScriptedImplementer>();
  auto recent = std::make_shared<conclave::RecentEventsSink>(1000);
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  ports.reviewer = std::make_shared<NonStandardThrowingReviewer>();
  ports.event_sinks = {recent};
  conclave::Orchestrator orch(cfg, ports);

  const auto report = orch.run(make_objective({"Add feature"}));
  expect(report.phase == conclave::RunPhase::completed && !report.success,
         "run completes without success");
  const auto* a = report.find("TKT-001");
  expect(a && a->status == conclave::TicketStatus::rejected, "ticket rejected");
  size_t verdicts = 0;
  for (const auto& e : recent->snapshot()) {
    if (e.type != conclave::EventType::review_verdict) continue;
    ++verdicts;
    expect(e.data.at("approved") == "false", "verdict not approved");
  }
  expect(verdicts == 1, "verdict published despite the throw");
  expect(report.review.rejected == 1 && report.review.approved == 0,
         "review summary counts the rejection");
  fs::remove_all(base);
}

void test_orchestrator_runs_isolated() {
  const fs::path base = scratch_dir("isolated");
  const fs::path repo = make_repo(base);
  conclave::RunConfig cfg = make_config(base, repo);
  cfg.audit_log_path = (base / "audit.ndjson").string();

  std::mutex mu;
  std::vector<std::string> workspaces;
  auto impl = std::make_shared<ScriptedImplementer>();
  impl->otherwise([&](const conclave::ImplementerRequest& req, const conclave::CancelToken&) {
    std::lock_guard<std::mutex> lk(mu);
    workspaces.push_back(req.workspace_path);
    return passing_result(req.ticket);
  });
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  conclave::Orchestrator orch(cfg, ports);

  const auto first = orch.run(make_objective({"Add feature"}));
  const auto second = orch.run(make_objective({"Add feature"}));
  expect(first.success && second.success, "both runs succeed");
  expect(first.run_id != second.run_id, "run ids differ");
  expect(workspaces.size() == 2 && workspaces[0] != workspaces[1], "workspaces differ");
  expect(workspaces[0].find(first.run_id) != std::string::npos &&
             workspaces[1].find(second.run_id) != std::string::npos,
         "workspace lives under its run id");
  expect(fs::is_empty(base / "sandboxes"), "per-run roots removed");

  const auto check = conclave::verify_audit_chain(cfg.audit_log_path);
  expect(check.ok && check.records == first.audit_records + second.audit_records,
         "audit chain spans both runs");
  fs::remove_all(base);
}

void test_orchestrator_config_invalid() {
  const fs::path base = scratch_dir("badconfig");
  const fs::path repo = make_repo(base);
  conclave::RunConfig cfg = make_config(base, repo);
  cfg.max_runners = 0;
  auto impl = std::make_shared<ScriptedImplementer>();
  conclave::OrchestratorPorts ports;
  ports.implementer = impl;
  conclave::Orchestrator orch(cfg, ports);
  const auto report = orch.run(make_objective({"Add feature"}));
  expect(report.error_code == conclave::ErrorCode::config_invalid, "config_invalid");
  expect(report.tickets.empty() && impl->calls().empty(), "nothing planned");

  conclave::Orchestrator no_impl(make_config(base, repo), conclave::OrchestratorPorts{});
  expect(no_impl.run(make_objective({"x"})).error_code == conclave::ErrorCode::config_invalid,
         "missing implementer rejected");
  fs::remove_all(base);
}

}  // namespace

int main() {
  std::cout << "=== Conclave Engine Test Suite ===\n";

  std::cout << "\n[Hashing & Formats]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("JSON strictness", test_json_strictness);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Ticket State Machine]\n";
  run_test("transition table", test_transition_table);
  run_test("error code strings", test_error_code_strings);

  std::cout << "\n[TicketGraph]\n";
  run_test("add_ticket errors", test_graph_add_ticket_errors);
  run_test("cycle detection", test_graph_cycle_detection);
  run_test("wave ordering property", test_wave_ordering_property);
  run_test("wave determinism", test_wave_determinism);
  run_test("failed dependency blocks", test_failed_dependency_blocks);
  run_test("follow-up parent edge", test_follow_up_parent_edge);
  run_test("status history and criteria", test_status_history_and_criteria);

  std::cout << "\n[ReviewGate]\n";
  run_test("score example 0.94", test_score_example);
  run_test("failure never approved", test_failure_never_approved);
  run_test("score bounds", test_score_bounds);
  run_test("follow-up synthesis", test_follow_up_synthesis);
  run_test("risks and summary", test_review_risks_and_summary);

  std::cout << "\n[Sandbox]\n";
  run_test("ignore rules", test_ignore_rules);
  run_test("snapshot digest", test_snapshot_digest);
  run_test("lease lifecycle", test_sandbox_lease_lifecycle);
  run_test("sandbox names never reused", test_sandbox_names_never_reused);
  run_test("changed repository refused", test_sandbox_rejects_changed_repo);
  run_test("run_process", test_run_process);

  std::cout << "\n[ExecutionCoordinator]\n";
  run_test("pool bound", test_wave_pool_bound);
  run_test("cancel in flight", test_cancel_in_flight);
  run_test("cancel before start", test_cancel_before_start);
  run_test("cooperative timeout", test_timeout_cooperative);
  run_test("uncooperative timeout abandoned", test_timeout_abandons_uncooperative);
  run_test("sandbox failure scoped", test_sandbox_failure_scoped);
  run_test("implementer exception contained", test_implementer_exception_contained);
  run_test("non-standard exception contained", test_non_standard_exception_contained);
  run_test("execution log events", test_execution_log_events);

  std::cout << "\n[Observability & Audit]\n";
  run_test("event ordering", test_event_ordering);
  run_test("event drop-oldest", test_event_drop_oldest);
  run_test("JSONL sink", test_jsonl_sink);
  run_test("run stats JSON", test_run_stats_json);
  run_test("audit chain", test_audit_chain);
  run_test("audit chain resumes", test_audit_chain_resumes);

  std::cout << "\n[Config]\n";
  run_test("validation", test_config_validation);
  run_test("JSON parsing", test_config_json);
  run_test("environment overrides", test_config_env_overrides);

  std::cout << "\n[Planner & Adapters]\n";
  run_test("planner decomposition", test_planner_decomposition);
  run_test("command adapters", test_command_adapters);

  std::cout << "\n[Orchestrator]\n";
  run_test("happy path", test_orchestrator_happy_path);
  run_test("failure blocks dependent", test_orchestrator_failure_blocks_dependent);
  run_test("planning error", test_orchestrator_planning_error);
  run_test("cycle means zero dispatch", test_orchestrator_cycle_zero_dispatch);
  run_test("regeneration bound", test_orchestrator_regeneration_bound);
  run_test("stop", test_orchestrator_stop);
  run_test("cancel ticket", test_orchestrator_cancel_ticket);
  run_test("integration failure", test_orchestrator_integration_failure);
  run_test("internal error", test_orchestrator_internal_error);
  run_test("reviewer non-standard exception", test_orchestrator_reviewer_non_standard_exception);
  run_test("runs isolated", test_orchestrator_runs_isolated);
  run_test("config invalid", test_orchestrator_config_invalid);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
