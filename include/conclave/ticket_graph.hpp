#pragma once

// conclave/ticket_graph.hpp — Tickets, dependency edges and wave layering.
//
// DESIGN:
//   The graph owns every Ticket of a run, in creation order. Tickets are never
//   removed. Only the orchestrator thread mutates the graph, between waves;
//   workers receive copies.
//
// INVARIANTS:
//   - Ticket ids are unique and non-empty.
//   - No self-dependency is ever stored. Longer cycles are reported by
//     cycles()/find_cycle()/validate(); the orchestrator refuses to dispatch
//     anything from a cyclic graph.
//   - Every status change goes through set_status() and is checked against
//     transition_allowed(). Each accepted change is appended to the ticket's
//     history and published as ticket_status_changed.
//   - next_wave() assigns a ticket to at most one wave.
//
// DEPENDENCY SATISFACTION:
//   A dependency is satisfied when its id is in completed_ids (the approved
//   set). Exception: a follow-up's edge to its own parent
//   (metadata parent_ticket_id) is satisfied once the parent is terminal and
//   not blocked. The follow-up exists because the parent fell short, so the
//   parent will usually never be approved.
//
// EXTENSION_POINT: priority_ordering
//   Current: eligible tickets are returned in creation order.
//   Upgrade path: order by priority, then creation order. Wave membership must
//   stay a pure function of graph state so runs remain reproducible.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "conclave/observability.hpp"
#include "conclave/types.hpp"

namespace conclave {

struct GraphResult {
  bool ok{true};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;

  static GraphResult failure(ErrorCode code, std::string message) {
    return GraphResult{false, code, std::move(message)};
  }
};

struct StatusChange {
  TicketStatus from{TicketStatus::pending};
  TicketStatus to{TicketStatus::pending};
  std::string reason;
  uint64_t timestamp_unix_ms{0};
};

struct WavePlan {
  uint32_t index{0};
  std::vector<std::string> tickets;        // creation order
  std::vector<std::string> newly_blocked;  // blocked while computing this plan

  bool empty() const { return tickets.empty(); }
};

class TicketGraph {
 public:
  using TransitionObserver = std::function<void(const Ticket&, const StatusChange&)>;

  // `events` is not owned and may be null.
  explicit TicketGraph(EventSink* events = nullptr) : events_(events) {}

  // Called synchronously after every accepted set_status().
  void set_transition_observer(TransitionObserver observer) { observer_ = std::move(observer); }

  // Rejects an empty id (planning_error), a duplicate id (duplicate_ticket)
  // and a self-dependency (dependency_cycle). Duplicate dependency ids are
  // collapsed, first occurrence wins.
  GraphResult add_ticket(Ticket ticket);

  bool cycles() const;

  // Ids on one cycle in traversal order, empty when acyclic.
  std::vector<std::string> find_cycle() const;

  // Unknown dependency ids -> planning_error; any cycle -> dependency_cycle.
  GraphResult validate() const;

  // Blocks pending tickets whose dependencies can no longer be satisfied
  // (iterated to a fixpoint), then returns the pending, unassigned tickets
  // whose dependencies are all satisfied. Does not change their status.
  WavePlan next_wave(const std::set<std::string>& completed_ids);

  GraphResult set_status(const std::string& id, TicketStatus to, const std::string& reason = "");

  // Records a reason on a ticket without changing its status (e.g. a
  // pending ticket left behind by a stopped run).
  void set_reason(const std::string& id, const std::string& reason);
  std::string reason_of(const std::string& id) const;

  // Merges an implementer's criteria report into the ticket: entries are
  // matched by description, or by position when the description is empty.
  GraphResult apply_criteria(const std::string& id,
                             const std::vector<AcceptanceCriterion>& reported);

  void assign_runner(const std::string& id, const std::string& runner_id);

  const Ticket* get(const std::string& id) const;
  bool contains(const std::string& id) const { return index_.count(id) != 0; }
  size_t size() const { return tickets_.size(); }

  const std::vector<Ticket>& tickets() const { return tickets_; }
  std::vector<StatusChange> status_history(const std::string& id) const;
  std::vector<std::string> approved_ids() const;
  std::optional<uint32_t> wave_of(const std::string& id) const;
  std::map<TicketStatus, size_t> count_by_status() const;
  uint32_t waves_planned() const { return next_wave_index_; }

 private:
  bool dependency_satisfied(const Ticket& t, const std::string& dep,
                            const std::set<std::string>& completed_ids) const;
  // The dependency that makes `t` unrunnable, if any.
  std::optional<std::string> blocking_dependency(const Ticket& t) const;
  Ticket* find_mutable(const std::string& id);
  void publish(EventType type, const std::string& entity,
               std::map<std::string, std::string> data) const;

  EventSink* events_;
  TransitionObserver observer_;
  std::vector<Ticket> tickets_;
  std::unordered_map<std::string, size_t> index_;
  std::unordered_map<std::string, std::vector<StatusChange>> history_;
  std::unordered_map<std::string, std::string> reasons_;
  std::unordered_map<std::string, uint32_t> wave_of_;
  uint32_t next_wave_index_{0};
};

}  // namespace conclave
