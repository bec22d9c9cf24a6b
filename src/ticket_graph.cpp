#include "conclave/ticket_graph.hpp"

#include <algorithm>

namespace conclave {

namespace {

std::string join_ids(const std::vector<std::string>& ids, const char* sep) {
  std::string out;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) out += sep;
    out += ids[i];
  }
  return out;
}

}  // namespace

void TicketGraph::publish(EventType type, const std::string& entity,
                          std::map<std::string, std::string> data) const {
  if (!events_) return;
  events_->publish(make_event(type, entity, std::move(data)));
}

Ticket* TicketGraph::find_mutable(const std::string& id) {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &tickets_[it->second];
}

const Ticket* TicketGraph::get(const std::string& id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &tickets_[it->second];
}

GraphResult TicketGraph::add_ticket(Ticket ticket) {
  if (ticket.id.empty()) {
    return GraphResult::failure(ErrorCode::planning_error, "ticket id must not be empty");
  }
  if (index_.count(ticket.id)) {
    return GraphResult::failure(ErrorCode::duplicate_ticket, "duplicate ticket id: " + ticket.id);
  }
  std::vector<std::string> deps;
  std::set<std::string> seen;
  for (const auto& d : ticket.dependencies) {
    if (d == ticket.id) {
      return GraphResult::failure(ErrorCode::dependency_cycle,
                                  "ticket " + ticket.id + " depends on itself");
    }
    if (seen.insert(d).second) deps.push_back(d);
  }
  ticket.dependencies = std::move(deps);
  ticket.status = TicketStatus::pending;

  const std::string id = ticket.id;
  std::map<std::string, std::string> data{
      {"title", ticket.title},
      {"priority", to_string(ticket.priority)},
      {"dependencies", join_ids(ticket.dependencies, ",")},
      {"generation", std::to_string(ticket.generation)},
  };
  if (ticket.is_follow_up()) data["parent_ticket_id"] = ticket.parent_id();

  index_.emplace(id, tickets_.size());
  tickets_.push_back(std::move(ticket));
  history_[id];
  publish(EventType::ticket_created, id, std::move(data));
  return {};
}

bool TicketGraph::cycles() const { return !find_cycle().empty(); }

std::vector<std::string> TicketGraph::find_cycle() const {
  // Iterative three-colour DFS over creation order; unknown ids are ignored.
  enum class Colour { white, grey, black };
  std::vector<Colour> colour(tickets_.size(), Colour::white);
  struct Frame {
    size_t node;
    size_t next_dep;
  };

  for (size_t root = 0; root < tickets_.size(); ++root) {
    if (colour[root] != Colour::white) continue;
    std::vector<Frame> stack{{root, 0}};
    colour[root] = Colour::grey;
    while (!stack.empty()) {
      Frame& top = stack.back();
      const Ticket& t = tickets_[top.node];
      if (top.next_dep >= t.dependencies.size()) {
        colour[top.node] = Colour::black;
        stack.pop_back();
        continue;
      }
      auto it = index_.find(t.dependencies[top.next_dep++]);
      if (it == index_.end()) continue;
      const size_t dep = it->second;
      if (colour[dep] == Colour::grey) {
        std::vector<std::string> cycle;
        bool on_cycle = false;
        for (const Frame& f : stack) {
          if (f.node == dep) on_cycle = true;
          if (on_cycle) cycle.push_back(tickets_[f.node].id);
        }
        return cycle;
      }
      if (colour[dep] == Colour::white) {
        colour[dep] = Colour::grey;
        stack.push_back({dep, 0});
      }
    }
  }
  return {};
}

GraphResult TicketGraph::validate() const {
  for (const auto& t : tickets_) {
    for (const auto& d : t.dependencies) {
      if (!index_.count(d)) {
        return GraphResult::failure(ErrorCode::planning_error,
                                    "ticket " + t.id + " depends on unknown ticket " + d);
      }
    }
  }
  const std::vector<std::string> cycle = find_cycle();
  if (!cycle.empty()) {
    return GraphResult::failure(ErrorCode::dependency_cycle,
                                "dependency cycle: " + join_ids(cycle, " -> ") + " -> " +
                                    cycle.front());
  }
  return {};
}

bool TicketGraph::dependency_satisfied(const Ticket& t, const std::string& dep,
                                       const std::set<std::string>& completed_ids) const {
  if (completed_ids.count(dep)) return true;
  if (t.is_follow_up() && dep == t.parent_id()) {
    const Ticket* parent = get(dep);
    return parent && is_terminal(parent->status) && parent->status != TicketStatus::blocked;
  }
  return false;
}

std::optional<std::string> TicketGraph::blocking_dependency(const Ticket& t) const {
  for (const auto& d : t.dependencies) {
    const Ticket* dep = get(d);
    if (!dep || !is_terminal_failure(dep->status)) continue;
    if (t.is_follow_up() && d == t.parent_id() && dep->status != TicketStatus::blocked) continue;
    return d;
  }
  return std::nullopt;
}

WavePlan TicketGraph::next_wave(const std::set<std::string>& completed_ids) {
  WavePlan plan;

  bool changed = true;
  while (changed) {
    changed = false;
    for (auto& t : tickets_) {
      if (t.status != TicketStatus::pending || wave_of_.count(t.id)) continue;
      const auto dep = blocking_dependency(t);
      if (!dep) continue;
      const Ticket* d = get(*dep);
      const std::string reason = "dependency " + *dep + " " + to_string(d->status);
      if (set_status(t.id, TicketStatus::blocked, reason).ok) {
        plan.newly_blocked.push_back(t.id);
        changed = true;
      }
    }
  }

  for (const auto& t : tickets_) {
    if (t.status != TicketStatus::pending || wave_of_.count(t.id)) continue;
    const bool ready = std::all_of(t.dependencies.begin(), t.dependencies.end(),
                                   [&](const std::string& d) {
                                     return dependency_satisfied(t, d, completed_ids);
                                   });
    if (ready) plan.tickets.push_back(t.id);
  }

  if (plan.tickets.empty()) return plan;
  plan.index = next_wave_index_++;
  for (const auto& id : plan.tickets) wave_of_[id] = plan.index;
  return plan;
}

GraphResult TicketGraph::set_status(const std::string& id, TicketStatus to,
                                    const std::string& reason) {
  Ticket* t = find_mutable(id);
  if (!t) {
    return GraphResult::failure(ErrorCode::internal_error, "unknown ticket: " + id);
  }
  const TicketStatus from = t->status;
  if (!transition_allowed(from, to)) {
    return GraphResult::failure(ErrorCode::invalid_transition,
                                "ticket " + id + ": " + to_string(from) + " -> " + to_string(to) +
                                    " is not allowed");
  }
  t->status = to;
  StatusChange change{from, to, reason, now_unix_ms()};
  history_[id].push_back(change);
  if (!reason.empty()) {
    reasons_[id] = reason;
  } else if (to == TicketStatus::approved) {
    reasons_.erase(id);
  }

  std::map<std::string, std::string> data{{"from", to_string(from)}, {"to", to_string(to)}};
  if (!reason.empty()) data["reason"] = reason;
  publish(EventType::ticket_status_changed, id, std::move(data));
  if (observer_) observer_(*t, change);
  return {};
}

void TicketGraph::set_reason(const std::string& id, const std::string& reason) {
  if (index_.count(id)) reasons_[id] = reason;
}

std::string TicketGraph::reason_of(const std::string& id) const {
  auto it = reasons_.find(id);
  return it == reasons_.end() ? "" : it->second;
}

GraphResult TicketGraph::apply_criteria(const std::string& id,
                                        const std::vector<AcceptanceCriterion>& reported) {
  Ticket* t = find_mutable(id);
  if (!t) {
    return GraphResult::failure(ErrorCode::internal_error, "unknown ticket: " + id);
  }
  for (size_t i = 0; i < reported.size(); ++i) {
    const AcceptanceCriterion& r = reported[i];
    AcceptanceCriterion* target = nullptr;
    if (!r.description.empty()) {
      for (auto& c : t->criteria) {
        if (c.description == r.description) {
          target = &c;
          break;
        }
      }
    } else if (i < t->criteria.size()) {
      target = &t->criteria[i];
    }
    if (!target) continue;
    target->met = r.met;
    target->evidence = r.evidence;
  }
  return {};
}

void TicketGraph::assign_runner(const std::string& id, const std::string& runner_id) {
  if (Ticket* t = find_mutable(id)) t->assigned_runner = runner_id;
}

std::vector<StatusChange> TicketGraph::status_history(const std::string& id) const {
  auto it = history_.find(id);
  return it == history_.end() ? std::vector<StatusChange>{} : it->second;
}

std::vector<std::string> TicketGraph::approved_ids() const {
  std::vector<std::string> out;
  for (const auto& t : tickets_) {
    if (t.status == TicketStatus::approved) out.push_back(t.id);
  }
  return out;
}

std::optional<uint32_t> TicketGraph::wave_of(const std::string& id) const {
  auto it = wave_of_.find(id);
  if (it == wave_of_.end()) return std::nullopt;
  return it->second;
}

std::map<TicketStatus, size_t> TicketGraph::count_by_status() const {
  std::map<TicketStatus, size_t> out;
  for (const auto& t : tickets_) ++out[t.status];
  return out;
}

}  // namespace conclave
