#pragma once

// conclave/planner.hpp — Default PlannerPort: one ticket per requirement.
//
// DECOMPOSITION:
//   - Requirement i (1-based, blank requirements skipped) becomes ticket
//     "TKT-<iii>" with three criteria:
//       "Implement: <requirement>", "Code passes all tests", "Changes are documented".
//   - A ticket whose requirement mentions setup, initialize or configure is
//     raised to high priority and every later ticket depends on it.
//   - Repository languages/frameworks are recorded in ticket metadata so an
//     implementer can pick toolchains without re-scanning.
//
// EXTENSION_POINT: model_backed_planner
//   Current: keyword heuristics only.
//   Upgrade path: a PlannerPort that asks a model to split requirements. It
//   must still return ids that are unique and stable for the run, and the
//   graph rejects cycles regardless of where the tickets came from.

#include <cstdint>
#include <string>
#include <vector>

#include "conclave/ports.hpp"

namespace conclave {

struct RepositoryContext {
  std::string path;
  std::vector<std::string> files;       // relative, sorted
  std::vector<std::string> languages;   // sorted
  std::vector<std::string> frameworks;  // sorted
};

// Walks the repository with the sandbox ignore rules.
RepositoryContext analyze_repository(const std::string& repo_path);

// Empty description or no non-blank requirement -> planning_error.
PlanResult validate_objective(const Objective& objective);

class HeuristicPlanner : public PlannerPort {
 public:
  PlanResult plan(const Objective& objective, const BaseSnapshot& snapshot) override;

  std::vector<Ticket> decompose(const Objective& objective, const RepositoryContext& repo) const;
  void identify_dependencies(std::vector<Ticket>& tickets) const;
};

}  // namespace conclave
