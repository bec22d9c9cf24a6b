#include "conclave/planner.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iterator>
#include <set>
#include <system_error>

namespace conclave {

namespace fs = std::filesystem;

namespace {

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string join(const std::vector<std::string>& v, const char* sep) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += sep;
    out += v[i];
  }
  return out;
}

const char* language_for_extension(const std::string& ext) {
  if (ext == ".py") return "Python";
  if (ext == ".js" || ext == ".jsx") return "JavaScript";
  if (ext == ".ts" || ext == ".tsx") return "TypeScript";
  if (ext == ".java") return "Java";
  if (ext == ".go") return "Go";
  if (ext == ".rs") return "Rust";
  if (ext == ".c" || ext == ".h") return "C";
  if (ext == ".cc" || ext == ".cpp" || ext == ".cxx" || ext == ".hpp") return "C++";
  return nullptr;
}

const char* framework_for_file(const std::string& name) {
  if (name == "package.json") return "Node.js";
  if (name == "requirements.txt" || name == "setup.py" || name == "pyproject.toml") return "Python";
  if (name == "Cargo.toml") return "Rust/Cargo";
  if (name == "go.mod") return "Go/Modules";
  if (name == "CMakeLists.txt") return "CMake";
  return nullptr;
}

std::string ticket_id_for(size_t index) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "TKT-%03zu", index);
  return buf;
}

}  // namespace

RepositoryContext analyze_repository(const std::string& repo_path) {
  RepositoryContext ctx;
  ctx.path = repo_path;
  std::set<std::string> languages;
  std::set<std::string> frameworks;

  std::error_code ec;
  fs::recursive_directory_iterator it(repo_path, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    const fs::path p = it->path();
    const std::string name = p.filename().string();
    if (is_ignored_entry(name)) {
      if (it->is_directory(ec)) it.disable_recursion_pending();
      it.increment(ec);
      continue;
    }
    if (it->is_regular_file(ec)) {
      ctx.files.push_back(p.lexically_relative(repo_path).generic_string());
      if (const char* lang = language_for_extension(p.extension().string())) languages.insert(lang);
      if (const char* fw = framework_for_file(name)) frameworks.insert(fw);
    }
    it.increment(ec);
  }

  std::sort(ctx.files.begin(), ctx.files.end());
  ctx.languages.assign(languages.begin(), languages.end());
  ctx.frameworks.assign(frameworks.begin(), frameworks.end());
  return ctx;
}

PlanResult validate_objective(const Objective& objective) {
  PlanResult r;
  if (is_blank(objective.description)) {
    r.error_code = ErrorCode::planning_error;
    r.error_message = "objective description is empty";
    return r;
  }
  const bool any = std::any_of(objective.requirements.begin(), objective.requirements.end(),
                               [](const std::string& s) { return !is_blank(s); });
  if (!any) {
    r.error_code = ErrorCode::planning_error;
    r.error_message = "objective has no requirements";
    return r;
  }
  r.ok = true;
  return r;
}

PlanResult HeuristicPlanner::plan(const Objective& objective, const BaseSnapshot& snapshot) {
  PlanResult r = validate_objective(objective);
  if (!r.ok) return r;
  const RepositoryContext repo = analyze_repository(snapshot.path);
  r.tickets = decompose(objective, repo);
  identify_dependencies(r.tickets);
  return r;
}

std::vector<Ticket> HeuristicPlanner::decompose(const Objective& objective,
                                                const RepositoryContext& repo) const {
  std::vector<Ticket> tickets;
  size_t index = 0;
  for (const auto& requirement : objective.requirements) {
    if (is_blank(requirement)) continue;
    ++index;
    Ticket t;
    t.id = ticket_id_for(index);
    t.title = requirement;
    t.description = "Implement requirement: " + requirement;
    if (!objective.constraints.empty()) {
      t.description += "\nConstraints: " + join(objective.constraints, "; ");
    }
    t.criteria = {
        AcceptanceCriterion{"Implement: " + requirement, false, ""},
        AcceptanceCriterion{"Code passes all tests", false, ""},
        AcceptanceCriterion{"Changes are documented", false, ""},
    };
    t.priority = TicketPriority::medium;
    t.metadata[meta::kObjective] = objective.description;
    t.metadata[meta::kRequirementIndex] = std::to_string(index);
    if (!repo.languages.empty()) t.metadata["repo_languages"] = join(repo.languages, ",");
    if (!repo.frameworks.empty()) t.metadata["repo_frameworks"] = join(repo.frameworks, ",");
    tickets.push_back(std::move(t));
  }
  return tickets;
}

void HeuristicPlanner::identify_dependencies(std::vector<Ticket>& tickets) const {
  static const char* kSetupKeywords[] = {"setup", "initialize", "configure"};
  for (size_t i = 0; i < tickets.size(); ++i) {
    // The requirement text, not the appended constraints.
    const std::string desc = lower(tickets[i].title);
    const bool is_setup = std::any_of(std::begin(kSetupKeywords), std::end(kSetupKeywords),
                                      [&](const char* k) { return desc.find(k) != std::string::npos; });
    if (!is_setup) continue;
    tickets[i].priority = TicketPriority::high;
    for (size_t j = i + 1; j < tickets.size(); ++j) {
      auto& deps = tickets[j].dependencies;
      if (std::find(deps.begin(), deps.end(), tickets[i].id) == deps.end()) {
        deps.push_back(tickets[i].id);
      }
    }
  }
}

}  // namespace conclave
