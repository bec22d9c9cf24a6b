#include "conclave/adapters.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "conclave/sandbox.hpp"

namespace conclave {

namespace fs = std::filesystem;

namespace {

const std::vector<std::string>& default_integrate_command() {
  static const std::vector<std::string> cmd = {"/usr/bin/git", "apply"};
  return cmd;
}

ProcessSpec spec_for(const std::vector<std::string>& command, const std::string& cwd,
                     uint64_t timeout_ms) {
  ProcessSpec spec;
  spec.command = command.front();
  spec.argv.assign(command.begin() + 1, command.end());
  spec.cwd = cwd;
  spec.timeout_ms = timeout_ms;
  return spec;
}

// First non-empty line of the process output, for one-line summaries.
std::string first_line(const ProcessResult& r) {
  for (const std::string* text : {&r.stderr_text, &r.stdout_text}) {
    size_t start = 0;
    while (start < text->size()) {
      size_t end = text->find('\n', start);
      if (end == std::string::npos) end = text->size();
      if (end > start) return text->substr(start, end - start);
      start = end + 1;
    }
  }
  return "";
}

std::string describe_exit(const ProcessResult& r) {
  if (!r.spawned) return r.error_message;
  if (r.timed_out) return "timed out";
  std::string s = "exit code " + std::to_string(r.exit_code);
  const std::string line = first_line(r);
  if (!line.empty()) s += ": " + line;
  return s;
}

}  // namespace

CommandIntegrator::CommandIntegrator(std::string repo_path, std::vector<std::string> command,
                                     uint64_t timeout_ms)
    : repo_path_(std::move(repo_path)),
      command_(command.empty() ? default_integrate_command() : std::move(command)),
      timeout_ms_(timeout_ms) {}

IntegrationOutcome CommandIntegrator::integrate(const std::vector<ExecutionResult>& approved) {
  IntegrationOutcome out;
  std::error_code ec;
  fs::path patch_dir = fs::temp_directory_path(ec);
  if (!ec) {
    patch_dir /= "conclave-patches";
    fs::create_directories(patch_dir, ec);
  }
  if (ec) {
    out.error_message = "cannot create patch directory: " + ec.message();
    return out;
  }

  for (const auto& r : approved) {
    if (r.diff.empty()) {
      out.log.push_back(r.ticket_id + ": no changes");
      out.applied.push_back(r.ticket_id);
      continue;
    }
    const fs::path patch = patch_dir / (r.ticket_id + ".patch");
    {
      std::ofstream f(patch, std::ios::binary | std::ios::trunc);
      f << r.diff;
      if (!f) {
        out.error_message = r.ticket_id + ": cannot write patch file " + patch.string();
        return out;
      }
    }

    ProcessSpec spec = spec_for(command_, repo_path_, timeout_ms_);
    spec.argv.push_back(patch.string());
    const ProcessResult pr = run_process(spec);
    fs::remove(patch, ec);

    if (!pr.spawned || pr.timed_out || pr.exit_code != 0) {
      out.error_message = r.ticket_id + ": " + describe_exit(pr);
      out.log.push_back(out.error_message);
      return out;
    }
    out.log.push_back(r.ticket_id + ": applied");
    out.applied.push_back(r.ticket_id);
  }
  out.ok = true;
  return out;
}

CommandFinalTest::CommandFinalTest(std::vector<std::string> command, uint64_t timeout_ms)
    : command_(std::move(command)), timeout_ms_(timeout_ms) {}

FinalTestOutcome CommandFinalTest::run(const std::string& repo_path) {
  FinalTestOutcome out;
  if (command_.empty()) {
    out.summary = "no test command configured";
    return out;
  }
  const ProcessResult pr = run_process(spec_for(command_, repo_path, timeout_ms_));
  out.passed = pr.spawned && !pr.timed_out && pr.exit_code == 0;
  out.summary = out.passed ? "passed" : "failed: " + describe_exit(pr);
  return out;
}

IntegrationOutcome NullIntegrator::integrate(const std::vector<ExecutionResult>& approved) {
  IntegrationOutcome out;
  out.ok = true;
  for (const auto& r : approved) out.applied.push_back(r.ticket_id);
  out.log.push_back("integration skipped: no integrator configured");
  return out;
}

FinalTestOutcome NullFinalTest::run(const std::string& /*repo_path*/) {
  return FinalTestOutcome{true, "skipped: no final test configured"};
}

}  // namespace conclave
