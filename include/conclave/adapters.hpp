#pragma once

// conclave/adapters.hpp — Default IntegratorPort / FinalTestPort implementations.
//
// Both command adapters go through run_process(): argv[0] of the configured
// vector is the absolute executable path, the remaining entries are passed
// as arguments. Commands run with the repository as working directory.
//
// CommandIntegrator applies approved diffs one at a time, in the order given.
// Each diff is written to a temporary patch file whose path is appended to the
// command line. The first failing application stops integration; tickets
// already applied stay listed in IntegrationOutcome::applied.

#include <cstdint>
#include <string>
#include <vector>

#include "conclave/ports.hpp"

namespace conclave {

class CommandIntegrator : public IntegratorPort {
 public:
  CommandIntegrator(std::string repo_path, std::vector<std::string> command = {},
                    uint64_t timeout_ms = 60000);

  IntegrationOutcome integrate(const std::vector<ExecutionResult>& approved) override;

  const std::vector<std::string>& command() const { return command_; }

 private:
  std::string repo_path_;
  std::vector<std::string> command_;
  uint64_t timeout_ms_;
};

class CommandFinalTest : public FinalTestPort {
 public:
  CommandFinalTest(std::vector<std::string> command, uint64_t timeout_ms);

  FinalTestOutcome run(const std::string& repo_path) override;

 private:
  std::vector<std::string> command_;
  uint64_t timeout_ms_;
};

// Reports success and lists every ticket as applied. Touches nothing.
class NullIntegrator : public IntegratorPort {
 public:
  IntegrationOutcome integrate(const std::vector<ExecutionResult>& approved) override;
};

class NullFinalTest : public FinalTestPort {
 public:
  FinalTestOutcome run(const std::string& repo_path) override;
};

}  // namespace conclave
