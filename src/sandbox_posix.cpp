#ifndef _WIN32

#include "conclave/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

extern char** environ;

namespace conclave {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit,
                    bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

void close_pair(int fds[2]) {
  if (fds[0] >= 0) close(fds[0]);
  if (fds[1] >= 0) close(fds[1]);
  fds[0] = fds[1] = -1;
}

// Builds the child's environment before fork; nothing is allocated after it.
std::vector<std::string> build_env(const ProcessSpec& spec) {
  std::map<std::string, std::string> merged;
  if (spec.inherit_env && environ) {
    for (char** e = environ; *e; ++e) {
      const char* eq = std::strchr(*e, '=');
      if (!eq) continue;
      merged[std::string(*e, static_cast<size_t>(eq - *e))] = eq + 1;
    }
  }
  for (const auto& [k, v] : spec.env) merged[k] = v;
  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
  return out;
}

}  // namespace

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  if (spec.command.empty()) {
    result.error_message = "empty command";
    return result;
  }

  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_env(spec);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
    close_pair(out_pipe);
    close_pair(err_pipe);
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pair(out_pipe);
    close_pair(err_pipe);
    result.error_message = std::string("spawn_failed: fork: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    setsid();
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) _exit(127);
    execve(spec.command.c_str(), argv.data(), envp.data());
    _exit(127);
  }

  result.spawned = true;
  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  int status = 0;
  bool out_open = true;
  bool err_open = true;
  bool exited = false;

  while (!exited) {
    // A closed stream leaves the poll set (negative fd); with both closed,
    // poll() only sleeps out its timeout between waitpid() checks.
    pollfd fds[2] = {{out_open ? out_pipe[0] : -1, POLLIN, 0},
                     {err_open ? err_pipe[0] : -1, POLLIN, 0}};
    poll(fds, 2, 10);
    if (out_open && fds[0].revents != 0) {
      const ssize_t n = read(out_pipe[0], buf, sizeof(buf));
      if (n == 0 || (n < 0 && errno != EAGAIN && errno != EINTR)) out_open = false;
      append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
    }
    if (err_open && fds[1].revents != 0) {
      const ssize_t n = read(err_pipe[0], buf, sizeof(buf));
      if (n == 0 || (n < 0 && errno != EAGAIN && errno != EINTR)) err_open = false;
      append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
    }

    if (waitpid(pid, &status, WNOHANG) == pid) {
      exited = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      exited = true;
    }
  }

  // Drain whatever the child wrote before exiting.
  for (int fd : {out_pipe[0], err_pipe[0]}) {
    std::string& dst = fd == out_pipe[0] ? result.stdout_text : result.stderr_text;
    bool& truncated = fd == out_pipe[0] ? result.stdout_truncated : result.stderr_truncated;
    for (;;) {
      const ssize_t n = read(fd, buf, sizeof(buf));
      if (n <= 0) break;
      append_limited(dst, buf, n, spec.max_output_bytes, truncated);
    }
  }
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.stdout_truncated) result.stdout_text += "(truncated)";
  if (result.stderr_truncated) result.stderr_text += "(truncated)";

  if (result.timed_out) {
    result.exit_code = 124;
    result.error_message = "timeout after " + std::to_string(spec.timeout_ms) + "ms";
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    if (result.exit_code == 127) result.error_message = "exec failed or command not found";
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace conclave

#endif
