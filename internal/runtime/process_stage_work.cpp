#include "process_stage_work.hpp"

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/scoped_chdir.hpp"

namespace labbook::runtime {

using labbook::observability::IntField;
using labbook::observability::StringField;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

/*
  While the child runs, the parent ignores SIGINT/SIGTERM so an interrupt
  reaches the child and comes back to us as its exit status.
*/
class IgnoreInterrupts {
 public:
  IgnoreInterrupts() {
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGINT, &ignore, &previous_int_);
    ::sigaction(SIGTERM, &ignore, &previous_term_);
  }

  ~IgnoreInterrupts() {
    ::sigaction(SIGINT, &previous_int_, nullptr);
    ::sigaction(SIGTERM, &previous_term_, nullptr);
  }

  IgnoreInterrupts(const IgnoreInterrupts&)            = delete;
  IgnoreInterrupts& operator=(const IgnoreInterrupts&) = delete;

 private:
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
};

std::string JoinCommand(const std::vector<std::string>& argv) {
  std::string line;
  for (const auto& arg : argv) {
    if (!line.empty()) line += ' ';
    line += arg;
  }
  return line;
}

} // namespace

ProcessStageWork::ProcessStageWork(std::string stage, std::vector<std::string> command, std::chrono::seconds timeout)
    : stage_(std::move(stage)), command_(std::move(command)), timeout_(timeout) {
}

void ProcessStageWork::Run(const std::filesystem::path& stage_dir, const std::vector<std::string>& args) {
  if (command_.empty()) {
    throw util::WorkExecutionError("stage '" + stage_ + "': no command configured");
  }

  std::vector<std::string> argv = command_;
  argv.insert(argv.end(), args.begin(), args.end());
  const auto command_line = JoinCommand(argv);

  std::vector<char*> raw_argv;
  raw_argv.reserve(argv.size() + 1);
  for (auto& arg : argv) {
    raw_argv.push_back(arg.data());
  }
  raw_argv.push_back(nullptr);

  std::error_code ec;
  std::filesystem::create_directories(stage_dir, ec);
  if (ec) {
    throw util::IOError("create stage directory " + stage_dir.string() + ": " + ec.message());
  }

  LABBOOK_LOG_INFO("running stage command", {StringField("stage", stage_), StringField("command", command_line)});

  int status = 0;
  {
    util::ScopedChdir chdir(stage_dir);
    IgnoreInterrupts  ignore_interrupts;

    const pid_t pid = ::fork();
    if (pid < 0) {
      throw util::WorkExecutionError("stage '" + stage_ + "': fork failed: " + std::strerror(errno));
    }
    if (pid == 0) {
      ::signal(SIGINT, SIG_DFL);
      ::signal(SIGTERM, SIG_DFL);
      ::execvp(raw_argv[0], raw_argv.data());
      ::_exit(127);
    }

    status = Wait(pid, command_line);
  }

  if (WIFSIGNALED(status)) {
    const int signal_number = WTERMSIG(status);
    if (signal_number == SIGINT || signal_number == SIGTERM) {
      throw util::StageCancelled("stage '" + stage_ + "': interrupted by signal " + std::to_string(signal_number));
    }
    throw util::WorkExecutionError("stage '" + stage_ + "': '" + command_line + "' killed by signal " + std::to_string(signal_number));
  }

  const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (exit_code != 0) {
    LABBOOK_LOG_WARN("stage command failed", {StringField("stage", stage_), IntField("exit_code", exit_code)});
    throw util::WorkExecutionError("stage '" + stage_ + "': '" + command_line + "' exited with code " + std::to_string(exit_code), exit_code);
  }
}

int ProcessStageWork::Wait(int pid, const std::string& command_line) const {
  const bool bounded  = timeout_.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout_;

  int status = 0;
  while (true) {
    const pid_t rc = ::waitpid(pid, &status, bounded ? WNOHANG : 0);
    if (rc == pid) {
      return status;
    }
    if (rc < 0) {
      if (errno == EINTR) continue;
      throw util::WorkExecutionError("stage '" + stage_ + "': waitpid failed: " + std::strerror(errno));
    }

    // rc == 0: still running, only reachable with WNOHANG.
    if (std::chrono::steady_clock::now() >= deadline) {
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      LABBOOK_LOG_WARN("stage command timed out", {StringField("stage", stage_), IntField("timeout_seconds", timeout_.count())});
      throw util::WorkExecutionError("stage '" + stage_ + "': '" + command_line + "' timed out after " + std::to_string(timeout_.count()) + "s");
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

} // namespace labbook::runtime
