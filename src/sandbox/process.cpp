#include "tutorplane/sandbox/process.hpp"

#include "tutorplane/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <string_view>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace tutorplane::sandbox {

namespace {

constexpr int POLL_SLICE_MS = 50;
constexpr std::chrono::milliseconds DRAIN_GRACE{250};

enum class ChildStage : int { Chdir = 1, Exec = 2, Fork = 3 };

struct ChildFailure {
  int stage = 0;
  int error = 0;
};

// Everything the supervisor and the program need, prepared before fork.
struct Launch {
  char *const *argv = nullptr;
  char *const *envp = nullptr;
  const char *working_dir = nullptr;
  int stdout_fd = -1;
  int stderr_fd = -1;
  int report_fd = -1;
  std::uint64_t max_memory_mb = 0;
  pid_t runner_pid = 0;
  sigset_t original_mask{};
};

class Pipe {
public:
  Pipe() = default;
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  ~Pipe() {
    close_read();
    close_write();
  }

  [[nodiscard]] bool open() { return pipe2(fds_, O_CLOEXEC) == 0; }
  [[nodiscard]] int read_end() const { return fds_[0]; }
  [[nodiscard]] int write_end() const { return fds_[1]; }

  void close_read() {
    if (fds_[0] >= 0) {
      close(fds_[0]);
      fds_[0] = -1;
    }
  }

  void close_write() {
    if (fds_[1] >= 0) {
      close(fds_[1]);
      fds_[1] = -1;
    }
  }

private:
  int fds_[2] = {-1, -1};
};

struct Capture {
  std::string text;
  bool truncated = false;
  bool open = true;
};

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Reads what is available; bytes past the cap are consumed so the writer never blocks.
void drain_into(const int fd, Capture &capture, const std::size_t limit) {
  std::array<char, 4096> chunk{};
  while (capture.open) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const auto count = static_cast<std::size_t>(bytes);
      const std::size_t room = capture.text.size() < limit ? limit - capture.text.size() : 0;
      capture.text.append(chunk.data(), std::min(room, count));
      if (count > room) {
        capture.truncated = true;
      }
      continue;
    }
    if (bytes == 0) {
      capture.open = false;
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      capture.open = false;
    }
    return;
  }
}

std::vector<std::string>
merged_environment(const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> merged;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view current(*entry);
    const auto overridden =
        std::any_of(overrides.begin(), overrides.end(), [&](const auto &item) {
          const std::string &key = item.first;
          return current.size() > key.size() && current.compare(0, key.size(), key) == 0 &&
                 current[key.size()] == '=';
        });
    if (!overridden) {
      merged.emplace_back(current);
    }
  }
  for (const auto &[key, value] : overrides) {
    merged.push_back(key + "=" + value);
  }
  return merged;
}

// From here on the code runs in forked children of a possibly multithreaded
// process: async-signal-safe calls only.

volatile sig_atomic_t g_program_pid = 0;
volatile sig_atomic_t g_stop_requested = 0;

void on_stop(int) {
  g_stop_requested = 1;
  if (g_program_pid > 0) {
    (void)kill(-static_cast<pid_t>(g_program_pid), SIGKILL);
  }
}

[[noreturn]] void child_fail(const int report_fd, const ChildStage stage) {
  const ChildFailure failure{.stage = static_cast<int>(stage), .error = errno};
  (void)!write(report_fd, &failure, sizeof(failure));
  _exit(127);
}

// Parses the decimal prefix of `text`; -1 when it has none.
long parse_decimal(const char *text) {
  long value = -1;
  for (; *text >= '0' && *text <= '9'; ++text) {
    value = (value < 0 ? 0 : value * 10) + (*text - '0');
  }
  return value;
}

// Parent pid from /proc/<pid>/stat, or -1 once the process is gone.
long parent_of(const char *pid_name) {
  char path[64] = "/proc/";
  std::size_t length = 6;
  for (const char *c = pid_name; *c != '\0' && length < 40; ++c) {
    path[length++] = *c;
  }
  for (const char *c = "/stat"; *c != '\0'; ++c) {
    path[length++] = *c;
  }
  path[length] = '\0';

  const int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return -1;
  }
  char buffer[512];
  const ssize_t bytes = read(fd, buffer, sizeof(buffer) - 1);
  close(fd);
  if (bytes <= 0) {
    return -1;
  }
  buffer[bytes] = '\0';

  // "pid (comm) state ppid ..." where comm may itself hold ") ".
  ssize_t close_paren = bytes - 1;
  while (close_paren >= 0 && buffer[close_paren] != ')') {
    --close_paren;
  }
  if (close_paren < 0 || close_paren + 4 >= bytes) {
    return -1;
  }
  return parse_decimal(buffer + close_paren + 4);
}

// SIGKILLs every process whose parent is the caller.
void kill_children() {
  const int dir = open("/proc", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir < 0) {
    return;
  }
  const long self = static_cast<long>(getpid());
  alignas(8) char buffer[4096];
  while (true) {
    const long bytes = syscall(SYS_getdents64, dir, buffer, sizeof(buffer));
    if (bytes <= 0) {
      break;
    }
    // linux_dirent64: u64 ino, s64 off, u16 reclen, u8 type, name.
    for (long offset = 0; offset < bytes;) {
      unsigned short record = 0;
      std::memcpy(&record, buffer + offset + 16, sizeof(record));
      const char *name = buffer + offset + 19;
      if (record == 0) {
        break;
      }
      if (*name >= '1' && *name <= '9' && parent_of(name) == self) {
        (void)kill(static_cast<pid_t>(parse_decimal(name)), SIGKILL);
      }
      offset += record;
    }
  }
  close(dir);
}

// Orphans below the supervisor are reparented to it, so sweeping until wait
// reports no children leaves nothing of the job behind.
void reap_descendants() {
  const struct timespec pause{.tv_sec = 0, .tv_nsec = 10'000'000};
  while (true) {
    kill_children();
    int status = 0;
    pid_t reaped = 0;
    while ((reaped = waitpid(-1, &status, WNOHANG)) > 0) {
    }
    if (reaped < 0 && errno == ECHILD) {
      return;
    }
    (void)nanosleep(&pause, nullptr);
  }
}

[[noreturn]] void exec_program(const Launch &launch) {
  (void)setpgid(0, 0);
  (void)signal(SIGPIPE, SIG_DFL);
  (void)signal(SIGTERM, SIG_DFL);
  (void)sigprocmask(SIG_SETMASK, &launch.original_mask, nullptr);

  const int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    (void)dup2(null_fd, STDIN_FILENO);
    close(null_fd);
  }
  (void)dup2(launch.stdout_fd, STDOUT_FILENO);
  (void)dup2(launch.stderr_fd, STDERR_FILENO);

  if (launch.max_memory_mb > 0) {
    struct rlimit limit{};
    limit.rlim_cur = static_cast<rlim_t>(launch.max_memory_mb) * 1024 * 1024;
    limit.rlim_max = limit.rlim_cur;
    (void)setrlimit(RLIMIT_AS, &limit);
  }

  if (launch.working_dir != nullptr && chdir(launch.working_dir) != 0) {
    child_fail(launch.report_fd, ChildStage::Chdir);
  }

  execvpe(launch.argv[0], launch.argv, launch.envp);
  child_fail(launch.report_fd, ChildStage::Exec);
}

// Forks the program, waits for it, clears out everything it left running and
// exits with the program's own status. SIGTERM from the runner means timeout.
[[noreturn]] void supervise(const Launch &launch) {
  (void)setpgid(0, 0);
  (void)prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0);
  (void)prctl(PR_SET_PDEATHSIG, SIGTERM, 0, 0, 0);

  struct sigaction stop{};
  stop.sa_handler = on_stop;
  sigemptyset(&stop.sa_mask);
  stop.sa_flags = 0;
  (void)sigaction(SIGTERM, &stop, nullptr);
  sigset_t term;
  sigemptyset(&term);
  sigaddset(&term, SIGTERM);
  (void)sigprocmask(SIG_UNBLOCK, &term, nullptr);
  if (getppid() != launch.runner_pid) {
    g_stop_requested = 1;
  }

  const pid_t program = fork();
  if (program < 0) {
    child_fail(launch.report_fd, ChildStage::Fork);
  }
  if (program == 0) {
    exec_program(launch);
  }
  (void)setpgid(program, program);
  g_program_pid = program;
  if (g_stop_requested != 0) {
    (void)kill(-program, SIGKILL);
  }
  close(launch.stdout_fd);
  close(launch.stderr_fd);
  close(launch.report_fd);

  siginfo_t info{};
  while (waitid(P_PID, static_cast<id_t>(program), &info, WEXITED | WNOWAIT) < 0 &&
         errno == EINTR) {
  }
  // Still unreaped, so the group id cannot have been recycled yet.
  (void)kill(-program, SIGKILL);
  g_program_pid = 0;
  int status = 0;
  while (waitpid(program, &status, 0) < 0 && errno == EINTR) {
  }
  reap_descendants();

  if (WIFSIGNALED(status)) {
    const int signal_number = WTERMSIG(status);
    struct rlimit no_core{};
    (void)setrlimit(RLIMIT_CORE, &no_core);
    (void)signal(signal_number, SIG_DFL);
    sigset_t raised;
    sigemptyset(&raised);
    sigaddset(&raised, signal_number);
    (void)sigprocmask(SIG_UNBLOCK, &raised, nullptr);
    (void)kill(getpid(), signal_number);
    _exit(128 + signal_number);
  }
  _exit(WIFEXITED(status) ? WEXITSTATUS(status) : 127);
}

} // namespace

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &args,
                                                      const ProcessOptions &options) {
  if (args.empty() || args.front().empty()) {
    return common::Result<ProcessResult>::failure(common::ErrorKind::InvalidArguments,
                                                  "command is empty");
  }

  Pipe stdout_pipe;
  Pipe stderr_pipe;
  Pipe report_pipe;
  if (!stdout_pipe.open() || !stderr_pipe.open() || !report_pipe.open()) {
    return common::Result<ProcessResult>::failure(std::string("failed to create pipes: ") +
                                                  std::strerror(errno));
  }

  // Everything the children touch is prepared before fork.
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const std::vector<std::string> environment = merged_environment(options.environment);
  std::vector<char *> envp;
  envp.reserve(environment.size() + 1);
  for (const auto &entry : environment) {
    envp.push_back(const_cast<char *>(entry.c_str()));
  }
  envp.push_back(nullptr);
  const std::string working_dir = options.working_dir.string();

  Launch launch{.argv = argv.data(),
                .envp = envp.data(),
                .working_dir = working_dir.empty() ? nullptr : working_dir.c_str(),
                .stdout_fd = stdout_pipe.write_end(),
                .stderr_fd = stderr_pipe.write_end(),
                .report_fd = report_pipe.write_end(),
                .max_memory_mb = options.max_memory_mb,
                .runner_pid = getpid()};

  // SIGTERM stays blocked until the supervisor has its handler installed.
  sigset_t term;
  sigemptyset(&term);
  sigaddset(&term, SIGTERM);
  (void)pthread_sigmask(SIG_BLOCK, &term, &launch.original_mask);

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid == 0) {
    supervise(launch);
  }
  const int fork_error = errno;
  (void)pthread_sigmask(SIG_SETMASK, &launch.original_mask, nullptr);
  if (pid < 0) {
    return common::Result<ProcessResult>::failure(std::string("failed to fork: ") +
                                                  std::strerror(fork_error));
  }

  (void)setpgid(pid, pid);
  stdout_pipe.close_write();
  stderr_pipe.close_write();
  report_pipe.close_write();

  // The report pipe closes once the program execs (O_CLOEXEC) and the
  // supervisor drops its copy; otherwise a child writes why it failed.
  ChildFailure failure{};
  ssize_t reported = 0;
  do {
    reported = read(report_pipe.read_end(), &failure, sizeof(failure));
  } while (reported < 0 && errno == EINTR);
  if (reported == static_cast<ssize_t>(sizeof(failure))) {
    int ignored = 0;
    while (waitpid(pid, &ignored, 0) < 0 && errno == EINTR) {
    }
    if (failure.stage == static_cast<int>(ChildStage::Chdir)) {
      return common::Result<ProcessResult>::failure("cannot enter working directory " +
                                                    working_dir + ": " +
                                                    std::strerror(failure.error));
    }
    if (failure.stage == static_cast<int>(ChildStage::Exec) && failure.error == ENOENT) {
      return common::Result<ProcessResult>::failure("toolchain not found: " + args.front());
    }
    return common::Result<ProcessResult>::failure("failed to execute " + args.front() + ": " +
                                                  std::strerror(failure.error));
  }

  set_non_blocking(stdout_pipe.read_end());
  set_non_blocking(stderr_pipe.read_end());

  Capture out;
  Capture err;
  bool exited = false;
  bool timed_out = false;
  std::chrono::steady_clock::time_point drain_deadline{};

  while (true) {
    struct pollfd poll_fds[2] = {
        {.fd = out.open ? stdout_pipe.read_end() : -1, .events = POLLIN, .revents = 0},
        {.fd = err.open ? stderr_pipe.read_end() : -1, .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, POLL_SLICE_MS);
    drain_into(stdout_pipe.read_end(), out, options.max_output_bytes);
    drain_into(stderr_pipe.read_end(), err, options.max_output_bytes);

    const auto now = std::chrono::steady_clock::now();
    if (!exited) {
      siginfo_t info{};
      const int waited = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
      if ((waited == 0 && info.si_pid == pid) || (waited < 0 && errno != EINTR)) {
        exited = true;
        drain_deadline = now + DRAIN_GRACE;
      } else if (!timed_out && now - started > options.timeout) {
        timed_out = true;
        (void)kill(pid, SIGTERM);
      }
    }

    if (exited && ((!out.open && !err.open) || now > drain_deadline)) {
      break;
    }
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }

  ProcessResult result;
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  result.timed_out = timed_out;
  if (out.truncated) {
    common::utf8_trim_partial_tail(out.text);
  }
  if (err.truncated) {
    common::utf8_trim_partial_tail(err.text);
  }
  result.stdout_text = std::move(out.text);
  result.stderr_text = std::move(err.text);
  result.stdout_truncated = out.truncated;
  result.stderr_truncated = err.truncated;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }

  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace tutorplane::sandbox
