#include "pkbsync/util/safe_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

#include "pkbsync/util/termination.hpp"

extern char **environ;

namespace pkbsync::util {

namespace {
  constexpr size_t kBufferSize = 4096;
  constexpr size_t kMaxOutputSize = 10 * 1024 * 1024; // 10MB limit

  /**
   * @brief Drain whatever is currently readable from fd into out
   * @return false once the write end has been closed
   */
  bool drainFd(int fd, std::string& out) {
    char buffer[kBufferSize];
    ssize_t bytes_read = read(fd, buffer, sizeof(buffer));
    if (bytes_read > 0) {
      // Truncate output to prevent memory exhaustion
      if (out.size() < kMaxOutputSize) {
        size_t room = kMaxOutputSize - out.size();
        out.append(buffer, std::min(room, static_cast<size_t>(bytes_read)));
      }
      return true;
    }
    if (bytes_read < 0 && (errno == EINTR || errno == EAGAIN)) {
      return true;
    }
    return false;
  }

  void safeClose(int& fd) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }

  /**
   * @brief Convert vector of strings to a null-terminated char* array for posix_spawn
   */
  class SafeArgvBuilder {
  private:
    std::vector<std::unique_ptr<char[]>> storage_;
    std::vector<char*> argv_;

  public:
    explicit SafeArgvBuilder(const std::vector<std::string>& strings) {
      storage_.reserve(strings.size());
      argv_.reserve(strings.size() + 1);

      for (const auto& str : strings) {
        auto len = str.length() + 1;
        auto buffer = std::make_unique<char[]>(len);
        std::memcpy(buffer.get(), str.c_str(), len);

        argv_.push_back(buffer.get());
        storage_.push_back(std::move(buffer));
      }
      argv_.push_back(nullptr);
    }

    char* const* data() { return argv_.data(); }
  };

  // Returns the wait status, or nullopt if the child is still running
  std::optional<int> reapIfExited(pid_t pid) {
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      return status;
    }
    return std::nullopt;
  }

  int killAndReap(pid_t pid) {
    kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + SafeProcess::kKillGracePeriod;
    while (std::chrono::steady_clock::now() < deadline) {
      if (auto status = reapIfExited(pid)) {
        return *status;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    kill(pid, SIGKILL);
    int status = 0;
    waitpid(pid, &status, 0);
    return status;
  }

  // Inherited environment with the given variables replaced or added
  std::vector<std::string> childEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
      std::string_view text(*entry);
      auto eq = text.find('=');
      std::string key(text.substr(0, eq));
      if (!overrides.contains(key)) {
        entries.emplace_back(text);
      }
    }
    for (const auto& [key, value] : overrides) {
      entries.push_back(key + "=" + value);
    }
    return entries;
  }

  int exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) {
      return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      return 128 + WTERMSIG(status);
    }
    return -1;
  }
}

Result<SafeProcess::ProcessResult> SafeProcess::execute(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::optional<std::string>& working_dir,
    std::optional<std::chrono::milliseconds> timeout,
    const std::map<std::string, std::string>& environment) {
  if (!isValidCommand(command)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid command name: " + command));
  }

  for (const auto& arg : args) {
    if (!isValidArgument(arg)) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid argument: " + arg.substr(0, 50) + "..."));
    }
  }

  auto command_path = findCommand(command);
  if (!command_path.has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Command not found: " + command));
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe2(stdout_pipe, O_CLOEXEC) == -1 || pipe2(stderr_pipe, O_CLOEXEC) == -1) {
    int saved = errno;
    safeClose(stdout_pipe[0]);
    safeClose(stdout_pipe[1]);
    safeClose(stderr_pipe[0]);
    safeClose(stderr_pipe[1]);
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Failed to create pipes: " + std::string(strerror(saved))));
  }

  std::vector<std::string> full_args;
  full_args.push_back(command);
  full_args.insert(full_args.end(), args.begin(), args.end());
  SafeArgvBuilder argv_builder(full_args);
  SafeArgvBuilder env_builder(childEnvironment(environment));

  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);
  posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
  posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

  // Change working directory for the duration of the spawn
  std::string old_cwd;
  if (working_dir.has_value()) {
    char* cwd = getcwd(nullptr, 0);
    if (cwd) {
      old_cwd = cwd;
      free(cwd);
    }

    if (chdir(working_dir->c_str()) != 0) {
      int saved = errno;
      posix_spawn_file_actions_destroy(&file_actions);
      safeClose(stdout_pipe[0]);
      safeClose(stdout_pipe[1]);
      safeClose(stderr_pipe[0]);
      safeClose(stderr_pipe[1]);
      return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                       "Failed to change directory to " + *working_dir + ": " +
                                       std::string(strerror(saved))));
    }
  }

  pid_t pid;
  int spawn_result = posix_spawn(&pid, command_path->c_str(), &file_actions, nullptr,
                                 argv_builder.data(), env_builder.data());
  posix_spawn_file_actions_destroy(&file_actions);

  if (!old_cwd.empty() && chdir(old_cwd.c_str()) != 0) {
    spdlog::warn("Failed to restore working directory {}: {}", old_cwd, strerror(errno));
  }

  safeClose(stdout_pipe[1]);
  safeClose(stderr_pipe[1]);

  if (spawn_result != 0) {
    safeClose(stdout_pipe[0]);
    safeClose(stderr_pipe[0]);
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn process: " + std::string(strerror(spawn_result))));
  }

  Termination::setActiveChild(pid);

  ProcessResult result;
  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (timeout.has_value()) {
    deadline = std::chrono::steady_clock::now() + *timeout;
  }
  bool timed_out = false;

  // Read both pipes until the child closes them or the deadline passes
  while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0) {
    int wait_ms = -1;
    if (deadline.has_value()) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          *deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }

    struct pollfd fds[2];
    nfds_t count = 0;
    if (stdout_pipe[0] >= 0) {
      fds[count++] = {stdout_pipe[0], POLLIN, 0};
    }
    if (stderr_pipe[0] >= 0) {
      fds[count++] = {stderr_pipe[0], POLLIN, 0};
    }

    int ready = poll(fds, count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      bool is_stdout = fds[i].fd == stdout_pipe[0];
      std::string& sink = is_stdout ? result.stdout_output : result.stderr_output;
      if (!drainFd(fds[i].fd, sink)) {
        safeClose(is_stdout ? stdout_pipe[0] : stderr_pipe[0]);
      }
    }
  }

  safeClose(stdout_pipe[0]);
  safeClose(stderr_pipe[0]);

  int status = 0;
  if (timed_out) {
    killAndReap(pid);
    Termination::setActiveChild(0);
    std::ostringstream msg;
    msg << command << " timed out after " << timeout->count() << "ms";
    return std::unexpected(makeError(ErrorCode::kTimeout, msg.str()));
  }

  // Pipes are closed; the child may still be running if it detached its output
  while (true) {
    if (auto exited = reapIfExited(pid)) {
      status = *exited;
      break;
    }
    if (deadline.has_value() && std::chrono::steady_clock::now() >= *deadline) {
      killAndReap(pid);
      Termination::setActiveChild(0);
      std::ostringstream msg;
      msg << command << " timed out after " << timeout->count() << "ms";
      return std::unexpected(makeError(ErrorCode::kTimeout, msg.str()));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  Termination::setActiveChild(0);
  result.exit_code = exitCodeFromStatus(status);
  return result;
}

Result<std::string> SafeProcess::executeForOutput(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::optional<std::string>& working_dir,
    std::optional<std::chrono::milliseconds> timeout) {
  auto result = execute(command, args, working_dir, timeout);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (!result->success()) {
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Command failed with exit code " + std::to_string(result->exit_code) +
                                     ": " + result->stderr_output));
  }

  return result->stdout_output;
}

bool SafeProcess::commandExists(const std::string& command) {
  return findCommand(command).has_value();
}

std::optional<std::string> SafeProcess::findCommand(const std::string& command) {
  if (!isValidCommand(command)) {
    return std::nullopt;
  }

  // Absolute path
  if (!command.empty() && command.front() == '/') {
    struct stat st;
    if (stat(command.c_str(), &st) == 0 && (st.st_mode & S_IXUSR)) {
      return command;
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return std::nullopt;
  }

  std::istringstream path_stream{std::string(path_env)};
  std::string dir;
  while (std::getline(path_stream, dir, ':')) {
    if (dir.empty()) continue;

    std::string full_path = dir + "/" + command;
    struct stat st;
    if (stat(full_path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && (st.st_mode & S_IXUSR)) {
      return full_path;
    }
  }

  return std::nullopt;
}

bool SafeProcess::isValidCommand(const std::string& command) {
  if (command.empty() || command.length() > 255) {
    return false;
  }

  const std::string dangerous_chars = "|&;(){}[]<>*?~$`\"'\\";
  for (char c : command) {
    if (dangerous_chars.find(c) != std::string::npos) {
      return false;
    }
    if (static_cast<unsigned char>(c) < 32) {
      return false;
    }
  }

  // Reject paths with .. to prevent directory traversal
  if (command.find("..") != std::string::npos) {
    return false;
  }

  return true;
}

bool SafeProcess::isValidArgument(const std::string& arg) {
  if (arg.length() > 4096) {
    return false;
  }

  // Reject control characters except tab, newline, carriage return
  for (char c : arg) {
    if (static_cast<unsigned char>(c) < 32 && c != '\t' && c != '\n' && c != '\r') {
      return false;
    }
  }

  return true;
}

} // namespace pkbsync::util
