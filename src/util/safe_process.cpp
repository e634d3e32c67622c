#include "poz/util/safe_process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <spawn.h>
#include <fcntl.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>

extern char **environ;

namespace poz::util {

namespace {

  /**
   * @brief Read all data from file descriptor with bounds checking
   */
  std::string readFromFd(int fd) {
    std::string result;
    constexpr size_t BUFFER_SIZE = 4096;
    constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024; // 10MB limit
    char buffer[BUFFER_SIZE];
    ssize_t bytes_read;

    while ((bytes_read = read(fd, buffer, sizeof(buffer))) > 0) {
      if (result.size() + static_cast<size_t>(bytes_read) > MAX_OUTPUT_SIZE) {
        // Truncate output to prevent memory exhaustion
        size_t remaining = MAX_OUTPUT_SIZE - result.size();
        if (remaining > 0) {
          result.append(buffer, remaining);
        }
        break;
      }
      result.append(buffer, static_cast<size_t>(bytes_read));
    }

    return result;
  }

  bool writeAllToFd(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
      ssize_t n = write(fd, data.data() + written, data.size() - written);
      if (n < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      written += static_cast<size_t>(n);
    }
    return true;
  }

  void safeClose(int fd) {
    if (fd >= 0) {
      close(fd);
    }
  }

  /**
   * @brief Convert vector of strings to a NULL-terminated char* array for posix_spawn
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

  Result<int> waitForExit(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
      if (errno != EINTR) {
        return std::unexpected(makeError(ErrorCode::kSystemError,
                                         "Failed to wait for process: " + std::string(strerror(errno))));
      }
    }

    if (WIFEXITED(status)) {
      return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      return 128 + WTERMSIG(status);
    }
    return -1;
  }

}

Result<std::string> SafeProcess::validate(const std::string& command,
                                          const std::vector<std::string>& args) {
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
    return std::unexpected(makeError(ErrorCode::kMissingDependency,
                                     "Command not found: " + command));
  }
  return *command_path;
}

Result<SafeProcess::ProcessResult> SafeProcess::execute(
    const std::string& command,
    const std::vector<std::string>& args) {
  auto command_path = validate(command, args);
  if (!command_path.has_value()) {
    return std::unexpected(command_path.error());
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};

  if (pipe(stdout_pipe) == -1 || pipe(stderr_pipe) == -1) {
    safeClose(stdout_pipe[0]);
    safeClose(stdout_pipe[1]);
    safeClose(stderr_pipe[0]);
    safeClose(stderr_pipe[1]);
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Failed to create pipes: " + std::string(strerror(errno))));
  }

  std::vector<std::string> full_args;
  full_args.push_back(command);
  full_args.insert(full_args.end(), args.begin(), args.end());

  SafeArgvBuilder argv_builder(full_args);

  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);

  // Redirect stdout and stderr to our pipes
  posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&file_actions, stdout_pipe[0]);
  posix_spawn_file_actions_addclose(&file_actions, stderr_pipe[0]);
  posix_spawn_file_actions_addclose(&file_actions, stdout_pipe[1]);
  posix_spawn_file_actions_addclose(&file_actions, stderr_pipe[1]);

  pid_t pid;
  int spawn_result = posix_spawn(&pid, command_path->c_str(), &file_actions, nullptr,
                                argv_builder.data(), environ);

  posix_spawn_file_actions_destroy(&file_actions);

  if (spawn_result != 0) {
    safeClose(stdout_pipe[0]);
    safeClose(stdout_pipe[1]);
    safeClose(stderr_pipe[0]);
    safeClose(stderr_pipe[1]);
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn process: " + std::string(strerror(spawn_result))));
  }

  ProcessResult result;

  // Close write ends in parent
  safeClose(stdout_pipe[1]);
  safeClose(stderr_pipe[1]);

  result.stdout_output = readFromFd(stdout_pipe[0]);
  result.stderr_output = readFromFd(stderr_pipe[0]);

  safeClose(stdout_pipe[0]);
  safeClose(stderr_pipe[0]);

  auto exit_code = waitForExit(pid);
  if (!exit_code.has_value()) {
    return std::unexpected(exit_code.error());
  }
  result.exit_code = *exit_code;

  return result;
}

Result<int> SafeProcess::executeWithInput(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::string& input) {
  auto command_path = validate(command, args);
  if (!command_path.has_value()) {
    return std::unexpected(command_path.error());
  }

  int stdin_pipe[2] = {-1, -1};
  if (pipe(stdin_pipe) == -1) {
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Failed to create pipe: " + std::string(strerror(errno))));
  }

  std::vector<std::string> full_args;
  full_args.push_back(command);
  full_args.insert(full_args.end(), args.begin(), args.end());

  SafeArgvBuilder argv_builder(full_args);

  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);
  posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
  posix_spawn_file_actions_addclose(&file_actions, stdin_pipe[0]);
  posix_spawn_file_actions_addclose(&file_actions, stdin_pipe[1]);
  posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

  pid_t pid;
  int spawn_result = posix_spawn(&pid, command_path->c_str(), &file_actions, nullptr,
                                argv_builder.data(), environ);

  posix_spawn_file_actions_destroy(&file_actions);
  safeClose(stdin_pipe[0]);

  if (spawn_result != 0) {
    safeClose(stdin_pipe[1]);
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn process: " + std::string(strerror(spawn_result))));
  }

  bool written = writeAllToFd(stdin_pipe[1], input);
  int write_errno = errno;
  safeClose(stdin_pipe[1]);

  auto exit_code = waitForExit(pid);
  if (!exit_code.has_value()) {
    return std::unexpected(exit_code.error());
  }
  if (!written) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     "Failed to write to " + command + ": " + std::string(strerror(write_errno))));
  }

  return *exit_code;
}

bool SafeProcess::commandExists(const std::string& command) {
  return findCommand(command).has_value();
}

std::optional<std::string> SafeProcess::findCommand(const std::string& command) {
  if (!isValidCommand(command)) {
    return std::nullopt;
  }

  // Check if command is an absolute path
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

  // Check for dangerous characters
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

} // namespace poz::util
