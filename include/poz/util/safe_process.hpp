#pragma once

#include <string>
#include <vector>
#include <optional>

#include "poz/common.hpp"

namespace poz::util {

/**
 * @brief Process execution without a shell
 *
 * Commands are resolved on PATH and started with posix_spawn, so arguments
 * are never interpreted by a shell.
 */
class SafeProcess {
public:
  /**
   * @brief Result of a process execution
   */
  struct ProcessResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
    bool success() const { return exit_code == 0; }
  };

  /**
   * @brief Execute a command and capture its output
   * @param command The command to execute (no shell interpretation)
   * @param args Command arguments
   * @return Result of execution or error
   */
  static Result<ProcessResult> execute(
    const std::string& command,
    const std::vector<std::string>& args = {}
  );

  /**
   * @brief Execute a command feeding it data on stdin
   *
   * The child's stdout and stderr go to /dev/null: clipboard owners such as
   * xclip and wl-copy fork a server that keeps inherited descriptors open.
   *
   * @param command The command to execute
   * @param args Command arguments
   * @param input Bytes written to the child's stdin before it is closed
   * @return Exit code of the command or error
   */
  static Result<int> executeWithInput(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::string& input
  );

  /**
   * @brief Check if a command exists in PATH
   * @param command Command name to check
   * @return true if command exists and is executable
   */
  static bool commandExists(const std::string& command);

  /**
   * @brief Find the full path of a command in PATH
   * @param command Command name to find
   * @return Full path to command or nullopt if not found
   */
  static std::optional<std::string> findCommand(const std::string& command);

  /**
   * @brief Validate that a command name is safe for execution
   */
  static bool isValidCommand(const std::string& command);

  /**
   * @brief Validate that an argument is safe for execution
   */
  static bool isValidArgument(const std::string& arg);

private:
  SafeProcess() = default;

  static Result<std::string> validate(const std::string& command,
                                      const std::vector<std::string>& args);
};

} // namespace poz::util
