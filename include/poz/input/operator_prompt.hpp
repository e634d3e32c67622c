#pragma once

#include <string>

#include "poz/common.hpp"

namespace poz::input {

/**
 * @brief Blocking confirmation from the operator
 */
class OperatorPrompt {
public:
  virtual ~OperatorPrompt() = default;

  // Show the prompt and block until the operator presses Enter
  virtual Result<void> waitForKeyPress(const std::string& prompt) = 0;
};

/**
 * Reads the confirmation from the controlling terminal (/dev/tty), which
 * stays usable when stdin carried the piped note.
 */
class TtyPrompt : public OperatorPrompt {
public:
  Result<void> waitForKeyPress(const std::string& prompt) override;
};

} // namespace poz::input
