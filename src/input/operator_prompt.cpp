#include "poz/input/operator_prompt.hpp"

#include <fstream>
#include <iostream>

namespace poz::input {

Result<void> TtyPrompt::waitForKeyPress(const std::string& prompt) {
  std::ifstream tty("/dev/tty");
  if (!tty.is_open()) {
    return std::unexpected(makeError(ErrorCode::kInterrupted,
                                     "No terminal available to confirm"));
  }

  std::cout << prompt << std::flush;

  std::string line;
  if (!std::getline(tty, line)) {
    std::cout << std::endl;
    return std::unexpected(makeError(ErrorCode::kInterrupted,
                                     "Confirmation aborted"));
  }
  return {};
}

} // namespace poz::input
