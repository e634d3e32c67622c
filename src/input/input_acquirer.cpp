#include "poz/input/input_acquirer.hpp"

#include <unistd.h>

#include <chrono>
#include <iostream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace poz::input {

bool ProcessStdin::isInteractive() const {
  return isatty(STDIN_FILENO) == 1;
}

Result<std::string> ProcessStdin::readAll() {
  std::string content{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
  if (std::cin.bad()) {
    return std::unexpected(makeError(ErrorCode::kNoInput, "Failed to read piped input"));
  }
  return content;
}

InputAcquirer::InputAcquirer(StdinSource& stdin_source, poz::clipboard::Clipboard& clipboard)
    : stdin_source_(stdin_source), clipboard_(clipboard) {
}

Result<std::optional<poz::core::NoteBody>> InputAcquirer::acquire(
    bool from_clipboard, const std::vector<std::string>& tags) {
  std::string raw;

  if (from_clipboard) {
    auto text = clipboard_.read();
    if (!text.has_value()) {
      return std::unexpected(text.error());
    }
    raw = std::move(*text);
  } else {
    if (stdin_source_.isInteractive()) {
      return std::unexpected(makeError(ErrorCode::kNoInput,
                                       "No piped input. Use -c to post from clipboard."));
    }
    auto text = stdin_source_.readAll();
    if (!text.has_value()) {
      return std::unexpected(text.error());
    }
    raw = std::move(*text);
  }

  poz::core::NoteBody body;
  body.content = poz::core::trimWhitespace(raw);
  if (body.content.empty()) {
    spdlog::debug("Captured input is empty");
    return std::optional<poz::core::NoteBody>{};
  }
  body.tags = tags;
  body.captured_at = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();

  spdlog::debug("Captured {} bytes from {}", body.content.size(), from_clipboard ? "clipboard" : "stdin");
  return std::optional<poz::core::NoteBody>{std::move(body)};
}

} // namespace poz::input
