#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "poz/common.hpp"
#include "poz/clipboard/clipboard.hpp"
#include "poz/core/note_body.hpp"

namespace poz::input {

/**
 * @brief Process standard input
 */
class StdinSource {
public:
  virtual ~StdinSource() = default;

  // True when stdin is attached to a terminal (nothing was piped)
  virtual bool isInteractive() const = 0;

  // Read stdin to end of stream
  virtual Result<std::string> readAll() = 0;
};

class ProcessStdin : public StdinSource {
public:
  bool isInteractive() const override;
  Result<std::string> readAll() override;
};

/**
 * @brief Captures the note body from stdin or the clipboard
 */
class InputAcquirer {
public:
  InputAcquirer(StdinSource& stdin_source, poz::clipboard::Clipboard& clipboard);

  /**
   * Capture the body. With from_clipboard the clipboard is read, otherwise
   * piped stdin; an interactive stdin yields kNoInput. Content is trimmed.
   * Returns nullopt when the captured text is empty.
   */
  Result<std::optional<poz::core::NoteBody>> acquire(bool from_clipboard,
                                                     const std::vector<std::string>& tags);

private:
  StdinSource& stdin_source_;
  poz::clipboard::Clipboard& clipboard_;
};

} // namespace poz::input
