#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace poz::core {

// Note content captured from stdin or the clipboard
struct NoteBody {
  std::string content;
  std::vector<std::string> tags;
  // Capture time in seconds since the epoch, used for the generated heading
  int64_t captured_at = 0;

  bool operator==(const NoteBody&) const = default;
};

/**
 * Split a comma-separated tag list. Each tag is trimmed of surrounding
 * whitespace and empty entries are dropped; order and duplicates are kept.
 */
std::vector<std::string> parseTags(const std::string& tag_list);

// Strip leading and trailing whitespace
std::string trimWhitespace(const std::string& text);

}  // namespace poz::core
