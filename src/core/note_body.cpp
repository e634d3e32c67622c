#include "poz/core/note_body.hpp"

#include <sstream>

namespace poz::core {

namespace {
constexpr const char* kWhitespace = " \t\r\n\f\v";
}

std::string trimWhitespace(const std::string& text) {
  auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::vector<std::string> parseTags(const std::string& tag_list) {
  std::vector<std::string> tags;
  std::stringstream ss(tag_list);
  std::string tag;
  while (std::getline(ss, tag, ',')) {
    tag = trimWhitespace(tag);
    if (!tag.empty()) {
      tags.push_back(tag);
    }
  }
  return tags;
}

}  // namespace poz::core
