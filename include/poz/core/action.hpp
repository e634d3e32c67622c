#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace poz::core {

// Post piped stdin as a new note
struct CreateNote {
  bool operator==(const CreateNote&) const = default;
};

// Post the clipboard contents as a new note (-c)
struct PostFromClipboard {
  bool operator==(const PostFromClipboard&) const = default;
};

// Show the most recent note of the workspace (-L)
struct ListLast {
  bool operator==(const ListLast&) const = default;
};

// Show the first server-side search match (-s)
struct Search {
  std::string query;
  bool operator==(const Search&) const = default;
};

// Replace a note's content with new input (-U)
struct Update {
  std::string note_id;
  bool operator==(const Update&) const = default;
};

// Delete a note (-D)
struct Delete {
  std::string note_id;
  bool operator==(const Delete&) const = default;
};

// Create a note, wait for the operator, then delete it (-b)
struct Burn {
  bool operator==(const Burn&) const = default;
};

using Action = std::variant<CreateNote, PostFromClipboard, ListLast, Search, Update, Delete, Burn>;

// Actions that need note content from stdin or the clipboard
bool requiresBody(const Action& action);

// Actions gated behind POZNOTE_ADVANCED_FEATURES
bool isAdvanced(const Action& action);

// Actions whose success creates a new note
bool createsNote(const Action& action);

std::string_view actionName(const Action& action);

}  // namespace poz::core
