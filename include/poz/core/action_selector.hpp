#pragma once

#include <optional>
#include <string>

#include "poz/common.hpp"
#include "poz/config/config.hpp"
#include "poz/core/action.hpp"

namespace poz::core {

// Action-related flags as parsed from the command line
struct ActionFlags {
  bool clipboard = false;                 // -c
  bool burn = false;                      // -b
  bool last = false;                      // -L
  std::optional<std::string> search;      // -s QUERY
  std::optional<std::string> update_id;   // -U ID
  std::optional<std::string> delete_id;   // -D ID
};

/**
 * @brief Resolves parsed flags into exactly one Action
 *
 * When several action flags are set the highest priority wins:
 * Burn > Delete > Update > Search > ListLast > PostFromClipboard > CreateNote.
 * Advanced actions are rejected with kAdvancedFeaturesDisabled unless the
 * config enables them.
 */
class ActionSelector {
public:
  static Result<Action> select(const ActionFlags& flags, const poz::config::Config& config);

  // Poznote note ids are decimal integers
  static bool isValidNoteId(const std::string& id);
};

}  // namespace poz::core
