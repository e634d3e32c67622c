#include "poz/core/action_selector.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace poz::core {

namespace {

Action pickByPriority(const ActionFlags& flags) {
  if (flags.burn) {
    return Burn{};
  }
  if (flags.delete_id.has_value()) {
    return Delete{*flags.delete_id};
  }
  if (flags.update_id.has_value()) {
    return Update{*flags.update_id};
  }
  if (flags.search.has_value()) {
    return Search{*flags.search};
  }
  if (flags.last) {
    return ListLast{};
  }
  if (flags.clipboard) {
    return PostFromClipboard{};
  }
  return CreateNote{};
}

int countActionFlags(const ActionFlags& flags) {
  return static_cast<int>(flags.burn) + static_cast<int>(flags.delete_id.has_value()) +
         static_cast<int>(flags.update_id.has_value()) + static_cast<int>(flags.search.has_value()) +
         static_cast<int>(flags.last);
}

}  // namespace

Result<Action> ActionSelector::select(const ActionFlags& flags, const poz::config::Config& config) {
  Action action = pickByPriority(flags);

  if (countActionFlags(flags) > 1) {
    spdlog::warn("Several action flags given, running {}", actionName(action));
  }

  if (isAdvanced(action) && !config.advanced_features_enabled) {
    return std::unexpected(makeError(ErrorCode::kAdvancedFeaturesDisabled,
                                     "Advanced features are disabled in " + config.source_path.string()));
  }

  if (auto* update = std::get_if<Update>(&action); update && !isValidNoteId(update->note_id)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid note id: '" + update->note_id + "'"));
  }
  if (auto* remove = std::get_if<Delete>(&action); remove && !isValidNoteId(remove->note_id)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid note id: '" + remove->note_id + "'"));
  }
  if (auto* search = std::get_if<Search>(&action); search && search->query.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Search query must not be empty"));
  }

  spdlog::debug("Selected action: {}", actionName(action));
  return action;
}

bool ActionSelector::isValidNoteId(const std::string& id) {
  return !id.empty() && id.size() <= 20 &&
         std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace poz::core
