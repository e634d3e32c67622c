#include "poz/cli/side_effect_runner.hpp"

#include <spdlog/spdlog.h>

namespace poz::cli {

using poz::core::ApiResult;

namespace {
const std::string kRule(40, '-');
}

SideEffectRunner::SideEffectRunner(poz::api::TransportClient& transport,
                                   const poz::api::RequestBuilder& builder,
                                   poz::clipboard::Clipboard& clipboard,
                                   poz::input::OperatorPrompt& prompt,
                                   ExitReporter& reporter,
                                   const poz::config::Config& config,
                                   SideEffectOptions options)
    : transport_(transport),
      builder_(builder),
      clipboard_(clipboard),
      prompt_(prompt),
      reporter_(reporter),
      config_(config),
      options_(std::move(options)) {
}

ApiResult SideEffectRunner::dispatch(const poz::api::ApiRequest& request) {
  if (options_.debug) {
    printDebugCommand(request.http);
  }
  return transport_.execute(request);
}

void SideEffectRunner::printDebugCommand(const poz::util::HttpRequest& request) {
  reporter_.info("");
  reporter_.info("--- DEBUG: CURL COMMAND ---");
  reporter_.info(poz::api::RequestBuilder::renderCurl(request));
  reporter_.info("---------------------------");
  reporter_.info("");
}

Result<void> SideEffectRunner::apply(const poz::core::Action& action, const ApiResult& result) {
  using namespace poz::core;

  if (!result.ok()) {
    return std::unexpected(result.toError());
  }

  if (std::holds_alternative<CreateNote>(action) || std::holds_alternative<PostFromClipboard>(action)) {
    return onCreated(result, false);
  }
  if (std::holds_alternative<Burn>(action)) {
    return onCreated(result, true);
  }
  if (std::holds_alternative<ListLast>(action)) {
    return onListed(result, nullptr);
  }
  if (const auto* search = std::get_if<Search>(&action)) {
    return onListed(result, search);
  }
  if (const auto* update = std::get_if<Update>(&action)) {
    return onUpdated(*update, result);
  }
  return onDeleted(std::get<Delete>(action));
}

Result<void> SideEffectRunner::onCreated(const ApiResult& result, bool burn_after) {
  if (!result.note_id.has_value() || !result.note_url.has_value()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Note was posted but the response did not include a note id"));
  }
  const std::string& note_id = *result.note_id;

  if (burn_after) {
    reporter_.info("Success: " + *result.note_url);
    copyUrl(*result.note_url);
    return burn(note_id);
  }

  copyUrl(*result.note_url);
  reporter_.success("Success: " + *result.note_url);
  if (options_.show_delete_hint) {
    reporter_.info("To delete this note run: " + options_.program_name + " -D " + note_id);
  }
  if (options_.show_update_hint) {
    reporter_.info("To update this note run: [command] | " + options_.program_name + " -U " + note_id);
  }
  return {};
}

Result<void> SideEffectRunner::burn(const std::string& note_id) {
  reporter_.info("");
  reporter_.info("BURN MODE: Note will be deleted from " + config_.workspace + " when you proceed.");

  auto confirmed = prompt_.waitForKeyPress("Press [Enter] to delete...");
  if (!confirmed.has_value()) {
    return std::unexpected(makeError(confirmed.error().code(),
                                     confirmed.error().message() + "; note " + note_id + " was not deleted"));
  }

  auto deleted = dispatch(builder_.deleteNote(note_id));
  if (!deleted.ok()) {
    auto error = deleted.toError();
    return std::unexpected(makeError(error.code(),
                                     "Note " + note_id + " was created but could not be deleted: " +
                                     error.message()));
  }

  reporter_.success("Success: Note " + note_id + " deleted.");
  return {};
}

Result<void> SideEffectRunner::onListed(const ApiResult& result, const poz::core::Search* search) {
  if (!result.note.has_value() || !result.note_url.has_value()) {
    if (search != nullptr) {
      reporter_.success("No notes found matching '" + search->query + "' in workspace: " + config_.workspace);
    } else {
      reporter_.success("No notes found in workspace: " + config_.workspace);
    }
    return {};
  }

  const auto& note = *result.note;
  if (search != nullptr) {
    reporter_.info("First match for '" + search->query + "' in " + config_.workspace +
                   " [ID: " + note.id + "]");
  } else {
    reporter_.info("--- Latest Note in " + config_.workspace + " [ID: " + note.id + "] ---");
  }
  reporter_.info(note.heading);
  reporter_.info(note.content);
  reporter_.info(kRule);

  copyUrl(*result.note_url);
  reporter_.success((search != nullptr ? "View in browser: " : "URL: ") + *result.note_url);
  return {};
}

Result<void> SideEffectRunner::onUpdated(const poz::core::Update& update, const ApiResult& result) {
  if (result.note_url.has_value()) {
    copyUrl(*result.note_url);
    reporter_.success("Success: Note " + update.note_id + " updated: " + *result.note_url);
  } else {
    reporter_.success("Success: Note " + update.note_id + " updated.");
  }
  return {};
}

Result<void> SideEffectRunner::onDeleted(const poz::core::Delete& remove) {
  reporter_.success("Success: Note " + remove.note_id + " deleted.");
  return {};
}

void SideEffectRunner::copyUrl(const std::string& url) {
  auto copied = clipboard_.write(url);
  if (!copied.has_value()) {
    reporter_.warning("Could not copy URL to clipboard: " + copied.error().message());
    return;
  }
  spdlog::debug("Copied {} to clipboard", url);
}

} // namespace poz::cli
