#pragma once

#include <string>

#include "poz/common.hpp"
#include "poz/api/request_builder.hpp"
#include "poz/api/transport_client.hpp"
#include "poz/cli/exit_reporter.hpp"
#include "poz/clipboard/clipboard.hpp"
#include "poz/config/config.hpp"
#include "poz/core/action.hpp"
#include "poz/core/api_result.hpp"
#include "poz/input/operator_prompt.hpp"

namespace poz::cli {

struct SideEffectOptions {
  bool debug = false;              // --debug: echo each request as a curl command
  bool show_delete_hint = false;   // -d
  bool show_update_hint = false;   // -u
  std::string program_name = "poznote-cli";
};

/**
 * @brief Sends requests and performs what follows a response
 *
 * Copies note URLs to the clipboard, prints fetched notes and runs the burn
 * sequence: URL shown and copied, blocking wait for the operator, then one
 * delete of the created note.
 */
class SideEffectRunner {
public:
  SideEffectRunner(poz::api::TransportClient& transport,
                   const poz::api::RequestBuilder& builder,
                   poz::clipboard::Clipboard& clipboard,
                   poz::input::OperatorPrompt& prompt,
                   ExitReporter& reporter,
                   const poz::config::Config& config,
                   SideEffectOptions options);

  // Send one request, echoing it first in debug mode
  poz::core::ApiResult dispatch(const poz::api::ApiRequest& request);

  // React to the response of the action's request
  Result<void> apply(const poz::core::Action& action, const poz::core::ApiResult& result);

private:
  Result<void> onCreated(const poz::core::ApiResult& result, bool burn);
  Result<void> onListed(const poz::core::ApiResult& result, const poz::core::Search* search);
  Result<void> onUpdated(const poz::core::Update& update, const poz::core::ApiResult& result);
  Result<void> onDeleted(const poz::core::Delete& remove);
  Result<void> burn(const std::string& note_id);

  void copyUrl(const std::string& url);
  void printDebugCommand(const poz::util::HttpRequest& request);

  poz::api::TransportClient& transport_;
  const poz::api::RequestBuilder& builder_;
  poz::clipboard::Clipboard& clipboard_;
  poz::input::OperatorPrompt& prompt_;
  ExitReporter& reporter_;
  const poz::config::Config& config_;
  SideEffectOptions options_;
};

} // namespace poz::cli
