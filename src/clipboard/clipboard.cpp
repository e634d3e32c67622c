#include "poz/clipboard/clipboard.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

#include "poz/util/safe_process.hpp"

namespace poz::clipboard {

namespace {

std::optional<std::string> getEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace

SystemClipboard::SystemClipboard()
    : SystemClipboard(getEnv, [](const std::string& command) {
        return poz::util::SafeProcess::commandExists(command);
      }) {
}

SystemClipboard::SystemClipboard(EnvLookup env, CommandProbe command_exists)
    : env_(std::move(env)), command_exists_(std::move(command_exists)) {
}

DisplayServer SystemClipboard::displayServer() const {
  auto has = [this](const std::string& name) {
    auto value = env_(name);
    return value.has_value() && !value->empty();
  };
  if (has("WAYLAND_DISPLAY")) {
    return DisplayServer::kWayland;
  }
  if (has("DISPLAY")) {
    return DisplayServer::kX11;
  }
  return DisplayServer::kUnknown;
}

ClipboardBackend SystemClipboard::waylandBackend() {
  return ClipboardBackend{
      "wl-clipboard",
      ClipboardTool{"wl-paste", {"--no-newline"}},
      ClipboardTool{"wl-copy", {}},
  };
}

ClipboardBackend SystemClipboard::x11Backend() {
  return ClipboardBackend{
      "xclip",
      ClipboardTool{"xclip", {"-selection", "clipboard", "-o"}},
      ClipboardTool{"xclip", {"-selection", "clipboard"}},
  };
}

std::vector<ClipboardBackend> SystemClipboard::candidateBackends() const {
  if (displayServer() == DisplayServer::kWayland) {
    return {waylandBackend(), x11Backend()};
  }
  return {x11Backend(), waylandBackend()};
}

Result<ClipboardBackend> SystemClipboard::selectBackend() const {
  for (const auto& backend : candidateBackends()) {
    if (command_exists_(backend.paste.command) && command_exists_(backend.copy.command)) {
      spdlog::debug("Using clipboard backend {}", backend.name);
      return backend;
    }
  }
  return std::unexpected(makeError(ErrorCode::kMissingDependency,
                                   "No clipboard utility found: install xclip (X11) or wl-clipboard (Wayland)"));
}

Result<std::string> SystemClipboard::read() {
  auto backend = selectBackend();
  if (!backend.has_value()) {
    return std::unexpected(backend.error());
  }

  auto output = poz::util::SafeProcess::execute(backend->paste.command, backend->paste.args);
  if (!output.has_value()) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     "Failed to read clipboard: " + output.error().message()));
  }
  return pastedText(*output);
}

std::string SystemClipboard::pastedText(const poz::util::SafeProcess::ProcessResult& result) {
  if (!result.success()) {
    spdlog::info("Paste tool exited with {}, treating clipboard as empty: {}",
                 result.exit_code, result.stderr_output);
    return "";
  }
  return result.stdout_output;
}

Result<void> SystemClipboard::write(const std::string& text) {
  auto backend = selectBackend();
  if (!backend.has_value()) {
    return std::unexpected(backend.error());
  }

  auto exit_code = poz::util::SafeProcess::executeWithInput(backend->copy.command, backend->copy.args, text);
  if (!exit_code.has_value()) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     "Failed to write clipboard: " + exit_code.error().message()));
  }
  if (*exit_code != 0) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     backend->copy.command + " exited with code " + std::to_string(*exit_code)));
  }
  return {};
}

} // namespace poz::clipboard
