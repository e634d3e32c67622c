#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "poz/common.hpp"
#include "poz/util/safe_process.hpp"

namespace poz::clipboard {

/**
 * @brief Read/write access to the system clipboard
 */
class Clipboard {
public:
  virtual ~Clipboard() = default;

  virtual Result<std::string> read() = 0;
  virtual Result<void> write(const std::string& text) = 0;
};

// Display server detected from the environment
enum class DisplayServer {
  kWayland,
  kX11,
  kUnknown
};

// External tool invocation for one clipboard direction
struct ClipboardTool {
  std::string command;
  std::vector<std::string> args;
};

struct ClipboardBackend {
  std::string name;
  ClipboardTool paste;
  ClipboardTool copy;
};

/**
 * @brief Clipboard backed by wl-clipboard (Wayland) or xclip (X11)
 *
 * The backend for the detected display server is tried first; the other one
 * is used when its tools are not installed. No installed tool yields
 * kMissingDependency.
 */
class SystemClipboard : public Clipboard {
public:
  using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
  using CommandProbe = std::function<bool(const std::string&)>;

  SystemClipboard();
  SystemClipboard(EnvLookup env, CommandProbe command_exists);

  Result<std::string> read() override;
  Result<void> write(const std::string& text) override;

  DisplayServer displayServer() const;

  // Backends in the order they are tried
  std::vector<ClipboardBackend> candidateBackends() const;

  // First candidate whose tools are installed
  Result<ClipboardBackend> selectBackend() const;

  // Clipboard text from a finished paste tool. wl-paste and xclip -o exit
  // non-zero when the clipboard is empty, which reads as empty text.
  static std::string pastedText(const poz::util::SafeProcess::ProcessResult& result);

  static ClipboardBackend waylandBackend();
  static ClipboardBackend x11Backend();

private:
  EnvLookup env_;
  CommandProbe command_exists_;
};

} // namespace poz::clipboard
