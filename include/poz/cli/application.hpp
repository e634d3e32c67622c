#pragma once

#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "poz/common.hpp"
#include "poz/api/transport_client.hpp"
#include "poz/cli/exit_reporter.hpp"
#include "poz/clipboard/clipboard.hpp"
#include "poz/config/config.hpp"
#include "poz/core/action_selector.hpp"
#include "poz/input/input_acquirer.hpp"
#include "poz/input/operator_prompt.hpp"

namespace poz::cli {

/**
 * @brief Options parsed from the command line
 */
struct CliOptions {
  poz::core::ActionFlags action;
  std::string tags;            // -t: comma-separated tags for a new note
  bool debug = false;          // --debug: print the equivalent curl command
  bool show_delete_hint = false;  // -d
  bool show_update_hint = false;  // -u
  std::string config_file;     // --config: Path to config file
  int verbose = 0;             // -v: can be repeated
};

/**
 * @brief External collaborators of the application
 */
struct Services {
  using TransportFactory =
      std::function<Result<std::shared_ptr<poz::api::Transport>>(const poz::config::Config&)>;

  TransportFactory make_transport;
  std::shared_ptr<poz::clipboard::Clipboard> clipboard;
  std::shared_ptr<poz::input::StdinSource> stdin_source;
  std::shared_ptr<poz::input::OperatorPrompt> prompt;
  poz::config::Config::EnvLookup env;
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  explicit Application(Services services, std::ostream& out = std::cout, std::ostream& err = std::cerr);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @param argc Argument count
   * @param argv Argument vector
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

private:
  void setupOptions(bool show_advanced);
  void setupHelp();

  // Value of --config, looked up before the full parse; empty when absent
  static std::string configPathFromArgs(int argc, char* argv[]);

  // --config, or ~/.poznote.conf
  std::filesystem::path configPath() const;

  int execute();

  CLI::App app_;
  CliOptions options_;
  Services services_;
  std::ostream& out_;
  std::ostream& err_;
  ExitReporter reporter_;
  std::optional<Result<poz::config::Config>> config_;
};

} // namespace poz::cli
