#include "poz/cli/application.hpp"

#include <cstring>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "poz/api/request_builder.hpp"
#include "poz/cli/side_effect_runner.hpp"
#include "poz/core/note_body.hpp"
#include "poz/util/logging.hpp"

namespace poz::cli {

Application::Application(Services services, std::ostream& out, std::ostream& err)
    : app_("poznote-cli", "Poznote CLI Tool: Post, update, or delete notes from the terminal.")
    , services_(std::move(services))
    , out_(out)
    , err_(err)
    , reporter_(out, err) {

  app_.set_version_flag("--version", poz::getVersion().toString());
}

std::string Application::configPathFromArgs(int argc, char* argv[]) {
  constexpr const char* kFlag = "--config";
  const size_t flag_len = std::strlen(kFlag);

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == kFlag && i + 1 < argc) {
      return argv[i + 1];
    }
    if (arg.size() > flag_len + 1 && arg.compare(0, flag_len + 1, std::string(kFlag) + "=") == 0) {
      return arg.substr(flag_len + 1);
    }
  }
  return "";
}

std::filesystem::path Application::configPath() const {
  if (options_.config_file.empty()) {
    return poz::config::Config::defaultConfigPath();
  }
  return options_.config_file;
}

int Application::run(int argc, char* argv[]) {
  // Quiet stderr logger until -v has been parsed
  poz::util::setupLogging(0);

  // Advanced options are only listed in --help when the config enables them
  options_.config_file = configPathFromArgs(argc, argv);
  const std::string prescanned_config = options_.config_file;
  config_ = poz::config::Config::resolve(configPath(), services_.env);
  bool show_advanced = config_->has_value() && (*config_)->advanced_features_enabled;

  setupOptions(show_advanced);
  setupHelp();

  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e, out_, err_);
  }

  if (options_.config_file != prescanned_config) {
    config_ = poz::config::Config::resolve(configPath(), services_.env);
  }

  return execute();
}

void Application::setupOptions(bool show_advanced) {
  auto& flags = options_.action;

  app_.add_flag("-c,--clipboard", flags.clipboard, "Post content from clipboard");
  app_.add_option("-t,--tags", options_.tags, "Comma-separated tags");
  app_.add_flag("-b,--burn", flags.burn, "Interactively delete note after posting");
  app_.add_flag("-d", options_.show_delete_hint, "Show command to self-delete");
  app_.add_flag("-u", options_.show_update_hint, "Show command to self-update");
  app_.add_flag("--debug", options_.debug, "Display equivalent curl command");
  app_.add_option("--config", options_.config_file, "Path to config file (default: ~/.poznote.conf)");
  app_.add_flag("-v,--verbose", options_.verbose, "Verbose logging on stderr (repeat for debug)");

  // Hidden (empty group) unless advanced features are enabled
  const std::string advanced_group = show_advanced ? "Advanced" : "";
  app_.add_flag("-L,--last", flags.last, "List the most recent note")->group(advanced_group);
  app_.add_option_function<std::string>("-s,--search",
      [&flags](const std::string& query) { flags.search = query; },
      "Search notes by keyword")->type_name("QUERY")->group(advanced_group);
  app_.add_option_function<std::string>("-U,--update",
      [&flags](const std::string& id) { flags.update_id = id; },
      "Update a specific note by ID")->type_name("ID")->group(advanced_group);
  app_.add_option_function<std::string>("-D,--delete",
      [&flags](const std::string& id) { flags.delete_id = id; },
      "Delete a specific note by ID")->type_name("ID")->group(advanced_group);
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(30);

  app_.footer(R"(Examples:
  ls -la | poznote-cli                 # Post piped output as a new note
  poznote-cli -c -t work,snippets      # Post the clipboard with tags
  echo "one-time secret" | poznote-cli -b

Configuration is read from ~/.poznote.conf:
  POZNOTE_URL="https://your-server.com"
  POZNOTE_USER="your_username"
  POZNOTE_PASS="your_password"
  POZNOTE_USER_ID="1"
  POZNOTE_WORKSPACE="Poznote"
  POZNOTE_ADVANCED_FEATURES="true"    # Enables -L, -s, -U and -D

Exit codes: 0 success, 10 missing dependency, 11 no piped input,
12 configuration error, 13 API or network error.)");
}

int Application::execute() {
  poz::util::setupLogging(options_.verbose);

  if (!config_->has_value()) {
    return reporter_.failure(config_->error());
  }
  const poz::config::Config& config = **config_;

  auto action = poz::core::ActionSelector::select(options_.action, config);
  if (!action.has_value()) {
    return reporter_.failure(action.error());
  }

  std::optional<poz::core::NoteBody> body;
  if (poz::core::requiresBody(*action)) {
    poz::input::InputAcquirer acquirer(*services_.stdin_source, *services_.clipboard);
    auto acquired = acquirer.acquire(options_.action.clipboard, poz::core::parseTags(options_.tags));
    if (!acquired.has_value()) {
      return reporter_.failure(acquired.error());
    }
    if (!acquired->has_value()) {
      reporter_.warning("Input is empty, nothing to send.");
      return kExitSuccess;
    }
    body = std::move(**acquired);
  } else if (!options_.tags.empty()) {
    spdlog::info("Tags are only used when creating a note, ignoring -t");
  }

  poz::api::RequestBuilder builder(config);
  auto request = builder.build(*action, body ? &*body : nullptr);
  if (!request.has_value()) {
    return reporter_.failure(request.error());
  }

  auto transport = services_.make_transport(config);
  if (!transport.has_value()) {
    return reporter_.failure(transport.error());
  }

  poz::api::TransportClient client(**transport, config);
  SideEffectOptions side_effect_options;
  side_effect_options.debug = options_.debug;
  side_effect_options.show_delete_hint = options_.show_delete_hint;
  side_effect_options.show_update_hint = options_.show_update_hint;

  SideEffectRunner runner(client, builder, *services_.clipboard, *services_.prompt,
                          reporter_, config, side_effect_options);

  auto result = runner.dispatch(*request);
  auto applied = runner.apply(*action, result);
  if (!applied.has_value()) {
    return reporter_.failure(applied.error());
  }
  return kExitSuccess;
}

} // namespace poz::cli
