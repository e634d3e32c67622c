#include <csignal>
#include <iostream>

#include "poz/cli/application_factory.hpp"
#include "poz/cli/exit_reporter.hpp"

int main(int argc, char* argv[]) {
  // Writes to a clipboard tool that exited early must fail with EPIPE, not kill us
  std::signal(SIGPIPE, SIG_IGN);

  try {
    auto app_result = poz::cli::ApplicationFactory::createProductionApplication();
    if (!app_result.has_value()) {
      std::cerr << "Error: " << app_result.error().message() << std::endl;
      return poz::cli::kExitFailure;
    }

    return (*app_result)->run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return poz::cli::kExitFailure;
  }
}
