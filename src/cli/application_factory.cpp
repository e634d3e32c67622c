#include "poz/cli/application_factory.hpp"

#include <stdexcept>

namespace poz::cli {

Services ApplicationFactory::productionServices() {
    Services services;

    services.make_transport = [](const poz::config::Config& config)
        -> Result<std::shared_ptr<poz::api::Transport>> {
        try {
            return std::make_shared<poz::api::CurlTransport>(config.request_timeout);
        } catch (const std::runtime_error& e) {
            return std::unexpected(makeError(ErrorCode::kMissingDependency,
                                             "HTTP support unavailable: " + std::string(e.what())));
        }
    };
    services.clipboard = std::make_shared<poz::clipboard::SystemClipboard>();
    services.stdin_source = std::make_shared<poz::input::ProcessStdin>();
    services.prompt = std::make_shared<poz::input::TtyPrompt>();
    services.env = poz::config::Config::processEnv();

    return services;
}

Result<std::unique_ptr<Application>> ApplicationFactory::createProductionApplication() {
    try {
        return std::make_unique<Application>(productionServices());
    } catch (const std::exception& e) {
        return std::unexpected(makeError(ErrorCode::kUnknownError,
                                         "Failed to initialize: " + std::string(e.what())));
    }
}

} // namespace poz::cli
