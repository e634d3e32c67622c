#pragma once

#include <memory>

#include "poz/common.hpp"
#include "poz/cli/application.hpp"

namespace poz::cli {

/**
 * @brief Factory for creating properly configured Application instances
 */
class ApplicationFactory {
public:
    /**
     * @brief Create an application talking to the real terminal, clipboard and network
     */
    static Result<std::unique_ptr<Application>> createProductionApplication();

    /**
     * @brief Services backed by the system: libcurl, xclip/wl-clipboard, stdin, /dev/tty
     */
    static Services productionServices();

private:
    ApplicationFactory() = delete;
};

} // namespace poz::cli
