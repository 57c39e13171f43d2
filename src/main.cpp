// SPDX-License-Identifier: MIT

// src/main.cpp
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "lib/stream/shutdown_token.hpp"
#include "src/channel_factory.hpp"
#include "src/config.hpp"
#include "src/logging.hpp"
#include "src/message_dispatcher.hpp"
#include "src/reconnect_supervisor.hpp"
#include "src/shutdown_coordinator.hpp"

using namespace geyser_pipe;

int main() {
    std::size_t from_file = LoadDotEnv();
    ConfigureLoggingFromEnv();
    if (from_file > 0) {
        spdlog::debug("Loaded {} variables from .env", from_file);
    }

    auto config = LoadConfig();
    if (!config) {
        spdlog::critical("Fatal error: {}", config.error().message);
        return EXIT_FAILURE;
    }

    ShutdownToken shutdown;
    ShutdownCoordinator coordinator(shutdown);
    coordinator.Start();

    MessageDispatcher dispatcher;
    ReconnectSupervisor supervisor(
        [&config] { return Connect(*config); }, shutdown, dispatcher);
    supervisor.Run();

    coordinator.Stop();
    spdlog::info("Shutdown complete");
    return EXIT_SUCCESS;
}
