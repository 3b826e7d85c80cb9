// apps/bridge_app/src/main.cpp
// hearth-gateway: hearth_bridge
// Purpose: run one gateway operation from the command line and print the result as JSON.
//
// Usage:
//   ./hearth_bridge <config.json|-> <interface> <operation> [kwargs-json]
//
// Notes:
// - "-" as config selects built-in defaults.
// - Exit status: 0 on success, 1 on an operation failure, 2 on usage/config errors.
// - Events go to stderr through spdlog; stdout carries only the result document.

#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hearth/config/config_loader.hpp"
#include "hearth/core/singleton_registry.hpp"
#include "hearth/gateway/gateway.hpp"
#include "hearth/obs/observability.hpp"
#include "hearth/version.hpp"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <config.json|-> <interface> <operation> [kwargs-json]\n"
              << "interfaces:";
    for (auto name : hearth::gateway::interfaces()) std::cerr << ' ' << name;
    std::cerr << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 4 || argc > 5) {
        usage(argv[0]);
        return 2;
    }

    const std::string config_path = argv[1];
    auto runtime = config_path == "-" ? hearth::config::Loader::defaults()
                                      : hearth::config::Loader::load_from_file(config_path);
    if (!runtime) {
        std::cerr << "config error: " << runtime.error() << std::endl;
        return 2;
    }

    nlohmann::json kwargs = nlohmann::json::object();
    if (argc == 5) {
        kwargs = nlohmann::json::parse(argv[4], nullptr, /*allow_exceptions=*/false);
        if (kwargs.is_discarded() || !kwargs.is_object()) {
            std::cerr << "kwargs must be a JSON object" << std::endl;
            return 2;
        }
    }

    auto logger = hearth::obs::default_logger();
    logger->backend().set_level(spdlog::level::from_str(runtime->log_level));
    logger->log_debug("", "BOOT", "starting", {{"user_agent", std::string(hearth::user_agent)},
                                               {"config", config_path}});

    hearth::core::SingletonRegistry registry;
    hearth::gateway::GatewayOptions options;
    options.runtime = std::move(*runtime);
    options.logger = logger;
    hearth::gateway::Gateway gateway(registry, std::move(options));

    const auto result = gateway.execute(argv[2], argv[3], kwargs);
    std::cout << result.to_json().dump(2) << std::endl;

    logger->backend().flush();
    return result.success ? 0 : 1;
}
