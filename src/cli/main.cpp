#include "textsplit/cli/app.hpp"
#include "textsplit/cli/options.hpp"
#include "textsplit/config/config.hpp"
#include "textsplit/events/components.hpp"
#include "textsplit/events/event_bus.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    // stdout carries the produced paths; logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("textsplit"));
    spdlog::set_pattern(textsplit::config::kDefaultLogPattern);

    const std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = textsplit::cli::parse_cli(args);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().message);
        std::cerr << textsplit::cli::usage();
        return textsplit::cli::kExitUsage;
    }
    const auto& options = parsed.value();

    if (options.command == textsplit::cli::Command::Help) {
        std::cout << textsplit::cli::usage();
        return textsplit::cli::kExitOk;
    }

    auto config = textsplit::cli::resolve_config(options);
    if (config.is_error()) {
        spdlog::error("{}", config.error().to_string());
        return config.error().code == textsplit::ErrorCode::InvalidArgument
            ? textsplit::cli::kExitUsage
            : textsplit::cli::kExitFailure;
    }
    if (auto applied = textsplit::config::apply_logging(config.value()); applied.is_error()) {
        spdlog::error("{}", applied.error().to_string());
        return textsplit::cli::kExitUsage;
    }

    textsplit::events::EventBus bus;
    textsplit::events::LoggerComponent logger(bus);
    textsplit::events::MetricsComponent metrics(bus);

    const int exit_code = textsplit::cli::run(options, config.value(), bus, std::cout);
    metrics.print_stats();
    return exit_code;
}
