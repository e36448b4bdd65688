#pragma once

#include "textsplit/cli/options.hpp"
#include "textsplit/config/config.hpp"
#include "textsplit/core/result.hpp"
#include "textsplit/events/event_bus.hpp"

#include <ostream>

namespace textsplit::cli {

/**
 * @brief Defaults, then the config file, then command-line flags
 */
textsplit::Result<config::AppConfig> resolve_config(const CliOptions& options);

/**
 * @brief Run the parsed command
 *
 * Paths produced by the command (chunk files, joined output, extracted
 * files) are written to @p out one per line; diagnostics go through spdlog.
 *
 * RETURNS:
 * kExitOk, kExitFailure for a failed operation, kExitUsage for an invalid
 * chunk size argument
 */
int run(const CliOptions& options, const config::AppConfig& config, events::EventBus& bus, std::ostream& out);

} // namespace textsplit::cli
