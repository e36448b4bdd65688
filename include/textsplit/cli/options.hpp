#pragma once

#include "textsplit/core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace textsplit::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

enum class Command {
    Help,
    Split,
    Join,
    Pack,
    Unpack
};

const char* command_name(Command command);

struct CliOptions {
    Command command = Command::Help;

    // Global flags
    std::optional<std::filesystem::path> config_file;
    std::optional<std::string> log_level;
    bool quiet = false;

    // Command arguments
    std::filesystem::path path;                     ///< source file / base path / packed file
    std::optional<std::string> chunk_size;          ///< raw text, validated when the command runs
    std::optional<std::filesystem::path> dest_dir;  ///< unpack only
    bool keep_archive = false;                      ///< pack only
};

/**
 * @brief Parse arguments (without argv[0])
 *
 * Usage errors fail with InvalidArgument; the message is meant to be
 * printed followed by usage().
 */
textsplit::Result<CliOptions> parse_cli(const std::vector<std::string>& args);

std::string usage();

} // namespace textsplit::cli
