#pragma once

#include "textsplit/core/result.hpp"

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace textsplit::config {

inline constexpr std::uint64_t kDefaultChunkSize = 20'000'000;
inline constexpr const char* kDefaultLogPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Settings read from an optional JSON file and overridden by CLI flags
 *
 * {
 *   "chunk_size": 20000000,          // integer or decimal string
 *   "log_level": "info",
 *   "log_pattern": "[%H:%M:%S] [%^%l%$] %v",
 *   "keep_archive": false,
 *   "compression_level": -1          // -1 (zlib default) or 0..9
 * }
 *
 * Unknown keys are ignored.
 */
struct AppConfig {
    std::uint64_t chunk_size = kDefaultChunkSize;
    std::string log_level = "info";
    std::string log_pattern = kDefaultLogPattern;
    bool keep_archive = false;
    int compression_level = -1;
};

/**
 * @brief Parse a chunk size given as text ("20000000")
 *
 * Only plain decimal digits are accepted. Empty text, signs, separators,
 * suffixes, zero and values beyond 64 bits fail with InvalidArgument.
 */
textsplit::Result<std::uint64_t> parse_chunk_size(const std::string& text);

textsplit::Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Overlay the keys present in @p json_text onto @p defaults
 */
textsplit::Result<AppConfig> parse_config(const std::string& json_text, AppConfig defaults = {});

/**
 * @brief Read and parse a config file
 *
 * NotFound if the file is missing, IOFailure if it cannot be read,
 * InvalidArgument for malformed JSON or invalid values.
 */
textsplit::Result<AppConfig> load_config(const std::filesystem::path& file, AppConfig defaults = {});

/**
 * @brief Apply log level and pattern to the default spdlog logger
 */
textsplit::Result<void> apply_logging(const AppConfig& config);

} // namespace textsplit::config
