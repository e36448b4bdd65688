#include "textsplit/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace textsplit::config {
namespace {

using json = nlohmann::json;

Result<AppConfig> invalid(const std::string& message) {
    return Err<AppConfig>(ErrorCode::InvalidArgument, "config: " + message);
}

} // namespace

Result<std::uint64_t> parse_chunk_size(const std::string& text) {
    auto reject = [&text](const std::string& why) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument,
                                  "invalid chunk size '" + text + "': " + why);
    };

    if (text.empty()) {
        return reject("expected a positive integer");
    }

    std::uint64_t value = 0;
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return reject("expected a positive integer");
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (kMax - digit) / 10) {
            return reject("value is too large");
        }
        value = value * 10 + digit;
    }

    if (value == 0) {
        return reject("must be greater than zero");
    }
    return Ok(value);
}

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return Err<spdlog::level::level_enum>(ErrorCode::InvalidArgument,
            "unknown log level '" + name + "' (expected trace, debug, info, warn, error, critical or off)");
    }
    return Ok(level);
}

Result<AppConfig> parse_config(const std::string& json_text, AppConfig defaults) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return invalid("not valid JSON");
    }
    if (!document.is_object()) {
        return invalid("top-level value must be an object");
    }

    AppConfig config = std::move(defaults);

    if (auto it = document.find("chunk_size"); it != document.end()) {
        if (it->is_number_unsigned()) {
            const auto value = it->get<std::uint64_t>();
            if (value == 0) {
                return invalid("chunk_size must be greater than zero");
            }
            config.chunk_size = value;
        } else if (it->is_string()) {
            auto parsed = parse_chunk_size(it->get<std::string>());
            if (parsed.is_error()) {
                return invalid(parsed.error().message);
            }
            config.chunk_size = parsed.value();
        } else {
            return invalid("chunk_size must be a positive integer");
        }
    }

    if (auto it = document.find("log_level"); it != document.end()) {
        if (!it->is_string()) {
            return invalid("log_level must be a string");
        }
        auto level = parse_log_level(it->get<std::string>());
        if (level.is_error()) {
            return invalid(level.error().message);
        }
        config.log_level = it->get<std::string>();
    }

    if (auto it = document.find("log_pattern"); it != document.end()) {
        if (!it->is_string()) {
            return invalid("log_pattern must be a string");
        }
        config.log_pattern = it->get<std::string>();
    }

    if (auto it = document.find("keep_archive"); it != document.end()) {
        if (!it->is_boolean()) {
            return invalid("keep_archive must be true or false");
        }
        config.keep_archive = it->get<bool>();
    }

    if (auto it = document.find("compression_level"); it != document.end()) {
        if (!it->is_number_integer()) {
            return invalid("compression_level must be an integer");
        }
        // Range-check at full width; get<int>() would wrap large values into range
        const bool in_range = it->is_number_unsigned()
                                  ? it->get<std::uint64_t>() <= 9
                                  : it->get<std::int64_t>() >= -1 && it->get<std::int64_t>() <= 9;
        if (!in_range) {
            return invalid("compression_level must be -1 or between 0 and 9");
        }
        config.compression_level = static_cast<int>(it->get<std::int64_t>());
    }

    return Ok(std::move(config));
}

Result<AppConfig> load_config(const std::filesystem::path& file, AppConfig defaults) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return Err<AppConfig>(ErrorCode::NotFound, "config: file not found: " + file.string());
    }

    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return Err<AppConfig>(ErrorCode::IOFailure, "config: failed to open " + file.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return Err<AppConfig>(ErrorCode::IOFailure, "config: failed to read " + file.string());
    }

    auto parsed = parse_config(buffer.str(), std::move(defaults));
    if (parsed.is_error()) {
        return Err<AppConfig>(make_error(parsed.error().code, parsed.error().message + " in " + file.string()));
    }
    return parsed;
}

Result<void> apply_logging(const AppConfig& config) {
    auto level = parse_log_level(config.log_level);
    if (level.is_error()) {
        return Err<void>(level.error());
    }
    spdlog::set_level(level.value());
    spdlog::set_pattern(config.log_pattern);
    return Ok();
}

} // namespace textsplit::config
