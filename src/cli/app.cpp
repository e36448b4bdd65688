#include "textsplit/cli/app.hpp"

#include "textsplit/chunk/joiner.hpp"
#include "textsplit/chunk/writer.hpp"
#include "textsplit/pipeline/packer.hpp"

#include <spdlog/spdlog.h>

namespace textsplit::cli {
namespace {

int report_failure(Command command, const Error& error) {
    spdlog::error("{} failed: {}", command_name(command), error.to_string());
    return kExitFailure;
}

void report_cleanup(const std::vector<chunk::CleanupWarning>& warnings) {
    if (!warnings.empty()) {
        spdlog::warn("{} chunk file(s) could not be deleted; the output is complete", warnings.size());
    }
}

} // namespace

Result<config::AppConfig> resolve_config(const CliOptions& options) {
    config::AppConfig resolved;
    if (options.config_file) {
        auto loaded = config::load_config(*options.config_file);
        if (loaded.is_error()) {
            return loaded;
        }
        resolved = std::move(loaded.value());
    }

    if (options.log_level) {
        auto level = config::parse_log_level(*options.log_level);
        if (level.is_error()) {
            return Err<config::AppConfig>(level.error());
        }
        resolved.log_level = *options.log_level;
    } else if (options.quiet) {
        resolved.log_level = "warn";
    }

    if (options.keep_archive) {
        resolved.keep_archive = true;
    }
    return Ok(std::move(resolved));
}

int run(const CliOptions& options, const config::AppConfig& config, events::EventBus& bus, std::ostream& out) {
    std::uint64_t chunk_size = config.chunk_size;
    if (options.chunk_size) {
        auto parsed = config::parse_chunk_size(*options.chunk_size);
        if (parsed.is_error()) {
            spdlog::error("{}: {}", command_name(options.command), parsed.error().message);
            return kExitUsage;
        }
        chunk_size = parsed.value();
    }

    switch (options.command) {
        case Command::Help:
            out << usage();
            return kExitOk;

        case Command::Split: {
            chunk::ChunkWriter writer(&bus);
            auto result = writer.split(options.path, chunk_size);
            if (result.is_error()) {
                return report_failure(options.command, result.error());
            }
            for (const auto& file : result.value().chunk_files) {
                out << file.string() << '\n';
            }
            return kExitOk;
        }

        case Command::Join: {
            chunk::ChunkJoiner joiner(&bus);
            auto result = joiner.join(options.path);
            if (result.is_error()) {
                return report_failure(options.command, result.error());
            }
            report_cleanup(result.value().cleanup_warnings);
            out << result.value().output.string() << '\n';
            return kExitOk;
        }

        case Command::Pack: {
            pipeline::Packer packer(config.compression_level, &bus);
            auto result = packer.pack(options.path, chunk_size, config.keep_archive);
            if (result.is_error()) {
                return report_failure(options.command, result.error());
            }
            for (const auto& file : result.value().chunk_files) {
                out << file.string() << '\n';
            }
            return kExitOk;
        }

        case Command::Unpack: {
            pipeline::Packer packer(config.compression_level, &bus);
            auto result = packer.unpack(options.path, options.dest_dir);
            if (result.is_error()) {
                return report_failure(options.command, result.error());
            }
            report_cleanup(result.value().cleanup_warnings);
            for (const auto& file : result.value().extracted) {
                out << file.string() << '\n';
            }
            return kExitOk;
        }
    }
    return kExitUsage;
}

} // namespace textsplit::cli
