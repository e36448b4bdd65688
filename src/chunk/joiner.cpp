#include "textsplit/chunk/joiner.hpp"

#include "textsplit/chunk/naming.hpp"
#include "textsplit/codec/base64.hpp"
#include "textsplit/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace textsplit::chunk {
namespace fs = std::filesystem;
namespace {

Result<std::string> read_text(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::IOFailure, "join: failed to open chunk file " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<std::string>(ErrorCode::IOFailure, "join: failed to read chunk file " + path.string());
    }
    return Ok(std::move(text));
}

std::string describe_gaps(const std::vector<IndexGap>& gaps) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < gaps.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << gaps[i].first;
        if (gaps[i].last != gaps[i].first) {
            oss << '-' << gaps[i].last;
        }
    }
    return oss.str();
}

} // namespace

std::vector<IndexGap> ChunkManifest::gaps() const {
    std::vector<std::uint32_t> present;
    for (const auto& entry : entries) {
        if (entry.index) {
            present.push_back(*entry.index);
        }
    }
    std::sort(present.begin(), present.end());

    // Bounded by the number of entries, not by the index values
    std::vector<IndexGap> gaps;
    std::uint32_t expected = 1;
    for (std::uint32_t index : present) {
        if (index > expected) {
            gaps.push_back(IndexGap{expected, index - 1});
        }
        if (index >= expected) {
            expected = index + 1;
        }
    }
    return gaps;
}

std::vector<fs::path> ChunkManifest::unnumbered() const {
    std::vector<fs::path> out;
    for (const auto& entry : entries) {
        if (!entry.index) {
            out.push_back(entry.path);
        }
    }
    return out;
}

ChunkManifest ChunkJoiner::build_manifest(const fs::path& base, std::vector<fs::path> matches) {
    std::sort(matches.begin(), matches.end(), [](const fs::path& lhs, const fs::path& rhs) {
        return lhs.filename().string() < rhs.filename().string();
    });

    ChunkManifest manifest;
    manifest.base = base;
    manifest.entries.reserve(matches.size());
    const std::string base_name = base.filename().string();
    for (auto& path : matches) {
        ManifestEntry entry;
        entry.index = parse_chunk_index(path.filename().string(), base_name);
        entry.path = std::move(path);
        manifest.entries.push_back(std::move(entry));
    }
    return manifest;
}

Result<ChunkManifest> ChunkJoiner::discover(const fs::path& base) const {
    auto matches = find_chunk_files(base);
    if (matches.is_error()) {
        return Err<ChunkManifest>(ErrorCode::IOFailure, "join: " + matches.error().message);
    }
    if (matches.value().empty()) {
        return Err<ChunkManifest>(ErrorCode::NotFound,
            "join: no chunk files matching " + base.string() + kPartMarker + "*" + kChunkExtension);
    }

    auto manifest = build_manifest(base, std::move(matches.value()));
    for (auto& entry : manifest.entries) {
        std::error_code ec;
        const auto size = fs::file_size(entry.path, ec);
        entry.encoded_bytes = ec ? 0 : size;
    }
    return Ok(std::move(manifest));
}

Result<JoinResult> ChunkJoiner::join(const fs::path& base) const {
    const auto started = std::chrono::steady_clock::now();

    auto discovered = discover(base);
    if (discovered.is_error()) {
        return fail(base, discovered.error());
    }
    const ChunkManifest& manifest = discovered.value();
    report_irregularities(manifest);

    const fs::path temp_output = temp_path_for(base);
    auto assembled = assemble(manifest, temp_output);
    if (assembled.is_error()) {
        std::error_code ignored;
        fs::remove(temp_output, ignored);
        return fail(base, assembled.error());
    }

    std::error_code ec;
    fs::rename(temp_output, base, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_output, ignored);
        return fail(base, make_error(ErrorCode::IOFailure,
            "join: failed to move " + temp_output.string() + " to " + base.string() + ": " + ec.message()));
    }

    JoinResult result;
    result.output = base;
    result.chunk_count = manifest.size();
    result.bytes_written = assembled.value();
    result.cleanup_warnings = remove_consumed(manifest);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    events::publish(bus_, events::JoinCompletedEvent{
        base, result.chunk_count, result.bytes_written, elapsed});

    return Ok(std::move(result));
}

Result<std::uint64_t> ChunkJoiner::assemble(const ChunkManifest& manifest, const fs::path& temp_output) const {
    std::ofstream output(temp_output, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<std::uint64_t>(ErrorCode::IOFailure, "join: failed to create output " + temp_output.string());
    }

    const auto total = static_cast<std::uint32_t>(manifest.size());
    std::uint64_t bytes_written = 0;
    std::vector<std::uint8_t> decoded;
    std::uint32_t position = 0;

    for (const auto& entry : manifest.entries) {
        ++position;
        auto text = read_text(entry.path);
        if (text.is_error()) {
            return Err<std::uint64_t>(text.error());
        }

        decoded.clear();
        if (auto status = codec::decode_append(text.value(), decoded); status.is_error()) {
            return Err<std::uint64_t>(ErrorCode::CorruptChunk,
                "join: chunk file " + entry.path.string() + " is not valid base64 (" +
                status.error().message + ")");
        }

        output.write(reinterpret_cast<const char*>(decoded.data()), static_cast<std::streamsize>(decoded.size()));
        if (!output) {
            return Err<std::uint64_t>(ErrorCode::IOFailure,
                "join: failed to write " + temp_output.string() + " while appending " + entry.path.string());
        }
        bytes_written += decoded.size();

        events::publish(bus_, events::ChunkDecodedEvent{entry.path, position, total, decoded.size()});
    }

    output.close();
    if (!output) {
        return Err<std::uint64_t>(ErrorCode::IOFailure, "join: failed to close output " + temp_output.string());
    }
    return Ok(bytes_written);
}

std::vector<CleanupWarning> ChunkJoiner::remove_consumed(const ChunkManifest& manifest) const {
    std::vector<CleanupWarning> warnings;
    for (const auto& entry : manifest.entries) {
        std::error_code ec;
        const bool removed = fs::remove(entry.path, ec);
        if (removed && !ec) {
            continue;
        }
        CleanupWarning warning{entry.path, ec ? ec.message() : std::string("file vanished before cleanup")};
        events::publish(bus_, events::ChunkCleanupFailedEvent{warning.chunk_file, warning.reason});
        warnings.push_back(std::move(warning));
    }
    return warnings;
}

void ChunkJoiner::report_irregularities(const ChunkManifest& manifest) {
    for (const auto& path : manifest.unnumbered()) {
        spdlog::warn("join: {} matches the chunk pattern but carries no numeric index; joined in name order",
                     path.string());
    }
    const auto gaps = manifest.gaps();
    if (!gaps.empty()) {
        spdlog::warn("join: chunk family {} has gaps, missing index(es): {}",
                     manifest.base.string(), describe_gaps(gaps));
    }
}

Result<JoinResult> ChunkJoiner::fail(const fs::path& base, Error error) const {
    events::publish(bus_, events::OperationFailedEvent{"join", base, error.message});
    return Err<JoinResult>(std::move(error));
}

} // namespace textsplit::chunk
