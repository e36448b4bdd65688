#include "textsplit/chunk/writer.hpp"

#include "textsplit/chunk/naming.hpp"
#include "textsplit/codec/base64.hpp"
#include "textsplit/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

namespace textsplit::chunk {
namespace fs = std::filesystem;

Result<SplitResult> ChunkWriter::split(const fs::path& source, std::uint64_t max_chunk_bytes) const {
    const auto started = std::chrono::steady_clock::now();

    if (max_chunk_bytes == 0) {
        return fail(source, make_error(ErrorCode::InvalidArgument,
                                       "split: chunk size must be > 0 for " + source.string()));
    }

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return fail(source, make_error(ErrorCode::NotFound,
                                       "split: source file not found: " + source.string()));
    }

    const std::uint64_t source_size = fs::file_size(source, ec);
    if (ec) {
        return fail(source, make_error(ErrorCode::IOFailure,
                                       "split: cannot stat " + source.string() + ": " + ec.message()));
    }

    const std::uint64_t planned = expected_chunk_count(source_size, max_chunk_bytes);
    if (planned > kMaxChunkCount) {
        return fail(source, make_error(ErrorCode::InvalidArgument,
            "split: " + source.string() + " needs " + std::to_string(planned) +
            " chunks of " + std::to_string(max_chunk_bytes) + " bytes; at most " +
            std::to_string(kMaxChunkCount) + " are supported"));
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return fail(source, make_error(ErrorCode::IOFailure,
                                       "split: failed to open source file: " + source.string()));
    }

    SplitResult result;
    result.source = source;

    // Never allocate more than the file can fill
    const auto buffer_size = static_cast<std::size_t>(std::min<std::uint64_t>(max_chunk_bytes,
                                                                             std::max<std::uint64_t>(source_size, 1)));
    std::vector<std::uint8_t> buffer(buffer_size);
    const auto total_chunks = static_cast<std::uint32_t>(planned);
    std::uint32_t chunk_index = 0;

    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }

        ++chunk_index;
        if (chunk_index > kMaxChunkCount) {
            return fail(source, make_error(ErrorCode::IOFailure,
                "split: " + source.string() + " grew while being split; wrote " +
                std::to_string(result.chunk_files.size()) + " chunk file(s)"));
        }

        const std::string encoded = codec::encode(buffer.data(), bytes_read);
        const fs::path chunk_path = chunk_file_path(source, chunk_index);
        if (auto written = write_chunk_file(chunk_path, encoded); written.is_error()) {
            return fail(source, make_error(ErrorCode::IOFailure,
                written.error().message + " (after " + std::to_string(result.chunk_files.size()) +
                " chunk file(s) written)"));
        }

        result.chunk_files.push_back(chunk_path);
        result.source_bytes += bytes_read;

        events::publish(bus_, events::ChunkWrittenEvent{
            source, chunk_path, chunk_index, std::max(total_chunks, chunk_index), bytes_read, encoded.size()});
    }

    if (input.bad()) {
        return fail(source, make_error(ErrorCode::IOFailure,
            "split: read error on " + source.string() + " after " +
            std::to_string(result.chunk_files.size()) + " chunk file(s) written"));
    }

    remove_stale_chunks(source, chunk_index);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    events::publish(bus_, events::SplitCompletedEvent{
        source, result.chunk_files.size(), result.source_bytes, elapsed});

    return Ok(std::move(result));
}

Result<void> ChunkWriter::write_chunk_file(const fs::path& chunk_path, const std::string& encoded) const {
    const fs::path temp = temp_path_for(chunk_path);
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::IOFailure, "split: failed to create " + temp.string());
        }
        output.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
        output.close();
        if (!output) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err<void>(ErrorCode::IOFailure, "split: failed to write " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, chunk_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Err<void>(ErrorCode::IOFailure,
                         "split: failed to move " + temp.string() + " to " + chunk_path.string() +
                         ": " + ec.message());
    }
    return Ok();
}

void ChunkWriter::remove_stale_chunks(const fs::path& source, std::uint32_t chunk_count) const {
    auto family = find_chunk_files(source);
    if (family.is_error()) {
        spdlog::warn("split: could not scan for stale chunk files: {}", family.error().message);
        return;
    }

    const std::string base_name = source.filename().string();
    for (const auto& path : family.value()) {
        const auto index = parse_chunk_index(path.filename().string(), base_name);
        if (!index || *index <= chunk_count) {
            continue;
        }
        std::error_code ec;
        if (fs::remove(path, ec)) {
            spdlog::warn("split: removed stale chunk file {} left by an earlier split", path.string());
        } else if (ec) {
            spdlog::warn("split: stale chunk file {} could not be removed: {}", path.string(), ec.message());
        }
    }
}

Result<SplitResult> ChunkWriter::fail(const fs::path& source, Error error) const {
    events::publish(bus_, events::OperationFailedEvent{"split", source, error.message});
    return Err<SplitResult>(std::move(error));
}

} // namespace textsplit::chunk
