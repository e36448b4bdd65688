#pragma once

#include "textsplit/chunk/types.hpp"
#include "textsplit/core/result.hpp"
#include "textsplit/events/event_bus.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace textsplit::chunk {

/**
 * @brief Splits a file into base64 chunk files "{source}.part{NNN}.txt"
 *
 * Holds no state besides the optional event bus; every split() is an
 * independent operation on the filesystem.
 */
class ChunkWriter {
public:
    explicit ChunkWriter(events::EventBus* bus = nullptr) : bus_(bus) {}

    /**
     * @brief Split @p source into chunks of at most @p max_chunk_bytes raw bytes
     *
     * Fails with NotFound if @p source is not a regular file, with
     * InvalidArgument if @p max_chunk_bytes is zero or the split would need
     * more than kMaxChunkCount chunks (both before any file is created),
     * and with IOFailure if reading or writing fails mid-stream. Chunk files
     * written before an IOFailure are left in place.
     *
     * A zero-length source produces no chunk files and succeeds.
     */
    textsplit::Result<SplitResult> split(const std::filesystem::path& source,
                                         std::uint64_t max_chunk_bytes) const;

private:
    textsplit::Result<void> write_chunk_file(const std::filesystem::path& chunk_path,
                                             const std::string& encoded) const;

    void remove_stale_chunks(const std::filesystem::path& source, std::uint32_t chunk_count) const;

    textsplit::Result<SplitResult> fail(const std::filesystem::path& source, Error error) const;

    events::EventBus* bus_;
};

} // namespace textsplit::chunk
