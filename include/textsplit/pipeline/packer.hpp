#pragma once

#include "textsplit/archive/zip_archive.hpp"
#include "textsplit/chunk/joiner.hpp"
#include "textsplit/chunk/types.hpp"
#include "textsplit/chunk/writer.hpp"
#include "textsplit/core/result.hpp"
#include "textsplit/events/event_bus.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace textsplit::pipeline {

struct UnpackResult {
    std::filesystem::path archive;                  ///< "{file}.zip" that was rebuilt
    std::vector<std::filesystem::path> extracted;
    std::vector<chunk::CleanupWarning> cleanup_warnings;
};

/**
 * @brief compress+split and join+decompress
 *
 * pack("app.exe", M) leaves "app.exe.zip.part001.txt" ... next to the file;
 * unpack("app.exe") rebuilds "app.exe.zip" from them and extracts it.
 */
class Packer {
public:
    explicit Packer(int compression_level = archive::kDefaultCompressionLevel,
                    events::EventBus* bus = nullptr)
        : archiver_(compression_level, bus), writer_(bus), joiner_(bus) {}

    /**
     * @brief Compress @p file to "{file}.zip" and split the archive
     *
     * The intermediate archive is removed afterwards unless @p keep_archive.
     */
    textsplit::Result<chunk::SplitResult> pack(const std::filesystem::path& file,
                                               std::uint64_t max_chunk_bytes,
                                               bool keep_archive = false) const;

    /**
     * @brief Join "{file}.zip" from its chunks and extract it
     *
     * Extracts into @p dest_dir, or next to @p file when not given. The
     * rebuilt archive is removed only after a successful extraction; if
     * extraction fails it is kept, since the chunk files are gone by then.
     */
    textsplit::Result<UnpackResult> unpack(const std::filesystem::path& file,
                                           const std::optional<std::filesystem::path>& dest_dir = std::nullopt) const;

private:
    static void discard_archive(const std::filesystem::path& archive);

    archive::ZipArchiver archiver_;
    chunk::ChunkWriter writer_;
    chunk::ChunkJoiner joiner_;
};

} // namespace textsplit::pipeline
