#pragma once

/**
 * @file zip_archive.hpp
 * @brief ZIP container used to compress a file before it is chunked
 *
 * WHAT IT DOES:
 * - compress(): "{file}.zip" holding one deflate entry named after the file
 * - decompress(): extracts every entry of a ZIP archive into a directory
 *
 * LIMITS:
 * - No ZIP64: entries and archives must stay below 4 GiB
 * - Methods: stored (0) and deflate (8); encrypted entries are rejected
 *
 * The chunking core never looks inside the archive: split and join treat
 * "{file}.zip" as an opaque byte sequence.
 */

#include "textsplit/core/result.hpp"
#include "textsplit/events/event_bus.hpp"

#include <filesystem>
#include <vector>

namespace textsplit::archive {

inline constexpr int kDefaultCompressionLevel = -1; ///< zlib's Z_DEFAULT_COMPRESSION
inline constexpr const char* kArchiveExtension = ".zip";

class ZipArchiver {
public:
    explicit ZipArchiver(int compression_level = kDefaultCompressionLevel,
                         events::EventBus* bus = nullptr)
        : compression_level_(compression_level), bus_(bus) {}

    /**
     * @brief "{file}.zip"
     */
    static std::filesystem::path archive_path_for(const std::filesystem::path& file);

    /**
     * @brief Write archive_path_for(@p file), replacing any existing archive
     *
     * NotFound if @p file is not a regular file; InvalidArgument for a
     * compression level outside -1..9 or a file of 4 GiB or more;
     * IOFailure on read/write/zlib errors.
     */
    textsplit::Result<std::filesystem::path> compress(const std::filesystem::path& file) const;

    /**
     * @brief Extract every entry of @p archive below @p dest_dir
     *
     * @p dest_dir is created when missing. Existing files are overwritten.
     * Returns the extracted regular files in central-directory order.
     *
     * NotFound if @p archive is missing; CorruptArchive for malformed
     * records, CRC or size mismatches, unsupported methods, encrypted
     * entries, or entry names that would escape @p dest_dir.
     */
    textsplit::Result<std::vector<std::filesystem::path>> decompress(const std::filesystem::path& archive,
                                                                     const std::filesystem::path& dest_dir) const;

    int compression_level() const noexcept { return compression_level_; }

private:
    int compression_level_;
    events::EventBus* bus_;
};

} // namespace textsplit::archive
