#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace textsplit::chunk {

/**
 * @brief Outcome of a successful split
 */
struct SplitResult {
    std::filesystem::path source;
    std::vector<std::filesystem::path> chunk_files; ///< In index order
    std::uint64_t source_bytes = 0;

    std::size_t chunk_count() const noexcept { return chunk_files.size(); }
};

/**
 * @brief One chunk file discovered on disk
 */
struct ManifestEntry {
    std::filesystem::path path;
    std::optional<std::uint32_t> index; ///< Empty when the name carries no numeric index
    std::uint64_t encoded_bytes = 0;
};

/**
 * @brief Run of consecutive indices absent from a chunk family
 */
struct IndexGap {
    std::uint32_t first = 0;
    std::uint32_t last = 0; ///< Inclusive

    std::uint64_t length() const noexcept { return static_cast<std::uint64_t>(last) - first + 1; }
};

/**
 * @brief Ordered, in-memory view of a chunk family
 *
 * Built from the filenames present on disk; never persisted.
 */
struct ChunkManifest {
    std::filesystem::path base;
    std::vector<ManifestEntry> entries; ///< Lexicographic filename order

    bool empty() const noexcept { return entries.empty(); }
    std::size_t size() const noexcept { return entries.size(); }

    /// Runs of indices missing below the highest numbered entry; one element per run
    std::vector<IndexGap> gaps() const;

    /// Entries whose wildcard part is not a decimal index
    std::vector<std::filesystem::path> unnumbered() const;
};

/**
 * @brief Chunk file that could not be removed after a successful join
 */
struct CleanupWarning {
    std::filesystem::path chunk_file;
    std::string reason;
};

/**
 * @brief Outcome of a successful join
 */
struct JoinResult {
    std::filesystem::path output;
    std::size_t chunk_count = 0;
    std::uint64_t bytes_written = 0;
    std::vector<CleanupWarning> cleanup_warnings;

    bool clean() const noexcept { return cleanup_warnings.empty(); }
};

} // namespace textsplit::chunk
