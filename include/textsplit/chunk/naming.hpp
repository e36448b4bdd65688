#pragma once

/**
 * @file naming.hpp
 * @brief Chunk file naming contract shared by ChunkWriter and ChunkJoiner
 *
 * Chunk files are named:
 *
 *     {base}.part{NNN}.txt
 *
 * where NNN is the 1-based index zero-padded to exactly three digits.
 * The joiner orders chunk files by plain lexicographic filename order,
 * which equals numeric order only because the width is fixed. Changing
 * kIndexWidth breaks that ordering for files written by older versions
 * and breaks interoperability with other tooling reading the same names.
 *
 * The fixed width caps one split at kMaxChunkCount chunks.
 */

#include "textsplit/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace textsplit::chunk {

inline constexpr std::size_t kIndexWidth = 3;
inline constexpr std::uint32_t kMaxChunkCount = 999;
inline constexpr const char* kPartMarker = ".part";
inline constexpr const char* kChunkExtension = ".txt";
inline constexpr const char* kTempSuffix = ".tmp";

/**
 * @brief Path of chunk @p index for @p base ("{base}.part{NNN}.txt")
 */
std::filesystem::path chunk_file_path(const std::filesystem::path& base, std::uint32_t index);

/**
 * @brief True when @p filename matches "{base_filename}.part*.txt"
 *
 * Mirrors glob semantics: '*' matches any (possibly empty) run of characters.
 */
bool matches_chunk_pattern(const std::string& filename, const std::string& base_filename);

/**
 * @brief Numeric index carried by a matching chunk filename
 *
 * Returns nullopt when the wildcard part is not a run of decimal digits
 * (the file still matches the discovery pattern but has no index).
 */
std::optional<std::uint32_t> parse_chunk_index(const std::string& filename,
                                               const std::string& base_filename);

/**
 * @brief Number of chunks a source of @p source_size bytes produces
 */
std::uint64_t expected_chunk_count(std::uint64_t source_size, std::uint64_t max_chunk_bytes) noexcept;

/**
 * @brief Sibling path used while a file is being written ("{path}.tmp")
 */
std::filesystem::path temp_path_for(const std::filesystem::path& path);

/**
 * @brief Directory holding the chunk family of @p base ("." when @p base has no parent)
 */
std::filesystem::path family_directory(const std::filesystem::path& base);

/**
 * @brief Regular files in the family directory matching "{base}.part*.txt"
 *
 * Returned in directory enumeration order (unsorted). Fails with
 * IOFailure when the directory cannot be read.
 */
textsplit::Result<std::vector<std::filesystem::path>> find_chunk_files(const std::filesystem::path& base);

} // namespace textsplit::chunk
