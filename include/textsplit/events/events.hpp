/**
 * @file events.hpp
 * @brief Progress events emitted by split, join and the archive adapter
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkWrittenEvent, JoinCompletedEvent.
 *
 * All events are emitted synchronously on the thread running the
 * operation, in chunk index order.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace textsplit::events {

// ════════════════════════════════════════════════════════
// Split Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after a chunk file has been renamed into place
 *
 * WHO EMITS: ChunkWriter
 * WHO SUBSCRIBES: LoggerComponent (progress), MetricsComponent
 */
struct ChunkWrittenEvent {
    std::filesystem::path source;
    std::filesystem::path chunk_file;
    std::uint32_t chunk_index;   ///< 1-based
    std::uint32_t total_chunks;
    std::size_t raw_bytes;
    std::size_t encoded_bytes;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SplitCompletedEvent {
    std::filesystem::path source;
    std::size_t chunk_count;
    std::uint64_t source_bytes;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Join Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after a chunk's decoded bytes were appended to the output
 *
 * WHO EMITS: ChunkJoiner
 * WHO SUBSCRIBES: LoggerComponent (progress), MetricsComponent
 */
struct ChunkDecodedEvent {
    std::filesystem::path chunk_file;
    std::uint32_t position;      ///< 1-based position in the sorted family
    std::uint32_t total_chunks;
    std::size_t decoded_bytes;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JoinCompletedEvent {
    std::filesystem::path output;
    std::size_t chunk_count;
    std::uint64_t bytes_written;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A consumed chunk file could not be deleted after a successful join
 *
 * Non-fatal: the reassembled output is valid.
 */
struct ChunkCleanupFailedEvent {
    std::filesystem::path chunk_file;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Archive Events
// ════════════════════════════════════════════════════════

struct ArchiveCreatedEvent {
    std::filesystem::path source;
    std::filesystem::path archive;
    std::uint64_t original_bytes;
    std::uint64_t compressed_bytes;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ArchiveExtractedEvent {
    std::filesystem::path archive;
    std::filesystem::path destination;
    std::size_t entry_count;
    std::uint64_t extracted_bytes;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Failure Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when split, join, compress or decompress aborts
 */
struct OperationFailedEvent {
    std::string operation;  ///< "split", "join", "compress", "decompress"
    std::filesystem::path path;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace textsplit::events
