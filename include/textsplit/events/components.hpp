/**
 * @file components.hpp
 * @brief Event-driven components wired up by the CLI
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * ChunkWriter writer(&bus);
 * writer.split(path, 1 << 20);   // progress is logged and counted
 */

#pragma once

#include "textsplit/events/event_bus.hpp"
#include "textsplit/events/events.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>

namespace textsplit::events {

/**
 * @brief Logs progress and outcome of every operation using spdlog
 *
 * Per-chunk lines go to debug; summaries to info; cleanup failures to
 * warn. Aborted operations are logged at debug; the caller reports them.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkWrittenEvent>([this](const ChunkWrittenEvent& e) {
            on_chunk_written(e);
        });

        bus_.subscribe<SplitCompletedEvent>([this](const SplitCompletedEvent& e) {
            on_split_completed(e);
        });

        bus_.subscribe<ChunkDecodedEvent>([this](const ChunkDecodedEvent& e) {
            on_chunk_decoded(e);
        });

        bus_.subscribe<JoinCompletedEvent>([this](const JoinCompletedEvent& e) {
            on_join_completed(e);
        });

        bus_.subscribe<ChunkCleanupFailedEvent>([this](const ChunkCleanupFailedEvent& e) {
            on_cleanup_failed(e);
        });

        bus_.subscribe<ArchiveCreatedEvent>([this](const ArchiveCreatedEvent& e) {
            on_archive_created(e);
        });

        bus_.subscribe<ArchiveExtractedEvent>([this](const ArchiveExtractedEvent& e) {
            on_archive_extracted(e);
        });

        bus_.subscribe<OperationFailedEvent>([this](const OperationFailedEvent& e) {
            on_operation_failed(e);
        });
    }

private:
    void on_chunk_written(const ChunkWrittenEvent& e) {
        spdlog::debug("[ChunkWritten] {} chunk={}/{} raw={} encoded={}",
                      e.chunk_file.string(), e.chunk_index, e.total_chunks,
                      e.raw_bytes, e.encoded_bytes);
    }

    void on_split_completed(const SplitCompletedEvent& e) {
        spdlog::info("[SplitCompleted] source={} chunks={} bytes={} duration={}ms",
                     e.source.string(), e.chunk_count, e.source_bytes, e.duration.count());
    }

    void on_chunk_decoded(const ChunkDecodedEvent& e) {
        spdlog::debug("[ChunkDecoded] {} chunk={}/{} bytes={}",
                      e.chunk_file.string(), e.position, e.total_chunks, e.decoded_bytes);
    }

    void on_join_completed(const JoinCompletedEvent& e) {
        spdlog::info("[JoinCompleted] output={} chunks={} bytes={} duration={}ms",
                     e.output.string(), e.chunk_count, e.bytes_written, e.duration.count());
    }

    void on_cleanup_failed(const ChunkCleanupFailedEvent& e) {
        spdlog::warn("[CleanupFailed] could not delete {}: {}", e.chunk_file.string(), e.reason);
    }

    void on_archive_created(const ArchiveCreatedEvent& e) {
        spdlog::info("[ArchiveCreated] {} -> {} ({} -> {} bytes)",
                     e.source.string(), e.archive.string(), e.original_bytes, e.compressed_bytes);
    }

    void on_archive_extracted(const ArchiveExtractedEvent& e) {
        spdlog::info("[ArchiveExtracted] {} -> {} entries={} bytes={}",
                     e.archive.string(), e.destination.string(), e.entry_count, e.extracted_bytes);
    }

    void on_operation_failed(const OperationFailedEvent& e) {
        spdlog::debug("[{}Failed] path={} error={}", e.operation, e.path.string(), e.error_message);
    }

    EventBus& bus_;
};

/**
 * @brief Counts chunks and bytes moved through split and join
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::uint64_t chunks_written = 0;
        std::uint64_t raw_bytes_written = 0;
        std::uint64_t encoded_bytes_written = 0;
        std::uint64_t chunks_decoded = 0;
        std::uint64_t bytes_decoded = 0;
        std::uint64_t splits_completed = 0;
        std::uint64_t joins_completed = 0;
        std::uint64_t cleanup_failures = 0;
        std::uint64_t operations_failed = 0;
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkWrittenEvent>([this](const ChunkWrittenEvent& e) {
            stats_.chunks_written++;
            stats_.raw_bytes_written += e.raw_bytes;
            stats_.encoded_bytes_written += e.encoded_bytes;
        });

        bus_.subscribe<ChunkDecodedEvent>([this](const ChunkDecodedEvent& e) {
            stats_.chunks_decoded++;
            stats_.bytes_decoded += e.decoded_bytes;
        });

        bus_.subscribe<SplitCompletedEvent>([this](const SplitCompletedEvent&) {
            stats_.splits_completed++;
        });

        bus_.subscribe<JoinCompletedEvent>([this](const JoinCompletedEvent&) {
            stats_.joins_completed++;
        });

        bus_.subscribe<ChunkCleanupFailedEvent>([this](const ChunkCleanupFailedEvent&) {
            stats_.cleanup_failures++;
        });

        bus_.subscribe<OperationFailedEvent>([this](const OperationFailedEvent&) {
            stats_.operations_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::debug("═══════════════════════════════════════");
        spdlog::debug("Run Statistics:");
        spdlog::debug("  Chunks written:  {}", stats_.chunks_written);
        spdlog::debug("  Raw bytes out:   {}", stats_.raw_bytes_written);
        spdlog::debug("  Encoded bytes:   {}", stats_.encoded_bytes_written);
        spdlog::debug("  Chunks decoded:  {}", stats_.chunks_decoded);
        spdlog::debug("  Bytes decoded:   {}", stats_.bytes_decoded);
        spdlog::debug("  Cleanup failures:{}", stats_.cleanup_failures);
        spdlog::debug("  Failed ops:      {}", stats_.operations_failed);
        spdlog::debug("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace textsplit::events
