#pragma once

#include "textsplit/chunk/types.hpp"
#include "textsplit/core/result.hpp"
#include "textsplit/events/event_bus.hpp"

#include <filesystem>
#include <vector>

namespace textsplit::chunk {

/**
 * @brief Reassembles "{base}.part*.txt" chunk files into @p base
 *
 * Ordering is by filename, ascending, which equals index order because
 * ChunkWriter zero-pads indices to a fixed width (see naming.hpp).
 */
class ChunkJoiner {
public:
    explicit ChunkJoiner(events::EventBus* bus = nullptr) : bus_(bus) {}

    /**
     * @brief Find and order the chunk family of @p base
     *
     * Fails with NotFound when no file matches, IOFailure when the
     * directory cannot be listed.
     */
    textsplit::Result<ChunkManifest> discover(const std::filesystem::path& base) const;

    /**
     * @brief Order @p matches by filename and attach parsed indices
     *
     * Independent of the order @p matches arrive in.
     */
    static ChunkManifest build_manifest(const std::filesystem::path& base,
                                        std::vector<std::filesystem::path> matches);

    /**
     * @brief Decode every chunk in order and write the bytes to @p base
     *
     * The output is assembled in "{base}.tmp" and renamed over @p base only
     * once every chunk has been decoded and written. On failure the
     * temporary file is removed, an existing @p base is untouched and no
     * chunk file is deleted. After success every consumed chunk file is
     * deleted; deletion failures are reported in JoinResult::cleanup_warnings.
     */
    textsplit::Result<JoinResult> join(const std::filesystem::path& base) const;

private:
    textsplit::Result<std::uint64_t> assemble(const ChunkManifest& manifest,
                                              const std::filesystem::path& temp_output) const;

    std::vector<CleanupWarning> remove_consumed(const ChunkManifest& manifest) const;

    static void report_irregularities(const ChunkManifest& manifest);

    textsplit::Result<JoinResult> fail(const std::filesystem::path& base, Error error) const;

    events::EventBus* bus_;
};

} // namespace textsplit::chunk
