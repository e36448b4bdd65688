#include "textsplit/pipeline/packer.hpp"

#include "textsplit/chunk/naming.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace textsplit::pipeline {
namespace fs = std::filesystem;

Result<chunk::SplitResult> Packer::pack(const fs::path& file, std::uint64_t max_chunk_bytes,
                                        bool keep_archive) const {
    if (max_chunk_bytes == 0) {
        return Err<chunk::SplitResult>(ErrorCode::InvalidArgument,
                                       "pack: chunk size must be > 0 for " + file.string());
    }

    auto archive = archiver_.compress(file);
    if (archive.is_error()) {
        return Err<chunk::SplitResult>(archive.error());
    }

    auto split = writer_.split(archive.value(), max_chunk_bytes);
    if (!keep_archive) {
        discard_archive(archive.value());
    }
    return split;
}

Result<UnpackResult> Packer::unpack(const fs::path& file, const std::optional<fs::path>& dest_dir) const {
    const fs::path archive = archive::ZipArchiver::archive_path_for(file);

    auto joined = joiner_.join(archive);
    if (joined.is_error()) {
        return Err<UnpackResult>(joined.error());
    }

    const fs::path destination = dest_dir.value_or(chunk::family_directory(file));
    auto extracted = archiver_.decompress(archive, destination);
    if (extracted.is_error()) {
        spdlog::warn("unpack: keeping {} after failed extraction", archive.string());
        return Err<UnpackResult>(extracted.error());
    }

    discard_archive(archive);

    UnpackResult result;
    result.archive = archive;
    result.extracted = std::move(extracted.value());
    result.cleanup_warnings = std::move(joined.value().cleanup_warnings);
    return Ok(std::move(result));
}

void Packer::discard_archive(const fs::path& archive) {
    std::error_code ec;
    fs::remove(archive, ec);
    if (ec) {
        spdlog::warn("could not remove intermediate archive {}: {}", archive.string(), ec.message());
    }
}

} // namespace textsplit::pipeline
