#include "textsplit/chunk/naming.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace textsplit::chunk {
namespace fs = std::filesystem;
namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> wildcard_part(const std::string& filename, const std::string& base_filename) {
    const std::string prefix = base_filename + kPartMarker;
    const std::string suffix = kChunkExtension;
    if (filename.size() < prefix.size() + suffix.size()) {
        return std::nullopt;
    }
    if (filename.compare(0, prefix.size(), prefix) != 0 || !ends_with(filename, suffix)) {
        return std::nullopt;
    }
    return filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
}

} // namespace

fs::path chunk_file_path(const fs::path& base, std::uint32_t index) {
    std::ostringstream name;
    name << base.filename().string() << kPartMarker
         << std::setw(static_cast<int>(kIndexWidth)) << std::setfill('0') << index
         << kChunkExtension;
    return base.parent_path() / name.str();
}

bool matches_chunk_pattern(const std::string& filename, const std::string& base_filename) {
    return wildcard_part(filename, base_filename).has_value();
}

std::optional<std::uint32_t> parse_chunk_index(const std::string& filename,
                                               const std::string& base_filename) {
    const auto digits = wildcard_part(filename, base_filename);
    if (!digits || digits->empty() || digits->size() > 9) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    for (char c : *digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint32_t>(c - '0');
    }
    return value;
}

std::uint64_t expected_chunk_count(std::uint64_t source_size, std::uint64_t max_chunk_bytes) noexcept {
    if (max_chunk_bytes == 0) {
        return 0;
    }
    return source_size / max_chunk_bytes + (source_size % max_chunk_bytes != 0 ? 1 : 0);
}

fs::path temp_path_for(const fs::path& path) {
    fs::path temp = path;
    temp += kTempSuffix;
    return temp;
}

fs::path family_directory(const fs::path& base) {
    const auto parent = base.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

Result<std::vector<fs::path>> find_chunk_files(const fs::path& base) {
    std::vector<fs::path> matches;
    const fs::path directory = family_directory(base);
    const std::string base_name = base.filename().string();

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return Ok(std::move(matches));
    }

    fs::directory_iterator it(directory, ec);
    if (ec) {
        return Err<std::vector<fs::path>>(ErrorCode::IOFailure,
            "cannot list " + directory.string() + ": " + ec.message());
    }

    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            return Err<std::vector<fs::path>>(ErrorCode::IOFailure,
                "cannot list " + directory.string() + ": " + ec.message());
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        if (matches_chunk_pattern(it->path().filename().string(), base_name)) {
            matches.push_back(it->path());
        }
    }
    if (ec) {
        return Err<std::vector<fs::path>>(ErrorCode::IOFailure,
            "cannot list " + directory.string() + ": " + ec.message());
    }
    return Ok(std::move(matches));
}

} // namespace textsplit::chunk
