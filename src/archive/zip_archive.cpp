#include "textsplit/archive/zip_archive.hpp"

#include "textsplit/events/events.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace textsplit::archive {
namespace fs = std::filesystem;
namespace {

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;

constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

// Offset of the crc-32 field inside a local header
constexpr std::streamoff kLocalCrcOffset = 14;

constexpr std::uint16_t kVersionNeeded = 20;
constexpr std::uint16_t kVersionMadeBy = (3 << 8) | 20; // UNIX host, ZIP 2.0
constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;
constexpr std::uint32_t kRegularFileAttributes = 0100644u << 16;

constexpr std::uint64_t kMaxEntrySize = 0xFFFFFFFFULL;
constexpr std::size_t kIoBufferSize = 64 * 1024;

struct EntryRecord {
    std::string name;
    std::uint16_t flags = 0;
    std::uint16_t method = kMethodDeflate;
    std::uint16_t dos_time = 0;
    std::uint16_t dos_date = (1 << 5) | 1; // 1980-01-01
    std::uint32_t crc = 0;
    std::uint32_t compressed_size = 0;
    std::uint32_t uncompressed_size = 0;
    std::uint32_t local_header_offset = 0;
};

void put_u16(std::string& out, std::uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void put_u32(std::string& out, std::uint32_t value) {
    put_u16(out, static_cast<std::uint16_t>(value & 0xFFFF));
    put_u16(out, static_cast<std::uint16_t>(value >> 16));
}

std::uint16_t get_u16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t get_u32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

void set_dos_timestamp(EntryRecord& record, fs::file_time_type write_time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        write_time - fs::file_time_type::clock::now() + system_clock::now());
    const std::time_t timestamp = system_clock::to_time_t(system_time);

    std::tm local{};
    if (localtime_r(&timestamp, &local) == nullptr) {
        return;
    }
    // DOS dates cover 1980..2107
    if (local.tm_year < 80 || local.tm_year > 207) {
        return;
    }
    record.dos_time = static_cast<std::uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
    record.dos_date = static_cast<std::uint16_t>(((local.tm_year - 80) << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
}

std::string local_header(const EntryRecord& record) {
    std::string out;
    out.reserve(kLocalHeaderSize + record.name.size());
    put_u32(out, kLocalHeaderSignature);
    put_u16(out, kVersionNeeded);
    put_u16(out, record.flags);
    put_u16(out, record.method);
    put_u16(out, record.dos_time);
    put_u16(out, record.dos_date);
    put_u32(out, record.crc);
    put_u32(out, record.compressed_size);
    put_u32(out, record.uncompressed_size);
    put_u16(out, static_cast<std::uint16_t>(record.name.size()));
    put_u16(out, 0); // extra field length
    out += record.name;
    return out;
}

std::string central_header(const EntryRecord& record) {
    std::string out;
    out.reserve(kCentralHeaderSize + record.name.size());
    put_u32(out, kCentralHeaderSignature);
    put_u16(out, kVersionMadeBy);
    put_u16(out, kVersionNeeded);
    put_u16(out, record.flags);
    put_u16(out, record.method);
    put_u16(out, record.dos_time);
    put_u16(out, record.dos_date);
    put_u32(out, record.crc);
    put_u32(out, record.compressed_size);
    put_u32(out, record.uncompressed_size);
    put_u16(out, static_cast<std::uint16_t>(record.name.size()));
    put_u16(out, 0); // extra field length
    put_u16(out, 0); // comment length
    put_u16(out, 0); // disk number start
    put_u16(out, 0); // internal attributes
    put_u32(out, kRegularFileAttributes);
    put_u32(out, record.local_header_offset);
    out += record.name;
    return out;
}

std::string end_of_central_directory(std::uint16_t entries, std::uint32_t cd_size, std::uint32_t cd_offset) {
    std::string out;
    out.reserve(kEndOfCentralDirSize);
    put_u32(out, kEndOfCentralDirSignature);
    put_u16(out, 0); // this disk
    put_u16(out, 0); // disk with central directory
    put_u16(out, entries);
    put_u16(out, entries);
    put_u32(out, cd_size);
    put_u32(out, cd_offset);
    put_u16(out, 0); // comment length
    return out;
}

class Deflater {
public:
    Deflater() { std::memset(&stream_, 0, sizeof(stream_)); }
    ~Deflater() {
        if (initialised_) {
            deflateEnd(&stream_);
        }
    }

    Deflater(const Deflater&) = delete;
    Deflater& operator=(const Deflater&) = delete;

    bool init(int level) {
        // Negative window bits: raw deflate, as ZIP stores it
        initialised_ = deflateInit2(&stream_, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK;
        return initialised_;
    }

    z_stream& stream() { return stream_; }

private:
    z_stream stream_;
    bool initialised_ = false;
};

class Inflater {
public:
    Inflater() { std::memset(&stream_, 0, sizeof(stream_)); }
    ~Inflater() {
        if (initialised_) {
            inflateEnd(&stream_);
        }
    }

    Inflater(const Inflater&) = delete;
    Inflater& operator=(const Inflater&) = delete;

    bool init() {
        initialised_ = inflateInit2(&stream_, -MAX_WBITS) == Z_OK;
        return initialised_;
    }

    z_stream& stream() { return stream_; }

private:
    z_stream stream_;
    bool initialised_ = false;
};

struct WrittenArchive {
    std::uint64_t original_bytes = 0;
    std::uint64_t compressed_bytes = 0;
};

Result<WrittenArchive> write_single_entry_archive(const fs::path& file, const fs::path& target, int level) {
    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return Err<WrittenArchive>(ErrorCode::IOFailure, "compress: failed to open " + file.string());
    }
    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<WrittenArchive>(ErrorCode::IOFailure, "compress: failed to create " + target.string());
    }

    EntryRecord record;
    record.name = file.filename().string();
    std::error_code ec;
    const auto write_time = fs::last_write_time(file, ec);
    if (!ec) {
        set_dos_timestamp(record, write_time);
    }

    // Sizes and crc are patched in once the data has been streamed
    output << local_header(record);

    Deflater deflater;
    if (!deflater.init(level)) {
        return Err<WrittenArchive>(ErrorCode::IOFailure, "compress: zlib deflateInit2 failed");
    }
    z_stream& zs = deflater.stream();

    std::vector<unsigned char> in_buffer(kIoBufferSize);
    std::vector<unsigned char> out_buffer(kIoBufferSize);
    uLong crc = crc32(0L, Z_NULL, 0);
    std::uint64_t original = 0;
    std::uint64_t compressed = 0;

    int status = Z_OK;
    while (status != Z_STREAM_END) {
        input.read(reinterpret_cast<char*>(in_buffer.data()), static_cast<std::streamsize>(in_buffer.size()));
        if (input.bad()) {
            return Err<WrittenArchive>(ErrorCode::IOFailure, "compress: read error on " + file.string());
        }
        const auto count = static_cast<uInt>(input.gcount());
        original += count;
        crc = crc32(crc, in_buffer.data(), count);

        const int flush = input ? Z_NO_FLUSH : Z_FINISH;
        zs.next_in = in_buffer.data();
        zs.avail_in = count;
        do {
            zs.next_out = out_buffer.data();
            zs.avail_out = static_cast<uInt>(out_buffer.size());
            status = deflate(&zs, flush);
            if (status == Z_STREAM_ERROR) {
                return Err<WrittenArchive>(ErrorCode::IOFailure, "compress: zlib deflate failed for " + file.string());
            }
            const std::size_t have = out_buffer.size() - zs.avail_out;
            output.write(reinterpret_cast<const char*>(out_buffer.data()), static_cast<std::streamsize>(have));
            if (!output) {
                return Err<WrittenArchive>(ErrorCode::IOFailure, "compress: failed to write " + target.string());
            }
            compressed += have;
        } while (zs.avail_out == 0);

        if (flush == Z_FINISH && status != Z_STREAM_END) {
            return Err<WrittenArchive>(ErrorCode::IOFailure, "compress: zlib did not finish the stream for " + file.string());
        }
    }

    if (original > kMaxEntrySize || compressed > kMaxEntrySize) {
        return Err<WrittenArchive>(ErrorCode::InvalidArgument,
            "compress: " + file.string() + " is too large for a ZIP archive without ZIP64");
    }

    record.crc = static_cast<std::uint32_t>(crc);
    record.compressed_size = static_cast<std::uint32_t>(compressed);
    record.uncompressed_size = static_cast<std::uint32_t>(original);

    std::string patch;
    put_u32(patch, record.crc);
    put_u32(patch, record.compressed_size);
    put_u32(patch, record.uncompressed_size);
    output.seekp(kLocalCrcOffset);
    output.write(patch.data(), static_cast<std::streamsize>(patch.size()));
    output.seekp(0, std::ios::end);

    const auto cd_offset = static_cast<std::uint64_t>(kLocalHeaderSize + record.name.size()) + compressed;
    const std::string central = central_header(record);
    if (cd_offset + central.size() > kMaxEntrySize) {
        return Err<WrittenArchive>(ErrorCode::InvalidArgument,
            "compress: " + file.string() + " is too large for a ZIP archive without ZIP64");
    }
    output << central
           << end_of_central_directory(1, static_cast<std::uint32_t>(central.size()),
                                       static_cast<std::uint32_t>(cd_offset));

    output.close();
    if (!output) {
        return Err<WrittenArchive>(ErrorCode::IOFailure, "compress: failed to finish " + target.string());
    }

    WrittenArchive written;
    written.original_bytes = original;
    written.compressed_bytes = cd_offset + central.size() + kEndOfCentralDirSize;
    return Ok(written);
}

bool is_safe_entry_name(const std::string& name) {
    if (name.empty() || name.find('\0') != std::string::npos) {
        return false;
    }
    if (name.front() == '/' || name.front() == '\\') {
        return false;
    }
    if (name.size() >= 2 && name[1] == ':') {
        return false;
    }
    std::size_t start = 0;
    while (start <= name.size()) {
        const std::size_t end = name.find_first_of("/\\", start);
        const std::string part = name.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (part == "..") {
            return false;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return true;
}

Result<std::vector<std::uint8_t>> read_at(std::ifstream& input, std::uint64_t offset, std::size_t size,
                                          const fs::path& archive) {
    std::vector<std::uint8_t> bytes(size);
    input.clear();
    input.seekg(static_cast<std::streamoff>(offset));
    input.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(input.gcount()) != size) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::CorruptArchive,
            "decompress: unexpected end of " + archive.string());
    }
    return Ok(std::move(bytes));
}

Result<std::vector<EntryRecord>> read_central_directory(std::ifstream& input, std::uint64_t archive_size,
                                                        const fs::path& archive, std::uint64_t& data_limit) {
    using Entries = std::vector<EntryRecord>;
    if (archive_size < kEndOfCentralDirSize) {
        return Err<Entries>(ErrorCode::CorruptArchive, "decompress: " + archive.string() + " is too small to be a ZIP archive");
    }

    const std::uint64_t tail_size = std::min<std::uint64_t>(archive_size, kEndOfCentralDirSize + kMaxCommentSize);
    const std::uint64_t tail_offset = archive_size - tail_size;
    auto tail = read_at(input, tail_offset, static_cast<std::size_t>(tail_size), archive);
    if (tail.is_error()) {
        return Err<Entries>(tail.error());
    }
    const auto& bytes = tail.value();

    std::optional<std::size_t> eocd;
    for (std::size_t i = bytes.size() - kEndOfCentralDirSize + 1; i-- > 0;) {
        if (get_u32(&bytes[i]) != kEndOfCentralDirSignature) {
            continue;
        }
        const std::uint16_t comment_length = get_u16(&bytes[i + 20]);
        if (i + kEndOfCentralDirSize + comment_length <= bytes.size()) {
            eocd = i;
            break;
        }
    }
    if (!eocd) {
        return Err<Entries>(ErrorCode::CorruptArchive, "decompress: no end-of-central-directory record in " + archive.string());
    }

    const std::uint8_t* record = &bytes[*eocd];
    const std::uint16_t disk = get_u16(record + 4);
    const std::uint16_t cd_disk = get_u16(record + 6);
    const std::uint16_t entry_count = get_u16(record + 10);
    const std::uint32_t cd_size = get_u32(record + 12);
    const std::uint32_t cd_offset = get_u32(record + 16);
    if (disk != 0 || cd_disk != 0) {
        return Err<Entries>(ErrorCode::CorruptArchive, "decompress: multi-disk archives are not supported: " + archive.string());
    }
    if (entry_count == 0xFFFF || cd_offset == 0xFFFFFFFFu) {
        return Err<Entries>(ErrorCode::CorruptArchive, "decompress: ZIP64 archives are not supported: " + archive.string());
    }

    const std::uint64_t eocd_offset = tail_offset + *eocd;
    if (static_cast<std::uint64_t>(cd_offset) + cd_size > eocd_offset) {
        return Err<Entries>(ErrorCode::CorruptArchive, "decompress: central directory out of bounds in " + archive.string());
    }
    data_limit = cd_offset;

    auto directory = read_at(input, cd_offset, cd_size, archive);
    if (directory.is_error()) {
        return Err<Entries>(directory.error());
    }
    const auto& cd = directory.value();

    Entries entries;
    entries.reserve(entry_count);
    std::size_t pos = 0;
    for (std::uint16_t i = 0; i < entry_count; ++i) {
        if (pos + kCentralHeaderSize > cd.size() || get_u32(&cd[pos]) != kCentralHeaderSignature) {
            return Err<Entries>(ErrorCode::CorruptArchive,
                "decompress: bad central directory entry " + std::to_string(i) + " in " + archive.string());
        }
        const std::uint8_t* h = &cd[pos];
        EntryRecord entry;
        entry.flags = get_u16(h + 8);
        entry.method = get_u16(h + 10);
        entry.dos_time = get_u16(h + 12);
        entry.dos_date = get_u16(h + 14);
        entry.crc = get_u32(h + 16);
        entry.compressed_size = get_u32(h + 20);
        entry.uncompressed_size = get_u32(h + 24);
        const std::uint16_t name_length = get_u16(h + 28);
        const std::uint16_t extra_length = get_u16(h + 30);
        const std::uint16_t comment_length = get_u16(h + 32);
        entry.local_header_offset = get_u32(h + 42);

        const std::size_t record_size = kCentralHeaderSize + name_length + extra_length + comment_length;
        if (pos + record_size > cd.size()) {
            return Err<Entries>(ErrorCode::CorruptArchive,
                "decompress: truncated central directory entry " + std::to_string(i) + " in " + archive.string());
        }
        entry.name.assign(reinterpret_cast<const char*>(h + kCentralHeaderSize), name_length);
        entries.push_back(std::move(entry));
        pos += record_size;
    }
    return Ok(std::move(entries));
}

Result<void> extract_entry(std::ifstream& input, std::uint64_t data_offset, const EntryRecord& entry,
                           const fs::path& target, const fs::path& archive) {
    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorCode::IOFailure, "decompress: failed to create " + target.string());
    }

    input.clear();
    input.seekg(static_cast<std::streamoff>(data_offset));

    std::vector<unsigned char> in_buffer(kIoBufferSize);
    std::vector<unsigned char> out_buffer(kIoBufferSize);
    std::uint64_t remaining = entry.compressed_size;
    std::uint64_t written = 0;
    uLong crc = crc32(0L, Z_NULL, 0);

    auto write_out = [&](const unsigned char* data, std::size_t size) {
        output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        crc = crc32(crc, data, static_cast<uInt>(size));
        written += size;
        return static_cast<bool>(output);
    };

    auto corrupt = [&](const std::string& what) {
        return Err<void>(ErrorCode::CorruptArchive,
                         "decompress: entry '" + entry.name + "' in " + archive.string() + ": " + what);
    };

    if (entry.method == kMethodStored) {
        while (remaining > 0) {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, in_buffer.size()));
            input.read(reinterpret_cast<char*>(in_buffer.data()), static_cast<std::streamsize>(want));
            if (static_cast<std::size_t>(input.gcount()) != want) {
                return corrupt("unexpected end of data");
            }
            if (!write_out(in_buffer.data(), want)) {
                return Err<void>(ErrorCode::IOFailure, "decompress: failed to write " + target.string());
            }
            remaining -= want;
        }
    } else {
        Inflater inflater;
        if (!inflater.init()) {
            return Err<void>(ErrorCode::IOFailure, "decompress: zlib inflateInit2 failed");
        }
        z_stream& zs = inflater.stream();
        int status = Z_OK;
        bool drained = true; // false while inflate may still hold output for us
        while (status != Z_STREAM_END) {
            if (zs.avail_in == 0 && drained) {
                if (remaining == 0) {
                    return corrupt("truncated deflate stream");
                }
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, in_buffer.size()));
                input.read(reinterpret_cast<char*>(in_buffer.data()), static_cast<std::streamsize>(want));
                if (static_cast<std::size_t>(input.gcount()) != want) {
                    return corrupt("unexpected end of data");
                }
                remaining -= want;
                zs.next_in = in_buffer.data();
                zs.avail_in = static_cast<uInt>(want);
            }

            zs.next_out = out_buffer.data();
            zs.avail_out = static_cast<uInt>(out_buffer.size());
            status = inflate(&zs, Z_NO_FLUSH);
            if (status == Z_NEED_DICT || status == Z_DATA_ERROR || status == Z_MEM_ERROR || status == Z_STREAM_ERROR) {
                return corrupt(zs.msg != nullptr ? zs.msg : "invalid deflate data");
            }
            drained = zs.avail_out != 0;
            const std::size_t have = out_buffer.size() - zs.avail_out;
            if (have > 0 && !write_out(out_buffer.data(), have)) {
                return Err<void>(ErrorCode::IOFailure, "decompress: failed to write " + target.string());
            }
            if (written > entry.uncompressed_size) {
                return corrupt("more data than the recorded size");
            }
        }
    }

    output.close();
    if (!output) {
        return Err<void>(ErrorCode::IOFailure, "decompress: failed to finish " + target.string());
    }
    if (written != entry.uncompressed_size) {
        return corrupt("size mismatch (expected " + std::to_string(entry.uncompressed_size) +
                       ", got " + std::to_string(written) + ")");
    }
    if (static_cast<std::uint32_t>(crc) != entry.crc) {
        return corrupt("CRC-32 mismatch");
    }
    return Ok();
}

} // namespace

fs::path ZipArchiver::archive_path_for(const fs::path& file) {
    fs::path archive = file;
    archive += kArchiveExtension;
    return archive;
}

Result<fs::path> ZipArchiver::compress(const fs::path& file) const {
    auto fail = [&](Error error) {
        events::publish(bus_, events::OperationFailedEvent{"compress", file, error.message});
        return Err<fs::path>(std::move(error));
    };

    if (compression_level_ < -1 || compression_level_ > 9) {
        return fail(make_error(ErrorCode::InvalidArgument,
            "compress: compression level " + std::to_string(compression_level_) + " is outside -1..9"));
    }

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return fail(make_error(ErrorCode::NotFound, "compress: file not found: " + file.string()));
    }
    const auto size = fs::file_size(file, ec);
    if (ec) {
        return fail(make_error(ErrorCode::IOFailure, "compress: cannot stat " + file.string() + ": " + ec.message()));
    }
    if (size >= kMaxEntrySize) {
        return fail(make_error(ErrorCode::InvalidArgument,
            "compress: " + file.string() + " is too large for a ZIP archive without ZIP64"));
    }

    const fs::path archive = archive_path_for(file);
    fs::path temp = archive;
    temp += ".tmp";

    auto written = write_single_entry_archive(file, temp, compression_level_);
    if (written.is_error()) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return fail(written.error());
    }

    fs::rename(temp, archive, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return fail(make_error(ErrorCode::IOFailure,
            "compress: failed to move " + temp.string() + " to " + archive.string() + ": " + ec.message()));
    }

    events::publish(bus_, events::ArchiveCreatedEvent{
        file, archive, written.value().original_bytes, written.value().compressed_bytes});
    return Ok(archive);
}

Result<std::vector<fs::path>> ZipArchiver::decompress(const fs::path& archive, const fs::path& dest_dir) const {
    using Paths = std::vector<fs::path>;
    auto fail = [&](Error error) {
        events::publish(bus_, events::OperationFailedEvent{"decompress", archive, error.message});
        return Err<Paths>(std::move(error));
    };

    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        return fail(make_error(ErrorCode::NotFound, "decompress: archive not found: " + archive.string()));
    }
    const auto archive_size = fs::file_size(archive, ec);
    if (ec) {
        return fail(make_error(ErrorCode::IOFailure, "decompress: cannot stat " + archive.string() + ": " + ec.message()));
    }

    std::ifstream input(archive, std::ios::binary);
    if (!input) {
        return fail(make_error(ErrorCode::IOFailure, "decompress: failed to open " + archive.string()));
    }

    std::uint64_t data_limit = 0;
    auto entries = read_central_directory(input, archive_size, archive, data_limit);
    if (entries.is_error()) {
        return fail(entries.error());
    }

    std::error_code dir_ec;
    fs::create_directories(dest_dir, ec);
    if (ec && !fs::is_directory(dest_dir, dir_ec)) {
        return fail(make_error(ErrorCode::IOFailure,
            "decompress: failed to create directory " + dest_dir.string() + ": " + ec.message()));
    }

    Paths extracted;
    std::uint64_t extracted_bytes = 0;
    for (const auto& entry : entries.value()) {
        if (!is_safe_entry_name(entry.name)) {
            return fail(make_error(ErrorCode::CorruptArchive,
                "decompress: unsafe entry name '" + entry.name + "' in " + archive.string()));
        }
        const fs::path target = dest_dir / fs::path(entry.name);

        if (entry.name.back() == '/') {
            fs::create_directories(target, ec);
            if (ec && !fs::is_directory(target, dir_ec)) {
                return fail(make_error(ErrorCode::IOFailure,
                    "decompress: failed to create directory " + target.string() + ": " + ec.message()));
            }
            continue;
        }

        if ((entry.flags & kFlagEncrypted) != 0) {
            return fail(make_error(ErrorCode::CorruptArchive,
                "decompress: entry '" + entry.name + "' is encrypted, which is not supported"));
        }
        if (entry.method != kMethodStored && entry.method != kMethodDeflate) {
            return fail(make_error(ErrorCode::CorruptArchive,
                "decompress: entry '" + entry.name + "' uses unsupported compression method " +
                std::to_string(entry.method)));
        }

        if (static_cast<std::uint64_t>(entry.local_header_offset) + kLocalHeaderSize > data_limit) {
            return fail(make_error(ErrorCode::CorruptArchive,
                "decompress: local header of '" + entry.name + "' out of bounds in " + archive.string()));
        }
        auto header = read_at(input, entry.local_header_offset, kLocalHeaderSize, archive);
        if (header.is_error()) {
            return fail(header.error());
        }
        const std::uint8_t* h = header.value().data();
        if (get_u32(h) != kLocalHeaderSignature) {
            return fail(make_error(ErrorCode::CorruptArchive,
                "decompress: bad local header signature for '" + entry.name + "' in " + archive.string()));
        }
        const std::uint64_t data_offset = static_cast<std::uint64_t>(entry.local_header_offset) +
                                          kLocalHeaderSize + get_u16(h + 26) + get_u16(h + 28);
        if (data_offset + entry.compressed_size > data_limit) {
            return fail(make_error(ErrorCode::CorruptArchive,
                "decompress: data of '" + entry.name + "' out of bounds in " + archive.string()));
        }

        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec && !fs::is_directory(target.parent_path(), dir_ec)) {
                return fail(make_error(ErrorCode::IOFailure,
                    "decompress: failed to create directory " + target.parent_path().string() + ": " + ec.message()));
            }
        }

        auto status = extract_entry(input, data_offset, entry, target, archive);
        if (status.is_error()) {
            std::error_code ignored;
            fs::remove(target, ignored);
            return fail(status.error());
        }
        spdlog::debug("decompress: extracted {} ({} bytes)", target.string(), entry.uncompressed_size);
        extracted.push_back(target);
        extracted_bytes += entry.uncompressed_size;
    }

    events::publish(bus_, events::ArchiveExtractedEvent{archive, dest_dir, extracted.size(), extracted_bytes});
    return Ok(std::move(extracted));
}

} // namespace textsplit::archive
