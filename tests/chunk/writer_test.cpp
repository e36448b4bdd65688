#include "textsplit/chunk/naming.hpp"
#include "textsplit/chunk/writer.hpp"
#include "textsplit/codec/base64.hpp"
#include "textsplit/events/event_bus.hpp"
#include "textsplit/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using textsplit::ErrorCode;
using textsplit::chunk::ChunkWriter;
namespace chunk = textsplit::chunk;
namespace events = textsplit::events;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("textsplit_writer_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

std::vector<std::uint8_t> random_bytes(std::size_t size, std::uint32_t seed = 7) {
    std::mt19937 engine(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(dist(engine));
    }
    return data;
}

void write_bytes(const fs::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

} // namespace

class ChunkWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        source_ = root_ / "payload.bin";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::size_t family_size() const {
        auto found = chunk::find_chunk_files(source_);
        return found.is_ok() ? found.value().size() : 0;
    }

    fs::path root_;
    fs::path source_;
};

TEST_F(ChunkWriterTest, WritesBase64OfEachSlice) {
    const auto data = random_bytes(25);
    write_bytes(source_, data);

    ChunkWriter writer;
    auto result = writer.split(source_, 10);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto& split = result.value();
    ASSERT_EQ(split.chunk_count(), 3u);
    EXPECT_EQ(split.source_bytes, 25u);
    EXPECT_EQ(split.chunk_files[0].string(), (root_ / "payload.bin.part001.txt").string());
    EXPECT_EQ(split.chunk_files[1].string(), (root_ / "payload.bin.part002.txt").string());
    EXPECT_EQ(split.chunk_files[2].string(), (root_ / "payload.bin.part003.txt").string());

    EXPECT_EQ(read_file(split.chunk_files[0]), textsplit::codec::encode(data.data(), 10));
    EXPECT_EQ(read_file(split.chunk_files[1]), textsplit::codec::encode(data.data() + 10, 10));
    EXPECT_EQ(read_file(split.chunk_files[2]), textsplit::codec::encode(data.data() + 20, 5));
}

TEST_F(ChunkWriterTest, ChunkFilesHaveNoLineBreaks) {
    write_bytes(source_, random_bytes(300));

    ChunkWriter writer;
    auto result = writer.split(source_, 300);
    ASSERT_TRUE(result.is_ok());

    const std::string text = read_file(result.value().chunk_files.front());
    EXPECT_EQ(text.size(), 400u);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(text.find('\r'), std::string::npos);
}

TEST_F(ChunkWriterTest, ExactMultipleHasNoEmptyTrailingChunk) {
    write_bytes(source_, random_bytes(30));

    ChunkWriter writer;
    auto result = writer.split(source_, 10);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().chunk_count(), 3u);
    EXPECT_FALSE(fs::exists(root_ / "payload.bin.part004.txt"));

    auto single = writer.split(source_, 30);
    ASSERT_TRUE(single.is_ok());
    EXPECT_EQ(single.value().chunk_count(), 1u);
}

TEST_F(ChunkWriterTest, ChunkCountMatchesCeilingDivision) {
    write_bytes(source_, random_bytes(4500));

    ChunkWriter writer;
    auto result = writer.split(source_, 2000);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().chunk_count(), chunk::expected_chunk_count(4500, 2000));
    EXPECT_EQ(result.value().chunk_count(), 3u);
}

TEST_F(ChunkWriterTest, EmptySourceProducesNoChunks) {
    write_bytes(source_, {});

    ChunkWriter writer;
    auto result = writer.split(source_, 10);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().chunk_count(), 0u);
    EXPECT_EQ(family_size(), 0u);
}

TEST_F(ChunkWriterTest, RejectsSplitNeedingMoreThan999Chunks) {
    write_bytes(source_, random_bytes(1000));

    ChunkWriter writer;
    auto result = writer.split(source_, 1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(family_size(), 0u);
}

TEST_F(ChunkWriterTest, AcceptsExactly999Chunks) {
    write_bytes(source_, random_bytes(999));

    ChunkWriter writer;
    auto result = writer.split(source_, 1);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().chunk_count(), 999u);
    EXPECT_TRUE(fs::exists(root_ / "payload.bin.part999.txt"));
}

TEST_F(ChunkWriterTest, RejectsZeroChunkSize) {
    write_bytes(source_, random_bytes(10));

    ChunkWriter writer;
    auto result = writer.split(source_, 0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(family_size(), 0u);
}

TEST_F(ChunkWriterTest, MissingSourceIsNotFound) {
    ChunkWriter writer;
    auto result = writer.split(root_ / "absent.bin", 10);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_NE(result.error().message.find("absent.bin"), std::string::npos);
}

TEST_F(ChunkWriterTest, DirectorySourceIsNotFound) {
    ChunkWriter writer;
    auto result = writer.split(root_, 10);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ChunkWriterTest, RepeatedSplitIsByteIdentical) {
    write_bytes(source_, random_bytes(1234));

    ChunkWriter writer;
    auto first = writer.split(source_, 500);
    ASSERT_TRUE(first.is_ok());
    std::vector<std::string> before;
    for (const auto& file : first.value().chunk_files) {
        before.push_back(read_file(file));
    }

    auto second = writer.split(source_, 500);
    ASSERT_TRUE(second.is_ok());
    ASSERT_EQ(second.value().chunk_count(), before.size());
    for (std::size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(read_file(second.value().chunk_files[i]), before[i]);
    }
}

TEST_F(ChunkWriterTest, SourceIsLeftUnchanged) {
    const auto data = random_bytes(777);
    write_bytes(source_, data);

    ChunkWriter writer;
    ASSERT_TRUE(writer.split(source_, 100).is_ok());
    EXPECT_EQ(read_file(source_), std::string(data.begin(), data.end()));
}

TEST_F(ChunkWriterTest, RemovesStaleChunksFromLargerEarlierSplit) {
    write_bytes(source_, random_bytes(50));

    ChunkWriter writer;
    ASSERT_TRUE(writer.split(source_, 10).is_ok());
    EXPECT_EQ(family_size(), 5u);

    write_bytes(source_, random_bytes(15));
    auto result = writer.split(source_, 10);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().chunk_count(), 2u);
    EXPECT_EQ(family_size(), 2u);
    EXPECT_FALSE(fs::exists(root_ / "payload.bin.part003.txt"));
    EXPECT_FALSE(fs::exists(root_ / "payload.bin.part005.txt"));
}

TEST_F(ChunkWriterTest, LeavesNoTemporaryFiles) {
    write_bytes(source_, random_bytes(64));

    ChunkWriter writer;
    ASSERT_TRUE(writer.split(source_, 16).is_ok());
    for (const auto& entry : fs::directory_iterator(root_)) {
        EXPECT_NE(entry.path().extension().string(), ".tmp") << entry.path().string();
    }
}

TEST_F(ChunkWriterTest, EmitsEventPerChunkInIndexOrder) {
    write_bytes(source_, random_bytes(35));

    events::EventBus bus;
    std::vector<std::uint32_t> indices;
    std::size_t raw_total = 0;
    std::size_t completed = 0;
    bus.subscribe<events::ChunkWrittenEvent>([&](const events::ChunkWrittenEvent& e) {
        indices.push_back(e.chunk_index);
        raw_total += e.raw_bytes;
        EXPECT_EQ(e.total_chunks, 4u);
        EXPECT_EQ(e.encoded_bytes, textsplit::codec::encoded_size(e.raw_bytes));
    });
    bus.subscribe<events::SplitCompletedEvent>([&](const events::SplitCompletedEvent& e) {
        ++completed;
        EXPECT_EQ(e.chunk_count, 4u);
        EXPECT_EQ(e.source_bytes, 35u);
    });

    ChunkWriter writer(&bus);
    ASSERT_TRUE(writer.split(source_, 10).is_ok());

    EXPECT_EQ(indices, (std::vector<std::uint32_t>{1, 2, 3, 4}));
    EXPECT_EQ(raw_total, 35u);
    EXPECT_EQ(completed, 1u);
}

TEST_F(ChunkWriterTest, FailureIsPublished) {
    events::EventBus bus;
    std::vector<std::string> operations;
    bus.subscribe<events::OperationFailedEvent>([&](const events::OperationFailedEvent& e) {
        operations.push_back(e.operation);
    });

    ChunkWriter writer(&bus);
    ASSERT_TRUE(writer.split(root_ / "missing.bin", 10).is_error());
    EXPECT_EQ(operations, (std::vector<std::string>{"split"}));
}

TEST_F(ChunkWriterTest, FailureMidSplitKeepsWrittenChunks) {
    const auto data = random_bytes(25);
    write_bytes(source_, data);
    // A non-empty directory in the second chunk's place cannot be replaced by rename
    const fs::path blocked = root_ / "payload.bin.part002.txt";
    fs::create_directories(blocked / "inner");

    ChunkWriter writer;
    auto result = writer.split(source_, 10);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::IOFailure);
    EXPECT_NE(result.error().message.find("after 1 chunk file(s) written"), std::string::npos)
        << result.error().message;

    const fs::path first = root_ / "payload.bin.part001.txt";
    ASSERT_TRUE(fs::is_regular_file(first));
    EXPECT_EQ(read_file(first), textsplit::codec::encode(data.data(), 10));
    EXPECT_TRUE(fs::is_directory(blocked));
    EXPECT_FALSE(fs::exists(chunk::temp_path_for(blocked)));
    EXPECT_FALSE(fs::exists(root_ / "payload.bin.part003.txt"));
}
