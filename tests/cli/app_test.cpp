#include "textsplit/cli/app.hpp"
#include "textsplit/events/components.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using textsplit::cli::CliOptions;
using textsplit::cli::Command;
namespace cli = textsplit::cli;
namespace events = textsplit::events;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("textsplit_cli_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

CliOptions parse(const std::vector<std::string>& args) {
    auto parsed = cli::parse_cli(args);
    EXPECT_TRUE(parsed.is_ok());
    return parsed.is_ok() ? parsed.value() : CliOptions{};
}

} // namespace

class CliAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        file_ = root_ / "payload.bin";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    int run(const std::vector<std::string>& args, std::string* printed = nullptr) {
        const CliOptions options = parse(args);
        auto config = cli::resolve_config(options);
        EXPECT_TRUE(config.is_ok());
        if (config.is_error()) {
            return -1;
        }
        events::EventBus bus;
        events::MetricsComponent metrics(bus);
        std::ostringstream out;
        const int code = cli::run(options, config.value(), bus, out);
        if (printed != nullptr) {
            *printed = out.str();
        }
        return code;
    }

    fs::path root_;
    fs::path file_;
};

TEST_F(CliAppTest, SplitThenJoinRoundTrips) {
    write_file(file_, "0123456789abcdefghij");

    std::string printed;
    ASSERT_EQ(run({"split", file_.string(), "8"}, &printed), cli::kExitOk);
    EXPECT_NE(printed.find("payload.bin.part001.txt"), std::string::npos);
    EXPECT_NE(printed.find("payload.bin.part003.txt"), std::string::npos);
    EXPECT_TRUE(fs::exists(root_ / "payload.bin.part003.txt"));

    fs::remove(file_);
    ASSERT_EQ(run({"join", file_.string()}, &printed), cli::kExitOk);
    EXPECT_EQ(printed, file_.string() + "\n");
    EXPECT_EQ(read_file(file_), "0123456789abcdefghij");
    EXPECT_FALSE(fs::exists(root_ / "payload.bin.part001.txt"));
}

TEST_F(CliAppTest, InvalidChunkSizeIsUsageError) {
    write_file(file_, "abc");
    EXPECT_EQ(run({"split", file_.string(), "0"}), cli::kExitUsage);
    EXPECT_EQ(run({"split", file_.string(), "ten"}), cli::kExitUsage);
    EXPECT_FALSE(fs::exists(root_ / "payload.bin.part001.txt"));
}

TEST_F(CliAppTest, OperationFailuresExitWithOne) {
    EXPECT_EQ(run({"split", file_.string(), "10"}), cli::kExitFailure);
    EXPECT_EQ(run({"join", file_.string()}), cli::kExitFailure);
    EXPECT_EQ(run({"unpack", file_.string()}), cli::kExitFailure);
}

TEST_F(CliAppTest, PackThenUnpackRoundTrips) {
    std::string content;
    for (int i = 0; i < 500; ++i) {
        content += "entry " + std::to_string(i) + "\n";
    }
    write_file(file_, content);

    ASSERT_EQ(run({"pack", file_.string(), "256"}), cli::kExitOk);
    EXPECT_TRUE(fs::exists(root_ / "payload.bin.zip.part001.txt"));
    EXPECT_FALSE(fs::exists(root_ / "payload.bin.zip"));

    const fs::path dest = root_ / "out";
    std::string printed;
    ASSERT_EQ(run({"unpack", file_.string(), dest.string()}, &printed), cli::kExitOk);
    EXPECT_EQ(printed, (dest / "payload.bin").string() + "\n");
    EXPECT_EQ(read_file(dest / "payload.bin"), content);
}

TEST_F(CliAppTest, ConfigFileSuppliesPackDefaults) {
    write_file(file_, std::string(5000, 'z'));
    const fs::path config_file = root_ / "textsplit.json";
    write_file(config_file, R"({"chunk_size": 4, "keep_archive": true})");

    ASSERT_EQ(run({"--config", config_file.string(), "pack", file_.string()}), cli::kExitOk);
    EXPECT_TRUE(fs::exists(root_ / "payload.bin.zip"));
    EXPECT_TRUE(fs::exists(root_ / "payload.bin.zip.part002.txt"));
}

TEST(ResolveConfigTest, FlagsOverrideConfigFile) {
    const auto dir = create_temp_dir();
    const fs::path config_file = dir / "cfg.json";
    write_file(config_file, R"({"log_level": "debug", "chunk_size": 99})");

    auto explicit_level = cli::resolve_config(parse({"-c", config_file.string(), "-l", "error", "join", "x"}));
    ASSERT_TRUE(explicit_level.is_ok());
    EXPECT_EQ(explicit_level.value().log_level, "error");
    EXPECT_EQ(explicit_level.value().chunk_size, 99u);

    auto quiet = cli::resolve_config(parse({"-c", config_file.string(), "-q", "join", "x"}));
    ASSERT_TRUE(quiet.is_ok());
    EXPECT_EQ(quiet.value().log_level, "warn");

    auto defaults = cli::resolve_config(parse({"join", "x"}));
    ASSERT_TRUE(defaults.is_ok());
    EXPECT_EQ(defaults.value().log_level, "info");
    EXPECT_EQ(defaults.value().chunk_size, textsplit::config::kDefaultChunkSize);

    fs::remove_all(dir);
}

TEST(ResolveConfigTest, ReportsBadInputs) {
    auto bad_level = cli::resolve_config(parse({"-l", "shouty", "join", "x"}));
    ASSERT_TRUE(bad_level.is_error());
    EXPECT_EQ(bad_level.error().code, textsplit::ErrorCode::InvalidArgument);

    auto missing = cli::resolve_config(parse({"-c", "/nonexistent/textsplit.json", "join", "x"}));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, textsplit::ErrorCode::NotFound);
}
