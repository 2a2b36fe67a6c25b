#include <gtest/gtest.h>
#include <managers/log_sync_cache.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

// Serves a growing in-memory "remote" log.
class FakeFetcher : public LogFetcher {
public:
    std::string remote;
    std::vector<std::uintmax_t> offsets;

    void fetch_log(const std::string&, const std::string&, std::uintmax_t start_offset,
                   const fs::path& dest) override {
        offsets.push_back(start_offset);
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (start_offset < remote.size()) out << remote.substr(start_offset);
    }
};

std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

class LogSyncCacheTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<JobStore> store;
    std::unique_ptr<LogSyncCache> cache;
    FakeFetcher fetcher;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "bridgectl_log_cache_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        store = std::make_unique<JobStore>(test_dir / "jobs.yaml");
        cache = std::make_unique<LogSyncCache>(*store, test_dir / "logs");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(LogSyncCacheTest, FirstFetchIsFullThenAppends) {
    fetcher.remote = "line 1\n";
    auto first = cache->fetch("42", "/remote/job.log", false, fetcher);
    EXPECT_FALSE(first.incremental);
    EXPECT_EQ(first.size, 7u);
    EXPECT_EQ(cache->get_offset("42"), 7u);

    fetcher.remote += "line 2\n";
    auto second = cache->fetch("42", "/remote/job.log", false, fetcher);
    EXPECT_TRUE(second.incremental);
    EXPECT_EQ(second.start_offset, 7u);
    EXPECT_EQ(second.bytes_fetched, 7u);
    EXPECT_EQ(slurp(second.path), "line 1\nline 2\n");
    EXPECT_EQ(cache->get_offset("42"), 14u);
    EXPECT_EQ(fetcher.offsets, (std::vector<std::uintmax_t>{0, 7}));
}

TEST_F(LogSyncCacheTest, NothingNewLeavesFileUntouched) {
    fetcher.remote = "abc\n";
    cache->fetch("1", "/r", false, fetcher);

    auto again = cache->fetch("1", "/r", false, fetcher);
    EXPECT_TRUE(again.no_new_content());
    EXPECT_EQ(slurp(again.path), "abc\n");
    EXPECT_EQ(cache->get_offset("1"), 4u);
}

TEST_F(LogSyncCacheTest, RefreshReplacesWholeFile) {
    fetcher.remote = "old content\n";
    cache->fetch("7", "/r", false, fetcher);

    fetcher.remote = "rotated\n";
    auto result = cache->fetch("7", "/r", true, fetcher);
    EXPECT_FALSE(result.incremental);
    EXPECT_EQ(result.start_offset, 0u);
    EXPECT_EQ(slurp(result.path), "rotated\n");
    EXPECT_EQ(cache->get_offset("7"), 8u);
}

TEST_F(LogSyncCacheTest, DeletedCacheFileResetsOffset) {
    fetcher.remote = "0123456789";
    auto first = cache->fetch("9", "/r", false, fetcher);
    fs::remove(first.path);

    auto second = cache->fetch("9", "/r", false, fetcher);
    EXPECT_EQ(second.start_offset, 0u);
    EXPECT_EQ(slurp(second.path), "0123456789");
    EXPECT_EQ(cache->get_offset("9"), 10u);
}

TEST_F(LogSyncCacheTest, MismatchedOffsetResetsOffset) {
    fetcher.remote = "abcdef";
    auto first = cache->fetch("3", "/r", false, fetcher);
    std::ofstream(first.path, std::ios::app) << "local junk";

    auto second = cache->fetch("3", "/r", false, fetcher);
    EXPECT_FALSE(second.incremental);
    EXPECT_EQ(slurp(second.path), "abcdef");
}

TEST_F(LogSyncCacheTest, LegacyFileNameIsMigrated) {
    fs::create_directories(test_dir / "logs");
    std::ofstream(test_dir / "logs" / "job-55.log") << "legacy";

    fs::path path = cache->cache_path("55");
    EXPECT_EQ(path, test_dir / "logs" / "55.log");
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(test_dir / "logs" / "job-55.log"));
    EXPECT_EQ(slurp(path), "legacy");
}

TEST_F(LogSyncCacheTest, PruneRemovesOnlyStaleLogs) {
    fs::path dir = test_dir / "logs";
    fs::create_directories(dir);
    std::ofstream(dir / "old.log") << "x";
    std::ofstream(dir / "new.log") << "y";
    std::ofstream(dir / "old.txt") << "z";
    auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(24 * 10);
    fs::last_write_time(dir / "old.log", old_time);
    fs::last_write_time(dir / "old.txt", old_time);

    cache->prune();
    EXPECT_FALSE(fs::exists(dir / "old.log"));
    EXPECT_TRUE(fs::exists(dir / "new.log"));
    EXPECT_TRUE(fs::exists(dir / "old.txt"));
}

TEST(ReadFileFromTest, Offsets) {
    fs::path p = fs::temp_directory_path() / "bridgectl_read_from.txt";
    std::ofstream(p) << "hello world";
    EXPECT_EQ(read_file_from(p, 6), "world");
    EXPECT_EQ(read_file_from(p, 11), "");
    EXPECT_EQ(read_file_from(p, 0), "hello world");
    fs::remove(p);
    EXPECT_EQ(read_file_from(p, 0), "");
}
