#include <gtest/gtest.h>
#include <managers/job_store.hpp>
#include <core/errors.hpp>
#include <core/job_status.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class JobStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "bridgectl_job_store_test";
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    JobRecord job(const std::string& id, const std::string& status, const std::string& created) {
        JobRecord j;
        j.job_id = id;
        j.status = status;
        j.created_at = created;
        j.log_path = "/scratch/logs/" + id + ".out";
        return j;
    }
};

TEST_F(JobStoreTest, MissingFileIsEmpty) {
    JobStore store(test_dir / "jobs.yaml");
    EXPECT_TRUE(store.load().empty());
    EXPECT_FALSE(store.get_job("1").has_value());
}

TEST_F(JobStoreTest, UpsertKeepsCreatedAt) {
    JobStore store(test_dir / "jobs.yaml");
    store.upsert(job("100", "PENDING", "2026-01-01T00:00:00Z"));

    JobRecord updated = job("100", "RUNNING", "");
    store.upsert(updated);

    auto got = store.get_job("100");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->status, "RUNNING");
    EXPECT_EQ(got->created_at, "2026-01-01T00:00:00Z");
    EXPECT_FALSE(got->updated_at.empty());
    EXPECT_EQ(store.load().size(), 1u);
}

TEST_F(JobStoreTest, ListFiltersAndOrdersNewestFirst) {
    JobStore store(test_dir / "jobs.yaml");
    store.upsert(job("1", "COMPLETED", "2026-01-01T00:00:00Z"));
    store.upsert(job("2", "RUNNING", "2026-01-02T00:00:00Z"));
    store.upsert(job("3", "PENDING", "2026-01-03T00:00:00Z"));

    auto all = store.list_jobs();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].job_id, "3");

    auto active = store.list_jobs(expand_status_aliases({}));
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].job_id, "3");
    EXPECT_EQ(active[1].job_id, "2");

    EXPECT_EQ(store.list_jobs({}, 1).size(), 1u);
}

TEST_F(JobStoreTest, OffsetsPersist) {
    JobStore store(test_dir / "jobs.yaml");
    store.upsert(job("5", "RUNNING", "2026-01-01T00:00:00Z"));

    store.set_log_offset("5", 1234);
    EXPECT_EQ(JobStore(test_dir / "jobs.yaml").get_log_offset("5"), 1234u);
    EXPECT_FALSE(store.get_job("5")->log_cached_at.empty());

    store.reset_log_offset("5");
    EXPECT_EQ(store.get_log_offset("5"), 0u);
    EXPECT_EQ(store.get_job("5")->log_path, "/scratch/logs/5.out");
}

TEST_F(JobStoreTest, UpdateStatusOfUnknownJob) {
    JobStore store(test_dir / "jobs.yaml");
    EXPECT_FALSE(store.update_status("nope", "RUNNING"));
    store.upsert(job("6", "PENDING", "2026-01-01T00:00:00Z"));
    EXPECT_TRUE(store.update_status("6", "COMPLETED"));
    EXPECT_EQ(store.get_job("6")->status, "COMPLETED");
}

TEST_F(JobStoreTest, CorruptFileStartsFresh) {
    fs::create_directories(test_dir);
    std::ofstream(test_dir / "jobs.yaml") << "jobs: [unterminated\n";
    JobStore store(test_dir / "jobs.yaml");
    EXPECT_TRUE(store.load().empty());
}

TEST_F(JobStoreTest, StoredStatusRereadsStore) {
    JobStore store(test_dir / "jobs.yaml");
    store.upsert(job("8", "RUNNING", "2026-01-01T00:00:00Z"));
    StoredJobStatus status(store);

    EXPECT_EQ(status.current_status("8"), "RUNNING");
    JobStore(test_dir / "jobs.yaml").update_status("8", "FAILED");
    EXPECT_EQ(status.current_status("8"), "FAILED");
    EXPECT_THROW(status.current_status("missing"), BridgeError);
}
