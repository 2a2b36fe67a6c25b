#include <gtest/gtest.h>
#include <platform/archive.hpp>
#include "zip_builder.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

TEST(ArchiveTest, FirstFileSkipsDirectories) {
    std::string zip = make_zip({{"logs/", ""}, {"logs/job_7.log", "line 1\nline 2\n"}});
    auto first = platform::read_first_file(zip);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "line 1\nline 2\n");
}

TEST(ArchiveTest, EmptyArchiveHasNoFirstFile) {
    std::string zip = make_zip({{"only-a-dir/", ""}});
    EXPECT_FALSE(platform::read_first_file(zip).has_value());
}

TEST(ArchiveTest, MemberMatchesBasenameUnderDirectory) {
    std::string zip = make_zip({{"bundle/result.csv", "a,b\n"}, {"bundle/output.log", "done\n"}});
    EXPECT_EQ(platform::read_member(zip, "output.log").value_or(""), "done\n");
    EXPECT_FALSE(platform::read_member(zip, "put.log").has_value());

    auto names = platform::list_members(zip);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "bundle/result.csv");
}

TEST(ArchiveTest, GarbageThrows) {
    EXPECT_THROW(platform::read_first_file("this is not an archive"), std::runtime_error);
}

class ArchiveExtractTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "bridgectl_archive_test";
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static std::string slurp(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(ArchiveExtractTest, ExtractsNestedFiles) {
    std::string zip = make_zip({{"out/a.txt", "A"}, {"out/sub/b.txt", "B"}});
    auto written = platform::extract_all(zip, test_dir);

    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(slurp(test_dir / "out/a.txt"), "A");
    EXPECT_EQ(slurp(test_dir / "out/sub/b.txt"), "B");
}

TEST_F(ArchiveExtractTest, SkipsEntriesEscapingDestination) {
    std::string zip = make_zip({{"../escape.txt", "x"}, {"safe.txt", "y"}});
    auto written = platform::extract_all(zip, test_dir);

    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0], test_dir / "safe.txt");
    EXPECT_FALSE(fs::exists(test_dir.parent_path() / "escape.txt"));
}
