#include <gtest/gtest.h>
#include "combine/file_combiner.h"
#include "utils/time_utils.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

using namespace pem;
using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

const Timestamp kBase = system_clock::from_time_t(1700000000);

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

class FileCombinerTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::applyTimezone("UTC");
        folder_ = fs::temp_directory_path() /
                  ("pem_combiner_" + std::to_string(::getpid()) + "_" +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(folder_);
        fs::create_directories(folder_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(folder_, ec);
    }

    fs::path writeSegment(const std::string& camera, int startSec, int endSec, const std::string& content) {
        fs::path path = folder_ / formatSegmentFileName(camera, kBase + seconds(startSec),
                                                        kBase + seconds(endSec), "mp4");
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    FileCombiner binaryCombiner(bool keepSplitFiles) {
        CombinerSettings settings;
        settings.tolerance = seconds(1);
        settings.keepSplitFiles = keepSplitFiles;
        return FileCombiner(std::make_shared<BinaryConcatJoiner>(), settings);
    }

    fs::path folder_;
};

TEST_F(FileCombinerTest, MergesContiguousSegmentsInTimeOrder) {
    auto a = writeSegment("cam1", 0, 10, "AAA");
    auto b = writeSegment("cam1", 10, 20, "BBB");
    auto c = writeSegment("cam1", 30, 40, "CCC");

    auto combiner = binaryCombiner(true);
    auto summary = combiner.combineFolder(folder_.string());

    EXPECT_EQ(summary.segmentsFound, 3u);
    EXPECT_EQ(summary.groupsMerged, 1u);
    EXPECT_EQ(summary.groupsFailed, 0u);
    EXPECT_EQ(summary.filesRemoved, 0u);
    ASSERT_EQ(summary.mergedFiles.size(), 1u);

    fs::path merged = folder_ / formatSegmentFileName("cam1", kBase, kBase + seconds(20), "mp4");
    EXPECT_EQ(fs::path(summary.mergedFiles[0]), merged);
    EXPECT_EQ(readFile(merged), "AAABBB");

    // keep_split_files keeps the originals
    EXPECT_TRUE(fs::exists(a));
    EXPECT_TRUE(fs::exists(b));
    EXPECT_TRUE(fs::exists(c));
}

TEST_F(FileCombinerTest, RemovesOriginalsWhenNotKeepingSplitFiles) {
    auto a = writeSegment("cam1", 0, 10, "AAA");
    auto b = writeSegment("cam1", 10, 20, "BBB");
    auto c = writeSegment("cam1", 30, 40, "CCC");

    auto combiner = binaryCombiner(false);
    auto summary = combiner.combineFolder(folder_.string());

    EXPECT_EQ(summary.groupsMerged, 1u);
    EXPECT_EQ(summary.filesRemoved, 2u);
    EXPECT_EQ(summary.filesSkipped, 0u);
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(b));
    // The isolated segment is not part of any group and stays in place
    EXPECT_TRUE(fs::exists(c));
    EXPECT_EQ(readFile(c), "CCC");
    EXPECT_TRUE(fs::exists(folder_ / formatSegmentFileName("cam1", kBase, kBase + seconds(20), "mp4")));
}

TEST_F(FileCombinerTest, CamerasAreMergedIndependently) {
    writeSegment("cam1", 0, 10, "1a");
    writeSegment("cam1", 10, 20, "1b");
    writeSegment("cam2", 0, 10, "2a");
    writeSegment("cam2", 10, 20, "2b");

    auto combiner = binaryCombiner(true);
    auto summary = combiner.combineFolder(folder_.string());

    EXPECT_EQ(summary.groupsMerged, 2u);
    EXPECT_EQ(readFile(folder_ / formatSegmentFileName("cam2", kBase, kBase + seconds(20), "mp4")), "2a2b");
}

TEST_F(FileCombinerTest, SecondRunDoesNotMergeAgain) {
    writeSegment("cam1", 0, 10, "AAA");
    writeSegment("cam1", 10, 20, "BBB");

    auto combiner = binaryCombiner(true);
    EXPECT_EQ(combiner.combineFolder(folder_.string()).groupsMerged, 1u);

    auto again = combiner.combineFolder(folder_.string());
    EXPECT_EQ(again.segmentsFound, 3u);
    EXPECT_EQ(again.groupsMerged, 0u);
    EXPECT_EQ(again.groupsFailed, 0u);
}

TEST_F(FileCombinerTest, FailedJoinKeepsOriginalsAndLeavesNoPartialFile) {
    auto a = writeSegment("cam1", 0, 10, "AAA");
    auto b = writeSegment("cam1", 10, 20, "BBB");

    CombinerSettings settings;
    settings.keepSplitFiles = false;
    FileCombiner combiner(std::make_shared<FfmpegConcatJoiner>("/bin/false", seconds(5)), settings);
    auto summary = combiner.combineFolder(folder_.string());

    EXPECT_EQ(summary.groupsMerged, 0u);
    EXPECT_EQ(summary.groupsFailed, 1u);
    EXPECT_EQ(summary.errors.size(), 1u);
    EXPECT_TRUE(fs::exists(a));
    EXPECT_TRUE(fs::exists(b));

    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(folder_)) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 2u);
}

TEST_F(FileCombinerTest, IgnoresUnrelatedFilesAndMissingFolder) {
    std::ofstream(folder_ / "README.txt") << "hello";
    auto combiner = binaryCombiner(true);

    auto summary = combiner.combineFolder(folder_.string());
    EXPECT_EQ(summary.segmentsFound, 0u);
    EXPECT_EQ(summary.groupsMerged, 0u);
    EXPECT_EQ(summary.filesSkipped, 1u);
    EXPECT_NE(summary.describe().find("1 unrecognised file(s) skipped"), std::string::npos);

    auto missing = combiner.combineFolder((folder_ / "absent").string());
    EXPECT_EQ(missing.segmentsFound, 0u);
}

TEST(FfmpegConcatJoinerTest, EscapesQuotesInConcatList) {
    auto list = FfmpegConcatJoiner::buildConcatList({"/data/a.mp4", "/data/it's.mp4"});
    EXPECT_EQ(list, "file '/data/a.mp4'\nfile '/data/it'\\''s.mp4'\n");
}
