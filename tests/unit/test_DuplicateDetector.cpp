#include <gtest/gtest.h>
#include "shipper/duplicate_detector.hpp"
#include "test_helpers.hpp"

TEST(DuplicateDetectorTest, DisjointSetsProduceNoOverlap)
{
    DuplicateDetector::Snapshots snapshots{
        {"a", {"/x/1.log", "/x/2.log"}},
        {"b", {"/y/1.log"}},
    };
    auto overlaps = DuplicateDetector::findOverlaps("c", {"/z/1.log"}, snapshots);
    EXPECT_TRUE(overlaps.empty());
}

TEST(DuplicateDetectorTest, OverlapListsOtherJobAndSortedFiles)
{
    DuplicateDetector::Snapshots snapshots{
        {"a", {"/x/1.log", "/x/2.log", "/x/3.log"}},
        {"b", {"/x/2.log"}},
        {"self", {"/x/1.log", "/x/2.log"}},
    };
    auto overlaps = DuplicateDetector::findOverlaps("self", {"/x/2.log", "/x/1.log", "/x/9.log"}, snapshots);

    ASSERT_EQ(overlaps.size(), 2u);
    EXPECT_EQ(overlaps[0].other, "a");
    EXPECT_EQ(overlaps[0].files, (std::vector<std::string>{"/x/1.log", "/x/2.log"}));
    EXPECT_EQ(overlaps[1].other, "b");
    EXPECT_EQ(overlaps[1].files, (std::vector<std::string>{"/x/2.log"}));
}

TEST(DuplicateDetectorTest, EmptyNewSetNeverOverlaps)
{
    DuplicateDetector::Snapshots snapshots{{"a", {"/x/1.log"}}};
    EXPECT_TRUE(DuplicateDetector::findOverlaps("b", {}, snapshots).empty());
}

TEST(DuplicateDetectorTest, ReportWarnsOncePerOverlappingJob)
{
    testutil::LogCapture logs;
    DuplicateDetector::report("job1", {
                                          FileOverlap{"job2", {"/x/1.log", "/x/2.log"}},
                                          FileOverlap{"job3", {"/x/2.log"}},
                                      });

    const auto text = logs.text();
    EXPECT_EQ(logs.count("[warning]"), 2u);
    EXPECT_NE(text.find("'job1' and 'job2' are both copying 2 file(s): /x/1.log, /x/2.log"), std::string::npos);
    EXPECT_NE(text.find("'job1' and 'job3' are both copying 1 file(s): /x/2.log"), std::string::npos);
}

TEST(DuplicateDetectorTest, ReportWithoutOverlapsIsSilent)
{
    testutil::LogCapture logs;
    DuplicateDetector::report("job1", {});
    EXPECT_EQ(logs.count("[warning]"), 0u);
}
