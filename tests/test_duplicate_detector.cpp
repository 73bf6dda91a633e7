// EN: Unit tests for DuplicateDetector - digests, grouping and sibling descriptions
// FR: Tests unitaires de DuplicateDetector - empreintes, regroupement et descriptions des lignes sœurs

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "validation/duplicate_detector.hpp"
#include "validation/validation_report.hpp"

#include <string>
#include <vector>

using namespace FP::Validation;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(DuplicateDetectorTest, DigestIsStableAndContentSensitive) {
    auto first = DuplicateDetector::digest("1,Ann,30");
    auto again = DuplicateDetector::digest("1,Ann,30");
    auto other = DuplicateDetector::digest("1,Ann,31");

    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);
    EXPECT_EQ(first.length, 8u);
}

TEST(DuplicateDetectorTest, EmptyContentHasKnownChecksum) {
    auto digest = DuplicateDetector::digest("");
    EXPECT_EQ(digest.checksum, 0u);
    EXPECT_EQ(digest.length, 0u);
}

TEST(DuplicateDetectorTest, GroupsRowsWithIdenticalContent) {
    DuplicateDetector detector;
    detector.record(1, "h1,h2");
    detector.record(5, "a,b");
    detector.record(6, "c,d");
    detector.record(9, "a,b");

    EXPECT_EQ(detector.recordedRows(), 4u);
    EXPECT_EQ(detector.distinctContents(), 3u);

    auto groups = detector.duplicateGroups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_THAT(groups[0].rows, ElementsAre(5u, 9u));
    EXPECT_EQ(groups[0].content_preview, "a,b");
}

TEST(DuplicateDetectorTest, GroupsAreOrderedByFirstRow) {
    DuplicateDetector detector;
    detector.record(2, "zzz");
    detector.record(3, "aaa");
    detector.record(4, "aaa");
    detector.record(7, "zzz");
    detector.record(8, "zzz");

    auto groups = detector.duplicateGroups();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_THAT(groups[0].rows, ElementsAre(2u, 7u, 8u));
    EXPECT_THAT(groups[1].rows, ElementsAre(3u, 4u));
}

TEST(DuplicateDetectorTest, PreviewIsTruncated) {
    std::string long_row(800, 'q');
    DuplicateDetector detector;
    detector.record(1, long_row);
    detector.record(2, long_row);

    auto groups = detector.duplicateGroups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].content_preview.size(), ValidationReport::kStoredPreviewLength);
}

TEST(DuplicateDetectorTest, DescribeSiblingsExcludesTheRowItself) {
    EXPECT_EQ(DuplicateDetector::describeSiblings({5, 9}, 5), "Exact duplicate of row(s): 9");
    EXPECT_EQ(DuplicateDetector::describeSiblings({5, 9}, 9), "Exact duplicate of row(s): 5");
    EXPECT_EQ(DuplicateDetector::describeSiblings({2, 4, 6}, 4), "Exact duplicate of row(s): 2, 6");
}

TEST(DuplicateDetectorTest, DescribeSiblingsSummarisesLargeGroups) {
    std::vector<size_t> rows;
    for (size_t row = 1; row <= 15; ++row) {
        rows.push_back(row);
    }
    std::string description = DuplicateDetector::describeSiblings(rows, 1);
    EXPECT_THAT(description, HasSubstr("2, 3, 4, 5, 6, 7, 8, 9, 10, 11"));
    EXPECT_THAT(description, HasSubstr(" and 4 more"));
}

TEST(DuplicateDetectorTest, ClearForgetsEverything) {
    DuplicateDetector detector;
    detector.record(1, "x");
    detector.record(2, "x");
    detector.clear();

    EXPECT_EQ(detector.recordedRows(), 0u);
    EXPECT_TRUE(detector.duplicateGroups().empty());
}
