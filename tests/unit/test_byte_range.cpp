#include <gtest/gtest.h>
#include "torrentcast/streaming/byte_range.hpp"

using namespace torrentcast::streaming;

TEST(ByteRangeTest, NoHeaderMeansWholeFile) {
    auto request = parse_range_header(std::nullopt, 1000);
    EXPECT_EQ(request.status, RangeStatus::NONE);
}

TEST(ByteRangeTest, OpenEndedRange) {
    auto request = parse_range_header("bytes=500-", 1000);
    
    ASSERT_EQ(request.status, RangeStatus::SATISFIABLE);
    EXPECT_EQ(request.range.start, 500u);
    EXPECT_EQ(request.range.end, 999u);
    EXPECT_EQ(request.range.length(), 500u);
    EXPECT_EQ(content_range_header(request.range, 1000), "bytes 500-999/1000");
}

TEST(ByteRangeTest, ClosedRange) {
    auto request = parse_range_header("bytes=0-99", 1000);
    
    ASSERT_EQ(request.status, RangeStatus::SATISFIABLE);
    EXPECT_EQ(request.range.start, 0u);
    EXPECT_EQ(request.range.end, 99u);
    EXPECT_EQ(request.range.length(), 100u);
}

TEST(ByteRangeTest, EndIsClampedToFile) {
    auto request = parse_range_header("bytes=900-5000", 1000);
    
    ASSERT_EQ(request.status, RangeStatus::SATISFIABLE);
    EXPECT_EQ(request.range.end, 999u);
    EXPECT_EQ(request.range.length(), 100u);
}

TEST(ByteRangeTest, SuffixRange) {
    auto tail = parse_range_header("bytes=-200", 1000);
    ASSERT_EQ(tail.status, RangeStatus::SATISFIABLE);
    EXPECT_EQ(tail.range.start, 800u);
    EXPECT_EQ(tail.range.end, 999u);
    
    auto oversized = parse_range_header("bytes=-5000", 1000);
    ASSERT_EQ(oversized.status, RangeStatus::SATISFIABLE);
    EXPECT_EQ(oversized.range.start, 0u);
    
    EXPECT_EQ(parse_range_header("bytes=-0", 1000).status, RangeStatus::NOT_SATISFIABLE);
}

TEST(ByteRangeTest, StartBeyondLengthIsNotSatisfiable) {
    auto request = parse_range_header("bytes=1200-1300", 1000);
    EXPECT_EQ(request.status, RangeStatus::NOT_SATISFIABLE);
    EXPECT_FALSE(request.reason.empty());
    EXPECT_EQ(unsatisfied_range_header(1000), "bytes */1000");
    
    EXPECT_EQ(parse_range_header("bytes=1000-", 1000).status, RangeStatus::NOT_SATISFIABLE);
}

TEST(ByteRangeTest, MalformedHeaders) {
    EXPECT_EQ(parse_range_header("items=0-10", 1000).status, RangeStatus::NOT_SATISFIABLE);
    EXPECT_EQ(parse_range_header("bytes=abc-", 1000).status, RangeStatus::NOT_SATISFIABLE);
    EXPECT_EQ(parse_range_header("bytes=10-x", 1000).status, RangeStatus::NOT_SATISFIABLE);
    EXPECT_EQ(parse_range_header("bytes=10", 1000).status, RangeStatus::NOT_SATISFIABLE);
    EXPECT_EQ(parse_range_header("bytes=500-400", 1000).status, RangeStatus::NOT_SATISFIABLE);
    EXPECT_EQ(parse_range_header("bytes=0-", 0).status, RangeStatus::NOT_SATISFIABLE);
}

TEST(ByteRangeTest, OnlyFirstOfMultipleRangesIsHonoured) {
    auto request = parse_range_header("bytes=0-9, 20-29", 1000);
    
    ASSERT_EQ(request.status, RangeStatus::SATISFIABLE);
    EXPECT_EQ(request.range.start, 0u);
    EXPECT_EQ(request.range.end, 9u);
}

TEST(ByteRangeTest, UnitIsCaseInsensitive) {
    EXPECT_EQ(parse_range_header("Bytes=0-1", 10).status, RangeStatus::SATISFIABLE);
}
