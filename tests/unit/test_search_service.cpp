#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "torrentcast/search/apibay_provider.hpp"
#include "torrentcast/search/search_service.hpp"

using namespace torrentcast::search;
using torrentcast::core::ErrorCode;
using torrentcast::core::Result;
using ::testing::_;
using ::testing::Return;

namespace {

class MockSearchProvider : public SearchProvider {
public:
    MOCK_METHOD(CategoryResult, fetch, (const std::string& query, const std::string& category), (override));
};

RawSearchEntry entry(const std::string& name, char hash_digit, std::uint32_t seeders,
                     const std::string& category = "200") {
    RawSearchEntry e;
    e.id = std::string(1, hash_digit);
    e.name = name;
    e.info_hash = std::string(40, hash_digit);
    e.size = 1536ull * 1024 * 1024;
    e.seeders = seeders;
    e.leechers = 2;
    e.category = category;
    e.added = 1700000000;
    return e;
}

CategoryResult ok(std::vector<RawSearchEntry> entries) {
    return CategoryResult{Result(), std::move(entries)};
}

CategoryResult failed(const std::string& message) {
    return CategoryResult{Result(ErrorCode::UPSTREAM_FAILURE, message), {}};
}

}

class SearchServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider = std::make_shared<::testing::NiceMock<MockSearchProvider>>();
        config.categories = {"200", "205"};
        config.default_limit = 2;
        config.max_limit = 3;
        service = std::make_unique<SearchService>(provider, config);
    }
    
    std::shared_ptr<::testing::NiceMock<MockSearchProvider>> provider;
    SearchConfig config;
    std::unique_ptr<SearchService> service;
};

TEST_F(SearchServiceTest, EmptyQueryIsRejected) {
    EXPECT_CALL(*provider, fetch(_, _)).Times(0);
    
    auto response = service->search("   ");
    EXPECT_EQ(response.result.error, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(response.result.message, "Search query is required");
}

TEST_F(SearchServiceTest, QueriesEveryCategory) {
    EXPECT_CALL(*provider, fetch("big buck bunny", "200")).WillOnce(Return(ok({})));
    EXPECT_CALL(*provider, fetch("big buck bunny", "205")).WillOnce(Return(ok({})));
    
    auto response = service->search("  big buck bunny ");
    ASSERT_TRUE(response.result.success());
    EXPECT_EQ(response.query, "big buck bunny");
    EXPECT_EQ(response.total, 0u);
}

TEST_F(SearchServiceTest, AllCategoriesFailingIsUpstreamFailure) {
    ON_CALL(*provider, fetch(_, _)).WillByDefault(Return(failed("HTTP 503")));
    
    auto response = service->search("anything");
    EXPECT_EQ(response.result.error, ErrorCode::UPSTREAM_FAILURE);
    EXPECT_EQ(response.result.message, "Search failed: HTTP 503");
}

TEST_F(SearchServiceTest, PartialFailureStillReturnsResults) {
    ON_CALL(*provider, fetch(_, "200")).WillByDefault(Return(failed("timeout")));
    ON_CALL(*provider, fetch(_, "205")).WillByDefault(Return(ok({entry("Show.S01E01.720p.mkv", 'a', 10, "205")})));
    
    auto response = service->search("show");
    ASSERT_TRUE(response.result.success());
    ASSERT_EQ(response.results.size(), 1u);
    EXPECT_EQ(response.results[0].category, "TV Shows");
}

TEST_F(SearchServiceTest, PlaceholderAndMalformedHashesAreDropped) {
    auto placeholder = entry("No results returned", '0', 0);
    auto malformed = entry("Movie.1080p", 'b', 50);
    malformed.info_hash = "xyz";
    ON_CALL(*provider, fetch(_, "200")).WillByDefault(Return(ok({placeholder, malformed, entry("Movie.1080p", 'c', 50)})));
    ON_CALL(*provider, fetch(_, "205")).WillByDefault(Return(ok({})));
    
    auto response = service->search("movie");
    ASSERT_EQ(response.total, 1u);
    EXPECT_EQ(response.results[0].info_hash, std::string(40, 'c'));
}

TEST_F(SearchServiceTest, NonVideoNamesWithFewSeedersAreFiltered) {
    ON_CALL(*provider, fetch(_, "200")).WillByDefault(Return(ok({
        entry("Soundtrack FLAC", 'a', 3),
        entry("Popular Archive", 'b', 6),
        entry("Clip.webm", 'c', 0),
    })));
    ON_CALL(*provider, fetch(_, "205")).WillByDefault(Return(ok({})));
    
    service = std::make_unique<SearchService>(provider, config);
    auto response = service->search("mixed", 1, 3);
    ASSERT_EQ(response.total, 2u);
    EXPECT_EQ(response.results[0].name, "Popular Archive");
    EXPECT_EQ(response.results[1].name, "Clip.webm");
}

TEST_F(SearchServiceTest, SortsBySeedersAndPaginates) {
    ON_CALL(*provider, fetch(_, "200")).WillByDefault(Return(ok({
        entry("A.720p", 'a', 10),
        entry("B.720p", 'b', 40),
    })));
    ON_CALL(*provider, fetch(_, "205")).WillByDefault(Return(ok({
        entry("C.720p", 'c', 30, "205"),
        entry("D.720p", 'd', 20, "205"),
        entry("E.720p", 'e', 5, "205"),
    })));
    
    auto first = service->search("x");
    ASSERT_TRUE(first.result.success());
    EXPECT_EQ(first.total, 5u);
    EXPECT_EQ(first.limit, 2u);
    ASSERT_EQ(first.results.size(), 2u);
    EXPECT_EQ(first.results[0].name, "B.720p");
    EXPECT_EQ(first.results[1].name, "C.720p");
    
    auto last = service->search("x", 3);
    ASSERT_EQ(last.results.size(), 1u);
    EXPECT_EQ(last.results[0].name, "E.720p");
    
    EXPECT_TRUE(service->search("x", 9).results.empty());
    EXPECT_EQ(service->search("x", 1, 50).limit, 3u);
    EXPECT_EQ(service->search("x", 0).page, 1u);
}

TEST(SearchFormattingTest, FormatHit) {
    auto hit = format_hit(entry("Big Buck Bunny 1080p", 'f', 12, "207"));
    
    EXPECT_EQ(hit.size, "1.5 GB");
    EXPECT_EQ(hit.size_bytes, 1536ull * 1024 * 1024);
    EXPECT_EQ(hit.category, "Movies HD");
    EXPECT_EQ(hit.uploaded, "2023-11-14");
    EXPECT_EQ(hit.magnet, "magnet:?xt=urn:btih:" + std::string(40, 'f') + "&dn=Big%20Buck%20Bunny%201080p");
    
    auto undated = entry("x.mkv", 'f', 1);
    undated.added = 0;
    EXPECT_EQ(format_hit(undated).uploaded, "Unknown");
}

TEST(SearchFormattingTest, CategoryNames) {
    EXPECT_STREQ(category_name("200"), "Movies");
    EXPECT_STREQ(category_name("209"), "Movies BluRay");
    EXPECT_STREQ(category_name("999"), "Video");
}

TEST(SearchFormattingTest, LooksLikeVideo) {
    EXPECT_TRUE(looks_like_video("Film.2019.2160p.HDR", 0));
    EXPECT_TRUE(looks_like_video("movie.MOV", 0));
    EXPECT_FALSE(looks_like_video("ebook collection", 5));
    EXPECT_TRUE(looks_like_video("ebook collection", 6));
}

TEST(ApibayResponseTest, ParsesStringFields) {
    auto parsed = ApibaySearchProvider::parse_response(R"([
        {"id":"42","name":"Sintel 720p","info_hash":"ABCDEFABCDEFABCDEFABCDEFABCDEFABCDEFABCD",
         "leechers":"3","seeders":"120","num_files":"1","size":"734003200",
         "username":"u","added":"1700000000","status":"vip","category":"207","imdb":""},
        {"id":43,"name":"Numeric","info_hash":"0123456789012345678901234567890123456789",
         "seeders":7,"leechers":-1,"size":1024,"added":0,"category":200}
    ])");
    
    ASSERT_TRUE(parsed.result.success()) << parsed.result.message;
    ASSERT_EQ(parsed.entries.size(), 2u);
    
    const auto& first = parsed.entries[0];
    EXPECT_EQ(first.id, "42");
    EXPECT_EQ(first.info_hash, "abcdefabcdefabcdefabcdefabcdefabcdefabcd");
    EXPECT_EQ(first.seeders, 120u);
    EXPECT_EQ(first.leechers, 3u);
    EXPECT_EQ(first.size, 734003200u);
    EXPECT_EQ(first.added, 1700000000);
    EXPECT_EQ(first.category, "207");
    
    const auto& second = parsed.entries[1];
    EXPECT_EQ(second.id, "43");
    EXPECT_EQ(second.seeders, 7u);
    EXPECT_EQ(second.leechers, 0u);
    EXPECT_EQ(second.category, "200");
}

TEST(ApibayResponseTest, RejectsMalformedBodies) {
    EXPECT_EQ(ApibaySearchProvider::parse_response("<html>").result.error, ErrorCode::UPSTREAM_FAILURE);
    EXPECT_EQ(ApibaySearchProvider::parse_response(R"({"error":"x"})").result.error, ErrorCode::UPSTREAM_FAILURE);
}

TEST(ApibayResponseTest, BuildsEncodedUrl) {
    SearchConfig config;
    config.endpoint = "https://index.example/q.php";
    ApibaySearchProvider provider(config);
    
    EXPECT_EQ(provider.build_url("big buck&bunny", "200"),
              "https://index.example/q.php?q=big%20buck%26bunny&cat=200");
}
