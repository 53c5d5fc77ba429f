#include <gtest/gtest.h>
#include "torrentcast/network/api_router.hpp"

using namespace torrentcast;
using namespace std::chrono_literals;

TEST(ApiJsonTest, StatusProjection) {
    session::SessionStatus status;
    status.session_id = std::string(40, 'a');
    status.info_hash = std::string(40, 'a');
    status.name = "Sintel";
    status.state = session::SessionState::READY;
    status.has_metadata = true;
    status.progress = 0.5;
    status.received = 512;
    status.total_length = 1024;
    status.video_file = engine::FileEntry{"Sintel.mp4", "Sintel/Sintel.mp4", 1024};
    status.files = {*status.video_file};
    status.trackers = {"udp://tracker.example:80"};
    status.diagnostic.connection_status = "searching";
    status.diagnostic.suggestions = {"Try a different torrent with more seeders"};
    status.age = 12s;
    status.idle = 3s;
    
    auto json = network::status_to_json(status);
    
    EXPECT_EQ(json["torrentId"].asString(), std::string(40, 'a'));
    EXPECT_EQ(json["state"].asString(), "ready");
    EXPECT_TRUE(json["ready"].asBool());
    EXPECT_FALSE(json["engineReady"].asBool());
    EXPECT_DOUBLE_EQ(json["progress"].asDouble(), 0.5);
    EXPECT_EQ(json["downloaded"].asUInt64(), 512u);
    EXPECT_TRUE(json["timeRemaining"].isNull());
    EXPECT_TRUE(json["error"].isNull());
    EXPECT_EQ(json["videoFile"]["name"].asString(), "Sintel.mp4");
    EXPECT_EQ(json["videoFile"]["size"].asString(), "1 KB");
    EXPECT_EQ(json["files"].size(), 1u);
    EXPECT_EQ(json["audioFiles"].size(), 0u);
    EXPECT_EQ(json["ageSeconds"].asInt64(), 12);
    EXPECT_EQ(json["idleSeconds"].asInt64(), 3);
    
    const auto& diagnostic = json["diagnostic"];
    EXPECT_EQ(diagnostic["connectionStatus"].asString(), "searching");
    EXPECT_EQ(diagnostic["suggestions"].size(), 1u);
    EXPECT_TRUE(diagnostic["lastWarning"].isNull());
}

TEST(ApiJsonTest, SearchProjection) {
    search::SearchResponse response;
    response.query = "sintel";
    response.page = 2;
    response.limit = 10;
    response.total = 11;
    search::SearchHit hit;
    hit.name = "Sintel 1080p";
    hit.info_hash = std::string(40, 'b');
    hit.size_bytes = 2048;
    hit.size = "2 KB";
    hit.seeders = 9;
    response.results.push_back(hit);
    
    auto json = network::search_to_json(response);
    
    EXPECT_TRUE(json["success"].asBool());
    EXPECT_EQ(json["page"].asUInt64(), 2u);
    EXPECT_EQ(json["total"].asUInt64(), 11u);
    ASSERT_EQ(json["results"].size(), 1u);
    EXPECT_EQ(json["results"][0]["infoHash"].asString(), std::string(40, 'b'));
    EXPECT_EQ(json["results"][0]["sizeBytes"].asUInt64(), 2048u);
    EXPECT_EQ(json["results"][0]["seeders"].asUInt(), 9u);
}

TEST(ApiJsonTest, CompactJsonWriter) {
    Json::Value value(Json::objectValue);
    value["error"] = "Torrent not found";
    EXPECT_EQ(network::HttpResponder::to_json_string(value), "{\"error\":\"Torrent not found\"}");
}
