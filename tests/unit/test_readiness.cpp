#include <gtest/gtest.h>
#include "torrentcast/session/readiness.hpp"
#include <functional>

using namespace torrentcast::session;
using torrentcast::engine::FileEntry;

namespace {

std::vector<FileEntry> playable_files() {
    return {
        {"poster.jpg", "Film/poster.jpg", 2048},
        {"film.mkv", "Film/film.mkv", 700 * 1024 * 1024},
    };
}

}

TEST(ReadinessMachineTest, StartsInitializing) {
    ReadinessMachine machine;
    EXPECT_EQ(machine.state(), SessionState::INITIALIZING);
    EXPECT_FALSE(machine.files_known());
    EXPECT_FALSE(machine.selected_file().has_value());
    EXPECT_FALSE(machine.is_terminal());
}

TEST(ReadinessMachineTest, ProgressThenMetadataReachesReady) {
    ReadinessMachine machine;
    
    EXPECT_TRUE(machine.on_progress_signal());
    EXPECT_EQ(machine.state(), SessionState::METADATA_LOADING);
    EXPECT_FALSE(machine.on_progress_signal());
    
    EXPECT_TRUE(machine.on_metadata(playable_files()));
    EXPECT_EQ(machine.state(), SessionState::READY);
    ASSERT_TRUE(machine.selected_file().has_value());
    EXPECT_EQ(machine.selected_file()->index, 1u);
    EXPECT_EQ(machine.selected_file()->mime_type, "video/x-matroska");
}

TEST(ReadinessMachineTest, MetadataInInitializingSkipsForward) {
    ReadinessMachine machine;
    EXPECT_TRUE(machine.on_metadata(playable_files()));
    EXPECT_EQ(machine.state(), SessionState::READY);
}

TEST(ReadinessMachineTest, NoPlayableFileFails) {
    ReadinessMachine machine;
    machine.on_progress_signal();
    
    EXPECT_TRUE(machine.on_metadata({{"album.flac", "album.flac", 100}}));
    EXPECT_EQ(machine.state(), SessionState::ERROR);
    EXPECT_TRUE(machine.files_known());
    ASSERT_TRUE(machine.error_reason().has_value());
    EXPECT_NE(machine.error_reason()->find("No playable video file"), std::string::npos);
    ASSERT_TRUE(machine.failure().has_value());
    EXPECT_EQ(machine.failure()->kind, FailureKind::NO_PLAYABLE_FILE);
}

TEST(ReadinessMachineTest, FatalErrorKeepsEngineReason) {
    ReadinessMachine machine;
    EXPECT_FALSE(machine.failure().has_value());
    machine.on_metadata(playable_files());
    
    EXPECT_TRUE(machine.on_fatal_error("disk write failed"));
    EXPECT_EQ(machine.state(), SessionState::ERROR);
    ASSERT_TRUE(machine.failure().has_value());
    EXPECT_EQ(machine.failure()->kind, FailureKind::ENGINE);
    EXPECT_EQ(machine.failure()->reason, "disk write failed");
    
    EXPECT_TRUE(machine.on_destroyed("user request"));
    EXPECT_FALSE(machine.failure().has_value());
}

TEST(ReadinessMachineTest, SelectedFileIsComputedOnce) {
    ReadinessMachine machine;
    machine.on_metadata(playable_files());
    
    auto changed = machine.on_metadata({{"other.mp4", "other.mp4", 1}});
    EXPECT_FALSE(changed);
    EXPECT_EQ(machine.selected_file()->entry.name, "film.mkv");
}

TEST(ReadinessMachineTest, NeverMovesBackwards) {
    ReadinessMachine machine;
    machine.on_metadata(playable_files());
    
    EXPECT_FALSE(machine.on_progress_signal());
    EXPECT_EQ(machine.state(), SessionState::READY);
    
    EXPECT_TRUE(machine.on_fatal_error("disk full"));
    EXPECT_EQ(machine.state(), SessionState::ERROR);
    EXPECT_FALSE(machine.on_metadata(playable_files()));
    EXPECT_FALSE(machine.on_fatal_error("again"));
    EXPECT_EQ(*machine.error_reason(), "disk full");
    
    EXPECT_TRUE(machine.on_destroyed("idle"));
    EXPECT_EQ(machine.state(), SessionState::DESTROYED);
    EXPECT_FALSE(machine.on_destroyed("twice"));
    EXPECT_FALSE(machine.on_fatal_error("late"));
    EXPECT_TRUE(machine.is_terminal());
}

TEST(ReadinessMachineTest, RandomEventSequencesAreMonotonic) {
    const std::vector<std::function<void(ReadinessMachine&)>> events = {
        [](ReadinessMachine& m) { m.on_progress_signal(); },
        [](ReadinessMachine& m) { m.on_metadata(playable_files()); },
        [](ReadinessMachine& m) { m.on_metadata({{"a.txt", "a.txt", 1}}); },
        [](ReadinessMachine& m) { m.on_fatal_error("boom"); },
        [](ReadinessMachine& m) { m.on_destroyed("gone"); },
    };
    
    unsigned seed = 12345;
    for (int round = 0; round < 200; ++round) {
        ReadinessMachine machine;
        auto previous = machine.state();
        for (int step = 0; step < 12; ++step) {
            seed = seed * 1103515245u + 12345u;
            events[(seed >> 16) % events.size()](machine);
            auto current = machine.state();
            EXPECT_GE(static_cast<int>(current), static_cast<int>(previous));
            previous = current;
        }
    }
}
