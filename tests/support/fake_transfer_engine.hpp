#pragma once

#include "torrentcast/engine/transfer_engine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace torrentcast::test_support {

// Deterministic content: byte i of file f.
std::uint8_t content_byte(std::size_t file_index, std::uint64_t offset);

class FakeTransferHandle;

class FakeByteReader : public engine::ByteReader {
public:
    FakeByteReader(std::shared_ptr<FakeTransferHandle> handle, std::size_t file_index,
                   std::uint64_t start, std::uint64_t end);
    ~FakeByteReader() override;
    
    std::size_t read(std::span<std::uint8_t> buffer) override;
    void close() override;
    bool is_closed() const override { return closed_; }
    
private:
    std::shared_ptr<FakeTransferHandle> handle_;
    std::size_t file_index_;
    std::uint64_t offset_;
    std::uint64_t end_;
    std::atomic<bool> closed_;
};

// Scriptable handle. Data is available up to a watermark; reads past it block
// until the watermark moves, the reader closes or the handle is destroyed.
class FakeTransferHandle : public engine::TransferHandle,
                           public std::enable_shared_from_this<FakeTransferHandle> {
public:
    FakeTransferHandle(std::string info_hash, std::weak_ptr<engine::HandleObserver> observer);
    
    std::string info_hash() const override { return info_hash_; }
    std::vector<engine::FileEntry> files() const override;
    engine::EngineCounters counters() const override;
    
    std::unique_ptr<engine::ByteReader> open_file_reader(std::size_t file_index,
                                                         std::uint64_t start,
                                                         std::uint64_t end) override;
    bool set_piece_priority(std::uint32_t piece_index, engine::PiecePriority level) override;
    
    void destroy(DestroyCallback callback) override;
    bool is_destroyed() const override { return destroyed_; }
    
    // Scripting
    void set_files(std::vector<engine::FileEntry> files);
    void set_counters(engine::EngineCounters counters);
    void set_available(std::uint64_t bytes);
    void fail_reads_from(std::uint64_t offset, std::string message = "simulated read failure");
    void fail_open(std::string message);
    void fail_priority_with_exception(bool enabled) { priority_throws_ = enabled; }
    
    void emit_announce();
    void emit_peer_connected();
    void emit_metadata();
    void emit_ready();
    void emit_error(const std::string& cause, bool fatal);
    void emit_progress(std::uint64_t bytes);
    
    // Observation
    std::vector<std::pair<std::uint32_t, engine::PiecePriority>> priority_calls() const;
    void clear_priority_calls();
    int readers_opened() const { return readers_opened_; }
    int readers_closed() const { return readers_closed_; }
    int destroy_calls() const { return destroy_calls_; }
    std::size_t reads_served() const { return reads_served_; }
    
private:
    friend class FakeByteReader;
    
    // Blocks until [offset] is available. Returns false when the reader should stop.
    bool wait_for(std::uint64_t offset, const std::atomic<bool>& closed);
    void notify_all();
    
    const std::string info_hash_;
    std::weak_ptr<engine::HandleObserver> observer_;
    
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<engine::FileEntry> files_;
    engine::EngineCounters counters_;
    std::uint64_t available_;
    std::optional<std::uint64_t> fail_from_;
    std::string fail_message_;
    std::optional<std::string> open_failure_;
    std::vector<std::pair<std::uint32_t, engine::PiecePriority>> priority_calls_;
    
    std::atomic<bool> destroyed_;
    std::atomic<bool> priority_throws_;
    std::atomic<int> readers_opened_;
    std::atomic<int> readers_closed_;
    std::atomic<int> destroy_calls_;
    std::atomic<std::size_t> reads_served_;
};

class FakeTransferEngine : public engine::TransferEngine {
public:
    FakeTransferEngine();
    
    std::shared_ptr<engine::TransferHandle> create(const std::string& locator,
                                                   std::weak_ptr<engine::HandleObserver> observer) override;
    void shutdown() override { shut_down_ = true; }
    
    void fail_next_create(std::string message);
    void set_create_delay(std::chrono::milliseconds delay) { create_delay_ = delay; }
    
    int create_calls() const { return create_calls_; }
    bool is_shut_down() const { return shut_down_; }
    std::vector<std::string> created_locators() const;
    std::shared_ptr<FakeTransferHandle> last_handle() const;
    std::shared_ptr<FakeTransferHandle> handle_for(const std::string& info_hash) const;
    
private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<FakeTransferHandle>> handles_;
    std::vector<std::string> locators_;
    std::optional<std::string> create_failure_;
    std::chrono::milliseconds create_delay_;
    std::atomic<int> create_calls_;
    std::atomic<bool> shut_down_;
};

// 40-hex info hash built from a small seed, for readable tests.
std::string test_hash(int seed);
std::string test_magnet(int seed, const std::string& name = "");

}
