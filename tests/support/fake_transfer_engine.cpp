#include "fake_transfer_engine.hpp"
#include <algorithm>
#include <cstdio>
#include <thread>

namespace torrentcast::test_support {

std::uint8_t content_byte(std::size_t file_index, std::uint64_t offset) {
    return static_cast<std::uint8_t>((offset * 31 + file_index * 7 + (offset >> 8)) & 0xff);
}

std::string test_hash(int seed) {
    char buffer[41];
    std::snprintf(buffer, sizeof(buffer), "%040x", seed);
    return std::string(buffer, 40);
}

std::string test_magnet(int seed, const std::string& name) {
    auto magnet = "magnet:?xt=urn:btih:" + test_hash(seed);
    if (!name.empty()) {
        magnet += "&dn=" + name;
    }
    return magnet;
}

// FakeByteReader

FakeByteReader::FakeByteReader(std::shared_ptr<FakeTransferHandle> handle, std::size_t file_index,
                               std::uint64_t start, std::uint64_t end)
    : handle_(std::move(handle)), file_index_(file_index), offset_(start), end_(end), closed_(false) {
    ++handle_->readers_opened_;
}

FakeByteReader::~FakeByteReader() {
    close();
}

std::size_t FakeByteReader::read(std::span<std::uint8_t> buffer) {
    if (closed_ || offset_ > end_ || buffer.empty()) {
        return 0;
    }
    
    if (!handle_->wait_for(offset_, closed_)) {
        if (closed_) {
            return 0;
        }
        throw engine::EngineError("torrent was destroyed");
    }
    
    std::uint64_t limit = end_ + 1;
    {
        std::lock_guard<std::mutex> lock(handle_->mutex_);
        if (handle_->fail_from_ && offset_ >= *handle_->fail_from_) {
            throw engine::EngineError(handle_->fail_message_);
        }
        limit = std::min(limit, handle_->available_);
        if (handle_->fail_from_) {
            limit = std::min(limit, *handle_->fail_from_);
        }
    }
    
    auto count = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), limit - offset_));
    for (std::size_t i = 0; i < count; ++i) {
        buffer[i] = content_byte(file_index_, offset_ + i);
    }
    offset_ += count;
    ++handle_->reads_served_;
    return count;
}

void FakeByteReader::close() {
    if (closed_.exchange(true)) {
        return;
    }
    ++handle_->readers_closed_;
    handle_->notify_all();
}

// FakeTransferHandle

FakeTransferHandle::FakeTransferHandle(std::string info_hash, std::weak_ptr<engine::HandleObserver> observer)
    : info_hash_(std::move(info_hash))
    , observer_(std::move(observer))
    , available_(std::numeric_limits<std::uint64_t>::max())
    , destroyed_(false)
    , priority_throws_(false)
    , readers_opened_(0)
    , readers_closed_(0)
    , destroy_calls_(0)
    , reads_served_(0) {}

std::vector<engine::FileEntry> FakeTransferHandle::files() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_;
}

engine::EngineCounters FakeTransferHandle::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

std::unique_ptr<engine::ByteReader> FakeTransferHandle::open_file_reader(std::size_t file_index,
                                                                        std::uint64_t start,
                                                                        std::uint64_t end) {
    if (destroyed_) {
        throw engine::EngineError("torrent was destroyed");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_failure_) {
            throw engine::EngineError(*open_failure_);
        }
        if (file_index >= files_.size() || start > end || end >= files_[file_index].length) {
            throw engine::EngineError("byte range outside file");
        }
    }
    return std::make_unique<FakeByteReader>(shared_from_this(), file_index, start, end);
}

bool FakeTransferHandle::set_piece_priority(std::uint32_t piece_index, engine::PiecePriority level) {
    if (priority_throws_) {
        throw engine::EngineError("priority rejected");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (counters_.piece_count == 0 || piece_index >= counters_.piece_count) {
        return false;
    }
    priority_calls_.emplace_back(piece_index, level);
    return true;
}

void FakeTransferHandle::destroy(DestroyCallback callback) {
    ++destroy_calls_;
    destroyed_ = true;
    notify_all();
    if (callback) {
        callback("");
    }
}

void FakeTransferHandle::set_files(std::vector<engine::FileEntry> files) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_ = std::move(files);
    counters_.total_length = 0;
    for (const auto& file : files_) {
        counters_.total_length += file.length;
    }
}

void FakeTransferHandle::set_counters(engine::EngineCounters counters) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_ = std::move(counters);
}

void FakeTransferHandle::set_available(std::uint64_t bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        available_ = bytes;
    }
    notify_all();
}

void FakeTransferHandle::fail_reads_from(std::uint64_t offset, std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_from_ = offset;
        fail_message_ = std::move(message);
    }
    notify_all();
}

void FakeTransferHandle::fail_open(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_failure_ = std::move(message);
}

bool FakeTransferHandle::wait_for(std::uint64_t offset, const std::atomic<bool>& closed) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]() {
        return closed || destroyed_ || offset < available_ || (fail_from_ && offset >= *fail_from_);
    });
    return !closed && !destroyed_;
}

void FakeTransferHandle::notify_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

void FakeTransferHandle::emit_announce() {
    if (auto observer = observer_.lock()) observer->on_announce();
}

void FakeTransferHandle::emit_peer_connected() {
    if (auto observer = observer_.lock()) observer->on_peer_connected();
}

void FakeTransferHandle::emit_metadata() {
    auto entries = files();
    if (auto observer = observer_.lock()) observer->on_metadata(entries);
}

void FakeTransferHandle::emit_ready() {
    if (auto observer = observer_.lock()) observer->on_ready();
}

void FakeTransferHandle::emit_error(const std::string& cause, bool fatal) {
    if (auto observer = observer_.lock()) observer->on_error(cause, fatal);
}

void FakeTransferHandle::emit_progress(std::uint64_t bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.received += bytes;
    }
    if (auto observer = observer_.lock()) observer->on_progress(bytes);
}

std::vector<std::pair<std::uint32_t, engine::PiecePriority>> FakeTransferHandle::priority_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return priority_calls_;
}

void FakeTransferHandle::clear_priority_calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    priority_calls_.clear();
}

// FakeTransferEngine

FakeTransferEngine::FakeTransferEngine()
    : create_delay_(0), create_calls_(0), shut_down_(false) {}

std::shared_ptr<engine::TransferHandle> FakeTransferEngine::create(
    const std::string& locator, std::weak_ptr<engine::HandleObserver> observer) {
    ++create_calls_;
    if (create_delay_.count() > 0) {
        std::this_thread::sleep_for(create_delay_);
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    locators_.push_back(locator);
    if (create_failure_) {
        auto message = *create_failure_;
        create_failure_.reset();
        throw engine::EngineError(message, true);
    }
    
    std::string hash;
    auto pos = locator.find("urn:btih:");
    if (pos != std::string::npos) {
        hash = locator.substr(pos + 9, 40);
    }
    auto handle = std::make_shared<FakeTransferHandle>(hash, std::move(observer));
    handles_.push_back(handle);
    return handle;
}

void FakeTransferEngine::fail_next_create(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    create_failure_ = std::move(message);
}

std::vector<std::string> FakeTransferEngine::created_locators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locators_;
}

std::shared_ptr<FakeTransferHandle> FakeTransferEngine::last_handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.empty() ? nullptr : handles_.back();
}

std::shared_ptr<FakeTransferHandle> FakeTransferEngine::handle_for(const std::string& info_hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = handles_.rbegin(); it != handles_.rend(); ++it) {
        if ((*it)->info_hash() == info_hash) {
            return *it;
        }
    }
    return nullptr;
}

}
