#include "torrentcast/engine/libtorrent_engine.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/logger.hpp"
#include "torrentcast/core/utils.hpp"
#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/announce_entry.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>
#include <boost/shared_array.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>

namespace torrentcast::engine {

namespace lt = libtorrent;

namespace {

std::string to_hex(const lt::sha1_hash& hash) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(hash.size() * 2);
    for (auto byte : hash) {
        auto value = static_cast<unsigned char>(byte);
        out.push_back(digits[value >> 4]);
        out.push_back(digits[value & 0x0f]);
    }
    return out;
}

// One outstanding read_piece request.
struct PieceRead {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    boost::shared_array<char> buffer;
    int size = 0;
    std::string error;
};

class LibtorrentEngine;

class LibtorrentHandle : public TransferHandle, public std::enable_shared_from_this<LibtorrentHandle> {
public:
    LibtorrentHandle(LibtorrentEngine& engine, lt::torrent_handle handle, lt::sha1_hash hash,
                     std::filesystem::path save_path, std::weak_ptr<HandleObserver> observer)
        : engine_(engine)
        , handle_(std::move(handle))
        , hash_(hash)
        , save_path_(std::move(save_path))
        , observer_(std::move(observer))
        , destroyed_(false)
        , metadata_sent_(false) {}
    
    std::string info_hash() const override { return to_hex(hash_); }
    
    std::vector<FileEntry> files() const override {
        std::vector<FileEntry> result;
        auto info = handle_.torrent_file();
        if (!info) {
            return result;
        }
        const auto& storage = info->files();
        for (auto index : storage.file_range()) {
            FileEntry entry;
            entry.name = std::string(storage.file_name(index));
            entry.path = storage.file_path(index);
            entry.length = static_cast<std::uint64_t>(storage.file_size(index));
            result.push_back(std::move(entry));
        }
        return result;
    }
    
    EngineCounters counters() const override;
    
    std::unique_ptr<ByteReader> open_file_reader(std::size_t file_index,
                                                 std::uint64_t start,
                                                 std::uint64_t end) override;
    
    bool set_piece_priority(std::uint32_t piece_index, PiecePriority level) override {
        if (destroyed_) {
            return false;
        }
        auto info = handle_.torrent_file();
        if (!info || piece_index >= static_cast<std::uint32_t>(info->num_pieces())) {
            return false;
        }
        handle_.piece_priority(lt::piece_index_t(static_cast<int>(piece_index)),
                               lt::download_priority_t(static_cast<std::uint8_t>(level)));
        return true;
    }
    
    void destroy(DestroyCallback callback) override;
    bool is_destroyed() const override { return destroyed_; }
    
    // Alert thread entry points.
    void handle_alert(lt::alert* alert);
    void fail_pending(const std::string& reason);
    // Deletes the scratch directory and runs the destroy callback once
    // libtorrent has let go of the torrent.
    void complete_destroy();
    
    const lt::sha1_hash& hash() const { return hash_; }
    const lt::torrent_handle& torrent() const { return handle_; }
    
    std::shared_ptr<PieceRead> request_piece(int piece);
    std::shared_ptr<const lt::torrent_info> torrent_file() const { return handle_.torrent_file(); }
    
private:
    template<typename Fn>
    void notify(Fn&& fn) {
        if (auto observer = observer_.lock()) {
            fn(*observer);
        }
    }
    
    void emit_metadata();
    
    LibtorrentEngine& engine_;
    lt::torrent_handle handle_;
    const lt::sha1_hash hash_;
    const std::filesystem::path save_path_;
    std::weak_ptr<HandleObserver> observer_;
    std::atomic<bool> destroyed_;
    std::atomic<bool> metadata_sent_;
    
    // Guards destroyed_ transitions against new piece requests as well.
    std::mutex reads_mutex_;
    std::multimap<int, std::shared_ptr<PieceRead>> pending_reads_;
    DestroyCallback destroy_callback_;
};

// Sequential reader: resolves each offset to a piece, waits for it through
// set_piece_deadline(alert_when_available) and copies out of the piece buffer.
class LibtorrentReader : public ByteReader {
public:
    LibtorrentReader(std::shared_ptr<LibtorrentHandle> handle, std::size_t file_index,
                     std::uint64_t start, std::uint64_t end)
        : handle_(std::move(handle))
        , file_index_(file_index)
        , offset_(start)
        , end_(end)
        , closed_(false)
        , cached_piece_(-1)
        , cached_size_(0) {}
    
    ~LibtorrentReader() override { close(); }
    
    std::size_t read(std::span<std::uint8_t> buffer) override {
        if (closed_ || offset_ > end_ || buffer.empty()) {
            return 0;
        }
        if (handle_->is_destroyed()) {
            throw EngineError("torrent was destroyed");
        }
        
        auto info = handle_->torrent_file();
        if (!info) {
            throw EngineError("metadata is not available");
        }
        
        auto wanted = std::min<std::uint64_t>(buffer.size(), end_ - offset_ + 1);
        auto request = info->map_file(lt::file_index_t(static_cast<int>(file_index_)),
                                      static_cast<std::int64_t>(offset_),
                                      static_cast<int>(wanted));
        int piece = static_cast<int>(request.piece);
        
        if (piece != cached_piece_) {
            auto pending = handle_->request_piece(piece);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                current_ = pending;
            }
            
            std::unique_lock<std::mutex> lock(pending->mutex);
            pending->cv.wait(lock, [&]() { return pending->done || closed_; });
            if (closed_) {
                return 0;
            }
            if (!pending->error.empty()) {
                throw EngineError("piece " + std::to_string(piece) + " unavailable: " + pending->error);
            }
            cached_piece_ = piece;
            cached_buffer_ = pending->buffer;
            cached_size_ = pending->size;
        }
        
        auto available = std::max(0, cached_size_ - request.start);
        auto count = std::min<std::size_t>(static_cast<std::size_t>(available),
                                           static_cast<std::size_t>(request.length));
        if (count == 0) {
            throw EngineError("short piece " + std::to_string(piece));
        }
        std::memcpy(buffer.data(), cached_buffer_.get() + request.start, count);
        offset_ += count;
        return count;
    }
    
    void close() override {
        if (closed_.exchange(true)) {
            return;
        }
        std::shared_ptr<PieceRead> current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current = current_;
        }
        if (current) {
            std::lock_guard<std::mutex> lock(current->mutex);
            current->cv.notify_all();
        }
    }
    
    bool is_closed() const override { return closed_; }
    
private:
    std::shared_ptr<LibtorrentHandle> handle_;
    const std::size_t file_index_;
    std::uint64_t offset_;
    const std::uint64_t end_;
    std::atomic<bool> closed_;
    
    std::mutex mutex_;
    std::shared_ptr<PieceRead> current_;
    int cached_piece_;
    boost::shared_array<char> cached_buffer_;
    int cached_size_;
};

class LibtorrentEngine : public TransferEngine {
public:
    explicit LibtorrentEngine(EngineConfig config)
        : config_(std::move(config))
        , running_(true)
        , dht_nodes_(0)
    {
        lt::settings_pack settings;
        settings.set_str(lt::settings_pack::listen_interfaces,
                         "0.0.0.0:" + std::to_string(config_.listen_port));
        settings.set_int(lt::settings_pack::connections_limit, config_.max_connections);
        settings.set_bool(lt::settings_pack::enable_dht, true);
        settings.set_int(lt::settings_pack::alert_mask,
                         lt::alert_category::error | lt::alert_category::status |
                         lt::alert_category::storage | lt::alert_category::tracker |
                         lt::alert_category::connect | lt::alert_category::piece_progress |
                         lt::alert_category::dht);
        
        session_ = std::make_unique<lt::session>(settings);
        core::utils::FileUtils::create_directories(config_.scratch_directory);
        
        alert_thread_ = std::thread([this]() { alert_loop(); });
        LOG_INFO("libtorrent engine listening on port {}, scratch directory {}",
                 config_.listen_port, config_.scratch_directory.string());
    }
    
    ~LibtorrentEngine() override { shutdown(); }
    
    std::shared_ptr<TransferHandle> create(const std::string& locator,
                                           std::weak_ptr<HandleObserver> observer) override {
        lt::error_code ec;
        auto params = lt::parse_magnet_uri(locator, ec);
        if (ec) {
            throw EngineError("Invalid magnet URI: " + ec.message(), true);
        }
        
        auto hash = params.info_hashes.get_best();
        auto save_path = config_.scratch_directory / to_hex(hash);
        params.save_path = save_path.string();
        params.flags |= lt::torrent_flags::sequential_download;
        
        lt::torrent_handle torrent;
        try {
            torrent = session_->add_torrent(std::move(params));
        } catch (const lt::system_error& e) {
            throw EngineError(e.what(), true);
        }
        
        auto handle = std::make_shared<LibtorrentHandle>(*this, torrent, hash, save_path, std::move(observer));
        {
            std::lock_guard<std::mutex> lock(handles_mutex_);
            handles_[hash] = handle;
        }
        LOG_DEBUG("libtorrent: added {}", to_hex(hash));
        return handle;
    }
    
    void shutdown() override {
        if (!running_.exchange(false)) {
            return;
        }
        if (alert_thread_.joinable()) {
            alert_thread_.join();
        }
        
        std::vector<std::shared_ptr<LibtorrentHandle>> remaining;
        std::map<lt::sha1_hash, std::shared_ptr<LibtorrentHandle>> removing;
        {
            std::lock_guard<std::mutex> lock(handles_mutex_);
            for (auto& [hash, weak] : handles_) {
                if (auto handle = weak.lock()) {
                    remaining.push_back(handle);
                }
            }
            handles_.clear();
            removing.swap(removing_);
        }
        for (auto& handle : remaining) {
            handle->fail_pending("engine shut down");
        }
        session_.reset();
        
        // No removal alert comes after the session is gone.
        for (auto& [hash, handle] : removing) {
            handle->complete_destroy();
        }
        LOG_INFO("libtorrent engine stopped");
    }
    
    // Keeps the handle alive until its torrent_removed_alert is dispatched.
    void remove(const std::shared_ptr<LibtorrentHandle>& handle) {
        {
            std::lock_guard<std::mutex> lock(handles_mutex_);
            removing_[handle->hash()] = handle;
        }
        try {
            session_->remove_torrent(handle->torrent(), lt::session::delete_files);
        } catch (...) {
            std::lock_guard<std::mutex> lock(handles_mutex_);
            removing_.erase(handle->hash());
            throw;
        }
    }
    
    std::uint32_t dht_nodes() const { return dht_nodes_; }
    bool dht_running() const { return session_ && session_->is_dht_running(); }
    
private:
    std::shared_ptr<LibtorrentHandle> find(const lt::sha1_hash& hash) {
        std::lock_guard<std::mutex> lock(handles_mutex_);
        auto it = handles_.find(hash);
        return it != handles_.end() ? it->second.lock() : nullptr;
    }
    
    // A torrent re-added under the same hash keeps its new entry in handles_.
    std::shared_ptr<LibtorrentHandle> take_removing(const lt::sha1_hash& hash) {
        std::lock_guard<std::mutex> lock(handles_mutex_);
        auto it = removing_.find(hash);
        if (it == removing_.end()) {
            return nullptr;
        }
        auto handle = std::move(it->second);
        removing_.erase(it);
        
        auto live = handles_.find(hash);
        if (live != handles_.end()) {
            auto current = live->second.lock();
            if (!current || current == handle) {
                handles_.erase(live);
            }
        }
        return handle;
    }
    
    void alert_loop() {
        auto last_stats = std::chrono::steady_clock::now();
        while (running_) {
            session_->wait_for_alert(std::chrono::milliseconds(500));
            
            auto now = std::chrono::steady_clock::now();
            if (now - last_stats > std::chrono::seconds(5)) {
                session_->post_dht_stats();
                last_stats = now;
            }
            
            std::vector<lt::alert*> alerts;
            session_->pop_alerts(&alerts);
            for (auto* alert : alerts) {
                try {
                    dispatch(alert);
                } catch (const std::exception& e) {
                    LOG_ERROR("libtorrent alert {} failed: {}", alert->what(), e.what());
                }
            }
        }
    }
    
    void dispatch(lt::alert* alert) {
        if (auto* stats = lt::alert_cast<lt::dht_stats_alert>(alert)) {
            std::uint32_t nodes = 0;
            for (const auto& bucket : stats->routing_table) {
                nodes += static_cast<std::uint32_t>(bucket.num_nodes);
            }
            dht_nodes_ = nodes;
            return;
        }
        if (auto* removed = lt::alert_cast<lt::torrent_removed_alert>(alert)) {
            if (auto handle = take_removing(removed->info_hashes.get_best())) {
                handle->handle_alert(alert);
            }
            return;
        }
        if (auto* torrent = dynamic_cast<lt::torrent_alert*>(alert)) {
            if (!torrent->handle.is_valid()) {
                return;
            }
            if (auto handle = find(torrent->handle.info_hashes().get_best())) {
                handle->handle_alert(alert);
            }
        }
    }
    
    EngineConfig config_;
    std::atomic<bool> running_;
    std::atomic<std::uint32_t> dht_nodes_;
    std::unique_ptr<lt::session> session_;
    std::thread alert_thread_;
    
    std::mutex handles_mutex_;
    std::map<lt::sha1_hash, std::weak_ptr<LibtorrentHandle>> handles_;
    std::map<lt::sha1_hash, std::shared_ptr<LibtorrentHandle>> removing_;
};

EngineCounters LibtorrentHandle::counters() const {
    EngineCounters counters;
    if (destroyed_ || !handle_.is_valid()) {
        return counters;
    }
    
    auto status = handle_.status();
    counters.name = status.name;
    counters.progress = status.progress;
    counters.received = static_cast<std::uint64_t>(std::max<std::int64_t>(0, status.total_wanted_done));
    counters.total_length = static_cast<std::uint64_t>(std::max<std::int64_t>(0, status.total_wanted));
    counters.peer_count = static_cast<std::uint32_t>(std::max(0, status.num_peers));
    counters.download_rate = static_cast<std::uint64_t>(std::max(0, status.download_payload_rate));
    counters.upload_rate = static_cast<std::uint64_t>(std::max(0, status.upload_payload_rate));
    counters.done = status.is_finished;
    if (auto info = handle_.torrent_file()) {
        counters.piece_count = static_cast<std::uint32_t>(info->num_pieces());
    }
    for (const auto& tracker : handle_.trackers()) {
        counters.trackers.push_back(tracker.url);
    }
    counters.dht_enabled = engine_.dht_running();
    counters.dht_nodes = engine_.dht_nodes();
    return counters;
}

std::unique_ptr<ByteReader> LibtorrentHandle::open_file_reader(std::size_t file_index,
                                                              std::uint64_t start,
                                                              std::uint64_t end) {
    if (destroyed_) {
        throw EngineError("torrent was destroyed");
    }
    auto info = handle_.torrent_file();
    if (!info) {
        throw EngineError("metadata is not available yet");
    }
    const auto& storage = info->files();
    if (file_index >= static_cast<std::size_t>(storage.num_files())) {
        throw EngineError("file index " + std::to_string(file_index) + " out of range");
    }
    auto size = static_cast<std::uint64_t>(storage.file_size(lt::file_index_t(static_cast<int>(file_index))));
    if (start > end || end >= size) {
        throw EngineError("byte range outside file");
    }
    return std::make_unique<LibtorrentReader>(shared_from_this(), file_index, start, end);
}

std::shared_ptr<PieceRead> LibtorrentHandle::request_piece(int piece) {
    auto pending = std::make_shared<PieceRead>();
    {
        std::lock_guard<std::mutex> lock(reads_mutex_);
        if (destroyed_) {
            pending->done = true;
            pending->error = "torrent was destroyed";
            return pending;
        }
        pending_reads_.emplace(piece, pending);
    }
    
    lt::piece_index_t index(piece);
    if (handle_.have_piece(index)) {
        handle_.read_piece(index);
    } else {
        handle_.set_piece_deadline(index, 0, lt::torrent_handle::alert_when_available);
    }
    return pending;
}

void LibtorrentHandle::fail_pending(const std::string& reason) {
    std::multimap<int, std::shared_ptr<PieceRead>> pending;
    {
        std::lock_guard<std::mutex> lock(reads_mutex_);
        pending.swap(pending_reads_);
    }
    for (auto& [piece, read] : pending) {
        std::lock_guard<std::mutex> lock(read->mutex);
        read->done = true;
        read->error = reason;
        read->cv.notify_all();
    }
}

void LibtorrentHandle::complete_destroy() {
    DestroyCallback callback;
    {
        std::lock_guard<std::mutex> lock(reads_mutex_);
        callback.swap(destroy_callback_);
    }
    std::error_code ec;
    std::filesystem::remove_all(save_path_, ec);
    if (callback) {
        callback(ec ? "scratch cleanup failed: " + ec.message() : "");
    }
}

void LibtorrentHandle::emit_metadata() {
    if (metadata_sent_.exchange(true)) {
        return;
    }
    auto entries = files();
    notify([&](HandleObserver& observer) { observer.on_metadata(entries); });
    notify([](HandleObserver& observer) { observer.on_ready(); });
}

void LibtorrentHandle::destroy(DestroyCallback callback) {
    bool already_destroyed;
    {
        std::lock_guard<std::mutex> lock(reads_mutex_);
        already_destroyed = destroyed_.exchange(true);
        if (!already_destroyed) {
            destroy_callback_ = std::move(callback);
        }
    }
    if (already_destroyed) {
        if (callback) callback("");
        return;
    }
    
    fail_pending("torrent was destroyed");
    
    try {
        engine_.remove(shared_from_this());
    } catch (const lt::system_error& e) {
        DestroyCallback pending;
        {
            std::lock_guard<std::mutex> lock(reads_mutex_);
            pending.swap(destroy_callback_);
        }
        if (pending) pending(e.what());
    }
}

void LibtorrentHandle::handle_alert(lt::alert* alert) {
    if (auto* read = lt::alert_cast<lt::read_piece_alert>(alert)) {
        std::vector<std::shared_ptr<PieceRead>> ready;
        {
            std::lock_guard<std::mutex> lock(reads_mutex_);
            auto range = pending_reads_.equal_range(static_cast<int>(read->piece));
            for (auto it = range.first; it != range.second; ++it) {
                ready.push_back(it->second);
            }
            pending_reads_.erase(range.first, range.second);
        }
        for (auto& pending : ready) {
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->done = true;
            if (read->error) {
                pending->error = read->error.message();
            } else {
                pending->buffer = read->buffer;
                pending->size = read->size;
            }
            pending->cv.notify_all();
        }
        return;
    }
    
    if (lt::alert_cast<lt::torrent_removed_alert>(alert)) {
        complete_destroy();
        return;
    }
    
    if (destroyed_) {
        return;
    }
    
    if (auto* piece = lt::alert_cast<lt::piece_finished_alert>(alert)) {
        std::uint64_t bytes = 0;
        if (auto info = handle_.torrent_file()) {
            bytes = static_cast<std::uint64_t>(info->piece_size(piece->piece_index));
        }
        notify([bytes](HandleObserver& observer) { observer.on_progress(bytes); });
    } else if (lt::alert_cast<lt::peer_connect_alert>(alert)) {
        notify([](HandleObserver& observer) { observer.on_peer_connected(); });
    } else if (lt::alert_cast<lt::tracker_reply_alert>(alert) ||
               lt::alert_cast<lt::dht_reply_alert>(alert)) {
        notify([](HandleObserver& observer) { observer.on_announce(); });
    } else if (lt::alert_cast<lt::metadata_received_alert>(alert)) {
        emit_metadata();
    } else if (auto* added = lt::alert_cast<lt::add_torrent_alert>(alert)) {
        if (!added->error && added->handle.torrent_file()) {
            emit_metadata();
        }
    } else if (auto* failed = lt::alert_cast<lt::metadata_failed_alert>(alert)) {
        auto message = failed->error.message();
        notify([&](HandleObserver& observer) { observer.on_error("metadata failed: " + message, true); });
    } else if (auto* error = lt::alert_cast<lt::torrent_error_alert>(alert)) {
        auto message = error->error.message();
        notify([&](HandleObserver& observer) { observer.on_error(message, true); });
    } else if (auto* file_error = lt::alert_cast<lt::file_error_alert>(alert)) {
        auto message = std::string(file_error->filename()) + ": " + file_error->error.message();
        notify([&](HandleObserver& observer) { observer.on_error(message, true); });
    } else if (auto* tracker = lt::alert_cast<lt::tracker_error_alert>(alert)) {
        auto message = std::string(tracker->tracker_url()) + ": " + tracker->error.message();
        notify([&](HandleObserver& observer) { observer.on_error(message, false); });
    }
}

}

EngineConfig EngineConfig::from_config(const core::Config& config) {
    EngineConfig result;
    result.max_connections = std::max(1, config.get_int("engine.max_connections", result.max_connections));
    auto port = config.get_int("engine.listen_port", result.listen_port);
    result.listen_port = static_cast<std::uint16_t>(std::clamp(port, 0, 65535));
    
    auto scratch = config.get_string("engine.scratch_directory");
    result.scratch_directory = scratch.empty()
        ? std::filesystem::temp_directory_path() / "torrentcast"
        : core::utils::FileUtils::expand_home(scratch);
    return result;
}

std::shared_ptr<TransferEngine> make_libtorrent_engine(const EngineConfig& config) {
    return std::make_shared<LibtorrentEngine>(config);
}

}
