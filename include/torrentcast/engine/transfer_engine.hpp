#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace torrentcast::engine {

// Raised by engine implementations. Never crosses the session/gateway boundary.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message, bool fatal = false)
        : std::runtime_error(message), fatal_(fatal) {}
    
    bool is_fatal() const { return fatal_; }
    
private:
    bool fatal_;
};

struct FileEntry {
    std::string name;
    std::string path;
    std::uint64_t length = 0;
};

struct EngineCounters {
    std::string name;
    double progress = 0.0;
    std::uint64_t received = 0;
    std::uint64_t total_length = 0;
    std::uint32_t peer_count = 0;
    std::uint64_t download_rate = 0;
    std::uint64_t upload_rate = 0;
    std::uint32_t piece_count = 0;
    std::uint32_t dht_nodes = 0;
    bool dht_enabled = true;
    std::vector<std::string> trackers;
    bool done = false;
};

enum class PiecePriority {
    DONT_DOWNLOAD = 0,
    LOW = 1,
    NORMAL = 4,
    HIGH = 7
};

// Engine callbacks. May be invoked from any engine thread.
class HandleObserver {
public:
    virtual ~HandleObserver() = default;
    
    virtual void on_announce() = 0;
    virtual void on_peer_connected() = 0;
    virtual void on_metadata(const std::vector<FileEntry>& files) = 0;
    virtual void on_ready() = 0;
    virtual void on_error(const std::string& cause, bool fatal) = 0;
    virtual void on_progress(std::uint64_t bytes_delta) = 0;
};

// Sequential reader over an inclusive byte range of one file. read() blocks
// until at least one byte is locally available, returns 0 at the end of the
// range, and throws EngineError when the data can no longer be produced.
// close() is idempotent, may be called from any thread and wakes a blocked
// read(), which then returns 0.
class ByteReader {
public:
    virtual ~ByteReader() = default;
    
    virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;
    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

class TransferHandle {
public:
    using DestroyCallback = std::function<void(const std::string& error)>;
    
    virtual ~TransferHandle() = default;
    
    virtual std::string info_hash() const = 0;
    virtual std::vector<FileEntry> files() const = 0;
    virtual EngineCounters counters() const = 0;
    
    virtual std::unique_ptr<ByteReader> open_file_reader(std::size_t file_index,
                                                         std::uint64_t start,
                                                         std::uint64_t end) = 0;
    
    // Returns false when the piece cannot be resolved yet.
    virtual bool set_piece_priority(std::uint32_t piece_index, PiecePriority level) = 0;
    
    // Fire-and-forget; callback receives an empty string on success.
    virtual void destroy(DestroyCallback callback) = 0;
    virtual bool is_destroyed() const = 0;
};

class TransferEngine {
public:
    virtual ~TransferEngine() = default;
    
    // locator is already normalised to a magnet URI. Throws EngineError.
    virtual std::shared_ptr<TransferHandle> create(const std::string& locator,
                                                   std::weak_ptr<HandleObserver> observer) = 0;
    
    virtual void shutdown() = 0;
};

}
