#pragma once

#include <json/value.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace torrentcast::network {

// Fan-out of server-sent events. Each subscriber owns a bounded queue of
// formatted frames; a subscriber that falls behind loses its oldest frames.
class EventBroadcaster {
public:
    static constexpr std::size_t MAX_QUEUED_FRAMES = 256;
    
    class Subscription {
    public:
        // Next queued frame, or nullopt after the timeout or once closed with
        // nothing left to deliver.
        std::optional<std::string> next(std::chrono::milliseconds timeout);
        void cancel();
        bool closed() const;
        
    private:
        friend class EventBroadcaster;
        
        void push(const std::string& frame);
        
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<std::string> frames_;
        bool closed_ = false;
    };
    
    EventBroadcaster() = default;
    ~EventBroadcaster();
    
    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;
    
    // After close() the returned subscription is already closed.
    std::shared_ptr<Subscription> subscribe();
    void unsubscribe(const std::shared_ptr<Subscription>& subscription);
    
    // Returns the number of subscribers the event was queued for.
    std::size_t publish(const std::string& event, const Json::Value& data);
    
    // Closes every subscription and refuses new ones.
    void close();
    
    std::size_t subscriber_count() const;
    
    // "event: <name>\ndata: <compact json>\n\n"
    static std::string format_frame(const std::string& event, const Json::Value& data);
    
private:
    mutable std::mutex mutex_;
    std::set<std::shared_ptr<Subscription>> subscribers_;
    bool closed_ = false;
};

}
