#include "torrentcast/network/event_broadcaster.hpp"
#include "torrentcast/core/logger.hpp"
#include <json/writer.h>
#include <vector>

namespace torrentcast::network {

std::optional<std::string> EventBroadcaster::Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !frames_.empty(); });
    if (frames_.empty()) {
        return std::nullopt;
    }
    auto frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void EventBroadcaster::Subscription::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventBroadcaster::Subscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void EventBroadcaster::Subscription::push(const std::string& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (frames_.size() >= MAX_QUEUED_FRAMES) {
            frames_.pop_front();
        }
        frames_.push_back(frame);
    }
    cv_.notify_all();
}

EventBroadcaster::~EventBroadcaster() {
    close();
}

std::shared_ptr<EventBroadcaster::Subscription> EventBroadcaster::subscribe() {
    auto subscription = std::make_shared<Subscription>();
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        subscription->cancel();
        return subscription;
    }
    subscribers_.insert(subscription);
    LOG_DEBUG("Event subscriber added, {} listening", subscribers_.size());
    return subscription;
}

void EventBroadcaster::unsubscribe(const std::shared_ptr<Subscription>& subscription) {
    subscription->cancel();
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(subscription);
}

std::size_t EventBroadcaster::publish(const std::string& event, const Json::Value& data) {
    auto frame = format_frame(event, data);
    
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.assign(subscribers_.begin(), subscribers_.end());
    }
    for (const auto& subscription : targets) {
        subscription->push(frame);
    }
    
    LOG_DEBUG("Event {} sent to {} subscriber(s)", event, targets.size());
    return targets.size();
}

void EventBroadcaster::close() {
    std::set<std::shared_ptr<Subscription>> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        subscribers.swap(subscribers_);
    }
    for (const auto& subscription : subscribers) {
        subscription->cancel();
    }
}

std::size_t EventBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

std::string EventBroadcaster::format_frame(const std::string& event, const Json::Value& data) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return "event: " + event + "\ndata: " + Json::writeString(builder, data) + "\n\n";
}

}
