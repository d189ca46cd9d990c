#include "event_channel.hpp"

#include <utility>

EventChannel::EventChannel(std::size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

bool EventChannel::try_send(WatchMessage msg) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_ || queue_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        queue_.push_back(std::move(msg));
    }
    cv_.notify_one();
    return true;
}

bool EventChannel::fail(ChannelError err) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) {
            ++dropped_;
            return false;
        }
        queue_.push_back(std::move(err));
    }
    cv_.notify_one();
    return true;
}

EventChannel::RecvStatus EventChannel::pop_locked(WatchMessage& out) {
    if (queue_.empty())
        return RecvStatus::Closed;
    out = std::move(queue_.front());
    queue_.pop_front();
    return RecvStatus::Message;
}

EventChannel::RecvStatus EventChannel::receive(WatchMessage& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return !queue_.empty() || closed_; });
    return pop_locked(out);
}

EventChannel::RecvStatus
EventChannel::receive_until(std::chrono::steady_clock::time_point deadline, WatchMessage& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (!cv_.wait_until(lk, deadline, [this] { return !queue_.empty() || closed_; }))
        return RecvStatus::Timeout;
    return pop_locked(out);
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

std::size_t EventChannel::dropped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dropped_;
}
