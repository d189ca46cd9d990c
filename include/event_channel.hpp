#ifndef EVENT_CHANNEL_HPP
#define EVENT_CHANNEL_HPP
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <variant>

#include "change_event.hpp"
#include "watch_errors.hpp"

using WatchMessage = std::variant<ChangeEvent, ChannelError>;

/**
 * @brief Bounded single-producer single-consumer queue of watch messages.
 *
 * The producer is the notification backend thread, which must never block:
 * `try_send()` drops the message when the queue is full or the receiver has
 * gone away. A fatal backend failure goes through `fail()` instead, which is
 * never dropped for lack of room. The consumer blocks on a condition variable.
 */
class EventChannel {
  public:
    static constexpr std::size_t kDefaultCapacity = 16;

    enum class RecvStatus { Message, Timeout, Closed };

    explicit EventChannel(std::size_t capacity = kDefaultCapacity);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * @brief Enqueue @p msg without blocking.
     *
     * @return `false` if the message was dropped because the channel is full
     *         or closed.
     */
    bool try_send(WatchMessage msg);

    /**
     * @brief Report a fatal backend failure, ignoring the capacity limit.
     *
     * @return `false` only if the channel is closed.
     */
    bool fail(ChannelError err);

    /** @brief Wait for the next message; returns `Closed` once drained. */
    RecvStatus receive(WatchMessage& out);

    /**
     * @brief Wait for the next message until @p deadline.
     *
     * Messages already queued when the channel was closed are still delivered.
     */
    RecvStatus receive_until(std::chrono::steady_clock::time_point deadline, WatchMessage& out);

    /** @brief Release the receiving end and wake every waiter. */
    void close();

    bool closed() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    /** @return Number of messages discarded by `try_send()`. */
    std::size_t dropped() const;

  private:
    RecvStatus pop_locked(WatchMessage& out);

    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<WatchMessage> queue_;
    bool closed_ = false;
    std::size_t dropped_ = 0;
};

#endif // EVENT_CHANNEL_HPP
