#ifndef DEBOUNCER_HPP
#define DEBOUNCER_HPP
#include <chrono>
#include <memory>
#include <optional>

#include "change_event.hpp"
#include "event_channel.hpp"

/// Time without a relevant notification after which a burst is considered over.
constexpr std::chrono::milliseconds kDefaultQuietWindow{200};

/**
 * @brief Coalesces bursts of notifications into single change triggers.
 *
 * Uses a trailing-edge time window: after the first create, modify or remove
 * notification the debouncer keeps reading until `quiet_window` passes without
 * another relevant one. Waiting is done with `EventChannel::receive_until()`,
 * so the calling thread sleeps instead of polling. Notifications of any other
 * kind are dropped and never move the clock.
 *
 * The debouncer is the only consumer of its channel. Destroying it closes the
 * channel, after which the producer silently discards deliveries.
 */
class Debouncer {
  public:
    explicit Debouncer(std::shared_ptr<EventChannel> channel,
                       std::chrono::milliseconds quiet_window = kDefaultQuietWindow);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    /**
     * @brief Block until the next burst has settled.
     *
     * @return The settled change: kind of the last relevant notification and
     *         the union of all paths touched by the burst. `std::nullopt` when
     *         the channel was closed.
     * @throws ChannelError if the event source reported a failure.
     */
    std::optional<ChangeEvent> next();

    std::chrono::milliseconds quiet_window() const { return quiet_window_; }

    /** @return Arrival time of the last accepted notification. */
    std::chrono::steady_clock::time_point last_observed() const { return last_observed_; }

  private:
    std::shared_ptr<EventChannel> channel_;
    std::chrono::milliseconds quiet_window_;
    std::chrono::steady_clock::time_point last_observed_{};
};

#endif // DEBOUNCER_HPP
