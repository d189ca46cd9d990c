#ifndef WATCH_SESSION_HPP
#define WATCH_SESSION_HPP
#include <cstddef>
#include <memory>

#include "event_channel.hpp"
#include "file_watch.hpp"
#include "watch_set.hpp"

/**
 * @brief One watch subscription paired with the channel it delivers into.
 *
 * The session exclusively owns the event source. On destruction the OS
 * watches are released first and the channel is closed afterwards, so no
 * delivery can race with teardown.
 */
class WatchSession {
  public:
    /**
     * @throws WatchSetupError if @p factory cannot watch every path.
     */
    WatchSession(const WatchSet& paths, const EventSourceFactory& factory,
                 std::size_t capacity = EventChannel::kDefaultCapacity);
    ~WatchSession();

    WatchSession(const WatchSession&) = delete;
    WatchSession& operator=(const WatchSession&) = delete;

    const std::shared_ptr<EventChannel>& channel() const { return channel_; }
    const WatchSet& paths() const { return paths_; }
    bool active() const { return source_ && source_->active(); }

  private:
    WatchSet paths_;
    std::shared_ptr<EventChannel> channel_;
    std::unique_ptr<EventSource> source_;
};

#endif // WATCH_SESSION_HPP
