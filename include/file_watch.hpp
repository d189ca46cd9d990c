#ifndef FILE_WATCH_HPP
#define FILE_WATCH_HPP
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "event_channel.hpp"
#include "watch_set.hpp"

/**
 * @brief Live subscription to filesystem notifications for a watch set.
 *
 * Implementations register one non-recursive watch per path when constructed
 * and deliver every notification into the channel they were given. Destroying
 * the source releases the watches.
 */
class EventSource {
  public:
    virtual ~EventSource() = default;

    /** @brief Check if the background delivery thread is still running. */
    virtual bool active() const = 0;

    virtual const WatchSet& paths() const = 0;
};

using EventSourceFactory = std::function<std::unique_ptr<EventSource>(
    const WatchSet&, std::shared_ptr<EventChannel>)>;

#if defined(__linux__)
/**
 * @brief inotify based event source.
 *
 * A background thread sleeps in `poll()` on the inotify descriptor and a
 * wake-up pipe, classifies each raw notification and pushes it with
 * `EventChannel::try_send()`.
 *
 * @throws WatchSetupError from the constructor when inotify cannot be
 *         initialized or any path cannot be watched.
 */
class FileWatcher : public EventSource {
  public:
    FileWatcher(const WatchSet& paths, std::shared_ptr<EventChannel> channel);
    ~FileWatcher() override;

    bool active() const override;
    const WatchSet& paths() const override { return paths_; }

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

  private:
    void run();
    void dispatch(const char* buf, long len);
    void release();

    WatchSet paths_;
    std::shared_ptr<EventChannel> channel_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    int inotify_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};
    std::map<int, std::filesystem::path> watches_;
};
#endif

/**
 * @brief Portable event source that compares modification times.
 *
 * Each watched file, and the direct entries of each watched directory, is
 * snapshotted every @p interval; differences become create, modify or remove
 * events.
 *
 * @throws WatchSetupError from the constructor if a path does not exist.
 */
class PollingWatcher : public EventSource {
  public:
    static constexpr std::chrono::milliseconds kDefaultInterval{500};

    PollingWatcher(const WatchSet& paths, std::shared_ptr<EventChannel> channel,
                   std::chrono::milliseconds interval = kDefaultInterval);
    ~PollingWatcher() override;

    bool active() const override { return running_.load(); }
    const WatchSet& paths() const override { return paths_; }

    PollingWatcher(const PollingWatcher&) = delete;
    PollingWatcher& operator=(const PollingWatcher&) = delete;

  private:
    using Snapshot = std::map<std::filesystem::path, std::filesystem::file_time_type>;

    Snapshot take_snapshot() const;
    void scan(Snapshot& prev);

    WatchSet paths_;
    std::shared_ptr<EventChannel> channel_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
    std::thread thread_;
};

/**
 * @brief Create the native event source for this platform.
 *
 * Uses inotify on Linux and falls back to `PollingWatcher` elsewhere.
 */
std::unique_ptr<EventSource> make_file_watcher(const WatchSet& paths,
                                               std::shared_ptr<EventChannel> channel);

/** @brief Factory producing `PollingWatcher` instances with @p interval. */
EventSourceFactory make_polling_watcher(std::chrono::milliseconds interval);

#endif // FILE_WATCH_HPP
