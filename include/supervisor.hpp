#ifndef SUPERVISOR_HPP
#define SUPERVISOR_HPP
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "change_event.hpp"
#include "debouncer.hpp"
#include "event_channel.hpp"
#include "file_watch.hpp"
#include "watch_session.hpp"
#include "watch_set.hpp"

/**
 * @brief A unit of supervised work.
 *
 * The body runs on its own thread. Throwing reports a task failure; the stop
 * token is signalled when the task should wind down.
 */
using Task = std::function<void(std::stop_token)>;

/**
 * @brief Produces a fresh task for every (re)start.
 */
class TaskFactory {
  public:
    virtual ~TaskFactory() = default;
    virtual Task build() = 0;
};

/** @brief Adapts a plain callable returning a `Task` to `TaskFactory`. */
class FunctionTaskFactory : public TaskFactory {
  public:
    explicit FunctionTaskFactory(std::function<Task()> fn) : fn_(std::move(fn)) {}
    Task build() override { return fn_ ? fn_() : Task{}; }

  private:
    std::function<Task()> fn_;
};

enum class SupervisorState { Running, WaitingForChange, Restarting };

std::string to_string(SupervisorState state);

struct SupervisorOptions {
    std::chrono::milliseconds quiet_window = kDefaultQuietWindow;
    /// Signal the stop token of a task superseded by a change.
    bool cancel_on_restart = false;
    std::size_t channel_capacity = EventChannel::kDefaultCapacity;
    /// Event source used for the session; the native watcher when empty.
    EventSourceFactory source_factory;
    /// Invoked on the supervising thread for every state transition.
    std::function<void(SupervisorState)> on_state;
};

/**
 * @brief Runs a task and restarts it after it exits or the watched paths change.
 *
 * Construction opens the watch session and starts a consumer thread that owns
 * the debouncer and republishes settled changes. `run()` then races the
 * running task against those changes:
 *
 * - a change settling first restarts the task right away;
 * - the task finishing first (successfully or not) parks the supervisor in
 *   `WaitingForChange` until the next settled change.
 *
 * Task failures are logged and never leave `run()`. Watch failures do.
 */
class Supervisor {
  public:
    /**
     * @throws WatchSetupError if the watch session cannot be established. No
     *         task is started in that case.
     * @throws std::invalid_argument if @p factory is null.
     */
    Supervisor(const WatchSet& paths, std::shared_ptr<TaskFactory> factory,
               SupervisorOptions opts = {});
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * @brief Supervise until stopped.
     *
     * Returns normally only after `stop()`.
     *
     * @throws ChannelError when notification delivery fails.
     */
    void run();

    /** @brief Make `run()` return. Safe to call from any thread. */
    void stop();

    SupervisorState state() const { return state_.load(); }

    /** @return Number of restarts performed so far. */
    std::size_t restart_count() const { return restarts_.load(); }

  private:
    struct TaskSlot {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void debounce_loop();
    void launch();
    void restart();
    void retire_current();
    void reap_orphans();
    void set_state(SupervisorState state);
    void post_finished(std::uint64_t generation);

    std::shared_ptr<TaskFactory> factory_;
    SupervisorOptions opts_;
    WatchSession session_;
    Debouncer debouncer_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::uint64_t seq_ = 0;
    std::uint64_t generation_ = 0;
    std::uint64_t change_seq_ = 0;
    std::uint64_t finish_seq_ = 0;
    std::optional<ChangeEvent> pending_change_;
    std::exception_ptr fatal_;
    bool stop_requested_ = false;
    bool started_ = false;

    std::atomic<SupervisorState> state_{SupervisorState::Running};
    std::atomic<std::size_t> restarts_{0};
    TaskSlot current_;
    std::vector<TaskSlot> orphans_;
    std::jthread debounce_thread_;
};

/**
 * @brief Watch @p paths and keep the task produced by @p factory running.
 *
 * Convenience wrapper that constructs a `Supervisor` and runs it. There is no
 * normal exit: the call ends only when a fatal watch error propagates.
 */
void watch(const WatchSet& paths, std::shared_ptr<TaskFactory> factory,
           SupervisorOptions opts = {});

#endif // SUPERVISOR_HPP
