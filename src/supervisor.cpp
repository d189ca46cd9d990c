#include "supervisor.hpp"

#include <stdexcept>
#include <utility>

#include "logger.hpp"

std::string to_string(SupervisorState state) {
    switch (state) {
    case SupervisorState::Running:
        return "running";
    case SupervisorState::WaitingForChange:
        return "waiting-for-change";
    case SupervisorState::Restarting:
        return "restarting";
    }
    return "unknown";
}

Supervisor::Supervisor(const WatchSet& paths, std::shared_ptr<TaskFactory> factory,
                       SupervisorOptions opts)
    : factory_(std::move(factory)), opts_(std::move(opts)),
      session_(paths, opts_.source_factory, opts_.channel_capacity),
      debouncer_(session_.channel(), opts_.quiet_window) {
    if (!factory_)
        throw std::invalid_argument("Supervisor requires a task factory");
    debounce_thread_ = std::jthread([this] { debounce_loop(); });
}

Supervisor::~Supervisor() {
    stop();
    session_.channel()->close();
    if (debounce_thread_.joinable())
        debounce_thread_.join();
    // Remaining tasks are asked to stop and joined by their jthread.
    current_.thread.request_stop();
    for (auto& slot : orphans_)
        slot.thread.request_stop();
}

void Supervisor::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

void Supervisor::debounce_loop() {
    try {
        while (true) {
            std::optional<ChangeEvent> change = debouncer_.next();
            std::lock_guard<std::mutex> lk(mtx_);
            if (!change) {
                if (!stop_requested_ && !fatal_)
                    fatal_ = std::make_exception_ptr(ChannelError("Notification channel closed"));
                cv_.notify_all();
                return;
            }
            if (pending_change_) {
                pending_change_->kind = change->kind;
                pending_change_->paths.insert(change->paths.begin(), change->paths.end());
            } else {
                pending_change_ = std::move(change);
                change_seq_ = ++seq_;
            }
            cv_.notify_all();
        }
    } catch (...) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!fatal_)
            fatal_ = std::current_exception();
        cv_.notify_all();
    }
}

void Supervisor::post_finished(std::uint64_t generation) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (generation != generation_ || finish_seq_ != 0)
            return;
        finish_seq_ = ++seq_;
    }
    cv_.notify_all();
}

void Supervisor::set_state(SupervisorState state) {
    state_.store(state);
    log_debug("Supervisor state: " + to_string(state));
    if (opts_.on_state)
        opts_.on_state(state);
}

void Supervisor::launch() {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        generation = ++generation_;
        finish_seq_ = 0;
    }
    Task task;
    try {
        task = factory_->build();
        if (!task)
            log_error("Task factory returned an empty task");
    } catch (const std::exception& e) {
        log_error(std::string("Failed to create task: ") + e.what());
    }
    if (!task) {
        post_finished(generation);
        return;
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    current_.done = done;
    current_.thread = std::jthread(
        [this, generation, done, task = std::move(task)](std::stop_token st) {
            try {
                task(st);
            } catch (const std::exception& e) {
                log_error(e.what());
            } catch (...) {
                log_error("Task failed with an unknown error");
            }
            done->store(true);
            post_finished(generation);
        });
}

void Supervisor::retire_current() {
    if (!current_.thread.joinable())
        return;
    if (current_.done && current_.done->load()) {
        current_.thread.join();
    } else {
        if (opts_.cancel_on_restart)
            current_.thread.request_stop();
        orphans_.push_back(std::move(current_));
    }
    current_ = TaskSlot{};
}

void Supervisor::reap_orphans() {
    for (auto it = orphans_.begin(); it != orphans_.end();) {
        if (it->done && it->done->load()) {
            if (it->thread.joinable())
                it->thread.join();
            it = orphans_.erase(it);
        } else {
            ++it;
        }
    }
}

void Supervisor::restart() {
    set_state(SupervisorState::Restarting);
    retire_current();
    reap_orphans();
    restarts_.fetch_add(1);
    launch();
    set_state(SupervisorState::Running);
}

void Supervisor::run() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (started_)
            throw std::logic_error("Supervisor is already running");
        started_ = true;
        if (stop_requested_)
            return;
    }
    launch();
    set_state(SupervisorState::Running);

    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
        cv_.wait(lk, [this] {
            return stop_requested_ || fatal_ || change_seq_ != 0 ||
                   (state_.load() == SupervisorState::Running && finish_seq_ != 0);
        });
        if (stop_requested_)
            return;
        if (fatal_) {
            std::exception_ptr err = fatal_;
            lk.unlock();
            std::rethrow_exception(err);
        }
        bool finished_first = state_.load() == SupervisorState::Running && finish_seq_ != 0 &&
                              (change_seq_ == 0 || finish_seq_ < change_seq_);
        if (finished_first) {
            lk.unlock();
            log_info("Process terminated! Restarting on file change...");
            set_state(SupervisorState::WaitingForChange);
            lk.lock();
            continue;
        }
        ChangeEvent change = std::move(*pending_change_);
        pending_change_.reset();
        change_seq_ = 0;
        lk.unlock();
        log_info("File change detected! Restarting!");
        log_debug("Settled change: " + describe(change));
        restart();
        lk.lock();
    }
}

void watch(const WatchSet& paths, std::shared_ptr<TaskFactory> factory, SupervisorOptions opts) {
    Supervisor supervisor(paths, std::move(factory), std::move(opts));
    supervisor.run();
}
