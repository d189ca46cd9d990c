#include "file_watch.hpp"

#include <system_error>
#include <utility>

#include "logger.hpp"

namespace fs = std::filesystem;

PollingWatcher::PollingWatcher(const WatchSet& paths, std::shared_ptr<EventChannel> channel,
                               std::chrono::milliseconds interval)
    : paths_(paths), channel_(std::move(channel)),
      interval_(interval.count() > 0 ? interval : kDefaultInterval) {
    for (const auto& p : paths_) {
        std::error_code ec;
        if (!fs::exists(p, ec))
            throw WatchSetupError(p, ec ? ec.message() : "No such file or directory");
        if (fs::is_directory(p, ec)) {
            fs::directory_iterator it(p, ec);
            if (ec)
                throw WatchSetupError(p, ec.message());
        }
        log_debug("Watching " + p.string() + " by polling");
    }
    Snapshot prev = take_snapshot();
    running_.store(true);
    thread_ = std::thread([this, prev]() mutable {
        std::unique_lock<std::mutex> lk(mtx_);
        while (running_.load()) {
            cv_.wait_for(lk, interval_, [this] { return !running_.load(); });
            if (!running_.load())
                break;
            lk.unlock();
            scan(prev);
            lk.lock();
        }
    });
}

PollingWatcher::~PollingWatcher() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_.store(false);
    }
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
}

PollingWatcher::Snapshot PollingWatcher::take_snapshot() const {
    Snapshot snap;
    for (const auto& p : paths_) {
        std::error_code ec;
        auto mtime = fs::last_write_time(p, ec);
        if (ec)
            continue;
        snap[p] = mtime;
        if (!fs::is_directory(p, ec))
            continue;
        for (fs::directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code entry_ec;
            auto entry_time = fs::last_write_time(it->path(), entry_ec);
            if (!entry_ec)
                snap[it->path()] = entry_time;
        }
    }
    return snap;
}

void PollingWatcher::scan(Snapshot& prev) {
    Snapshot cur = take_snapshot();
    auto post = [this](ChangeKind kind, const fs::path& path) {
        ChangeEvent ev;
        ev.kind = kind;
        ev.paths.insert(path);
        channel_->try_send(std::move(ev));
    };
    for (const auto& [path, mtime] : cur) {
        auto it = prev.find(path);
        if (it == prev.end())
            post(ChangeKind::Create, path);
        else if (it->second != mtime)
            post(ChangeKind::Modify, path);
    }
    for (const auto& [path, mtime] : prev) {
        if (!cur.count(path))
            post(ChangeKind::Remove, path);
    }
    prev = std::move(cur);
}

EventSourceFactory make_polling_watcher(std::chrono::milliseconds interval) {
    return [interval](const WatchSet& paths, std::shared_ptr<EventChannel> channel) {
        return std::unique_ptr<EventSource>(
            std::make_unique<PollingWatcher>(paths, std::move(channel), interval));
    };
}
