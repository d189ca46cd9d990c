#include "file_watch.hpp"

#include <array>
#include <cerrno>
#include <system_error>
#include <utility>

#include "logger.hpp"

#if defined(__linux__)
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

#if defined(__linux__)
namespace {
constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_ATTRIB | IN_CLOSE_WRITE | IN_DELETE |
                                IN_DELETE_SELF | IN_MOVED_FROM | IN_MOVED_TO | IN_MOVE_SELF;

ChangeKind classify(uint32_t mask) {
    if (mask & (IN_CREATE | IN_MOVED_TO))
        return ChangeKind::Create;
    if (mask & (IN_DELETE | IN_DELETE_SELF | IN_MOVED_FROM | IN_MOVE_SELF))
        return ChangeKind::Remove;
    if (mask & (IN_MODIFY | IN_ATTRIB | IN_Q_OVERFLOW))
        return ChangeKind::Modify;
    return ChangeKind::Other;
}

std::string errno_message() {
    std::error_code ec(errno, std::system_category());
    return ec.message();
}
} // namespace

FileWatcher::FileWatcher(const WatchSet& paths, std::shared_ptr<EventChannel> channel)
    : paths_(paths), channel_(std::move(channel)) {
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0)
        throw WatchSetupError(paths_.paths().front(), "inotify_init1 failed: " + errno_message());
    if (pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) != 0) {
        std::string msg = "pipe2 failed: " + errno_message();
        release();
        throw WatchSetupError(paths_.paths().front(), msg);
    }
    for (const auto& p : paths_) {
        int wd = inotify_add_watch(inotify_fd_, p.c_str(), kWatchMask);
        if (wd < 0) {
            std::string msg = errno_message();
            release();
            throw WatchSetupError(p, msg);
        }
        watches_[wd] = p;
        log_debug("Watching " + p.string() + " via inotify");
    }
    running_.store(true);
    thread_ = std::thread([this]() { run(); });
}

FileWatcher::~FileWatcher() {
    running_.store(false);
    if (wake_pipe_[1] >= 0) {
        char c = 'x';
        // A full pipe already guarantees a wake-up.
        if (write(wake_pipe_[1], &c, 1) < 0 && errno != EAGAIN)
            log_warning("Failed to wake inotify thread: " + errno_message());
    }
    if (thread_.joinable())
        thread_.join();
    release();
}

bool FileWatcher::active() const { return running_.load(); }

void FileWatcher::release() {
    if (inotify_fd_ >= 0) {
        for (const auto& [wd, path] : watches_)
            inotify_rm_watch(inotify_fd_, wd);
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
    watches_.clear();
    for (int& fd : wake_pipe_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

void FileWatcher::run() {
    alignas(inotify_event) std::array<char, 4096> buf{};
    while (running_.load()) {
        pollfd fds[2] = {{inotify_fd_, POLLIN, 0}, {wake_pipe_[0], POLLIN, 0}};
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            channel_->fail(ChannelError("poll on inotify descriptor failed: " + errno_message()));
            break;
        }
        if (fds[1].revents != 0)
            break;
        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            channel_->fail(ChannelError("inotify descriptor reported an error"));
            break;
        }
        if ((fds[0].revents & POLLIN) == 0)
            continue;
        long len = read(inotify_fd_, buf.data(), buf.size());
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR)
                continue;
            channel_->fail(ChannelError("inotify read failed: " + errno_message()));
            break;
        }
        dispatch(buf.data(), len);
    }
    running_.store(false);
}

void FileWatcher::dispatch(const char* buf, long len) {
    long i = 0;
    while (i < len) {
        const auto* ev = reinterpret_cast<const inotify_event*>(buf + i);
        ChangeEvent change;
        change.kind = classify(ev->mask);
        if (ev->mask & IN_Q_OVERFLOW) {
            // Notifications were lost; report the whole watch set as modified.
            change.paths.insert(paths_.begin(), paths_.end());
        } else {
            auto it = watches_.find(ev->wd);
            if (it != watches_.end()) {
                fs::path affected = it->second;
                if (ev->len > 0 && ev->name[0] != '\0')
                    affected /= ev->name;
                change.paths.insert(affected);
            }
        }
        // Dropped when the consumer is behind or gone; the backend never blocks.
        channel_->try_send(std::move(change));
        i += static_cast<long>(sizeof(inotify_event) + ev->len);
    }
}
#endif

std::unique_ptr<EventSource> make_file_watcher(const WatchSet& paths,
                                               std::shared_ptr<EventChannel> channel) {
#if defined(__linux__)
    return std::make_unique<FileWatcher>(paths, std::move(channel));
#else
    return std::make_unique<PollingWatcher>(paths, std::move(channel));
#endif
}
