#include "debouncer.hpp"

#include <utility>

#include "logger.hpp"

Debouncer::Debouncer(std::shared_ptr<EventChannel> channel,
                     std::chrono::milliseconds quiet_window)
    : channel_(std::move(channel)), quiet_window_(quiet_window) {
    if (quiet_window_.count() < 0)
        quiet_window_ = kDefaultQuietWindow;
}

Debouncer::~Debouncer() {
    if (channel_)
        channel_->close();
}

std::optional<ChangeEvent> Debouncer::next() {
    std::optional<ChangeEvent> pending;
    WatchMessage msg;
    while (true) {
        EventChannel::RecvStatus status;
        if (pending)
            status = channel_->receive_until(last_observed_ + quiet_window_, msg);
        else
            status = channel_->receive(msg);

        if (status == EventChannel::RecvStatus::Closed)
            return std::nullopt;
        if (status == EventChannel::RecvStatus::Timeout)
            return pending;

        if (auto* err = std::get_if<ChannelError>(&msg))
            throw *err;
        auto& ev = std::get<ChangeEvent>(msg);
        if (!is_relevant(ev)) {
            log_debug("Ignoring notification: " + describe(ev));
            continue;
        }
        last_observed_ = std::chrono::steady_clock::now();
        if (!pending) {
            pending = std::move(ev);
        } else {
            pending->kind = ev.kind;
            pending->paths.insert(ev.paths.begin(), ev.paths.end());
        }
    }
}
