#include "watch_session.hpp"

#include "logger.hpp"

WatchSession::WatchSession(const WatchSet& paths, const EventSourceFactory& factory,
                           std::size_t capacity)
    : paths_(paths), channel_(std::make_shared<EventChannel>(capacity)) {
    source_ = factory ? factory(paths_, channel_) : make_file_watcher(paths_, channel_);
    if (!source_)
        throw WatchSetupError(paths_.paths().front(), "event source factory returned nothing");
    log_debug("Watch session started for " + std::to_string(paths_.size()) + " path(s)");
}

WatchSession::~WatchSession() {
    source_.reset();
    channel_->close();
    if (std::size_t lost = channel_->dropped(); lost > 0)
        log_debug("Watch session dropped " + std::to_string(lost) + " notification(s)");
}
