#ifndef WATCH_ERRORS_HPP
#define WATCH_ERRORS_HPP
#include <filesystem>
#include <stdexcept>
#include <string>

/**
 * @brief Raised when a path of the watch set cannot be registered.
 *
 * Fatal: it propagates out of session construction and is never retried.
 */
class WatchSetupError : public std::runtime_error {
  public:
    WatchSetupError(const std::filesystem::path& path, const std::string& reason)
        : std::runtime_error("Failed to watch " + path.string() + ": " + reason), path_(path) {}

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

/**
 * @brief Raised when the notification backend fails while a session is live.
 */
class ChannelError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

#endif // WATCH_ERRORS_HPP
