#ifndef WATCH_SET_HPP
#define WATCH_SET_HPP
#include <cstddef>
#include <filesystem>
#include <vector>

/**
 * @brief Ordered collection of paths registered with an event source.
 *
 * The set is fixed at construction. Paths are compared after lexical
 * normalization and only the first occurrence of a duplicate is kept, so each
 * path is watched exactly once.
 */
class WatchSet {
  public:
    using const_iterator = std::vector<std::filesystem::path>::const_iterator;

    /**
     * @brief Build a watch set from @p paths.
     *
     * @throws std::invalid_argument if @p paths is empty or holds only empty
     *         entries.
     */
    explicit WatchSet(const std::vector<std::filesystem::path>& paths);

    const std::vector<std::filesystem::path>& paths() const { return paths_; }
    std::size_t size() const { return paths_.size(); }
    bool contains(const std::filesystem::path& path) const;

    const_iterator begin() const { return paths_.begin(); }
    const_iterator end() const { return paths_.end(); }

  private:
    std::vector<std::filesystem::path> paths_;
};

#endif // WATCH_SET_HPP
