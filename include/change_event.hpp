#ifndef CHANGE_EVENT_HPP
#define CHANGE_EVENT_HPP
#include <filesystem>
#include <set>
#include <string>

enum class ChangeKind { Create, Modify, Remove, Other };

/**
 * @brief A single filesystem notification as delivered by an event source.
 *
 * Two events compare equal when both the kind and the affected paths match.
 */
struct ChangeEvent {
    ChangeKind kind = ChangeKind::Other;
    std::set<std::filesystem::path> paths;

    bool operator==(const ChangeEvent&) const = default;
};

/**
 * @brief Check whether an event should count as a change.
 *
 * Only create, modify and remove notifications are relevant; everything else
 * is ignored by the debouncer.
 */
bool is_relevant(const ChangeEvent& ev);

/** @return Lower-case name of @p kind ("create", "modify", ...). */
std::string to_string(ChangeKind kind);

/** @return Short human-readable summary such as `modify: a.txt, b.txt`. */
std::string describe(const ChangeEvent& ev);

#endif // CHANGE_EVENT_HPP
