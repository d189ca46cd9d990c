#include "watch_set.hpp"

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

// lexically_normal() keeps a trailing separator, so "src/" would not match "src".
static fs::path normalize(const fs::path& p) {
    fs::path norm = p.lexically_normal();
    if (!norm.has_filename() && norm.has_relative_path())
        norm = norm.parent_path();
    return norm;
}

WatchSet::WatchSet(const std::vector<fs::path>& paths) {
    for (const auto& p : paths) {
        if (p.empty())
            continue;
        fs::path norm = normalize(p);
        if (!contains(norm))
            paths_.push_back(norm);
    }
    if (paths_.empty())
        throw std::invalid_argument("Watch set requires at least one path");
}

bool WatchSet::contains(const fs::path& path) const {
    fs::path norm = normalize(path);
    return std::find(paths_.begin(), paths_.end(), norm) != paths_.end();
}
