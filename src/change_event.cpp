#include "change_event.hpp"

bool is_relevant(const ChangeEvent& ev) {
    switch (ev.kind) {
    case ChangeKind::Create:
    case ChangeKind::Modify:
    case ChangeKind::Remove:
        return true;
    case ChangeKind::Other:
        break;
    }
    return false;
}

std::string to_string(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Create:
        return "create";
    case ChangeKind::Modify:
        return "modify";
    case ChangeKind::Remove:
        return "remove";
    case ChangeKind::Other:
        return "other";
    }
    return "other";
}

std::string describe(const ChangeEvent& ev) {
    std::string out = to_string(ev.kind);
    if (ev.paths.empty())
        return out;
    out += ": ";
    bool first = true;
    for (const auto& p : ev.paths) {
        if (!first)
            out += ", ";
        out += p.string();
        first = false;
    }
    return out;
}
