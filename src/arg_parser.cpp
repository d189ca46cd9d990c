#include "arg_parser.hpp"

static bool looks_like_option(const char* arg) { return arg[0] == '-' && arg[1] != '\0'; }

ArgParser::ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags,
                     const std::map<char, std::string>& short_map,
                     const std::set<std::string>& switches)
    : known_flags_(known_flags), short_map_(short_map), switches_(switches) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            for (++i; i < argc; ++i)
                trailing_.emplace_back(argv[i]);
            break;
        }
        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                std::string key = arg.substr(0, eq);
                if (accept(key))
                    record(key, arg.substr(eq + 1));
            } else if (!switches_.count(arg) && i + 1 < argc && !looks_like_option(argv[i + 1])) {
                std::string val = argv[++i];
                if (accept(arg))
                    record(arg, val);
            } else if (accept(arg)) {
                flags_.insert(arg);
            }
        } else if (arg.size() >= 2 && arg[0] == '-' && short_map_.count(arg[1])) {
            parse_short(arg, argc, argv, i);
        } else {
            positional_.push_back(arg);
        }
    }
}

bool ArgParser::accept(const std::string& key) {
    if (known_flags_.empty() || known_flags_.count(key))
        return true;
    unknown_flags_.push_back(key);
    return false;
}

void ArgParser::record(const std::string& key, const std::string& val) {
    flags_.insert(key);
    options_[key] = val;
    multi_options_[key].push_back(val);
}

// Handles stacked switches (`-gs`), attached values (`-wsrc`, `-w=src`) and a
// value in the following argument (`-w src`).
void ArgParser::parse_short(const std::string& arg, int argc, char* argv[], int& i) {
    size_t eq = arg.find('=');
    std::string before = arg.substr(1, eq != std::string::npos ? eq - 1 : std::string::npos);
    std::string after = eq != std::string::npos ? arg.substr(eq + 1) : "";

    for (size_t j = 0; j < before.size();) {
        char c = before[j];
        if (!short_map_.count(c))
            break;
        std::string key = short_map_.at(c);
        std::string val;
        bool last = (j == before.size() - 1);
        if (switches_.count(key)) {
            if (last && !after.empty()) {
                if (accept(key))
                    record(key, after);
                break;
            }
        } else if (last) {
            if (!after.empty())
                val = after;
            else if (i + 1 < argc && !looks_like_option(argv[i + 1]))
                val = argv[++i];
        } else if (!short_map_.count(before[j + 1])) {
            val = before.substr(j + 1) + after;
            j = before.size();
        }
        if (!val.empty()) {
            if (accept(key))
                record(key, val);
            break;
        }
        if (accept(key))
            flags_.insert(key);
        ++j;
    }
}

std::string ArgParser::get_option(const std::string& opt) const {
    auto it = options_.find(opt);
    if (it != options_.end())
        return it->second;
    return "";
}

std::vector<std::string> ArgParser::get_all_options(const std::string& opt) const {
    auto it = multi_options_.find(opt);
    if (it != multi_options_.end())
        return it->second;
    return {};
}
