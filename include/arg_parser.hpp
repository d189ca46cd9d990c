#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (`--flag`, `--opt value` and
 * `--opt=value`) and single-character aliases (`-h`, `-w path`, `-wpath`).
 * A long or short option takes the following argument as its value unless
 * that argument itself starts with `-` or the option is a switch. Switches
 * never consume the next argument and only take a value in the `--flag=value`
 * form.
 * Options may be repeated; every value is kept in order. A bare `--` ends
 * option parsing and everything after it is collected as the trailing
 * command.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value seen per option
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< All values of repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments before `--`
    std::vector<std::string> trailing_;      ///< Arguments after `--`
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::set<std::string> known_flags_;      ///< List of accepted flags
    std::map<char, std::string> short_map_;  ///< Mapping of short to long flags
    std::set<std::string> switches_;         ///< Flags that never take a value

    bool accept(const std::string& key);
    void record(const std::string& key, const std::string& val);
    void parse_short(const std::string& arg, int argc, char* argv[], int& i);

  public:
    /**
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Flags considered valid. If empty, all flags are
     *        treated as known.
     * @param short_map Mapping from single character options to their long
     *        form.
     * @param switches Long flags that never consume the following argument.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& switches = {});

    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @return Value of @p opt or an empty string if missing. */
    std::string get_option(const std::string& opt) const;

    /** @return Every value given for @p opt, in command line order. */
    std::vector<std::string> get_all_options(const std::string& opt) const;

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    /** @return Arguments following the `--` terminator. */
    const std::vector<std::string>& trailing() const { return trailing_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
