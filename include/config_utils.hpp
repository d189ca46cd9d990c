#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

/// Scalar config values keyed by their command line flag (`--debounce`).
using ConfigOptions = std::map<std::string, std::string>;
/// Sequence config values keyed by their command line flag (`--watch`).
using ConfigLists = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level keys map to `--key`. Nested maps are treated as categories and
 * their keys are flattened to the same level, so `logging: {log-level: debug}`
 * yields `--log-level`. Sequences of scalars are stored in @p lists.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving scalar option values.
 * @param lists Map receiving sequence option values.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, ConfigOptions& opts, ConfigLists& lists,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as `load_yaml_config()` with objects in place of maps
 * and arrays in place of sequences.
 */
bool load_json_config(const std::string& path, ConfigOptions& opts, ConfigLists& lists,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
