#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalars become `--key` entries in @p opts. A sequence of scalars
 * is joined with newlines, and a nested map (such as a `logging:` section) is
 * flattened so its children become `--child` entries.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by their flag name.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as load_yaml_config(): arrays are joined with newlines and
 * nested objects are flattened one level.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
