#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>

#include "server_config.hpp"

namespace streamguard {

// Returns the value of an environment variable, or nullopt when unset.
using EnvReader = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
EnvReader process_env();

/**
 * Applies environment overrides to config. A variable that is set but does
 * not parse (number, boolean) is collected; all of them are reported
 * together.
 * @throws ConfigError naming every unparsable variable.
 */
void apply_env(ServerConfig& config, const EnvReader& env);

/**
 * Validates the server settings and the embedded security policy.
 * @throws ConfigError listing every violated key.
 */
void validate(const ServerConfig& config);

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> split_csv(const std::string& value);

std::optional<bool> parse_bool(const std::string& value);
std::optional<int64_t> parse_int(const std::string& value);

}
