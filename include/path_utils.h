#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and the default config location
 */

#include <string>

namespace rtvoice {

/**
 * Expands leading ~ to $HOME. ~user is not supported.
 * Returns path unchanged if path is empty or no expansion applies.
 */
std::string expand_path(const std::string& path);

/**
 * Config file to load: the explicit argument if given, else $RTVOICE_CONFIG,
 * else "config/config.json". The result is ~-expanded.
 */
std::string resolve_config_path(const std::string& explicit_path);

} // namespace rtvoice
