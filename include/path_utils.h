#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion, PATH lookup, platform defaults
 */

#include <string>

namespace voxlink {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Searches $PATH for an executable named `name`.
 * Returns the full path, or empty string if not found.
 */
std::string find_in_path(const std::string& name);

/**
 * Returns platform-specific default espeak-ng data path when config leaves it empty.
 * Linux: first existing of the usual distro locations
 * macOS: /opt/homebrew/share/espeak-ng-data
 */
std::string default_espeak_data_path();

} // namespace voxlink
