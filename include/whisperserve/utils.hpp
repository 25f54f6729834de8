// Utility functions.
#pragma once

// stl includes
#include <string>

// local includes
#include "config.hpp"
#include "types.hpp"


namespace whisperserve {

std::string join_path(std::string a, std::string b);

bool exists(std::string path);

// Absolute form of a path, for messages
std::string absolute_path(std::string path);

// Strips leading and trailing whitespace
std::string trim(const std::string &text);

std::string to_lower(std::string text);

std::string to_upper(std::string text);

} // namespace whisperserve
