/**
 * @file string_util.hpp
 * @brief Small string helpers shared by the parsers.
 */
#pragma once
#include "odtdeploy/common/common.hpp"

namespace odtdeploy
{

/// ASCII lower-case copy.
std::string to_lower_ascii(std::string_view text);

/// Case-insensitive (ASCII) equality.
bool iequals(std::string_view a, std::string_view b);

/// Case-insensitive (ASCII) substring test.
bool icontains(std::string_view haystack, std::string_view needle);

/// Copy without leading/trailing whitespace.
std::string trim(std::string_view text);

/**
 * @brief Split on a delimiter, trimming each piece and dropping empty pieces.
 */
std::vector<std::string> split_list(std::string_view text, char delimiter);

} // namespace odtdeploy
