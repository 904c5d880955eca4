#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/** Boolean variable controlling whether every ipmitool command line is
 * traced to stderr during this run.
 */
extern bool debugEnabled;

namespace fan_control
{

/*
 * Split on runs of whitespace, dropping empty tokens.
 */
std::vector<std::string> splitFields(std::string_view text);

/*
 * Split on every occurrence of the delimiter, keeping empty pieces.
 */
std::vector<std::string> splitString(std::string_view text, char delimiter);

std::string trim(std::string_view text);

std::string toUpper(std::string_view text);

std::string toLower(std::string_view text);

/*
 * Parse a base 10 integer with an optional sign. The whole string must be
 * consumed; returns nullopt otherwise or on overflow.
 */
std::optional<int> parseDecimal(std::string_view text);

/*
 * Given a tool name, find it on PATH the way execvp() would. A name with a
 * slash is checked as is.
 */
bool findExecutable(const std::string& name);

} // namespace fan_control
