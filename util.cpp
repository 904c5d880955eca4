// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

bool debugEnabled = false;

namespace fan_control
{

namespace fs = std::filesystem;

std::vector<std::string> splitFields(std::string_view text)
{
    std::vector<std::string> results;
    std::string::size_type pos = 0;

    while (pos < text.size())
    {
        while (pos < text.size() &&
               std::isspace(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }

        auto start = pos;
        while (pos < text.size() &&
               !std::isspace(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }

        if (pos > start)
        {
            results.emplace_back(text.substr(start, pos - start));
        }
    }

    return results;
}

std::vector<std::string> splitString(std::string_view text, char delimiter)
{
    std::vector<std::string> results;
    std::string::size_type start = 0;

    for (;;)
    {
        auto n = text.find(delimiter, start);
        if (n == std::string_view::npos)
        {
            results.emplace_back(text.substr(start));
            break;
        }

        results.emplace_back(text.substr(start, n - start));
        start = n + 1;
    }

    return results;
}

std::string trim(std::string_view text)
{
    auto notSpace = [](char c) {
        return !std::isspace(static_cast<unsigned char>(c));
    };

    auto first = std::find_if(text.begin(), text.end(), notSpace);
    auto last = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    if (first >= last)
    {
        return {};
    }

    return std::string(first, last);
}

std::string toUpper(std::string_view text)
{
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string toLower(std::string_view text)
{
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::optional<int> parseDecimal(std::string_view text)
{
    /* from_chars takes a minus sign but not a plus sign. */
    if (text.size() > 1 && text.front() == '+' && text[1] != '-')
    {
        text.remove_prefix(1);
    }

    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }

    return value;
}

static bool isExecutableFile(const fs::path& path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

bool findExecutable(const std::string& name)
{
    if (name.empty())
    {
        return false;
    }

    if (name.find('/') != std::string::npos)
    {
        return isExecutableFile(name);
    }

    const char* env = std::getenv("PATH");
    if (env == nullptr)
    {
        return false;
    }

    for (const auto& dir : splitString(env, ':'))
    {
        /* An empty PATH element means the current directory. */
        fs::path candidate = dir.empty() ? fs::path(".") : fs::path(dir);
        if (isExecutableFile(candidate / name))
        {
            return true;
        }
    }

    return false;
}

} // namespace fan_control
