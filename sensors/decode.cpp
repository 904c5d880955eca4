// SPDX-License-Identifier: Apache-2.0

#include "sensors/decode.hpp"

#include "conf.hpp"
#include "errors/exception.hpp"
#include "ipmi/oemcmds.hpp"
#include "util.hpp"

#include <phosphor-logging/log.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fan_control
{

using namespace phosphor::logging;

static constexpr auto notAvailable = "N/A";
static constexpr auto disconnected = "na";
static constexpr auto celsiusUnit = "degrees C";
static constexpr auto celsiusSymbol = "°C";

std::string hexToPercent(std::string_view hex)
{
    if (hex.size() > 1 && hex.front() == '+' && hex[1] != '-')
    {
        hex.remove_prefix(1);
    }

    int64_t value = 0;
    auto [ptr, ec] =
        std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (hex.empty() || ec != std::errc() || ptr != hex.data() + hex.size())
    {
        return notAvailable;
    }

    return std::to_string(value) + "%";
}

PwmMap decodePwms(const std::vector<std::string>& tokens)
{
    PwmMap pwms;

    if (tokens.size() <= conf::fans.size())
    {
        return pwms;
    }

    for (const auto& fan : conf::fans)
    {
        pwms.emplace(fan.name, hexToPercent(tokens[fan.index]));
    }

    return pwms;
}

PwmMap readPwms(IpmiToolInterface& tool)
{
    try
    {
        return decodePwms(readPwmRegisters(tool));
    }
    catch (const IpmiToolException& e)
    {
        log<level::ERR>("Unable to read fan PWM values",
                        entry("WHAT=%s", e.what()));
    }

    return {};
}

/*
 * Numbers are printed without decimals, anything else is kept verbatim.
 */
static std::string formatMagnitude(const std::string& value)
{
    if (value.empty())
    {
        return value;
    }

    /* from_chars takes a minus sign but not a plus sign, and no hex. */
    std::string_view text(value);
    if (text.size() > 1 && text.front() == '+' && text[1] != '-')
    {
        text.remove_prefix(1);
    }

    double number = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     number, std::chars_format::general);
    if (ec != std::errc() || ptr != text.data() + text.size())
    {
        return value;
    }

    if (std::isnan(number))
    {
        return "NaN";
    }
    if (std::isinf(number))
    {
        return number > 0 ? "+Inf" : "-Inf";
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << number;
    return oss.str();
}

SensorTable parseSensorList(std::string_view output)
{
    SensorTable table;

    for (const auto& line : splitString(output, '\n'))
    {
        if (trim(line).empty())
        {
            continue;
        }

        auto fields = splitString(line, '|');
        if (fields.size() < 3)
        {
            continue;
        }

        auto name = trim(fields[0]);
        auto value = trim(fields[1]);
        auto unit = trim(fields[2]);
        auto upper = toUpper(line);

        bool isFan = upper.find("FAN") != std::string::npos;

        /* A disconnected sensor only matters for the fan table. */
        if (value == disconnected && !isFan)
        {
            continue;
        }

        if (isFan && upper.find("POWER") == std::string::npos)
        {
            if (value != disconnected)
            {
                table.rpms[name] = value + " RPM";
            }
        }
        else if (upper.find("TEMP") != std::string::npos ||
                 upper.find("AIRFLOW") != std::string::npos)
        {
            auto magnitude = formatMagnitude(value);
            if (unit == celsiusUnit)
            {
                unit = celsiusSymbol;
            }

            /* Absent probes report a flat zero. */
            if (magnitude == "0" && unit == celsiusSymbol)
            {
                continue;
            }

            table.thermals.push_back({name, magnitude + " " + unit});
        }
    }

    return table;
}

} // namespace fan_control
