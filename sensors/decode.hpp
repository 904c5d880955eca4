#pragma once

#include "interfaces.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fan_control
{

/* Fan name to "<N>%". */
using PwmMap = std::map<std::string, std::string>;

struct ThermalReading
{
    std::string name;
    std::string value;

    bool operator==(const ThermalReading& rhs) const = default;
};

/*
 * What a sensor list yields once parsed: tachometer readings keyed by sensor
 * name, and temperature/airflow readings in the order they were listed.
 */
struct SensorTable
{
    std::map<std::string, std::string> rpms;
    std::vector<ThermalReading> thermals;
};

/*
 * Convert a hex register value such as "32" into "50%". Anything that is
 * not a base 16 integer yields "N/A". The value is not clamped to 100.
 */
std::string hexToPercent(std::string_view hex);

/*
 * Map the OEM PWM read response tokens onto fan names. Token 0 is a header
 * byte, tokens 1..6 follow the fan table. A response with fewer than seven
 * tokens gives an empty map.
 */
PwmMap decodePwms(const std::vector<std::string>& tokens);

/*
 * Parse the pipe delimited output of "sensor list".
 */
SensorTable parseSensorList(std::string_view output);

/*
 * Issue the OEM PWM read and decode it. A failed read is logged and gives
 * an empty map, so callers report the fans as unavailable.
 */
PwmMap readPwms(IpmiToolInterface& tool);

} // namespace fan_control
