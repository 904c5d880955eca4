// SPDX-License-Identifier: Apache-2.0

#include "sensors/report.hpp"

#include "conf.hpp"
#include "sensors/decode.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace fan_control
{

static constexpr auto notAvailable = "N/A";

template <typename Map>
static std::string lookup(const Map& map, std::string_view key)
{
    auto it = map.find(std::string(key));
    if (it == map.end() || it->second.empty())
    {
        return notAvailable;
    }
    return it->second;
}

StatusReport buildStatusReport(const PwmMap& pwms, const SensorTable& table)
{
    StatusReport report;

    report.fans.reserve(conf::fans.size());
    for (const auto& fan : conf::fans)
    {
        report.fans.push_back({std::string(fan.name),
                               lookup(table.rpms, fan.name),
                               lookup(pwms, fan.name)});
    }
    report.thermals = table.thermals;

    return report;
}

StatusReport collectStatus(IpmiToolInterface& tool)
{
    auto pwms = readPwms(tool);
    auto table = parseSensorList(tool.sensorList());

    return buildStatusReport(pwms, table);
}

nlohmann::ordered_json statusToJson(const StatusReport& report)
{
    auto fans = nlohmann::ordered_json::array();
    for (const auto& fan : report.fans)
    {
        fans.push_back(
            {{"name", fan.name}, {"rpm", fan.rpm}, {"pwm", fan.pwm}});
    }

    auto thermals = nlohmann::ordered_json::array();
    for (const auto& thermal : report.thermals)
    {
        thermals.push_back({{"name", thermal.name}, {"value", thermal.value}});
    }

    nlohmann::ordered_json data;
    data["fans"] = fans;
    data["thermals"] = thermals;
    return data;
}

namespace
{

/*
 * Left align within a column of the given width. The degree sign is two
 * bytes but one column wide, so pad by display width instead of setw().
 */
std::string column(const std::string& text, size_t width)
{
    size_t length = 0;
    for (unsigned char c : text)
    {
        if ((c & 0xC0) != 0x80)
        {
            ++length;
        }
    }

    if (length >= width)
    {
        return text;
    }
    return text + std::string(width - length, ' ');
}

constexpr auto fanRule = "+----------------------+-----------------+---------+";
constexpr auto thermalRule =
    "+----------------------+---------------------------+";

} // namespace

void printStatusTable(std::ostream& out, const StatusReport& report)
{
    out << fanRule << "\n";
    out << "| COOLING SYSTEM                                   |\n";
    out << fanRule << "\n";
    out << "| " << column("SENSOR", 20) << " | " << column("RPM", 15) << " | "
        << column("PWM (%)", 7) << " |\n";
    out << fanRule << "\n";
    for (const auto& fan : report.fans)
    {
        out << "| " << column(fan.name, 20) << " | " << column(fan.rpm, 15)
            << " | " << column(fan.pwm, 7) << " |\n";
    }

    out << fanRule << "\n";
    out << "| TEMPERATURE & AIRFLOW                            |\n";
    out << thermalRule << "\n";
    out << "| " << column("SENSOR", 20) << " | " << column("VALUE", 25)
        << " |\n";
    out << thermalRule << "\n";
    for (const auto& thermal : report.thermals)
    {
        out << "| " << column(thermal.name, 20) << " | "
            << column(thermal.value, 25) << " |\n";
    }
    out << thermalRule << "\n";
}

} // namespace fan_control
