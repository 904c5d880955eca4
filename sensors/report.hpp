#pragma once

#include "interfaces.hpp"
#include "sensors/decode.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace fan_control
{

struct FanReading
{
    std::string name;
    std::string rpm;
    std::string pwm;

    bool operator==(const FanReading& rhs) const = default;
};

struct StatusReport
{
    /* Always one entry per fan table row, in table order. */
    std::vector<FanReading> fans;
    std::vector<ThermalReading> thermals;
};

/*
 * Merge PWM and sensor list readings. A fan missing from either source
 * reports "N/A" for that column.
 */
StatusReport buildStatusReport(const PwmMap& pwms, const SensorTable& table);

/*
 * Gather a full report from the controller.
 *
 * @warning Throws IpmiToolException if the sensor list cannot be read. A
 * failed PWM read only degrades the PWM column.
 */
StatusReport collectStatus(IpmiToolInterface& tool);

nlohmann::ordered_json statusToJson(const StatusReport& report);

/*
 * Render the cooling and the temperature/airflow tables.
 */
void printStatusTable(std::ostream& out, const StatusReport& report);

} // namespace fan_control
