#pragma once

#include <string>
#include <vector>

namespace fan_control
{

/*
 * An IpmiToolInterface runs the management controller's CLI client. Both
 * calls block until the client exits.
 */
class IpmiToolInterface
{
  public:
    IpmiToolInterface() = default;

    virtual ~IpmiToolInterface() = default;

    /** @brief Issue a raw OEM command.
     *
     * @param[in] args - Arguments following the OEM group byte.
     * @return Combined stdout and stderr of the client.
     *
     * @warning Throws IpmiToolException if the client fails.
     */
    virtual std::string raw(const std::vector<std::string>& args) = 0;

    /** @brief Enumerate every sensor as pipe delimited rows.
     *
     * @return Stdout of the client.
     *
     * @warning Throws IpmiToolException if the client fails.
     */
    virtual std::string sensorList() = 0;
};

} // namespace fan_control
