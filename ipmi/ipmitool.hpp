#pragma once

#include "conf.hpp"
#include "interfaces.hpp"

#include <string>
#include <vector>

namespace fan_control
{

/*
 * Runs the ipmitool client as a child process, without a shell in between.
 */
class IpmiTool : public IpmiToolInterface
{
  public:
    explicit IpmiTool(const conf::ToolConfig& config) : _config(config) {}

    std::string raw(const std::vector<std::string>& args) override;
    std::string sensorList() override;

  private:
    /*
     * Build the full argv: tool, interface arguments, then the command.
     */
    std::vector<std::string> commandLine(
        const std::vector<std::string>& args) const;

    /*
     * Run the client and collect its stdout, and its stderr too if
     * mergeStderr is set. Returns the exit status via status, or -1 if the
     * child was killed by a signal.
     */
    std::string run(const std::vector<std::string>& argv, bool mergeStderr,
                    int* status);

    conf::ToolConfig _config;
};

/*
 * Join an argv into a printable command line.
 */
std::string joinCommandLine(const std::vector<std::string>& argv);

} // namespace fan_control
