// SPDX-License-Identifier: Apache-2.0

#include "build/buildjson.hpp"

#include "conf.hpp"
#include "errors/exception.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace fan_control
{

void validateJson(const json& data)
{
    if (!data.is_object())
    {
        throw ConfigurationException(
            "TypeError: configuration is not an object");
    }

    auto tool = data.find("ipmitool");
    if (tool != data.end() &&
        (!tool->is_string() || tool->get<std::string>().empty()))
    {
        throw ConfigurationException(
            "TypeError: 'ipmitool' must be a non-empty string");
    }

    auto netFn = data.find("oemNetFn");
    if (netFn != data.end() && !netFn->is_string())
    {
        throw ConfigurationException("TypeError: 'oemNetFn' must be a string");
    }

    auto intf = data.find("interface");
    if (intf != data.end())
    {
        if (!intf->is_array())
        {
            throw ConfigurationException(
                "TypeError: 'interface' must be an array");
        }
        for (const auto& arg : *intf)
        {
            if (!arg.is_string())
            {
                throw ConfigurationException(
                    "TypeError: 'interface' must only hold strings");
            }
        }
    }
}

json parseValidateJson(const std::string& path)
{
    std::ifstream jsonFile(path);
    if (!jsonFile.is_open())
    {
        throw ConfigurationException("Unable to open json file");
    }

    auto data = json::parse(jsonFile, nullptr, false);
    if (data.is_discarded())
    {
        throw ConfigurationException("Invalid json - parse failed");
    }

    /* Check the data. */
    validateJson(data);

    return data;
}

conf::ToolConfig buildToolConfigFromJson(const json& data)
{
    conf::ToolConfig config;

    auto tool = data.find("ipmitool");
    if (tool != data.end())
    {
        tool->get_to(config.tool);
    }

    auto netFn = data.find("oemNetFn");
    if (netFn != data.end())
    {
        netFn->get_to(config.oemNetFn);
    }

    auto intf = data.find("interface");
    if (intf != data.end())
    {
        config.interfaceArgs = intf->get<std::vector<std::string>>();
    }

    return config;
}

std::filesystem::path searchConfigurationPath()
{
    static constexpr auto name = "config.json";

    for (const auto& pathSeg :
         {std::filesystem::current_path(),
          std::filesystem::path{"/etc/rd450x-fan-control"},
          std::filesystem::path{"/usr/share/rd450x-fan-control"}})
    {
        auto file = pathSeg / name;
        if (std::filesystem::exists(file))
        {
            return file;
        }
    }

    return {};
}

} // namespace fan_control
