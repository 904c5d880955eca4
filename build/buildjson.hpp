#pragma once

#include "conf.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

using json = nlohmann::json;

namespace fan_control
{

/**
 * Given a json configuration file, parse and validate it.
 *
 * The json data must be an object. Every key is optional, but when present
 * "ipmitool" must be a non-empty string, "oemNetFn" a string and
 * "interface" an array of strings.
 *
 * @warning Throws ConfigurationException on any failure.
 */
json parseValidateJson(const std::string& path);

/**
 * Given validated json, build the tool configuration. Missing keys keep
 * their defaults.
 */
conf::ToolConfig buildToolConfigFromJson(const json& data);

/**
 * Find the first config.json in the working directory, then the system
 * directories. Returns an empty path if there is none.
 */
std::filesystem::path searchConfigurationPath();

} // namespace fan_control
