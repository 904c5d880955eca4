#pragma once

#include <exception>
#include <string>

namespace fan_control
{

class IpmiToolException : public std::exception
{
  public:
    explicit IpmiToolException(const std::string& message) : message(message)
    {}

    const char* what() const noexcept override
    {
        return message.c_str();
    }

  private:
    std::string message;
};

class ConfigurationException : public std::exception
{
  public:
    explicit ConfigurationException(const std::string& message) :
        message(message)
    {}

    const char* what() const noexcept override
    {
        return message.c_str();
    }

  private:
    std::string message;
};

} // namespace fan_control
