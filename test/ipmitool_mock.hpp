#pragma once

#include "interfaces.hpp"

#include <string>
#include <vector>

#include <gmock/gmock.h>

namespace fan_control
{

class IpmiToolMock : public IpmiToolInterface
{
  public:
    ~IpmiToolMock() override = default;

    MOCK_METHOD1(raw, std::string(const std::vector<std::string>&));
    MOCK_METHOD0(sensorList, std::string());
};

} // namespace fan_control
