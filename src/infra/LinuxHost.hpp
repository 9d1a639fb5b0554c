#pragma once

#include "domain/Host.hpp"

class LinuxHost : public Host {
public:
    bool isElevated() override;
    std::string kernelRelease() override;
    bool hasTool(const std::string& name) override;
    void reboot() override;
};
