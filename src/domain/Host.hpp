#pragma once

#include <string>

struct Host {
    virtual ~Host() = default;
    virtual bool isElevated() = 0;
    virtual std::string kernelRelease() = 0;
    virtual bool hasTool(const std::string& name) = 0;
    virtual void reboot() = 0;
};
