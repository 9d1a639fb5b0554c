#pragma once

#include <string>

struct ConnectivityProber {
    virtual ~ConnectivityProber() = default;
    virtual bool reachable(const std::string& target) = 0;  // um único eco
};
