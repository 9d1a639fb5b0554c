#pragma once

#include <string>

struct LoggerRepo {
    virtual ~LoggerRepo() = default;
    virtual void append(const std::string& timestamp,
                        const std::string& adapters,
                        const std::string& changed,
                        const std::string& outcome,
                        const std::string& detail) = 0;
};
