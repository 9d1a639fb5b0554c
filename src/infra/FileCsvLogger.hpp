#pragma once

#include "domain/Logger.hpp"

#include <filesystem>

class FileCsvLogger : public LoggerRepo {
public:
    explicit FileCsvLogger(std::filesystem::path csv) : csv_(std::move(csv)) {}

    void append(const std::string& timestamp,
                const std::string& adapters,
                const std::string& changed,
                const std::string& outcome,
                const std::string& detail) override;

private:
    std::filesystem::path csv_;

    void ensureHeader();
};
