#pragma once

#include "domain/Report.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

std::string summarize(const RunReport& r);
nlohmann::json reportToJson(const RunReport& r);
void writeReportJson(const std::filesystem::path& path, const RunReport& r);
