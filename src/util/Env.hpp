#pragma once

#include <filesystem>
#include <string>

void loadDotenv(const std::filesystem::path& dotenvPath);
std::string getenvOr(const std::string& key, const std::string& defVal);
int getenvIntOr(const std::string& key, int defVal);
std::string trim(const std::string& s);
