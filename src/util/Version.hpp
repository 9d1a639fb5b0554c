#pragma once

#include <array>
#include <optional>
#include <string>

using Version = std::array<int, 3>;

// "5.15.0-91-generic" -> {5, 15, 0}; "6.1" -> {6, 1, 0}
std::optional<Version> parseVersion(const std::string& text);
std::string versionStr(const Version& v);
