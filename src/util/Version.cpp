#include "util/Version.hpp"

#include <cctype>

std::optional<Version> parseVersion(const std::string& text) {
    Version v {0, 0, 0};
    std::size_t i = 0;
    int parts = 0;
    while (parts < 3 && i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        int n = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            n = n * 10 + (text[i] - '0');
            if (n > 1000000) return std::nullopt;
            ++i;
        }
        v[parts++] = n;
        if (i < text.size() && text[i] == '.')
            ++i;
        else
            break;
    }
    if (parts < 2) return std::nullopt;
    return v;
}

std::string versionStr(const Version& v) {
    return std::to_string(v[0]) + "." + std::to_string(v[1]) + "." + std::to_string(v[2]);
}
