#include "util/Env.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void loadDotenv(const std::filesystem::path& dotenvPath) {
    std::error_code ec;
    if (!std::filesystem::exists(dotenvPath, ec)) return;

    std::ifstream in(dotenvPath);
    if (!in.is_open()) return;

    std::string line;
    while (std::getline(in, line)) {
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        if (s.rfind("export ", 0) == 0) s = trim(s.substr(7));
        auto pos = s.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(s.substr(0, pos));
        std::string val = trim(s.substr(pos + 1));
        if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                                (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        if (key.empty()) continue;
        setenv(key.c_str(), val.c_str(), 0);  // não sobrescreve se já existe
    }
}

std::string getenvOr(const std::string& key, const std::string& defVal) {
    const char* v = std::getenv(key.c_str());
    return v ? std::string(v) : defVal;
}

int getenvIntOr(const std::string& key, int defVal) {
    std::string v = trim(getenvOr(key, ""));
    if (v.empty()) return defVal;
    std::size_t used = 0;
    int n = std::stoi(v, &used);
    if (used != v.size()) throw std::invalid_argument(key + " não é um inteiro: " + v);
    return n;
}
