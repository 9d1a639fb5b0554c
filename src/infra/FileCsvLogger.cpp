#include "infra/FileCsvLogger.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace {
std::string field(std::string s) {
    std::replace(s.begin(), s.end(), '\n', ' ');
    std::replace(s.begin(), s.end(), '\r', ' ');
    std::replace(s.begin(), s.end(), ';', ',');
    return s;
}
}  // namespace

void FileCsvLogger::ensureHeader() {
    std::error_code ec;
    if (std::filesystem::exists(csv_, ec) && std::filesystem::file_size(csv_, ec) > 0) return;
    std::ofstream out(csv_, std::ios::app);
    if (!out) throw std::runtime_error("não foi possível criar " + csv_.string());
    out << "timestamp;adapters;changed;outcome;detail\n";
}

void FileCsvLogger::append(const std::string& timestamp,
                           const std::string& adapters,
                           const std::string& changed,
                           const std::string& outcome,
                           const std::string& detail) {
    ensureHeader();
    std::ofstream out(csv_, std::ios::app);
    if (!out) throw std::runtime_error("não foi possível abrir " + csv_.string());
    out << field(timestamp) << ';' << field(adapters) << ';' << field(changed) << ';' << field(outcome) << ';'
        << field(detail) << "\n";
}
