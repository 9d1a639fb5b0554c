#include "util/Time.hpp"

#include <ctime>

namespace {
std::string formatNow(const char* fmt) {
    std::time_t t = std::time(nullptr);
    std::tm tm {};
    localtime_r(&t, &tm);
    char buff[40];
    std::size_t n = std::strftime(buff, sizeof(buff), fmt, &tm);
    return std::string(buff, n);
}
}  // namespace

std::string nowStr() {
    return formatNow("%Y-%m-%d %H:%M:%S");
}

// Sem setlocale o programa fica no locale "C", então %a e %b saem em inglês.
std::string nowMailDateStr() {
    return formatNow("%a, %d %b %Y %H:%M:%S %z");
}
