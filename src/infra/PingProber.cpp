#include "infra/PingProber.hpp"

#include "util/Process.hpp"

#include <arpa/inet.h>

namespace {
bool isIpv6Literal(const std::string& target) {
    in6_addr addr {};
    return inet_pton(AF_INET6, target.c_str(), &addr) == 1;
}
}  // namespace

std::string buildPingCommand(const std::string& target, int timeoutSeconds, bool havePing6) {
    std::string args = " -c 1 -W " + std::to_string(timeoutSeconds) + " -- " + shellQuote(target);
    if (isIpv6Literal(target)) return (havePing6 ? "ping6" : "ping -6") + args;
    return "ping" + args;
}

PingProber::PingProber(int timeoutSeconds)
    : timeoutSeconds_(timeoutSeconds < 1 ? 1 : timeoutSeconds), havePing6_(hasCmd("ping6")) {}

bool PingProber::reachable(const std::string& target) {
    std::string out;
    return runCmdCapture(buildPingCommand(target, timeoutSeconds_, havePing6_), out) == 0;
}
