#pragma once

#include "domain/ConnectivityProber.hpp"

#include <string>

// Monta a linha de comando de um único eco. Literais IPv6 usam ping6 quando
// existe (iputils antigo, busybox) e `ping -6` caso contrário. O "--" impede
// que um alvo começando com "-" seja lido como opção.
std::string buildPingCommand(const std::string& target, int timeoutSeconds, bool havePing6);

class PingProber : public ConnectivityProber {
public:
    explicit PingProber(int timeoutSeconds = 2);

    bool reachable(const std::string& target) override;

private:
    int timeoutSeconds_;
    bool havePing6_;
};
