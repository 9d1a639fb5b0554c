#pragma once

#include <iosfwd>
#include <string>

// Ponto único por onde passa toda ação que altera o sistema.
// Em simulação a ação é descrita e não executada; com confirmação
// interativa, uma recusa tem o mesmo efeito da simulação.
class ChangeGate {
public:
    ChangeGate(bool dryRun, bool confirm, std::istream& in, std::ostream& out)
        : dryRun_(dryRun), confirm_(confirm), in_(in), out_(out) {}

    bool shouldProcess(const std::string& target, const std::string& action);

private:
    bool dryRun_;
    bool confirm_;
    std::istream& in_;
    std::ostream& out_;
};
