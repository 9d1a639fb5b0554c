#include "app/ChangeGate.hpp"

#include "util/Env.hpp"

#include <istream>
#include <ostream>

bool ChangeGate::shouldProcess(const std::string& target, const std::string& action) {
    if (dryRun_) {
        out_ << "🧪 [SIMULAÇÃO] " << action << " em " << target << "\n";
        return false;
    }
    if (!confirm_) return true;

    out_ << "❓ " << action << " em " << target << "? [s/N] " << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) answer.clear();
    answer = trim(answer);
    bool yes = !answer.empty() && (answer[0] == 's' || answer[0] == 'S' || answer[0] == 'y' || answer[0] == 'Y');
    if (!yes) {
        out_ << "⏭️  Recusado: " << action << " em " << target << " (tratado como simulação)\n";
    }
    return yes;
}
