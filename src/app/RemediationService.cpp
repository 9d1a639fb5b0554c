#include "app/RemediationService.hpp"

#include "app/RunSummary.hpp"
#include "util/Time.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iterator>
#include <iostream>
#include <sstream>

namespace {
bool sameValue(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

std::string joinNames(const std::vector<std::string>& names) {
    std::ostringstream oss;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) oss << ',';
        oss << names[i];
    }
    return oss.str();
}
}  // namespace

std::optional<RunOutcome> RemediationService::checkEnvironment() {
    if (!host_->isElevated()) {
        std::cerr << "❌ Execute como root (sudo): alterar offload e reiniciar adaptadores exige privilégios.\n";
        report_.detail = "privilégios insuficientes";
        return RunOutcome::InsufficientPrivilege;
    }

    std::string release = host_->kernelRelease();
    auto kernel = parseVersion(release);
    if (!kernel || *kernel < opt_.minKernel) {
        std::cerr << "❌ Kernel " << (release.empty() ? "desconhecido" : release)
                  << " não suportado (mínimo " << versionStr(opt_.minKernel) << ").\n";
        report_.detail = "kernel não suportado: " + release;
        return RunOutcome::UnsupportedEnvironment;
    }

    for (const auto& tool : opt_.requiredTools) {
        if (!host_->hasTool(tool)) {
            std::cerr << "❌ Ferramenta obrigatória ausente: " << tool << "\n";
            report_.detail = "ferramenta ausente: " + tool;
            return RunOutcome::UnsupportedEnvironment;
        }
    }
    return std::nullopt;
}

std::vector<Adapter> RemediationService::discoverActiveAdapters() {
    std::vector<Adapter> all;
    try {
        all = net_->listAdapters();
    } catch (const std::exception& e) {
        std::cerr << "⚠️  Falha ao listar adaptadores: " << e.what() << "\n";
        return {};
    }

    std::vector<Adapter> active;
    std::copy_if(all.begin(), all.end(), std::back_inserter(active), [](const Adapter& a) {
        return a.physical && a.status == LinkStatus::Up;
    });
    for (const auto& a : active) std::cout << "📡 Adaptador ativo: " << a.name << "\n";
    return active;
}

bool RemediationService::setPropertyIfNeeded(const Adapter& adapter,
                                             const std::string& property,
                                             const std::string& desired) {
    PropertyAction act{adapter.name, property, "", desired, "", ""};

    std::optional<AdvancedProperty> current;
    try {
        current = net_->getProperty(adapter.name, property);
    } catch (const std::exception& e) {
        std::cerr << "⚠️  Não foi possível ler " << property << " em " << adapter.name << ": " << e.what() << "\n";
        act.result = "failed";
        act.error = e.what();
        report_.properties.push_back(act);
        return false;
    }

    if (!current) {
        std::cout << "ℹ️  " << property << " não disponível em " << adapter.name << ", ignorando.\n";
        act.result = "absent";
        report_.properties.push_back(act);
        return false;
    }

    act.before = current->value;
    if (sameValue(current->value, desired)) {
        std::cout << "✅ " << adapter.name << ": " << property << " já está em " << current->value << ".\n";
        act.result = "compliant";
        report_.properties.push_back(act);
        return false;
    }

    if (current->fixed) {
        std::cerr << "⚠️  " << adapter.name << ": " << property << " = " << current->value
                  << " é fixo no driver, não pode ser alterado.\n";
        act.result = "fixed";
        report_.properties.push_back(act);
        return false;
    }

    if (!gate_.shouldProcess(adapter.name, "Alterar " + property + " de " + current->value + " para " + desired)) {
        act.result = "simulated";
        report_.properties.push_back(act);
        return false;
    }

    try {
        net_->setProperty(adapter.name, property, desired);
    } catch (const std::exception& e) {
        std::cerr << "⚠️  Falha ao alterar " << property << " em " << adapter.name << ": " << e.what() << "\n";
        act.result = "failed";
        act.error = e.what();
        report_.properties.push_back(act);
        return false;
    }

    std::cout << "🔧 " << adapter.name << ": " << property << " " << current->value << " -> " << desired << "\n";
    act.result = "changed";
    report_.properties.push_back(act);
    return true;
}

bool RemediationService::probe(const std::vector<std::string>& targets) {
    lastReached_.clear();
    for (const auto& target : targets) {
        std::cout << "🔍 Ping " << target << " ...\n";
        bool ok = false;
        try {
            ok = prober_->reachable(target);
        } catch (const std::exception& e) {
            std::cerr << "⚠️  Ping " << target << " falhou: " << e.what() << "\n";
        }
        if (ok) {
            std::cout << "✅ " << target << " respondeu.\n";
            lastReached_ = target;
            return true;
        }
        std::cout << "❌ " << target << " sem resposta.\n";
    }
    return false;
}

void RemediationService::restartAdapters(const std::vector<Adapter>& adapters) {
    for (const auto& a : adapters) {
        RestartAttempt att{a.name, "", ""};
        if (!gate_.shouldProcess(a.name, "Reiniciar adaptador")) {
            att.result = "simulated";
            report_.restarts.push_back(att);
            continue;
        }
        std::cout << "🔄 Reiniciando " << a.name << " ...\n";
        try {
            net_->restart(a.name);
            att.result = "restarted";
        } catch (const std::exception& e) {
            std::cerr << "⚠️  Falha ao reiniciar " << a.name << ": " << e.what() << "\n";
            att.result = "failed";
            att.error = e.what();
        }
        report_.restarts.push_back(att);
    }
}

bool RemediationService::probeRound(const std::string& label) {
    ProbeRound round{label, false, ""};
    round.passed = probe(opt_.pingTargets);
    round.target = lastReached_;
    report_.probes.push_back(round);
    return round.passed;
}

void RemediationService::wait(int seconds, const std::string& reason) {
    std::cout << "⏱️  Aguardando " << seconds << "s " << reason << " ...\n";
    sleeper_->sleepSeconds(seconds);
}

RunOutcome RemediationService::escalate() {
    if (!opt_.forceReboot) {
        std::cerr << "⚠️  Conectividade não voltou após reiniciar os adaptadores. "
                     "Reinicie o host ou execute novamente com --force-reboot.\n";
        report_.detail = "intervenção manual necessária";
        return RunOutcome::ManualInterventionRequired;
    }

    if (!gate_.shouldProcess("host", "Reiniciar o host")) {
        report_.detail = "reinicialização do host não executada";
        return RunOutcome::ManualInterventionRequired;
    }

    report_.outcome = RunOutcome::RebootInitiated;
    report_.detail = "reinicialização forçada do host";
    notify();

    std::cerr << "♻️  Reiniciando o host em " << opt_.rebootGraceSeconds << "s ...\n";
    sleeper_->sleepSeconds(opt_.rebootGraceSeconds);
    try {
        host_->reboot();
    } catch (const std::exception& e) {
        std::cerr << "❌ Falha ao reiniciar o host: " << e.what() << "\n";
        report_.detail = std::string("falha ao reiniciar o host: ") + e.what();
        return RunOutcome::ManualInterventionRequired;
    }
    report_.rebootRequested = true;
    return RunOutcome::RebootInitiated;
}

void RemediationService::notify() {
    if (!mail_ || notified_ || opt_.dryRun) return;
    notified_ = true;
    report_.finished = nowStr();
    std::string subject = "LSO: " + toString(report_.outcome);
    if (!mail_->send(subject, summarize(report_)))
        std::cerr << "⚠️  Relatório por email não enviado.\n";
}

RunReport RemediationService::finish(RunOutcome outcome) {
    report_.outcome = outcome;
    report_.finished = nowStr();

    if (log_) {
        try {
            log_->append(report_.started, joinNames(report_.adapters), report_.anyChangeMade ? "sim" : "não",
                         toString(outcome), report_.detail);
        } catch (const std::exception& e) {
            std::cerr << "⚠️  Falha ao gravar log CSV: " << e.what() << "\n";
        }
    }

    if (needsAttention(outcome)) notify();

    std::cout << "\n" << summarize(report_);
    return report_;
}

RunReport RemediationService::run() {
    report_ = RunReport{};
    report_.started = nowStr();
    report_.dryRun = opt_.dryRun;
    notified_ = false;

    if (auto fatal = checkEnvironment()) return finish(*fatal);

    auto adapters = discoverActiveAdapters();
    if (adapters.empty()) {
        std::cerr << "⚠️  Nenhum adaptador físico ativo encontrado. Nada a fazer.\n";
        report_.detail = "nenhum adaptador físico ativo";
        return finish(RunOutcome::NoAdapters);
    }
    for (const auto& a : adapters) report_.adapters.push_back(a.name);

    bool anyChange = false;
    for (const auto& a : adapters) {
        anyChange |= setPropertyIfNeeded(a, opt_.ipv4Feature, opt_.desiredValue);
        anyChange |= setPropertyIfNeeded(a, opt_.ipv6Feature, opt_.desiredValue);
    }
    report_.anyChangeMade = anyChange;

    // Sem alteração, a rede é considerada saudável sem teste de ping.
    if (!anyChange) {
        std::cout << "✅ Nenhuma alteração necessária. Nada mais a fazer.\n";
        report_.detail = "nenhuma alteração; conectividade não testada";
        return finish(RunOutcome::Healthy);
    }

    wait(opt_.initialWaitSeconds, "para o adaptador estabilizar");
    if (probeRound("Teste pós-alteração")) {
        std::cout << "✅ Conectividade confirmada após desativar o offload.\n";
        return finish(RunOutcome::Remediated);
    }

    std::cerr << "⚠️  Sem conectividade após a alteração. Reiniciando adaptadores.\n";
    restartAdapters(adapters);
    wait(opt_.reinitializeWaitSeconds, "após reiniciar os adaptadores");
    if (probeRound("Teste pós-reinício")) {
        std::cout << "✅ Conectividade restabelecida após reiniciar os adaptadores.\n";
        return finish(RunOutcome::RecoveredAfterRestart);
    }

    return finish(escalate());
}
