#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "app/RemediationService.hpp"
#include "app/RunSummary.hpp"
#include "infra/CurlEmailSender.hpp"
#include "infra/FileCsvLogger.hpp"
#include "infra/LinuxHost.hpp"
#include "infra/LinuxNetworkAdapter.hpp"
#include "infra/PingProber.hpp"
#include "infra/ThreadSleeper.hpp"
#include "util/Env.hpp"

namespace {
constexpr int kExitUsage = 64;
constexpr int kExitInternal = 70;

const char* kUsage =
    "Uso: lso-remediator [opções]\n"
    "\n"
    "Desativa o TCP segmentation offload (IPv4/IPv6) nos adaptadores físicos ativos,\n"
    "testa a conectividade e, se necessário, reinicia os adaptadores e o host.\n"
    "\n"
    "  --ping-targets a,b,...            alvos de ping em ordem (padrão 8.8.8.8,1.1.1.1)\n"
    "  --ping-target a                   acrescenta um alvo (pode repetir)\n"
    "  --initial-wait-seconds N          espera após a alteração (padrão 45)\n"
    "  --reinitialize-wait-seconds N     espera após reiniciar adaptadores (padrão 30)\n"
    "  --force-reboot                    reinicia o host se tudo falhar\n"
    "  --dry-run, --what-if              apenas descreve as alterações\n"
    "  --confirm                         pede confirmação antes de cada alteração\n"
    "  --report-json ARQ                 grava o resumo da execução em JSON\n"
    "  --help                            mostra esta ajuda\n"
    "\n"
    "Códigos de saída:\n"
    "  0  rede saudável ou corrigida      1  nenhum adaptador ativo\n"
    "  2  sem privilégios de root         3  ambiente não suportado\n"
    "  4  intervenção manual necessária   5  reinicialização do host iniciada\n"
    "  64 parâmetros inválidos            70 erro interno\n";

struct Args {
    std::vector<std::string> pingTargets;
    int initialWait = 45;
    int reinitializeWait = 30;
    bool forceReboot = false;
    bool dryRun = false;
    bool confirm = false;
    bool help = false;
    std::filesystem::path reportJson;
};

int parseSeconds(const std::string& flag, const std::string& v) {
    std::size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(v, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + ": valor inválido '" + v + "'");
    }
    if (used != v.size() || n < 0) throw std::invalid_argument(flag + ": valor inválido '" + v + "'");
    return n;
}

void addTargets(std::vector<std::string>& out, const std::string& list) {
    std::istringstream iss(list);
    std::string t;
    while (std::getline(iss, t, ',')) {
        t = trim(t);
        if (!t.empty()) out.push_back(t);
    }
}

Args parseArgs(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; i++) {
        std::string s = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(s + " requer um valor");
            return argv[++i];
        };
        if (s == "--ping-targets" || s == "--ping-target")
            addTargets(a.pingTargets, value());
        else if (s == "--initial-wait-seconds")
            a.initialWait = parseSeconds(s, value());
        else if (s == "--reinitialize-wait-seconds")
            a.reinitializeWait = parseSeconds(s, value());
        else if (s == "--force-reboot")
            a.forceReboot = true;
        else if (s == "--dry-run" || s == "--what-if")
            a.dryRun = true;
        else if (s == "--confirm")
            a.confirm = true;
        else if (s == "--report-json")
            a.reportJson = value();
        else if (s == "--help" || s == "-h")
            a.help = true;
        else
            throw std::invalid_argument("Parâmetro desconhecido: " + s);
    }
    return a;
}

std::filesystem::path exeDir() {
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) return std::filesystem::current_path();
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}
}  // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << "\n\n" << kUsage;
        return kExitUsage;
    }
    if (args.help) {
        std::cout << kUsage;
        return 0;
    }

    auto here = exeDir();
    loadDotenv(here / ".env");

    RemediationOptions opt;
    int pingTimeout = 2;
    std::string runLog;
    try {
        if (!args.pingTargets.empty()) opt.pingTargets = args.pingTargets;
        opt.initialWaitSeconds = args.initialWait;
        opt.reinitializeWaitSeconds = args.reinitializeWait;
        opt.forceReboot = args.forceReboot;
        opt.dryRun = args.dryRun;
        opt.confirm = args.confirm;
        opt.ipv4Feature = getenvOr("LSO_FEATURE_IPV4", opt.ipv4Feature);
        opt.ipv6Feature = getenvOr("LSO_FEATURE_IPV6", opt.ipv6Feature);
        opt.desiredValue = lower(getenvOr("LSO_DESIRED_VALUE", opt.desiredValue));
        pingTimeout = getenvIntOr("PING_TIMEOUT_SECONDS", pingTimeout);
        runLog = getenvOr("RUN_LOG_CSV", (here / "remediation_log.csv").string());
    } catch (const std::exception& e) {
        std::cerr << "❌ Configuração inválida no .env: " << e.what() << "\n";
        return kExitUsage;
    }

    try {
        auto net = std::make_shared<LinuxNetworkAdapter>();
        auto prober = std::make_shared<PingProber>(pingTimeout);
        auto host = std::make_shared<LinuxHost>();
        auto sleeper = std::make_shared<ThreadSleeper>();
        std::shared_ptr<LoggerRepo> logger = runLog.empty() ? nullptr : std::make_shared<FileCsvLogger>(runLog);
        std::shared_ptr<EmailSender> mail = CurlEmailSender::fromEnv();

        if (opt.dryRun) std::cout << "🧪 Modo simulação: nenhuma alteração será aplicada.\n";

        RemediationService svc(opt, net, prober, host, sleeper, logger, mail);
        RunReport report = svc.run();

        if (!args.reportJson.empty()) {
            try {
                writeReportJson(args.reportJson, report);
                std::cout << "🗒️  Relatório gravado em " << args.reportJson.string() << "\n";
            } catch (const std::exception& e) {
                std::cerr << "⚠️  " << e.what() << "\n";
            }
        }
        return exitCode(report.outcome);
    } catch (const std::exception& e) {
        std::cerr << "❌ Erro inesperado: " << e.what() << "\n";
        return kExitInternal;
    }
}
