#include "app/RunSummary.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

std::string summarize(const RunReport& r) {
    std::ostringstream oss;
    oss << "📋 Resultado: " << toString(r.outcome) << " (código " << exitCode(r.outcome) << ")\n"
        << "🕒 Início: " << r.started << "  Fim: " << r.finished << "\n";
    if (r.dryRun) oss << "🧪 Modo simulação: nenhuma alteração aplicada\n";

    oss << "📡 Adaptadores:";
    if (r.adapters.empty()) oss << " nenhum";
    for (const auto& a : r.adapters) oss << ' ' << a;
    oss << '\n';

    for (const auto& p : r.properties) {
        oss << "   - " << p.adapter << ' ' << p.property << ": ";
        if (p.result == "absent")
            oss << "não disponível";
        else
            oss << p.before << " -> " << p.desired << " [" << p.result << "]";
        if (!p.error.empty()) oss << " (" << p.error << ")";
        oss << '\n';
    }
    oss << "🔧 Alguma alteração aplicada: " << (r.anyChangeMade ? "sim" : "não") << '\n';

    for (const auto& pr : r.probes) {
        oss << "🔍 " << pr.label << ": " << (pr.passed ? "OK via " + pr.target : "falhou") << '\n';
    }
    for (const auto& rs : r.restarts) {
        oss << "🔄 Reinício " << rs.adapter << ": " << rs.result;
        if (!rs.error.empty()) oss << " (" << rs.error << ")";
        oss << '\n';
    }
    if (r.rebootRequested) oss << "♻️  Reinicialização do host solicitada\n";
    if (!r.detail.empty()) oss << "ℹ️  " << r.detail << '\n';
    return oss.str();
}

nlohmann::json reportToJson(const RunReport& r) {
    nlohmann::json j;
    j["started"] = r.started;
    j["finished"] = r.finished;
    j["outcome"] = toString(r.outcome);
    j["exit_code"] = exitCode(r.outcome);
    j["dry_run"] = r.dryRun;
    j["adapters"] = r.adapters;
    j["any_change_made"] = r.anyChangeMade;
    j["reboot_requested"] = r.rebootRequested;
    j["detail"] = r.detail;

    j["properties"] = nlohmann::json::array();
    for (const auto& p : r.properties) {
        nlohmann::json e{{"adapter", p.adapter},
                         {"property", p.property},
                         {"before", p.before},
                         {"desired", p.desired},
                         {"result", p.result}};
        if (!p.error.empty()) e["error"] = p.error;
        j["properties"].push_back(e);
    }

    j["probes"] = nlohmann::json::array();
    for (const auto& pr : r.probes) {
        nlohmann::json e{{"label", pr.label}, {"passed", pr.passed}};
        if (pr.passed) e["target"] = pr.target;
        j["probes"].push_back(e);
    }

    j["restarts"] = nlohmann::json::array();
    for (const auto& rs : r.restarts) {
        nlohmann::json e{{"adapter", rs.adapter}, {"result", rs.result}};
        if (!rs.error.empty()) e["error"] = rs.error;
        j["restarts"].push_back(e);
    }
    return j;
}

void writeReportJson(const std::filesystem::path& path, const RunReport& r) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("não foi possível abrir " + path.string());
    out << reportToJson(r).dump(2) << '\n';
    if (!out) throw std::runtime_error("falha ao gravar " + path.string());
}
