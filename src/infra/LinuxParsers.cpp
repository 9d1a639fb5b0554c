#include "infra/LinuxParsers.hpp"

#include "util/Env.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace {
bool hasFlag(const nlohmann::json& link, const std::string& flag) {
    if (!link.contains("flags") || !link["flags"].is_array()) return false;
    for (const auto& f : link["flags"]) {
        if (f.is_string() && f.get<std::string>() == flag) return true;
    }
    return false;
}
}  // namespace

LinkStatus parseOperState(const std::string& operstate) {
    if (operstate == "UP" || operstate == "up") return LinkStatus::Up;
    if (operstate == "DOWN" || operstate == "down" || operstate == "LOWERLAYERDOWN") return LinkStatus::Down;
    return LinkStatus::Other;
}

std::vector<Adapter> parseIpLinkJson(const std::string& text) {
    auto data = nlohmann::json::parse(text);
    if (!data.is_array()) throw std::runtime_error("ip -json link: esperado um array");

    std::vector<Adapter> adapters;
    for (const auto& link : data) {
        if (!link.is_object() || !link.contains("ifname")) continue;
        Adapter a;
        a.name = link["ifname"].get<std::string>();
        a.index = link.value("ifindex", 0);
        a.status = parseOperState(link.value("operstate", ""));
        // Drivers sem sinalização de portadora ficam em UNKNOWN mesmo com o link ativo.
        if (a.status == LinkStatus::Other && link.value("operstate", "") == "UNKNOWN" &&
            hasFlag(link, "UP") && hasFlag(link, "LOWER_UP"))
            a.status = LinkStatus::Up;
        adapters.push_back(a);
    }
    return adapters;
}

std::map<std::string, FeatureState> parseEthtoolFeatures(const std::string& text) {
    std::map<std::string, FeatureState> features;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        auto s = trim(line);
        if (s.empty() || s.rfind("Features for", 0) == 0) continue;
        auto pos = s.find(':');
        if (pos == std::string::npos) continue;

        std::string name = trim(s.substr(0, pos));
        std::istringstream rest(s.substr(pos + 1));
        FeatureState st;
        if (!(rest >> st.value)) continue;
        st.fixed = s.find("[fixed]") != std::string::npos;
        features[name] = st;
    }
    return features;
}
