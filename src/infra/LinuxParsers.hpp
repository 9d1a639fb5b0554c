#pragma once

#include "domain/Adapter.hpp"

#include <map>
#include <string>
#include <vector>

struct FeatureState {
    std::string value;
    bool fixed = false;
};

// Saída de `ip -json link show`. O campo physical fica em false;
// quem chama decide com base no sysfs.
std::vector<Adapter> parseIpLinkJson(const std::string& text);

// Saída de `ethtool -k <if>`.
std::map<std::string, FeatureState> parseEthtoolFeatures(const std::string& text);

LinkStatus parseOperState(const std::string& operstate);
