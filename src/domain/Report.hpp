#pragma once

#include "domain/RunOutcome.hpp"

#include <string>
#include <vector>

struct PropertyAction {
    std::string adapter;
    std::string property;
    std::string before;
    std::string desired;
    std::string result;  // absent, compliant, fixed, simulated, changed, failed
    std::string error;
};

struct ProbeRound {
    std::string label;
    bool passed = false;
    std::string target;  // primeiro alvo que respondeu
};

struct RestartAttempt {
    std::string adapter;
    std::string result;  // restarted, simulated, failed
    std::string error;
};

struct RunReport {
    std::string started;
    std::string finished;
    RunOutcome outcome = RunOutcome::Healthy;
    bool dryRun = false;
    std::vector<std::string> adapters;
    std::vector<PropertyAction> properties;
    bool anyChangeMade = false;
    std::vector<ProbeRound> probes;
    std::vector<RestartAttempt> restarts;
    bool rebootRequested = false;
    std::string detail;
};
