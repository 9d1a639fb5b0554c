#pragma once

#include <string>

enum class RunOutcome {
    Healthy,
    Remediated,
    RecoveredAfterRestart,
    ManualInterventionRequired,
    RebootInitiated,
    NoAdapters,
    InsufficientPrivilege,
    UnsupportedEnvironment,
};

inline int exitCode(RunOutcome o) {
    switch (o) {
        case RunOutcome::Healthy:
        case RunOutcome::Remediated:
        case RunOutcome::RecoveredAfterRestart:
            return 0;
        case RunOutcome::NoAdapters:
            return 1;
        case RunOutcome::InsufficientPrivilege:
            return 2;
        case RunOutcome::UnsupportedEnvironment:
            return 3;
        case RunOutcome::ManualInterventionRequired:
            return 4;
        case RunOutcome::RebootInitiated:
            return 5;
    }
    return 70;
}

inline std::string toString(RunOutcome o) {
    switch (o) {
        case RunOutcome::Healthy: return "healthy";
        case RunOutcome::Remediated: return "remediated";
        case RunOutcome::RecoveredAfterRestart: return "recovered_after_restart";
        case RunOutcome::ManualInterventionRequired: return "manual_intervention_required";
        case RunOutcome::RebootInitiated: return "reboot_initiated";
        case RunOutcome::NoAdapters: return "no_adapters";
        case RunOutcome::InsufficientPrivilege: return "insufficient_privilege";
        case RunOutcome::UnsupportedEnvironment: return "unsupported_environment";
    }
    return "unknown";
}

inline bool needsAttention(RunOutcome o) {
    return o == RunOutcome::ManualInterventionRequired || o == RunOutcome::RebootInitiated;
}
