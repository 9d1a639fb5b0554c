#pragma once

#include "app/ChangeGate.hpp"
#include "domain/Adapter.hpp"
#include "domain/ConnectivityProber.hpp"
#include "domain/EmailSender.hpp"
#include "domain/Host.hpp"
#include "domain/Logger.hpp"
#include "domain/NetworkAdapter.hpp"
#include "domain/Report.hpp"
#include "domain/Sleeper.hpp"
#include "util/Version.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct RemediationOptions {
    std::vector<std::string> pingTargets{"8.8.8.8", "1.1.1.1"};
    int initialWaitSeconds = 45;
    int reinitializeWaitSeconds = 30;
    bool forceReboot = false;
    bool dryRun = false;
    bool confirm = false;

    std::string ipv4Feature = "tx-tcp-segmentation";
    std::string ipv6Feature = "tx-tcp6-segmentation";
    std::string desiredValue = "off";

    int rebootGraceSeconds = 10;
    Version minKernel{2, 6, 39};
    std::vector<std::string> requiredTools{"ip", "ethtool"};
};

class RemediationService {
public:
    // log e mail podem ser nulos (CSV desativado / email não configurado).
    RemediationService(RemediationOptions opt,
                       std::shared_ptr<NetworkAdapter> net,
                       std::shared_ptr<ConnectivityProber> prober,
                       std::shared_ptr<Host> host,
                       std::shared_ptr<Sleeper> sleeper,
                       std::shared_ptr<LoggerRepo> log,
                       std::shared_ptr<EmailSender> mail,
                       std::istream& confirmIn = std::cin)
        : opt_(std::move(opt)),
          net_(std::move(net)),
          prober_(std::move(prober)),
          host_(std::move(host)),
          sleeper_(std::move(sleeper)),
          log_(std::move(log)),
          mail_(std::move(mail)),
          gate_(opt_.dryRun, opt_.confirm, confirmIn, std::cout) {}

    RunReport run();

    std::optional<RunOutcome> checkEnvironment();
    std::vector<Adapter> discoverActiveAdapters();
    bool setPropertyIfNeeded(const Adapter& adapter,
                             const std::string& property,
                             const std::string& desired);
    bool probe(const std::vector<std::string>& targets);
    void restartAdapters(const std::vector<Adapter>& adapters);

private:
    const RemediationOptions opt_;
    std::shared_ptr<NetworkAdapter> net_;
    std::shared_ptr<ConnectivityProber> prober_;
    std::shared_ptr<Host> host_;
    std::shared_ptr<Sleeper> sleeper_;
    std::shared_ptr<LoggerRepo> log_;
    std::shared_ptr<EmailSender> mail_;
    ChangeGate gate_;

    RunReport report_;
    std::string lastReached_;
    bool notified_ = false;

    bool probeRound(const std::string& label);
    void wait(int seconds, const std::string& reason);
    RunOutcome escalate();
    void notify();
    RunReport finish(RunOutcome outcome);
};
