#pragma once

#include "domain/NetworkAdapter.hpp"
#include "domain/Sleeper.hpp"
#include "infra/ThreadSleeper.hpp"
#include "util/Process.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Executa um comando de shell e devolve o código de saída, como runCmdCapture.
using CommandRunner = std::function<int(const std::string& cmd, std::string& output)>;

class LinuxNetworkAdapter : public NetworkAdapter {
public:
    explicit LinuxNetworkAdapter(std::filesystem::path sysfsNet = "/sys/class/net",
                                 CommandRunner run = runCmdCapture,
                                 std::shared_ptr<Sleeper> sleeper = std::make_shared<ThreadSleeper>())
        : sysfsNet_(std::move(sysfsNet)), run_(std::move(run)), sleeper_(std::move(sleeper)) {}

    std::vector<Adapter> listAdapters() override;
    std::optional<AdvancedProperty> getProperty(const std::string& adapter, const std::string& name) override;
    void setProperty(const std::string& adapter, const std::string& name, const std::string& value) override;
    void restart(const std::string& adapter) override;

private:
    std::filesystem::path sysfsNet_;
    CommandRunner run_;
    std::shared_ptr<Sleeper> sleeper_;

    bool isPhysical(const std::string& iface) const;
    bool nmcliManages(const std::string& iface);
    bool nmcliRestart(const std::string& iface);
    void iplinkRestart(const std::string& iface);
};
