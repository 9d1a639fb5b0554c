#include "infra/LinuxNetworkAdapter.hpp"

#include "infra/LinuxParsers.hpp"
#include "util/Env.hpp"
#include "util/Process.hpp"

#include <sstream>
#include <stdexcept>
#include <system_error>

bool LinuxNetworkAdapter::isPhysical(const std::string& iface) const {
    // Interfaces virtuais (lo, veth, bridge, tun...) não têm o link "device".
    std::error_code ec;
    return std::filesystem::exists(sysfsNet_ / iface / "device", ec);
}

std::vector<Adapter> LinuxNetworkAdapter::listAdapters() {
    std::string out;
    if (run_("ip -json link show", out) != 0)
        throw std::runtime_error("ip -json link show falhou: " + trim(out));

    auto adapters = parseIpLinkJson(out);
    for (auto& a : adapters) a.physical = isPhysical(a.name);
    return adapters;
}

std::optional<AdvancedProperty> LinuxNetworkAdapter::getProperty(const std::string& adapter,
                                                                 const std::string& name) {
    std::string out;
    if (run_("ethtool -k " + shellQuote(adapter), out) != 0)
        throw std::runtime_error("ethtool -k " + adapter + " falhou: " + trim(out));

    auto features = parseEthtoolFeatures(out);
    auto it = features.find(name);
    if (it == features.end()) return std::nullopt;
    return AdvancedProperty{adapter, name, it->second.value, it->second.fixed};
}

void LinuxNetworkAdapter::setProperty(const std::string& adapter,
                                      const std::string& name,
                                      const std::string& value) {
    std::string out;
    std::string cmd = "ethtool -K " + shellQuote(adapter) + " " + shellQuote(name) + " " + shellQuote(value);
    if (run_(cmd, out) != 0)
        throw std::runtime_error("ethtool -K " + adapter + " " + name + " " + value + ": " + trim(out));

    // ethtool pode sair com 0 mesmo quando o driver ignora o pedido.
    auto after = getProperty(adapter, name);
    if (!after || after->value != value)
        throw std::runtime_error(name + " continua em " + (after ? after->value : std::string("?")) +
                                 " após ethtool -K");
}

bool LinuxNetworkAdapter::nmcliManages(const std::string& iface) {
    std::string out;
    if (run_("command -v nmcli", out) != 0) return false;
    if (run_("nmcli -t -f DEVICE,STATE device status", out) != 0) return false;

    std::string state;
    {
        std::istringstream iss(out);
        std::string line;
        while (std::getline(iss, line)) {
            auto pos = line.find(':');
            if (pos == std::string::npos) continue;
            if (line.substr(0, pos) == iface) {
                state = trim(line.substr(pos + 1));
                break;
            }
        }
    }
    return !state.empty() && state.rfind("unmanaged", 0) != 0 && state.rfind("unavailable", 0) != 0;
}

// false: o NetworkManager não assumiu o reinício e o ip link pode ser usado.
// Depois de um disconnect bem-sucedido, só o nmcli reativa a conexão.
bool LinuxNetworkAdapter::nmcliRestart(const std::string& iface) {
    if (!nmcliManages(iface)) return false;

    std::string out;
    if (run_("nmcli device disconnect " + shellQuote(iface), out) != 0) return false;
    sleeper_->sleepSeconds(2);
    if (run_("nmcli device connect " + shellQuote(iface), out) != 0)
        throw std::runtime_error("nmcli device connect " + iface + " falhou após disconnect: " + trim(out));
    return true;
}

void LinuxNetworkAdapter::iplinkRestart(const std::string& iface) {
    std::string out;
    if (run_("ip link set dev " + shellQuote(iface) + " down", out) != 0)
        throw std::runtime_error("ip link set dev " + iface + " down falhou: " + trim(out));
    sleeper_->sleepSeconds(2);
    if (run_("ip link set dev " + shellQuote(iface) + " up", out) != 0)
        throw std::runtime_error("ip link set dev " + iface + " up falhou: " + trim(out));
}

void LinuxNetworkAdapter::restart(const std::string& adapter) {
    if (nmcliRestart(adapter)) return;
    iplinkRestart(adapter);
}
