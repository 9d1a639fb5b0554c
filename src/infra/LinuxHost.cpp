#include "infra/LinuxHost.hpp"

#include "util/Env.hpp"
#include "util/Process.hpp"

#include <stdexcept>
#include <sys/utsname.h>
#include <unistd.h>

bool LinuxHost::isElevated() {
    return geteuid() == 0;
}

std::string LinuxHost::kernelRelease() {
    utsname u {};
    if (uname(&u) != 0) return "";
    return u.release;
}

bool LinuxHost::hasTool(const std::string& name) {
    return hasCmd(name);
}

void LinuxHost::reboot() {
    std::string cmd = hasCmd("systemctl") ? "systemctl reboot" : "shutdown -r now";
    std::string out;
    if (runCmdCapture(cmd, out) != 0) throw std::runtime_error(cmd + " falhou: " + trim(out));
}
