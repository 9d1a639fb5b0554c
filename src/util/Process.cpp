#include "util/Process.hpp"

#include <cstdio>
#include <string>
#include <sys/wait.h>

int runCmdCapture(const std::string& cmd, std::string& output) {
    std::string full = cmd + " 2>&1";
    FILE* pipe = popen(full.c_str(), "r");
    output.clear();
    if (!pipe) return -1;
    char buf[4096];
    while (fgets(buf, sizeof buf, pipe)) output += buf;
    int rc = pclose(pipe);
    if (rc == -1) return -1;
    if (WIFEXITED(rc)) return WEXITSTATUS(rc);
    if (WIFSIGNALED(rc)) return 128 + WTERMSIG(rc);
    return rc;
}

bool hasCmd(const std::string& name) {
    std::string out;
    return runCmdCapture("command -v " + shellQuote(name), out) == 0;
}

std::string shellQuote(const std::string& arg) {
    std::string q = "'";
    for (char c : arg) {
        if (c == '\'')
            q += "'\\''";
        else
            q += c;
    }
    q += '\'';
    return q;
}
