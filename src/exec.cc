#include "exec.hh"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

#include <fmt/core.h>

#include "log.hh"

void exec_nocapture(const std::string& cmd) {
    if (cmd.empty()) {
        return;
    }
    spdlog::debug("[exec] spawn: {}", cmd);
    int status = std::system(fmt::format("({}) >/dev/null 2>&1 &", cmd).c_str());
    if (status == -1) {
        spdlog::warn("[exec] failed to spawn '{}'", cmd);
    }
}

std::string exec(const std::string& cmd) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw exec_error_t(fmt::format("popen() failed for '{}'", cmd));
    }
    std::string result;
    std::array<char, 128> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }
    int status = pclose(pipe);
    if (status == -1) {
        throw exec_error_t(fmt::format("pclose() failed for '{}'", cmd));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        throw exec_error_t(fmt::format("'{}' exited with status {}", cmd, WEXITSTATUS(status)));
    }
    std::replace(result.begin(), result.end(), '\n', ' ');
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}
