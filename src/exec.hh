#pragma once

#include <stdexcept>
#include <string>

struct exec_error_t: std::runtime_error {
    using std::runtime_error::runtime_error;
};

// runs cmd in the background and returns immediately
void exec_nocapture(const std::string& cmd);

// runs cmd, blocks until it exits and returns its stdout with newlines folded to spaces
std::string exec(const std::string& cmd);
