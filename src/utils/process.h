#pragma once

#include <map>
#include <string>
#include <vector>

struct ProcessResult {
    bool started{false};
    bool success{false};
    int exitCode{-1};
    std::string output;
    std::string errorOutput;
    std::string error;
};

using ProcessEnvironment = std::map<std::string, std::string>;

// Runs args[0] directly (no shell). The child inherits the current environment
// with the entries of `environment` added or replaced.
ProcessResult runProcess(const std::vector<std::string> &args,
                         const ProcessEnvironment &environment = {});
