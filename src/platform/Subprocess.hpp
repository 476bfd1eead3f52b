#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace roiwatch {

struct ProcessOutput {
    int exitCode = -1;
    std::string out;
    std::string err;
};

// Runs argv[0] (looked up in PATH) and collects stdout/stderr. The child is
// killed and reaped once `timeout` has elapsed, even if it already closed
// its output; that case returns false.
bool runProcess(const std::vector<std::string>& argv,
                std::chrono::milliseconds timeout, ProcessOutput& result,
                std::string* err);

}  // namespace roiwatch
