#pragma once

#include <memory>
#include <string>

#include "capture/ICaptureBackend.hpp"

namespace roiwatch {

// Captures the Windows desktop from inside WSL by running a
// System.Drawing script through powershell.exe.
std::unique_ptr<ICaptureBackend> CreateBackendWslPowerShell(
    const std::string& powershellPath);

}  // namespace roiwatch
