#pragma once

#include <memory>

#include "capture/ICaptureBackend.hpp"

namespace roiwatch {

std::unique_ptr<ICaptureBackend> CreateBackendWlrScreencopy();

}  // namespace roiwatch
