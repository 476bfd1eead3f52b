#pragma once

#include <memory>

#include "capture/ICaptureBackend.hpp"

namespace roiwatch {

std::unique_ptr<ICaptureBackend> CreateBackendPortalScreenshot();

}  // namespace roiwatch
