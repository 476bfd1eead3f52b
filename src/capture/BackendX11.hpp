#pragma once

#include <memory>

#include "capture/ICaptureBackend.hpp"

namespace roiwatch {

std::unique_ptr<ICaptureBackend> CreateBackendX11();

}  // namespace roiwatch
