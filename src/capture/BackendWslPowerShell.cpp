#include "capture/BackendWslPowerShell.hpp"

#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "capture/ImageCodec.hpp"
#include "capture/Region.hpp"
#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"
#include "platform/Subprocess.hpp"

namespace roiwatch {

namespace {

constexpr std::chrono::milliseconds kProbeTimeout{5000};

// The script clips the request to the virtual screen (which may start at
// negative coordinates) and prints:
//   BOUNDS l t r b
//   AREA l t r b
//   <base64 png>
std::string buildScript(const std::optional<Region>& region) {
    std::ostringstream os;
    os << "$ErrorActionPreference = 'Stop'\n"
          "Add-Type -AssemblyName System.Windows.Forms\n"
          "Add-Type -AssemblyName System.Drawing\n"
          "$vs = [System.Windows.Forms.SystemInformation]::VirtualScreen\n";
    if (region) {
        os << "$x = " << region->left << "; $y = " << region->top
           << "; $r0 = " << region->right << "; $b0 = " << region->bottom
           << "\n";
    } else {
        os << "$x = $vs.Left; $y = $vs.Top; $r0 = $vs.Right; $b0 = "
              "$vs.Bottom\n";
    }
    os << "$l = [Math]::Max($x, $vs.Left); $t = [Math]::Max($y, $vs.Top)\n"
          "$r = [Math]::Min($r0, $vs.Right); $b = [Math]::Min($b0, "
          "$vs.Bottom)\n"
          "Write-Output \"BOUNDS $($vs.Left) $($vs.Top) $($vs.Right) "
          "$($vs.Bottom)\"\n"
          "if ($r -le $l -or $b -le $t) { exit 2 }\n"
          "$bmp = New-Object System.Drawing.Bitmap ($r - $l), ($b - $t)\n"
          "$g = [System.Drawing.Graphics]::FromImage($bmp)\n"
          "try {\n"
          "  $g.CopyFromScreen($l, $t, 0, 0, $bmp.Size)\n"
          "  $ms = New-Object System.IO.MemoryStream\n"
          "  $bmp.Save($ms, [System.Drawing.Imaging.ImageFormat]::Png)\n"
          "  Write-Output \"AREA $l $t $r $b\"\n"
          "  Write-Output ([Convert]::ToBase64String($ms.ToArray()))\n"
          "} finally {\n"
          "  $g.Dispose(); $bmp.Dispose()\n"
          "}\n";
    return os.str();
}

bool parseRect(const std::string& line, const char* tag, Region& out) {
    std::istringstream is(line);
    std::string word;
    if (!(is >> word) || word != tag) {
        return false;
    }
    return static_cast<bool>(is >> out.left >> out.top >> out.right >>
                             out.bottom);
}

std::string firstLine(const std::string& text) {
    auto end = text.find_first_of("\r\n");
    return text.substr(0, end);
}

}  // namespace

class WslPowerShellBackend final : public ICaptureBackend {
public:
    explicit WslPowerShellBackend(std::string powershellPath)
        : powershell_(std::move(powershellPath)) {}

    std::string name() const override {
        return "wsl-powershell";
    }

    bool isAvailable() const override {
        ProcessOutput out;
        std::string err;
        if (!runProcess({powershell_, "-NoProfile", "-NonInteractive",
                         "-Command", "Write-Output ok"},
                        kProbeTimeout, out, &err)) {
            LOG_DEBUG("wsl: powershell probe failed: %s", err.c_str());
            return false;
        }
        return out.exitCode == 0 && out.out.find("ok") != std::string::npos;
    }

    std::vector<MonitorInfo> listMonitors() override {
        std::vector<MonitorInfo> result;
        ProcessOutput out;
        std::string err;
        const char* script =
            "Add-Type -AssemblyName System.Windows.Forms\n"
            "foreach ($s in [System.Windows.Forms.Screen]::AllScreens) {\n"
            "  Write-Output \"$($s.DeviceName) $($s.Bounds.X) $($s.Bounds.Y) "
            "$($s.Bounds.Width) $($s.Bounds.Height) $($s.Primary)\"\n"
            "}\n";
        if (!runProcess({powershell_, "-NoProfile", "-NonInteractive",
                         "-Command", script},
                        kProbeTimeout, out, &err) ||
            out.exitCode != 0) {
            LOG_ERROR("wsl: failed to enumerate screens: %s",
                      err.empty() ? firstLine(out.err).c_str() : err.c_str());
            return result;
        }
        std::istringstream lines(out.out);
        std::string line;
        while (std::getline(lines, line)) {
            std::istringstream is(line);
            MonitorInfo mon;
            std::string primary;
            if (is >> mon.name >> mon.x >> mon.y >> mon.w >> mon.h >> primary) {
                mon.primary = (primary == "True");
                result.push_back(mon);
            }
        }
        return result;
    }

    CaptureResult captureOnce(const std::optional<Region>& region,
                              std::chrono::milliseconds timeout) override {
        CaptureResult result;
        ProcessOutput out;
        std::string err;
        if (!runProcess({powershell_, "-NoProfile", "-NonInteractive",
                         "-Command", buildScript(region)},
                        timeout, out, &err)) {
            result.error = err;
            LOG_ERROR("wsl: %s", err.c_str());
            return result;
        }

        std::string payload;
        std::istringstream lines(out.out);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            Region rect;
            if (parseRect(line, "BOUNDS", rect)) {
                result.displayBounds = rect;
            } else if (parseRect(line, "AREA", rect)) {
                result.area = rect;
            } else if (line.size() > payload.size()) {
                payload = line;
            }
        }

        if (out.exitCode == 2) {
            result.error = "region lies outside the virtual screen";
            return result;
        }
        if (out.exitCode != 0) {
            result.error = "powershell exited with code " +
                           std::to_string(out.exitCode) + ": " +
                           firstLine(out.err);
            LOG_ERROR("wsl: %s", result.error.c_str());
            return result;
        }

        std::vector<unsigned char> png;
        if (!base64Decode(payload, png)) {
            result.error = "powershell output carried no image payload";
            LOG_ERROR("wsl: %s", result.error.c_str());
            return result;
        }
        if (!decodeImage(png.data(), png.size(), result.image, &err)) {
            result.error = err;
            LOG_ERROR("wsl: %s", err.c_str());
            result.image = ImageRGBA{};
        }
        return result;
    }

private:
    std::string powershell_;
};

std::unique_ptr<ICaptureBackend> CreateBackendWslPowerShell(
    const std::string& powershellPath) {
    return std::make_unique<WslPowerShellBackend>(powershellPath);
}

}  // namespace roiwatch
