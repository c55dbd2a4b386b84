#include <facet/gpu_device.h>

#include <algorithm>
#include <cctype>

namespace facet {

namespace {

struct FormatName {
    SurfaceFormat format;
    const char* name;
};

constexpr FormatName kFormatNames[] = {
    {SurfaceFormat::BGRA8Unorm, "bgra8unorm"},
    {SurfaceFormat::BGRA8UnormSrgb, "bgra8unorm-srgb"},
    {SurfaceFormat::RGBA8Unorm, "rgba8unorm"},
    {SurfaceFormat::RGBA8UnormSrgb, "rgba8unorm-srgb"},
    {SurfaceFormat::RGBA16Float, "rgba16float"},
};

} // namespace

const char* surfaceFormatName(SurfaceFormat format) {
    for (const auto& entry : kFormatNames) {
        if (entry.format == format) return entry.name;
    }
    return "unknown";
}

std::optional<SurfaceFormat> parseSurfaceFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kFormatNames) {
        if (lower == entry.name) return entry.format;
    }
    return std::nullopt;
}

const char* surfaceStatusName(SurfaceStatus status) {
    switch (status) {
        case SurfaceStatus::Success:    return "Success";
        case SurfaceStatus::Suboptimal: return "Suboptimal";
        case SurfaceStatus::Timeout:    return "Timeout";
        case SurfaceStatus::Outdated:   return "Outdated";
        case SurfaceStatus::Lost:       return "Lost";
        case SurfaceStatus::DeviceLost: return "DeviceLost";
        case SurfaceStatus::Error:      return "Error";
    }
    return "Unknown";
}

} // namespace facet
