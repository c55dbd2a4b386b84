#include <facet/webgpu/gpu_common.h>

namespace facet::webgpu {

WGPUTextureFormat toWGPUFormat(SurfaceFormat format) {
    switch (format) {
        case SurfaceFormat::BGRA8Unorm:     return WGPUTextureFormat_BGRA8Unorm;
        case SurfaceFormat::BGRA8UnormSrgb: return WGPUTextureFormat_BGRA8UnormSrgb;
        case SurfaceFormat::RGBA8Unorm:     return WGPUTextureFormat_RGBA8Unorm;
        case SurfaceFormat::RGBA8UnormSrgb: return WGPUTextureFormat_RGBA8UnormSrgb;
        case SurfaceFormat::RGBA16Float:    return WGPUTextureFormat_RGBA16Float;
    }
    return WGPUTextureFormat_Undefined;
}

std::optional<SurfaceFormat> fromWGPUFormat(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_BGRA8Unorm:     return SurfaceFormat::BGRA8Unorm;
        case WGPUTextureFormat_BGRA8UnormSrgb: return SurfaceFormat::BGRA8UnormSrgb;
        case WGPUTextureFormat_RGBA8Unorm:     return SurfaceFormat::RGBA8Unorm;
        case WGPUTextureFormat_RGBA8UnormSrgb: return SurfaceFormat::RGBA8UnormSrgb;
        case WGPUTextureFormat_RGBA16Float:    return SurfaceFormat::RGBA16Float;
        default:                               return std::nullopt;
    }
}

WGPUPresentMode toWGPUPresentMode(PresentMode mode) {
    switch (mode) {
        case PresentMode::Fifo:      return WGPUPresentMode_Fifo;
        case PresentMode::Immediate: return WGPUPresentMode_Immediate;
    }
    return WGPUPresentMode_Fifo;
}

} // namespace facet::webgpu
