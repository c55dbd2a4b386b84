#pragma once

/**
 * @file gpu_common.h
 * @brief Shared WebGPU helpers: string views, format mapping, safe release
 */

#include <facet/gpu_device.h>

#include <webgpu/webgpu.h>
#include <cstring>
#include <optional>
#include <string>

namespace facet::webgpu {

// =============================================================================
// String Helpers
// =============================================================================

/**
 * @brief Convert C string to WebGPU string view
 */
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

/**
 * @brief Copy a WebGPU string view (which may be null-terminated) into a string
 */
inline std::string fromStringView(WGPUStringView view) {
    if (!view.data) return "unknown";
    size_t len = view.length == WGPU_STRLEN ? std::strlen(view.data) : view.length;
    return std::string(view.data, len);
}

// =============================================================================
// Format Mapping
// =============================================================================

WGPUTextureFormat toWGPUFormat(SurfaceFormat format);

/// Empty for texture formats facet does not render to
std::optional<SurfaceFormat> fromWGPUFormat(WGPUTextureFormat format);

WGPUPresentMode toWGPUPresentMode(PresentMode mode);

// =============================================================================
// Resource Cleanup Helpers
// =============================================================================

/**
 * @brief Safe release helpers that check for null, release, and set to nullptr
 *
 * Usage:
 * @code
 * void destroyDepthBuffer() {
 *     release(m_depthView);
 *     release(m_depthTexture);
 * }
 * @endcode
 */

inline void release(WGPURenderPipeline& p) {
    if (p) { wgpuRenderPipelineRelease(p); p = nullptr; }
}

inline void release(WGPUBindGroupLayout& l) {
    if (l) { wgpuBindGroupLayoutRelease(l); l = nullptr; }
}

inline void release(WGPUBindGroup& g) {
    if (g) { wgpuBindGroupRelease(g); g = nullptr; }
}

/// Buffers are destroyed first so their memory is reclaimed immediately
inline void release(WGPUBuffer& b) {
    if (b) { wgpuBufferDestroy(b); wgpuBufferRelease(b); b = nullptr; }
}

/// Textures are destroyed first so their memory is reclaimed immediately
inline void release(WGPUTexture& t) {
    if (t) { wgpuTextureDestroy(t); wgpuTextureRelease(t); t = nullptr; }
}

inline void release(WGPUTextureView& v) {
    if (v) { wgpuTextureViewRelease(v); v = nullptr; }
}

inline void release(WGPUShaderModule& m) {
    if (m) { wgpuShaderModuleRelease(m); m = nullptr; }
}

inline void release(WGPUPipelineLayout& l) {
    if (l) { wgpuPipelineLayoutRelease(l); l = nullptr; }
}

inline void release(WGPUQueue& q) {
    if (q) { wgpuQueueRelease(q); q = nullptr; }
}

inline void release(WGPUDevice& d) {
    if (d) { wgpuDeviceRelease(d); d = nullptr; }
}

inline void release(WGPUAdapter& a) {
    if (a) { wgpuAdapterRelease(a); a = nullptr; }
}

inline void release(WGPUSurface& s) {
    if (s) { wgpuSurfaceRelease(s); s = nullptr; }
}

inline void release(WGPUInstance& i) {
    if (i) { wgpuInstanceRelease(i); i = nullptr; }
}

} // namespace facet::webgpu
