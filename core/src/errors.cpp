#include <facet/errors.h>

namespace facet {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidMesh:            return "InvalidMesh";
        case ErrorKind::SurfaceConfig:          return "SurfaceConfig";
        case ErrorKind::SurfaceLost:            return "SurfaceLost";
        case ErrorKind::SurfaceOutdated:        return "SurfaceOutdated";
        case ErrorKind::FrameAcquisitionFailed: return "FrameAcquisitionFailed";
        case ErrorKind::DeviceLost:             return "DeviceLost";
        case ErrorKind::ShaderCompile:          return "ShaderCompile";
    }
    return "Unknown";
}

} // namespace facet
