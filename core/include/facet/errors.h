#pragma once

/**
 * @file errors.h
 * @brief Error taxonomy for the facet viewer engine
 *
 * Every exception thrown by facet derives from facet::Error, which carries
 * an ErrorKind so callers can branch on the failure class without RTTI.
 * Expected per-frame failures (frame acquisition) are not thrown; they are
 * reported through std::optional returns and logged.
 */

#include <stdexcept>
#include <string>

namespace facet {

/// Failure classes reported by the engine
enum class ErrorKind {
    InvalidMesh,            ///< Malformed geometry, rejected at ingestion
    SurfaceConfig,          ///< Requested surface format/size not supported
    SurfaceLost,            ///< Surface must be reconfigured
    SurfaceOutdated,        ///< Surface no longer matches the window
    FrameAcquisitionFailed, ///< Frame dropped after one retry
    DeviceLost,             ///< GPU session must be rebuilt
    ShaderCompile           ///< Pipeline construction failed
};

/// Human readable name for an ErrorKind
const char* errorKindName(ErrorKind kind);

/// Base class for all facet exceptions
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/// Index out of range, index count not a multiple of 3, or empty sequences
class InvalidMeshError : public Error {
public:
    explicit InvalidMeshError(const std::string& message)
        : Error(ErrorKind::InvalidMesh, message) {}
};

/// Surface format not supported by the device
class SurfaceConfigError : public Error {
public:
    explicit SurfaceConfigError(const std::string& message)
        : Error(ErrorKind::SurfaceConfig, message) {}
};

/// The GPU device is gone; every GPU handle of the session is invalid
class DeviceLostError : public Error {
public:
    explicit DeviceLostError(const std::string& message)
        : Error(ErrorKind::DeviceLost, message) {}
};

/// Shader module or render pipeline could not be created
class ShaderCompileError : public Error {
public:
    explicit ShaderCompileError(const std::string& message)
        : Error(ErrorKind::ShaderCompile, message) {}
};

} // namespace facet
