#pragma once

/**
 * @file config.h
 * @brief Viewer configuration: defaults, optional JSON file, command line
 *
 * Precedence, lowest first: built-in defaults, the JSON file named by
 * --config, then individual command-line flags.
 *
 * Example file:
 * @code
 * {
 *   "window": [1600, 900],
 *   "continuous": false,
 *   "clearColor": [0.1, 0.1, 0.12, 1.0],
 *   "camera": { "fov": 50, "minDistance": 0.05 },
 *   "input": { "orbitSpeed": 0.008 },
 *   "drawMesh": true
 * }
 * @endcode
 */

#include <facet/camera.h>
#include <facet/frame_loop.h>
#include <facet/gpu_resources.h>
#include <facet/input_adapter.h>

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace facet {

struct CameraConfig {
    float fov = 45.0f;
    float nearPlane = 0.1f;
    float farPlane = 100.0f;
    float minDistance = 0.01f;
    float pitchLimit = 89.0f;
};

struct ViewerConfig {
    uint32_t windowWidth = 1280;
    uint32_t windowHeight = 720;
    std::string title = "facet";
    bool continuous = false;
    std::string surfaceFormat = "bgra8unorm-srgb";
    bool vsync = true;
    glm::vec4 clearColor = glm::vec4(0.12f, 0.12f, 0.14f, 1.0f);
    CameraConfig camera;
    InputSettings input;
    DrawConfig draw;
    bool verbose = false;

    // Command line only
    std::string modelPath;      ///< OBJ file to show
    std::string configPath;
    int maxFrames = 0;          ///< 0 = run until closed
    bool showHelp = false;

    /// Unknown format names fall back to bgra8unorm-srgb
    GpuResourceSettings gpuSettings() const;
    FrameLoopSettings loopSettings() const;

    /// @throws std::invalid_argument if the camera values violate camera invariants
    void applyTo(Camera& camera) const;
};

/**
 * @brief Overlay JSON text onto a configuration
 * @return the merged configuration, or empty if the text is malformed or a
 *         value has the wrong type (the error is logged)
 */
std::optional<ViewerConfig> parseConfigJson(const std::string& text, const ViewerConfig& base = ViewerConfig());

/// Read and overlay a JSON file; empty if it cannot be read or parsed
std::optional<ViewerConfig> loadConfigFile(const std::string& path, const ViewerConfig& base = ViewerConfig());

/**
 * @brief Build the configuration from command-line arguments (without argv[0])
 *
 * A --config file is applied first, then the remaining flags. A bad file is
 * reported and ignored.
 */
ViewerConfig parseArgs(const std::vector<std::string>& args);

void printUsage();

} // namespace facet
