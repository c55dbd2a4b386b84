// facet - Mesh viewer
// Window, config, scene and the host event loop

#include <facet/config.h>
#include <facet/errors.h>
#include <facet/frame_loop.h>
#include <facet/glfw_window.h>
#include <facet/gpu_resources.h>
#include <facet/mesh.h>
#include <facet/obj_loader.h>
#include <facet/scene.h>
#include <facet/webgpu/webgpu_device.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace facet;

namespace {

constexpr ModelId kMainModel = 1;

// Device loss is retried this many times in a row before giving up
constexpr int kMaxDeviceRebuilds = 3;

std::unique_ptr<GpuResourceManager> createSession(GlfwWindow& window, const ViewerConfig& config) {
    auto device = std::make_unique<webgpu::WebGpuDevice>(window);
    return std::make_unique<GpuResourceManager>(std::move(device), config.gpuSettings());
}

Mesh loadInitialMesh(const ViewerConfig& config) {
    if (config.modelPath.empty()) {
        std::cout << "[facet] No model given, showing unit cube" << std::endl;
        return makeUnitCube(glm::vec4(0.8f, 0.8f, 0.8f, 1.0f));
    }
    return loadObj(config.modelPath);
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    ViewerConfig config = parseArgs(args);

    if (config.showHelp) {
        printUsage();
        return 0;
    }

    std::cout << "facet - Starting..." << std::endl;

    SceneState scene;
    try {
        config.applyTo(scene.camera());
        scene.replaceModel(kMainModel, loadInitialMesh(config));
    } catch (const std::exception& e) {
        std::cerr << "[facet] " << e.what() << std::endl;
        return 1;
    }

    try {
        GlfwWindow window(config.windowWidth, config.windowHeight, config.title);

        FrameLoop loop(window, scene, createSession(window, config),
                       config.loopSettings(), config.input);

        int rendered = 0;
        int rebuilds = 0;
        while (!loop.closed()) {
            TickResult result;
            try {
                result = loop.tick();
                rebuilds = 0;
            } catch (const DeviceLostError& e) {
                std::cerr << "[facet] " << e.what() << std::endl;
                if (++rebuilds > kMaxDeviceRebuilds) {
                    std::cerr << "[facet] Device lost repeatedly, exiting" << std::endl;
                    return 1;
                }
                // The old surface must be gone before the window gets a new one
                loop.dropGpu();
                loop.resetGpu(createSession(window, config));
                continue;
            }

            if (result == TickResult::Closed) {
                break;
            }
            if (result == TickResult::Rendered && config.maxFrames > 0 &&
                ++rendered >= config.maxFrames) {
                break;
            }

            // A dropped frame is retried on the next tick rather than after the next event
            if (config.continuous || loop.framePending()) {
                window.pollEvents();
            } else {
                window.waitEvents();
            }
        }

        const FrameStats& stats = loop.stats();
        std::cout << "[facet] " << stats.framesRendered << " frames rendered, "
                  << stats.framesSkipped << " skipped, "
                  << stats.totalDrawCalls << " draw calls" << std::endl;
    } catch (const ShaderCompileError& e) {
        std::cerr << "[facet] Shader compilation failed: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[facet] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
