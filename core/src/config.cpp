#include <facet/config.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace facet {

using json = nlohmann::json;

namespace {

glm::vec4 readColor(const json& j, const glm::vec4& fallback) {
    glm::vec4 c = fallback;
    if (!j.is_array() || j.size() < 3 || j.size() > 4) {
        throw std::invalid_argument("clearColor must be an array of 3 or 4 numbers");
    }
    for (size_t i = 0; i < j.size(); ++i) {
        c[static_cast<int>(i)] = j.at(i).get<float>();
    }
    return c;
}

void readWindow(const json& j, ViewerConfig& config) {
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument("window must be [width, height]");
    }
    config.windowWidth = j.at(0).get<uint32_t>();
    config.windowHeight = j.at(1).get<uint32_t>();
}

// Helper to parse WxH format
bool parseSize(const std::string& s, uint32_t& w, uint32_t& h) {
    size_t x = s.find('x');
    if (x == std::string::npos) return false;
    int width = std::atoi(s.substr(0, x).c_str());
    int height = std::atoi(s.substr(x + 1).c_str());
    if (width <= 0 || height <= 0) return false;
    w = static_cast<uint32_t>(width);
    h = static_cast<uint32_t>(height);
    return true;
}

} // namespace

// =============================================================================
// Derived settings
// =============================================================================

GpuResourceSettings ViewerConfig::gpuSettings() const {
    GpuResourceSettings settings;
    if (auto format = parseSurfaceFormat(surfaceFormat)) {
        settings.preferredFormat = *format;
    } else {
        std::cerr << "[Config] Unknown surface format '" << surfaceFormat
                  << "', using bgra8unorm-srgb" << std::endl;
    }
    settings.presentMode = vsync ? PresentMode::Fifo : PresentMode::Immediate;
    settings.verbose = verbose;
    return settings;
}

FrameLoopSettings ViewerConfig::loopSettings() const {
    FrameLoopSettings settings;
    settings.continuous = continuous;
    settings.clearColor = clearColor;
    settings.draw = draw;
    settings.verbose = verbose;
    return settings;
}

void ViewerConfig::applyTo(Camera& cam) const {
    cam.fov(camera.fov);
    cam.clipPlanes(camera.nearPlane, camera.farPlane);
    cam.minDistance(camera.minDistance);
    cam.pitchLimit(camera.pitchLimit);
    cam.viewport(windowWidth, windowHeight);
}

// =============================================================================
// JSON
// =============================================================================

std::optional<ViewerConfig> parseConfigJson(const std::string& text, const ViewerConfig& base) {
    ViewerConfig config = base;

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[Config] Top-level value must be an object" << std::endl;
            return std::nullopt;
        }

        if (j.contains("window")) readWindow(j["window"], config);
        config.title = j.value("title", config.title);
        config.continuous = j.value("continuous", config.continuous);
        config.surfaceFormat = j.value("surfaceFormat", config.surfaceFormat);
        config.vsync = j.value("vsync", config.vsync);
        if (j.contains("clearColor")) config.clearColor = readColor(j["clearColor"], config.clearColor);
        config.draw.drawModel = j.value("drawModel", config.draw.drawModel);
        config.draw.drawMesh = j.value("drawMesh", config.draw.drawMesh);
        config.verbose = j.value("verbose", config.verbose);

        if (j.contains("camera")) {
            const json& c = j["camera"];
            config.camera.fov = c.value("fov", config.camera.fov);
            config.camera.nearPlane = c.value("near", config.camera.nearPlane);
            config.camera.farPlane = c.value("far", config.camera.farPlane);
            config.camera.minDistance = c.value("minDistance", config.camera.minDistance);
            config.camera.pitchLimit = c.value("pitchLimit", config.camera.pitchLimit);
        }

        if (j.contains("input")) {
            const json& in = j["input"];
            config.input.orbitSpeed = in.value("orbitSpeed", config.input.orbitSpeed);
            config.input.maxOrbitStep = in.value("maxOrbitStep", config.input.maxOrbitStep);
            config.input.maxPanStep = in.value("maxPanStep", config.input.maxPanStep);
            config.input.zoomSpeed = in.value("zoomSpeed", config.input.zoomSpeed);
            config.input.maxZoomStep = in.value("maxZoomStep", config.input.maxZoomStep);
            config.input.orbitAroundCursor = in.value("orbitAroundCursor", config.input.orbitAroundCursor);
        }
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] Parse error: " << e.what() << std::endl;
        return std::nullopt;
    } catch (const json::exception& e) {
        std::cerr << "[Config] Invalid value: " << e.what() << std::endl;
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] Invalid value: " << e.what() << std::endl;
        return std::nullopt;
    }

    return config;
}

std::optional<ViewerConfig> loadConfigFile(const std::string& path, const ViewerConfig& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parseConfigJson(buffer.str(), base);
    if (config) {
        config->configPath = path;
        std::cout << "[Config] Loaded: " << path << std::endl;
    } else {
        std::cerr << "[Config] Ignoring " << path << std::endl;
    }
    return config;
}

// =============================================================================
// Command line
// =============================================================================

ViewerConfig parseArgs(const std::vector<std::string>& args) {
    ViewerConfig config;

    // The config file is the base the other flags override
    for (size_t i = 0; i < args.size(); ++i) {
        std::string path;
        if (args[i] == "--config" && i + 1 < args.size()) {
            path = args[i + 1];
        } else if (args[i].rfind("--config=", 0) == 0) {
            path = args[i].substr(9);
        }
        if (!path.empty()) {
            if (auto loaded = loadConfigFile(path, config)) {
                config = *loaded;
            }
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config" && i + 1 < args.size()) {
            ++i;
        } else if (arg.rfind("--config=", 0) == 0) {
            continue;
        } else if (arg == "--window" && i + 1 < args.size()) {
            if (!parseSize(args[++i], config.windowWidth, config.windowHeight)) {
                std::cerr << "[Config] Ignoring malformed --window " << args[i] << std::endl;
            }
        } else if (arg.rfind("--window=", 0) == 0) {
            if (!parseSize(arg.substr(9), config.windowWidth, config.windowHeight)) {
                std::cerr << "[Config] Ignoring malformed " << arg << std::endl;
            }
        } else if (arg == "--continuous") {
            config.continuous = true;
        } else if (arg == "--no-vsync") {
            config.vsync = false;
        } else if (arg == "--wireframe") {
            config.draw.drawMesh = true;
        } else if (arg == "--orbit-cursor") {
            config.input.orbitAroundCursor = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--frames" && i + 1 < args.size()) {
            config.maxFrames = std::atoi(args[++i].c_str());
        } else if (arg.rfind("--frames=", 0) == 0) {
            config.maxFrames = std::atoi(arg.substr(9).c_str());
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (!arg.empty() && arg[0] != '-') {
            // Non-flag argument is the model path
            config.modelPath = arg;
        } else {
            std::cerr << "[Config] Unknown option: " << arg << std::endl;
        }
    }

    return config;
}

void printUsage() {
    std::cout << "Usage: facet [options] [model.obj]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>     Load settings from a JSON file\n"
              << "  --window WxH        Initial window size (default 1280x720)\n"
              << "  --continuous        Render every frame instead of on demand\n"
              << "  --no-vsync          Present immediately\n"
              << "  --wireframe         Start with the mesh overlay enabled\n"
              << "  --orbit-cursor      Orbit around the point under the cursor\n"
              << "  --frames N          Exit after N rendered frames\n"
              << "  --verbose           Per-frame logging\n"
              << "  -h, --help          Show this help\n"
              << "\n"
              << "Controls:\n"
              << "  Left drag           Orbit\n"
              << "  Right drag          Pan (also shift + left drag)\n"
              << "  Scroll              Zoom\n"
              << "  M / W               Toggle model / mesh overlay\n"
              << "  F                   Frame the model\n"
              << "  Esc                 Quit\n";
}

} // namespace facet
