/**
 * @file test_config.cpp
 * @brief Unit tests for JSON configuration and command line parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <facet/config.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace facet;
using Catch::Matchers::WithinAbs;

namespace {

const std::string kFixtures = FACET_TEST_FIXTURES_DIR;

} // namespace

TEST_CASE("ViewerConfig defaults", "[config]") {
    ViewerConfig config;
    REQUIRE(config.windowWidth == 1280);
    REQUIRE(config.windowHeight == 720);
    REQUIRE_FALSE(config.continuous);
    REQUIRE(config.draw.drawModel);
    REQUIRE_FALSE(config.draw.drawMesh);

    SECTION("gpu settings") {
        GpuResourceSettings gpu = config.gpuSettings();
        REQUIRE(gpu.preferredFormat == SurfaceFormat::BGRA8UnormSrgb);
        REQUIRE(gpu.presentMode == PresentMode::Fifo);
    }

    SECTION("unknown surface format falls back") {
        config.surfaceFormat = "r11g11b10";
        REQUIRE(config.gpuSettings().preferredFormat == SurfaceFormat::BGRA8UnormSrgb);
    }

    SECTION("vsync off presents immediately") {
        config.vsync = false;
        REQUIRE(config.gpuSettings().presentMode == PresentMode::Immediate);
    }
}

TEST_CASE("parseConfigJson", "[config][json]") {
    SECTION("values override the base") {
        auto config = parseConfigJson(R"({
            "window": [640, 480],
            "continuous": true,
            "surfaceFormat": "RGBA8Unorm-sRGB",
            "camera": { "fov": 70, "pitchLimit": 60 },
            "input": { "maxPanStep": 50, "orbitAroundCursor": true }
        })");
        REQUIRE(config.has_value());
        REQUIRE(config->windowWidth == 640);
        REQUIRE(config->windowHeight == 480);
        REQUIRE(config->continuous);
        REQUIRE(config->gpuSettings().preferredFormat == SurfaceFormat::RGBA8UnormSrgb);
        REQUIRE(config->camera.fov == 70.0f);
        REQUIRE(config->camera.pitchLimit == 60.0f);
        REQUIRE(config->input.maxPanStep == 50.0f);
        REQUIRE(config->input.orbitAroundCursor);
        // Untouched keys keep their defaults
        REQUIRE(config->camera.nearPlane == 0.1f);
        REQUIRE(config->input.orbitSpeed == 0.01f);
    }

    SECTION("unknown keys are ignored") {
        auto config = parseConfigJson(R"({ "shadows": true, "title": "x" })");
        REQUIRE(config.has_value());
        REQUIRE(config->title == "x");
    }

    SECTION("malformed JSON") {
        REQUIRE_FALSE(parseConfigJson("{ \"window\": [1, ").has_value());
    }

    SECTION("wrong value types") {
        REQUIRE_FALSE(parseConfigJson(R"({ "continuous": "yes" })").has_value());
        REQUIRE_FALSE(parseConfigJson(R"({ "window": 1024 })").has_value());
        REQUIRE_FALSE(parseConfigJson(R"({ "clearColor": [1, 0] })").has_value());
        REQUIRE_FALSE(parseConfigJson("[1, 2, 3]").has_value());
    }
}

TEST_CASE("loadConfigFile", "[config][json]") {
    SECTION("fixture file") {
        auto config = loadConfigFile(kFixtures + "/viewer.json");
        REQUIRE(config.has_value());
        REQUIRE(config->windowWidth == 1024);
        REQUIRE(config->title == "facet fixture");
        REQUIRE(config->draw.drawMesh);
        REQUIRE(config->clearColor == glm::vec4(0, 0, 0, 1));
        REQUIRE_THAT(config->camera.nearPlane, WithinAbs(0.05f, 1e-7));
        REQUIRE(config->configPath == kFixtures + "/viewer.json");
    }

    SECTION("missing file") {
        REQUIRE_FALSE(loadConfigFile(kFixtures + "/does_not_exist.json").has_value());
    }
}

TEST_CASE("parseArgs", "[config][cli]") {
    SECTION("flags and model path") {
        ViewerConfig config = parseArgs({"--window", "800x600", "--continuous", "--wireframe",
                                         "--frames=10", "model.obj"});
        REQUIRE(config.windowWidth == 800);
        REQUIRE(config.windowHeight == 600);
        REQUIRE(config.continuous);
        REQUIRE(config.draw.drawMesh);
        REQUIRE(config.maxFrames == 10);
        REQUIRE(config.modelPath == "model.obj");
    }

    SECTION("orbit around the cursor") {
        REQUIRE_FALSE(parseArgs({}).input.orbitAroundCursor);
        REQUIRE(parseArgs({"--orbit-cursor"}).input.orbitAroundCursor);
    }

    SECTION("malformed window size keeps the default") {
        ViewerConfig config = parseArgs({"--window=huge"});
        REQUIRE(config.windowWidth == 1280);
    }

    SECTION("command line overrides the config file") {
        ViewerConfig config = parseArgs({"--window=320x200", "--config", kFixtures + "/viewer.json"});
        REQUIRE(config.windowWidth == 320);
        REQUIRE(config.title == "facet fixture");
    }

    SECTION("help") {
        REQUIRE(parseArgs({"-h"}).showHelp);
        REQUIRE(parseArgs({"--help"}).showHelp);
    }
}

TEST_CASE("ViewerConfig applyTo", "[config][camera]") {
    ViewerConfig config;
    config.camera.fov = 30.0f;
    config.camera.nearPlane = 0.5f;
    config.camera.farPlane = 50.0f;

    Camera camera;
    config.applyTo(camera);
    REQUIRE(camera.getFov() == 30.0f);
    REQUIRE(camera.getNear() == 0.5f);
    REQUIRE(camera.getFar() == 50.0f);
    REQUIRE(camera.getViewportWidth() == 1280);

    SECTION("invalid camera values are rejected") {
        config.camera.farPlane = 0.1f;
        REQUIRE_THROWS_AS(config.applyTo(camera), std::invalid_argument);
    }
}
