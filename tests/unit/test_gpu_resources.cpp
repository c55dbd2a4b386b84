/**
 * @file test_gpu_resources.cpp
 * @brief Unit tests for GpuResourceManager against a recording fake device
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <facet/buffer_builder.h>
#include <facet/errors.h>
#include <facet/gpu_resources.h>

#include <glm/gtc/matrix_transform.hpp>

#include "support/fake_gpu_device.h"

#include <memory>
#include <stdexcept>

using namespace facet;
using namespace facet::testing;
using Catch::Matchers::WithinAbs;

namespace {

struct Fixture {
    std::shared_ptr<FakeGpuState> state = std::make_shared<FakeGpuState>();

    std::unique_ptr<GpuResourceManager> make(GpuResourceSettings settings = {}) {
        return std::make_unique<GpuResourceManager>(std::make_unique<FakeGpuDevice>(state), settings);
    }
};

Mesh makeTriangles(uint32_t count) {
    std::vector<Vertex> verts;
    std::vector<uint32_t> indices;
    for (uint32_t t = 0; t < count; ++t) {
        float x = static_cast<float>(t);
        verts.emplace_back(glm::vec3(x, 0, 0), glm::vec3(0, 0, 1));
        verts.emplace_back(glm::vec3(x + 1, 0, 0), glm::vec3(0, 0, 1));
        verts.emplace_back(glm::vec3(x, 1, 0), glm::vec3(0, 0, 1));
        indices.push_back(3 * t);
        indices.push_back(3 * t + 1);
        indices.push_back(3 * t + 2);
    }
    return Mesh(std::move(verts), std::move(indices));
}

} // namespace

TEST_CASE("GpuResourceManager construction", "[gpu]") {
    Fixture f;

    SECTION("null device") {
        REQUIRE_THROWS_AS(GpuResourceManager(nullptr), std::invalid_argument);
    }

    SECTION("uniform buffer is created and bound") {
        auto gpu = f.make();
        REQUIRE(f.state->boundUniforms != kInvalidBuffer);
        REQUIRE(f.state->buffer(f.state->boundUniforms).usage == BufferUsage::Uniform);
    }

    SECTION("model slots respect the device alignment") {
        f.state->alignment = 256;
        auto gpu = f.make();
        REQUIRE(gpu->modelUniformOffset(0) == 256);
        REQUIRE(gpu->modelUniformOffset(1) == 512);
    }

    SECTION("each manager has its own generation") {
        auto a = f.make();
        auto b = f.make();
        REQUIRE(a->generation() != b->generation());
    }

    SECTION("destruction releases the uniform buffer") {
        f.make().reset();
        REQUIRE(f.state->buffers.empty());
    }
}

TEST_CASE("GpuResourceManager surface configuration", "[gpu][surface]") {
    Fixture f;
    auto gpu = f.make();

    SECTION("configure builds pipelines once per format") {
        gpu->configureSurface(800, 600);
        gpu->configureSurface(1600, 1200);
        REQUIRE(gpu->surfaceConfigured());
        REQUIRE(gpu->surfaceWidth() == 1600);
        REQUIRE(f.state->configurations.size() == 2);
        REQUIRE(f.state->pipelineFormats.size() == 1);
        REQUIRE(gpu->stats().surfaceConfigurations == 2);
    }

    SECTION("zero size is rejected") {
        REQUIRE_THROWS_AS(gpu->configureSurface(0, 600), std::invalid_argument);
        REQUIRE_FALSE(gpu->surfaceConfigured());
    }

    SECTION("unsupported format, then fallback") {
        f.state->formats = {SurfaceFormat::RGBA8Unorm};
        REQUIRE_THROWS_AS(gpu->configureSurface(800, 600), SurfaceConfigError);
        gpu->useFallbackFormat();
        REQUIRE(gpu->format() == SurfaceFormat::RGBA8Unorm);
        REQUIRE_NOTHROW(gpu->configureSurface(800, 600));
        REQUIRE(f.state->pipelineFormats.back() == SurfaceFormat::RGBA8Unorm);
    }

    SECTION("no formats at all") {
        f.state->formats.clear();
        REQUIRE_THROWS_AS(gpu->useFallbackFormat(), SurfaceConfigError);
    }

    SECTION("shader failures propagate") {
        f.state->failPipelines = true;
        REQUIRE_THROWS_AS(gpu->configureSurface(800, 600), ShaderCompileError);
    }
}

TEST_CASE("GpuResourceManager mesh uploads", "[gpu][buffers]") {
    Fixture f;
    auto gpu = f.make();
    GpuBufferLayout small = buildBuffers(makeTriangles(2));
    GpuBufferLayout large = buildBuffers(makeTriangles(20));

    SECTION("first upload allocates vertex, index and edge buffers") {
        MeshHandle handle = gpu->uploadMesh(small);
        REQUIRE(handle.valid());
        REQUIRE(gpu->owns(handle));
        REQUIRE(handle.indexCount == 6);
        REQUIRE(f.state->buffer(handle.vertexBuffer).data.size() >= small.vertexBytes.size());
        REQUIRE(f.state->buffer(handle.indexBuffer).usage == BufferUsage::Index);
    }

    SECTION("data that fits is written in place") {
        MeshHandle handle = gpu->uploadMesh(large);
        size_t created = f.state->created;
        MeshHandle again = gpu->uploadMesh(small, handle);
        REQUIRE(f.state->created == created);
        REQUIRE(again.vertexBuffer == handle.vertexBuffer);
        REQUIRE(again.indexCount == 6);
        REQUIRE(gpu->stats().inPlaceUploads == 1);
    }

    SECTION("growing data reallocates and frees the old buffers") {
        MeshHandle handle = gpu->uploadMesh(small);
        BufferId oldVertex = handle.vertexBuffer;
        MeshHandle grown = gpu->uploadMesh(large, handle);
        REQUIRE(grown.vertexBuffer != oldVertex);
        REQUIRE(f.state->buffers.count(oldVertex) == 0);
        REQUIRE(gpu->stats().reallocations == 1);
    }

    SECTION("releaseMesh frees the buffers once") {
        MeshHandle handle = gpu->uploadMesh(small);
        size_t destroyed = f.state->destroyed;
        gpu->releaseMesh(handle);
        REQUIRE(f.state->destroyed == destroyed + 3);
        REQUIRE_FALSE(handle.valid());
        gpu->releaseMesh(handle);
        REQUIRE(f.state->destroyed == destroyed + 3);
    }

    SECTION("handles from another session are never freed here") {
        Fixture other;
        auto otherGpu = other.make();
        MeshHandle foreign = otherGpu->uploadMesh(small);
        REQUIRE_FALSE(gpu->owns(foreign));

        size_t destroyed = f.state->destroyed;
        MeshHandle copy = foreign;
        gpu->releaseMesh(copy);
        REQUIRE(f.state->destroyed == destroyed);

        // Uploading over a foreign handle allocates fresh buffers
        MeshHandle fresh = gpu->uploadMesh(small, foreign);
        REQUIRE(gpu->owns(fresh));
        REQUIRE(other.state->buffers.count(foreign.vertexBuffer) == 1);
    }
}

TEST_CASE("GpuResourceManager uniforms", "[gpu][uniforms]") {
    Fixture f;
    GpuResourceSettings settings;
    settings.initialModelSlots = 1;
    auto gpu = f.make(settings);

    Camera camera;
    camera.viewport(1600, 1200);
    glm::mat4 view = camera.viewMatrix();
    glm::mat4 projection = camera.projectionMatrix();

    SECTION("frame block and model slots are written") {
        glm::mat4 model = glm::translate(glm::mat4(1.0f), glm::vec3(1, 2, 3));
        gpu->updateUniforms(view, projection, {model}, Lights());

        glm::mat4 written = f.state->projection();
        REQUIRE_THAT(written[1][1] / written[0][0], WithinAbs(1600.0f / 1200.0f, 1e-5));

        FrameUniforms frame = f.state->frameUniforms();
        REQUIRE_THAT(frame.cameraPos[2], WithinAbs(5.0f, 1e-4));

        ModelUniforms slot = f.state->modelUniforms(gpu->modelUniformOffset(0));
        REQUIRE(slot.model[12] == 1.0f);
        REQUIRE(slot.model[14] == 3.0f);
    }

    SECTION("more models than slots grows and rebinds the buffer") {
        BufferId before = f.state->boundUniforms;
        std::vector<glm::mat4> models(5, glm::mat4(1.0f));
        gpu->updateUniforms(view, projection, models, Lights());
        REQUIRE(f.state->boundUniforms != before);
        REQUIRE(f.state->buffers.count(before) == 0);
        REQUIRE(f.state->buffer(f.state->boundUniforms).data.size() >=
                gpu->modelUniformOffset(4) + sizeof(ModelUniforms));
    }
}

TEST_CASE("GpuResourceManager frame acquisition", "[gpu][frames]") {
    Fixture f;
    auto gpu = f.make();

    SECTION("acquire before configuration is refused") {
        REQUIRE_FALSE(gpu->acquireFrame().has_value());
    }

    gpu->configureSurface(800, 600);

    SECTION("success") {
        auto frame = gpu->acquireFrame();
        REQUIRE(frame.has_value());
        REQUIRE(frame->width == 800);
        REQUIRE(frame->height == 600);
    }

    SECTION("outdated once reconfigures and retries") {
        f.state->acquireScript = {SurfaceStatus::Outdated};
        auto frame = gpu->acquireFrame();
        REQUIRE(frame.has_value());
        REQUIRE(f.state->configurations.size() == 2);
        REQUIRE(gpu->stats().acquireRetries == 1);
        REQUIRE(gpu->stats().droppedFrames == 0);
    }

    SECTION("timeout retries without reconfiguring") {
        f.state->acquireScript = {SurfaceStatus::Timeout};
        REQUIRE(gpu->acquireFrame().has_value());
        REQUIRE(f.state->configurations.size() == 1);
    }

    SECTION("two failures drop the frame") {
        f.state->acquireScript = {SurfaceStatus::Lost, SurfaceStatus::Lost};
        REQUIRE_FALSE(gpu->acquireFrame().has_value());
        REQUIRE(gpu->stats().droppedFrames == 1);

        // The next frame is unaffected
        REQUIRE(gpu->acquireFrame().has_value());
    }

    SECTION("device loss is an exception") {
        f.state->acquireScript = {SurfaceStatus::DeviceLost};
        REQUIRE_THROWS_AS(gpu->acquireFrame(), DeviceLostError);
        REQUIRE_THROWS_AS(gpu->uploadMesh(buildBuffers(makeUnitCube())), DeviceLostError);
    }

    SECTION("submit and present") {
        auto frame = gpu->acquireFrame();
        REQUIRE(frame.has_value());
        gpu->submitAndPresent(DrawList(), *frame);
        REQUIRE(f.state->submissions.size() == 1);
        REQUIRE(f.state->presents == 1);
    }

    SECTION("loss during submission") {
        auto frame = gpu->acquireFrame();
        REQUIRE(frame.has_value());
        f.state->loseOnSubmit = true;
        REQUIRE_THROWS_AS(gpu->submitAndPresent(DrawList(), *frame), DeviceLostError);
    }
}
