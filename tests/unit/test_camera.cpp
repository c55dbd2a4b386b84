/**
 * @file test_camera.cpp
 * @brief Unit tests for the orbit camera
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <facet/camera.h>

#include <glm/gtc/constants.hpp>

#include <cmath>
#include <stdexcept>

using namespace facet;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

void requireNear(const glm::mat4& a, const glm::mat4& b, float eps) {
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            REQUIRE_THAT(a[c][r], WithinAbs(b[c][r], eps));
        }
    }
}

// Screen position of a world point, in pixels with y down
glm::vec2 project(const Camera& camera, const glm::vec3& p) {
    glm::vec4 clip = camera.projectionMatrix() * camera.viewMatrix() * glm::vec4(p, 1.0f);
    glm::vec2 ndc = glm::vec2(clip) / clip.w;
    return glm::vec2((ndc.x * 0.5f + 0.5f) * camera.getViewportWidth(),
                     (0.5f - ndc.y * 0.5f) * camera.getViewportHeight());
}

} // namespace

TEST_CASE("Camera defaults", "[camera]") {
    Camera camera;
    REQUIRE(camera.getDistance() == 5.0f);
    REQUIRE(camera.getFov() == 45.0f);
    REQUIRE(camera.getNear() == 0.1f);
    REQUIRE(camera.getFar() == 100.0f);
    REQUIRE(camera.getTarget() == glm::vec3(0));
    REQUIRE_THAT(camera.getEye().z, WithinAbs(5.0f, 1e-5));
}

TEST_CASE("Camera zoom", "[camera][zoom]") {
    Camera camera;
    camera.minDistance(0.5f);

    SECTION("zoom in moves closer, zoom out moves away") {
        camera.zoom(1.0f);
        REQUIRE(camera.getDistance() < 5.0f);
        camera.zoom(-2.0f);
        REQUIRE(camera.getDistance() > 5.0f);
    }

    SECTION("repeated zoom-in converges to the minimum without reaching zero") {
        float previous = camera.getDistance();
        for (int i = 0; i < 2000; ++i) {
            camera.zoom(5.0f);
            REQUIRE(camera.getDistance() > 0.0f);
            REQUIRE(camera.getDistance() >= 0.5f);
            REQUIRE(camera.getDistance() <= previous);
            previous = camera.getDistance();
        }
        REQUIRE_THAT(camera.getDistance(), WithinAbs(0.5f, 1e-5));
    }

    SECTION("zoom out leaves the minimum distance") {
        camera.distance(0.0f);
        REQUIRE(camera.getDistance() == 0.5f);
        camera.zoom(-1.0f);
        REQUIRE(camera.getDistance() > 0.5f);
    }

    SECTION("zoom out is capped by the maximum distance") {
        camera.maxDistance(20.0f);
        for (int i = 0; i < 100; ++i) {
            camera.zoom(-5.0f);
        }
        REQUIRE(camera.getDistance() == 20.0f);
    }
}

TEST_CASE("Camera orbit", "[camera][orbit]") {
    Camera camera;
    camera.pitchLimit(80.0f);
    const float limit = glm::radians(80.0f);

    SECTION("pitch stays within the clamp") {
        for (int i = 0; i < 50; ++i) {
            camera.orbit(0.1f, 0.3f);
            REQUIRE(camera.getPitch() <= limit);
        }
        REQUIRE_THAT(camera.getPitch(), WithinAbs(limit, 1e-6));

        for (int i = 0; i < 100; ++i) {
            camera.orbit(-0.1f, -0.3f);
            REQUIRE(camera.getPitch() >= -limit);
        }
    }

    SECTION("clamping is idempotent") {
        camera.orbit(0.0f, 10.0f);
        float clamped = camera.getPitch();
        camera.orbit(0.0f, 10.0f);
        REQUIRE(camera.getPitch() == clamped);
        camera.orbit(0.0f, 0.0f);
        REQUIRE(camera.getPitch() == clamped);
    }

    SECTION("yaw wraps around") {
        for (int i = 0; i < 100; ++i) {
            camera.orbit(1.0f, 0.0f);
        }
        REQUIRE(std::abs(camera.getYaw()) <= glm::pi<float>() + 1e-5f);
    }

    SECTION("orbit keeps the distance to the target") {
        camera.orbit(0.7f, 0.4f);
        REQUIRE_THAT(glm::length(camera.getEye() - camera.getTarget()), WithinRel(5.0f, 1e-5));
    }
}

TEST_CASE("Camera orbit around a pivot", "[camera][orbit]") {
    Camera camera;
    camera.viewport(800, 600);
    const glm::vec3 pivot(1.0f, 0.5f, 0.0f);

    SECTION("the pivot keeps its screen position") {
        glm::vec2 before = project(camera, pivot);
        float eyeToPivot = glm::length(camera.getEye() - pivot);

        camera.orbitAround(pivot, 0.4f, -0.2f);

        glm::vec2 after = project(camera, pivot);
        REQUIRE_THAT(after.x, WithinAbs(before.x, 0.01));
        REQUIRE_THAT(after.y, WithinAbs(before.y, 0.01));
        REQUIRE_THAT(glm::length(camera.getEye() - pivot), WithinRel(eyeToPivot, 1e-5));
        REQUIRE_THAT(camera.getDistance(), WithinRel(5.0f, 1e-6));
    }

    SECTION("yaw and pitch change as in orbit") {
        Camera reference = camera;
        reference.orbit(0.4f, 2.0f);
        camera.orbitAround(pivot, 0.4f, 2.0f);
        REQUIRE_THAT(camera.getYaw(), WithinAbs(reference.getYaw(), 1e-6));
        REQUIRE(camera.getPitch() == reference.getPitch());
    }

    SECTION("orbiting around the target is a plain orbit") {
        Camera reference = camera;
        reference.orbit(-0.7f, 0.3f);
        camera.orbitAround(camera.getTarget(), -0.7f, 0.3f);
        REQUIRE_THAT(glm::length(camera.getEye() - reference.getEye()), WithinAbs(0.0f, 1e-5));
    }
}

TEST_CASE("Camera rays", "[camera][ray]") {
    Camera camera;
    camera.viewport(800, 600);
    camera.orbit(0.3f, 0.2f);

    SECTION("the center pixel looks along the view direction") {
        Ray ray = camera.rayThrough(glm::vec2(400, 300));
        REQUIRE(ray.origin == camera.getEye());
        REQUIRE_THAT(glm::dot(ray.direction, camera.forward()), WithinAbs(1.0f, 1e-5));
    }

    SECTION("a ray passes through the point projected to its pixel") {
        glm::vec3 point(0.6f, -0.4f, 0.3f);
        Ray ray = camera.rayThrough(project(camera, point));
        glm::vec3 toPoint = glm::normalize(point - ray.origin);
        REQUIRE_THAT(glm::dot(ray.direction, toPoint), WithinAbs(1.0f, 1e-5));
    }
}

TEST_CASE("Camera pan", "[camera][pan]") {
    Camera camera;
    camera.viewport(800, 600);

    SECTION("a point under the cursor follows the drag") {
        glm::vec3 target = camera.getTarget();
        glm::vec2 before = project(camera, target);
        camera.pan(40.0f, -25.0f);
        glm::vec2 after = project(camera, target);

        REQUIRE_THAT(after.x - before.x, WithinAbs(40.0f, 0.05));
        REQUIRE_THAT(after.y - before.y, WithinAbs(-25.0f, 0.05));
    }

    SECTION("pan keeps the view direction") {
        glm::vec3 forward = camera.forward();
        camera.pan(100.0f, 100.0f);
        REQUIRE_THAT(glm::dot(forward, camera.forward()), WithinAbs(1.0f, 1e-5));
    }
}

TEST_CASE("Camera matrices", "[camera][matrices]") {
    Camera camera;
    camera.orbit(0.6f, -0.3f);
    camera.pan(12.0f, 7.0f);

    SECTION("view times inverse view is identity") {
        requireNear(camera.viewMatrix() * camera.inverseViewMatrix(), glm::mat4(1.0f), 1e-5f);
    }

    SECTION("inverse view matches a general inverse") {
        requireNear(camera.inverseViewMatrix(), glm::inverse(camera.viewMatrix()), 1e-4f);
    }

    SECTION("projection uses the given aspect") {
        glm::mat4 p = camera.projectionMatrix(1600.0f / 1200.0f);
        REQUIRE_THAT(p[1][1] / p[0][0], WithinRel(1600.0f / 1200.0f, 1e-5));
    }

    SECTION("projection maps near to depth 0 and far to depth 1") {
        glm::mat4 p = camera.projectionMatrix(1.0f);
        glm::vec4 nearPoint = p * glm::vec4(0, 0, -camera.getNear(), 1);
        glm::vec4 farPoint = p * glm::vec4(0, 0, -camera.getFar(), 1);
        REQUIRE_THAT(nearPoint.z / nearPoint.w, WithinAbs(0.0f, 1e-5));
        REQUIRE_THAT(farPoint.z / farPoint.w, WithinAbs(1.0f, 1e-4));
    }

    SECTION("non-positive aspect is rejected") {
        REQUIRE_THROWS_AS(camera.projectionMatrix(0.0f), std::invalid_argument);
    }
}

TEST_CASE("Camera lookAt", "[camera]") {
    Camera camera;

    SECTION("eye and target are reproduced") {
        camera.lookAt(glm::vec3(3, 4, 5), glm::vec3(1, 1, 1));
        glm::vec3 eye = camera.getEye();
        REQUIRE_THAT(eye.x, WithinAbs(3.0f, 1e-4));
        REQUIRE_THAT(eye.y, WithinAbs(4.0f, 1e-4));
        REQUIRE_THAT(eye.z, WithinAbs(5.0f, 1e-4));
    }

    SECTION("coincident eye and target") {
        REQUIRE_THROWS_AS(camera.lookAt(glm::vec3(1), glm::vec3(1)), std::invalid_argument);
    }
}

TEST_CASE("Camera framing", "[camera][frame]") {
    Camera camera;
    Bounds bounds;
    bounds.expand(glm::vec3(9, 9, 9));
    bounds.expand(glm::vec3(11, 11, 11));

    camera.frame(bounds);

    REQUIRE(camera.getTarget() == glm::vec3(10));
    float halfFov = glm::radians(camera.getFov()) * 0.5f;
    REQUIRE(camera.getDistance() * std::sin(halfFov) > bounds.radius());

    SECTION("clip planes enclose the bounds") {
        float centerDistance = glm::length(bounds.center() - camera.getEye());
        REQUIRE(camera.getNear() < centerDistance - bounds.radius());
        REQUIRE(camera.getFar() > centerDistance + bounds.radius());
        REQUIRE(camera.getNear() > 0.0f);
    }

    SECTION("framing tiny geometry clamps to the minimum and zoom out still works") {
        Bounds tiny;
        tiny.expand(glm::vec3(0.0f));
        tiny.expand(glm::vec3(0.001f));

        Camera small;
        small.frame(tiny);
        REQUIRE(small.getDistance() == small.getMinDistance());

        small.zoom(-1.0f);
        REQUIRE(small.getDistance() > small.getMinDistance());
        float afterOne = small.getDistance();
        small.zoom(-1.0f);
        REQUIRE(small.getDistance() > afterOne);
    }

    SECTION("empty bounds leave the camera alone") {
        Camera other;
        other.frame(Bounds());
        REQUIRE(other.getDistance() == 5.0f);
        REQUIRE(other.getTarget() == glm::vec3(0));
    }
}

TEST_CASE("Camera parameter validation", "[camera][validation]") {
    Camera camera;
    REQUIRE_THROWS_AS(camera.fov(0.0f), std::invalid_argument);
    REQUIRE_THROWS_AS(camera.fov(180.0f), std::invalid_argument);
    REQUIRE_THROWS_AS(camera.clipPlanes(0.0f, 10.0f), std::invalid_argument);
    REQUIRE_THROWS_AS(camera.clipPlanes(5.0f, 5.0f), std::invalid_argument);
    REQUIRE_THROWS_AS(camera.minDistance(0.0f), std::invalid_argument);
    REQUIRE_THROWS_AS(camera.pitchLimit(90.0f), std::invalid_argument);

    SECTION("rejected values leave state unchanged") {
        REQUIRE(camera.getFov() == 45.0f);
        REQUIRE(camera.getNear() == 0.1f);
    }
}
