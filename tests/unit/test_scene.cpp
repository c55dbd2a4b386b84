/**
 * @file test_scene.cpp
 * @brief Unit tests for SceneState mutation and generation tracking
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <facet/errors.h>
#include <facet/scene.h>

#include <stdexcept>

using namespace facet;
using Catch::Matchers::WithinAbs;

TEST_CASE("SceneState models", "[scene]") {
    SceneState scene;
    REQUIRE(scene.empty());
    REQUIRE(scene.bounds().empty());

    SECTION("replaceModel inserts and bumps the revision") {
        uint64_t before = scene.revision();
        scene.replaceModel(1, makeUnitCube());
        REQUIRE(scene.modelCount() == 1);
        REQUIRE(scene.revision() > before);
        REQUIRE(scene.find(1) != nullptr);
        REQUIRE(scene.find(2) == nullptr);
    }

    SECTION("replacing geometry assigns a new generation and keeps the transform") {
        scene.replaceModel(1, makeUnitCube());
        Transform t;
        t.translation = glm::vec3(2, 0, 0);
        scene.setTransform(1, t);
        uint64_t generation = scene.find(1)->generation;

        scene.replaceModel(1, makeUnitCube(glm::vec4(1, 0, 0, 1)));
        REQUIRE(scene.find(1)->generation != generation);
        REQUIRE(scene.find(1)->model.transform.translation == glm::vec3(2, 0, 0));
    }

    SECTION("setTransform does not change the generation") {
        scene.replaceModel(1, makeUnitCube());
        uint64_t generation = scene.find(1)->generation;
        uint64_t revision = scene.revision();

        Transform t;
        t.scale = 3.0f;
        scene.setTransform(1, t);
        REQUIRE(scene.find(1)->generation == generation);
        REQUIRE(scene.revision() > revision);
    }

    SECTION("recolorModel creates new geometry") {
        scene.replaceModel(1, makeUnitCube());
        uint64_t generation = scene.find(1)->generation;
        scene.recolorModel(1, glm::vec4(0, 1, 0, 1));

        const SceneModel* entry = scene.find(1);
        REQUIRE(entry->generation != generation);
        REQUIRE(entry->model.meshes[0]->vertices()[0].color == glm::vec4(0, 1, 0, 1));
    }

    SECTION("invalid geometry is rejected and the scene is unchanged") {
        uint64_t revision = scene.revision();
        std::vector<Vertex> verts(3);
        REQUIRE_THROWS_AS(scene.replaceModel(1, Mesh(verts, {0, 1})), InvalidMeshError);
        REQUIRE_THROWS_AS(scene.replaceModel(1, Model()), InvalidMeshError);
        REQUIRE(scene.empty());
        REQUIRE(scene.revision() == revision);
    }

    SECTION("unknown ids") {
        REQUIRE_THROWS_AS(scene.setTransform(7, Transform()), std::out_of_range);
        REQUIRE_THROWS_AS(scene.recolorModel(7, glm::vec4(1)), std::out_of_range);
        REQUIRE_FALSE(scene.removeModel(7));
    }

    SECTION("removeModel and clear") {
        scene.replaceModel(1, makeUnitCube());
        scene.replaceModel(2, makeUnitCube());
        REQUIRE(scene.removeModel(1));
        REQUIRE(scene.modelCount() == 1);
        scene.clear();
        REQUIRE(scene.empty());
    }
}

TEST_CASE("SceneState camera framing", "[scene][camera]") {
    SceneState scene;

    SECTION("the first model frames the camera") {
        Model model(makeUnitCube());
        model.transform.translation = glm::vec3(10, 0, 0);
        scene.replaceModel(1, model);
        REQUIRE_THAT(scene.camera().getTarget().x, WithinAbs(10.0f, 1e-5));
    }

    SECTION("later models leave the camera where the user put it") {
        scene.replaceModel(1, makeUnitCube());
        scene.camera().orbit(0.5f, 0.2f);
        float yaw = scene.camera().getYaw();
        glm::vec3 target = scene.camera().getTarget();

        Model far(makeUnitCube());
        far.transform.translation = glm::vec3(0, 0, -50);
        scene.replaceModel(2, far);
        REQUIRE(scene.camera().getYaw() == yaw);
        REQUIRE(scene.camera().getTarget() == target);
    }

    SECTION("scene bounds include every transform") {
        scene.replaceModel(1, makeUnitCube());
        Model moved(makeUnitCube());
        moved.transform.translation = glm::vec3(0, 4, 0);
        scene.replaceModel(2, moved);
        REQUIRE_THAT(scene.bounds().max.y, WithinAbs(4.5f, 1e-5));
        REQUIRE_THAT(scene.bounds().min.y, WithinAbs(-0.5f, 1e-5));
    }
}

TEST_CASE("SceneState raycast", "[scene][ray]") {
    SceneState scene;
    scene.replaceModel(1, makeUnitCube());

    Ray down;
    down.origin = glm::vec3(0.1f, 0.2f, 5.0f);
    down.direction = glm::vec3(0, 0, -1);

    SECTION("hits the nearest face") {
        auto hit = scene.raycast(down);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->z, WithinAbs(0.5f, 1e-5));
        REQUIRE_THAT(hit->x, WithinAbs(0.1f, 1e-5));
    }

    SECTION("misses beside the model") {
        down.origin.x = 2.0f;
        REQUIRE_FALSE(scene.raycast(down).has_value());
    }

    SECTION("ignores geometry behind the origin") {
        down.direction = glm::vec3(0, 0, 1);
        REQUIRE_FALSE(scene.raycast(down).has_value());
    }

    SECTION("uses model transforms and picks the closest model") {
        Model front(makeUnitCube());
        front.transform.translation = glm::vec3(0, 0, 2);
        scene.replaceModel(2, front);

        auto hit = scene.raycast(down);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->z, WithinAbs(2.5f, 1e-5));
    }

    SECTION("an empty scene has nothing to hit") {
        scene.clear();
        REQUIRE_FALSE(scene.raycast(down).has_value());
    }
}

TEST_CASE("SceneState lights", "[scene][lights]") {
    SceneState scene;
    Lights lights;

    SECTION("valid lights are stored") {
        lights.intensity = 2.0f;
        scene.setLights(lights);
        REQUIRE(scene.lights().intensity == 2.0f);
    }

    SECTION("zero direction is rejected") {
        lights.direction = glm::vec3(0);
        REQUIRE_THROWS_AS(scene.setLights(lights), std::invalid_argument);
    }

    SECTION("negative intensity is rejected") {
        lights.ambientIntensity = -0.1f;
        REQUIRE_THROWS_AS(scene.setLights(lights), std::invalid_argument);
    }
}
