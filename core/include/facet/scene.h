#pragma once

/**
 * @file scene.h
 * @brief Scene state: models, camera and lights
 *
 * SceneState is the single source of truth the frame loop reads once per
 * tick. It holds no GPU handles, so it survives a device loss untouched.
 * Every geometry change stamps the model with a fresh generation number;
 * the frame loop compares generations to decide what to upload.
 */

#include <facet/camera.h>
#include <facet/mesh.h>

#include <glm/glm.hpp>
#include <cstdint>
#include <map>
#include <optional>

namespace facet {

using ModelId = uint32_t;

/// One directional light plus an ambient term
struct Lights {
    glm::vec3 direction = glm::vec3(-0.4f, -1.0f, -0.6f);  ///< Direction the light travels
    glm::vec3 color = glm::vec3(1.0f);
    float intensity = 1.0f;
    glm::vec3 ambientColor = glm::vec3(1.0f);
    float ambientIntensity = 0.25f;
};

/// A model as stored in the scene
struct SceneModel {
    Model model;
    uint64_t generation = 0;   ///< Changes whenever the geometry is replaced
};

class SceneState {
public:
    SceneState() = default;

    // -------------------------------------------------------------------------
    /// @name Mutation
    /// @{

    /**
     * @brief Insert or replace the geometry shown under id
     *
     * The transform of an existing model is kept. The first model added to
     * an empty scene frames the camera around it.
     *
     * @throws InvalidMeshError if the mesh is malformed (scene unchanged)
     */
    void replaceModel(ModelId id, Mesh mesh);

    /// Insert or replace a whole model, transform included
    void replaceModel(ModelId id, Model model);

    /// @return false if no model had that id
    bool removeModel(ModelId id);

    /// @throws std::out_of_range for an unknown id
    void setTransform(ModelId id, const Transform& transform);

    /// Replace every vertex color of a model. Sizes are unchanged.
    /// @throws std::out_of_range for an unknown id
    void recolorModel(ModelId id, const glm::vec4& color);

    void setCamera(const Camera& camera);

    /// @throws std::invalid_argument for a zero direction or negative intensity
    void setLights(const Lights& lights);

    /// Remove all models (camera and lights are kept)
    void clear();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Access
    /// @{

    Camera& camera() { return m_camera; }
    const Camera& camera() const { return m_camera; }
    const Lights& lights() const { return m_lights; }

    const std::map<ModelId, SceneModel>& models() const { return m_models; }
    const SceneModel* find(ModelId id) const;

    size_t modelCount() const { return m_models.size(); }
    bool empty() const { return m_models.empty(); }

    /// World space bounds of all models
    Bounds bounds() const;

    /// Nearest world space point where the ray hits a triangle, either side facing
    std::optional<glm::vec3> raycast(const Ray& ray) const;

    /// Bumped by every mutation; lets readers detect changes cheaply
    uint64_t revision() const { return m_revision; }

    /// @}

private:
    SceneModel& require(ModelId id);

    std::map<ModelId, SceneModel> m_models;
    Camera m_camera;
    Lights m_lights;
    uint64_t m_nextGeneration = 1;
    uint64_t m_revision = 0;
};

} // namespace facet
