#pragma once

/**
 * @file camera.h
 * @brief Orbit camera: view/projection state driven by orbit, pan and zoom
 *
 * The eye sits on a sphere around the target point, parameterized by
 * distance, yaw and pitch. Zoom is multiplicative and pan is scaled by the
 * distance to the target, so navigation feels the same for millimeter and
 * meter sized geometry.
 */

#include <facet/mesh.h>

#include <glm/glm.hpp>
#include <cstdint>

namespace facet {

class Camera {
public:
    Camera() = default;

    // -------------------------------------------------------------------------
    /// @name Navigation
    /// @{

    /**
     * @brief Place the eye and target directly
     * @throws std::invalid_argument if eye and target coincide
     */
    void lookAt(glm::vec3 eye, glm::vec3 target);

    /// Rotate the eye around the target (radians). Pitch is clamped to the limit.
    void orbit(float deltaYaw, float deltaPitch);

    /**
     * @brief Orbit around an arbitrary point
     *
     * Eye and target rotate together about the pivot, so the pivot stays
     * where it is on screen. Yaw and pitch change exactly as in orbit().
     */
    void orbitAround(glm::vec3 pivot, float deltaYaw, float deltaPitch);

    /// Move eye and target parallel to the view plane by a drag of (dx, dy) pixels
    void pan(float deltaX, float deltaY);

    /// Scale the distance above the minimum; positive delta moves closer.
    /// Zooming out from the minimum itself scales the minimum instead.
    void zoom(float delta);

    /// Center on bounds and back off until they fit the vertical field of view
    void frame(const Bounds& bounds);

    /// Fit near/far planes around bounds as seen from the current eye
    void fitPlanes(const Bounds& bounds);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Parameters
    /// @{

    /// Vertical field of view in degrees, in (0, 180)
    void fov(float degrees);

    /// Clip planes; requires 0 < near < far
    void clipPlanes(float nearPlane, float farPlane);

    /// Viewport in pixels; the aspect ratio is derived from it
    void viewport(uint32_t width, uint32_t height);

    /// Smallest allowed distance to the target; must be > 0
    void minDistance(float d);

    /// Largest allowed distance to the target
    void maxDistance(float d);

    /// Pitch clamp in degrees, in (0, 90)
    void pitchLimit(float degrees);

    /// Set distance to the target, clamped to [minDistance, maxDistance]
    void distance(float d);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Computed Matrices
    /// @{

    glm::mat4 viewMatrix() const;

    /// Rigid inverse of viewMatrix(), computed without a general inversion
    glm::mat4 inverseViewMatrix() const;

    /// Right-handed perspective with 0..1 depth range
    glm::mat4 projectionMatrix(float aspect) const;

    /// Perspective using the viewport aspect ratio
    glm::mat4 projectionMatrix() const { return projectionMatrix(aspect()); }

    /// Ray from the eye through a viewport pixel (origin top left, y down)
    Ray rayThrough(glm::vec2 pixel) const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Accessors
    /// @{

    glm::vec3 getEye() const;
    glm::vec3 getTarget() const { return m_target; }
    glm::vec3 getUp() const { return m_up; }
    float getDistance() const { return m_distance; }
    float getYaw() const { return m_yaw; }
    float getPitch() const { return m_pitch; }
    float getFov() const { return m_fov; }
    float getNear() const { return m_near; }
    float getFar() const { return m_far; }
    float getMinDistance() const { return m_minDistance; }
    float getMaxDistance() const { return m_maxDistance; }
    float getPitchLimit() const { return m_pitchLimit; }
    uint32_t getViewportWidth() const { return m_viewportWidth; }
    uint32_t getViewportHeight() const { return m_viewportHeight; }
    float aspect() const;

    /// Unit vector from eye toward target
    glm::vec3 forward() const;

    /// Unit vector pointing to screen right
    glm::vec3 right() const;

    /// @}

private:
    glm::vec3 m_target = glm::vec3(0);
    glm::vec3 m_up = glm::vec3(0, 1, 0);
    float m_distance = 5.0f;
    float m_yaw = 0.0f;
    float m_pitch = 0.0f;
    float m_fov = 45.0f;
    float m_near = 0.1f;
    float m_far = 100.0f;
    float m_minDistance = 0.01f;
    float m_maxDistance = 1.0e5f;
    float m_pitchLimit = glm::radians(89.0f);  ///< Radians
    uint32_t m_viewportWidth = 1280;
    uint32_t m_viewportHeight = 720;
};

} // namespace facet
