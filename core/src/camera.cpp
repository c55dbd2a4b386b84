#include <facet/camera.h>

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace facet {

// ============================================================================
// Navigation
// ============================================================================

void Camera::lookAt(glm::vec3 eye, glm::vec3 target) {
    glm::vec3 offset = eye - target;
    float len = glm::length(offset);
    if (!(len > 0.0f)) {
        throw std::invalid_argument("Camera::lookAt: eye and target coincide");
    }

    m_target = target;
    m_distance = glm::clamp(len, m_minDistance, m_maxDistance);
    m_yaw = std::atan2(offset.x, offset.z);
    m_pitch = glm::clamp(std::asin(glm::clamp(offset.y / len, -1.0f, 1.0f)),
                         -m_pitchLimit, m_pitchLimit);
}

void Camera::orbit(float deltaYaw, float deltaPitch) {
    m_yaw = std::remainder(m_yaw + deltaYaw, glm::two_pi<float>());
    m_pitch = glm::clamp(m_pitch + deltaPitch, -m_pitchLimit, m_pitchLimit);
}

namespace {

// Rotation taking +Z onto the eye offset direction for a yaw/pitch pair
glm::quat offsetRotation(float yaw, float pitch) {
    return glm::angleAxis(yaw, glm::vec3(0, 1, 0)) * glm::angleAxis(-pitch, glm::vec3(1, 0, 0));
}

} // namespace

void Camera::orbitAround(glm::vec3 pivot, float deltaYaw, float deltaPitch) {
    float yaw = std::remainder(m_yaw + deltaYaw, glm::two_pi<float>());
    float pitch = glm::clamp(m_pitch + deltaPitch, -m_pitchLimit, m_pitchLimit);

    glm::quat delta = offsetRotation(yaw, pitch) * glm::inverse(offsetRotation(m_yaw, m_pitch));
    m_target = pivot + delta * (m_target - pivot);
    m_yaw = yaw;
    m_pitch = pitch;
}

void Camera::pan(float deltaX, float deltaY) {
    // World units covered by one pixel at the target's depth
    float worldPerPixel = 2.0f * m_distance * std::tan(glm::radians(m_fov) * 0.5f) /
                          static_cast<float>(std::max(m_viewportHeight, 1u));

    glm::vec3 r = right();
    glm::vec3 u = glm::cross(r, forward());

    // Content follows the pointer, so the target moves against the drag
    m_target += (-r * deltaX + u * deltaY) * worldPerPixel;
}

void Camera::zoom(float delta) {
    float above = m_distance - m_minDistance;
    if (delta < 0.0f) {
        // Zooming out must move the eye even when it sits exactly at the minimum
        above = std::max(above, m_minDistance);
    }
    float scaled = above * std::pow(0.9f, delta);
    m_distance = glm::clamp(m_minDistance + scaled, m_minDistance, m_maxDistance);
}

void Camera::frame(const Bounds& bounds) {
    if (bounds.empty()) return;

    m_target = bounds.center();
    float radius = bounds.radius();
    if (radius > 0.0f) {
        float halfFov = glm::radians(m_fov) * 0.5f;
        distance(radius / std::sin(halfFov) * 1.1f);
    }
    fitPlanes(bounds);
}

void Camera::fitPlanes(const Bounds& bounds) {
    if (bounds.empty()) return;

    float radius = std::max(bounds.radius(), 1.0e-4f);
    float centerDistance = glm::length(bounds.center() - getEye());

    float farPlane = centerDistance + radius * 2.0f;
    float nearPlane = std::max(centerDistance - radius * 2.0f, farPlane * 1.0e-4f);
    nearPlane = std::min(nearPlane, m_distance * 0.5f);
    clipPlanes(nearPlane, farPlane);
}

// ============================================================================
// Parameters
// ============================================================================

void Camera::fov(float degrees) {
    if (!(degrees > 0.0f && degrees < 180.0f)) {
        throw std::invalid_argument("Camera::fov: " + std::to_string(degrees) +
                                    " is outside (0, 180)");
    }
    m_fov = degrees;
}

void Camera::clipPlanes(float nearPlane, float farPlane) {
    if (!(nearPlane > 0.0f) || !(farPlane > nearPlane)) {
        throw std::invalid_argument("Camera::clipPlanes: require 0 < near < far (near=" +
                                    std::to_string(nearPlane) + ", far=" +
                                    std::to_string(farPlane) + ")");
    }
    m_near = nearPlane;
    m_far = farPlane;
}

void Camera::viewport(uint32_t width, uint32_t height) {
    m_viewportWidth = width;
    m_viewportHeight = height;
}

void Camera::minDistance(float d) {
    if (!(d > 0.0f)) {
        throw std::invalid_argument("Camera::minDistance must be > 0");
    }
    m_minDistance = d;
    m_maxDistance = std::max(m_maxDistance, d);
    m_distance = std::max(m_distance, d);
}

void Camera::maxDistance(float d) {
    m_maxDistance = std::max(d, m_minDistance);
    m_distance = std::min(m_distance, m_maxDistance);
}

void Camera::pitchLimit(float degrees) {
    if (!(degrees > 0.0f && degrees < 90.0f)) {
        throw std::invalid_argument("Camera::pitchLimit must be in (0, 90)");
    }
    m_pitchLimit = glm::radians(degrees);
    m_pitch = glm::clamp(m_pitch, -m_pitchLimit, m_pitchLimit);
}

void Camera::distance(float d) {
    m_distance = glm::clamp(d, m_minDistance, m_maxDistance);
}

// ============================================================================
// Computed Matrices
// ============================================================================

glm::vec3 Camera::getEye() const {
    float cosPitch = std::cos(m_pitch);
    return m_target + m_distance * glm::vec3(
        cosPitch * std::sin(m_yaw),
        std::sin(m_pitch),
        cosPitch * std::cos(m_yaw)
    );
}

glm::vec3 Camera::forward() const {
    return glm::normalize(m_target - getEye());
}

glm::vec3 Camera::right() const {
    return glm::normalize(glm::cross(forward(), m_up));
}

float Camera::aspect() const {
    if (m_viewportHeight == 0) return 1.0f;
    return static_cast<float>(m_viewportWidth) / static_cast<float>(m_viewportHeight);
}

glm::mat4 Camera::viewMatrix() const {
    if (!(m_distance > 0.0f)) {
        throw std::logic_error("Camera::viewMatrix: distance to target is not positive");
    }
    return glm::lookAtRH(getEye(), m_target, m_up);
}

glm::mat4 Camera::inverseViewMatrix() const {
    glm::mat4 view = viewMatrix();
    glm::mat4 inv = glm::mat4(glm::transpose(glm::mat3(view)));
    inv[3] = glm::vec4(getEye(), 1.0f);
    return inv;
}

Ray Camera::rayThrough(glm::vec2 pixel) const {
    float width = static_cast<float>(std::max(m_viewportWidth, 1u));
    float height = static_cast<float>(std::max(m_viewportHeight, 1u));
    float ndcX = pixel.x / width * 2.0f - 1.0f;
    float ndcY = 1.0f - pixel.y / height * 2.0f;

    float tanHalf = std::tan(glm::radians(m_fov) * 0.5f);
    glm::vec3 up = glm::cross(right(), forward());
    glm::vec3 dir = forward() + right() * (ndcX * tanHalf * aspect()) + up * (ndcY * tanHalf);

    Ray ray;
    ray.origin = getEye();
    ray.direction = glm::normalize(dir);
    return ray;
}

glm::mat4 Camera::projectionMatrix(float aspect) const {
    if (!(aspect > 0.0f)) {
        throw std::invalid_argument("Camera::projectionMatrix: aspect must be > 0");
    }
    if (!(m_distance > 0.0f)) {
        throw std::logic_error("Camera::projectionMatrix: distance to target is not positive");
    }
    return glm::perspectiveRH_ZO(glm::radians(m_fov), aspect, m_near, m_far);
}

} // namespace facet
