#include <facet/scene.h>
#include <facet/errors.h>

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace facet {

namespace {

// Moller-Trumbore; returns the ray parameter of the hit
std::optional<float> intersect(const Ray& ray, const glm::vec3& a, const glm::vec3& b,
                               const glm::vec3& c) {
    const float eps = 1.0e-9f;
    glm::vec3 e1 = b - a;
    glm::vec3 e2 = c - a;
    glm::vec3 p = glm::cross(ray.direction, e2);
    float det = glm::dot(e1, p);
    if (std::abs(det) < eps) return std::nullopt;

    float inv = 1.0f / det;
    glm::vec3 s = ray.origin - a;
    float u = glm::dot(s, p) * inv;
    if (u < 0.0f || u > 1.0f) return std::nullopt;

    glm::vec3 q = glm::cross(s, e1);
    float v = glm::dot(ray.direction, q) * inv;
    if (v < 0.0f || u + v > 1.0f) return std::nullopt;

    float t = glm::dot(e2, q) * inv;
    if (t <= 0.0f) return std::nullopt;
    return t;
}

} // namespace

void SceneState::replaceModel(ModelId id, Mesh mesh) {
    validateMesh(mesh);

    Model model(std::move(mesh));
    auto it = m_models.find(id);
    if (it != m_models.end()) {
        model.transform = it->second.model.transform;
    }
    replaceModel(id, std::move(model));
}

void SceneState::replaceModel(ModelId id, Model model) {
    if (model.meshes.empty()) {
        throw InvalidMeshError("model " + std::to_string(id) + " has no meshes");
    }
    for (const auto& mesh : model.meshes) {
        if (!mesh) {
            throw InvalidMeshError("model " + std::to_string(id) + " contains a null mesh");
        }
        validateMesh(*mesh);
    }

    const bool wasEmpty = m_models.empty();

    SceneModel& entry = m_models[id];
    entry.model = std::move(model);
    entry.generation = m_nextGeneration++;
    ++m_revision;

    if (wasEmpty) {
        m_camera.frame(entry.model.worldBounds());
    }
}

bool SceneState::removeModel(ModelId id) {
    if (m_models.erase(id) == 0) return false;
    ++m_revision;
    return true;
}

void SceneState::setTransform(ModelId id, const Transform& transform) {
    require(id).model.transform = transform;
    ++m_revision;
}

void SceneState::recolorModel(ModelId id, const glm::vec4& color) {
    SceneModel& entry = require(id);
    for (auto& mesh : entry.model.meshes) {
        mesh = std::make_shared<const Mesh>(mesh->recolored(color));
    }
    entry.generation = m_nextGeneration++;
    ++m_revision;
}

void SceneState::setCamera(const Camera& camera) {
    m_camera = camera;
    ++m_revision;
}

void SceneState::setLights(const Lights& lights) {
    if (glm::length(lights.direction) <= 0.0f) {
        throw std::invalid_argument("SceneState::setLights: light direction is zero");
    }
    if (lights.intensity < 0.0f || lights.ambientIntensity < 0.0f) {
        throw std::invalid_argument("SceneState::setLights: negative intensity");
    }
    m_lights = lights;
    ++m_revision;
}

void SceneState::clear() {
    if (m_models.empty()) return;
    m_models.clear();
    ++m_revision;
}

const SceneModel* SceneState::find(ModelId id) const {
    auto it = m_models.find(id);
    return it != m_models.end() ? &it->second : nullptr;
}

Bounds SceneState::bounds() const {
    Bounds b;
    for (const auto& [id, entry] : m_models) {
        b.expand(entry.model.worldBounds());
    }
    return b;
}

std::optional<glm::vec3> SceneState::raycast(const Ray& ray) const {
    float nearest = std::numeric_limits<float>::max();
    bool hit = false;

    for (const auto& [id, entry] : m_models) {
        glm::mat4 m = entry.model.transform.matrix();
        for (const auto& mesh : entry.model.meshes) {
            if (!mesh->bounds().transformed(m).hits(ray)) continue;

            std::vector<glm::vec3> world;
            world.reserve(mesh->vertexCount());
            for (const Vertex& v : mesh->vertices()) {
                world.push_back(glm::vec3(m * glm::vec4(v.position, 1.0f)));
            }

            const auto& indices = mesh->indices();
            for (size_t i = 0; i + 2 < indices.size(); i += 3) {
                auto t = intersect(ray, world[indices[i]], world[indices[i + 1]], world[indices[i + 2]]);
                if (t && *t < nearest) {
                    nearest = *t;
                    hit = true;
                }
            }
        }
    }

    if (!hit) return std::nullopt;
    return ray.origin + ray.direction * nearest;
}

SceneModel& SceneState::require(ModelId id) {
    auto it = m_models.find(id);
    if (it == m_models.end()) {
        throw std::out_of_range("SceneState: no model with id " + std::to_string(id));
    }
    return it->second;
}

} // namespace facet
