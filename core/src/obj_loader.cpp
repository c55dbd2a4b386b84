#include <facet/obj_loader.h>
#include <facet/errors.h>

#include <assimp/Importer.hpp>
#include <assimp/scene.h>
#include <assimp/postprocess.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace facet {

namespace {

// Convert Assimp matrix to GLM
glm::mat4 aiToGlm(const aiMatrix4x4& m) {
    return glm::mat4(
        m.a1, m.b1, m.c1, m.d1,
        m.a2, m.b2, m.c2, m.d2,
        m.a3, m.b3, m.c3, m.d3,
        m.a4, m.b4, m.c4, m.d4
    );
}

void processMesh(const aiMesh* mesh, const aiMatrix4x4& transform, const glm::vec4& color,
                 std::vector<Vertex>& vertices, std::vector<uint32_t>& indices) {
    const uint32_t baseIndex = static_cast<uint32_t>(vertices.size());

    glm::mat4 mat = aiToGlm(transform);
    glm::mat3 normalMat = glm::transpose(glm::inverse(glm::mat3(mat)));

    for (unsigned int i = 0; i < mesh->mNumVertices; ++i) {
        Vertex vertex;

        aiVector3D pos = mesh->mVertices[i];
        vertex.position = glm::vec3(mat * glm::vec4(pos.x, pos.y, pos.z, 1.0f));

        // Normals stay as the file (or flat generation) supplies them
        if (mesh->HasNormals()) {
            aiVector3D norm = mesh->mNormals[i];
            vertex.normal = normalMat * glm::vec3(norm.x, norm.y, norm.z);
        }

        if (mesh->HasVertexColors(0)) {
            const aiColor4D& c = mesh->mColors[0][i];
            vertex.color = glm::vec4(c.r, c.g, c.b, c.a);
        } else {
            vertex.color = color;
        }

        vertices.push_back(vertex);
    }

    // Fan-triangulate polygons; points and lines carry no surface
    for (unsigned int i = 0; i < mesh->mNumFaces; ++i) {
        const aiFace& face = mesh->mFaces[i];
        for (unsigned int j = 1; j + 1 < face.mNumIndices; ++j) {
            indices.push_back(baseIndex + face.mIndices[0]);
            indices.push_back(baseIndex + face.mIndices[j]);
            indices.push_back(baseIndex + face.mIndices[j + 1]);
        }
    }
}

void processNode(const aiNode* node, const aiScene* scene, const aiMatrix4x4& parentTransform,
                 const glm::vec4& color, std::vector<Vertex>& vertices,
                 std::vector<uint32_t>& indices) {
    aiMatrix4x4 nodeTransform = parentTransform * node->mTransformation;

    for (unsigned int i = 0; i < node->mNumMeshes; ++i) {
        processMesh(scene->mMeshes[node->mMeshes[i]], nodeTransform, color, vertices, indices);
    }

    for (unsigned int i = 0; i < node->mNumChildren; ++i) {
        processNode(node->mChildren[i], scene, nodeTransform, color, vertices, indices);
    }
}

} // namespace

Mesh parseObj(const std::string& text, const glm::vec4& color, const std::string& name) {
    Assimp::Importer importer;

    // No aiProcess_Triangulate: polygons are fanned in processMesh
    unsigned int flags =
        aiProcess_GenNormals |
        aiProcess_JoinIdenticalVertices |
        aiProcess_ValidateDataStructure;

    const aiScene* scene = importer.ReadFileFromMemory(text.data(), text.size(), flags, "obj");

    if (!scene || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !scene->mRootNode) {
        throw InvalidMeshError("OBJ import of '" + name + "' failed: " + importer.GetErrorString());
    }

    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    aiMatrix4x4 identity;
    processNode(scene->mRootNode, scene, identity, color, vertices, indices);

    if (vertices.empty() || indices.empty()) {
        throw InvalidMeshError("OBJ '" + name + "' contains no triangles");
    }

    Mesh mesh(std::move(vertices), std::move(indices), name);
    validateMesh(mesh);
    return mesh;
}

Mesh loadObj(const std::string& path, const glm::vec4& color) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InvalidMeshError("cannot open OBJ file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Mesh mesh = parseObj(buffer.str(), color, path);

    std::cout << "[ObjLoader] Loaded " << path << "\n";
    std::cout << "[ObjLoader]   " << mesh.vertexCount() << " vertices, "
              << mesh.triangleCount() << " triangles" << std::endl;
    return mesh;
}

} // namespace facet
