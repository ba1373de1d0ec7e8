module;
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>

module Graphics:Importers.OBJ.Impl;
import :Importers.OBJ;
import :Geometry;
import :AssetErrors;
import Core;

namespace Graphics
{
    namespace
    {
        struct VertexKey
        {
            int p = -1, n = -1, t = -1;
            bool operator==(const VertexKey& other) const { return p == other.p && n == other.n && t == other.t; }
        };

        struct VertexKeyHash
        {
            size_t operator()(const VertexKey& k) const
            {
                return std::hash<int>()(k.p) ^ (std::hash<int>()(k.n) << 1) ^ (std::hash<int>()(k.t) << 2);
            }
        };

        struct MeshBuilder
        {
            MeshData Mesh;
            std::unordered_map<VertexKey, uint32_t, VertexKeyHash> UniqueVertices;
        };

        // OBJ indices are 1-based; negative values count back from the end.
        bool ResolveIndex(std::string_view token, size_t count, int& out)
        {
            if (token.empty()) return true;

            int value = 0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (ec != std::errc() || value == 0) return false;

            out = value > 0 ? value - 1 : static_cast<int>(count) + value;
            return out >= 0 && static_cast<size_t>(out) < count;
        }

        std::string_view Trim(std::string_view s)
        {
            const auto begin = s.find_first_not_of(" \t\r");
            if (begin == std::string_view::npos) return {};
            const auto end = s.find_last_not_of(" \t\r");
            return s.substr(begin, end - begin + 1);
        }

        // Texture statements may carry options (-bm 1.0 ...); the path is the last token.
        std::string LastToken(std::istringstream& ss)
        {
            std::string token, last;
            while (ss >> token) last = token;
            return last;
        }

        void ComputeVertexNormals(MeshData& mesh)
        {
            for (ModelVertex& v : mesh.Vertices) v.Normal = glm::vec3(0.0f);

            for (size_t i = 0; i + 2 < mesh.Indices.size(); i += 3)
            {
                ModelVertex& a = mesh.Vertices[mesh.Indices[i]];
                ModelVertex& b = mesh.Vertices[mesh.Indices[i + 1]];
                ModelVertex& c = mesh.Vertices[mesh.Indices[i + 2]];
                const glm::vec3 faceNormal = glm::cross(b.Position - a.Position, c.Position - a.Position);
                a.Normal += faceNormal;
                b.Normal += faceNormal;
                c.Normal += faceNormal;
            }

            for (ModelVertex& v : mesh.Vertices)
            {
                const float len = glm::length(v.Normal);
                v.Normal = len > 0.0f ? v.Normal / len : glm::vec3(0.0f, 1.0f, 0.0f);
            }
        }
    }

    std::expected<ObjModel, AssetError> ParseObj(std::string_view text)
    {
        std::istringstream stream{std::string{text}};

        std::vector<glm::vec3> tempPos;
        std::vector<glm::vec3> tempNorm;
        std::vector<glm::vec2> tempUV;

        ObjModel model;
        std::vector<MeshBuilder> builders;
        std::unordered_map<std::string, uint32_t> materialIndex;
        uint32_t currentMaterial = 0;
        bool materialSelected = false;
        bool allFacesHaveNormals = true;

        auto selectMaterial = [&](const std::string& name)
        {
            auto it = materialIndex.find(name);
            if (it == materialIndex.end())
            {
                const auto index = static_cast<uint32_t>(model.MaterialNames.size());
                it = materialIndex.emplace(name, index).first;
                model.MaterialNames.push_back(name);
                builders.emplace_back();
                builders.back().Mesh.Name = name;
                builders.back().Mesh.MaterialIndex = index;
            }
            currentMaterial = it->second;
            materialSelected = true;
        };

        std::string line;
        size_t lineNumber = 0;
        while (std::getline(stream, line))
        {
            ++lineNumber;
            if (line.empty() || line[0] == '#') continue;
            std::istringstream ss(line);
            std::string type;
            ss >> type;

            if (type == "v")
            {
                glm::vec3 v;
                ss >> v.x >> v.y >> v.z;
                tempPos.push_back(v);
            }
            else if (type == "vn")
            {
                glm::vec3 vn;
                ss >> vn.x >> vn.y >> vn.z;
                tempNorm.push_back(vn);
            }
            else if (type == "vt")
            {
                glm::vec2 vt;
                ss >> vt.x >> vt.y;
                tempUV.push_back(vt);
            }
            else if (type == "usemtl")
            {
                std::string name;
                ss >> name;
                selectMaterial(name);
            }
            else if (type == "mtllib")
            {
                std::string rest;
                std::getline(ss, rest);
                if (auto lib = Trim(rest); !lib.empty()) model.MaterialLibraries.emplace_back(lib);
            }
            else if (type == "f")
            {
                if (!materialSelected) selectMaterial("");
                MeshBuilder& builder = builders[currentMaterial];

                std::string vertexStr;
                std::vector<uint32_t> faceIndices;

                while (ss >> vertexStr)
                {
                    const std::string_view vs = vertexStr;
                    const size_t s1 = vs.find('/');
                    const size_t s2 = s1 == std::string_view::npos ? std::string_view::npos : vs.find('/', s1 + 1);

                    VertexKey key;
                    const std::string_view pTok = vs.substr(0, s1);
                    const std::string_view tTok = s1 == std::string_view::npos
                                                      ? std::string_view{}
                                                      : vs.substr(s1 + 1, s2 == std::string_view::npos
                                                                              ? std::string_view::npos
                                                                              : s2 - s1 - 1);
                    const std::string_view nTok = s2 == std::string_view::npos ? std::string_view{} : vs.substr(s2 + 1);

                    if (pTok.empty() || !ResolveIndex(pTok, tempPos.size(), key.p) ||
                        !ResolveIndex(tTok, tempUV.size(), key.t) || !ResolveIndex(nTok, tempNorm.size(), key.n))
                    {
                        Core::Log::Error("OBJ: bad face vertex '{}' on line {}.", vertexStr, lineNumber);
                        return std::unexpected(AssetError::InvalidData);
                    }
                    if (key.n < 0) allFacesHaveNormals = false;

                    auto it = builder.UniqueVertices.find(key);
                    if (it == builder.UniqueVertices.end())
                    {
                        const auto idx = static_cast<uint32_t>(builder.Mesh.Vertices.size());
                        it = builder.UniqueVertices.emplace(key, idx).first;

                        ModelVertex vertex;
                        vertex.Position = tempPos[key.p];
                        if (key.t >= 0) vertex.TexCoord = {tempUV[key.t].x, 1.0f - tempUV[key.t].y};
                        if (key.n >= 0) vertex.Normal = tempNorm[key.n];
                        builder.Mesh.Vertices.push_back(vertex);
                    }
                    faceIndices.push_back(it->second);
                }

                if (faceIndices.size() < 3)
                {
                    Core::Log::Error("OBJ: face with {} vertices on line {}.", faceIndices.size(), lineNumber);
                    return std::unexpected(AssetError::InvalidData);
                }

                for (size_t i = 1; i + 1 < faceIndices.size(); ++i)
                {
                    builder.Mesh.Indices.push_back(faceIndices[0]);
                    builder.Mesh.Indices.push_back(faceIndices[i]);
                    builder.Mesh.Indices.push_back(faceIndices[i + 1]);
                }
            }
            // o, g, s, l and anything else carry nothing this loader uses.
        }

        for (MeshBuilder& builder : builders)
        {
            if (builder.Mesh.Indices.empty()) continue;
            if (!allFacesHaveNormals) ComputeVertexNormals(builder.Mesh);
            ComputeTangents(builder.Mesh.Vertices, builder.Mesh.Indices);
            model.Meshes.push_back(std::move(builder.Mesh));
        }

        if (model.Meshes.empty())
            return std::unexpected(AssetError::InvalidData);

        model.HadNormals = allFacesHaveNormals;
        return model;
    }

    std::expected<std::vector<ObjMaterial>, AssetError> ParseMtl(std::string_view text)
    {
        std::istringstream stream{std::string{text}};
        std::vector<ObjMaterial> materials;

        std::string line;
        while (std::getline(stream, line))
        {
            if (line.empty() || line[0] == '#') continue;
            std::istringstream ss(line);
            std::string type;
            ss >> type;

            if (type == "newmtl")
            {
                ObjMaterial material;
                ss >> material.Name;
                materials.push_back(std::move(material));
                continue;
            }

            if (materials.empty()) continue;
            ObjMaterial& current = materials.back();

            if (type == "map_Kd")
            {
                current.DiffuseTexture = LastToken(ss);
            }
            else if (type == "map_Bump" || type == "map_bump" || type == "bump" || type == "norm")
            {
                current.NormalTexture = LastToken(ss);
            }
        }

        if (materials.empty()) return std::unexpected(AssetError::InvalidData);
        return materials;
    }
}
