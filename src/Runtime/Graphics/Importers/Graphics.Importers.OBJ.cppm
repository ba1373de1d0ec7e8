module;
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

export module Graphics:Importers.OBJ;

import :Geometry;
import :AssetErrors;

export namespace Graphics
{
    // One `newmtl` block. Texture paths are as written, relative to the .mtl file.
    struct ObjMaterial
    {
        std::string Name;
        std::string DiffuseTexture;  // map_Kd
        std::string NormalTexture;   // map_Bump / bump / norm
    };

    struct ObjModel
    {
        // One mesh per material used by the file; MeshData::MaterialIndex indexes MaterialNames.
        std::vector<MeshData> Meshes;
        std::vector<std::string> MaterialNames;
        std::vector<std::string> MaterialLibraries;  // mtllib entries
        bool HadNormals = false;
    };

    // Polygons are fanned into triangles, p/t/n triples are de-duplicated per mesh,
    // missing normals are averaged from face normals, V is flipped to a top-left
    // origin and tangents are computed. Negative (relative) indices are accepted.
    [[nodiscard]] std::expected<ObjModel, AssetError> ParseObj(std::string_view text);

    [[nodiscard]] std::expected<std::vector<ObjMaterial>, AssetError> ParseMtl(std::string_view text);
}
