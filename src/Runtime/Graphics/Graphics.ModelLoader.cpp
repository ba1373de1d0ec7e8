module;
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

module Graphics:ModelLoader.Impl;
import :ModelLoader;
import :AssetErrors;
import :ResourceUploader;
import :FrameRenderer;
import :TextureLoader;
import :Importers.OBJ;
import Core;

namespace Graphics
{
    namespace
    {
        std::unordered_map<std::string, ObjMaterial> ReadMaterialLibraries(const std::filesystem::path& baseDir,
                                                                           const ObjModel& obj)
        {
            std::unordered_map<std::string, ObjMaterial> materials;
            for (const std::string& library : obj.MaterialLibraries)
            {
                const std::filesystem::path path = baseDir / library;
                auto text = Core::Filesystem::ReadTextFile(path);
                if (!text)
                {
                    Core::Log::Warn("ModelLoader: material library {} not found, using defaults.", path.string());
                    continue;
                }

                auto parsed = ParseMtl(*text);
                if (!parsed)
                {
                    Core::Log::Warn("ModelLoader: material library {} is empty or malformed.", path.string());
                    continue;
                }
                for (ObjMaterial& material : *parsed) materials[material.Name] = std::move(material);
            }
            return materials;
        }

        TextureHandle LoadOptionalTexture(const std::filesystem::path& baseDir, const std::string& relative,
                                          ResourceUploader& uploader, TextureFormat format, size_t& missing)
        {
            if (relative.empty()) return {};

            auto texture = TextureLoader::Load(baseDir / relative, uploader, format);
            if (!texture)
            {
                Core::Log::Error("ModelLoader: texture '{}' dropped ({}).", relative,
                                 AssetErrorToString(texture.error()));
                ++missing;
                return {};
            }
            return *texture;
        }
    }

    std::expected<LoadedModel, AssetError> ModelLoader::Load(const std::filesystem::path& filepath,
                                                             ResourceUploader& uploader)
    {
        auto text = Core::Filesystem::ReadTextFile(filepath);
        if (!text)
        {
            Core::Log::Error("ModelLoader: cannot read {}", filepath.string());
            return std::unexpected(AssetError::FileNotFound);
        }

        auto obj = ParseObj(*text);
        if (!obj)
        {
            Core::Log::Error("ModelLoader: {} is not a usable OBJ file ({}).", filepath.string(),
                             AssetErrorToString(obj.error()));
            return std::unexpected(obj.error());
        }

        const std::filesystem::path baseDir = filepath.parent_path();
        const auto libraries = ReadMaterialLibraries(baseDir, *obj);

        LoadedModel result;

        // Material per OBJ material name, built on first use.
        std::vector<std::optional<MaterialHandle>> materials(obj->MaterialNames.size());
        auto resolveMaterial = [&](uint32_t index) -> std::expected<MaterialHandle, AssetError>
        {
            if (materials[index]) return *materials[index];

            MaterialDesc desc;
            desc.Name = obj->MaterialNames[index];
            if (auto it = libraries.find(desc.Name); it != libraries.end())
            {
                desc.Diffuse = LoadOptionalTexture(baseDir, it->second.DiffuseTexture, uploader,
                                                   TextureFormat::Rgba8Srgb, result.MissingTextures);
                desc.Normal = LoadOptionalTexture(baseDir, it->second.NormalTexture, uploader,
                                                  TextureFormat::Rgba8Unorm, result.MissingTextures);
            }

            auto material = uploader.BuildMaterial(desc);
            if (!material) return std::unexpected(AssetError::UploadFailed);
            materials[index] = *material;
            return *material;
        };

        for (const MeshData& mesh : obj->Meshes)
        {
            const std::string label = filepath.filename().string() + ":" + mesh.Name;

            auto material = resolveMaterial(mesh.MaterialIndex);
            if (!material)
            {
                Core::Log::Error("ModelLoader: material for '{}' failed, mesh dropped.", label);
                ++result.DroppedMeshes;
                continue;
            }

            auto handle = uploader.UploadMesh(mesh.Vertices, mesh.Indices, label);
            if (!handle)
            {
                Core::Log::Error("ModelLoader: mesh '{}' dropped ({}).", label,
                                 Core::ErrorCodeToString(handle.error()));
                ++result.DroppedMeshes;
                continue;
            }
            result.Draws.push_back({*handle, *material});
        }

        if (result.Draws.empty())
        {
            Core::Log::Error("ModelLoader: no mesh of {} could be uploaded.", filepath.string());
            return std::unexpected(AssetError::UploadFailed);
        }

        Core::Log::Info("Loaded {}: {} meshes, {} dropped, {} textures replaced by defaults.", filepath.string(),
                        result.Draws.size(), result.DroppedMeshes, result.MissingTextures);
        return result;
    }
}
