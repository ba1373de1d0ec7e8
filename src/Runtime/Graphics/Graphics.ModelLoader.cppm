module;
#include <cstddef>
#include <expected>
#include <filesystem>
#include <vector>

export module Graphics:ModelLoader;

import :AssetErrors;
import :ResourceUploader;
import :FrameRenderer;

export namespace Graphics
{
    struct LoadedModel
    {
        std::vector<DrawItem> Draws;      // One per uploaded mesh
        size_t DroppedMeshes = 0;         // Meshes whose upload failed
        size_t MissingTextures = 0;       // Texture references replaced by a default
    };

    class ModelLoader
    {
    public:
        // Reads an OBJ (+ its MTL libraries and textures) and uploads it. Assets that fail
        // are dropped with an error log; the call fails only if no mesh survives.
        [[nodiscard]] static std::expected<LoadedModel, AssetError> Load(const std::filesystem::path& filepath,
                                                                         ResourceUploader& uploader);
    };
}
