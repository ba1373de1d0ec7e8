module;
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <span>
#include <vector>

module Graphics:TextureLoader.Impl;
import :TextureLoader;
import :AssetErrors;
import :ResourceUploader;
import Core;

namespace Graphics
{
    std::expected<DecodedImage, AssetError> TextureLoader::Decode(std::span<const std::byte> encoded)
    {
        if (encoded.empty()) return std::unexpected(AssetError::InvalidData);

        int w = 0, h = 0, c = 0;
        // Force 4 channels (RGBA) for Vulkan compatibility
        stbi_uc* pixels = stbi_load_from_memory(reinterpret_cast<const stbi_uc*>(encoded.data()),
                                                static_cast<int>(encoded.size()), &w, &h, &c, STBI_rgb_alpha);
        if (!pixels)
        {
            Core::Log::Error("TextureLoader: decode failed: {}", stbi_failure_reason());
            return std::unexpected(AssetError::DecodeFailed);
        }

        DecodedImage image;
        image.Width = static_cast<uint32_t>(w);
        image.Height = static_cast<uint32_t>(h);
        image.Pixels.resize(static_cast<size_t>(w) * h * 4);
        std::memcpy(image.Pixels.data(), pixels, image.Pixels.size());
        stbi_image_free(pixels);

        return image;
    }

    std::expected<DecodedImage, AssetError> TextureLoader::ReadImage(const std::filesystem::path& filepath)
    {
        auto bytes = Core::Filesystem::ReadBinaryFile(filepath);
        if (!bytes)
        {
            Core::Log::Error("TextureLoader: Failed to load {}", filepath.string());
            return std::unexpected(AssetError::FileNotFound);
        }

        auto image = Decode(*bytes);
        if (!image) Core::Log::Error("TextureLoader: {} is not a readable image.", filepath.string());
        return image;
    }

    std::expected<TextureHandle, AssetError> TextureLoader::Load(const std::filesystem::path& filepath,
                                                                 ResourceUploader& uploader, TextureFormat format)
    {
        auto image = ReadImage(filepath);
        if (!image) return std::unexpected(image.error());

        auto handle = uploader.UploadTexture(image->Pixels, image->Width, image->Height, format,
                                             filepath.filename().string());
        if (!handle) return std::unexpected(AssetError::UploadFailed);
        return *handle;
    }
}
