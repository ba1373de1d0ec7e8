module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <vector>

export module Graphics:TextureLoader;

import :AssetErrors;
import :ResourceUploader;

export namespace Graphics
{
    // RGBA8, top row first.
    struct DecodedImage
    {
        std::vector<uint8_t> Pixels;
        uint32_t Width = 0;
        uint32_t Height = 0;
    };

    class TextureLoader
    {
    public:
        // Any format stb_image reads; always expanded to 4 channels.
        [[nodiscard]] static std::expected<DecodedImage, AssetError> Decode(std::span<const std::byte> encoded);

        [[nodiscard]] static std::expected<DecodedImage, AssetError> ReadImage(const std::filesystem::path& filepath);

        // Decode + ResourceUploader::UploadTexture.
        [[nodiscard]] static std::expected<TextureHandle, AssetError> Load(const std::filesystem::path& filepath,
                                                                           ResourceUploader& uploader,
                                                                           TextureFormat format);
    };
}
