module;

#include <cstdint>
#include <string_view>

export module Graphics:AssetErrors;

import Core;

export namespace Graphics
{
    // Failures of the asset layer (file decode and model import). Device-side
    // failures during upload collapse into UploadFailed.
    enum class AssetError : std::uint32_t
    {
        FileNotFound,
        DecodeFailed,
        UnsupportedFormat,
        UploadFailed,
        InvalidData
    };

    [[nodiscard]] constexpr std::string_view AssetErrorToString(AssetError e) noexcept
    {
        switch (e)
        {
            case AssetError::FileNotFound:      return "FileNotFound";
            case AssetError::DecodeFailed:      return "DecodeFailed";
            case AssetError::UnsupportedFormat: return "UnsupportedFormat";
            case AssetError::UploadFailed:      return "UploadFailed";
            case AssetError::InvalidData:       return "InvalidData";
        }
        return "Unknown";
    }

    // Engine-wide code for an asset failure, for callers that report through Core::Expected.
    [[nodiscard]] constexpr Core::ErrorCode ToErrorCode(AssetError e) noexcept
    {
        switch (e)
        {
            case AssetError::FileNotFound:      return Core::ErrorCode::FileNotFound;
            case AssetError::UploadFailed:      return Core::ErrorCode::ResourceUploadFailed;
            case AssetError::UnsupportedFormat: return Core::ErrorCode::InvalidFormat;
            case AssetError::DecodeFailed:
            case AssetError::InvalidData:       return Core::ErrorCode::AssetLoadFailed;
        }
        return Core::ErrorCode::Unknown;
    }
}
