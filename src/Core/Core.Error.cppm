module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it (device creation,
    //                          surface configuration, uploads, pipeline builds,
    //                          frame acquisition).
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome.
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no reference".
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //                          If violated, indicates a bug, not a runtime error.
    //
    // The failure site logs which resource and operation failed; the code
    // travels upward so callers can decide between retry and shutdown.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceUploadFailed = 102,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,
        InvalidPath = 203,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,
        ShaderCompilationFailed = 402,
        PipelineCreationFailed = 403,
        SwapchainOutOfDate = 404,
        SurfaceLost = 405,
        DeviceInitFailed = 406,
        SurfaceConfigFailed = 407,
        ShaderInterfaceMismatch = 408,
        StaleGpuMirror = 409,
        SurfaceMinimized = 410,

        // Asset errors (500-599)
        AssetLoadFailed = 501,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                 return "Success";
            case ErrorCode::OutOfMemory:             return "OutOfMemory";
            case ErrorCode::ResourceNotFound:        return "ResourceNotFound";
            case ErrorCode::ResourceUploadFailed:    return "ResourceUploadFailed";
            case ErrorCode::FileNotFound:            return "FileNotFound";
            case ErrorCode::FileReadError:           return "FileReadError";
            case ErrorCode::InvalidPath:             return "InvalidPath";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::InvalidState:            return "InvalidState";
            case ErrorCode::InvalidFormat:           return "InvalidFormat";
            case ErrorCode::OutOfRange:              return "OutOfRange";
            case ErrorCode::DeviceLost:              return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:       return "OutOfDeviceMemory";
            case ErrorCode::ShaderCompilationFailed: return "ShaderCompilationFailed";
            case ErrorCode::PipelineCreationFailed:  return "PipelineCreationFailed";
            case ErrorCode::SwapchainOutOfDate:      return "SwapchainOutOfDate";
            case ErrorCode::SurfaceLost:             return "SurfaceLost";
            case ErrorCode::DeviceInitFailed:        return "DeviceInitFailed";
            case ErrorCode::SurfaceConfigFailed:     return "SurfaceConfigFailed";
            case ErrorCode::ShaderInterfaceMismatch: return "ShaderInterfaceMismatch";
            case ErrorCode::StaleGpuMirror:          return "StaleGpuMirror";
            case ErrorCode::SurfaceMinimized:        return "SurfaceMinimized";
            case ErrorCode::AssetLoadFailed:         return "AssetLoadFailed";
            default:                                 return "Unknown";
        }
    }

    // Outdated/Lost surfaces are recovered by reconfiguring and retrying once.
    constexpr bool IsTransientSurfaceError(ErrorCode code)
    {
        return code == ErrorCode::SwapchainOutOfDate || code == ErrorCode::SurfaceLost;
    }

    // Errors after which the device cannot be used for further frames.
    constexpr bool IsFatalDeviceError(ErrorCode code)
    {
        return code == ErrorCode::DeviceLost || code == ErrorCode::OutOfDeviceMemory ||
               code == ErrorCode::OutOfMemory || code == ErrorCode::DeviceInitFailed;
    }

    // Type alias for common expected patterns
    template <typename T>
    using Expected = std::expected<T, ErrorCode>;

    // Helper to create success result
    template <typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    // Helper to create error result
    template <typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
