module;
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

module Core:Filesystem.Impl;
import :Filesystem;
import :Error;
import :Logging;

namespace Core::Filesystem
{
    std::filesystem::path GetRoot()
    {
        // Binary release layout
        if (std::filesystem::exists("assets"))
        {
            return std::filesystem::current_path();
        }

        // Running from build/bin
        if (std::filesystem::exists("../assets"))
        {
            return std::filesystem::current_path().parent_path();
        }

#ifdef TESSERA_ROOT_DIR
        return std::filesystem::path(TESSERA_ROOT_DIR);
#else
        return std::filesystem::current_path();
#endif
    }

    std::string GetAssetPath(const std::string& relativePath)
    {
        auto path = GetRoot() / relativePath;
        return path.string();
    }

    std::filesystem::path GetShaderDirectory()
    {
#ifdef TESSERA_SHADER_DIR
        std::filesystem::path built(TESSERA_SHADER_DIR);
        if (std::filesystem::exists(built)) return built;
#endif
        return GetRoot() / "shaders";
    }

    Expected<std::vector<std::byte>> ReadBinaryFile(const std::filesystem::path& path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            Log::Error("File not found: {}", path.string());
            return std::unexpected(ErrorCode::FileNotFound);
        }

        std::ifstream file(path, std::ios::ate | std::ios::binary);
        if (!file.is_open())
        {
            Log::Error("Failed to open file: {}", path.string());
            return std::unexpected(ErrorCode::FileReadError);
        }

        const auto size = static_cast<size_t>(file.tellg());
        std::vector<std::byte> buffer(size);
        file.seekg(0);
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
        if (!file)
        {
            Log::Error("Short read on file: {}", path.string());
            return std::unexpected(ErrorCode::FileReadError);
        }
        return buffer;
    }

    Expected<std::string> ReadTextFile(const std::filesystem::path& path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            Log::Error("Failed to open file: {}", path.string());
            return std::unexpected(ErrorCode::FileNotFound);
        }
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }
}
