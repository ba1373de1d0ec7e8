module;
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

export module Core:Filesystem;

import :Error;

export namespace Core::Filesystem
{
    // Directory that contains "assets/". Resolution order: cwd, parent of cwd, TESSERA_ROOT_DIR.
    [[nodiscard]] std::filesystem::path GetRoot();

    [[nodiscard]] std::string GetAssetPath(const std::string& relativePath);

    // Directory the build placed the compiled .spv files in.
    [[nodiscard]] std::filesystem::path GetShaderDirectory();

    [[nodiscard]] Expected<std::vector<std::byte>> ReadBinaryFile(const std::filesystem::path& path);
    [[nodiscard]] Expected<std::string> ReadTextFile(const std::filesystem::path& path);
}
