#include <filesystem>
#include <string_view>

import Core;
import Runtime;

using namespace Core;

// TesseraViewer [--quiet] [model.obj]
int main(int argc, char** argv)
{
    Runtime::SceneDriverConfig config;
    config.Window = {"Tessera Viewer", 1280, 720};

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--quiet")
            Log::SetMinLevel(Log::Level::Warning);
        else
            config.ModelPath = arg;
    }

    auto driver = Runtime::SceneDriver::Create(config);
    if (!driver)
    {
        Log::Error("Viewer failed to start: {}", ErrorCodeToString(driver.error()));
        return 1;
    }

    Log::Info("Viewer running. WASD/arrows move, right drag looks, scroll zooms, Esc quits.");
    return (*driver)->Run();
}
