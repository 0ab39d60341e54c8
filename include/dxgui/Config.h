#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

namespace dxgui {

struct RendererConfig {
    std::size_t vertexSlack  = 5000;   // extra vertices allocated on every growth
    std::size_t indexSlack   = 10000;  // extra indices allocated on every growth
    std::string rendererName = "dxgui_d3d11";
    std::string logLevel     = "info";
    std::string logFile;               // empty: no file sink
    bool        logConsole   = true;
};

// Reads <dir>/dxgui.ini. Returns false when the file is missing or unreadable;
// keys that fail to parse keep their current values.
bool LoadConfig(RendererConfig& cfg, const std::filesystem::path& dir);
bool SaveConfig(const RendererConfig& cfg, const std::filesystem::path& dir);

} // namespace dxgui
