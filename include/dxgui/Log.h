#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace dxgui::log {

struct LogConfig {
    std::filesystem::path file;         // empty: no file sink
    bool                  console = true;
    spdlog::level::level_enum level = spdlog::level::info;
};

// Installs the "dxgui" logger (rotating file 1MB * 4 and/or stderr).
// Replaces any logger created earlier by Get().
void Init(const LogConfig& cfg);

// The "dxgui" logger; created on first use with a stderr sink when the host
// never called Init().
std::shared_ptr<spdlog::logger> Get();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"); unknown names map to info.
spdlog::level::level_enum ParseLevel(const std::string& name);

} // namespace dxgui::log
