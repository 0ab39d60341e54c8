#include "dxgui/Log.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace dxgui::log {

static constexpr const char* kLoggerName = "dxgui";
static constexpr const char* kPattern    = "[%Y-%m-%d %H:%M:%S.%e][%l] %v";

static std::mutex g_mutex;
static std::shared_ptr<spdlog::logger> g_logger;

void Init(const LogConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!cfg.file.empty()) {
        std::error_code ec;
        if (cfg.file.has_parent_path())
            fs::create_directories(cfg.file.parent_path(), ec);
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file.string(), 1 << 20, 4)); // 1MB * 4
    }
    if (cfg.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(cfg.level);
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(g_mutex);
    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
    g_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> Get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = spdlog::get(kLoggerName);
        if (!g_logger) {
            g_logger = spdlog::stderr_color_mt(kLoggerName);
            g_logger->set_pattern(kPattern);
        }
    }
    return g_logger;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
    const auto lvl = spdlog::level::from_str(name);
    // from_str() returns off for anything it does not know.
    if (lvl == spdlog::level::off && name != "off")
        return spdlog::level::info;
    return lvl;
}

} // namespace dxgui::log
