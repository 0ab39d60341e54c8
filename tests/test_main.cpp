// tests/test_main.cpp
//
// The only translation unit that defines DOCTEST_CONFIG_IMPLEMENT; the other
// test files include doctest without it.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include "dxgui/Log.h"

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

#ifndef NOMINMAX
    #define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h> // IsDebuggerPresent

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS")) ||
           env_truthy(std::getenv("TF_BUILD"));
}

} // namespace

int main(int argc, char** argv) {
    // Renderer info/debug chatter drowns the test report; DXGUI_TEST_LOG=1 brings it back.
    dxgui::log::LogConfig logCfg;
    logCfg.level = env_truthy(std::getenv("DXGUI_TEST_LOG")) ? spdlog::level::debug
                                                              : spdlog::level::warn;
    dxgui::log::Init(logCfg);

    doctest::Context context;

    context.setOption("order-by", "name");
    context.setOption("duration", true);
    context.setOption("no-path-filenames", true);

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    if (::IsDebuggerPresent() != FALSE) {
        context.setOption("no-breaks", false);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();
    spdlog::shutdown();
    return res;
}
