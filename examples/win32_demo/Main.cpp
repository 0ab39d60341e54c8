// Win32 host for the dxgui renderer: one window, the ImGui Win32 platform
// backend, a registered checkerboard texture and a custom draw callback.

#include "DemoDevice.h"

#include "dxgui/Config.h"
#include "dxgui/HrCheck.h"
#include "dxgui/Log.h"
#include "dxgui/Renderer.h"

#include <imgui.h>
#include <imgui_impl_win32.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <vector>

extern IMGUI_IMPL_API LRESULT ImGui_ImplWin32_WndProcHandler(HWND hWnd, UINT msg, WPARAM wParam, LPARAM lParam);

using Microsoft::WRL::ComPtr;

namespace {

struct DemoState {
    DemoDevice gfx;
    std::unique_ptr<dxgui::Renderer> renderer;
    UINT width = 1280;
    UINT height = 720;
    bool vsync = true;

    // Deferred out of WndProc; GPU work happens between frames.
    bool  fontRebuildRequested = false;
    float requestedFontScale = 1.0f;
    float fontScale = 1.0f; // scale of the atlas the renderer has bound
};

DemoState* g_state = nullptr;

std::filesystem::path ExeDir()
{
    std::wstring buf(MAX_PATH, L'\0');
    DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    while (n >= buf.size())
    {
        buf.resize(buf.size() * 2);
        n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    }
    if (n == 0)
        return std::filesystem::current_path();
    buf.resize(n);
    return std::filesystem::path(buf).parent_path();
}

// Two-grey checkerboard, `cell` pixels per square.
ComPtr<ID3D11ShaderResourceView> CreateCheckerboard(ID3D11Device* dev, UINT size, UINT cell)
{
    std::vector<std::uint32_t> pixels(static_cast<size_t>(size) * size);
    for (UINT y = 0; y < size; ++y)
        for (UINT x = 0; x < size; ++x)
            pixels[static_cast<size_t>(y) * size + x] = (((x / cell) + (y / cell)) & 1u) ? 0xff404040u : 0xffc0c0c0u;

    D3D11_TEXTURE2D_DESC td{};
    td.Width = size;
    td.Height = size;
    td.MipLevels = 1;
    td.ArraySize = 1;
    td.Format = DXGI_FORMAT_R8G8B8A8_UNORM;
    td.SampleDesc.Count = 1;
    td.Usage = D3D11_USAGE_IMMUTABLE;
    td.BindFlags = D3D11_BIND_SHADER_RESOURCE;

    D3D11_SUBRESOURCE_DATA init{};
    init.pSysMem = pixels.data();
    init.SysMemPitch = size * 4;

    ComPtr<ID3D11Texture2D> tex;
    DXGUI_HR_CHECK(dev->CreateTexture2D(&td, &init, tex.GetAddressOf()));
    ComPtr<ID3D11ShaderResourceView> srv;
    DXGUI_HR_CHECK(dev->CreateShaderResourceView(tex.Get(), nullptr, srv.GetAddressOf()));
    return srv;
}

// Runs mid-frame on the immediate context and unbinds state the renderer
// relies on; the ImDrawCallback_ResetRenderState command after it rebinds.
void UnbindCallback(const ImDrawList*, const ImDrawCmd* cmd)
{
    auto* ctx = static_cast<ID3D11DeviceContext*>(cmd->UserCallbackData);
    ID3D11ShaderResourceView* none = nullptr;
    ctx->PSSetShaderResources(0, 1, &none);
    ctx->RSSetState(nullptr);
}

LRESULT CALLBACK WndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    if (ImGui_ImplWin32_WndProcHandler(hwnd, msg, wParam, lParam))
        return 1;

    switch (msg)
    {
    case WM_SIZE:
        if (g_state && wParam != SIZE_MINIMIZED)
        {
            g_state->width = LOWORD(lParam);
            g_state->height = HIWORD(lParam);
            g_state->gfx.Resize(g_state->width, g_state->height);
        }
        return 0;
    case WM_DPICHANGED:
        if (g_state)
        {
            g_state->requestedFontScale = static_cast<float>(HIWORD(wParam)) / 96.0f;
            g_state->fontRebuildRequested = true;
            const RECT* suggested = reinterpret_cast<const RECT*>(lParam);
            ::SetWindowPos(hwnd, nullptr, suggested->left, suggested->top,
                           suggested->right - suggested->left, suggested->bottom - suggested->top,
                           SWP_NOZORDER | SWP_NOACTIVATE);
        }
        return 0;
    case WM_SYSCOMMAND:
        if ((wParam & 0xfff0) == SC_KEYMENU) // no ALT menu
            return 0;
        break;
    case WM_DESTROY:
        ::PostQuitMessage(0);
        return 0;
    default:
        break;
    }
    return ::DefWindowProcW(hwnd, msg, wParam, lParam);
}

void ConfigureFonts(float scale)
{
    ImGuiIO& io = ImGui::GetIO();
    io.Fonts->Clear();
    ImFontConfig cfg;
    cfg.SizePixels = 13.0f * scale;
    io.Fonts->AddFontDefault(&cfg);
    ImGui::GetStyle() = ImGuiStyle();
    ImGui::StyleColorsDark();
    ImGui::GetStyle().ScaleAllSizes(scale);
}

// On failure the CPU atlas is rebuilt at the old scale so its glyph data
// matches the texture the renderer still has bound.
void RebuildFonts(DemoState& state, float scale)
{
    ConfigureFonts(scale);
    try
    {
        state.renderer->RebuildFontTexture();
        state.fontScale = scale;
        dxgui::log::Get()->info("Font atlas rebuilt at scale {:.2f}", scale);
    }
    catch (const dxgui::GpuError& e)
    {
        dxgui::log::Get()->error("Font rebuild at scale {:.2f} failed, keeping {:.2f}: {}",
                                 scale, state.fontScale, e.what());
        ConfigureFonts(state.fontScale);
        ImFontAtlas& fonts = *ImGui::GetIO().Fonts;
        unsigned char* pixels = nullptr;
        int width = 0, height = 0;
        fonts.GetTexDataAsRGBA32(&pixels, &width, &height);
        fonts.SetTexID(dxgui::ToImTextureID(dxgui::kFontTextureId));
    }
}

void DrawUi(DemoState& state, dxgui::TextureId checker)
{
    ImGui::Begin("dxgui");
    ImGui::Text("%.1f FPS", ImGui::GetIO().Framerate);
    ImGui::Text("Vertex capacity: %zu", state.renderer->VertexCapacity());
    ImGui::Text("Index capacity:  %zu", state.renderer->IndexCapacity());
    ImGui::Text("Registered textures: %zu", state.renderer->Textures().Size());
    ImGui::Checkbox("VSync", &state.vsync);
    ImGui::Image(dxgui::ToImTextureID(checker), ImVec2(128, 128));

    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->AddCallback(UnbindCallback, state.gfx.Context());
    dl->AddCallback(ImDrawCallback_ResetRenderState, nullptr);
    ImGui::TextUnformatted("Drawn after a custom callback.");
    ImGui::End();

    ImGui::ShowDemoWindow();
}

int Run(HINSTANCE hInst)
{
    const std::filesystem::path exeDir = ExeDir();

    dxgui::RendererConfig cfg;
    if (!dxgui::LoadConfig(cfg, exeDir))
        (void)dxgui::SaveConfig(cfg, exeDir);

    dxgui::log::LogConfig logCfg;
    logCfg.console = cfg.logConsole;
    logCfg.level = dxgui::log::ParseLevel(cfg.logLevel);
    if (!cfg.logFile.empty())
        logCfg.file = exeDir / cfg.logFile;
    dxgui::log::Init(logCfg);

    ImGui_ImplWin32_EnableDpiAwareness();

    WNDCLASSEXW wc{};
    wc.cbSize = sizeof(wc);
    wc.style = CS_CLASSDC;
    wc.lpfnWndProc = WndProc;
    wc.hInstance = hInst;
    wc.hCursor = ::LoadCursorW(nullptr, IDC_ARROW);
    wc.lpszClassName = L"DxguiDemoWindow";
    ::RegisterClassExW(&wc);

    DemoState state;
    g_state = &state;

    RECT wr{ 0, 0, static_cast<LONG>(state.width), static_cast<LONG>(state.height) };
    ::AdjustWindowRect(&wr, WS_OVERLAPPEDWINDOW, FALSE);
    HWND hwnd = ::CreateWindowExW(0, wc.lpszClassName, L"dxgui Direct3D 11 demo", WS_OVERLAPPEDWINDOW,
                                  CW_USEDEFAULT, CW_USEDEFAULT, wr.right - wr.left, wr.bottom - wr.top,
                                  nullptr, nullptr, hInst, nullptr);
    if (!hwnd)
    {
        dxgui::log::Get()->critical("CreateWindowExW failed ({})", ::GetLastError());
        return 1;
    }

    if (!state.gfx.Init(hwnd, state.width, state.height))
    {
        dxgui::log::Get()->critical("Direct3D 11 initialization failed");
        ::DestroyWindow(hwnd);
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGui_ImplWin32_Init(hwnd);

    int exitCode = 0;
    try
    {
        state.renderer = std::make_unique<dxgui::Renderer>(state.gfx.Device(), cfg);
        const float dpiScale = ImGui_ImplWin32_GetDpiScaleForHwnd(hwnd);
        if (dpiScale > 1.0f)
            RebuildFonts(state, dpiScale);

        const dxgui::TextureId checker =
            state.renderer->RegisterTexture(CreateCheckerboard(state.gfx.Device(), 64, 8));

        ::ShowWindow(hwnd, SW_SHOWDEFAULT);
        ::UpdateWindow(hwnd);

        bool running = true;
        while (running)
        {
            MSG msg;
            while (::PeekMessageW(&msg, nullptr, 0, 0, PM_REMOVE))
            {
                ::TranslateMessage(&msg);
                ::DispatchMessageW(&msg);
                if (msg.message == WM_QUIT)
                    running = false;
            }
            if (!running)
                break;

            if (state.fontRebuildRequested)
            {
                state.fontRebuildRequested = false;
                RebuildFonts(state, state.requestedFontScale);
            }

            ImGui_ImplWin32_NewFrame();
            ImGui::NewFrame();
            DrawUi(state, checker);
            ImGui::Render();

            state.gfx.BeginFrame();
            state.renderer->Render(ImGui::GetDrawData());
            state.gfx.EndFrame(state.vsync);
        }

        (void)state.renderer->UnregisterTexture(checker);
    }
    catch (const std::exception& e)
    {
        dxgui::log::Get()->critical("Fatal: {}", e.what());
        exitCode = 1;
    }

    state.renderer.reset();
    ImGui_ImplWin32_Shutdown();
    ImGui::DestroyContext();
    state.gfx.Shutdown();
    g_state = nullptr;
    if (::IsWindow(hwnd))
        ::DestroyWindow(hwnd);
    ::UnregisterClassW(wc.lpszClassName, hInst);
    spdlog::shutdown();
    return exitCode;
}

} // namespace

int WINAPI wWinMain(HINSTANCE hInst, HINSTANCE, PWSTR, int)
{
    return Run(hInst);
}
