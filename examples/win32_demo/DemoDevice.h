#pragma once
#include <windows.h>

#include <d3d11.h>
#include <dxgi1_6.h>
#include <wrl/client.h>

// D3D11 device + flip-model swapchain for the demo window.
class DemoDevice {
public:
    DemoDevice() = default;
    ~DemoDevice() { Shutdown(); }

    DemoDevice(const DemoDevice&) = delete;
    DemoDevice& operator=(const DemoDevice&) = delete;

    bool Init(HWND hwnd, UINT width, UINT height);
    void Resize(UINT width, UINT height);
    void Shutdown();

    // Binds and clears the back buffer.
    void BeginFrame();
    void EndFrame(bool vsync);

    [[nodiscard]] ID3D11Device* Device() const noexcept { return m_device.Get(); }
    [[nodiscard]] ID3D11DeviceContext* Context() const noexcept { return m_ctx.Get(); }

    void SetClearColor(float r, float g, float b, float a) noexcept
    {
        m_clearColor[0] = r;
        m_clearColor[1] = g;
        m_clearColor[2] = b;
        m_clearColor[3] = a;
    }

private:
    bool CreateSwapchain(UINT width, UINT height);
    void CreateRTV();

    Microsoft::WRL::ComPtr<ID3D11Device>           m_device;
    Microsoft::WRL::ComPtr<ID3D11DeviceContext>    m_ctx;
    Microsoft::WRL::ComPtr<IDXGIFactory2>          m_factory;
    Microsoft::WRL::ComPtr<IDXGISwapChain1>        m_swap;
    Microsoft::WRL::ComPtr<ID3D11RenderTargetView> m_rtv;

    HWND m_hwnd = nullptr;
    DXGI_FORMAT m_backbufferFormat = DXGI_FORMAT_R8G8B8A8_UNORM;
    float m_clearColor[4] = { 0.08f, 0.10f, 0.12f, 1.0f };
};
