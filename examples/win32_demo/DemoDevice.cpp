#include "DemoDevice.h"

#include "dxgui/Log.h"

#include <iterator> // std::size

using Microsoft::WRL::ComPtr;

static HRESULT CreateD3D11Device(UINT flags,
                                 D3D_DRIVER_TYPE driverType,
                                 ComPtr<ID3D11Device>& outDevice,
                                 ComPtr<ID3D11DeviceContext>& outCtx)
{
    // The ImGui shaders are vs_4_0 / ps_4_0, so 10.0 is enough.
    static constexpr D3D_FEATURE_LEVEL kLevels[] = {
        D3D_FEATURE_LEVEL_11_1,
        D3D_FEATURE_LEVEL_11_0,
        D3D_FEATURE_LEVEL_10_1,
        D3D_FEATURE_LEVEL_10_0,
    };

    return D3D11CreateDevice(
        nullptr,
        driverType,
        nullptr,
        flags,
        kLevels,
        static_cast<UINT>(std::size(kLevels)),
        D3D11_SDK_VERSION,
        outDevice.GetAddressOf(),
        nullptr,
        outCtx.GetAddressOf());
}

bool DemoDevice::Init(HWND hwnd, UINT width, UINT height)
{
    Shutdown();
    m_hwnd = hwnd;

    UINT flags = 0;
#if defined(_DEBUG)
    flags |= D3D11_CREATE_DEVICE_DEBUG;
#endif

    HRESULT hr = CreateD3D11Device(flags, D3D_DRIVER_TYPE_HARDWARE, m_device, m_ctx);
#if defined(_DEBUG)
    if (FAILED(hr))
    {
        // Retry without the debug layer (machines without Graphics Tools).
        hr = CreateD3D11Device(flags & ~D3D11_CREATE_DEVICE_DEBUG, D3D_DRIVER_TYPE_HARDWARE, m_device, m_ctx);
    }
#endif
    if (FAILED(hr))
    {
        dxgui::log::Get()->warn("Hardware device unavailable (0x{:08x}); falling back to WARP",
                                static_cast<unsigned>(hr));
        hr = CreateD3D11Device(0, D3D_DRIVER_TYPE_WARP, m_device, m_ctx);
        if (FAILED(hr))
        {
            dxgui::log::Get()->error("D3D11CreateDevice failed (0x{:08x})", static_cast<unsigned>(hr));
            return false;
        }
    }

    ComPtr<IDXGIDevice> dxgiDev;
    ComPtr<IDXGIAdapter> adapter;
    if (FAILED(m_device.As(&dxgiDev)) ||
        FAILED(dxgiDev->GetAdapter(adapter.GetAddressOf())) ||
        FAILED(adapter->GetParent(IID_PPV_ARGS(m_factory.GetAddressOf()))))
    {
        dxgui::log::Get()->error("Could not reach the DXGI factory of the device");
        Shutdown();
        return false;
    }

    (void)m_factory->MakeWindowAssociation(m_hwnd, DXGI_MWA_NO_ALT_ENTER);

    if (!CreateSwapchain(width, height))
    {
        Shutdown();
        return false;
    }
    return true;
}

bool DemoDevice::CreateSwapchain(UINT width, UINT height)
{
    DXGI_SWAP_CHAIN_DESC1 desc{};
    desc.Width = width;
    desc.Height = height;
    desc.Format = m_backbufferFormat;
    desc.BufferUsage = DXGI_USAGE_RENDER_TARGET_OUTPUT;
    desc.BufferCount = 2;
    desc.SampleDesc = { 1, 0 };
    desc.SwapEffect = DXGI_SWAP_EFFECT_FLIP_DISCARD;
    desc.Scaling = DXGI_SCALING_STRETCH;
    desc.AlphaMode = DXGI_ALPHA_MODE_IGNORE;

    const HRESULT hr = m_factory->CreateSwapChainForHwnd(
        m_device.Get(), m_hwnd, &desc, nullptr, nullptr, m_swap.GetAddressOf());
    if (FAILED(hr))
    {
        dxgui::log::Get()->error("CreateSwapChainForHwnd failed (0x{:08x})", static_cast<unsigned>(hr));
        return false;
    }

    CreateRTV();
    return m_rtv != nullptr;
}

void DemoDevice::CreateRTV()
{
    m_rtv.Reset();

    ComPtr<ID3D11Texture2D> backBuffer;
    if (FAILED(m_swap->GetBuffer(0, IID_PPV_ARGS(backBuffer.GetAddressOf()))))
        return;

    (void)m_device->CreateRenderTargetView(backBuffer.Get(), nullptr, m_rtv.GetAddressOf());
}

void DemoDevice::Resize(UINT width, UINT height)
{
    if (!m_swap || width == 0 || height == 0)
        return;

    // The back buffers cannot be resized while a view of them is alive.
    m_ctx->OMSetRenderTargets(0, nullptr, nullptr);
    m_rtv.Reset();

    const HRESULT hr = m_swap->ResizeBuffers(0, width, height, DXGI_FORMAT_UNKNOWN, 0);
    if (FAILED(hr))
    {
        dxgui::log::Get()->error("ResizeBuffers({}x{}) failed (0x{:08x})", width, height, static_cast<unsigned>(hr));
        return;
    }

    CreateRTV();
}

void DemoDevice::BeginFrame()
{
    if (!m_ctx || !m_rtv)
        return;

    m_ctx->OMSetRenderTargets(1, m_rtv.GetAddressOf(), nullptr);
    m_ctx->ClearRenderTargetView(m_rtv.Get(), m_clearColor);
}

void DemoDevice::EndFrame(bool vsync)
{
    if (!m_swap)
        return;

    const HRESULT hr = m_swap->Present(vsync ? 1u : 0u, 0);
    if (FAILED(hr))
        dxgui::log::Get()->error("Present failed (0x{:08x})", static_cast<unsigned>(hr));
}

void DemoDevice::Shutdown()
{
    m_rtv.Reset();
    m_swap.Reset();
    m_factory.Reset();
    m_ctx.Reset();
    m_device.Reset();
    m_hwnd = nullptr;
}
