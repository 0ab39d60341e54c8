#include <doctest/doctest.h>

#include "dxgui/ContextState.h"
#include "test_support/d3d11_test_util.h"

#include <stdexcept>

using Microsoft::WRL::ComPtr;
using dxgui::ContextState;
using dxgui::ContextStateGuard;
using dxgui::test::WarpDevice;

namespace {

struct HostState {
    ComPtr<ID3D11BlendState>         blend;
    ComPtr<ID3D11RasterizerState>    raster;
    ComPtr<ID3D11DepthStencilState>  depth;
    ComPtr<ID3D11SamplerState>       sampler;
    ComPtr<ID3D11ShaderResourceView> srv;
    ComPtr<ID3D11Buffer>             vb;
    ComPtr<ID3D11Buffer>             ib;
    ComPtr<ID3D11Buffer>             cb;
};

// Binds a recognisable, non-default configuration the way a host renderer would.
HostState BindHostState(ID3D11Device* dev, ID3D11DeviceContext* ctx)
{
    HostState h;

    D3D11_BLEND_DESC bd{};
    bd.RenderTarget[0].BlendEnable = FALSE;
    bd.RenderTarget[0].RenderTargetWriteMask = D3D11_COLOR_WRITE_ENABLE_RED;
    DXGUI_HR_CHECK(dev->CreateBlendState(&bd, h.blend.GetAddressOf()));

    D3D11_RASTERIZER_DESC rd{};
    rd.FillMode = D3D11_FILL_WIREFRAME;
    rd.CullMode = D3D11_CULL_BACK;
    DXGUI_HR_CHECK(dev->CreateRasterizerState(&rd, h.raster.GetAddressOf()));

    D3D11_DEPTH_STENCIL_DESC dd{};
    dd.DepthEnable = TRUE;
    dd.DepthWriteMask = D3D11_DEPTH_WRITE_MASK_ALL;
    dd.DepthFunc = D3D11_COMPARISON_LESS;
    DXGUI_HR_CHECK(dev->CreateDepthStencilState(&dd, h.depth.GetAddressOf()));

    D3D11_SAMPLER_DESC sd{};
    sd.Filter = D3D11_FILTER_MIN_MAG_MIP_POINT;
    sd.AddressU = sd.AddressV = sd.AddressW = D3D11_TEXTURE_ADDRESS_CLAMP;
    sd.MaxLOD = D3D11_FLOAT32_MAX;
    DXGUI_HR_CHECK(dev->CreateSamplerState(&sd, h.sampler.GetAddressOf()));

    h.srv = dxgui::test::MakeTextureView(dev);

    D3D11_BUFFER_DESC vbd{};
    vbd.ByteWidth = 256;
    vbd.Usage = D3D11_USAGE_DEFAULT;
    vbd.BindFlags = D3D11_BIND_VERTEX_BUFFER;
    DXGUI_HR_CHECK(dev->CreateBuffer(&vbd, nullptr, h.vb.GetAddressOf()));
    vbd.BindFlags = D3D11_BIND_INDEX_BUFFER;
    DXGUI_HR_CHECK(dev->CreateBuffer(&vbd, nullptr, h.ib.GetAddressOf()));
    vbd.BindFlags = D3D11_BIND_CONSTANT_BUFFER;
    DXGUI_HR_CHECK(dev->CreateBuffer(&vbd, nullptr, h.cb.GetAddressOf()));

    const FLOAT factor[4] = { 0.25f, 0.5f, 0.75f, 1.0f };
    ctx->OMSetBlendState(h.blend.Get(), factor, 0x0000ffffu);
    ctx->OMSetDepthStencilState(h.depth.Get(), 3);
    ctx->RSSetState(h.raster.Get());

    const D3D11_VIEWPORT vps[2] = { { 5, 6, 100, 200, 0.1f, 0.9f }, { 0, 0, 32, 32, 0, 1 } };
    ctx->RSSetViewports(2, vps);
    const D3D11_RECT sc = { 1, 2, 3, 4 };
    ctx->RSSetScissorRects(1, &sc);

    ID3D11ShaderResourceView* srv = h.srv.Get();
    ctx->PSSetShaderResources(0, 1, &srv);
    ID3D11SamplerState* sampler = h.sampler.Get();
    ctx->PSSetSamplers(0, 1, &sampler);
    ID3D11Buffer* cb = h.cb.Get();
    ctx->VSSetConstantBuffers(0, 1, &cb);

    const UINT stride = 12, offset = 16;
    ID3D11Buffer* vb = h.vb.Get();
    ctx->IASetVertexBuffers(0, 1, &vb, &stride, &offset);
    ctx->IASetIndexBuffer(h.ib.Get(), DXGI_FORMAT_R32_UINT, 8);
    ctx->IASetPrimitiveTopology(D3D11_PRIMITIVE_TOPOLOGY_LINESTRIP);

    return h;
}

// Overwrites every slot the snapshot tracks.
void Scribble(ID3D11DeviceContext* ctx)
{
    ctx->OMSetBlendState(nullptr, nullptr, 0xffffffffu);
    ctx->OMSetDepthStencilState(nullptr, 0);
    ctx->RSSetState(nullptr);
    const D3D11_VIEWPORT vp = { 0, 0, 1, 1, 0, 1 };
    ctx->RSSetViewports(1, &vp);
    const D3D11_RECT sc = { 0, 0, 1, 1 };
    ctx->RSSetScissorRects(1, &sc);
    ID3D11ShaderResourceView* noSrv = nullptr;
    ctx->PSSetShaderResources(0, 1, &noSrv);
    ID3D11SamplerState* noSampler = nullptr;
    ctx->PSSetSamplers(0, 1, &noSampler);
    ID3D11Buffer* noBuffer = nullptr;
    ctx->VSSetConstantBuffers(0, 1, &noBuffer);
    const UINT zero = 0;
    ctx->IASetVertexBuffers(0, 1, &noBuffer, &zero, &zero);
    ctx->IASetIndexBuffer(nullptr, DXGI_FORMAT_R16_UINT, 0);
    ctx->IASetPrimitiveTopology(D3D11_PRIMITIVE_TOPOLOGY_TRIANGLELIST);
}

} // namespace

TEST_CASE("ContextState::Capture reads back what the host bound")
{
    WarpDevice warp;
    HostState host = BindHostState(warp.device.Get(), warp.context.Get());

    const ContextState s = ContextState::Capture(warp.context.Get());

    CHECK(s.blendState.Get() == host.blend.Get());
    CHECK(s.blendFactor[1] == doctest::Approx(0.5f));
    CHECK(s.sampleMask == 0x0000ffffu);
    CHECK(s.depthStencilState.Get() == host.depth.Get());
    CHECK(s.stencilRef == 3);
    CHECK(s.rasterizerState.Get() == host.raster.Get());
    CHECK(s.viewportCount == 2);
    CHECK(s.viewports[0].Width == doctest::Approx(100.0f));
    CHECK(s.scissorRectCount == 1);
    CHECK(s.scissorRects[0].right == 3);
    CHECK(s.psShaderResource.Get() == host.srv.Get());
    CHECK(s.psSampler.Get() == host.sampler.Get());
    CHECK(s.vsConstantBuffer.Get() == host.cb.Get());
    CHECK(s.vertexBuffer.Get() == host.vb.Get());
    CHECK(s.vertexBufferStride == 12);
    CHECK(s.vertexBufferOffset == 16);
    CHECK(s.indexBuffer.Get() == host.ib.Get());
    CHECK(s.indexBufferFormat == DXGI_FORMAT_R32_UINT);
    CHECK(s.indexBufferOffset == 8);
    CHECK(s.topology == D3D11_PRIMITIVE_TOPOLOGY_LINESTRIP);
}

TEST_CASE("ContextStateGuard restores every tracked slot when it leaves scope")
{
    WarpDevice warp;
    HostState host = BindHostState(warp.device.Get(), warp.context.Get());
    const ContextState before = ContextState::Capture(warp.context.Get());

    {
        ContextStateGuard guard(warp.context.Get());
        CHECK(guard.Armed());
        Scribble(warp.context.Get());
        CHECK(ContextState::Capture(warp.context.Get()) != before);
    }

    CHECK(ContextState::Capture(warp.context.Get()) == before);
}

TEST_CASE("ContextStateGuard restores during exception unwind")
{
    WarpDevice warp;
    HostState host = BindHostState(warp.device.Get(), warp.context.Get());
    const ContextState before = ContextState::Capture(warp.context.Get());

    CHECK_THROWS_AS(([&] {
        ContextStateGuard guard(warp.context.Get());
        Scribble(warp.context.Get());
        throw std::runtime_error("frame failed");
    })(), std::runtime_error);

    CHECK(ContextState::Capture(warp.context.Get()) == before);
}

TEST_CASE("ContextStateGuard clears slots that were empty at capture")
{
    WarpDevice warp;
    // Fresh context: nothing bound in any tracked slot.
    const ContextState empty = ContextState::Capture(warp.context.Get());
    CHECK(empty.psShaderResource == nullptr);
    CHECK(empty.blendState == nullptr);

    {
        ContextStateGuard guard(warp.context.Get());
        HostState leaked = BindHostState(warp.device.Get(), warp.context.Get());
    }

    const ContextState after = ContextState::Capture(warp.context.Get());
    CHECK(after == empty);
    CHECK(after.psShaderResource == nullptr);
    CHECK(after.psSampler == nullptr);
    CHECK(after.vertexBuffer == nullptr);
}

TEST_CASE("ContextStateGuard restores exactly once")
{
    WarpDevice warp;
    HostState host = BindHostState(warp.device.Get(), warp.context.Get());
    const ContextState before = ContextState::Capture(warp.context.Get());

    ContextStateGuard guard(warp.context.Get());
    Scribble(warp.context.Get());
    guard.Restore();
    CHECK_FALSE(guard.Armed());
    CHECK(ContextState::Capture(warp.context.Get()) == before);

    // A later Restore (or the destructor) must not rewrite the old snapshot.
    Scribble(warp.context.Get());
    const ContextState scribbled = ContextState::Capture(warp.context.Get());
    guard.Restore();
    CHECK(ContextState::Capture(warp.context.Get()) == scribbled);
}
