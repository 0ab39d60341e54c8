#include "dxgui/DeviceObjects.h"
#include "dxgui/HrCheck.h"
#include "dxgui/Log.h"
#include "dxgui/TextureRegistry.h"

// Generated by fxc from shaders/*.hlsl
#include "dxgui/shaders/ImGuiVS.h"
#include "dxgui/shaders/ImGuiPS.h"

#include <imgui.h>

#include <cstddef>
#include <iterator>

using Microsoft::WRL::ComPtr;

namespace dxgui
{
    DeviceObjects DeviceObjects::Create(ID3D11Device* device, ImFontAtlas& fonts)
    {
        DeviceObjects objs;
        CreateVertexStage(device, objs);
        CreatePixelStage(device, objs);
        CreateFixedStates(device, objs);
        objs.font = CreateFontTexture(device, fonts);
        return objs;
    }

    void CreateVertexStage(ID3D11Device* device, DeviceObjects& out)
    {
        DXGUI_HR_CHECK(device->CreateVertexShader(g_ImGuiVS, sizeof(g_ImGuiVS), nullptr,
                                                  out.vertexShader.ReleaseAndGetAddressOf()));

        // Matches ImDrawVert: pos, uv, packed RGBA color.
        const D3D11_INPUT_ELEMENT_DESC layout[] = {
            { "POSITION", 0, DXGI_FORMAT_R32G32_FLOAT,   0, (UINT)offsetof(ImDrawVert, pos), D3D11_INPUT_PER_VERTEX_DATA, 0 },
            { "TEXCOORD", 0, DXGI_FORMAT_R32G32_FLOAT,   0, (UINT)offsetof(ImDrawVert, uv),  D3D11_INPUT_PER_VERTEX_DATA, 0 },
            { "COLOR",    0, DXGI_FORMAT_R8G8B8A8_UNORM, 0, (UINT)offsetof(ImDrawVert, col), D3D11_INPUT_PER_VERTEX_DATA, 0 },
        };
        DXGUI_HR_CHECK(device->CreateInputLayout(layout, static_cast<UINT>(std::size(layout)),
                                                 g_ImGuiVS, sizeof(g_ImGuiVS),
                                                 out.inputLayout.ReleaseAndGetAddressOf()));

        D3D11_BUFFER_DESC cbd{};
        cbd.ByteWidth = sizeof(VertexConstants);
        cbd.Usage = D3D11_USAGE_DYNAMIC;
        cbd.BindFlags = D3D11_BIND_CONSTANT_BUFFER;
        cbd.CPUAccessFlags = D3D11_CPU_ACCESS_WRITE;
        DXGUI_HR_CHECK(device->CreateBuffer(&cbd, nullptr, out.constantBuffer.ReleaseAndGetAddressOf()));
    }

    void CreatePixelStage(ID3D11Device* device, DeviceObjects& out)
    {
        DXGUI_HR_CHECK(device->CreatePixelShader(g_ImGuiPS, sizeof(g_ImGuiPS), nullptr,
                                                 out.pixelShader.ReleaseAndGetAddressOf()));
    }

    void CreateFixedStates(ID3D11Device* device, DeviceObjects& out)
    {
        // Non-premultiplied alpha on every slot. IndependentBlendEnable keeps
        // slots 1..7 from inheriting whatever a driver does with slot 0.
        {
            D3D11_BLEND_DESC bd{};
            bd.AlphaToCoverageEnable = FALSE;
            bd.IndependentBlendEnable = TRUE;
            for (auto& rt : bd.RenderTarget)
            {
                rt.BlendEnable = TRUE;
                rt.SrcBlend = D3D11_BLEND_SRC_ALPHA;
                rt.DestBlend = D3D11_BLEND_INV_SRC_ALPHA;
                rt.BlendOp = D3D11_BLEND_OP_ADD;
                rt.SrcBlendAlpha = D3D11_BLEND_ONE;
                rt.DestBlendAlpha = D3D11_BLEND_INV_SRC_ALPHA;
                rt.BlendOpAlpha = D3D11_BLEND_OP_ADD;
                rt.RenderTargetWriteMask = D3D11_COLOR_WRITE_ENABLE_ALL;
            }
            DXGUI_HR_CHECK(device->CreateBlendState(&bd, out.blendState.ReleaseAndGetAddressOf()));
        }

        D3D11_RASTERIZER_DESC rd{};
        rd.FillMode = D3D11_FILL_SOLID;
        rd.CullMode = D3D11_CULL_NONE;
        rd.ScissorEnable = TRUE;
        rd.DepthClipEnable = TRUE;
        DXGUI_HR_CHECK(device->CreateRasterizerState(&rd, out.rasterizerState.ReleaseAndGetAddressOf()));

        D3D11_DEPTH_STENCIL_DESC dd{};
        dd.DepthEnable = FALSE;
        dd.DepthWriteMask = D3D11_DEPTH_WRITE_MASK_ALL;
        dd.DepthFunc = D3D11_COMPARISON_ALWAYS;
        dd.StencilEnable = FALSE;
        dd.FrontFace.StencilFailOp = dd.FrontFace.StencilDepthFailOp = dd.FrontFace.StencilPassOp = D3D11_STENCIL_OP_KEEP;
        dd.FrontFace.StencilFunc = D3D11_COMPARISON_ALWAYS;
        dd.BackFace = dd.FrontFace;
        DXGUI_HR_CHECK(device->CreateDepthStencilState(&dd, out.depthStencilState.ReleaseAndGetAddressOf()));
    }

    FontTexture CreateFontTexture(ID3D11Device* device, ImFontAtlas& fonts)
    {
        unsigned char* pixels = nullptr;
        int width = 0, height = 0;
        fonts.GetTexDataAsRGBA32(&pixels, &width, &height);
        if (!pixels || width <= 0 || height <= 0)
            throw GpuError(E_FAIL, "CreateFontTexture: font atlas produced no pixels");

        FontTexture out;
        out.width = static_cast<UINT>(width);
        out.height = static_cast<UINT>(height);

        D3D11_TEXTURE2D_DESC td{};
        td.Width = out.width;
        td.Height = out.height;
        td.MipLevels = 1;
        td.ArraySize = 1;
        td.Format = DXGI_FORMAT_R8G8B8A8_UNORM;
        td.SampleDesc.Count = 1;
        td.Usage = D3D11_USAGE_IMMUTABLE;
        td.BindFlags = D3D11_BIND_SHADER_RESOURCE;

        D3D11_SUBRESOURCE_DATA init{};
        init.pSysMem = pixels;
        init.SysMemPitch = td.Width * 4;

        ComPtr<ID3D11Texture2D> tex;
        DXGUI_HR_CHECK(device->CreateTexture2D(&td, &init, tex.GetAddressOf()));

        D3D11_SHADER_RESOURCE_VIEW_DESC srvd{};
        srvd.Format = td.Format;
        srvd.ViewDimension = D3D11_SRV_DIMENSION_TEXTURE2D;
        srvd.Texture2D.MostDetailedMip = 0;
        srvd.Texture2D.MipLevels = td.MipLevels;
        DXGUI_HR_CHECK(device->CreateShaderResourceView(tex.Get(), &srvd, out.view.GetAddressOf()));

        D3D11_SAMPLER_DESC sd{};
        sd.Filter = D3D11_FILTER_MIN_MAG_MIP_LINEAR;
        sd.AddressU = sd.AddressV = sd.AddressW = D3D11_TEXTURE_ADDRESS_WRAP;
        sd.MipLODBias = 0.0f;
        sd.ComparisonFunc = D3D11_COMPARISON_ALWAYS;
        sd.MinLOD = 0.0f;
        sd.MaxLOD = 0.0f;
        DXGUI_HR_CHECK(device->CreateSamplerState(&sd, out.sampler.GetAddressOf()));

        // Tag the atlas only once the view exists.
        fonts.SetTexID(ToImTextureID(kFontTextureId));

        log::Get()->info("Font atlas uploaded ({}x{})", width, height);
        return out;
    }
}
