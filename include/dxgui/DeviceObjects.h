#pragma once
#include <d3d11.h>
#include <wrl/client.h>

struct ImFontAtlas;

namespace dxgui
{
    // Shader-visible layout of the projection constant buffer (register b0).
    struct VertexConstants
    {
        float mvp[4][4];
    };

    struct FontTexture
    {
        Microsoft::WRL::ComPtr<ID3D11ShaderResourceView> view;
        Microsoft::WRL::ComPtr<ID3D11SamplerState>       sampler;
        UINT width = 0, height = 0;
    };

    // Pipeline objects created once per device. Every Create* throws GpuError.
    struct DeviceObjects
    {
        Microsoft::WRL::ComPtr<ID3D11VertexShader>      vertexShader;
        Microsoft::WRL::ComPtr<ID3D11InputLayout>       inputLayout;
        Microsoft::WRL::ComPtr<ID3D11Buffer>            constantBuffer;
        Microsoft::WRL::ComPtr<ID3D11PixelShader>       pixelShader;
        Microsoft::WRL::ComPtr<ID3D11BlendState>        blendState;
        Microsoft::WRL::ComPtr<ID3D11RasterizerState>   rasterizerState;
        Microsoft::WRL::ComPtr<ID3D11DepthStencilState> depthStencilState;
        FontTexture font;

        static DeviceObjects Create(ID3D11Device* device, ImFontAtlas& fonts);
    };

    void CreateVertexStage(ID3D11Device* device, DeviceObjects& out);
    void CreatePixelStage(ID3D11Device* device, DeviceObjects& out);
    void CreateFixedStates(ID3D11Device* device, DeviceObjects& out);

    // Rasterizes `fonts` to RGBA32, uploads it as an immutable texture and
    // tags the atlas with kFontTextureId.
    FontTexture CreateFontTexture(ID3D11Device* device, ImFontAtlas& fonts);
}
