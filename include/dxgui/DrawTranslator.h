#pragma once
#include <d3d11.h>
#include <imgui.h>

#include "dxgui/DeviceObjects.h"

namespace dxgui
{
    class TextureRegistry;

    // Orthographic projection mapping the display rectangle to clip space,
    // with UI Y pointing down and clip Y pointing up. Row-vector convention:
    // clip = [x y 0 1] * m.
    VertexConstants ComputeProjection(const ImVec2& displayPos, const ImVec2& displaySize);

    // UI-space clip rect (x1, y1, x2, y2) to a pixel scissor rect, truncated.
    D3D11_RECT ClipRectToScissor(const ImVec4& clipRect, const ImVec2& displayPos, const ImVec2& framebufferScale);

    // Receives the device-facing side effects of a translated frame.
    class DrawTarget
    {
    public:
        virtual ~DrawTarget() = default;
        virtual void BindTexture(ID3D11ShaderResourceView* view) = 0;
        virtual void SetScissor(const D3D11_RECT& rect) = 0;
        virtual void DrawIndexed(UINT indexCount, UINT startIndex, INT baseVertex) = 0;
        virtual void SetupRenderState(const ImDrawData& drawData) = 0;
    };

    // Walks every command of every list in order. Throws TextureNotFound at
    // the first element command whose texture is neither the font atlas nor
    // registered; nothing after it reaches the target.
    void TranslateDrawData(const ImDrawData& drawData,
                           const TextureRegistry& textures,
                           ID3D11ShaderResourceView* fontView,
                           DrawTarget& target);
}
