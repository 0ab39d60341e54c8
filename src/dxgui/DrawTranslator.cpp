#include "dxgui/DrawTranslator.h"
#include "dxgui/HrCheck.h"
#include "dxgui/TextureRegistry.h"

namespace dxgui
{
    VertexConstants ComputeProjection(const ImVec2& displayPos, const ImVec2& displaySize)
    {
        const float L = displayPos.x;
        const float R = displayPos.x + displaySize.x;
        const float T = displayPos.y;
        const float B = displayPos.y + displaySize.y;

        VertexConstants c{
            {
                { 2.0f / (R - L),    0.0f,              0.0f, 0.0f },
                { 0.0f,              2.0f / (T - B),    0.0f, 0.0f },
                { 0.0f,              0.0f,              0.5f, 0.0f },
                { (R + L) / (L - R), (T + B) / (B - T), 0.5f, 1.0f },
            }
        };
        return c;
    }

    D3D11_RECT ClipRectToScissor(const ImVec4& clipRect, const ImVec2& displayPos, const ImVec2& framebufferScale)
    {
        D3D11_RECT r{};
        r.left   = static_cast<LONG>((clipRect.x - displayPos.x) * framebufferScale.x);
        r.top    = static_cast<LONG>((clipRect.y - displayPos.y) * framebufferScale.y);
        r.right  = static_cast<LONG>((clipRect.z - displayPos.x) * framebufferScale.x);
        r.bottom = static_cast<LONG>((clipRect.w - displayPos.y) * framebufferScale.y);
        return r;
    }

    void TranslateDrawData(const ImDrawData& drawData,
                           const TextureRegistry& textures,
                           ID3D11ShaderResourceView* fontView,
                           DrawTarget& target)
    {
        // Indices are list-relative; the draw call adds the list's base vertex.
        UINT listIdxBase = 0;
        INT  listVtxBase = 0;

        // nullptr: nothing known to be bound (start of frame, after a callback).
        ID3D11ShaderResourceView* bound = nullptr;

        for (int n = 0; n < drawData.CmdListsCount; ++n)
        {
            const ImDrawList* list = drawData.CmdLists[n];
            for (int i = 0; i < list->CmdBuffer.Size; ++i)
            {
                const ImDrawCmd* cmd = &list->CmdBuffer[i];

                if (cmd->UserCallback != nullptr)
                {
                    if (cmd->UserCallback == ImDrawCallback_ResetRenderState)
                        target.SetupRenderState(drawData);
                    else
                        cmd->UserCallback(list, cmd);
                    bound = nullptr;
                    continue;
                }

                const TextureId texId = FromImTextureID(cmd->GetTexID());
                ID3D11ShaderResourceView* view = nullptr;
                if (texId == kFontTextureId)
                {
                    view = fontView;
                }
                else
                {
                    view = textures.Find(texId);
                    if (!view)
                        throw TextureNotFound(texId);
                }

                if (view != bound)
                {
                    target.BindTexture(view);
                    bound = view;
                }

                target.SetScissor(ClipRectToScissor(cmd->ClipRect, drawData.DisplayPos, drawData.FramebufferScale));
                target.DrawIndexed(cmd->ElemCount,
                                   listIdxBase + cmd->IdxOffset,
                                   listVtxBase + static_cast<INT>(cmd->VtxOffset));
            }
            listIdxBase += static_cast<UINT>(list->IdxBuffer.Size);
            listVtxBase += list->VtxBuffer.Size;
        }
    }
}
