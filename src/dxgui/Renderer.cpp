#include "dxgui/Renderer.h"
#include "dxgui/ContextState.h"
#include "dxgui/DrawTranslator.h"
#include "dxgui/HrCheck.h"
#include "dxgui/Log.h"

#include <exception>
#include <stdexcept>
#include <utility>

using Microsoft::WRL::ComPtr;

namespace dxgui
{
    // Forwards translated commands to the immediate context.
    class Renderer::ContextTarget final : public DrawTarget
    {
    public:
        explicit ContextTarget(Renderer& r) : m_r(r) {}

        void BindTexture(ID3D11ShaderResourceView* view) override
        {
            m_r.m_ctx->PSSetShaderResources(0, 1, &view);
        }

        void SetScissor(const D3D11_RECT& rect) override
        {
            m_r.m_ctx->RSSetScissorRects(1, &rect);
        }

        void DrawIndexed(UINT indexCount, UINT startIndex, INT baseVertex) override
        {
            m_r.m_ctx->DrawIndexed(indexCount, startIndex, baseVertex);
        }

        void SetupRenderState(const ImDrawData& drawData) override
        {
            m_r.SetupRenderState(drawData);
        }

    private:
        Renderer& m_r;
    };

    static ImGuiContext* RequireImGuiContext()
    {
        ImGuiContext* ctx = ImGui::GetCurrentContext();
        if (!ctx)
            throw std::logic_error("dxgui::Renderer: no current ImGui context");
        return ctx;
    }

    Renderer::Renderer(ID3D11Device* device, const RendererConfig& cfg)
        : m_device(device)
        , m_config(cfg)
        , m_imgui(RequireImGuiContext())
        , m_objects(DeviceObjects::Create(device, *ImGui::GetIO().Fonts))
        , m_vertexBuffer(D3D11_BIND_VERTEX_BUFFER, sizeof(ImDrawVert), cfg.vertexSlack)
        , m_indexBuffer(D3D11_BIND_INDEX_BUFFER, sizeof(ImDrawIdx), cfg.indexSlack)
        , m_uploader(m_vertexBuffer, m_indexBuffer, nullptr)
    {
        m_device->GetImmediateContext(m_ctx.GetAddressOf());
        m_uploader.SetConstantBuffer(m_objects.constantBuffer.Get());

        m_vertexBuffer.Reserve(m_device.Get(), 0);
        m_indexBuffer.Reserve(m_device.Get(), 0);

        ImGuiIO& io = ImGui::GetIO();
        io.BackendRendererName = m_config.rendererName.c_str();
        io.BackendFlags |= ImGuiBackendFlags_RendererHasVtxOffset;

        log::Get()->info("{} initialized (vertex capacity {}, index capacity {})",
                         m_config.rendererName, m_vertexBuffer.Capacity(), m_indexBuffer.Capacity());
    }

    Renderer::~Renderer()
    {
        // The host may already have destroyed or switched the ImGui context.
        if (ImGui::GetCurrentContext() != m_imgui)
            return;

        ImGuiIO& io = ImGui::GetIO();
        if (io.BackendRendererName == m_config.rendererName.c_str())
            io.BackendRendererName = nullptr;
        io.BackendFlags &= ~ImGuiBackendFlags_RendererHasVtxOffset;
        io.Fonts->SetTexID(ToImTextureID(0));
    }

    void Renderer::Render(const ImDrawData* drawData)
    {
        if (!drawData || drawData->DisplaySize.x <= 0.0f || drawData->DisplaySize.y <= 0.0f)
            return;

        // Size from the lists themselves; that is what gets copied.
        std::size_t vtxCount = 0, idxCount = 0;
        for (int n = 0; n < drawData->CmdListsCount; ++n)
        {
            vtxCount += static_cast<std::size_t>(drawData->CmdLists[n]->VtxBuffer.Size);
            idxCount += static_cast<std::size_t>(drawData->CmdLists[n]->IdxBuffer.Size);
        }

        try
        {
            m_vertexBuffer.Reserve(m_device.Get(), vtxCount);
            m_indexBuffer.Reserve(m_device.Get(), idxCount);

            ContextStateGuard guard(m_ctx.Get());

            m_uploader.Upload(m_ctx.Get(), *drawData);
            SetupRenderState(*drawData);

            ContextTarget target(*this);
            TranslateDrawData(*drawData, m_textures, m_objects.font.view.Get(), target);
        }
        catch (const std::exception& e)
        {
            log::Get()->error("Render: frame aborted: {}", e.what());
            throw;
        }
    }

    void Renderer::SetupRenderState(const ImDrawData& drawData)
    {
        ID3D11DeviceContext* ctx = m_ctx.Get();

        D3D11_VIEWPORT vp{};
        vp.TopLeftX = 0.0f;
        vp.TopLeftY = 0.0f;
        vp.Width = drawData.DisplaySize.x * drawData.FramebufferScale.x;
        vp.Height = drawData.DisplaySize.y * drawData.FramebufferScale.y;
        vp.MinDepth = 0.0f;
        vp.MaxDepth = 1.0f;
        ctx->RSSetViewports(1, &vp);

        const UINT stride = sizeof(ImDrawVert);
        const UINT offset = 0;
        ID3D11Buffer* vb = m_vertexBuffer.Get();
        ctx->IASetInputLayout(m_objects.inputLayout.Get());
        ctx->IASetVertexBuffers(0, 1, &vb, &stride, &offset);
        ctx->IASetIndexBuffer(m_indexBuffer.Get(),
                              sizeof(ImDrawIdx) == 2 ? DXGI_FORMAT_R16_UINT : DXGI_FORMAT_R32_UINT, 0);
        ctx->IASetPrimitiveTopology(D3D11_PRIMITIVE_TOPOLOGY_TRIANGLELIST);

        ID3D11Buffer* cb = m_objects.constantBuffer.Get();
        ID3D11SamplerState* sampler = m_objects.font.sampler.Get();
        ctx->VSSetShader(m_objects.vertexShader.Get(), nullptr, 0);
        ctx->VSSetConstantBuffers(0, 1, &cb);
        ctx->PSSetShader(m_objects.pixelShader.Get(), nullptr, 0);
        ctx->PSSetSamplers(0, 1, &sampler);
        ctx->GSSetShader(nullptr, nullptr, 0);
        ctx->HSSetShader(nullptr, nullptr, 0);
        ctx->DSSetShader(nullptr, nullptr, 0);
        ctx->CSSetShader(nullptr, nullptr, 0);

        const float blendFactor[4] = { 0.0f, 0.0f, 0.0f, 0.0f };
        ctx->OMSetBlendState(m_objects.blendState.Get(), blendFactor, 0xffffffff);
        ctx->OMSetDepthStencilState(m_objects.depthStencilState.Get(), 0);
        ctx->RSSetState(m_objects.rasterizerState.Get());
    }

    TextureId Renderer::RegisterTexture(ComPtr<ID3D11ShaderResourceView> view)
    {
        return m_textures.Add(std::move(view));
    }

    bool Renderer::UnregisterTexture(TextureId id)
    {
        return m_textures.Remove(id);
    }

    ID3D11ShaderResourceView* Renderer::LookupTexture(TextureId id) const
    {
        return m_textures.Find(id);
    }

    void Renderer::RebuildFontTexture()
    {
        ImGuiIO& io = ImGui::GetIO();
        FontTexture rebuilt = CreateFontTexture(m_device.Get(), *io.Fonts);
        m_objects.font = std::move(rebuilt);
    }
}
