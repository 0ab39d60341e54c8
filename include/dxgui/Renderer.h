#pragma once
#include <d3d11.h>
#include <wrl/client.h>
#include <imgui.h>

#include <cstddef>

#include "dxgui/Config.h"
#include "dxgui/DeviceObjects.h"
#include "dxgui/FrameUploader.h"
#include "dxgui/GrowableBuffer.h"
#include "dxgui/TextureRegistry.h"

namespace dxgui
{
    // Draws ImGui frames with Direct3D 11 on the device's immediate context.
    //
    // Construction needs a current ImGui context: the font atlas is uploaded
    // and the renderer announces itself through io.BackendRendererName and
    // ImGuiBackendFlags_RendererHasVtxOffset. Rendering binds whatever render
    // target the caller set up and leaves every pipeline slot it touches as it
    // found it.
    //
    // Not thread-safe; one Render() at a time per context.
    class Renderer
    {
    public:
        // Throws GpuError if any pipeline object cannot be created and
        // std::logic_error when no ImGui context is current.
        explicit Renderer(ID3D11Device* device, const RendererConfig& cfg = {});
        ~Renderer();

        Renderer(const Renderer&) = delete;
        Renderer& operator=(const Renderer&) = delete;

        // No-op for a null frame or a non-positive display size. Throws
        // GpuError (buffer growth, Map) or TextureNotFound; the context state
        // is restored either way.
        void Render(const ImDrawData* drawData);

        // Host textures for ImGui::Image(). The returned id converts with
        // ToImTextureID(). Throws std::invalid_argument for a null view.
        TextureId RegisterTexture(Microsoft::WRL::ComPtr<ID3D11ShaderResourceView> view);
        bool UnregisterTexture(TextureId id);
        [[nodiscard]] ID3D11ShaderResourceView* LookupTexture(TextureId id) const;

        TextureRegistry& Textures() noexcept { return m_textures; }
        const TextureRegistry& Textures() const noexcept { return m_textures; }

        // Re-rasterizes io.Fonts after fonts were added or resized (DPI
        // change). On failure the previous atlas stays bound.
        void RebuildFontTexture();

        [[nodiscard]] ID3D11ShaderResourceView* FontView() const noexcept { return m_objects.font.view.Get(); }
        [[nodiscard]] std::size_t VertexCapacity() const noexcept { return m_vertexBuffer.Capacity(); }
        [[nodiscard]] std::size_t IndexCapacity() const noexcept { return m_indexBuffer.Capacity(); }
        [[nodiscard]] ID3D11Buffer* VertexBuffer() const noexcept { return m_vertexBuffer.Get(); }
        [[nodiscard]] ID3D11Buffer* IndexBuffer() const noexcept { return m_indexBuffer.Get(); }

    private:
        class ContextTarget;

        void SetupRenderState(const ImDrawData& drawData);

        Microsoft::WRL::ComPtr<ID3D11Device>        m_device;
        Microsoft::WRL::ComPtr<ID3D11DeviceContext> m_ctx;
        RendererConfig  m_config;
        ImGuiContext*   m_imgui = nullptr;
        DeviceObjects   m_objects;
        GrowableBuffer  m_vertexBuffer;
        GrowableBuffer  m_indexBuffer;
        TextureRegistry m_textures;
        FrameUploader   m_uploader;
    };
}
