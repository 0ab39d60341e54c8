#pragma once
#include <d3d11.h>
#include <wrl/client.h>
#include <imgui.h>

#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace dxgui
{
    using TextureId = std::uint64_t;

    // Id carried by the font atlas. Never handed out by the registry.
    inline constexpr TextureId kFontTextureId = ~TextureId{0};

    // ImTextureID is void* or ImU64 depending on how imgui was configured.
    inline ImTextureID ToImTextureID(TextureId id)
    {
        return (ImTextureID)(std::uintptr_t)id;
    }

    inline TextureId FromImTextureID(ImTextureID id)
    {
        return static_cast<TextureId>((std::uintptr_t)id);
    }

    // Maps ids used in ImDrawCmd::TextureId to shader-resource views the host
    // created. Holds one COM reference per entry; the host keeps its own.
    class TextureRegistry
    {
    public:
        // Stores `view` under a fresh id (starting at 1, never the font id).
        TextureId Add(Microsoft::WRL::ComPtr<ID3D11ShaderResourceView> view);

        // Stores `view` under a caller-chosen id, replacing any previous entry.
        // Throws std::invalid_argument for kFontTextureId or a null view.
        void Insert(TextureId id, Microsoft::WRL::ComPtr<ID3D11ShaderResourceView> view);

        bool Remove(TextureId id);

        // nullptr when the id is unknown.
        [[nodiscard]] ID3D11ShaderResourceView* Find(TextureId id) const;

        [[nodiscard]] bool Contains(TextureId id) const { return m_views.count(id) != 0; }
        [[nodiscard]] std::size_t Size() const noexcept { return m_views.size(); }
        void Clear() noexcept { m_views.clear(); }

    private:
        std::unordered_map<TextureId, Microsoft::WRL::ComPtr<ID3D11ShaderResourceView>> m_views;
        TextureId m_nextId = 1;
    };
}
