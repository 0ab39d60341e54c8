#include "dxgui/TextureRegistry.h"
#include "dxgui/Log.h"

#include <stdexcept>
#include <utility>

using Microsoft::WRL::ComPtr;

namespace dxgui
{
    TextureId TextureRegistry::Add(ComPtr<ID3D11ShaderResourceView> view)
    {
        if (!view)
            throw std::invalid_argument("TextureRegistry::Add: null shader resource view");

        // Skip ids the host claimed through Insert() and the reserved font id.
        while (m_nextId == kFontTextureId || m_nextId == 0 || Contains(m_nextId))
            ++m_nextId;

        const TextureId id = m_nextId++;
        m_views.emplace(id, std::move(view));
        log::Get()->debug("TextureRegistry: registered texture {}", id);
        return id;
    }

    void TextureRegistry::Insert(TextureId id, ComPtr<ID3D11ShaderResourceView> view)
    {
        if (id == kFontTextureId)
            throw std::invalid_argument("TextureRegistry::Insert: id is reserved for the font atlas");
        if (!view)
            throw std::invalid_argument("TextureRegistry::Insert: null shader resource view");

        m_views[id] = std::move(view);
        log::Get()->debug("TextureRegistry: registered texture {}", id);
    }

    bool TextureRegistry::Remove(TextureId id)
    {
        const bool removed = m_views.erase(id) != 0;
        if (removed)
            log::Get()->debug("TextureRegistry: unregistered texture {}", id);
        return removed;
    }

    ID3D11ShaderResourceView* TextureRegistry::Find(TextureId id) const
    {
        const auto it = m_views.find(id);
        return it != m_views.end() ? it->second.Get() : nullptr;
    }
}
