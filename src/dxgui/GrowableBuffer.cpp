#include "dxgui/GrowableBuffer.h"
#include "dxgui/HrCheck.h"
#include "dxgui/Log.h"

#include <algorithm>
#include <limits>
#include <utility>

using Microsoft::WRL::ComPtr;

namespace dxgui
{
    bool GrowableBuffer::Reserve(ID3D11Device* device, std::size_t required)
    {
        if (m_buffer && m_capacity >= required)
            return false;

        // A zero-sized buffer is rejected by CreateBuffer.
        const std::size_t elements = (std::max<std::size_t>)(required + m_slack, 1);
        if (elements > (std::numeric_limits<UINT>::max)() / m_elementSize)
            throw GpuError(E_OUTOFMEMORY, "GrowableBuffer::Reserve: requested size exceeds UINT range");

        D3D11_BUFFER_DESC desc{};
        desc.ByteWidth = static_cast<UINT>(elements * m_elementSize);
        desc.Usage = D3D11_USAGE_DYNAMIC;
        desc.BindFlags = m_bindFlags;
        desc.CPUAccessFlags = D3D11_CPU_ACCESS_WRITE;
        desc.MiscFlags = 0;
        desc.StructureByteStride = 0;

        // Build the replacement first so a failure leaves the old buffer usable.
        ComPtr<ID3D11Buffer> grown;
        DXGUI_HR_CHECK(device->CreateBuffer(&desc, nullptr, grown.GetAddressOf()));

        log::Get()->debug("GrowableBuffer: bind=0x{:x} grew {} -> {} elements",
                          m_bindFlags, m_capacity, elements);

        m_buffer = std::move(grown);
        m_capacity = elements;
        return true;
    }
}
