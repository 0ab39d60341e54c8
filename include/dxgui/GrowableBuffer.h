#pragma once
#include <d3d11.h>
#include <wrl/client.h>

#include <cstddef>

namespace dxgui
{
    // Dynamic, CPU-write-only GPU buffer that only ever grows. Every growth
    // allocates `required + slack` elements.
    class GrowableBuffer
    {
    public:
        GrowableBuffer(UINT bindFlags, std::size_t elementSize, std::size_t slack) noexcept
            : m_bindFlags(bindFlags), m_elementSize(elementSize), m_slack(slack) {}

        // Returns true when a new buffer was created. Throws GpuError if
        // creation fails; the current buffer and capacity are then untouched.
        bool Reserve(ID3D11Device* device, std::size_t required);

        ID3D11Buffer* Get() const noexcept { return m_buffer.Get(); }
        std::size_t Capacity() const noexcept { return m_capacity; }
        std::size_t ElementSize() const noexcept { return m_elementSize; }
        std::size_t Slack() const noexcept { return m_slack; }

    private:
        Microsoft::WRL::ComPtr<ID3D11Buffer> m_buffer;
        std::size_t m_capacity = 0;
        UINT        m_bindFlags;
        std::size_t m_elementSize;
        std::size_t m_slack;
    };
}
