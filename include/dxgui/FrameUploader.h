#pragma once
#include <d3d11.h>
#include <imgui.h>

namespace dxgui
{
    class GrowableBuffer;

    // Copies one frame's geometry and projection into GPU memory.
    class FrameUploader
    {
    public:
        FrameUploader(GrowableBuffer& vertices, GrowableBuffer& indices, ID3D11Buffer* constants) noexcept
            : m_vertices(vertices), m_indices(indices), m_constants(constants) {}

        // Both buffers must already hold the summed VtxBuffer / IdxBuffer
        // sizes of every list. Throws GpuError if a Map fails; nothing
        // stays mapped.
        void Upload(ID3D11DeviceContext* ctx, const ImDrawData& drawData);

        void SetConstantBuffer(ID3D11Buffer* constants) noexcept { m_constants = constants; }

    private:
        void UploadGeometry(ID3D11DeviceContext* ctx, const ImDrawData& drawData);
        void UploadProjection(ID3D11DeviceContext* ctx, const ImDrawData& drawData);

        GrowableBuffer& m_vertices;
        GrowableBuffer& m_indices;
        ID3D11Buffer*   m_constants;
    };
}
