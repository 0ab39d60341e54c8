#include "dxgui/FrameUploader.h"
#include "dxgui/DrawTranslator.h"
#include "dxgui/GrowableBuffer.h"
#include "dxgui/HrCheck.h"

#include <cstring>

namespace dxgui
{
    namespace
    {
        // Unmaps on scope exit so a failure on the second Map never leaves
        // the first buffer mapped.
        class ScopedMap
        {
        public:
            ScopedMap(ID3D11DeviceContext* ctx, ID3D11Resource* res) : m_ctx(ctx), m_res(res)
            {
                DXGUI_HR_CHECK(m_ctx->Map(m_res, 0, D3D11_MAP_WRITE_DISCARD, 0, &m_mapped));
            }
            ~ScopedMap() { m_ctx->Unmap(m_res, 0); }

            ScopedMap(const ScopedMap&) = delete;
            ScopedMap& operator=(const ScopedMap&) = delete;

            template <typename T>
            T* As() const noexcept { return static_cast<T*>(m_mapped.pData); }

        private:
            ID3D11DeviceContext*     m_ctx;
            ID3D11Resource*          m_res;
            D3D11_MAPPED_SUBRESOURCE m_mapped{};
        };
    }

    void FrameUploader::Upload(ID3D11DeviceContext* ctx, const ImDrawData& drawData)
    {
        UploadGeometry(ctx, drawData);
        UploadProjection(ctx, drawData);
    }

    void FrameUploader::UploadGeometry(ID3D11DeviceContext* ctx, const ImDrawData& drawData)
    {
        ScopedMap vtx(ctx, m_vertices.Get());
        ScopedMap idx(ctx, m_indices.Get());

        ImDrawVert* vtxDst = vtx.As<ImDrawVert>();
        ImDrawIdx*  idxDst = idx.As<ImDrawIdx>();
        for (int n = 0; n < drawData.CmdListsCount; ++n)
        {
            const ImDrawList* list = drawData.CmdLists[n];
            if (list->VtxBuffer.Size > 0)
                std::memcpy(vtxDst, list->VtxBuffer.Data, list->VtxBuffer.Size * sizeof(ImDrawVert));
            if (list->IdxBuffer.Size > 0)
                std::memcpy(idxDst, list->IdxBuffer.Data, list->IdxBuffer.Size * sizeof(ImDrawIdx));
            vtxDst += list->VtxBuffer.Size;
            idxDst += list->IdxBuffer.Size;
        }
    }

    void FrameUploader::UploadProjection(ID3D11DeviceContext* ctx, const ImDrawData& drawData)
    {
        ScopedMap cb(ctx, m_constants);
        const VertexConstants proj = ComputeProjection(drawData.DisplayPos, drawData.DisplaySize);
        std::memcpy(cb.As<VertexConstants>(), &proj, sizeof(proj));
    }
}
