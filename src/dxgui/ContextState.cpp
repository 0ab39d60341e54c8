#include "dxgui/ContextState.h"

#include <cstring>
#include <utility>

using Microsoft::WRL::ComPtr;

namespace dxgui
{
    namespace
    {
        // D3D11 allows at most 256 class instances per stage.
        constexpr UINT kMaxClassInstances = 256;

        // `get` has the signature of ID3D11DeviceContext::XXGetShader.
        template <typename TShader, typename TGet>
        StageShader<TShader> CaptureStage(TGet&& get)
        {
            StageShader<TShader> out;
            ID3D11ClassInstance* raw[kMaxClassInstances] = {};
            UINT count = kMaxClassInstances;
            get(out.shader.GetAddressOf(), raw, &count);

            out.instances.reserve(count);
            for (UINT i = 0; i < count; ++i)
            {
                ComPtr<ID3D11ClassInstance> inst;
                inst.Attach(raw[i]); // Get* returned an owned reference
                out.instances.push_back(std::move(inst));
            }
            return out;
        }

        // `set` has the signature of ID3D11DeviceContext::XXSetShader.
        template <typename TShader, typename TSet>
        void ApplyStage(const StageShader<TShader>& stage, TSet&& set)
        {
            ID3D11ClassInstance* raw[kMaxClassInstances] = {};
            UINT count = 0;
            for (const auto& inst : stage.instances)
            {
                if (count == kMaxClassInstances)
                    break;
                raw[count++] = inst.Get();
            }
            set(stage.shader.Get(), count ? raw : nullptr, count);
        }

        template <typename TShader>
        bool SameStage(const StageShader<TShader>& a, const StageShader<TShader>& b)
        {
            if (a.shader.Get() != b.shader.Get() || a.instances.size() != b.instances.size())
                return false;
            for (std::size_t i = 0; i < a.instances.size(); ++i)
                if (a.instances[i].Get() != b.instances[i].Get())
                    return false;
            return true;
        }

        bool SameRect(const D3D11_RECT& a, const D3D11_RECT& b)
        {
            return a.left == b.left && a.top == b.top && a.right == b.right && a.bottom == b.bottom;
        }

        bool SameViewport(const D3D11_VIEWPORT& a, const D3D11_VIEWPORT& b)
        {
            return a.TopLeftX == b.TopLeftX && a.TopLeftY == b.TopLeftY &&
                   a.Width == b.Width && a.Height == b.Height &&
                   a.MinDepth == b.MinDepth && a.MaxDepth == b.MaxDepth;
        }
    }

    ContextState ContextState::Capture(ID3D11DeviceContext* ctx)
    {
        ContextState s;

        s.scissorRectCount = kMaxViewports;
        ctx->RSGetScissorRects(&s.scissorRectCount, s.scissorRects);
        s.viewportCount = kMaxViewports;
        ctx->RSGetViewports(&s.viewportCount, s.viewports);
        ctx->RSGetState(s.rasterizerState.GetAddressOf());

        ctx->OMGetBlendState(s.blendState.GetAddressOf(), s.blendFactor, &s.sampleMask);
        ctx->OMGetDepthStencilState(s.depthStencilState.GetAddressOf(), &s.stencilRef);

        s.vertexShader = CaptureStage<ID3D11VertexShader>(
            [&](ID3D11VertexShader** sh, ID3D11ClassInstance** ci, UINT* n) { ctx->VSGetShader(sh, ci, n); });
        s.pixelShader = CaptureStage<ID3D11PixelShader>(
            [&](ID3D11PixelShader** sh, ID3D11ClassInstance** ci, UINT* n) { ctx->PSGetShader(sh, ci, n); });
        s.geometryShader = CaptureStage<ID3D11GeometryShader>(
            [&](ID3D11GeometryShader** sh, ID3D11ClassInstance** ci, UINT* n) { ctx->GSGetShader(sh, ci, n); });
        s.hullShader = CaptureStage<ID3D11HullShader>(
            [&](ID3D11HullShader** sh, ID3D11ClassInstance** ci, UINT* n) { ctx->HSGetShader(sh, ci, n); });
        s.domainShader = CaptureStage<ID3D11DomainShader>(
            [&](ID3D11DomainShader** sh, ID3D11ClassInstance** ci, UINT* n) { ctx->DSGetShader(sh, ci, n); });
        s.computeShader = CaptureStage<ID3D11ComputeShader>(
            [&](ID3D11ComputeShader** sh, ID3D11ClassInstance** ci, UINT* n) { ctx->CSGetShader(sh, ci, n); });

        ctx->VSGetConstantBuffers(0, 1, s.vsConstantBuffer.GetAddressOf());
        ctx->PSGetShaderResources(0, 1, s.psShaderResource.GetAddressOf());
        ctx->PSGetSamplers(0, 1, s.psSampler.GetAddressOf());

        ctx->IAGetPrimitiveTopology(&s.topology);
        ctx->IAGetIndexBuffer(s.indexBuffer.GetAddressOf(), &s.indexBufferFormat, &s.indexBufferOffset);
        ctx->IAGetVertexBuffers(0, 1, s.vertexBuffer.GetAddressOf(), &s.vertexBufferStride, &s.vertexBufferOffset);
        ctx->IAGetInputLayout(s.inputLayout.GetAddressOf());

        return s;
    }

    void ContextState::Apply(ID3D11DeviceContext* ctx) const
    {
        ctx->RSSetScissorRects(scissorRectCount, scissorRectCount ? scissorRects : nullptr);
        ctx->RSSetViewports(viewportCount, viewportCount ? viewports : nullptr);
        ctx->RSSetState(rasterizerState.Get());

        ctx->OMSetBlendState(blendState.Get(), blendFactor, sampleMask);
        ctx->OMSetDepthStencilState(depthStencilState.Get(), stencilRef);

        ApplyStage(vertexShader,
            [&](ID3D11VertexShader* sh, ID3D11ClassInstance* const* ci, UINT n) { ctx->VSSetShader(sh, ci, n); });
        ApplyStage(pixelShader,
            [&](ID3D11PixelShader* sh, ID3D11ClassInstance* const* ci, UINT n) { ctx->PSSetShader(sh, ci, n); });
        ApplyStage(geometryShader,
            [&](ID3D11GeometryShader* sh, ID3D11ClassInstance* const* ci, UINT n) { ctx->GSSetShader(sh, ci, n); });
        ApplyStage(hullShader,
            [&](ID3D11HullShader* sh, ID3D11ClassInstance* const* ci, UINT n) { ctx->HSSetShader(sh, ci, n); });
        ApplyStage(domainShader,
            [&](ID3D11DomainShader* sh, ID3D11ClassInstance* const* ci, UINT n) { ctx->DSSetShader(sh, ci, n); });
        ApplyStage(computeShader,
            [&](ID3D11ComputeShader* sh, ID3D11ClassInstance* const* ci, UINT n) { ctx->CSSetShader(sh, ci, n); });

        ID3D11Buffer* cb = vsConstantBuffer.Get();
        ctx->VSSetConstantBuffers(0, 1, &cb);
        ID3D11ShaderResourceView* srv = psShaderResource.Get();
        ctx->PSSetShaderResources(0, 1, &srv);
        ID3D11SamplerState* sampler = psSampler.Get();
        ctx->PSSetSamplers(0, 1, &sampler);

        ctx->IASetPrimitiveTopology(topology);
        ctx->IASetIndexBuffer(indexBuffer.Get(), indexBufferFormat, indexBufferOffset);
        ID3D11Buffer* vb = vertexBuffer.Get();
        ctx->IASetVertexBuffers(0, 1, &vb, &vertexBufferStride, &vertexBufferOffset);
        ctx->IASetInputLayout(inputLayout.Get());
    }

    bool operator==(const ContextState& a, const ContextState& b)
    {
        if (a.scissorRectCount != b.scissorRectCount || a.viewportCount != b.viewportCount)
            return false;
        for (UINT i = 0; i < a.scissorRectCount; ++i)
            if (!SameRect(a.scissorRects[i], b.scissorRects[i]))
                return false;
        for (UINT i = 0; i < a.viewportCount; ++i)
            if (!SameViewport(a.viewports[i], b.viewports[i]))
                return false;

        return a.rasterizerState.Get() == b.rasterizerState.Get() &&
               a.blendState.Get() == b.blendState.Get() &&
               std::memcmp(a.blendFactor, b.blendFactor, sizeof(a.blendFactor)) == 0 &&
               a.sampleMask == b.sampleMask &&
               a.depthStencilState.Get() == b.depthStencilState.Get() &&
               a.stencilRef == b.stencilRef &&
               SameStage(a.vertexShader, b.vertexShader) &&
               SameStage(a.pixelShader, b.pixelShader) &&
               SameStage(a.geometryShader, b.geometryShader) &&
               SameStage(a.hullShader, b.hullShader) &&
               SameStage(a.domainShader, b.domainShader) &&
               SameStage(a.computeShader, b.computeShader) &&
               a.vsConstantBuffer.Get() == b.vsConstantBuffer.Get() &&
               a.psShaderResource.Get() == b.psShaderResource.Get() &&
               a.psSampler.Get() == b.psSampler.Get() &&
               a.topology == b.topology &&
               a.indexBuffer.Get() == b.indexBuffer.Get() &&
               a.indexBufferFormat == b.indexBufferFormat &&
               a.indexBufferOffset == b.indexBufferOffset &&
               a.vertexBuffer.Get() == b.vertexBuffer.Get() &&
               a.vertexBufferStride == b.vertexBufferStride &&
               a.vertexBufferOffset == b.vertexBufferOffset &&
               a.inputLayout.Get() == b.inputLayout.Get();
    }

    ContextStateGuard::ContextStateGuard(ID3D11DeviceContext* ctx)
        : m_ctx(ctx), m_saved(ContextState::Capture(ctx))
    {
    }

    void ContextStateGuard::Restore() noexcept
    {
        if (!m_ctx)
            return;

        m_saved.Apply(m_ctx.Get());
        m_ctx.Reset();
        m_saved = ContextState{};
    }
}
