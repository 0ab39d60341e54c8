#pragma once
#include <d3d11.h>
#include <wrl/client.h>

#include <vector>

namespace dxgui
{
    // A bound shader plus the class instances it was bound with.
    template <typename TShader>
    struct StageShader
    {
        Microsoft::WRL::ComPtr<TShader> shader;
        std::vector<Microsoft::WRL::ComPtr<ID3D11ClassInstance>> instances;
    };

    // Snapshot of every device-context slot the renderer writes to.
    // A null member means "nothing was bound"; Apply() binds the null back.
    struct ContextState
    {
        static constexpr UINT kMaxViewports = D3D11_VIEWPORT_AND_SCISSORRECT_OBJECT_COUNT_PER_PIPELINE;

        // Rasterizer
        UINT           scissorRectCount = 0;
        D3D11_RECT     scissorRects[kMaxViewports] = {};
        UINT           viewportCount = 0;
        D3D11_VIEWPORT viewports[kMaxViewports] = {};
        Microsoft::WRL::ComPtr<ID3D11RasterizerState> rasterizerState;

        // Output merger
        Microsoft::WRL::ComPtr<ID3D11BlendState> blendState;
        FLOAT blendFactor[4] = {};
        UINT  sampleMask = 0;
        Microsoft::WRL::ComPtr<ID3D11DepthStencilState> depthStencilState;
        UINT  stencilRef = 0;

        // Shader stages
        StageShader<ID3D11VertexShader>   vertexShader;
        StageShader<ID3D11PixelShader>    pixelShader;
        StageShader<ID3D11GeometryShader> geometryShader;
        StageShader<ID3D11HullShader>     hullShader;
        StageShader<ID3D11DomainShader>   domainShader;
        StageShader<ID3D11ComputeShader>  computeShader;
        Microsoft::WRL::ComPtr<ID3D11Buffer>             vsConstantBuffer;   // slot 0
        Microsoft::WRL::ComPtr<ID3D11ShaderResourceView> psShaderResource;   // slot 0
        Microsoft::WRL::ComPtr<ID3D11SamplerState>       psSampler;          // slot 0

        // Input assembler
        D3D11_PRIMITIVE_TOPOLOGY topology = D3D11_PRIMITIVE_TOPOLOGY_UNDEFINED;
        Microsoft::WRL::ComPtr<ID3D11Buffer> indexBuffer;
        DXGI_FORMAT indexBufferFormat = DXGI_FORMAT_UNKNOWN;
        UINT        indexBufferOffset = 0;
        Microsoft::WRL::ComPtr<ID3D11Buffer> vertexBuffer;                   // slot 0
        UINT        vertexBufferStride = 0;
        UINT        vertexBufferOffset = 0;
        Microsoft::WRL::ComPtr<ID3D11InputLayout> inputLayout;

        static ContextState Capture(ID3D11DeviceContext* ctx);
        void Apply(ID3D11DeviceContext* ctx) const;
    };

    // Compares bound object identities and plain values slot by slot.
    bool operator==(const ContextState& a, const ContextState& b);
    inline bool operator!=(const ContextState& a, const ContextState& b) { return !(a == b); }

    // Captures the context state on construction and writes it back exactly
    // once: on Restore() or when the guard goes out of scope, including
    // during exception unwind.
    class ContextStateGuard
    {
    public:
        explicit ContextStateGuard(ID3D11DeviceContext* ctx);
        ~ContextStateGuard() { Restore(); }

        ContextStateGuard(const ContextStateGuard&) = delete;
        ContextStateGuard& operator=(const ContextStateGuard&) = delete;
        ContextStateGuard(ContextStateGuard&&) = delete;
        ContextStateGuard& operator=(ContextStateGuard&&) = delete;

        void Restore() noexcept;

        [[nodiscard]] bool Armed() const noexcept { return m_ctx != nullptr; }
        [[nodiscard]] const ContextState& Saved() const noexcept { return m_saved; }

    private:
        Microsoft::WRL::ComPtr<ID3D11DeviceContext> m_ctx;
        ContextState m_saved;
    };
}
