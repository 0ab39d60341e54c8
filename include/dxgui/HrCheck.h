#pragma once
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <comdef.h>
#include <cstdint>
#include <stdexcept>
#include <sstream>
#include <string>

namespace dxgui
{
    inline std::string WideToUtf8(const wchar_t* w)
    {
        if (!w) return {};
        int len = WideCharToMultiByte(CP_UTF8, 0, w, -1, nullptr, 0, nullptr, nullptr);
        std::string s(len > 0 ? len - 1 : 0, '\0');
        if (len > 1) WideCharToMultiByte(CP_UTF8, 0, w, -1, s.data(), len, nullptr, nullptr);
        return s;
    }

    // A failed Direct3D / DXGI call. Carries the HRESULT so callers can tell
    // E_OUTOFMEMORY from DXGI_ERROR_DEVICE_REMOVED and friends.
    class GpuError : public std::runtime_error
    {
    public:
        GpuError(HRESULT hr, const std::string& what)
            : std::runtime_error(what), m_hr(hr) {}

        [[nodiscard]] HRESULT Code() const noexcept { return m_hr; }

    private:
        HRESULT m_hr;
    };

    // A draw command referenced a texture id that is neither the font atlas
    // nor registered with the renderer.
    class TextureNotFound : public std::runtime_error
    {
    public:
        explicit TextureNotFound(std::uint64_t id)
            : std::runtime_error(Describe(id)), m_id(id) {}

        [[nodiscard]] std::uint64_t Id() const noexcept { return m_id; }

    private:
        static std::string Describe(std::uint64_t id)
        {
            std::ostringstream oss;
            oss << "texture not found: id 0x" << std::hex << id;
            return oss.str();
        }

        std::uint64_t m_id;
    };

    inline void ThrowIfFailed(HRESULT hr, const char* expr, const char* file, int line)
    {
        if (FAILED(hr))
        {
            _com_error err(hr);
            std::ostringstream oss;
            oss << "HRESULT 0x" << std::hex << static_cast<unsigned long>(hr)
                << " at " << file << ":" << std::dec << line
                << " for " << expr << " - " << WideToUtf8(err.ErrorMessage());
            throw GpuError(hr, oss.str());
        }
    }
} // namespace dxgui

#define DXGUI_HR_CHECK(EXPR) ::dxgui::ThrowIfFailed((EXPR), #EXPR, __FILE__, __LINE__)
