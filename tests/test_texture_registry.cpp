#include <doctest/doctest.h>

#include "dxgui/TextureRegistry.h"
#include "test_support/d3d11_test_util.h"

#include <stdexcept>

using dxgui::kFontTextureId;
using dxgui::TextureRegistry;

TEST_CASE("TextureRegistry hands out distinct ids that are never the font id")
{
    dxgui::test::WarpDevice warp;
    TextureRegistry reg;

    auto a = dxgui::test::MakeTextureView(warp.device.Get());
    auto b = dxgui::test::MakeTextureView(warp.device.Get());

    const auto idA = reg.Add(a);
    const auto idB = reg.Add(b);

    CHECK(idA != idB);
    CHECK(idA != kFontTextureId);
    CHECK(idB != kFontTextureId);
    CHECK(idA != 0);
    CHECK(reg.Find(idA) == a.Get());
    CHECK(reg.Find(idB) == b.Get());
    CHECK(reg.Size() == 2);
}

TEST_CASE("TextureRegistry rejects the reserved font id and null views")
{
    dxgui::test::WarpDevice warp;
    TextureRegistry reg;

    auto view = dxgui::test::MakeTextureView(warp.device.Get());
    CHECK_THROWS_AS(reg.Insert(kFontTextureId, view), std::invalid_argument);
    CHECK_THROWS_AS(reg.Add(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(reg.Insert(7, nullptr), std::invalid_argument);
    CHECK(reg.Size() == 0);
    CHECK(reg.Find(kFontTextureId) == nullptr);
}

TEST_CASE("TextureRegistry lookups of unknown or removed ids return null")
{
    dxgui::test::WarpDevice warp;
    TextureRegistry reg;

    CHECK(reg.Find(42) == nullptr);

    const auto id = reg.Add(dxgui::test::MakeTextureView(warp.device.Get()));
    REQUIRE(reg.Find(id) != nullptr);

    CHECK(reg.Remove(id));
    CHECK(reg.Find(id) == nullptr);
    CHECK_FALSE(reg.Remove(id));
}

TEST_CASE("TextureRegistry::Add skips ids claimed through Insert")
{
    dxgui::test::WarpDevice warp;
    TextureRegistry reg;

    auto claimed = dxgui::test::MakeTextureView(warp.device.Get());
    reg.Insert(1, claimed);

    const auto id = reg.Add(dxgui::test::MakeTextureView(warp.device.Get()));
    CHECK(id != 1);
    CHECK(reg.Find(1) == claimed.Get());
}

namespace {

ULONG RefCount(IUnknown* p)
{
    p->AddRef();
    return p->Release();
}

} // namespace

TEST_CASE("TextureRegistry holds its own reference to the view")
{
    dxgui::test::WarpDevice warp;
    TextureRegistry reg;

    auto view = dxgui::test::MakeTextureView(warp.device.Get());
    const ULONG hostOnly = RefCount(view.Get());
    const auto id = reg.Add(view);
    CHECK(RefCount(view.Get()) == hostOnly + 1);

    CHECK(reg.Remove(id));
    CHECK(RefCount(view.Get()) == hostOnly);
}

TEST_CASE("TextureRegistry keeps a view alive after the host lets go")
{
    dxgui::test::WarpDevice warp;
    TextureRegistry reg;

    auto view = dxgui::test::MakeTextureView(warp.device.Get(), 8, 2);
    const auto id = reg.Add(view);
    view.Reset();

    ID3D11ShaderResourceView* kept = reg.Find(id);
    REQUIRE(kept != nullptr);
    D3D11_SHADER_RESOURCE_VIEW_DESC desc{};
    kept->GetDesc(&desc);
    CHECK(desc.Format == DXGI_FORMAT_R8G8B8A8_UNORM);
    CHECK(desc.ViewDimension == D3D11_SRV_DIMENSION_TEXTURE2D);
}
