#include "dxgui/Config.h"
#include "dxgui/Log.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace dxgui {

static std::filesystem::path Path(const std::filesystem::path& dir) {
    return dir / "dxgui.ini";
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static bool ParseSize(std::string_view sv, std::size_t& out) noexcept
{
    std::size_t v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

// Slack of 0 would allocate empty buffers before the first frame.
static bool ParseSlack(std::string_view sv, std::size_t& out) noexcept
{
    std::size_t v = 0;
    if (!ParseSize(sv, v) || v == 0)
        return false;
    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

// Strip a trailing "# ...", "; ..." or "// ..." comment from a value.
static void StripInlineComment(std::string& v)
{
    std::size_t cut = std::string::npos;
    auto consider = [&](std::size_t p)
    {
        if (p == std::string::npos) return;
        if (cut == std::string::npos || p < cut) cut = p;
    };

    consider(v.find('#'));
    consider(v.find(';'));
    consider(v.find("//"));

    if (cut != std::string::npos)
    {
        v.erase(cut);
        TrimInPlace(v);
    }
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(RendererConfig& cfg, const std::filesystem::path& dir)
{
    const auto path = Path(dir);

    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // UTF-8 BOM from Windows editors.
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        text.erase(0, 3);

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);
        StripInlineComment(v);

        if (k.empty()) continue;

        bool ok = true;
        if (k == "vertexSlack")
        {
            ok = ParseSlack(v, cfg.vertexSlack);
        }
        else if (k == "indexSlack")
        {
            ok = ParseSlack(v, cfg.indexSlack);
        }
        else if (k == "rendererName")
        {
            ok = !v.empty();
            if (ok) cfg.rendererName = v;
        }
        else if (k == "logLevel")
        {
            cfg.logLevel = v;
        }
        else if (k == "logFile")
        {
            cfg.logFile = v;
        }
        else if (k == "logConsole")
        {
            ok = ParseBool(v, cfg.logConsole);
        }
        else
        {
            log::Get()->warn("LoadConfig: unknown key '{}' in {}", k, path.string());
            continue;
        }

        if (!ok)
            log::Get()->warn("LoadConfig: bad value '{}' for '{}' in {}", v, k, path.string());
    }

    return true;
}

bool SaveConfig(const RendererConfig& cfg, const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        log::Get()->error("SaveConfig: create_directories failed for {} ({}: {})",
                          dir.string(), ec.value(), ec.message());
        return false;
    }

    std::ostringstream oss;
    oss << "vertexSlack="  << cfg.vertexSlack  << "\n";
    oss << "indexSlack="   << cfg.indexSlack   << "\n";
    oss << "rendererName=" << cfg.rendererName << "\n";
    oss << "logLevel="     << cfg.logLevel     << "\n";
    oss << "logFile="      << cfg.logFile      << "\n";
    oss << "logConsole="   << (cfg.logConsole ? 1 : 0) << "\n";
    const std::string text = oss.str();

    std::ofstream f(Path(dir), std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace dxgui
