#include "voyage/core/Config.hpp"
#include "voyage/core/Log.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace voyage::core {

static std::filesystem::path Path(const std::filesystem::path& dir) {
    return dir / "voyage.ini";
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

template <typename Int>
static bool ParseInt(std::string_view sv, Int& out) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);

    Int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

static std::string ToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool IsKnownLevel(const std::string& v)
{
    return v == "trace" || v == "debug" || v == "info" || v == "warn" ||
           v == "error" || v == "critical" || v == "off";
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(Config& cfg, const std::filesystem::path& configDir)
{
    const auto path = Path(configDir);

    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Tolerate a UTF-8 BOM from editors that add one.
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF)
    {
        text.erase(0, 3);
    }

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

        // Strip trailing inline comments:
        //   stageDays=5   # a working week on the river
        {
            const std::size_t hashPos = v.find('#');
            const std::size_t semiPos = v.find(';');

            std::size_t cut = std::string::npos;
            if (hashPos != std::string::npos) cut = hashPos;
            if (semiPos != std::string::npos && (cut == std::string::npos || semiPos < cut)) cut = semiPos;

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        if (k == "dataDir")
        {
            if (!v.empty()) cfg.dataDir = v;
        }
        else if (k == "logDir")
        {
            if (!v.empty()) cfg.logDir = v;
        }
        else if (k == "logLevel")
        {
            const std::string lv = ToLower(v);
            if (IsKnownLevel(lv))
                cfg.logLevel = lv;
            else
                logsys::get()->warn("LoadConfig: ignoring unknown logLevel '{}'", v);
        }
        else if (k == "stageDays")
        {
            int parsed = cfg.stageDays;
            if (ParseInt(v, parsed) && parsed >= 1 && parsed <= 10)
                cfg.stageDays = parsed;
            else
                logsys::get()->warn("LoadConfig: ignoring invalid stageDays '{}'", v);
        }
        else if (k == "displayMode")
        {
            const std::string mode = ToLower(v);
            if (mode == "simple" || mode == "detailed")
                cfg.displayMode = mode;
            else
                logsys::get()->warn("LoadConfig: ignoring unknown displayMode '{}'", v);
        }
        else if (k == "seed")
        {
            std::uint64_t parsed = cfg.seed;
            if (ParseInt(v, parsed))
                cfg.seed = parsed;
            else
                logsys::get()->warn("LoadConfig: ignoring invalid seed '{}'", v);
        }
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& configDir)
{
    std::error_code ec;
    std::filesystem::create_directories(configDir, ec);
    if (ec)
    {
        logsys::get()->error("SaveConfig: create_directories failed for {} ({}: {})",
                             configDir.string(), ec.value(), ec.message());
        return false;
    }

    std::ostringstream oss;
    oss << "dataDir="     << cfg.dataDir     << "\n";
    oss << "logDir="      << cfg.logDir      << "\n";
    oss << "logLevel="    << cfg.logLevel    << "\n";
    oss << "stageDays="   << cfg.stageDays   << "\n";
    oss << "displayMode=" << cfg.displayMode << "\n";
    oss << "seed="        << cfg.seed        << "\n";
    const std::string text = oss.str();

    std::ofstream f(Path(configDir), std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace voyage::core
