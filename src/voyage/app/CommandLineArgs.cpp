#include "voyage/app/CommandLineArgs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <sstream>

namespace voyage::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Matches "--opt=value" / "--opt:value" against `prefix` ("--opt").
// `arg` is the lower-cased argument, `raw` the original; the value is taken from `raw`.
[[nodiscard]] bool ConsumeValue(std::string_view arg,
                                std::string_view raw,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() == n)
        return false;

    const char sep = arg[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = raw.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

[[nodiscard]] std::optional<std::uint64_t> ParseU64(std::string_view s)
{
    std::uint64_t v = 0;
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (s.empty() || ec != std::errc{} || ptr != end)
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;
    const std::size_t argc = argv.size();

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        // Non-options: the first is the command, the rest are its arguments.
        // "-5" is not an option here, so negative numbers can be passed through.
        const bool looksLikeOption = raw.size() > 1 && raw[0] == '-' &&
                                     !(raw[1] >= '0' && raw[1] <= '9');
        if (!looksLikeOption)
        {
            if (out.command.empty())
                out.command = ToLower(raw);
            else
                out.positional.emplace_back(raw);
            continue;
        }

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Options with values
        std::string_view value;

        const auto takeNextString = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argc || argv[i + 1].empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(argv[i + 1]);
            ++i;
        };

        const auto takeNextInt = [&](std::optional<int>& dst) {
            if (i + 1 >= argc) {
                addUnknown(raw);
                return;
            }
            const auto parsed = ParseInt(argv[i + 1]);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
            ++i;
        };

        const auto parseIntInto = [&](std::optional<int>& dst, std::string_view v) {
            const auto parsed = ParseInt(v);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
        };

        struct StringOption {
            std::string_view            name;
            std::string_view            alias;
            std::optional<std::string>* dst;
        };
        const StringOption stringOptions[] = {
            {"--config",    "-c", &out.configDir},
            {"--data",      "-d", &out.dataDir},
            {"--log-dir",   "",   &out.logDir},
            {"--log-level", "",   &out.logLevel},
            {"--journey",   "-j", &out.journey},
            {"--display",   "",   &out.display},
        };

        bool handled = false;
        for (const StringOption& opt : stringOptions)
        {
            if (arg == opt.name || (!opt.alias.empty() && arg == opt.alias)) {
                takeNextString(*opt.dst);
                handled = true;
                break;
            }
            if (ConsumeValue(arg, raw, opt.name, value) ||
                (!opt.alias.empty() && ConsumeValue(arg, raw, opt.alias, value))) {
                if (value.empty())
                    addUnknown(raw);
                else
                    *opt.dst = std::string(value);
                handled = true;
                break;
            }
        }
        if (handled)
            continue;

        if (arg == "--stage-days" || arg == "--days") {
            takeNextInt(out.stageDays);
            continue;
        }
        if (ConsumeValue(arg, raw, "--stage-days", value) || ConsumeValue(arg, raw, "--days", value)) {
            parseIntInto(out.stageDays, value);
            continue;
        }

        if (arg == "--seed") {
            if (i + 1 >= argc) {
                addUnknown(raw);
                continue;
            }
            const auto parsed = ParseU64(argv[i + 1]);
            if (!parsed) {
                addUnknown(raw);
                continue;
            }
            out.seed = *parsed;
            ++i;
            continue;
        }
        if (ConsumeValue(arg, raw, "--seed", value)) {
            const auto parsed = ParseU64(value);
            if (parsed)
                out.seed = *parsed;
            else
                addUnknown(raw);
            continue;
        }

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(static_cast<std::size_t>(std::max(argc, 0)));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "voyage_weather - river journey weather\n\n";
    oss << "Usage\n";
    oss << "  voyage_weather [options] <command> [args]\n\n";

    oss << "Commands\n";
    oss << "  start <region> <season>      Start (or restart) a journey at day 1\n";
    oss << "  next                         Generate the next day\n";
    oss << "  stage [days]                 Generate a stage (default: the journey's stage length)\n";
    oss << "  override <region> <season> [day]\n";
    oss << "                               Generate a day (default: the next) with explicit region/season\n";
    oss << "  view <day>                   Show a generated day\n";
    oss << "  status                       Show journey state and event cooldowns\n";
    oss << "  configure                    Change --stage-days and/or --display for the journey\n";
    oss << "  end                          End the journey and delete its days\n\n";

    oss << "Options\n";
    oss << "  --config, -c <dir>           Directory holding voyage.ini (default: .)\n";
    oss << "  --data, -d <dir>             Journey data directory (overrides dataDir)\n";
    oss << "  --log-dir <dir>              Log directory (overrides logDir)\n";
    oss << "  --log-level <level>          trace|debug|info|warn|error|critical|off\n";
    oss << "  --journey, -j <key>          Journey key (default: default)\n";
    oss << "  --seed <N>                   Seed for the dice (0 = from the clock)\n";
    oss << "  --stage-days <1..10>         Stage length for start/configure\n";
    oss << "  --display simple|detailed    Output detail for start/configure\n";
    oss << "  --help, -h                   Show this help\n\n";

    oss << "Regions\n";
    oss << "  reikland nordland ostland middenland hochland talabecland ostermark stirland\n";
    oss << "  sylvania wissenland averland solland kislev wasteland border_princes\n\n";

    oss << "Examples\n";
    oss << "  voyage_weather start reikland summer --stage-days 5\n";
    oss << "  voyage_weather stage\n";
    oss << "  voyage_weather -j barge-7 override kislev winter\n";
    oss << "  voyage_weather -j barge-7 override kislev winter 4\n";
    return oss.str();
}

} // namespace voyage::app
