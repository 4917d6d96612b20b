// src/voyage/app/main.cpp
//
// voyage_weather: command-line front end for journey weather.

#include "voyage/app/CommandLineArgs.hpp"
#include "voyage/app/WeatherFormat.hpp"
#include "voyage/core/Config.hpp"
#include "voyage/core/Errors.hpp"
#include "voyage/core/Log.hpp"
#include "voyage/core/Rng.hpp"
#include "voyage/journey/JourneyService.hpp"
#include "voyage/journey/JourneyStore.hpp"
#include "voyage/journey/StageOrchestrator.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>

namespace {

using namespace voyage;

constexpr const char* kDefaultJourney = "default";

rng::Seed KeyStream(const std::string& key)
{
    rng::Seed h = 0;
    for (unsigned char c : key) h = rng::mix64(h ^ c);
    return h;
}

rng::Seed ClockSeed()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return rng::mix64(static_cast<std::uint64_t>(now));
}

const std::string& Arg(const app::CommandLineArgs& args, std::size_t i, const char* what)
{
    if (i >= args.positional.size())
        throw ConfigurationError(std::string("'") + args.command + "' needs a " + what);
    return args.positional[i];
}

int ParseDay(const std::string& text)
{
    int day = 0;
    try {
        std::size_t used = 0;
        day = std::stoi(text, &used);
        if (used != text.size()) day = 0;
    }
    catch (const std::logic_error&) {
        day = 0;
    }
    if (day < 1)
        throw ConfigurationError("'" + text + "' is not a day number");
    return day;
}

int Run(const app::CommandLineArgs& args)
{
    core::Config cfg;
    const std::string configDir = args.configDir.value_or(".");
    const bool haveConfig = core::LoadConfig(cfg, configDir);

    if (args.dataDir)  cfg.dataDir = *args.dataDir;
    if (args.logDir)   cfg.logDir = *args.logDir;
    if (args.logLevel) cfg.logLevel = *args.logLevel;
    if (args.seed)     cfg.seed = *args.seed;

    logsys::init(cfg.logDir, logsys::parse_level(cfg.logLevel));
    auto log = logsys::get();
    if (!haveConfig)
        log->debug("No voyage.ini in {}; using defaults", configDir);

    const std::string key = args.journey.value_or(kDefaultJourney);
    journey::ValidateJourneyKey(key);

    const weather::WeatherTables& tables = weather::WeatherTables::Default();
    journey::JsonFileJourneyStore store(cfg.dataDir);

    // A fixed seed replays the same dice for the same journey and day.
    const rng::Seed seed = cfg.seed != 0 ? cfg.seed : ClockSeed();
    rng::DayKeyedRandomSource dice(seed, KeyStream(key));
    log->debug("journey {}: seed {}", key, seed);

    journey::JourneyService service(store);
    journey::StageOrchestrator orchestrator(store, tables, dice);

    const std::string& cmd = args.command;

    if (cmd == "start")
    {
        journey::JourneyOptions opts;
        opts.stageDuration = args.stageDays.value_or(cfg.stageDays);
        opts.displayMode   = journey::ParseDisplayMode(args.display.value_or(cfg.displayMode));

        const auto region = weather::ParseRegion(Arg(args, 0, "region"));
        const auto season = weather::ParseSeason(Arg(args, 1, "season"));
        const auto state  = service.start(key, region, season, opts);
        std::cout << "Journey '" << key << "' started in " << weather::DisplayName(state.region)
                  << " (" << weather::DisplayName(state.season) << "), stage length "
                  << state.stageDuration << " day(s).\n";
        return 0;
    }

    if (cmd == "next")
    {
        const auto state = service.state(key);
        const auto day   = orchestrator.generateDay(key);
        std::cout << app::FormatDay(day, state.displayMode, tables);
        return 0;
    }

    if (cmd == "stage")
    {
        std::optional<int> days = args.stageDays;
        if (!args.positional.empty()) days = ParseDay(args.positional[0]);

        const auto state   = service.state(key);
        const auto records = orchestrator.generateStage(key, days);
        std::cout << app::FormatStage(state.currentStage, records, state.displayMode, tables);
        return 0;
    }

    if (cmd == "override")
    {
        const auto region = weather::ParseRegion(Arg(args, 0, "region"));
        const auto season = weather::ParseSeason(Arg(args, 1, "season"));
        const auto state  = service.state(key);
        const int  n      = args.positional.size() > 2 ? ParseDay(args.positional[2]) : state.currentDay;
        const auto day    = orchestrator.overrideDay(key, n, region, season);
        std::cout << app::FormatDay(day, state.displayMode, tables);
        return 0;
    }

    if (cmd == "view")
    {
        const int n = ParseDay(Arg(args, 0, "day number"));
        const auto state = service.state(key);
        const auto day   = orchestrator.viewDay(key, n);
        if (!day)
        {
            std::cout << "Day " << n << " has not been generated yet (next day is "
                      << state.currentDay << ").\n";
            return 1;
        }
        std::cout << app::FormatDay(*day, state.displayMode, tables);
        return 0;
    }

    if (cmd == "status")
    {
        const auto state = service.state(key);
        std::cout << app::FormatStatus(key, state, service.cooldowns(key));
        return 0;
    }

    if (cmd == "configure")
    {
        std::optional<journey::DisplayMode> mode;
        if (args.display) mode = journey::ParseDisplayMode(*args.display);
        if (!args.stageDays && !mode)
            throw ConfigurationError("'configure' needs --stage-days and/or --display");

        const auto state = service.configure(key, args.stageDays, mode);
        std::cout << "Journey '" << key << "': stage length " << state.stageDuration
                  << " day(s), " << journey::ToKey(state.displayMode) << " display.\n";
        return 0;
    }

    if (cmd == "end")
    {
        service.end(key);
        std::cout << "Journey '" << key << "' ended.\n";
        return 0;
    }

    std::cerr << "Unknown command '" << cmd << "'.\n\n" << app::BuildCommandLineHelpText();
    return 2;
}

} // namespace

int main(int argc, char** argv)
{
    const voyage::app::CommandLineArgs args = voyage::app::ParseCommandLineArgs(argc, argv);

    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            std::cerr << "Unrecognised or incomplete option: " << u << "\n";
        std::cerr << "\n" << voyage::app::BuildCommandLineHelpText();
        return 2;
    }
    if (args.showHelp || args.command.empty())
    {
        std::cout << voyage::app::BuildCommandLineHelpText();
        return args.showHelp ? 0 : 2;
    }

    try {
        return Run(args);
    }
    catch (const voyage::JourneyNotFound& e) {
        voyage::logsys::get()->error("{}", e.what());
        std::cerr << "No journey '" << e.key() << "'. Start one with: voyage_weather start <region> <season>\n";
        return 1;
    }
    catch (const voyage::Error& e) {
        voyage::logsys::get()->error("{}", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        voyage::logsys::get()->critical("unexpected failure: {}", e.what());
        return 1;
    }
}
