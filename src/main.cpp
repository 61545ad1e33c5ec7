// src/main.cpp - Vedika command line entry point
//
//   vedika [--config FILE] weekly [--start YYYY-MM-DD] [--format text|yaml]
//   vedika [--config FILE] day    [--date YYYY-MM-DD]  [--format text|yaml]
//   vedika [--config FILE] janam  [--format text|yaml]
//   vedika [--config FILE] verse  <words...> [--top N]

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "digest/digest_renderer.hpp"
#include "digest/digest_serializer.hpp"
#include "digest/record_sink.hpp"
#include "digest/weekly_digest.hpp"
#include "ephemeris/analytic_provider.hpp"
#include "ephemeris/ephemeris_adapter.hpp"
#include "panchang/janam_patri.hpp"
#include "panchang/observance_classifier.hpp"
#include "panchang/panchang_calculator.hpp"
#include "verse/corpus_loader.hpp"
#include "verse/verse_recommender.hpp"

#ifdef VEDIKA_WITH_SWISSEPH
#include "ephemeris/swisseph_provider.hpp"
#endif

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace vedika;

namespace
{

constexpr int kExitUsage = 1;
constexpr int kExitComputation = 2;

constexpr std::string_view kDefaultConfig = "config.yaml";

// -----------------------------------------------------------------------
// Command line
// -----------------------------------------------------------------------
struct CommandLine
{
    std::optional<std::filesystem::path> config_path;
    std::string command;
    std::optional<std::string> date;
    std::string format{"text"};
    int top{3};
    std::vector<std::string> words;
};

void print_usage(std::ostream& out)
{
    out << "usage: vedika [--config FILE] <command> [options]\n"
        << "\n"
        << "commands:\n"
        << "  weekly [--start YYYY-MM-DD] [--format text|yaml]   seven-day digest\n"
        << "  day    [--date YYYY-MM-DD]  [--format text|yaml]   panchang for one day\n"
        << "  janam  [--format text|yaml]                        birth chart from config\n"
        << "  verse  <words...> [--top N]                        search the verse corpus\n";
}

std::optional<CommandLine> parse_command_line(int argc, char** argv)
{
    CommandLine cli;
    std::vector<std::string_view> args(argv + 1, argv + argc);

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "--config" || arg == "--start" || arg == "--date" || arg == "--format" || arg == "--top")
        {
            if (!has_value)
            {
                std::cerr << "missing value for " << arg << '\n';
                return std::nullopt;
            }
            const std::string value(args[++i]);
            if (arg == "--config") cli.config_path = value;
            else if (arg == "--format") cli.format = value;
            else if (arg == "--top")
            {
                const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), cli.top);
                if (ec != std::errc{} || ptr != value.data() + value.size())
                {
                    std::cerr << "--top expects a number, got '" << value << "'\n";
                    return std::nullopt;
                }
            }
            else cli.date = value;
        }
        else if (arg == "-h" || arg == "--help")
        {
            return std::nullopt;
        }
        else if (cli.command.empty())
        {
            cli.command = arg;
        }
        else
        {
            cli.words.emplace_back(arg);
        }
    }

    if (cli.command.empty())
    {
        return std::nullopt;
    }
    if (cli.format != "text" && cli.format != "yaml")
    {
        std::cerr << "unknown format '" << cli.format << "'\n";
        return std::nullopt;
    }
    return cli;
}

// -----------------------------------------------------------------------
// Wiring
// -----------------------------------------------------------------------
std::unique_ptr<ephemeris::EphemerisProvider> make_provider(const core::EphemerisConfig& config)
{
    if (config.provider == "swisseph")
    {
#ifdef VEDIKA_WITH_SWISSEPH
        return std::make_unique<ephemeris::SwissEphemerisProvider>(config.ephe_path);
#else
        core::fail(core::ErrorKind::EphemerisUnavailable,
                   "this build has no Swiss Ephemeris support; set ephemeris.provider: analytic");
#endif
    }
    return std::make_unique<ephemeris::AnalyticProvider>();
}

verse::Corpus load_corpus(const core::CorpusConfig& config)
{
    auto corpus = verse::CorpusLoader::load_yaml(config.path);
    if (!corpus)
    {
        core::fail(core::ErrorKind::CorpusEmpty, "no verses could be loaded from " + config.path.string());
    }
    return std::move(*corpus);
}

verse::VerseRecommender make_recommender(const core::CorpusConfig& config)
{
    auto scorer = verse::make_scorer(config.matcher);
    if (!scorer)
    {
        throw std::invalid_argument("unknown matcher " + config.matcher);
    }
    return verse::VerseRecommender(std::move(*scorer), config.default_verse_id);
}

void publish(const core::AppConfig& config, const YAML::Node& record)
{
    digest::log_sink()(record);
    if (!config.output.records_path.empty())
    {
        digest::file_sink(config.output.records_path)(record);
    }
}

astro::CivilDate resolve_date(const std::optional<std::string>& text, const astro::GeoLocation& location)
{
    if (!text)
    {
        return astro::TimeSystem::local_date(
            astro::Moment{.jd_ut = astro::TimeSystem::now_as_jd(), .utc_offset_hours = location.utc_offset_hours});
    }
    const auto date = astro::TimeSystem::parse_date(*text);
    if (!date)
    {
        core::fail(core::ErrorKind::InvalidDate, "'" + *text + "' is not a YYYY-MM-DD date");
    }
    return *date;
}

// -----------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------
int run_weekly(const CommandLine& cli, const core::AppConfig& config, ephemeris::EphemerisAdapter& adapter)
{
    const auto corpus = load_corpus(config.corpus);
    const auto recommender = make_recommender(config.corpus);
    panchang::PanchangCalculator calculator(adapter);
    digest::WeeklyDigestAssembler assembler(calculator, recommender);

    const auto week = assembler.assemble(resolve_date(cli.date, config.location), config.location, corpus);

    if (cli.format == "yaml")
    {
        std::cout << digest::emit_block(digest::to_yaml(week)) << '\n';
    }
    else
    {
        digest::DigestRenderer{}.render_digest(std::cout, week);
    }
    publish(config, digest::make_digest_record(week));
    return EXIT_SUCCESS;
}

int run_day(const CommandLine& cli, const core::AppConfig& config, ephemeris::EphemerisAdapter& adapter)
{
    panchang::PanchangCalculator calculator(adapter);
    const auto day = calculator.compute(resolve_date(cli.date, config.location), config.location);
    const auto observances = panchang::ObservanceClassifier::classify_day(day);

    if (cli.format == "yaml")
    {
        YAML::Node node = digest::to_yaml(day);
        YAML::Node list(YAML::NodeType::Sequence);
        for (const auto& obs : observances.observances)
        {
            list.push_back(digest::to_yaml(obs));
        }
        node["observances"] = list;
        std::cout << digest::emit_block(node) << '\n';
    }
    else
    {
        digest::DigestRenderer{}.render_day(std::cout, day, observances);
    }
    return EXIT_SUCCESS;
}

int run_janam(const CommandLine& cli, const core::AppConfig& config, ephemeris::EphemerisAdapter& adapter)
{
    const auto& jp = config.janam_patri;
    if (!jp.enabled)
    {
        std::cout << "Janam patri is disabled. Set janam_patri.enabled: true and the birth details in the config.\n";
        return EXIT_SUCCESS;
    }

    const auto corpus = load_corpus(config.corpus);
    const auto recommender = make_recommender(config.corpus);
    panchang::JanamPatriCalculator calculator(adapter);

    std::optional<panchang::JanamPatriOverride> override_values;
    if (jp.janma_nakshatra || jp.rashi)
    {
        override_values = panchang::JanamPatriOverride{.nakshatra = jp.janma_nakshatra, .rashi = jp.rashi};
    }

    auto chart = calculator.compute(
        panchang::BirthDetails{.name = jp.name, .local_time = jp.birth_time, .place = jp.birth_place},
        override_values);
    chart.verses = panchang::JanamPatriCalculator::recommend(chart, recommender, corpus);

    if (cli.format == "yaml")
    {
        std::cout << digest::emit_block(digest::to_yaml(chart)) << '\n';
    }
    else
    {
        digest::DigestRenderer{}.render_janam_patri(std::cout, chart);
    }
    publish(config, digest::make_janam_patri_record(chart));
    return EXIT_SUCCESS;
}

int run_verse(const CommandLine& cli, const core::AppConfig& config)
{
    if (cli.words.empty())
    {
        std::cerr << "verse: give at least one search word\n";
        return kExitUsage;
    }
    const auto corpus = load_corpus(config.corpus);
    const auto recommender = make_recommender(config.corpus);
    const auto results = recommender.recommend(corpus, cli.words, cli.top);
    digest::DigestRenderer{}.render_verses(std::cout, results);
    return EXIT_SUCCESS;
}

std::optional<core::AppConfig> load_config(const CommandLine& cli)
{
    if (cli.config_path)
    {
        return core::ConfigLoader::load(*cli.config_path);
    }
    if (std::filesystem::exists(kDefaultConfig))
    {
        return core::ConfigLoader::load(kDefaultConfig);
    }
    VDK_WARN("No {} found, using built-in defaults", kDefaultConfig);
    return core::AppConfig{};
}

} // anonymous namespace

int main(int argc, char** argv)
{
    const auto cli = parse_command_line(argc, argv);
    if (!cli)
    {
        print_usage(std::cerr);
        return kExitUsage;
    }

    core::Logger::init();

    int status = EXIT_SUCCESS;
    try
    {
        const auto config = load_config(*cli);
        if (!config)
        {
            std::cerr << "error: invalid configuration (see log)\n";
            core::Logger::shutdown();
            return kExitUsage;
        }
        core::Logger::set_level(config->log_level);

        if (cli->command == "verse")
        {
            status = run_verse(*cli, *config);
        }
        else if (cli->command == "weekly" || cli->command == "day" || cli->command == "janam")
        {
            const auto zodiac = ephemeris::parse_zodiac(config->ephemeris.ayanamsa);
            const auto provider = make_provider(config->ephemeris);
            ephemeris::EphemerisAdapter adapter(*provider, zodiac.value_or(ephemeris::Zodiac::Sidereal));
            VDK_INFO("Ephemeris provider: {} ({})", provider->name(), config->ephemeris.ayanamsa);

            if (cli->command == "weekly") status = run_weekly(*cli, *config, adapter);
            else if (cli->command == "day") status = run_day(*cli, *config, adapter);
            else status = run_janam(*cli, *config, adapter);
        }
        else
        {
            std::cerr << "unknown command '" << cli->command << "'\n";
            print_usage(std::cerr);
            status = kExitUsage;
        }
    }
    catch (const core::ComputationError& e)
    {
        std::cerr << "error [" << core::to_string(e.kind()) << "]: " << e.what() << '\n';
        status = kExitComputation;
    }
    catch (const std::exception& e)
    {
        VDK_ERROR("{}", e.what());
        std::cerr << "error: " << e.what() << '\n';
        status = kExitUsage;
    }

    core::Logger::shutdown();
    return status;
}
