#include "ssemcp/tools/builtin.hpp"

#include "ssemcp/content.hpp"
#include "ssemcp/exceptions.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace ssemcp::tools
{

namespace
{
constexpr double SUN_TEMPERATURE_K = 5778.0;

struct StarEntry
{
    const char* name;
    const char* type;
    const char* temperature;
    const char* luminosity;
    const char* description;
};

const std::array<StarEntry, 4> STAR_CATALOGUE = {{
    {"Sun", "G-type main-sequence star", "5778K", "1x solar luminosity",
     "The star at the centre of our solar system, a typical yellow dwarf"},
    {"Sirius", "A-type main-sequence star", "9940K", "25x solar luminosity",
     "The brightest star in the night sky, a binary system"},
    {"Betelgeuse", "M-type supergiant", "3500K", "100000x solar luminosity",
     "The red supergiant in Orion, one of the largest known stars"},
    {"Vega", "A-type main-sequence star", "9602K", "40x solar luminosity",
     "The brightest star in Lyra, once the pole star"},
}};

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// 5778 -> "5778", 5778.5 -> "5778.5"
std::string format_number(double v)
{
    std::ostringstream oss;
    if (std::floor(v) == v && std::fabs(v) < 1e15)
        oss << static_cast<long long>(v);
    else
        oss << v;
    return oss.str();
}

std::string format_ratio(double v)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

double number_arg(const ssemcp::Json& args, const char* key)
{
    auto it = args.find(key);
    if (it == args.end() || it->is_null())
        throw ssemcp::ValidationError(std::string("missing required argument: ") + key);
    if (!it->is_number())
        throw ssemcp::ValidationError(std::string(key) + " must be a number");
    return it->get<double>();
}
} // namespace

Tool make_echo_tool()
{
    return Tool{"echo", "Echo the given text back",
                ssemcp::Json{{"type", "object"},
                             {"properties",
                              ssemcp::Json{{"text", ssemcp::Json{{"type", "string"},
                                                                 {"description", "Text to echo"}}}}},
                             {"required", ssemcp::Json::array({"text"})}},
                [](const ssemcp::Json& args) -> ssemcp::Json
                {
                    auto text = args.value("text", std::string());
                    return ssemcp::Json::array({text_block("echo: " + text)});
                }};
}

Tool make_star_info_tool()
{
    return Tool{
        "get_star_info", "Look up classification details for a named star",
        ssemcp::Json{
            {"type", "object"},
            {"properties",
             ssemcp::Json{{"star_name", ssemcp::Json{{"type", "string"},
                                                     {"description", "Star name or type"}}}}},
            {"required", ssemcp::Json::array({"star_name"})}},
        [](const ssemcp::Json& args) -> ssemcp::Json
        {
            auto star_name = args.value("star_name", std::string());
            auto key = lower(star_name);
            std::ostringstream out;
            for (const auto& star : STAR_CATALOGUE)
            {
                if (lower(star.name) != key)
                    continue;
                out << "Star: " << star.name << "\n"
                    << "Type: " << star.type << "\n"
                    << "Temperature: " << star.temperature << "\n"
                    << "Luminosity: " << star.luminosity << "\n"
                    << "Description: " << star.description;
                return ssemcp::Json::array({text_block(out.str())});
            }
            out << "Sorry, no information about '" << star_name << "' in the catalogue.\n"
                << "Available stars: ";
            for (size_t i = 0; i < STAR_CATALOGUE.size(); ++i)
                out << (i ? ", " : "") << STAR_CATALOGUE[i].name;
            return ssemcp::Json::array({text_block(out.str())});
        }};
}

Tool make_classify_star_tool()
{
    return Tool{
        "classify_star", "Classify a star from its surface temperature and luminosity",
        ssemcp::Json{
            {"type", "object"},
            {"properties",
             ssemcp::Json{
                 {"temperature", ssemcp::Json{{"type", "number"},
                                              {"description", "Surface temperature (K)"}}},
                 {"luminosity", ssemcp::Json{{"type", "number"},
                                             {"description", "Luminosity (solar units)"}}}}},
            {"required", ssemcp::Json::array({"temperature", "luminosity"})}},
        [](const ssemcp::Json& args) -> ssemcp::Json
        {
            double temperature = number_arg(args, "temperature");
            double luminosity = number_arg(args, "luminosity");
            if (temperature <= 0 || luminosity <= 0)
                throw ssemcp::ValidationError("temperature and luminosity must be positive");

            const char* spectral_class = "M";
            const char* colour = "red";
            if (temperature >= 30000)
            {
                spectral_class = "O";
                colour = "blue";
            }
            else if (temperature >= 10000)
            {
                spectral_class = "B";
                colour = "blue-white";
            }
            else if (temperature >= 7500)
            {
                spectral_class = "A";
                colour = "white";
            }
            else if (temperature >= 6000)
            {
                spectral_class = "F";
                colour = "yellow-white";
            }
            else if (temperature >= 5200)
            {
                spectral_class = "G";
                colour = "yellow";
            }
            else if (temperature >= 3700)
            {
                spectral_class = "K";
                colour = "orange";
            }

            const char* luminosity_class = "white dwarf";
            if (luminosity >= 10000)
                luminosity_class = "supergiant";
            else if (luminosity >= 1000)
                luminosity_class = "bright giant";
            else if (luminosity >= 100)
                luminosity_class = "giant";
            else if (luminosity >= 0.1)
                luminosity_class = "main-sequence star";

            std::ostringstream out;
            out << "Classification:\n"
                << "Temperature: " << format_number(temperature) << "K\n"
                << "Luminosity: " << format_number(luminosity) << "x solar\n"
                << "Spectral class: " << spectral_class << "-type\n"
                << "Colour: " << colour << "\n"
                << "Class: " << luminosity_class << "\n";
            if (temperature > SUN_TEMPERATURE_K)
                out << "\nHotter than the Sun (" << format_ratio(temperature / SUN_TEMPERATURE_K)
                    << "x)";
            else
                out << "\nCooler than the Sun (" << format_ratio(SUN_TEMPERATURE_K / temperature)
                    << "x)";
            if (luminosity > 1)
                out << "\nBrighter than the Sun (" << format_ratio(luminosity) << "x)";
            else
                out << "\nDimmer than the Sun (" << format_ratio(1 / luminosity) << "x)";
            return ssemcp::Json::array({text_block(out.str())});
        }};
}

Tool make_mood_tool()
{
    return Tool{"get_mood", "Report the current mood of someone",
                ssemcp::Json{{"type", "object"},
                             {"properties",
                              ssemcp::Json{{"name", ssemcp::Json{{"type", "string"},
                                                                 {"description", "Who to ask"}}}}},
                             {"required", ssemcp::Json::array()}},
                [](const ssemcp::Json& args) -> ssemcp::Json
                {
                    auto name = args.value("name", std::string("world"));
                    const std::array<std::string, 6> moods = {
                        name + " is in a great mood today!",
                        name + " feels a little tired today...",
                        name + " is full of energy today!",
                        name + " is calm today.",
                        name + " is a bit excited today!",
                        name + " is pondering life today...",
                    };
                    thread_local std::mt19937 gen{std::random_device{}()};
                    std::uniform_int_distribution<size_t> dis(0, moods.size() - 1);
                    return ssemcp::Json::array({text_block(moods[dis(gen)])});
                }};
}

size_t register_builtin_tools(ToolRegistry& registry, const Settings& settings)
{
    size_t count = 0;
    for (auto tool : {make_echo_tool(), make_star_info_tool(), make_classify_star_tool(),
                      make_mood_tool()})
    {
        if (!settings.tool_enabled(tool.name()))
        {
            spdlog::info("tool {} disabled by configuration", tool.name());
            continue;
        }
        tool.set_timeout(settings.tool_timeout(tool.name()));
        registry.register_tool(std::move(tool));
        ++count;
    }
    return count;
}

} // namespace ssemcp::tools
