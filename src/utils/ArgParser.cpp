#include "ArgParser.h"
#include "Definitions.h"

#include <algorithm>
#include <stdexcept>

namespace def = ConverterPro::Definitions;

namespace ConverterPro {

ArgParser::ArgParser()
    : m_options("image-converter-pro", def::APP_NAME + " " + def::APP_VERSION + " - batch image format converter")
{
    m_options.allow_unrecognised_options();
    m_options.add_options()
        ("c,config", "Path of the JSON settings file", cxxopts::value<std::string>()->default_value(def::CONFIG_FILE))
        ("l,log-file", "Path of the log file", cxxopts::value<std::string>()->default_value(def::LOG_FILE))
        ("t,theme", "Appearance: dark|light (overrides the settings file)", cxxopts::value<std::string>()->default_value(""))
        ("h,help", "Display this help menu");
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    Arguments args;
    try {
        const auto result = m_options.parse(argc, argv);
        args.helpRequested = result.count("help") > 0;
        args.configPath = result["config"].as<std::string>();
        args.logFile = result["log-file"].as<std::string>();
        args.theme = result["theme"].as<std::string>();
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Error parsing arguments: ") + e.what());
    }

    if (!args.theme.empty()) {
        const auto& themes = def::APP_THEMES;
        if (std::find(themes.begin(), themes.end(), args.theme) == themes.end()) {
            throw std::runtime_error("Unknown theme '" + args.theme + "' (expected dark or light)");
        }
    }
    return args;
}

std::string ArgParser::help() const {
    return m_options.help();
}

} // namespace ConverterPro
