#ifndef CONVERTERPRO_ARG_PARSER_H
#define CONVERTERPRO_ARG_PARSER_H

#include <string>
#include <cxxopts.hpp>

namespace ConverterPro {

/**
 * @brief Command line of the GUI entry point, parsed with cxxopts.
 *
 * Unknown options are left alone so Qt can consume its own (-platform, -style ...).
 */
class ArgParser {
public:
    struct Arguments {
        std::string configPath;
        std::string logFile;
        std::string theme;      // empty: use the configured appearance
        bool helpRequested = false;
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @throws std::runtime_error on malformed options or an unknown theme.
     */
    Arguments parseArgs(int argc, char** argv);

    std::string help() const;

private:
    cxxopts::Options m_options;
};

} // namespace ConverterPro

#endif // CONVERTERPRO_ARG_PARSER_H
