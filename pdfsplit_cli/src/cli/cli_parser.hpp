#ifndef PDFSPLIT_CLI_PARSER_HPP
#define PDFSPLIT_CLI_PARSER_HPP

#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool dry_run = false;
    bool quiet = false;

    std::string log_level = "WARNING";
    std::filesystem::path log_file;

    std::filesystem::path input_path;
    std::filesystem::path output_dir;
    std::string pages;
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //PDFSPLIT_CLI_PARSER_HPP
