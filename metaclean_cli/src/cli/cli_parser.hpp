#ifndef METACLEAN_CLI_PARSER_HPP
#define METACLEAN_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool keep_icc = false;
    bool sanitize = false;
    bool check_ffmpeg = false;
    bool quiet = false;

    unsigned timeout_seconds = 600;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path ffmpeg_path;
    std::filesystem::path output_dir;

    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // METACLEAN_CLI_PARSER_HPP
