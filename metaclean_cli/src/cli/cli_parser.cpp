#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");

    // --- Flags (booleans) ---
    app.add_flag("--keep-icc", settings.keep_icc,
                 "Keep embedded colour profiles (ICC, PNG gamma/chromaticity).");

    app.add_flag("--sanitize", settings.sanitize,
                 "Replace spaces and unusual characters in output file names.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress console logging and per-file results.");

    app.add_flag("--check-ffmpeg", settings.check_ffmpeg,
                 "Print the version of the ffmpeg that would be used and exit.");

    // --- Options ---
    app.add_option("--ffmpeg", settings.ffmpeg_path,
                   "Path of the ffmpeg executable, relative to this program's directory\n"
                   "unless absolute (default: ./ffmpeg, ./ffmpeg/ffmpeg, then PATH).");

    app.add_option("--timeout", settings.timeout_seconds,
                   "Seconds before an ffmpeg run is killed (0 = no limit).")
                   ->default_val(settings.timeout_seconds)
                   ->check(CLI::NonNegativeNumber);

    app.add_option("-o,--output-dir", settings.output_dir,
                   "Write cleaned files to DIR instead of next to the originals.")
                   ->take_last();

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to FILE (default: no file logging).");

    // --- Positional Arguments ---
    // existence is checked per file by the dispatcher so one bad path does not abort the batch
    app.add_option("inputs", settings.inputs, "Image or video files to clean.");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.check_ffmpeg && settings.inputs.empty()) {
            throw CLI::RequiredError("inputs");
        }
        if (!settings.output_dir.empty() &&
            std::filesystem::exists(settings.output_dir) &&
            !std::filesystem::is_directory(settings.output_dir)) {
            throw CLI::ValidationError("Output path ('-o') must be a directory.");
        }
    });
}
