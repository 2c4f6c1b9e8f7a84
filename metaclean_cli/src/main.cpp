#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libmetaclean/include/dispatcher.hpp"
#include "../../libmetaclean/include/errors.hpp"
#include "../../libmetaclean/include/logger.hpp"
#include "../../libmetaclean/include/video_stripper.hpp"

using namespace metaclean;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::atomic<Dispatcher*> g_dispatcher{nullptr};

// handle ctrl+c or termination signals
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
        if (auto* dispatcher = g_dispatcher.load()) {
            dispatcher->stop();
        }
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void install_log_sinks(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file);
        if (!fileSink->is_open()) {
            std::cerr << YELLOW << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        } else {
            fileSink->log(LogLevel::Info, "metaclean started", "main");
            Logger::add_sink(std::move(fileSink));
        }
    }

    if (!settings.quiet) {
        if (const auto level = Logger::string_to_level(settings.log_level)) {
            auto consoleSink = std::make_unique<ConsoleLogSink>();
            consoleSink->log_level = *level;
            Logger::add_sink(std::move(consoleSink));
        }
    }
}

static int check_ffmpeg(const Dispatcher& dispatcher, const Settings& settings) {
    const fs::path ffmpeg = dispatcher.resolvedFfmpegPath();
    try {
        const VideoStripper ffmpeg_check(ffmpeg);
        const std::string version = ffmpeg_check.query_version();
        if (!settings.quiet) {
            std::cout << GREEN << ffmpeg.string() << ": " << version << RESET << std::endl;
        }
        return 0;
    } catch (const MetaCleanError& e) {
        std::cerr << RED << "[" << to_string(e.kind()) << "] " << e.what() << RESET << std::endl;
        return 1;
    }
}

int main(int argc, char* argv[]) {

    CLI::App app{"metaclean: strip EXIF, XMP, IPTC and container metadata from images and videos."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    install_log_sinks(settings);
    init_utf8_locale();

    Dispatcher dispatcher;
    dispatcher.ffmpegPath(settings.ffmpeg_path)
              .preserveIccProfile(settings.keep_icc)
              .videoTimeout(std::chrono::seconds(settings.timeout_seconds))
              .outputDirectory(settings.output_dir)
              .sanitizeNames(settings.sanitize);

    if (settings.check_ffmpeg) {
        return check_ffmpeg(dispatcher, settings);
    }

    g_dispatcher.store(&dispatcher);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    size_t failures = 0;
    for (const auto& input : settings.inputs) {
        if (interrupted.load()) break;

        const OperationResult result = dispatcher.process(input);
        if (result.ok()) {
            if (!settings.quiet) {
                std::cout << GREEN << "[DONE] " << input.filename().string()
                          << " -> " << result.output_path->string() << RESET << std::endl;
            }
        } else {
            ++failures;
            if (!settings.quiet) {
                std::cerr << RED << "[FAIL] " << input.string()
                          << " [" << to_string(result.error_kind.value_or(ErrorKind::FilesystemError)) << "] "
                          << result.error_message.value_or("unknown error") << RESET << std::endl;
            }
        }
    }

    g_dispatcher.store(nullptr);

    if (interrupted.load()) {
        if (!settings.quiet) {
            std::cerr << CYAN << "\n[INTERRUPT] Stopped." << RESET << std::endl;
        }
        return 130; // standard exit code for SIGINT
    }
    return failures == 0 ? 0 : 1;
}
