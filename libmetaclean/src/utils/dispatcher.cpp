/**
 * @file dispatcher.cpp
 * @brief Implementation of the public Dispatcher API.
 */

#include "../../include/dispatcher.hpp"

#include "../../include/errors.hpp"
#include "../../include/ffmpeg_locator.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/hash_namer.hpp"
#include "../../include/image_stripper_registry.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_type.hpp"
#include "../../include/video_stripper.hpp"

#include <atomic>
#include <system_error>

namespace metaclean {

namespace {
constexpr auto kTag = "dispatcher";

// fresh names tried when another writer takes the chosen one first
constexpr int kMaxCreateAttempts = 3;
}

struct Dispatcher::Impl {
    HashNamer namer;

    std::filesystem::path ffmpegPath;
    bool preserveIcc = false;
    std::chrono::seconds videoTimeout = VideoStripper::kDefaultTimeout;
    std::filesystem::path outputDir;
    bool sanitizeNames = false;

    std::atomic<VideoStripper*> currentStripper = nullptr;

    [[nodiscard]] std::filesystem::path resolveFfmpeg() const {
        return locate_ffmpeg(ffmpegPath, executable_dir());
    }

    // the input must be an existing, readable regular file
    static SourceFile inspect(const std::filesystem::path& source) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(source, ec);
        if (ec) abs = source;

        const auto status = std::filesystem::status(abs, ec);
        if (ec || !std::filesystem::exists(status)) {
            throw FilesystemError("file not found: " + abs.string());
        }
        if (!std::filesystem::is_regular_file(status)) {
            throw FilesystemError("not a regular file: " + abs.string());
        }
        if (const unique_FILE readable(open_file(abs, "rb")); !readable) {
            throw FilesystemError("cannot read file: " + abs.string());
        }

        SourceFile file;
        file.path = abs;
        file.size = std::filesystem::file_size(abs, ec);

        const MediaType type = classify_media(abs);
        file.kind = type.kind;
        file.mime = type.mime;
        return file;
    }

    void prepareOutputDir() const {
        if (outputDir.empty()) return;
        std::error_code ec;
        std::filesystem::create_directories(outputDir, ec);
        if (ec || !std::filesystem::is_directory(outputDir)) {
            throw FilesystemError("cannot create output directory " + outputDir.string() +
                                  (ec ? " (" + ec.message() + ")" : ""));
        }
    }

    void stripVideo(const SourceFile& file, const std::filesystem::path& output) {
        VideoStripper stripper(resolveFfmpeg(), videoTimeout);
        currentStripper.store(&stripper);
        try {
            stripper.strip(file.path, output);
        } catch (const std::exception&) {
            currentStripper.store(nullptr);
            throw;
        }
        currentStripper.store(nullptr);
    }

    OperationResult run(const std::filesystem::path& source) {
        const SourceFile file = inspect(source);
        Logger::log(LogLevel::Debug,
                    file.path.string() + ": " + media_kind_to_string(file.kind) +
                    (file.mime.empty() ? "" : " (" + file.mime + ")") + ", " +
                    std::to_string(file.size) + " bytes",
                    kTag);

        if (file.kind == MediaKind::Unsupported) {
            throw UnsupportedFileTypeError("unsupported file type: " +
                                           (file.mime.empty() ? file.path.extension().string() : file.mime));
        }

        prepareOutputDir();

        for (int attempt = 1;; ++attempt) {
            const auto output = namer.output_path_for(file.path, outputDir, sanitizeNames);
            try {
                if (file.kind == MediaKind::Image) {
                    strip_image(file.path, output, preserveIcc);
                } else {
                    stripVideo(file, output);
                }
                return OperationResult::success(output);
            } catch (const OutputExistsError&) {
                if (attempt >= kMaxCreateAttempts) throw;
                Logger::log(LogLevel::Warning, output.string() + " was taken meanwhile, choosing another name", kTag);
            } catch (const MetaCleanError&) {
                throw;
            } catch (const std::filesystem::filesystem_error& e) {
                throw FilesystemError(e.what());
            } catch (const std::exception& e) {
                // anything else escaped a stripper, classify by what was being processed
                if (file.kind == MediaKind::Image) throw ImageProcessingError(e.what());
                throw VideoProcessingError(e.what());
            }
        }
    }
};

Dispatcher::Dispatcher() : impl_(std::make_unique<Impl>()) {}

Dispatcher::~Dispatcher() {
    stop();
}

Dispatcher::Dispatcher(Dispatcher&&) noexcept = default;
Dispatcher& Dispatcher::operator=(Dispatcher&&) noexcept = default;

Dispatcher::Impl& Dispatcher::impl() {
    if (!impl_) impl_ = std::make_unique<Impl>();
    return *impl_;
}

Dispatcher& Dispatcher::ffmpegPath(const std::filesystem::path& path) {
    impl().ffmpegPath = path;
    return *this;
}

Dispatcher& Dispatcher::preserveIccProfile(const bool val) {
    impl().preserveIcc = val;
    return *this;
}

Dispatcher& Dispatcher::videoTimeout(const std::chrono::seconds timeout) {
    impl().videoTimeout = timeout.count() < 0 ? std::chrono::seconds::zero() : timeout;
    return *this;
}

Dispatcher& Dispatcher::outputDirectory(const std::filesystem::path& dir) {
    impl().outputDir = dir;
    return *this;
}

Dispatcher& Dispatcher::sanitizeNames(const bool val) {
    impl().sanitizeNames = val;
    return *this;
}

std::filesystem::path Dispatcher::resolvedFfmpegPath() const {
    if (!impl_) return locate_ffmpeg({}, executable_dir());
    return impl_->resolveFfmpeg();
}

OperationResult Dispatcher::process(const std::filesystem::path& source) noexcept {
    try {
        Logger::log(LogLevel::Info, "Processing " + source.string(), kTag);
        auto result = impl().run(source);
        Logger::log(LogLevel::Info, "Cleaned copy written to " + result.output_path->string(), kTag);
        return result;
    } catch (const MetaCleanError& e) {
        Logger::log(LogLevel::Error, source.string() + ": " + e.what(), kTag);
        return OperationResult::failure(e.kind(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::log(LogLevel::Error, source.string() + ": " + e.what(), kTag);
        return OperationResult::failure(ErrorKind::FilesystemError, e.what());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, source.string() + ": " + e.what(), kTag);
        return OperationResult::failure(ErrorKind::FilesystemError, e.what());
    }
}

void Dispatcher::stop() noexcept {
    if (!impl_) return;
    if (auto* stripper = impl_->currentStripper.load()) {
        stripper->request_stop();
    }
}

} // namespace metaclean
