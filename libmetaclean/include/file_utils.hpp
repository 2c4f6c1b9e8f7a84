#ifndef METACLEAN_FILE_UTILS_HPP
#define METACLEAN_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace metaclean {

    /**
     * @brief Closes a FILE* owned by a unique_ptr.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Deletes an output file left behind by a failed operation.
     *
     * Missing files are not an error. Removal failures are logged.
     *
     * @return true if a file existed and was removed.
     */
    bool remove_partial_output(const std::filesystem::path &path,
                               std::string_view tag = "file_utils");

    /**
     * @brief Owns the output path of one strip operation.
     *
     * create() makes the file with exclusive-create semantics, so an
     * existing file is never truncated or reused. A file this guard created
     * is deleted again when the guard goes out of scope without commit();
     * a file it did not create is never touched.
     */
    class OutputFileGuard {
    public:
        explicit OutputFileGuard(std::filesystem::path path, std::string_view tag = "file_utils");
        ~OutputFileGuard();

        OutputFileGuard(const OutputFileGuard&) = delete;
        OutputFileGuard& operator=(const OutputFileGuard&) = delete;

        /**
         * @brief Creates the file for binary writing.
         * @throws OutputExistsError if the path already exists.
         * @throws FilesystemError on any other failure.
         */
        [[nodiscard]] unique_FILE create();

#ifndef _WIN32
        /**
         * @brief Like create() but returns a read/write descriptor the caller owns.
         */
        [[nodiscard]] int create_fd();
#endif

        /// Keeps the file: the operation succeeded.
        void commit() noexcept { committed_ = true; }

        [[nodiscard]] bool created() const noexcept { return created_; }
        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        [[noreturn]] void throw_create_error(int err) const;

        std::filesystem::path path_;
        std::string tag_;
        bool created_ = false;
        bool committed_ = false;
    };

    /**
     * @brief Directory containing the running executable.
     *
     * Falls back to the current working directory when it cannot be
     * determined.
     */
    std::filesystem::path executable_dir();

    /**
     * @brief True if @p path is a regular file the current user may execute.
     */
    bool is_executable_file(const std::filesystem::path &path);

} // namespace metaclean

#endif // METACLEAN_FILE_UTILS_HPP
