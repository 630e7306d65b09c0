#ifndef IRCDCC_STORAGE_DOWNLOADPATHVALIDATOR_HPP_
#define IRCDCC_STORAGE_DOWNLOADPATHVALIDATOR_HPP_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ircdcc::storage
{
// Turns a filename advertised by a peer into a safe absolute path inside the download directory.
// Existing files are never chosen, a counter is appended to the name instead: report(1).txt.
class DownloadPathValidator
{
public:
    // Paths that are promised to another download but may not exist on disk yet
    using ReservedPredicate = std::function<bool(const std::string &path)>;

    struct Result
    {
        std::string safe_path;
        std::string sanitized_filename;
    };

    DownloadPathValidator(std::string download_dir, std::vector<std::string> blocked_extensions,
        uint64_t max_file_size);

    bool validate(const std::string &requested_filename, uint64_t proposed_file_size,
        Result &result, std::string &error, const ReservedPredicate &is_reserved = {}) const;

    [[nodiscard]] const std::string &download_dir() const;

    static std::string sanitize_filename(const std::string &filename);
    static std::string extension(const std::string &filename);

    // "name.ext" becomes "name(counter).ext", shortened to stay within max_filename_length
    static std::string numbered_filename(const std::string &filename, int counter);

    static constexpr size_t max_filename_length = 200;
    static constexpr int    max_name_attempts   = 1000;

private:
    const std::string              download_dir_;
    const std::vector<std::string> blocked_extensions_;
    const uint64_t                 max_file_size_;
};
}  // namespace ircdcc::storage

#endif  // IRCDCC_STORAGE_DOWNLOADPATHVALIDATOR_HPP_
