#include "downloadpathvalidator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <glog/logging.h>

namespace ircdcc::storage
{
namespace
{
bool is_allowed_char(char c)
{
    static const std::string allowed_punctuation {" ._()-[]"};
    return std::isalnum(static_cast<unsigned char>(c)) ||
           allowed_punctuation.find(c) != std::string::npos;
}

bool is_separator_char(char c)
{
    return c == '_' || c == '-' || std::isspace(static_cast<unsigned char>(c));
}

std::string trim(const std::string &str, const std::string &chars)
{
    auto first = str.find_first_not_of(chars);
    if (first == std::string::npos)
    {
        return {};
    }
    auto last = str.find_last_not_of(chars);
    return str.substr(first, last - first + 1);
}

std::string to_lower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return char(std::tolower(c)); });
    return str;
}

bool is_within(const std::filesystem::path &dir, const std::filesystem::path &path)
{
    auto [dir_end, path_it] = std::mismatch(dir.begin(), dir.end(), path.begin(), path.end());
    return dir_end == dir.end() && path_it != path.end();
}
}  // namespace

DownloadPathValidator::DownloadPathValidator(std::string download_dir,
    std::vector<std::string> blocked_extensions, uint64_t max_file_size)
    : download_dir_ {std::move(download_dir)}
    , blocked_extensions_ {std::move(blocked_extensions)}
    , max_file_size_ {max_file_size}
{}

bool DownloadPathValidator::validate(const std::string &requested_filename,
    uint64_t proposed_file_size, Result &result, std::string &error,
    const ReservedPredicate &is_reserved) const
{
    auto sanitized = sanitize_filename(requested_filename);

    auto ext = to_lower(extension(sanitized));
    if (!ext.empty() && std::any_of(blocked_extensions_.cbegin(), blocked_extensions_.cend(),
                            [&](const std::string &blocked) { return to_lower(blocked) == ext; }))
    {
        LOG(WARNING) << "Download of '" << requested_filename << "' blocked due to extension "
                     << ext;
        error = "File type '" + extension(sanitized) + "' is blocked.";
        return false;
    }

    if (proposed_file_size > max_file_size_)
    {
        LOG(WARNING) << "Download of '" << requested_filename << "' (" << proposed_file_size
                     << " bytes) exceeds the size limit";
        error = "File size " + std::to_string(proposed_file_size) + " exceeds maximum allowed " +
                std::to_string(max_file_size_) + ".";
        return false;
    }

    namespace fs = std::filesystem;
    std::error_code ec;

    auto dir = fs::absolute(download_dir_, ec);
    if (!ec && !fs::exists(dir, ec))
    {
        fs::create_directories(dir, ec);
        if (!ec)
        {
            LOG(INFO) << "Created download directory " << dir;
        }
    }
    if (!ec)
    {
        dir = fs::weakly_canonical(dir, ec);
    }
    if (ec)
    {
        LOG(ERROR) << "Cannot prepare download directory " << download_dir_ << ": "
                   << ec.message();
        error = "Download directory '" + download_dir_ + "' cannot be created.";
        return false;
    }

    auto path = fs::weakly_canonical(dir / sanitized, ec);
    if (ec || !is_within(dir, path))
    {
        LOG(ERROR) << "Path traversal attempt detected: '" << requested_filename
                   << "' is not within " << dir;
        error = "Invalid file path (potential traversal attempt).";
        return false;
    }

    auto is_taken = [&](const fs::path &candidate) {
        std::error_code exists_ec;
        return fs::exists(candidate, exists_ec) || exists_ec ||
               (is_reserved && is_reserved(candidate.string()));
    };

    auto name = sanitized;
    for (int counter = 1; is_taken(path); ++counter)
    {
        if (counter > max_name_attempts)
        {
            LOG(ERROR) << "No free name for '" << sanitized << "' in " << dir << " after "
                       << max_name_attempts << " attempts";
            error = "Could not find a unique filename for '" + sanitized + "'.";
            return false;
        }
        name = numbered_filename(sanitized, counter);
        path = dir / name;
    }
    if (name != sanitized)
    {
        LOG(INFO) << "'" << sanitized << "' already exists, saving as '" << name << "'";
    }

    result.safe_path          = path.string();
    result.sanitized_filename = name;
    return true;
}

const std::string &DownloadPathValidator::download_dir() const
{
    return download_dir_;
}

std::string DownloadPathValidator::sanitize_filename(const std::string &filename)
{
    auto base_name = trim(filename, " \t\r\n");
    auto slash     = base_name.find_last_of("/\\");
    if (slash != std::string::npos)
    {
        base_name.erase(0, slash + 1);
    }

    std::string replaced;
    replaced.reserve(base_name.size());
    for (char c : base_name)
    {
        replaced.push_back(is_allowed_char(c) ? c : '_');
    }

    std::string collapsed;
    collapsed.reserve(replaced.size());
    for (size_t i = 0; i < replaced.size();)
    {
        size_t run = 0;
        while (i + run < replaced.size() && is_separator_char(replaced[i + run]))
        {
            ++run;
        }

        if (run >= 2)
        {
            collapsed.push_back('_');
            i += run;
        }
        else
        {
            collapsed.push_back(replaced[i]);
            ++i;
        }
    }

    auto sanitized = trim(collapsed, "._- ");

    if (sanitized.size() > max_filename_length)
    {
        auto ext = extension(sanitized);
        if (!ext.empty() && ext.size() < max_filename_length / 2)
        {
            auto name = sanitized.substr(0, sanitized.size() - ext.size());
            sanitized = name.substr(0, max_filename_length - ext.size()) + ext;
        }
        else
        {
            sanitized.resize(max_filename_length);
        }
    }

    if (sanitized.empty())
    {
        sanitized = "_sanitized_";
    }
    else if (sanitized == "." || sanitized == "..")
    {
        sanitized = "_" + sanitized + "_";
    }

    return sanitized;
}

std::string DownloadPathValidator::numbered_filename(const std::string &filename, int counter)
{
    auto ext    = extension(filename);
    auto stem   = filename.substr(0, filename.size() - ext.size());
    auto suffix = "(" + std::to_string(counter) + ")";
    auto tail   = std::min(max_filename_length, suffix.size() + ext.size());
    if (stem.size() + tail > max_filename_length)
    {
        stem.resize(max_filename_length - tail);
    }
    return stem + suffix + ext;
}

std::string DownloadPathValidator::extension(const std::string &filename)
{
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos)
    {
        return {};
    }

    // Leading dots mark hidden files, not extensions
    if (filename.find_first_not_of('.') >= dot)
    {
        return {};
    }
    return filename.substr(dot);
}
}  // namespace ircdcc::storage
