#include "sourcefile.hpp"

#include <algorithm>
#include <filesystem>

#include <glog/logging.h>

namespace ircdcc::storage
{
SourceFile::SourceFile(std::string path)
    : path_ {std::move(path)}
    , size_ {0}
    , is_open_ {false}
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec))
    {
        LOG(ERROR) << path_ << " is not a readable regular file"
                   << (ec ? ": " + ec.message() : std::string {});
        return;
    }

    auto file_size = std::filesystem::file_size(path_, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot get the size of " << path_ << ": " << ec.message();
        return;
    }

    // Zero-length regions cannot be mapped, an empty file needs no mapping anyway
    if (file_size != 0)
    {
        try
        {
            mapping_ = {path_.c_str(), boost::interprocess::read_only};
            region_  = {mapping_, boost::interprocess::read_only};
        }
        catch (const boost::interprocess::interprocess_exception &e)
        {
            LOG(ERROR) << "Cannot map " << path_ << ": " << e.what();
            return;
        }
    }

    size_    = region_.get_size();
    is_open_ = true;
}

bool SourceFile::is_open() const
{
    return is_open_;
}

uint64_t SourceFile::size() const
{
    return size_;
}

const std::string &SourceFile::path() const
{
    return path_;
}

SourceFile::Chunk SourceFile::chunk(uint64_t offset, size_t max_size) const
{
    if (!is_open_ || offset >= size_)
    {
        return {nullptr, 0};
    }

    auto base = static_cast<const uint8_t *>(region_.get_address());
    return {base + offset, size_t(std::min<uint64_t>(max_size, size_ - offset))};
}
}  // namespace ircdcc::storage
