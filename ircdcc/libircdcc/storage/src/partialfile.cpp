#include "partialfile.hpp"

#include <filesystem>

#include <glog/logging.h>

namespace ircdcc::storage
{
PartialFile::PartialFile(std::string path, uint64_t resume_offset)
    : path_ {std::move(path)}
    , size_ {0}
{
    if (!open(resume_offset))
    {
        stream_.close();
    }
}

bool PartialFile::open(uint64_t resume_offset)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    uint64_t        existing = fs::exists(path_, ec) ? fs::file_size(path_, ec) : 0;
    if (ec)
    {
        LOG(ERROR) << "Cannot inspect " << path_ << ": " << ec.message();
        return false;
    }
    if (resume_offset > existing)
    {
        LOG(ERROR) << "Cannot resume " << path_ << " at " << resume_offset << ", only "
                   << existing << " bytes are on disk";
        return false;
    }

    // Opening for append creates a missing file
    stream_.open(path_, std::ios::out | std::ios::binary | std::ios::app);
    if (!stream_)
    {
        LOG(ERROR) << "Cannot open " << path_ << " for writing";
        return false;
    }

    if (existing != resume_offset)
    {
        fs::resize_file(path_, resume_offset, ec);
        if (ec)
        {
            LOG(ERROR) << "Cannot cut " << path_ << " to " << resume_offset
                       << " bytes: " << ec.message();
            return false;
        }
    }

    size_ = resume_offset;
    return true;
}

bool PartialFile::is_open() const
{
    return stream_.is_open();
}

uint64_t PartialFile::size() const
{
    return size_;
}

const std::string &PartialFile::path() const
{
    return path_;
}

bool PartialFile::write(const uint8_t *data, size_t size)
{
    if (!stream_.is_open())
    {
        LOG(ERROR) << "Write to " << path_ << " which is not open";
        return false;
    }

    stream_.write(reinterpret_cast<const char *>(data), std::streamsize(size));
    if (!stream_)
    {
        LOG(ERROR) << "Writing " << size << " bytes to " << path_ << " failed";
        return false;
    }

    size_ += size;
    return true;
}

bool PartialFile::commit()
{
    if (!stream_.is_open())
    {
        return false;
    }

    stream_.flush();
    bool flushed = bool(stream_);
    stream_.close();
    if (!flushed || !stream_)
    {
        LOG(ERROR) << "Cannot flush " << path_;
        return false;
    }
    return true;
}
}  // namespace ircdcc::storage
