#ifndef IRCDCC_STORAGE_SOURCEFILE_HPP_
#define IRCDCC_STORAGE_SOURCEFILE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

namespace ircdcc::storage
{
/**
 * File offered to a peer, mapped read-only for the duration of the transfer so that chunks go
 * to the socket without an intermediate copy.
 */
class SourceFile
{
public:
    struct Chunk
    {
        const uint8_t *data;
        size_t         size;
    };

    explicit SourceFile(std::string path);

    SourceFile(const SourceFile &) = delete;
    SourceFile &operator=(const SourceFile &) = delete;

    [[nodiscard]] bool               is_open() const;
    [[nodiscard]] uint64_t           size() const;
    [[nodiscard]] const std::string &path() const;

    // At most max_size bytes starting at offset; empty past the end of the file
    [[nodiscard]] Chunk chunk(uint64_t offset, size_t max_size) const;

private:
    const std::string                  path_;
    boost::interprocess::file_mapping  mapping_;
    boost::interprocess::mapped_region region_;
    uint64_t                           size_;
    bool                               is_open_;
};
}  // namespace ircdcc::storage

#endif  // IRCDCC_STORAGE_SOURCEFILE_HPP_
