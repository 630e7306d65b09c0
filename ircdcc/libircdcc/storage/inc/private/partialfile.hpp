#ifndef IRCDCC_STORAGE_PARTIALFILE_HPP_
#define IRCDCC_STORAGE_PARTIALFILE_HPP_

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace ircdcc::storage
{
/**
 * Download target. Opening keeps the first resume_offset bytes of an existing file and drops
 * the rest; data is only ever appended after that.
 */
class PartialFile
{
public:
    PartialFile(std::string path, uint64_t resume_offset);

    PartialFile(const PartialFile &) = delete;
    PartialFile &operator=(const PartialFile &) = delete;

    [[nodiscard]] bool               is_open() const;
    [[nodiscard]] uint64_t           size() const;
    [[nodiscard]] const std::string &path() const;

    bool write(const uint8_t *data, size_t size);

    // Flushes and closes; the file cannot be written afterwards
    bool commit();

private:
    bool open(uint64_t resume_offset);

    const std::string path_;
    std::ofstream     stream_;
    uint64_t          size_;
};
}  // namespace ircdcc::storage

#endif  // IRCDCC_STORAGE_PARTIALFILE_HPP_
