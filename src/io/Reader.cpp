/**
 * @file Reader.cpp
 * @brief Implementation of the file and block device stream.
 *
 * Provides positioned reads over a regular file or a block device. Size is
 * taken from fstat() for regular files and from the platform ioctl for block
 * devices, so an index can be built over a raw partition holding text data.
 */

#include "Reader.hpp"
#include "utils/common.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/ioctl.h>
#include <linux/fs.h>
#elif __APPLE__
#include <sys/ioctl.h>
#include <sys/disk.h>
#endif

static size_t get_dev_size(int fd) {
    uint64_t size = 0;
#ifdef __linux__
    if (ioctl(fd, BLKGETSIZE64, &size) == -1) {
        throw std::runtime_error(fmt::format("ioctl({:#x}, BLKGETSIZE64): {}", fd, strerror(errno)));
    }
#elif __APPLE__
    uint32_t block_size = 0;
    if (ioctl(fd, DKIOCGETBLOCKSIZE, &block_size) == -1) {
        throw std::runtime_error(fmt::format("ioctl({:#x}, DKIOCGETBLOCKSIZE): {}", fd, strerror(errno)));
    }
    uint64_t block_count = 0;
    if (ioctl(fd, DKIOCGETBLOCKCOUNT, &block_count) == -1) {
        throw std::runtime_error(fmt::format("ioctl({:#x}, DKIOCGETBLOCKCOUNT): {}", fd, strerror(errno)));
    }
    size = block_count * block_size;
#else
    (void)fd;
    throw std::runtime_error("block devices are not supported on this platform");
#endif
    return size;
}

#ifdef O_BINARY
#define OPEN_MODE O_RDONLY|O_BINARY
#else
#define OPEN_MODE O_RDONLY
#endif

/**
 * @brief Opens the specified file or device for reading.
 * @param fname Path to file or device to open.
 * @throws std::runtime_error If file cannot be opened or stat'ed.
 */
Reader::Reader(const std::filesystem::path& fname) {
    m_fd = open(fname.string().c_str(), OPEN_MODE);
    if( m_fd == -1 ) {
        throw std::runtime_error(fmt::format("open(\"{}\", {:#x}): {}", fname, OPEN_MODE, strerror(errno)));
    }

    struct stat st;
    if( fstat(m_fd, &st) == -1 ) {
        int err = errno;
        close(m_fd);
        m_fd = -1;
        throw std::runtime_error(fmt::format("fstat(\"{}\"): {}", fname, strerror(err)));
    }
    m_is_device = S_ISBLK(st.st_mode);
    if( m_is_device ){
        logger->debug("Device: {}, size: {}", fname, size());
    }
}

Reader::~Reader() {
    if( m_fd != -1 ) {
        close(m_fd);
    }
}

/**
 * @brief Current size of the underlying file or device.
 *
 * Queried on every call so that a file growing or shrinking after the index
 * was built can be detected by the caller.
 */
size_t Reader::size() const {
    if( m_is_device ){
        return get_dev_size(m_fd);
    }
    struct stat st;
    if( fstat(m_fd, &st) == -1 ) {
        throw std::runtime_error(fmt::format("fstat(fd {:#x}): {}", m_fd, strerror(errno)));
    }
    return st.st_size;
}

/**
 * @brief Reads data from a specific file/device position.
 *
 * Short reads are retried until @p count bytes are read or EOF is hit.
 *
 * @param offset File position to read from.
 * @param buf Buffer to read into.
 * @param count Number of bytes to read.
 * @return Number of bytes actually read (may be less than count at EOF).
 * @throws std::invalid_argument If offset is negative.
 * @throws ReadError On read error.
 */
size_t Reader::read_at(off_t offset, void* buf, size_t count) {
    if( offset < 0 ){
        throw std::invalid_argument(fmt::format("offset < 0: {:#x}", offset));
    }

    char* out = static_cast<char*>(buf);
    size_t total_read = 0;
    while( total_read < count ){
        const off_t pos = offset + static_cast<off_t>(total_read);
        ssize_t nread = ::pread(m_fd, out + total_read, count - total_read, pos);
        if( nread == -1 ) {
            if (errno == EINTR) continue;
            throw ReadError(fmt::format("read(fd {:#x}, offset {:#x}, count {:#x}): {}", m_fd, pos, count - total_read, strerror(errno)));
        }
        if( nread == 0 ){
            break; // EOF
        }
        total_read += static_cast<size_t>(nread);
    }
    return total_read;
}
