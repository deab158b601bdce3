#pragma once
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "Stream.hpp"

// file-backed stream, can read from:
//  - regular file
//  - linux/macos block device (/dev/sdX)
//
// reads are positioned (pread), so the fd itself has no meaningful position
class Reader : public Stream {
    public:
    Reader(const std::filesystem::path& fname);
    ~Reader();

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // either succeeds or throws an exception
    size_t read_at(off_t offset, void* buf, size_t count) override;

    size_t size() const override;

    private:
        int m_fd = -1;
        bool m_is_device = false;
};
