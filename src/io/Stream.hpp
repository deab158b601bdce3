#pragma once
#include <cstddef>
#include <sys/types.h>

// random-access byte source, the only thing IndexedRecordStream needs from a file
class Stream {
    public:
    virtual ~Stream() {}

    // returns number of bytes read, 0 at or past EOF; throws on I/O errors
    virtual size_t read_at(off_t offset, void* buf, size_t count) = 0;

    // current size in bytes, re-queried on every call
    virtual size_t size() const = 0;
};
