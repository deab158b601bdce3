#pragma once
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

#include "Stream.hpp"

// in-memory stream over an owned copy of the data
class MemReader : public Stream {
    public:
    explicit MemReader(std::string data) : m_data(std::move(data)) {}

    size_t read_at(off_t offset, void* buf, size_t count) override {
        if( offset < 0 ){
            throw std::invalid_argument("offset < 0");
        }
        if( (size_t)offset >= m_data.size() ){
            return 0;
        }
        size_t n = std::min(count, m_data.size() - offset);
        memcpy(buf, m_data.data() + offset, n);
        return n;
    }

    size_t size() const override { return m_data.size(); }

    // test hook for simulating a file changed behind our back
    std::string& data() { return m_data; }

    private:
    std::string m_data;
};
