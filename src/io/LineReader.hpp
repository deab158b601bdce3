#pragma once
#include <string>
#include <vector>

#include "Stream.hpp"

// buffered '\n'-terminated line reader on top of a Stream, with its own position
class LineReader {
    public:
    static constexpr size_t DEFAULT_BUF_SIZE = 0x10000;

    explicit LineReader(Stream& stream, size_t buf_size = DEFAULT_BUF_SIZE);

    // reads one line including its '\n' (the last line may lack one)
    // returns false if already at EOF, leaving @line empty
    bool read_line(std::string& line);

    // same as read_line() but doesn't copy the line
    bool skip_line();

    void seek(off_t offset);
    off_t tell() const { return m_pos; }

    private:
    template <typename F> bool consume_line(F&& on_bytes);
    bool fill();

    Stream& m_stream;
    std::vector<char> m_buf;
    off_t m_buf_offset = 0;  // stream offset of m_buf[0]
    size_t m_buf_len = 0;    // valid bytes in m_buf
    off_t m_pos = 0;
};
