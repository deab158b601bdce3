#include "LineReader.hpp"

#include <cstring>
#include <stdexcept>

LineReader::LineReader(Stream& stream, size_t buf_size) : m_stream(stream), m_buf(buf_size) {
    if( buf_size == 0 ){
        throw std::invalid_argument("LineReader: buf_size must be > 0");
    }
}

void LineReader::seek(off_t offset) {
    if( offset < 0 ){
        throw std::invalid_argument("LineReader: negative seek offset");
    }
    // buffer is kept, it is still valid if the new position falls inside it
    m_pos = offset;
}

// make sure m_pos is inside the buffer, returns false on EOF
bool LineReader::fill() {
    if( m_pos >= m_buf_offset && m_pos < m_buf_offset + (off_t)m_buf_len ){
        return true;
    }
    m_buf_offset = m_pos;
    m_buf_len = m_stream.read_at(m_pos, m_buf.data(), m_buf.size());
    return m_buf_len != 0;
}

template <typename F>
bool LineReader::consume_line(F&& on_bytes) {
    bool got_any = false;
    while( fill() ){
        got_any = true;
        const size_t start = m_pos - m_buf_offset;
        const char* begin = m_buf.data() + start;
        const size_t avail = m_buf_len - start;

        const char* nl = static_cast<const char*>(memchr(begin, '\n', avail));
        const size_t len = nl ? (size_t)(nl - begin) + 1 : avail;
        on_bytes(begin, len);
        m_pos += len;
        if( nl ){
            break;
        }
    }
    return got_any;
}

bool LineReader::read_line(std::string& line) {
    line.clear();
    return consume_line([&line](const char* p, size_t n) { line.append(p, n); });
}

bool LineReader::skip_line() {
    return consume_line([](const char*, size_t) {});
}
