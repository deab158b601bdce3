/**
 * @file IndexedRecordStream.cpp
 * @brief Sparse offset index over a delimited text stream.
 *
 * One forward pass at construction stores the byte offset of every
 * chunk_size'th record. A lookup then costs one seek plus at most
 * chunk_size-1 skipped lines, independent of the record number.
 */

#include "IndexedRecordStream.hpp"
#include "RecordCursor.hpp"
#include "io/Reader.hpp"
#include "utils/common.hpp"

#include <chrono>

std::string_view strip_eol(std::string_view line) {
    if( !line.empty() && line.back() == '\n' ){
        line.remove_suffix(1);
    }
    // also a lone '\r' on a last line that lost its '\n'
    if( !line.empty() && line.back() == '\r' ){
        line.remove_suffix(1);
    }
    return line;
}

IndexedRecordStream::OutOfRange::OutOfRange(uint64_t n, uint64_t record_count)
    : std::out_of_range(fmt::format("record {} is out of range [1, {}]", n, record_count)) {}

static Stream& checked(const std::unique_ptr<Stream>& stream) {
    if( !stream ){
        throw std::invalid_argument("IndexedRecordStream: null stream");
    }
    return *stream;
}

/**
 * @brief Takes ownership of @p stream and indexes it.
 *
 * The stream is read from offset 0 regardless of any earlier reads.
 *
 * @throws std::invalid_argument If the stream is null or chunk_size is 0.
 * @throws Reader::ReadError On I/O errors during the scan.
 */
IndexedRecordStream::IndexedRecordStream(std::unique_ptr<Stream> stream, const IndexOptions& opts)
    : m_stream(std::move(stream)), m_reader(checked(m_stream), opts.read_buffer_size), m_opts(opts), m_parser(opts.parse)
{
    if( m_opts.chunk_size == 0 ){
        throw std::invalid_argument("IndexedRecordStream: chunk_size must be > 0");
    }
    build_index();
}

IndexedRecordStream::IndexedRecordStream(const std::filesystem::path& fname, const IndexOptions& opts)
    : IndexedRecordStream(std::make_unique<Reader>(fname), opts) {}

void IndexedRecordStream::build_index() {
    const auto t0 = std::chrono::steady_clock::now();
    const uint64_t chunk_size = m_opts.chunk_size;

    m_stream_size = m_stream->size();
    m_reader.seek(0);
    if( m_reader.read_line(m_header_line) ){
        m_header = m_parser.split(strip_eol(m_header_line));
    }

    // key 1 exists even without records, it's where record 1 would start
    const off_t first_record = m_reader.tell();
    m_offset_index[1] = first_record;

    uint64_t n = 0;
    off_t pos = first_record;
    while( m_reader.skip_line() ){
        ++n;
        if( (n - 1) % chunk_size == 0 ){
            m_offset_index[n] = pos;
        }
        pos = m_reader.tell();
    }
    m_record_count = n;
    m_reader.seek(first_record);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
    logger->debug("indexed {} records ({} bytes) in {} ms: chunk_size {}, {} index entries",
            m_record_count, m_stream_size, elapsed.count(), chunk_size, m_offset_index.size());
}

// an indexed offset must still follow a '\n'; read from the stream, the LineReader buffer may be stale
void IndexedRecordStream::check_line_start(uint64_t key, off_t offset) {
    if( offset == 0 ){
        return;
    }
    char prev = 0;
    if( m_stream->read_at(offset - 1, &prev, 1) != 1 || prev != '\n' ){
        throw MalformedStream(fmt::format("index entry for record {} at {:#x} is not at a line start", key, offset));
    }
}

void IndexedRecordStream::check_range(uint64_t n) const {
    if( n < 1 || n > m_record_count ){
        throw OutOfRange(n, m_record_count);
    }
}

/**
 * @brief Reads record @p n without parsing it.
 *
 * @throws OutOfRange If n is not in [1, record_count()].
 * @throws MalformedStream If the stream changed since indexing or ends before record n.
 */
std::string IndexedRecordStream::get_raw_record(uint64_t n) {
    check_range(n);

    const size_t size = m_stream->size();
    if( size != m_stream_size ){
        throw MalformedStream(fmt::format("stream size changed since indexing: {} -> {}", m_stream_size, size));
    }

    const uint64_t chunk_start = (n - 1) / m_opts.chunk_size * m_opts.chunk_size + 1;
    auto it = m_offset_index.find(chunk_start);
    if( it == m_offset_index.end() ){
        throw MalformedStream(fmt::format("no index entry for record {}", chunk_start));
    }
    check_line_start(chunk_start, it->second);

    logger->trace("record {}: seek {:#x} (record {}), skip {} lines", n, it->second, chunk_start, n - chunk_start);
    m_reader.seek(it->second);
    for( uint64_t i = chunk_start; i < n; i++ ){
        if( !m_reader.skip_line() ){
            throw MalformedStream(fmt::format("unexpected end of stream at record {} while seeking record {}", i, n));
        }
    }

    std::string line;
    if( !m_reader.read_line(line) ){
        throw MalformedStream(fmt::format("unexpected end of stream at record {}", n));
    }
    line.resize(strip_eol(line).size());
    return line;
}

Record IndexedRecordStream::get_record(uint64_t n) {
    return m_parser.zip(m_header, get_raw_record(n));
}

RecordCursor IndexedRecordStream::iterate_from(uint64_t n) {
    return RecordCursor(*this, n);
}

std::string IndexedRecordStream::scan_raw_record(Stream& stream, uint64_t n) {
    if( n < 1 ){
        throw OutOfRange(n, 0);
    }

    LineReader reader(stream);
    std::string line;
    // header + n records
    for( uint64_t i = 0; i <= n; i++ ){
        if( !reader.read_line(line) ){
            throw OutOfRange(n, i == 0 ? 0 : i - 1);
        }
    }
    line.resize(strip_eol(line).size());
    return line;
}
