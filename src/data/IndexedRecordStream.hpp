#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "io/LineReader.hpp"
#include "io/Stream.hpp"
#include "processing/RecordParser.hpp"

class RecordCursor;

struct IndexOptions {
    static constexpr uint64_t DEFAULT_CHUNK_SIZE = 1000;

    uint64_t chunk_size = DEFAULT_CHUNK_SIZE; // records between two index entries, > 0
    size_t read_buffer_size = LineReader::DEFAULT_BUF_SIZE;
    ParseOptions parse;
};

// Random access to the records of a header-prefixed delimited text stream.
//
// The constructor scans the whole stream once and remembers the offset of
// every chunk_size'th record (1, 1+chunk_size, 1+2*chunk_size, ...).
// get_record(n) seeks to the closest remembered offset at or before n and
// skips at most chunk_size-1 lines from there.
//
// Not thread-safe: every lookup moves the shared read position.
// Open a separate stream per thread instead.
class IndexedRecordStream {
    public:
    using offset_index_t = std::unordered_map<uint64_t, off_t>;

    class OutOfRange : public std::out_of_range {
        public:
        OutOfRange(uint64_t n, uint64_t record_count);
    };

    class MalformedStream : public std::runtime_error {
        public:
        explicit MalformedStream(const std::string& msg) : std::runtime_error(msg) {}
    };

    explicit IndexedRecordStream(std::unique_ptr<Stream> stream, const IndexOptions& opts = IndexOptions());
    explicit IndexedRecordStream(const std::filesystem::path& fname, const IndexOptions& opts = IndexOptions());

    IndexedRecordStream(const IndexedRecordStream&) = delete;
    IndexedRecordStream& operator=(const IndexedRecordStream&) = delete;

    uint64_t record_count() const { return m_record_count; }
    uint64_t chunk_size() const { return m_opts.chunk_size; }

    // first line as read, including its line terminator
    const std::string& header_line() const { return m_header_line; }
    // field names, empty for an empty stream
    const std::vector<std::string>& header() const { return m_header; }

    const offset_index_t& offset_index() const { return m_offset_index; }
    const RecordParser& parser() const { return m_parser; }

    // n is 1-based and excludes the header
    Record get_record(uint64_t n);

    // unparsed line, without its line terminator
    std::string get_raw_record(uint64_t n);

    // lazy sequence of records n..record_count(), n may be record_count()+1
    RecordCursor iterate_from(uint64_t n);

    // reference lookup without any index: reads n lines past the header from offset 0
    static std::string scan_raw_record(Stream& stream, uint64_t n);

    private:
    void build_index();
    void check_range(uint64_t n) const;
    void check_line_start(uint64_t key, off_t offset);

    std::unique_ptr<Stream> m_stream;
    LineReader m_reader;
    IndexOptions m_opts;
    RecordParser m_parser;

    offset_index_t m_offset_index;
    std::string m_header_line;
    std::vector<std::string> m_header;
    uint64_t m_record_count = 0;
    size_t m_stream_size = 0;
};

std::string_view strip_eol(std::string_view line);
