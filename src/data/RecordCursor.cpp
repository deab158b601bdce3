#include "RecordCursor.hpp"
#include "IndexedRecordStream.hpp"

RecordCursor::RecordCursor(IndexedRecordStream& stream, uint64_t first) : m_stream(stream), m_next(first) {}

std::optional<Record> RecordCursor::next() {
    const uint64_t count = m_stream.record_count();
    if( !m_checked ){
        // record_count()+1 is a valid, already exhausted, start
        if( m_next < 1 || m_next > count + 1 ){
            throw IndexedRecordStream::OutOfRange(m_next, count);
        }
        m_checked = true;
    }

    if( m_next > count ){
        return std::nullopt;
    }
    Record record = m_stream.get_record(m_next);
    m_next++;
    return record;
}
