#pragma once
#include <cstdint>
#include <iterator>
#include <optional>

#include "processing/RecordParser.hpp"

class IndexedRecordStream;

// Forward-only sequence of records produced by IndexedRecordStream::iterate_from().
// Holds its own position, so several cursors over the same stream can be
// interleaved. Every step is a full get_record() lookup.
class RecordCursor {
    public:
    RecordCursor(IndexedRecordStream& stream, uint64_t first);

    // std::nullopt once past the last record
    // throws IndexedRecordStream::OutOfRange on the first call if the start position is invalid
    std::optional<Record> next();

    // number of the record next() returns
    uint64_t position() const { return m_next; }

    class iterator {
        public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Record;
        using difference_type = std::ptrdiff_t;
        using pointer = const Record*;
        using reference = const Record&;

        iterator() = default;
        explicit iterator(RecordCursor* cursor) : m_cursor(cursor), m_current(cursor->next()) {}

        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }

        iterator& operator++() {
            m_current = m_cursor->next();
            return *this;
        }

        bool operator==(const iterator& other) const {
            return m_current.has_value() == other.m_current.has_value() && (!m_current || m_cursor == other.m_cursor);
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

        private:
        RecordCursor* m_cursor = nullptr;
        std::optional<Record> m_current;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    private:
    IndexedRecordStream& m_stream;
    uint64_t m_next;
    bool m_checked = false;
};
