#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// field name -> field value
using Record = std::map<std::string, std::string>;

struct ParseOptions {
    char separator = ',';

    // header/record field count mismatch: zip to the shorter list (true) or throw FieldMismatch (false)
    bool truncate_mismatched_fields = true;
};

// Splits delimited lines and zips them against a header.
// No quoting: a separator inside a field always splits it.
class RecordParser {
    public:
    class FieldMismatch : public std::runtime_error {
        public:
        FieldMismatch(size_t header_fields, size_t record_fields);

        size_t header_fields() const { return m_header_fields; }
        size_t record_fields() const { return m_record_fields; }

        private:
        size_t m_header_fields;
        size_t m_record_fields;
    };

    RecordParser() = default;
    explicit RecordParser(const ParseOptions& opts) : m_opts(opts) {}

    // split on separator, trim whitespace around each field
    // always returns at least one (possibly empty) field
    std::vector<std::string> split(std::string_view line) const;

    Record parse(std::string_view header_line, std::string_view record_line) const;
    Record zip(const std::vector<std::string>& names, std::string_view record_line) const;

    const ParseOptions& options() const { return m_opts; }

    private:
    ParseOptions m_opts;
};

std::string_view trim(std::string_view s);
