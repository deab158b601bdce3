#include "RecordParser.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view s) {
    while( !s.empty() && is_space(s.front()) ) s.remove_prefix(1);
    while( !s.empty() && is_space(s.back()) )  s.remove_suffix(1);
    return s;
}

RecordParser::FieldMismatch::FieldMismatch(size_t header_fields, size_t record_fields)
    : std::runtime_error(fmt::format("field count mismatch: header has {} fields, record has {}", header_fields, record_fields)),
      m_header_fields(header_fields), m_record_fields(record_fields) {}

std::vector<std::string> RecordParser::split(std::string_view line) const {
    std::vector<std::string> fields;
    size_t start = 0;
    while( true ){
        size_t pos = line.find(m_opts.separator, start);
        std::string_view field = line.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        fields.emplace_back(trim(field));
        if( pos == std::string_view::npos ){
            break;
        }
        start = pos + 1;
    }
    return fields;
}

Record RecordParser::zip(const std::vector<std::string>& names, std::string_view record_line) const {
    std::vector<std::string> values = split(record_line);
    if( names.size() != values.size() && !m_opts.truncate_mismatched_fields ){
        throw FieldMismatch(names.size(), values.size());
    }

    Record record;
    const size_t n = std::min(names.size(), values.size());
    for( size_t i = 0; i < n; i++ ){
        record[names[i]] = std::move(values[i]); // duplicate column name: last one wins
    }
    return record;
}

Record RecordParser::parse(std::string_view header_line, std::string_view record_line) const {
    return zip(split(header_line), record_line);
}
