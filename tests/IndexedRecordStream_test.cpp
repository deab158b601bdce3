#include "data/IndexedRecordStream.hpp"
#include "io/LineReader.hpp"
#include "io/MemReader.hpp"
#include "test_utils.hpp"

#include <random>
#include <set>

static const char* PEOPLE_CSV =
    "age,name,color\n"
    "23,Dan,blue\n"
    "33,Danny,purple\n"
    "50,Danna,red\n"
    "22,Barbra,grey\n"
    "55,Moshik,white\n";

// logs the offset of every read, to see where lookups start
class RecordingStream : public MemReader {
    public:
    using MemReader::MemReader;

    size_t read_at(off_t offset, void* buf, size_t count) override {
        m_offsets.push_back(offset);
        return MemReader::read_at(offset, buf, count);
    }

    std::vector<off_t> m_offsets;
};

static IndexOptions make_opts(uint64_t chunk_size, size_t read_buffer_size = LineReader::DEFAULT_BUF_SIZE) {
    IndexOptions opts;
    opts.chunk_size = chunk_size;
    opts.read_buffer_size = read_buffer_size;
    return opts;
}

// start offset of every data line, [0] is record 1
static std::vector<off_t> record_offsets(const std::string& csv) {
    std::vector<off_t> offsets;
    size_t pos = csv.find('\n');
    while (pos != std::string::npos && pos + 1 < csv.size()) {
        offsets.push_back(pos + 1);
        pos = csv.find('\n', pos + 1);
    }
    return offsets;
}

TEST(IndexedRecordStream, people_example) {
    IndexedRecordStream index(std::make_unique<MemReader>(PEOPLE_CSV));

    EXPECT_EQ(5u, index.record_count());
    EXPECT_EQ(1000u, index.chunk_size());
    EXPECT_EQ((std::vector<std::string>{"age", "name", "color"}), index.header());
    EXPECT_EQ("age,name,color\n", index.header_line());

    Record expected = {{"age", "50"}, {"name", "Danna"}, {"color", "red"}};
    EXPECT_EQ(expected, index.get_record(3));
    EXPECT_EQ("50,Danna,red", index.get_raw_record(3));
}

TEST(IndexedRecordStream, people_example_with_padding) {
    // fields padded with spaces and no trailing newline
    IndexedRecordStream index(std::make_unique<MemReader>(
        "age,name,color\n"
        "                     23, Dan, blue\n"
        "                     33, Danny, purple\n"
        "                     50, Danna, red\n"
        "                     22, Barbra, grey\n"
        "                     55, Moshik, white"));

    EXPECT_EQ(5u, index.record_count());
    Record expected = {{"age", "50"}, {"name", "Danna"}, {"color", "red"}};
    EXPECT_EQ(expected, index.get_record(3));
    Record last = {{"age", "55"}, {"name", "Moshik"}, {"color", "white"}};
    EXPECT_EQ(last, index.get_record(5));
}

TEST(IndexedRecordStream, from_file) {
    IndexedRecordStream index(find_fixture("people.csv"));
    EXPECT_EQ(5u, index.record_count());
    EXPECT_EQ("Moshik", index.get_record(5).at("name"));
}

TEST(IndexedRecordStream, from_file_crlf_custom_separator) {
    IndexOptions opts;
    opts.parse.separator = ';';
    IndexedRecordStream index(find_fixture("cities_crlf.csv"), opts);

    EXPECT_EQ(3u, index.record_count());
    EXPECT_EQ((std::vector<std::string>{"id", "city", "country"}), index.header());
    EXPECT_EQ("2 ; Lyon ; FR", index.get_raw_record(2));
    Record expected = {{"id", "3"}, {"city", "Porto"}, {"country", "PT"}};
    EXPECT_EQ(expected, index.get_record(3));
}

TEST(IndexedRecordStream, missing_file) {
    EXPECT_THROW(IndexedRecordStream index("no_such_file.csv"), std::runtime_error);
}

TEST(IndexedRecordStream, index_alignment) {
    for (uint64_t nrecords : {1, 2, 3, 7, 10, 11, 25}) {
        for (uint64_t chunk : {1, 2, 3, 5, 10, 1000}) {
            SCOPED_TRACE(fmt::format("nrecords={} chunk={}", nrecords, chunk));
            const std::string csv = make_csv(nrecords);
            const std::vector<off_t> offsets = record_offsets(csv);
            ASSERT_EQ(nrecords, offsets.size());

            IndexedRecordStream index(std::make_unique<MemReader>(csv), make_opts(chunk));

            std::set<uint64_t> expected_keys;
            for (uint64_t key = 1; key <= nrecords; key += chunk) {
                expected_keys.insert(key);
            }
            std::set<uint64_t> keys;
            for (const auto& [key, offset] : index.offset_index()) {
                keys.insert(key);
                EXPECT_EQ(offsets[key - 1], offset) << "key " << key;
            }
            EXPECT_EQ(expected_keys, keys);

            // right after the header
            EXPECT_EQ((off_t)csv.find('\n') + 1, index.offset_index().at(1));
        }
    }
}

TEST(IndexedRecordStream, chunk_boundary_follows_last_record_of_previous_chunk) {
    const std::string csv = make_csv(10);
    IndexedRecordStream index(std::make_unique<MemReader>(csv), make_opts(4));

    // offset of record 5 == offset right after record 4
    const std::string upto_record4 = "age,name,color\n1,name1,color1\n2,name2,color2\n3,name3,color3\n4,name4,color4\n";
    ASSERT_EQ(0, csv.compare(0, upto_record4.size(), upto_record4));
    EXPECT_EQ((off_t)upto_record4.size(), index.offset_index().at(5));
}

TEST(IndexedRecordStream, chunking_2500_records) {
    const std::string csv = make_csv(2500);
    auto stream = std::make_unique<RecordingStream>(csv);
    RecordingStream* rec = stream.get();
    IndexedRecordStream index(std::move(stream), make_opts(1000, 64));

    ASSERT_EQ(2500u, index.record_count());
    std::set<uint64_t> keys;
    for (const auto& [key, offset] : index.offset_index()) {
        keys.insert(key);
    }
    EXPECT_EQ((std::set<uint64_t>{1, 1001, 2001}), keys);

    rec->m_offsets.clear();
    Record expected = {{"age", "2500"}, {"name", "name2500"}, {"color", fmt::format("color{}", 2500 % 7)}};
    EXPECT_EQ(expected, index.get_record(2500));

    // one byte before the record 2001 boundary is checked for '\n',
    // then reading starts at the boundary and nothing before it is touched
    const off_t boundary = index.offset_index().at(2001);
    ASSERT_GE(rec->m_offsets.size(), 2u);
    EXPECT_EQ(boundary - 1, rec->m_offsets[0]);
    EXPECT_EQ(boundary, rec->m_offsets[1]);
    for (size_t i = 1; i < rec->m_offsets.size(); i++) {
        EXPECT_GE(rec->m_offsets[i], boundary);
    }
}

TEST(IndexedRecordStream, matches_linear_scan_exhaustive) {
    for (uint64_t nrecords : {1, 2, 999, 1000, 1001, 2500}) {
        for (uint64_t chunk : {1, 3, 1000}) {
            SCOPED_TRACE(fmt::format("nrecords={} chunk={}", nrecords, chunk));
            const std::string csv = make_csv(nrecords);
            IndexedRecordStream index(std::make_unique<MemReader>(csv), make_opts(chunk, 256));

            MemReader ref(csv);
            LineReader reader(ref);
            std::string line;
            ASSERT_TRUE(reader.read_line(line)); // header
            for (uint64_t n = 1; n <= nrecords; n++) {
                ASSERT_TRUE(reader.read_line(line));
                ASSERT_EQ(index.parser().parse(index.header_line(), line), index.get_record(n)) << "record " << n;
            }
            EXPECT_FALSE(reader.read_line(line));
        }
    }
}

TEST(IndexedRecordStream, matches_linear_scan_random_order) {
    const std::string csv = make_csv(3000);
    IndexedRecordStream index(std::make_unique<MemReader>(csv), make_opts(100, 512));
    MemReader ref(csv);

    std::mt19937_64 rng(20240917);
    std::uniform_int_distribution<uint64_t> dist(1, index.record_count());
    for (int i = 0; i < 300; i++) {
        const uint64_t n = dist(rng);
        ASSERT_EQ(IndexedRecordStream::scan_raw_record(ref, n), index.get_raw_record(n)) << "record " << n;
        ASSERT_EQ(index.parser().parse(index.header_line(), IndexedRecordStream::scan_raw_record(ref, n)), index.get_record(n));
    }
}

TEST(IndexedRecordStream, out_of_range) {
    IndexedRecordStream index(std::make_unique<MemReader>(PEOPLE_CSV));
    EXPECT_THROW(index.get_record(0), IndexedRecordStream::OutOfRange);
    EXPECT_THROW(index.get_record(6), IndexedRecordStream::OutOfRange);
    EXPECT_THROW(index.get_raw_record(6), std::out_of_range);
    EXPECT_NO_THROW(index.get_record(5));
}

TEST(IndexedRecordStream, header_only) {
    IndexedRecordStream index(std::make_unique<MemReader>("age,name,color\n"));
    EXPECT_EQ(0u, index.record_count());
    EXPECT_EQ((std::vector<std::string>{"age", "name", "color"}), index.header());
    EXPECT_EQ(1u, index.offset_index().size());
    EXPECT_EQ(15, index.offset_index().at(1));
    EXPECT_THROW(index.get_record(0), IndexedRecordStream::OutOfRange);
    EXPECT_THROW(index.get_record(1), IndexedRecordStream::OutOfRange);
}

TEST(IndexedRecordStream, empty_stream) {
    IndexedRecordStream index(std::make_unique<MemReader>(""));
    EXPECT_EQ(0u, index.record_count());
    EXPECT_TRUE(index.header().empty());
    EXPECT_EQ("", index.header_line());
    EXPECT_EQ(0, index.offset_index().at(1));
    EXPECT_THROW(index.get_record(1), IndexedRecordStream::OutOfRange);
}

TEST(IndexedRecordStream, invalid_construction) {
    EXPECT_THROW(IndexedRecordStream index(std::make_unique<MemReader>(PEOPLE_CSV), make_opts(0)), std::invalid_argument);
    std::unique_ptr<Stream> null_stream;
    EXPECT_THROW(IndexedRecordStream index(std::move(null_stream)), std::invalid_argument);
}

TEST(IndexedRecordStream, field_count_mismatch_truncates_by_default) {
    IndexedRecordStream index(std::make_unique<MemReader>("a,b,c\n1,2\n1,2,3,4\n"));
    EXPECT_EQ((Record{{"a", "1"}, {"b", "2"}}), index.get_record(1));
    EXPECT_EQ((Record{{"a", "1"}, {"b", "2"}, {"c", "3"}}), index.get_record(2));
}

TEST(IndexedRecordStream, field_count_mismatch_strict) {
    IndexOptions opts;
    opts.parse.truncate_mismatched_fields = false;
    IndexedRecordStream index(std::make_unique<MemReader>("a,b,c\n1,2\n1,2,3\n"), opts);
    EXPECT_THROW(index.get_record(1), RecordParser::FieldMismatch);
    EXPECT_NO_THROW(index.get_record(2));
    // raw access is unaffected
    EXPECT_EQ("1,2", index.get_raw_record(1));
}

TEST(IndexedRecordStream, stream_size_changed) {
    auto stream = std::make_unique<MemReader>(PEOPLE_CSV);
    MemReader* mem = stream.get();
    IndexedRecordStream index(std::move(stream));

    mem->data() += "99,Late,black\n";
    EXPECT_THROW(index.get_record(1), IndexedRecordStream::MalformedStream);
    EXPECT_EQ(5u, index.record_count());
}

TEST(IndexedRecordStream, stream_truncated_in_place) {
    auto stream = std::make_unique<MemReader>("h\na\nb\nc\n");
    MemReader* mem = stream.get();
    IndexedRecordStream index(std::move(stream), make_opts(10, 2));
    ASSERT_EQ(3u, index.record_count());

    // same size, fewer lines
    mem->data() = "h\na\nbbbb";
    EXPECT_EQ("a", index.get_raw_record(1));
    EXPECT_THROW(index.get_record(3), IndexedRecordStream::MalformedStream);
}

TEST(IndexedRecordStream, stream_rewritten_same_size) {
    auto stream = std::make_unique<MemReader>("h\naa\nb\nc\n");
    MemReader* mem = stream.get();
    IndexedRecordStream index(std::move(stream), make_opts(2, 2));
    ASSERT_EQ(3u, index.record_count());
    ASSERT_EQ(7, index.offset_index().at(3));

    // same size, record 3 is now indexed into the middle of a line
    mem->data() = "h\nabc\ndef";
    EXPECT_THROW(index.get_raw_record(3), IndexedRecordStream::MalformedStream);
    EXPECT_THROW(index.get_record(3), IndexedRecordStream::MalformedStream);
}

TEST(IndexedRecordStream, last_line_with_lone_cr) {
    IndexedRecordStream index(std::make_unique<MemReader>("a,b\r\n1,2\r\n3,4\r"), make_opts(1, 4));
    ASSERT_EQ(2u, index.record_count());
    EXPECT_EQ("3,4", index.get_raw_record(2));
    EXPECT_EQ("4", index.get_record(2).at("b"));
}

TEST(IndexedRecordStream, lookups_in_any_order) {
    IndexedRecordStream index(std::make_unique<MemReader>(make_csv(50)), make_opts(7, 16));
    for (uint64_t n : {50, 1, 49, 2, 7, 8, 14, 15, 25, 25, 1}) {
        EXPECT_EQ(std::to_string(n), index.get_record(n).at("age"));
    }
}

TEST(IndexedRecordStream, scan_raw_record) {
    MemReader ref(PEOPLE_CSV);
    EXPECT_EQ("23,Dan,blue", IndexedRecordStream::scan_raw_record(ref, 1));
    EXPECT_EQ("55,Moshik,white", IndexedRecordStream::scan_raw_record(ref, 5));
    EXPECT_THROW(IndexedRecordStream::scan_raw_record(ref, 6), IndexedRecordStream::OutOfRange);
    EXPECT_THROW(IndexedRecordStream::scan_raw_record(ref, 0), IndexedRecordStream::OutOfRange);
}

TEST(strip_eol, variants) {
    EXPECT_EQ("a", strip_eol("a\n"));
    EXPECT_EQ("a", strip_eol("a\r\n"));
    EXPECT_EQ("a", strip_eol("a\r"));
    EXPECT_EQ("a\rb", strip_eol("a\rb"));
    EXPECT_EQ("a", strip_eol("a"));
    EXPECT_EQ("", strip_eol("\n"));
}
