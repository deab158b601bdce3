#include "IterCommand.hpp"
#include "data/RecordCursor.hpp"

REGISTER_COMMAND(IterCommand);

IterCommand::IterCommand(bool reg) : IndexCommand(reg, "iter", "print records sequentially starting at a given record") {
    m_parser.add_argument("-F", "--from")
        .default_value(uint64_t{1})
        .scan<'u', uint64_t>()
        .help("first record to print");
    m_parser.add_argument("-n", "--limit")
        .default_value(uint64_t{0})
        .scan<'u', uint64_t>()
        .help("max records to print, 0 = all");
}

int IterCommand::run() {
    const uint64_t limit = m_parser.get<uint64_t>("--limit");
    try {
        IndexedRecordStream index(filename(), index_options());
        RecordCursor cursor = index.iterate_from(m_parser.get<uint64_t>("--from"));

        uint64_t printed = 0;
        while( limit == 0 || printed < limit ){
            const uint64_t n = cursor.position();
            std::optional<Record> record = cursor.next();
            if( !record ){
                break;
            }
            fmt::print("{}: {}\n", n, format_record(index.header(), *record));
            printed++;
        }
        logger->debug("printed {} records", printed);
    } catch (const std::exception& e) {
        logger->error("{}: {}", filename(), e.what());
        return 1;
    }
    return 0;
}
