/**
 * @file GetCommand.cpp
 * @brief Random-access lookup of one or more records by number.
 */

#include "GetCommand.hpp"

REGISTER_COMMAND(GetCommand);

GetCommand::GetCommand(bool reg) : IndexCommand(reg, "get", "print records by number (1-based, header excluded)") {
    m_parser.add_argument("records")
        .help("record numbers")
        .nargs(argparse::nargs_pattern::at_least_one)
        .scan<'u', uint64_t>();
    m_parser.add_argument("-r", "--raw")
        .default_value(false)
        .implicit_value(true)
        .help("print the unparsed line");
}

/**
 * @brief Looks up every requested record in command line order.
 *
 * Out of range numbers are reported and skipped, the remaining records are
 * still printed.
 *
 * @return 0 if all records were printed, 1 otherwise.
 */
int GetCommand::run() {
    const bool raw = m_parser.get<bool>("--raw");
    int rc = 0;
    try {
        IndexedRecordStream index(filename(), index_options());
        for( uint64_t n : m_parser.get<std::vector<uint64_t>>("records") ){
            try {
                if( raw ){
                    fmt::print("{}\n", index.get_raw_record(n));
                } else {
                    fmt::print("{}: {}\n", n, format_record(index.header(), index.get_record(n)));
                }
            } catch (const IndexedRecordStream::OutOfRange& e) {
                logger->error("{}", e.what());
                rc = 1;
            } catch (const RecordParser::FieldMismatch& e) {
                logger->error("record {}: {}", n, e.what());
                rc = 1;
            }
        }
    } catch (const std::exception& e) {
        logger->error("{}: {}", filename(), e.what());
        return 1;
    }
    return rc;
}
