/**
 * @file TestCommand.cpp
 * @brief Platform self-test, run implicitly before every other command.
 *
 * Byte offsets are stored as off_t and record numbers as uint64_t, so files
 * larger than 2Gb need a 64-bit off_t (_FILE_OFFSET_BITS=64 on 32-bit hosts).
 */

#include "TestCommand.hpp"
#include "io/LineReader.hpp"
#include "io/MemReader.hpp"

REGISTER_COMMAND(TestCommand);

TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

int TestCommand::run() {
    logger->trace("selftest: sizeof(off_t)     = {}", sizeof(off_t));
    logger->trace("selftest: sizeof(size_t)    = {}", sizeof(size_t));
    logger->trace("selftest: sizeof(uint64_t)  = {}", sizeof(uint64_t));

    if( sizeof(off_t) != 8 ){
        logger->critical("selftest: sizeof(off_t) != 8, large files are not supported");
        return 1;
    }

    if( sizeof(size_t) < sizeof(uint32_t) ){
        logger->critical("selftest: sizeof(size_t) < 4");
        return 1;
    }

    // tiny buffer forces lines to span several refills
    MemReader mem("h\nline one\n\nlast");
    LineReader reader(mem, 3);
    std::string line;
    const char* expected[] = { "h\n", "line one\n", "\n", "last" };
    for( const char* exp : expected ){
        if( !reader.read_line(line) || line != exp ){
            logger->critical("selftest: LineReader returned \"{}\", expected \"{}\"", line, exp);
            return 1;
        }
    }
    if( reader.read_line(line) || reader.tell() != (off_t)mem.size() ){
        logger->critical("selftest: LineReader did not stop at EOF");
        return 1;
    }

    logger->trace("selftest: OK");
    return 0;
}
