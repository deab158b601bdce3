#include "InfoCommand.hpp"
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <algorithm>

REGISTER_COMMAND(InfoCommand);

InfoCommand::InfoCommand(bool reg) : IndexCommand(reg, "info", "index a file and show its record count and header") {
}

int InfoCommand::run() {
    try {
        IndexedRecordStream index(filename(), index_options());

        std::vector<uint64_t> keys;
        keys.reserve(index.offset_index().size());
        for( const auto& [key, offset] : index.offset_index() ){
            keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());

        fmt::print("file:       {}\n", filename());
        fmt::print("records:    {}\n", index.record_count());
        fmt::print("fields:     {}\n", fmt::join(index.header(), ", "));
        fmt::print("chunk size: {}\n", index.chunk_size());
        fmt::print("index:      {} entries\n", keys.size());
        for( uint64_t key : keys ){
            logger->debug("index: record {:>10} at offset {:#x}", key, index.offset_index().at(key));
        }
    } catch (const std::exception& e) {
        logger->error("{}: {}", filename(), e.what());
        return 1;
    }
    return 0;
}
