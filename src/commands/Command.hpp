#pragma once
#include "utils/common.hpp"
#include "data/IndexedRecordStream.hpp"

#define REGISTER_COMMAND(klass) \
    klass klass::instance(true)

// for declaring friends like "friend class CmdTestBase<GetCommand>"
template<typename T> class CmdTestBase;

class Command {
    public:
        virtual int run() = 0;
        virtual ~Command() {}

        static std::map<std::string, Command*>& registry() {
            static std::map<std::string, Command*> registry;
            return registry;
        }

        argparse::ArgumentParser& parser() {
            return m_parser;
        }

    protected:
        Command(bool reg, const char* name, const char* description) : m_parser(name, "", argparse::default_arguments::help) {
            m_parser.add_description(description);
            register_common_args(m_parser);
            if( reg ){
                if( registry().find(name) != registry().end() ){
                    throw std::runtime_error("Command already registered: " + std::string(name));
                }
                registry()[name] = this;
            }
        }

        argparse::ArgumentParser m_parser;
};

// base for commands working on one indexed file
class IndexCommand : public Command {
    protected:
        IndexCommand(bool reg, const char* name, const char* description) : Command(reg, name, description) {
            m_parser.add_argument("filename").help("delimited text file, first line is the header");
            m_parser.add_argument("-c", "--chunk-size")
                .default_value(IndexOptions::DEFAULT_CHUNK_SIZE)
                .scan<'u', uint64_t>()
                .help("records between two index entries");
            m_parser.add_argument("-s", "--separator")
                .default_value(std::string(","))
                .help("field separator, a single character or \"tab\"");
            m_parser.add_argument("--strict-fields")
                .default_value(false)
                .implicit_value(true)
                .help("fail on records whose field count differs from the header instead of truncating");
        }

        fs::path filename() const {
            return m_parser.get<std::string>("filename");
        }

        IndexOptions index_options() const {
            IndexOptions opts;
            opts.chunk_size = m_parser.get<uint64_t>("--chunk-size");
            opts.parse.separator = parse_separator(m_parser.get<std::string>("--separator"));
            opts.parse.truncate_mismatched_fields = !m_parser.get<bool>("--strict-fields");
            return opts;
        }

        // prints fields in header order, "name=value" separated by spaces
        static std::string format_record(const std::vector<std::string>& header, const Record& record) {
            std::string out;
            for( const auto& name : header ){
                auto it = record.find(name);
                if( it == record.end() ){
                    continue; // record has fewer fields than the header
                }
                if( !out.empty() ){
                    out += ' ';
                }
                out += fmt::format("{}={}", name, it->second);
            }
            return out;
        }
};
