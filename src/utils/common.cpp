/**
 * @file common.cpp
 * @brief Global logger, argument registration and crash handling.
 */

#include "common.hpp"
#include "version.h"

#include <spdlog/sinks/stdout_color_sinks.h>

int verbosity = 0;

// stdout carries records, diagnostics go to stderr
std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::stderr_color_mt(APP_NAME));
argparse::ArgumentParser program(APP_NAME, "", argparse::default_arguments::help);

// begin stack trace generation on error
#include <backtrace.h>

void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "??", lineno, function ? function : "??");
    return 0;  // Continue processing the backtrace
}

void signal_handler(int sig) {
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    exit(1);
}
// end stack trace generation on error

void init_log(const std::string& log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }
    inited = true;

    // explicit log pathname, can't continue without log
    if( !log_fname.empty() && !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        exit(1);
    }
    logger->start();
}

// "," ";" "|" or the escapes "\t" / "tab"
char parse_separator(const std::string& value){
    if( value == "\\t" || value == "tab" ){
        return '\t';
    }
    if( value.size() != 1 || value[0] == '\n' ){
        throw std::runtime_error("Invalid separator: \"" + value + "\", expected a single character");
    }
    return value[0];
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("log pathname [default: console only]");
}

void register_program_args(argparse::ArgumentParser &parser) {
    static bool registered = false;
    if( registered ){
        return;
    }
    registered = true;

    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}
