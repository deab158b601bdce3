/**
 * @file main.cpp
 * @brief Entry point: argument parsing, logging setup and command dispatch.
 *
 * Every command registers itself in Command::registry(). The self-test runs
 * silently before any command except "test" itself.
 */

#include <argparse/argparse.hpp>
#include <iostream>

#include "utils/common.hpp"
#include "version.h"

#include "commands/TestCommand.hpp"

extern argparse::ArgumentParser program;

int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (!program.is_subcommand_used(name)) {
            continue;
        }

        if( name == TEST_CMD_NAME ){
            // explicit self-test, make it visible
            logger->set_verbosity(9);
        } else if( selfTestCmd->run() != 0 ){
            logger->critical("self-test failed, exiting");
            return 1;
        }

        std::string log_fname;
        if( cmd->parser().is_used("--log") ){
            log_fname = cmd->parser().get<std::string>("--log");
        } else if( program.is_used("--log") ){
            log_fname = program.get<std::string>("--log");
        }
        init_log(log_fname);

        return cmd->run();
    }

    std::cout << program;
    return 0;
}
