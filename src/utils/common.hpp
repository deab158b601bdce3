#pragma once
#include "io/Logger.hpp"

#include <string>
#include <filesystem>
#include <vector>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "csvseek"

#define ANSI_COLOR_GREEN   "\x1b[32m"
#define ANSI_COLOR_RED     "\x1b[31m"
#define ANSI_COLOR_RESET   "\x1b[0m"

extern std::shared_ptr<Logger> logger;
extern int verbosity;

void init_log(const std::string& log_fname);
char parse_separator(const std::string& value);
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);
