#pragma once
#include "io/Logger.hpp"
#include "units.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "cachedict"

#define ANSI_COLOR_GREEN   "\x1b[32m"
#define ANSI_COLOR_RED     "\x1b[31m"
#define ANSI_COLOR_RESET   "\x1b[0m"

extern std::shared_ptr<Logger> logger;
extern int verbosity;
extern bool g_force;

void init_log(const std::string& log_fname);
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);
