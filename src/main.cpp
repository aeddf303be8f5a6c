/**
 * @file main.cpp
 * @brief Entry point of the cachedict tool.
 *
 * Parses the command line, sets up logging, runs the self-test and then the
 * selected sub-command.
 */

#include <iostream>

#include <argparse/argparse.hpp>

#include "utils/common.hpp"
#include "version.h"

#include "commands/TestCommand.hpp"

extern argparse::ArgumentParser program;

int main(int argc, char* argv[]) {
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
        return 1;
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // before init_log(), file sink level depends on it
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (!program.is_subcommand_used(name)) {
            continue;
        }

        if( cmd->parser().is_used("--log-dedup-limit") ){
            logger->set_dedup_limit(cmd->parser().get<int>("--log-dedup-limit"));
        }
        std::string log_fname;
        if( cmd->parser().is_used("--log") ){
            log_fname = cmd->parser().get<std::string>("--log");
        } else if( program.is_used("--log") ){
            log_fname = program.get<std::string>("--log");
        }
        init_log(log_fname);

        if( name != TEST_CMD_NAME ){
            // implicit self-test, only failures are visible
            int rc = 0;
            logger->with_console_level(spdlog::level::critical, [&]{ rc = selfTestCmd->run(); });
            if( rc != 0 ){
                logger->critical("self-test failed, exiting");
                return 1;
            }
        } else {
            logger->set_verbosity(9);
        }

        try {
            return cmd->run();
        } catch (const std::exception& e) {
            logger->critical("{}: {}", name, e.what());
            return 1;
        }
    }

    std::cout << program;
    return 0;
}
