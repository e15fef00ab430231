/// @file main.cpp
/// @brief rollout: append stdin to a size-rotated directory of log files.

#include "rollout.hpp"
#include <iostream>
#include <unistd.h>

int main(int argc, char* argv[]) {
    rollout::Options options;
    try {
        options = rollout::parseArgs(argc, argv);
    } catch (const rollout::UsageError& e) {
        std::cerr << e.what() << "\n\n" << rollout::usage();
        return 1;
    }

    if (options.showHelp) {
        std::cout << rollout::usage();
        return 0;
    }

    rollout::Logger logger(options.logLevel, false);
    if (options.logFormat == rollout::LogFormat::Json) {
        logger.addSink<rollout::ConsoleSink, rollout::JsonFormatter>();
    } else {
        logger.addSink<rollout::ConsoleSink>();
    }

    try {
        rollout::ensureDirectory(options.directory);
    } catch (const rollout::UsageError& e) {
        std::cerr << e.what() << "\n\n" << rollout::usage();
        return 1;
    }

    rollout::FdInputReader input(STDIN_FILENO);
    return rollout::runAppender(options, input, logger);
}
