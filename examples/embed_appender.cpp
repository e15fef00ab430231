/// @file embed_appender.cpp
/// @brief Drives the appender from an in-memory stream instead of stdin.
///
/// Writes 200 lines with a 1KB threshold into ./demo_journal, keeping the
/// three newest rotated files.

#include "rollout.hpp"
#include <iostream>
#include <sstream>

int main() {
    rollout::Logger logger(rollout::LogLevel::INFO);

    std::ostringstream text;
    for (int i = 0; i < 200; ++i) {
        text << "request " << i << " served in " << (i * 7) % 113 << "ms\n";
    }
    std::istringstream input(text.str());
    rollout::StreamInputReader reader(input, "demo input");

    try {
        rollout::ensureDirectory("demo_journal");
        rollout::Appender appender(
            rollout::JournalConfig::in("demo_journal").prefix("demo").maxSizeKb(1).keep(3),
            logger);
        rollout::AppenderStats stats = appender.run(reader);

        std::cout << "Wrote " << stats.bytesWritten << " bytes with "
                  << stats.rotations << " rotations.\n"
                  << "Check demo_journal/current and demo_journal/demo.N.log\n";
    } catch (const rollout::RolloutError& e) {
        std::cerr << rollout::getErrorKindString(e.kind()) << " error: " << e.what() << "\n";
        return 1;
    } catch (const rollout::UsageError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
