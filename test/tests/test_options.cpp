#include <gtest/gtest.h>
#include "rollout.hpp"
#include "utils/test_utils.hpp"
#include <cerrno>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

rollout::Options parse(const std::vector<std::string> &args) {
    return rollout::parseArgs(args);
}

class ThrowingReader : public rollout::IInputReader {
public:
    explicit ThrowingReader(bool runtimeFailure) : m_runtimeFailure(runtimeFailure) {}

    std::size_t read(char *, std::size_t) override {
        if (m_runtimeFailure) throw std::runtime_error("decoder exploded");
        throw rollout::RolloutError(rollout::ErrorKind::Read, "stdin", EIO, "cannot read from 'stdin'");
    }

private:
    bool m_runtimeFailure;
};

std::string usageMessage(const std::vector<std::string> &args) {
    try {
        parse(args);
    } catch (const rollout::UsageError &e) {
        return e.what();
    }
    return "";
}

} // anonymous namespace

TEST(OptionsTest, Defaults) {
    rollout::Options o = parse({"-p", "app", "/var/log/app"});
    EXPECT_FALSE(o.showHelp);
    EXPECT_EQ(o.directory, "/var/log/app");
    EXPECT_EQ(o.prefix, "app");
    EXPECT_EQ(o.sizeKb, 10240u);
    EXPECT_EQ(o.keep, 0u);
    EXPECT_FALSE(o.rotateOnStart);
    EXPECT_EQ(o.logLevel, rollout::LogLevel::INFO);
    EXPECT_EQ(o.logFormat, rollout::LogFormat::Text);
}

TEST(OptionsTest, ShortFlags) {
    rollout::Options o = parse({"-s", "64", "-k", "5", "-r", "-p", "svc", "logs"});
    EXPECT_EQ(o.sizeKb, 64u);
    EXPECT_EQ(o.keep, 5u);
    EXPECT_TRUE(o.rotateOnStart);
    EXPECT_EQ(o.prefix, "svc");
    EXPECT_EQ(o.directory, "logs");
}

TEST(OptionsTest, LongFlagsAndEqualsForm) {
    rollout::Options o = parse({"logs", "--size=2", "--keep", "999", "--rotate-on-start",
                                "--prefix=web", "--log-level", "debug", "--log-format=json"});
    EXPECT_EQ(o.sizeKb, 2u);
    EXPECT_EQ(o.keep, 999u);
    EXPECT_TRUE(o.rotateOnStart);
    EXPECT_EQ(o.prefix, "web");
    EXPECT_EQ(o.logLevel, rollout::LogLevel::DEBUG);
    EXPECT_EQ(o.logFormat, rollout::LogFormat::Json);
}

TEST(OptionsTest, HelpShortCircuits) {
    EXPECT_TRUE(parse({"-h"}).showHelp);
    EXPECT_TRUE(parse({"-p", "x", "--help"}).showHelp);
    EXPECT_THROW(parse({"--bogus", "--help"}), rollout::UsageError);
}

TEST(OptionsTest, ToConfig) {
    rollout::Options o = parse({"-s", "3", "-k", "2", "-r", "-p", "app", "dir"});
    rollout::JournalConfig c = o.toConfig();
    EXPECT_EQ(c.directory(), "dir");
    EXPECT_EQ(c.prefixName(), "app");
    EXPECT_EQ(c.maxSizeBytes(), 3u * 1024u);
    EXPECT_EQ(c.keepCount(), 2u);
    EXPECT_TRUE(c.rotatesOnStart());
    EXPECT_EQ(c.journalPath(), "dir/current");
    EXPECT_NO_THROW(c.validate());
}

TEST(OptionsTest, ErrorMessages) {
    EXPECT_EQ(usageMessage({"-s", "big", "-p", "a", "d"}), "Expected number, found 'big'");
    EXPECT_EQ(usageMessage({"-k", "-1", "-p", "a", "d"}), "Expected number, found '-1'");
    EXPECT_EQ(usageMessage({"-x", "-p", "a", "d"}), "Unknown argument '-x'");
    EXPECT_EQ(usageMessage({"-p", "a", "d", "e"}), "Unexpected argument 'e'");
    EXPECT_EQ(usageMessage({"-p", "a", "d", "-s"}), "Expected number");
    EXPECT_EQ(usageMessage({"-p", "a"}), "Log directory not specified");
    EXPECT_EQ(usageMessage({"d"}), "Missing prefix");
    EXPECT_EQ(usageMessage({"-p", "", "d"}), "Invalid prefix ''");
    EXPECT_EQ(usageMessage({"-p", "a/b", "d"}), "Invalid prefix 'a/b'");
    EXPECT_EQ(usageMessage({"-k", "1000", "-p", "a", "d"}), "Keep must be between 0 and 999");
    EXPECT_EQ(usageMessage({"-s", "0", "-p", "a", "d"}), "Size must be a positive number of KB");
    EXPECT_EQ(usageMessage({"--log-level", "loud", "-p", "a", "d"}), "Unknown log level 'loud'");
    EXPECT_EQ(usageMessage({"--log-format=xml", "-p", "a", "d"}), "Unknown log format 'xml'");
    EXPECT_EQ(usageMessage({"--colour=yes", "-p", "a", "d"}), "Unknown argument '--colour=yes'");
}

TEST(OptionsTest, ArgvOverloadSkipsProgramName) {
    const char *argv[] = {"rollout", "-p", "app", "logs"};
    rollout::Options o = rollout::parseArgs(4, argv);
    EXPECT_EQ(o.prefix, "app");
    EXPECT_EQ(o.directory, "logs");
}

TEST(OptionsTest, UsageMentionsEveryFlag) {
    std::string text = rollout::usage();
    const char *flags[] = {"--help", "--size", "--keep", "--rotate-on-start", "--prefix",
                           "--log-level", "--log-format", "<dir>"};
    for (size_t i = 0; i < sizeof(flags) / sizeof(flags[0]); ++i) {
        EXPECT_NE(text.find(flags[i]), std::string::npos) << flags[i];
    }
}

TEST(EnsureDirectoryTest, CreatesNestedDirectories) {
    TempDir dir;
    std::string nested = dir.file("a/b/c");
    EXPECT_NO_THROW(rollout::ensureDirectory(nested));
    EXPECT_TRUE(rollout::detail::isDirectory(nested));
    EXPECT_NO_THROW(rollout::ensureDirectory(nested));
}

TEST(EnsureDirectoryTest, FileInTheWayIsUsageError) {
    TempDir dir;
    TestUtils::writeFile(dir.file("plain"), "x");
    try {
        rollout::ensureDirectory(dir.file("plain"));
        FAIL() << "expected UsageError";
    } catch (const rollout::UsageError &e) {
        EXPECT_NE(std::string(e.what()).find("Unable to find or create directory"), std::string::npos);
    }
}

class RunAppenderTest : public ::testing::Test {
protected:
    RunAppenderTest() : m_logger(rollout::LogLevel::DEBUG, false) {
        m_logger.addCustomSink(rollout::detail::make_unique<rollout::CallbackSink>(
            rollout::CallbackSink::EntryCallback([this](const rollout::LogEntry &e) {
                if (e.level == rollout::LogLevel::FATAL) m_fatal.push_back(e.message);
            })));
    }

    rollout::Options options() const {
        return parse({"-p", "app", m_dir.path()});
    }

    TempDir m_dir;
    rollout::Logger m_logger;
    std::vector<std::string> m_fatal;
};

TEST_F(RunAppenderTest, CleanEndOfInputExitsZero) {
    std::istringstream in("one\ntwo\n");
    rollout::StreamInputReader reader(in);
    EXPECT_EQ(rollout::runAppender(options(), reader, m_logger), 0);
    EXPECT_TRUE(m_fatal.empty());
    EXPECT_EQ(TestUtils::readFile(m_dir.file("current")), "one\ntwo\n");
}

TEST_F(RunAppenderTest, ReadErrorIsLoggedAndExitsOne) {
    ThrowingReader reader(false);
    EXPECT_EQ(rollout::runAppender(options(), reader, m_logger), 1);
    ASSERT_EQ(m_fatal.size(), 1u);
    EXPECT_EQ(m_fatal[0], "Read error: cannot read from 'stdin'");
}

TEST_F(RunAppenderTest, AnyOtherExceptionIsLoggedAndExitsOne) {
    ThrowingReader reader(true);
    EXPECT_EQ(rollout::runAppender(options(), reader, m_logger), 1);
    ASSERT_EQ(m_fatal.size(), 1u);
    EXPECT_EQ(m_fatal[0], "Unexpected error: decoder exploded");
}

TEST_F(RunAppenderTest, OversizedLimitIsInvalidConfiguration) {
    rollout::Options opts = options();
    opts.sizeKb = std::numeric_limits<std::uint64_t>::max();
    std::istringstream in("");
    rollout::StreamInputReader reader(in);
    EXPECT_EQ(rollout::runAppender(opts, reader, m_logger), 1);
    ASSERT_EQ(m_fatal.size(), 1u);
    EXPECT_EQ(m_fatal[0].find("Invalid configuration: "), 0u);
}
