#include <gtest/gtest.h>
#include "rollout.hpp"
#include "utils/test_utils.hpp"
#include <string>
#include <vector>

#include <sys/stat.h>

class StartupRecoveryTest : public ::testing::Test {
protected:
    StartupRecoveryTest() : m_logger(rollout::LogLevel::TRACE, false) {}

    rollout::RecoveryOutcome recover(const rollout::JournalConfig &config) {
        rollout::RetentionManager retention(config, m_logger);
        rollout::Rotator rotator(config, m_writer, retention, m_logger);
        rollout::StartupRecovery recovery(config, m_writer, rotator, m_logger);
        return recovery.run();
    }

    rollout::JournalConfig config(bool rotateOnStart) const {
        return rollout::JournalConfig::in(m_dir.path()).prefix("app").rotateOnStart(rotateOnStart);
    }

    TempDir m_dir;
    rollout::Logger m_logger;
    rollout::LineBufferedWriter m_writer;
};

TEST_F(StartupRecoveryTest, MissingJournalIsCreated) {
    EXPECT_EQ(recover(config(false)), rollout::RecoveryOutcome::Created);
    EXPECT_TRUE(TestUtils::fileExists(m_dir.file("current")));
    EXPECT_EQ(m_writer.sizeBytes(), 0u);
    EXPECT_TRUE(m_writer.atBoundary());
}

TEST_F(StartupRecoveryTest, ExistingJournalIsResumed) {
    TestUtils::writeFile(m_dir.file("current"), "first\nsecond\n");
    EXPECT_EQ(recover(config(false)), rollout::RecoveryOutcome::Resumed);
    EXPECT_EQ(m_writer.sizeBytes(), 13u);
    EXPECT_TRUE(m_writer.atBoundary());

    m_writer.append("third\n");
    EXPECT_EQ(TestUtils::readFile(m_dir.file("current")), "first\nsecond\nthird\n");
}

TEST_F(StartupRecoveryTest, ResumedPartialLineIsNotABoundary) {
    TestUtils::writeFile(m_dir.file("current"), "complete\ncut off mid");
    EXPECT_EQ(recover(config(false)), rollout::RecoveryOutcome::Resumed);
    EXPECT_EQ(m_writer.sizeBytes(), 20u);
    EXPECT_FALSE(m_writer.atBoundary());
}

TEST_F(StartupRecoveryTest, EmptyJournalIsResumedAtBoundary) {
    TestUtils::writeFile(m_dir.file("current"), "");
    EXPECT_EQ(recover(config(true)), rollout::RecoveryOutcome::Resumed);
    EXPECT_EQ(m_writer.sizeBytes(), 0u);
    EXPECT_TRUE(m_writer.atBoundary());
    EXPECT_FALSE(TestUtils::fileExists(m_dir.file("app.1.log")));
}

TEST_F(StartupRecoveryTest, RotateOnStartMovesLeftoverJournal) {
    TestUtils::writeFile(m_dir.file("current"), "from the last run\nunterminated");
    EXPECT_EQ(recover(config(true)), rollout::RecoveryOutcome::RotatedOnStart);

    EXPECT_EQ(TestUtils::readFile(m_dir.file("app.1.log")), "from the last run\nunterminated");
    EXPECT_EQ(TestUtils::getFileSize(m_dir.file("current")), 0u);
    EXPECT_EQ(m_writer.sizeBytes(), 0u);
    EXPECT_TRUE(m_writer.atBoundary());
}

TEST_F(StartupRecoveryTest, RotateOnStartUsesNextFreeIndex) {
    TestUtils::writeFile(m_dir.file("app.1.log"), "a\n");
    TestUtils::writeFile(m_dir.file("app.2.log"), "b\n");
    TestUtils::writeFile(m_dir.file("current"), "c\n");
    EXPECT_EQ(recover(config(true)), rollout::RecoveryOutcome::RotatedOnStart);
    EXPECT_EQ(TestUtils::readFile(m_dir.file("app.3.log")), "c\n");
}

TEST_F(StartupRecoveryTest, JournalThatIsADirectoryIsOpenError) {
    ASSERT_EQ(mkdir(m_dir.file("current").c_str(), 0755), 0);
    try {
        recover(config(false));
        FAIL() << "expected RolloutError";
    } catch (const rollout::RolloutError &e) {
        EXPECT_EQ(e.kind(), rollout::ErrorKind::Open);
    }
}

TEST_F(StartupRecoveryTest, MissingDirectoryIsOpenError) {
    auto missing = rollout::JournalConfig::in(m_dir.file("nope")).prefix("app");
    try {
        recover(missing);
        FAIL() << "expected RolloutError";
    } catch (const rollout::RolloutError &e) {
        EXPECT_EQ(e.kind(), rollout::ErrorKind::Open);
    }
}

TEST(RecoveryOutcomeTest, Names) {
    EXPECT_STREQ(rollout::getRecoveryOutcomeString(rollout::RecoveryOutcome::Created), "created");
    EXPECT_STREQ(rollout::getRecoveryOutcomeString(rollout::RecoveryOutcome::Resumed), "resumed");
    EXPECT_STREQ(rollout::getRecoveryOutcomeString(rollout::RecoveryOutcome::RotatedOnStart), "rotated-on-start");
}
