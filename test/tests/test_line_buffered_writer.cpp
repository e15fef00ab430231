#include <gtest/gtest.h>
#include "rollout.hpp"
#include "utils/test_utils.hpp"
#include <string>

class LineBufferedWriterTest : public ::testing::Test {
protected:
    TempDir m_dir;
    rollout::LineBufferedWriter m_writer;
};

TEST_F(LineBufferedWriterTest, FreshJournalIsEmptyAndAtBoundary) {
    m_writer.open(m_dir.file("current"), false);
    EXPECT_TRUE(m_writer.isOpen());
    EXPECT_EQ(m_writer.sizeBytes(), 0u);
    EXPECT_TRUE(m_writer.atBoundary());
    EXPECT_TRUE(TestUtils::fileExists(m_dir.file("current")));
}

TEST_F(LineBufferedWriterTest, AppendTracksSizeAndBoundary) {
    m_writer.open(m_dir.file("current"), false);

    m_writer.append("hello\n");
    EXPECT_EQ(m_writer.sizeBytes(), 6u);
    EXPECT_TRUE(m_writer.atBoundary());

    m_writer.append("partial");
    EXPECT_EQ(m_writer.sizeBytes(), 13u);
    EXPECT_FALSE(m_writer.atBoundary());

    m_writer.append(" line\nand more");
    EXPECT_FALSE(m_writer.atBoundary());

    m_writer.append("\n");
    EXPECT_TRUE(m_writer.atBoundary());
    EXPECT_EQ(m_writer.sizeBytes(), 28u);
}

TEST_F(LineBufferedWriterTest, EveryAppendReachesTheFile) {
    m_writer.open(m_dir.file("current"), false);
    m_writer.append("abc");
    EXPECT_EQ(TestUtils::readFile(m_dir.file("current")), "abc");
    m_writer.append("def\n");
    EXPECT_EQ(TestUtils::readFile(m_dir.file("current")), "abcdef\n");
}

TEST_F(LineBufferedWriterTest, EmptyAppendKeepsState) {
    m_writer.open(m_dir.file("current"), false);
    m_writer.append("no newline");
    m_writer.append("", 0);
    EXPECT_FALSE(m_writer.atBoundary());
    EXPECT_EQ(m_writer.sizeBytes(), 10u);
}

TEST_F(LineBufferedWriterTest, BinaryBytesArePreserved) {
    m_writer.open(m_dir.file("current"), false);
    const char data[] = {'a', '\0', '\r', '\n', '\xff', '\n'};
    m_writer.append(data, sizeof(data));
    EXPECT_EQ(TestUtils::readFile(m_dir.file("current")), std::string(data, sizeof(data)));
}

TEST_F(LineBufferedWriterTest, AppendModeKeepsExistingContent) {
    TestUtils::writeFile(m_dir.file("current"), "old\n");
    m_writer.open(m_dir.file("current"), false);
    m_writer.resume(4, true);
    m_writer.append("new\n");
    EXPECT_EQ(m_writer.sizeBytes(), 8u);
    EXPECT_EQ(TestUtils::readFile(m_dir.file("current")), "old\nnew\n");
}

TEST_F(LineBufferedWriterTest, TruncateModeEmptiesFile) {
    TestUtils::writeFile(m_dir.file("current"), "stale content\n");
    m_writer.open(m_dir.file("current"), true);
    EXPECT_EQ(TestUtils::getFileSize(m_dir.file("current")), 0u);
}

TEST_F(LineBufferedWriterTest, OpenFailureIsOpenError) {
    try {
        m_writer.open(m_dir.file("no/such/dir/current"), false);
        FAIL() << "expected RolloutError";
    } catch (const rollout::RolloutError &e) {
        EXPECT_EQ(e.kind(), rollout::ErrorKind::Open);
        EXPECT_NE(std::string(e.what()).find("no/such/dir/current"), std::string::npos);
    }
}

TEST_F(LineBufferedWriterTest, DiskFullIsWriteError) {
    if (!TestUtils::fileExists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    m_writer.open("/dev/full", false);
    try {
        m_writer.append("this cannot fit\n");
        FAIL() << "expected RolloutError";
    } catch (const rollout::RolloutError &e) {
        EXPECT_EQ(e.kind(), rollout::ErrorKind::Write);
        EXPECT_TRUE(e.isFatal());
    }
    EXPECT_EQ(m_writer.sizeBytes(), 0u);
}

TEST_F(LineBufferedWriterTest, AppendAfterCloseIsWriteError) {
    m_writer.open(m_dir.file("current"), false);
    m_writer.close();
    EXPECT_FALSE(m_writer.isOpen());
    EXPECT_THROW(m_writer.append("x\n"), rollout::RolloutError);
}
