#include "netdef/Debug.hpp"
#include "TempFile.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using netdef::DebugLevel;
using netdef::DebugLogger;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

class DebugTest : public ::testing::Test {
protected:
    void SetUp() override {
        DebugLogger::getInstance().setStream(captured_);
    }

    void TearDown() override {
        DebugLogger::getInstance().setLevel(DebugLevel::WARN);
        DebugLogger::getInstance().closeLogFile();
    }

    std::ostringstream captured_;
};

} // namespace

TEST_F(DebugTest, ParseLevelIgnoresCase) {
    EXPECT_EQ(DebugLogger::parseLevel("trace"), DebugLevel::TRACE);
    EXPECT_EQ(DebugLogger::parseLevel("Detail"), DebugLevel::DETAIL);
    EXPECT_EQ(DebugLogger::parseLevel("WARN"), DebugLevel::WARN);
    EXPECT_EQ(DebugLogger::parseLevel("none"), DebugLevel::NONE);
    EXPECT_FALSE(DebugLogger::parseLevel("verbose").has_value());
    EXPECT_FALSE(DebugLogger::parseLevel("").has_value());
}

TEST_F(DebugTest, LevelNames) {
    EXPECT_EQ(DebugLogger::levelToString(DebugLevel::ERROR), "ERROR");
    EXPECT_EQ(DebugLogger::levelToString(DebugLevel::DETAIL), "DETAIL");
}

TEST_F(DebugTest, MessagesBelowLevelAreDropped) {
    DebugLogger::getInstance().setLevel(DebugLevel::WARN);
    NETDEF_LOG(DebugLevel::INFO, "hidden {}", 1);
    NETDEF_LOG(DebugLevel::TRACE, "hidden {}", 2);
    EXPECT_EQ(captured_.str(), "");

    NETDEF_LOG(DebugLevel::ERROR, "shown {}", 3);
    EXPECT_THAT(captured_.str(), StartsWith("[ERROR] "));
    EXPECT_THAT(captured_.str(), HasSubstr(" - shown 3\n"));
}

TEST_F(DebugTest, NoneSilencesEverything) {
    DebugLogger::getInstance().setLevel(DebugLevel::NONE);
    EXPECT_FALSE(DebugLogger::getInstance().isEnabled(DebugLevel::ERROR));
    NETDEF_LOG(DebugLevel::ERROR, "nothing");
    EXPECT_EQ(captured_.str(), "");
}

TEST_F(DebugTest, TraceEnablesAllLevels) {
    DebugLogger::getInstance().setLevel(DebugLevel::TRACE);
    EXPECT_TRUE(DebugLogger::getInstance().isEnabled(DebugLevel::TRACE));
    EXPECT_TRUE(DebugLogger::getInstance().isEnabled(DebugLevel::INFO));
    EXPECT_FALSE(DebugLogger::getInstance().isEnabled(DebugLevel::NONE));
}

TEST_F(DebugTest, BadFormatStringIsReported) {
    DebugLogger::getInstance().setLevel(DebugLevel::INFO);
    NETDEF_LOG(DebugLevel::INFO, "missing {} {}", 1);
    EXPECT_THAT(captured_.str(), StartsWith("[ERROR] Format error in log message: "));
}

TEST_F(DebugTest, LogFileInMissingDirectoryFails) {
    EXPECT_FALSE(DebugLogger::getInstance().setLogFile(netdef::test::missingFilePath() + "/log.txt"));
    EXPECT_TRUE(DebugLogger::getInstance().setLogFile(""));
}

TEST_F(DebugTest, LogFileReceivesMessages) {
    netdef::test::TempFile file("");
    ASSERT_TRUE(DebugLogger::getInstance().setLogFile(file.path()));
    DebugLogger::getInstance().setLevel(DebugLevel::INFO);
    NETDEF_LOG(DebugLevel::INFO, "Scanned {} symbols", 12);
    DebugLogger::getInstance().closeLogFile();

    std::ifstream in(file.path());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_THAT(contents.str(), StartsWith("[INFO] "));
    EXPECT_THAT(contents.str(), HasSubstr("Scanned 12 symbols"));
    EXPECT_EQ(captured_.str(), "");
}
