#include "netdef/DefinitionLoader.hpp"
#include "FakeCircuit.hpp"
#include "TempFile.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace netdef;
using netdef::test::FakeCircuit;
using netdef::test::TempFile;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

const char* const VALID =
    "DEVICES: CLOCK clk 2, SWITCH en 1, NAND g 2;\n"
    "CONNECT: clk > g.I1, en > g.I2;\n"
    "MONITOR: g, clk;\n"
    "END;\n";

class DefinitionLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        DebugLogger::getInstance().closeLogFile();
        DebugLogger::getInstance().setLevel(DebugLevel::WARN);
    }

    LoadResult load(const std::string& path, const LoadOptions& options = LoadOptions()) {
        return loadDefinition(path, circuit_.names, circuit_.devices, circuit_.network,
                              circuit_.monitors, options);
    }

    FakeCircuit circuit_;
};

} // namespace

TEST_F(DefinitionLoaderTest, ValidFileBuildsCircuit) {
    TempFile file(VALID);
    LoadResult result = load(file.path());

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.messages, "");
    EXPECT_FALSE(result.hasWarnings);
    EXPECT_EQ(circuit_.devices.findDevices(std::nullopt).size(), 3u);
    EXPECT_EQ(circuit_.monitors.monitorsDictionary().size(), 2u);
}

TEST_F(DefinitionLoaderTest, DiagnosticsAreCollected) {
    TempFile file("DEVICES: XOR x1, XOR X2;\nCONNECT: ;\nMONITOR: ;\nEND;");
    LoadResult result = load(file.path());

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.messages, StartsWith("Device name should be a lowercase alphanumeric string"));
    EXPECT_THAT(result.messages, HasSubstr("Line 1: DEVICES: XOR x1, XOR X2;\n"));
    EXPECT_THAT(result.messages, HasSubstr("1 syntax error detected in the file\n"));
}

TEST_F(DefinitionLoaderTest, WarningsStillSucceed) {
    TempFile file("DEVICES: SWITCH s 0;\nCONNECT: ;\nMONITOR: s, s;\nEND;");
    LoadResult result = load(file.path());

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.hasWarnings);
    EXPECT_THAT(result.messages, StartsWith("Warning: Monitor exists at this output already.\n"));
}

TEST_F(DefinitionLoaderTest, SourceLinesWithoutNumbers) {
    TempFile file("DEVICES: SWITCH s 0;\nCONNECT: ;\nMONITOR: x2;\nEND;");
    LoadOptions options;
    options.showLineNumbers = false;
    LoadResult result = load(file.path(), options);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.messages, "Device x2 is not defined\nMONITOR: x2;\n         ^\n");
}

TEST_F(DefinitionLoaderTest, MissingFileGivesFailedResult) {
    std::string path = netdef::test::missingFilePath();
    LoadResult result = load(path);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.messages, "Cannot open definition file: " + path + "\n");
}

TEST_F(DefinitionLoaderTest, UnopenableLogFile) {
    TempFile file(VALID);
    LoadOptions options;
    options.logFile = netdef::test::missingFilePath() + "/netdef.log";
    LoadResult result = load(file.path(), options);

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.messages, StartsWith("Cannot open log file: "));
    EXPECT_TRUE(circuit_.devices.findDevices(std::nullopt).empty());
}

TEST_F(DefinitionLoaderTest, LogLevelAndFileAreApplied) {
    TempFile file(VALID);
    TempFile log("");
    LoadOptions options;
    options.logLevel = DebugLevel::INFO;
    options.logFile = log.path();
    LoadResult result = load(file.path(), options);
    DebugLogger::getInstance().closeLogFile();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(DebugLogger::getInstance().getLevel(), DebugLevel::INFO);

    std::ifstream in(log.path());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_THAT(contents.str(), HasSubstr("[INFO] "));
    EXPECT_THAT(contents.str(), HasSubstr("circuit build succeeded"));
}
