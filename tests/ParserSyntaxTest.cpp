#include "netdef/DiagnosticSink.hpp"
#include "netdef/Parser.hpp"
#include "FakeCircuit.hpp"
#include "TempFile.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace netdef;
using netdef::test::FakeCircuit;
using netdef::test::TempFile;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

class ParserSyntaxTest : public ::testing::Test {
protected:
    Parser& load(const std::string& contents) {
        file_ = std::make_unique<TempFile>(contents);
        scanner_ = std::make_unique<Scanner>(file_->path(), circuit_.names, std::make_unique<BufferSink>());
        parser_ = std::make_unique<Parser>(circuit_.names, circuit_.devices, circuit_.network,
                                           circuit_.monitors, *scanner_);
        return *parser_;
    }

    std::string messages() const { return scanner_->getErrorMessages(); }

    // Source line echo plus caret, as printed under a message
    static std::string located(int line, const std::string& source, int column) {
        std::string prefix = "Line " + std::to_string(line) + ": ";
        return prefix + source + "\n" + std::string(prefix.size() + column - 1, ' ') + "^\n";
    }

    FakeCircuit circuit_;
    std::unique_ptr<TempFile> file_;
    std::unique_ptr<Scanner> scanner_;
    std::unique_ptr<Parser> parser_;
};

const char* const TAIL = "\nCONNECT: ;\nMONITOR: ;\nEND;";

} // namespace

TEST_F(ParserSyntaxTest, MinimalFileParses) {
    auto description = load("DEVICES: SWITCH switch1, 0; CONNECT: ; MONITOR: switch1; END;").parseFile();

    ASSERT_TRUE(description.has_value());
    EXPECT_EQ(parser_->errorCount(), 0);
    EXPECT_EQ(messages(), "");

    const std::vector<ItemDescriptor>& devices = description->items(Section::DEVICES);
    ASSERT_EQ(devices.size(), 1u);
    ASSERT_EQ(devices[0].size(), 3u);
    EXPECT_EQ(circuit_.names.resolve(devices[0][1].getId()), std::optional<std::string>("switch1"));
    EXPECT_EQ(circuit_.names.resolve(devices[0][2].getId()), std::optional<std::string>("0"));

    EXPECT_TRUE(description->items(Section::CONNECT).empty());
    ASSERT_EQ(description->items(Section::MONITOR).size(), 1u);
    EXPECT_EQ(description->items(Section::MONITOR)[0].size(), 1u);
}

TEST_F(ParserSyntaxTest, FullCircuitKeepsItemShapes) {
    auto description = load(
        "DEVICES: SWITCH s1 0, SWITCH s2 1, AND g1 2, DTYPE d1, CLOCK clk, 10;\n"
        "CONNECT: s1 > g1.I1, s2 > g1.I2, g1 > d1.DATA, clk > d1.CLK, s1 > d1.SET, s2 > d1.CLEAR;\n"
        "MONITOR: g1, d1.Q, d1.QBAR;\n"
        "END;").parseFile();

    ASSERT_TRUE(description.has_value());
    EXPECT_EQ(description->items(Section::DEVICES).size(), 5u);
    EXPECT_EQ(description->items(Section::DEVICES)[3].size(), 2u);

    const std::vector<ItemDescriptor>& connections = description->items(Section::CONNECT);
    ASSERT_EQ(connections.size(), 6u);
    for (const ItemDescriptor& item : connections) {
        EXPECT_EQ(item.size(), 5u);
    }

    const std::vector<ItemDescriptor>& monitors = description->items(Section::MONITOR);
    ASSERT_EQ(monitors.size(), 3u);
    EXPECT_EQ(monitors[0].size(), 1u);
    EXPECT_EQ(monitors[1].size(), 3u);
    EXPECT_EQ(monitors[2][2].getCategory(), SymbolCategory::OUTPUT_PIN);
}

TEST_F(ParserSyntaxTest, QualifiedOutputConnection) {
    auto description = load(
        "DEVICES: DTYPE d1, XOR x;\n"
        "CONNECT: d1.QBAR > x.I1;\n"
        "MONITOR: ;\n"
        "END;").parseFile();

    ASSERT_TRUE(description.has_value());
    ASSERT_EQ(description->items(Section::CONNECT).size(), 1u);
    EXPECT_EQ(description->items(Section::CONNECT)[0].size(), 7u);
}

TEST_F(ParserSyntaxTest, MissingDevicesKeyword) {
    const std::string source = "SWITCH sw1 0; CONNECT: ; MONITOR: ; END;";
    EXPECT_FALSE(load(source).parseNetwork());

    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(), "File must start with keyword 'DEVICES'.\n" + located(1, source, 1) +
                          "1 syntax error detected in the file\n");
}

TEST_F(ParserSyntaxTest, TruncatedFileReportsOnePrematureEnd) {
    const std::string source = "DEVICES: SWITCH sw1 0;";
    EXPECT_FALSE(load(source).parseFile().has_value());

    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(), "File ends too early (premature end of file). Should check for missing sections.\n" +
                          located(1, source, 22));
}

TEST_F(ParserSyntaxTest, TruncatedInsideItem) {
    EXPECT_FALSE(load("DEVICES: SWITCH sw1").parseFile().has_value());
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_THAT(messages(), StartsWith("File ends too early"));
}

TEST_F(ParserSyntaxTest, EmptyFile) {
    EXPECT_FALSE(load("").parseNetwork());
    EXPECT_EQ(messages(),
              "File ends too early (premature end of file). Should check for missing sections.\n"
              "1 syntax error detected in the file\n");
}

TEST_F(ParserSyntaxTest, BadDeviceAmongGoodSiblings) {
    const std::string first = "DEVICES: AND g1 2, AND g2 17, OR g3 2;";
    auto description = load(first + TAIL).parseFile();

    EXPECT_FALSE(description.has_value());
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(), "Number of inputs for an AND/NAND/OR/NOR device should be between 1 and 16.\n" +
                          located(1, first, 27));
}

TEST_F(ParserSyntaxTest, NameWithUppercaseLetter) {
    const std::string first = "DEVICES: XOR aBc;";
    load(first + TAIL).parseFile();

    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(),
              "Device name should be a lowercase alphanumeric string (including '_'). "
              "Specific character is not lowercase\n" + located(1, first, 15));
}

TEST_F(ParserSyntaxTest, NameWithStrayCharacter) {
    load(std::string("DEVICES: XOR a-b;") + TAIL).parseFile();
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_THAT(messages(), HasSubstr("Specific character is not a letter, digit or underscore"));
}

TEST_F(ParserSyntaxTest, NameStartingWithDigit) {
    load(std::string("DEVICES: XOR 1abc;") + TAIL).parseFile();
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_THAT(messages(), HasSubstr("First character is not a lowercase letter"));
}

TEST_F(ParserSyntaxTest, DevicePropertyErrors) {
    struct Case {
        const char* devices;
        const char* message;
        int column;
    };
    const Case cases[] = {
        {"DEVICES: SWITCH s1;", "The required number of parameters for a device of the type CLOCK/", 19},
        {"DEVICES: XOR;", "The required number of parameters for a device of the type XOR/DTYPE", 13},
        {"DEVICES: LATCH l1;", "1st parameter of a device should be the keyword", 10},
        {"DEVICES: SWITCH s1 2;", "Switch state should be either 0 or 1.", 20},
        {"DEVICES: CLOCK c1 0;", "Clock period/RC time constant should be a positive integer.", 19},
        {"DEVICES: RC r1 007;", "Clock period/RC time constant should be a positive integer.", 16},
        {"DEVICES: SIGGEN sg 0120;", "Siggen waveform should only consist of 0s and 1s.", 22},
        {"DEVICES: XOR x1 5;", "Devices should be separated by ',' and ended by ';'.", 17},
        {"DEVICES: ;", "There should be at least one device.", 10},
    };

    for (const Case& c : cases) {
        SCOPED_TRACE(c.devices);
        FakeCircuit circuit;
        TempFile file(std::string(c.devices) + TAIL);
        Scanner scanner(file.path(), circuit.names, std::make_unique<BufferSink>());
        Parser parser(circuit.names, circuit.devices, circuit.network, circuit.monitors, scanner);

        EXPECT_FALSE(parser.parseFile().has_value());
        EXPECT_EQ(parser.errorCount(), 1);
        EXPECT_THAT(scanner.getErrorMessages(), StartsWith(c.message));
        EXPECT_THAT(scanner.getErrorMessages(), HasSubstr(located(1, c.devices, c.column)));
    }
}

TEST_F(ParserSyntaxTest, OptionalCommaBeforeProperty) {
    auto description = load(std::string("DEVICES: CLOCK c1, 5, RC r1 20, SIGGEN sg, 0110;") + TAIL).parseFile();
    ASSERT_TRUE(description.has_value());
    EXPECT_EQ(description->items(Section::DEVICES).size(), 3u);
}

TEST_F(ParserSyntaxTest, ConnectionErrors) {
    struct Case {
        const char* connect;
        const char* message;
        int column;
    };
    const Case cases[] = {
        {"CONNECT: s1 > d1 DATA;", "3rd parameter of a connection must be a device name", 18},
        {"CONNECT: s1 d1.DATA;", "2nd parameter of a connection should be '>'.", 13},
        {"CONNECT: d1.DATA > s1.I1;", "Output pins can only be Q or QBAR.", 13},
        {"CONNECT: s1 > d1.Q;", "The input pin should be one of the following", 18},
        {"CONNECT: s1 > d1.DATA s1 > d1.CLK;", "Connections should be separated by ',' and ended by ';'.", 23},
    };

    for (const Case& c : cases) {
        SCOPED_TRACE(c.connect);
        FakeCircuit circuit;
        TempFile file(std::string("DEVICES: SWITCH s1 0, DTYPE d1;\n") + c.connect + "\nMONITOR: ;\nEND;");
        Scanner scanner(file.path(), circuit.names, std::make_unique<BufferSink>());
        Parser parser(circuit.names, circuit.devices, circuit.network, circuit.monitors, scanner);

        EXPECT_FALSE(parser.parseFile().has_value());
        EXPECT_EQ(parser.errorCount(), 1);
        EXPECT_THAT(scanner.getErrorMessages(), StartsWith(c.message));
        EXPECT_THAT(scanner.getErrorMessages(), HasSubstr(located(2, c.connect, c.column)));
    }
}

TEST_F(ParserSyntaxTest, MonitorSeparator) {
    const std::string monitor = "MONITOR: d1.Q d1.QBAR;";
    load("DEVICES: DTYPE d1;\nCONNECT: ;\n" + monitor + "\nEND;").parseFile();

    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_THAT(messages(), StartsWith("Monitors should be separated by ',' and ended by ';'."));
    EXPECT_THAT(messages(), HasSubstr(located(3, monitor, 15)));
}

TEST_F(ParserSyntaxTest, TrailingCommaBeforeNextSection) {
    const std::string first = "DEVICES: XOR x1,";
    load(first + TAIL).parseFile();

    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(),
              "Devices should be separated by ',' and ended by ';'. "
              "Should also check for excessive parameters of a device.\n" + located(1, first, 16));
}

TEST_F(ParserSyntaxTest, MisspelledSectionHeader) {
    const std::string source = "DEVICES: XOR x1;\nCONECT: ;\nMONITOR: ;\nEND;";
    auto description = load(source).parseFile();

    EXPECT_FALSE(description.has_value());
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(), "';' after the last device should be followed by keyword 'CONNECT'.\n" +
                          located(2, "CONECT: ;", 1));
}

TEST_F(ParserSyntaxTest, MissingColon) {
    load(std::string("DEVICES - XOR x1;") + TAIL).parseFile();
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(), "DEVICES, CONNECT and MONITOR should be followed by ':'.\n" +
                          located(1, "DEVICES - XOR x1;", 9));
}

TEST_F(ParserSyntaxTest, WrongEndKeyword) {
    load("DEVICES: XOR x1;\nCONNECT: ;\nMONITOR: ;\nFIN;").parseFile();
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(), "';' after the last monitor should be followed by keyword 'END'.\n" +
                          located(4, "FIN;", 1));
}

TEST_F(ParserSyntaxTest, EndWithoutSemicolon) {
    load("DEVICES: XOR x1;\nCONNECT: ;\nMONITOR: ;\nEND").parseFile();
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(), "'END' should be followed by ';'.\n" + located(4, "END", 1));
}

TEST_F(ParserSyntaxTest, EndFollowedByComma) {
    load("DEVICES: XOR x1;\nCONNECT: ;\nMONITOR: ;\nEND,").parseFile();
    EXPECT_EQ(parser_->errorCount(), 1);
    EXPECT_EQ(messages(), "'END' should be followed by ';'.\n" + located(4, "END,", 4));
}

TEST_F(ParserSyntaxTest, TokensAfterEndAreIgnored) {
    EXPECT_TRUE(load("DEVICES: XOR x1;\nCONNECT: ;\nMONITOR: ;\nEND; trailing words").parseFile().has_value());
}

TEST_F(ParserSyntaxTest, UnterminatedCommentIsReported) {
    const std::string first = "DEVICES: XOR x1; ! oops";
    EXPECT_FALSE(load(first + "\nCONNECT: ;").parseNetwork());

    EXPECT_EQ(parser_->errorCount(), 2);
    EXPECT_THAT(messages(), StartsWith("Comment opened with '!' is never closed.\n" + located(1, first, 18)));
    EXPECT_THAT(messages(), HasSubstr("File ends too early"));
    EXPECT_THAT(messages(), HasSubstr("2 syntax errors detected in the file\n"));
}

TEST_F(ParserSyntaxTest, IndependentErrorsAreAllReported) {
    EXPECT_FALSE(load(
        "DEVICES: SWITCH s1 3, DTYPE d1;\n"
        "CONNECT: s1 > d1.Q;\n"
        "MONITOR: d1.DATA;\n"
        "END;").parseNetwork());

    EXPECT_EQ(parser_->errorCount(), 3);
    EXPECT_THAT(messages(), HasSubstr("Switch state should be either 0 or 1."));
    EXPECT_THAT(messages(), HasSubstr("The input pin should be one of the following"));
    EXPECT_THAT(messages(), HasSubstr("Output pins can only be Q or QBAR."));
    EXPECT_THAT(messages(), HasSubstr("3 syntax errors detected in the file\n"));
}

TEST_F(ParserSyntaxTest, SyntaxErrorsSkipTheBuild) {
    EXPECT_FALSE(load(std::string("DEVICES: XOR x1, XOR X2;") + TAIL).parseNetwork());
    EXPECT_TRUE(circuit_.devices.findDevices(std::nullopt).empty());
}

TEST_F(ParserSyntaxTest, ParseFileTwiceThrows) {
    Parser& parser = load(std::string("DEVICES: XOR x1;") + TAIL);
    EXPECT_TRUE(parser.parseFile().has_value());
    EXPECT_THROW(parser.parseFile(), std::logic_error);
}
