#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/TextWriter.h"
#include "../src/scanners/InvisibleCharScanner.h"

namespace inviscan {

class TextWriterTest : public ::testing::Test {
protected:
    Config config;
    TextWriter writer;
    InvisibleCharScanner scanner;
};

TEST_F(TextWriterTest, CleanReport) {
    std::vector<ScanResult> results;
    results.push_back(scanner.scan("a.rs", "fn main() {}\n"));
    Report report = Report::aggregate(std::move(results), false);
    EXPECT_EQ(writer.write(report, config),
              "No suspicious invisible characters detected.\n\nScanned 1 file(s)\nVerdict: clean\n");
}

TEST_F(TextWriterTest, SingleFinding) {
    std::vector<ScanResult> results;
    results.push_back(scanner.scan("src/a.js", "let\xC2\xA0x = 5;\n"));
    Report report = Report::aggregate(std::move(results), false);
    EXPECT_EQ(writer.write(report, config),
              "Found 1 suspicious character(s) in 1 file(s):\n\n"
              "src/a.js\n"
              "    Line 1:4 (byte 3) - NO-BREAK SPACE (U+00A0) [ConfusableWhitespace, low]\n"
              "      Non-ASCII whitespace; may bypass naive filters\n"
              "      context: let[U+00A0]x = 5;\n"
              "\n"
              "\nScanned 1 file(s); by category: ConfusableWhitespace=1\n"
              "Verdict: threat\n");
}

TEST_F(TextWriterTest, SkippedFilesListed) {
    std::vector<ScanResult> results;
    results.push_back(scanner.scan("ok.txt", "fine"));
    results.push_back(scanner.scan("bad.txt", "\xC3"));
    config.fail_on_skip = true;
    Report report = Report::aggregate(std::move(results), true);
    std::string out = writer.write(report, config);
    EXPECT_THAT(out, ::testing::HasSubstr("Skipped 1 file(s) (--fail-on-skip enabled):\n"));
    EXPECT_THAT(out, ::testing::HasSubstr("    bad.txt: invalid UTF-8 sequence at byte offset 0\n"));
    EXPECT_THAT(out, ::testing::EndsWith("Verdict: operational_error\n"));
}

TEST_F(TextWriterTest, FilePathIsMadeVisible) {
    std::vector<ScanResult> results;
    results.push_back(scanner.scan("evil\xE2\x80\xAE" "txt.js", "\xE2\x80\x8B"));
    Report report = Report::aggregate(std::move(results), false);
    std::string out = writer.write(report, config);
    EXPECT_THAT(out, ::testing::HasSubstr("evil[U+202E]txt.js\n"));
    EXPECT_EQ(out.find("\xE2\x80\xAE"), std::string::npos);
    EXPECT_EQ(out.find("\xE2\x80\x8B"), std::string::npos);
}

} // namespace inviscan

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
