#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Application.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace inviscan {

class ApplicationTest : public ::testing::Test {
protected:
    std::string temp_dir;
    std::ostringstream out;

    void SetUp() override {
        char template_path[] = "/tmp/inviscan_app_XXXXXX";
        char* made = mkdtemp(template_path);
        ASSERT_NE(made, nullptr);
        temp_dir = made;
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    std::string create_file(const std::string& rel, const std::string& content) {
        fs::path p = fs::path(temp_dir) / rel;
        fs::create_directories(p.parent_path());
        std::ofstream file(p, std::ios::binary);
        EXPECT_TRUE(file.is_open());
        file << content;
        return p.string();
    }

    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "inviscan");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        out.str("");
        Application app(out);
        ::testing::internal::CaptureStderr();
        int rc = app.run(static_cast<int>(argv.size()), argv.data());
        log_output = ::testing::internal::GetCapturedStderr();
        return rc;
    }

    std::string log_output;
};

TEST_F(ApplicationTest, CleanTreeExitsZero) {
    create_file("src/main.rs", "fn main() {}\n");
    EXPECT_EQ(run({temp_dir + "/**/*.rs"}), 0);
    EXPECT_THAT(out.str(), ::testing::StartsWith("No suspicious invisible characters detected."));
}

TEST_F(ApplicationTest, NoBreakSpaceIsThreat) {
    create_file("src/a.js", "let\xC2\xA0x = 5;\n");
    EXPECT_EQ(run({temp_dir + "/**/*.js"}), 1);
    EXPECT_THAT(out.str(), ::testing::HasSubstr("NO-BREAK SPACE (U+00A0)"));
}

TEST_F(ApplicationTest, RightToLeftOverrideIsThreatInJson) {
    create_file("b.py", "s = \"\xE2\x80\xAE" "cba\"\n");
    EXPECT_EQ(run({temp_dir + "/*.py", "--json"}), 1);
    nlohmann::json parsed = nlohmann::json::parse(out.str());
    EXPECT_EQ(parsed["verdict"], "threat");
    EXPECT_EQ(parsed["total_findings"], 1);
    EXPECT_EQ(parsed["findings_by_category"]["BidiControl"], 1);
}

TEST_F(ApplicationTest, UndecodableFileIsSkippedWithoutFailOnSkip) {
    create_file("ok.txt", "hello\n");
    create_file("latin1.txt", "caf\xE9\n");
    EXPECT_EQ(run({temp_dir + "/*.txt", "--json"}), 0);
    nlohmann::json parsed = nlohmann::json::parse(out.str());
    ASSERT_EQ(parsed["skipped_files"].size(), 1u);
    EXPECT_EQ(parsed["verdict"], "clean");
}

TEST_F(ApplicationTest, UndecodableFileWithFailOnSkipExitsTwo) {
    create_file("ok.txt", "hello\n");
    create_file("latin1.txt", "caf\xE9\n");
    EXPECT_EQ(run({temp_dir + "/*.txt", "--fail-on-skip"}), 2);
    EXPECT_THAT(out.str(), ::testing::HasSubstr("Verdict: operational_error"));
}

TEST_F(ApplicationTest, ThreatAlongsideSkipWithoutFailOnSkip) {
    create_file("a.txt", "\xE2\x80\x8B");
    create_file("b.txt", "\xFF");
    EXPECT_EQ(run({temp_dir + "/*.txt"}), 1);
}

TEST_F(ApplicationTest, FailFastDoesNotChangeFailOnSkipVerdict) {
    create_file("a.txt", "\xE2\x80\x8B");
    create_file("b.txt", "\xFF\xFE");
    EXPECT_EQ(run({temp_dir + "/*.txt", "--fail-on-skip"}), 2);
    EXPECT_EQ(run({temp_dir + "/*.txt", "--fail-on-skip", "--fail-fast"}), 2);
    EXPECT_EQ(run({temp_dir + "/*.txt", "--fail-fast"}), 1);
}

TEST_F(ApplicationTest, NoMatchingFilesExitsTwo) {
    create_file("a.rs", "x");
    EXPECT_EQ(run({temp_dir + "/**/*.go"}), 2);
    EXPECT_THAT(log_output, ::testing::HasSubstr("No files matched"));
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ApplicationTest, MalformedPatternExitsTwo) {
    EXPECT_EQ(run({temp_dir + "/[abc.rs"}), 2);
    EXPECT_THAT(log_output, ::testing::HasSubstr("unterminated character class"));
}

TEST_F(ApplicationTest, ErrorMessagesEscapeInvisibleCharacters) {
    EXPECT_EQ(run({temp_dir + "/\xE2\x80\xAE" "sj.*"}), 2);
    EXPECT_THAT(log_output, ::testing::HasSubstr("[U+202E]sj.*"));
    EXPECT_EQ(log_output.find("\xE2\x80\xAE"), std::string::npos);

    create_file("a.js", "x");
    EXPECT_EQ(run({temp_dir + "/a.js", "--output", temp_dir + "/no\xE2\x80\x8B" "dir/out.txt"}), 2);
    EXPECT_THAT(log_output, ::testing::HasSubstr("no[U+200B]dir/out.txt"));
    EXPECT_EQ(log_output.find("\xE2\x80\x8B"), std::string::npos);
}

TEST_F(ApplicationTest, UsageErrorsExitTwo) {
    create_file("a.rs", "x");
    EXPECT_EQ(run({temp_dir + "/a.rs", "--nope"}), 2);
    EXPECT_EQ(run({temp_dir + "/a.rs", "--json", "--sarif"}), 2);
}

TEST_F(ApplicationTest, AllMatchesExcludedIsClean) {
    create_file("node_modules/pkg/index.js", "\xE2\x80\xAE");
    EXPECT_EQ(run({temp_dir + "/node_modules/pkg/index.js", "--json"}), 0);
    nlohmann::json parsed = nlohmann::json::parse(out.str());
    EXPECT_EQ(parsed["total_files_scanned"], 0);
}

TEST_F(ApplicationTest, ScanBundlesReachesDist) {
    create_file("dist/extension.js", "\xE2\x80\x8B");
    EXPECT_EQ(run({temp_dir + "/dist/extension.js"}), 0);
    EXPECT_EQ(run({temp_dir + "/**/*.js", "--scan-bundles"}), 1);
    // dist/ is pruned from the walk, so nothing matches at all
    EXPECT_EQ(run({temp_dir + "/**/*.js"}), 2);
}

TEST_F(ApplicationTest, WritesOutputFile) {
    create_file("a.js", "\xE2\x80\x8B");
    std::string report_path = temp_dir + "/report.sarif";
    EXPECT_EQ(run({temp_dir + "/*.js", "--sarif", "--output", report_path}), 1);
    EXPECT_TRUE(out.str().empty());
    std::ifstream in(report_path);
    nlohmann::json parsed = nlohmann::json::parse(in);
    EXPECT_EQ(parsed["version"], "2.1.0");
    EXPECT_EQ(parsed["runs"][0]["results"].size(), 1u);
}

TEST_F(ApplicationTest, UnwritableOutputFileExitsTwo) {
    create_file("a.js", "x");
    EXPECT_EQ(run({temp_dir + "/*.js", "--output", temp_dir + "/missing/dir/report.txt"}), 2);
}

TEST_F(ApplicationTest, ParallelMatchesSequential) {
    for (int i = 0; i < 12; ++i) {
        create_file("f" + std::to_string(i) + ".txt", (i % 4 == 0) ? "a\xE2\x80\x8D" "b" : "plain");
    }
    EXPECT_EQ(run({temp_dir + "/*.txt", "--json", "--compact"}), 1);
    std::string sequential = out.str();
    EXPECT_EQ(run({temp_dir + "/*.txt", "--json", "--compact", "--parallel-threads", "4"}), 1);
    EXPECT_EQ(out.str(), sequential);
}

} // namespace inviscan

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
