#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Logging.h"
#include <thread>
#include <vector>

namespace inviscan {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
    }

    // Runs fn with stderr captured and returns what was written.
    template <typename Fn>
    std::string capture(Fn fn) {
        ::testing::internal::CaptureStderr();
        fn();
        return ::testing::internal::GetCapturedStderr();
    }
};

TEST_F(LoggingTest, SingletonInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, SetLogLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);
}

TEST_F(LoggingTest, LogLevelEnumValues) {
    EXPECT_EQ(static_cast<int>(LogLevel::Error), 0);
    EXPECT_EQ(static_cast<int>(LogLevel::Warn), 1);
    EXPECT_EQ(static_cast<int>(LogLevel::Info), 2);
    EXPECT_EQ(static_cast<int>(LogLevel::Debug), 3);
    EXPECT_EQ(static_cast<int>(LogLevel::Trace), 4);
}

TEST_F(LoggingTest, PrefixesGoToStderr) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);
    std::string out = capture([&]{
        logger.error("e");
        logger.warn("w");
        logger.info("i");
        logger.debug("d");
        logger.trace("t");
    });
    EXPECT_EQ(out, "[ERROR] e\n[WARN] w\n[INFO] i\n[DEBUG] d\n[TRACE] t\n");
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Warn);
    std::string out = capture([&]{
        logger.error("kept");
        logger.warn("kept too");
        logger.info("dropped");
        logger.debug("dropped");
    });
    EXPECT_THAT(out, ::testing::HasSubstr("kept too"));
    EXPECT_THAT(out, ::testing::Not(::testing::HasSubstr("dropped")));
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("WARNING", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("Trace", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
    EXPECT_FALSE(parse_log_level("verbose", lvl));
    EXPECT_FALSE(parse_log_level("", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
}

TEST_F(LoggingTest, ThreadSafety) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Error);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&logger, i]() {
            for (int j = 0; j < 100; ++j) {
                logger.info("thread " + std::to_string(i) + " log " + std::to_string(j));
                logger.set_level((j % 2) ? LogLevel::Error : LogLevel::Warn);
            }
        });
    }
    for (auto& t : threads) t.join();

    LogLevel current = logger.level();
    EXPECT_TRUE(current == LogLevel::Error || current == LogLevel::Warn);
}

} // namespace inviscan

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
