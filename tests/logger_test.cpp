#include "logger.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryEndpoint> sink = std::make_shared<MemoryEndpoint>();
    std::shared_ptr<Logger> logger = std::make_shared<Logger>("tests");

    void SetUp() override {
        logger->addEndpoint(sink);
        // Only explicit flushes reach the sink
        logger->setFlushTimeInterval(std::chrono::hours(1));
    }
};

} // namespace

TEST_F(LoggerTest, BuffersUntilFlush) {
    logger->info("first");
    logger->warn("second");
    EXPECT_TRUE(sink->getMessages().empty());

    logger->flush();
    auto messages = sink->getMessages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_NE(messages[0].find(" - tests - [INFO] first"), std::string::npos);
    EXPECT_NE(messages[1].find(" - tests - [WARN] second"), std::string::npos);
    EXPECT_EQ(sink->getFlushCount(), 1u);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    logger->setLevel(Logger::LogLevel::WARN);
    logger->info("hidden");
    logger->log("hidden too");
    logger->warn("shown");
    logger->error("also shown");
    logger->flush();

    auto messages = sink->getMessages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_NE(messages[0].find("[WARN] shown"), std::string::npos);
    EXPECT_NE(messages[1].find("[ERROR] also shown"), std::string::npos);
    EXPECT_EQ(logger->getLevel(), 2);
}

TEST_F(LoggerTest, FormatsArguments) {
    logger->info("cached {} of {}", 3, "keys");
    logger->flush();

    auto messages = sink->getMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_NE(messages[0].find("cached 3 of keys"), std::string::npos);
}

TEST_F(LoggerTest, CustomFormat) {
    logger->setFormat("{1}|{2}|{3}\n");
    logger->error("boom");
    logger->flush();

    auto messages = sink->getMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "tests|ERROR|boom\n");
}

TEST_F(LoggerTest, FlushesWhenByteLimitReached) {
    logger->setFlushByteLimit(1);
    logger->info("immediate");

    EXPECT_EQ(sink->getMessages().size(), 1u);
}

TEST_F(LoggerTest, FlushesOnDestruction) {
    logger->info("pending");
    logger.reset();

    EXPECT_EQ(sink->getMessages().size(), 1u);
}

TEST_F(LoggerTest, RejectsNullEndpoint) {
    EXPECT_THROW(logger->addEndpoint(nullptr), std::invalid_argument);
}

TEST_F(LoggerTest, ReportsObjectType) {
    EXPECT_EQ(logger->getType(), "Logger");
}

TEST(FileEndpoint, AppendsToFile) {
    const std::string path = ::testing::TempDir() + "patternkit_logger_test.log";
    std::remove(path.c_str());
    {
        Logger logger("file");
        logger.addEndpoint(std::make_shared<FileEndpoint>(path));
        logger.setFormat("{3}\n");
        logger.info("line one");
        logger.info("line two");
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "line one\nline two\n");
    std::remove(path.c_str());
}

TEST(FileEndpoint, ThrowsWhenPathCannotBeOpened) {
    EXPECT_THROW(FileEndpoint("/nonexistent-dir/for/sure/log.txt"), std::runtime_error);
}
