#include "logger.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace facewatch;
using facewatch::testutil::TempDir;

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("Error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("chatty"), LogLevel::INFO);
}

TEST(LoggerTest, AuditRecordsGoToLogFile) {
    TempDir dir;
    auto& logger = Logger::getInstance();
    const LogLevel previous = logger.getLogLevel();

    logger.setLogLevel(LogLevel::INFO);
    logger.setLogFile(dir.file("facewatch.log"));
    logger.debug("hidden below level");
    logger.auditNotification("alice", 0.875, true);
    logger.auditReload("/var/lib/facewatch/classifiers", 2, false);
    logger.setConsoleOutput(true);
    logger.setLogLevel(previous);

    std::ifstream file(dir.file("facewatch.log"));
    std::stringstream content;
    content << file.rdbuf();
    const std::string text = content.str();

    EXPECT_EQ(text.find("hidden below level"), std::string::npos);
    EXPECT_NE(text.find("[INFO]"), std::string::npos);
    EXPECT_NE(text.find("NOTIFY name=alice confidence=0.875 snapshot=yes"), std::string::npos);
    EXPECT_NE(text.find("[WARNING]"), std::string::npos);
    EXPECT_NE(text.find("RELOAD dir=/var/lib/facewatch/classifiers classifiers=2 result=failed"),
              std::string::npos);
}
