#include <gtest/gtest.h>
#include "service_logger.hpp"
#include <regex>
#include <sstream>

using namespace streamguard;

class ServiceLoggerTest : public ::testing::Test {
protected:
    void SetUp() override { ServiceLogger::set_streams(out, err); }
    void TearDown() override { ServiceLogger::reset_streams(); }

    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(ServiceLoggerTest, LineFormat) {
    ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::STARTUP, "internal", "listening on 0.0.0.0:8001");

    std::string line = out.str();
    EXPECT_TRUE(std::regex_match(line, std::regex(
        R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} UTC\] \[INFO\] \[STARTUP\] ip=internal msg="listening on 0\.0\.0\.0:8001"\n)")))
        << line;
    EXPECT_TRUE(err.str().empty());
}

TEST_F(ServiceLoggerTest, ErrorsGoToErrorStream) {
    ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::CACHE, "internal", "cache read failed");
    ServiceLogger::log(ServiceLogger::Level::ERROR, ServiceLogger::Event::SERVER_ERROR, "203.0.113.7", "status=500");
    ServiceLogger::log(ServiceLogger::Level::CRITICAL, ServiceLogger::Event::PANIC_RECOVERED, "203.0.113.7");

    EXPECT_NE(out.str().find("[WARN] [CACHE]"), std::string::npos);
    EXPECT_NE(err.str().find("[ERROR] [SERVER_ERROR] ip=203.0.113.7"), std::string::npos);
    EXPECT_NE(err.str().find("[CRIT] [PANIC] ip=203.0.113.7\n"), std::string::npos);
}

TEST_F(ServiceLoggerTest, MessageCannotForgeLines) {
    ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::REQUEST, "1.2.3.4\n[CRIT]",
                       "Malicious \" quote and \n newline\r\x01 end");

    std::string line = out.str();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.find('\n'), line.size() - 1);
    EXPECT_EQ(line.find('\x01'), std::string::npos);
    EXPECT_NE(line.find("msg=\"Malicious   quote and   newline  end\""), std::string::npos) << line;
}

TEST(ServiceLoggerSanitizeTest, StripsNonPrintable) {
    EXPECT_EQ(ServiceLogger::sanitize_log_message("a\\b\"c"), "a b c");
    EXPECT_EQ(ServiceLogger::sanitize_log_message(std::string("x\0y\x7f", 4)), "xy");
    EXPECT_EQ(ServiceLogger::sanitize_log_message("plain text"), "plain text");
}

TEST(ServiceLoggerSanitizeTest, EmptyAddressIsUnknown) {
    std::ostringstream out, err;
    ServiceLogger::set_streams(out, err);
    ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::CONNECTION, "");
    ServiceLogger::reset_streams();
    EXPECT_NE(out.str().find("ip=unknown"), std::string::npos);
}
