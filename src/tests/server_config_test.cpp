#include <gtest/gtest.h>
#include <limits>
#include "config/server_config.hpp"
#include "logger/logger.hpp"

using ftecho::config::ServerConfig;

TEST(ServerConfigTest, DefaultsAreValid) {
  ServerConfig config;
  EXPECT_EQ(config.address, "0.0.0.0");
  EXPECT_EQ(config.port, 9000);
  EXPECT_EQ(config.chunk_size, 4096u);
  EXPECT_EQ(config.max_frame_length, 16u * 1024 * 1024);
  EXPECT_EQ(config.idle_timeout.count(), 300);
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, EphemeralPortNeedsOptIn) {
  ServerConfig config;
  config.port = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
  EXPECT_NO_THROW(config.validate(true));
}

TEST(ServerConfigTest, RejectsBadSettings) {
  {
    ServerConfig config;
    config.address.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);
  }
  {
    ServerConfig config;
    config.storage_root.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);
  }
  {
    ServerConfig config;
    config.chunk_size = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
  }
  {
    ServerConfig config;
    config.max_frame_length = 1024;
    config.chunk_size = 1024;
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.chunk_size = 1023;
    EXPECT_NO_THROW(config.validate());
  }
  {
    ServerConfig config;
    config.idle_timeout = std::chrono::seconds(-1);
    EXPECT_THROW(config.validate(), std::invalid_argument);
  }
}

TEST(ServerConfigTest, ParseSeverity) {
  boost::log::trivial::severity_level level = boost::log::trivial::info;
  EXPECT_TRUE(ftecho::logging::parse_severity("debug", level));
  EXPECT_EQ(level, boost::log::trivial::debug);
  EXPECT_TRUE(ftecho::logging::parse_severity("error", level));
  EXPECT_EQ(level, boost::log::trivial::error);
  EXPECT_FALSE(ftecho::logging::parse_severity("loud", level));
  EXPECT_EQ(level, boost::log::trivial::error);
}

TEST(ServerConfigTest, ParseUnsignedAcceptsDigitsWithinRange) {
  using ftecho::config::parse_unsigned;
  EXPECT_EQ(parse_unsigned("0", 10, "-p"), 0u);
  EXPECT_EQ(parse_unsigned("65535", 65535, "-p"), 65535u);
  EXPECT_EQ(parse_unsigned("4294967295", std::numeric_limits<uint32_t>::max(), "-m"), 4294967295u);
  EXPECT_EQ(parse_unsigned("18446744073709551615", std::numeric_limits<uint64_t>::max(), "offset"),
            std::numeric_limits<uint64_t>::max());
}

TEST(ServerConfigTest, ParseUnsignedRejectsValuesThatWouldWrap) {
  using ftecho::config::parse_unsigned;
  // 2^32 + 8192 must not become 8192
  EXPECT_THROW(parse_unsigned("4294975488", std::numeric_limits<uint32_t>::max(), "-m"), std::invalid_argument);
  EXPECT_THROW(parse_unsigned("65536", 65535, "-p"), std::invalid_argument);
  EXPECT_THROW(parse_unsigned("18446744073709551616", std::numeric_limits<uint64_t>::max(), "offset"),
               std::invalid_argument);
}

TEST(ServerConfigTest, ParseUnsignedRejectsSignsAndJunk) {
  using ftecho::config::parse_unsigned;
  const std::string rejected[] = {"", "-5", "+5", " 5", "5 ", "0x10", "1e3", "12abc"};
  for (const auto& text : rejected) {
    SCOPED_TRACE(text);
    EXPECT_THROW(parse_unsigned(text, std::numeric_limits<uint64_t>::max(), "offset"), std::invalid_argument);
  }
}
