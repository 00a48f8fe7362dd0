#include <gtest/gtest.h>
#include "config_loader.hpp"
#include <map>

using namespace streamguard;

static EnvReader env_of(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

TEST(ServerConfigTest, DefaultValues) {
    ServerConfig config;
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8001);
    EXPECT_FALSE(config.enable_tls);
    EXPECT_EQ(config.default_stream_mode, "direct");
    EXPECT_EQ(config.video_info_ttl_sec, 900);
    EXPECT_EQ(config.stream_url_ttl_sec, 300);
    EXPECT_NO_THROW(validate(config));
}

TEST(ConfigLoaderTest, SplitCsv) {
    EXPECT_EQ(split_csv("a, b,,c "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(split_csv("").empty());
    EXPECT_TRUE(split_csv(" , ").empty());
}

TEST(ConfigLoaderTest, ParseBool) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool(" YES "), true);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(ConfigLoaderTest, ParseInt) {
    EXPECT_EQ(parse_int("42"), 42);
    EXPECT_EQ(parse_int("-7"), -7);
    EXPECT_FALSE(parse_int("42abc").has_value());
    EXPECT_FALSE(parse_int("").has_value());
}

TEST(ConfigLoaderTest, AppliesOverrides) {
    ServerConfig config;
    apply_env(config, env_of({
        {"STREAMGUARD_PORT", "9000"},
        {"PROXY_COUNTRIES", "cn, ru"},
        {"ALLOWED_PLATFORMS", "YouTube,Vimeo"},
        {"MAX_QUERY_LENGTH", "512"},
        {"IP_BLOCKLIST", "10.0.0.0/24, 192.168.1.7"},
        {"ENABLE_IP_CONTROL", "true"},
        {"ENABLE_HSTS", "false"},
        {"EXPOSE_DETAILED_ERRORS", "1"},
    }));

    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.proxy_countries, (std::vector<std::string>{"CN", "RU"}));
    EXPECT_EQ(config.security.allowed_platforms, (std::vector<std::string>{"youtube", "vimeo"}));
    EXPECT_EQ(config.security.max_query_length, 512);
    EXPECT_EQ(config.security.ip_blocklist.size(), 2u);
    EXPECT_TRUE(config.security.enable_ip_control);
    EXPECT_FALSE(config.security.enable_hsts);
    EXPECT_TRUE(config.security.expose_detailed_errors);
    EXPECT_NO_THROW(validate(config));
}

TEST(ConfigLoaderTest, UnparsableValuesAreCollected) {
    ServerConfig config;
    try {
        apply_env(config, env_of({
            {"STREAMGUARD_PORT", "eighty"},
            {"ENABLE_HSTS", "sometimes"},
            {"STREAMGUARD_THREADS", "4"},
        }));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        ASSERT_EQ(e.violations().size(), 2u);
        EXPECT_EQ(e.violations()[0].rfind("STREAMGUARD_PORT", 0), 0u);
        EXPECT_EQ(e.violations()[1].rfind("ENABLE_HSTS", 0), 0u);
    }
}

TEST(ConfigLoaderTest, PortOutOfRange) {
    ServerConfig config;
    EXPECT_THROW(apply_env(config, env_of({{"PORT", "70000"}})), ConfigError);
    EXPECT_THROW(apply_env(config, env_of({{"PORT", "-1"}})), ConfigError);
}

TEST(ConfigLoaderTest, ValidateRejectsBadServerSettings) {
    ServerConfig config;
    config.default_stream_mode = "teleport";
    config.proxy_countries = {"CHN"};
    config.security.hsts_max_age = 60;
    try {
        validate(config);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.violations().size(), 3u);
    }
}

TEST(ConfigLoaderTest, TlsRequiresCertificatePaths) {
    ServerConfig config;
    config.enable_tls = true;
    config.cert_path.clear();
    EXPECT_THROW(validate(config), ConfigError);
}
