#include <gtest/gtest.h>
#include "metrics.hpp"

using namespace streamguard;

TEST(MetricsTest, Counter) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    reg.increment_counter("test_counter", 1.0);
    reg.increment_counter("test_counter", 2.5);
    EXPECT_EQ(reg.get_counter("test_counter"), 3.5);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("test_counter 3.5"), std::string::npos);
    EXPECT_NE(prometheus.find("# TYPE test_counter counter"), std::string::npos);
}

TEST(MetricsTest, Gauge) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.set_gauge("test_gauge", 42.0);
    EXPECT_EQ(reg.get_gauge("test_gauge"), 42.0);

    reg.set_gauge("test_gauge", 40.0);
    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("test_gauge 40"), std::string::npos);
    EXPECT_NE(prometheus.find("# TYPE test_gauge gauge"), std::string::npos);

    reg.increment_gauge("test_gauge");
    reg.increment_gauge("test_gauge", 2.0);
    reg.decrement_gauge("test_gauge");
    EXPECT_EQ(reg.get_gauge("test_gauge"), 42.0);
}

TEST(MetricsTest, UnknownNamesReadZero) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    EXPECT_EQ(reg.get_counter(metric::kPanicsRecovered), 0.0);
    EXPECT_EQ(reg.get_gauge("never_set"), 0.0);
    EXPECT_TRUE(reg.collect_prometheus().empty());
}

TEST(MetricsTest, SecurityCounterNamesArePrefixed) {
    const char* names[] = {
        metric::kRequestsTotal, metric::kAccessDenied, metric::kSizeLimitExceeded,
        metric::kValidationFailures, metric::kSanitizationRejected, metric::kSuspiciousActivity,
        metric::kPanicsRecovered, metric::kCacheHits, metric::kCacheMisses, metric::kCacheErrors,
        metric::kRequestsCancelled,
    };
    for (const char* name : names) {
        std::string n(name);
        EXPECT_EQ(n.rfind("streamguard_", 0), 0u) << n;
        EXPECT_EQ(n.substr(n.size() - 6), "_total") << n;
    }
}
