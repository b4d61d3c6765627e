#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <cstdlib>

using namespace Tollgate;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().resetToDefaults();
    }

    void TearDown() override {
        unsetenv("TOLLGATE_LOCK_MAX_RETRIES");
        unsetenv("TOLLGATE_RETRY_EXPONENTIAL");
        Configuration::getInstance().resetToDefaults();
    }
};

TEST_F(ConfigurationTest, DefaultsMatchDocumentedValues) {
    const TollgateConfig& config = GetConfig();

    EXPECT_EQ(config.store.backend.get(), "memory");
    EXPECT_EQ(config.signature.tolerance_seconds.get(), 300);
    EXPECT_EQ(config.idempotency.ttl_seconds.get(), 86400);
    EXPECT_EQ(config.idempotency.store_failure_policy.get(), "treat_as_new");
    EXPECT_EQ(config.lock.default_ttl_seconds.get(), 30);
    EXPECT_EQ(config.lock.retry_delay_ms.get(), 50);
    EXPECT_EQ(config.lock.max_retries.get(), 20);
    EXPECT_EQ(config.rate_limit.token_bucket_ttl_seconds.get(), 3600);
    EXPECT_EQ(config.resilience.max_attempts.get(), 3);
    EXPECT_EQ(config.resilience.failure_threshold.get(), 5);
    EXPECT_EQ(config.resilience.open_timeout_ms.get(), 60000);
    EXPECT_EQ(config.resilience.max_parallel.get(), 5);
    EXPECT_TRUE(config.resilience.continue_on_error.get());
    EXPECT_TRUE(Configuration::getInstance().validate());
}

TEST_F(ConfigurationTest, LoadFromStringOverridesSections) {
    const std::string yaml = R"(
tollgate:
  store:
    backend: "remote"
    address: "store.internal:50061"
  signature:
    tolerance_seconds: 120
  idempotency:
    store_failure_policy: "treat_as_duplicate"
  lock:
    max_retries: 3
  resilience:
    exponential_backoff: false
    max_parallel: 2
)";

    ASSERT_TRUE(Configuration::getInstance().loadFromString(yaml));
    const TollgateConfig& config = GetConfig();

    EXPECT_EQ(config.store.backend.get(), "remote");
    EXPECT_EQ(config.store.address.get(), "store.internal:50061");
    EXPECT_EQ(config.signature.tolerance_seconds.get(), 120);
    EXPECT_EQ(config.idempotency.store_failure_policy.get(), "treat_as_duplicate");
    EXPECT_EQ(config.lock.max_retries.get(), 3);
    EXPECT_FALSE(config.resilience.exponential_backoff.get());
    EXPECT_EQ(config.resilience.max_parallel.get(), 2);
    // Untouched values keep their defaults
    EXPECT_EQ(config.lock.retry_delay_ms.get(), 50);
}

TEST_F(ConfigurationTest, InvalidValuesFailValidation) {
    const std::string yaml = R"(
tollgate:
  store:
    backend: "postgres"
  idempotency:
    store_failure_policy: "ignore"
  resilience:
    max_attempts: 0
)";

    EXPECT_FALSE(Configuration::getInstance().loadFromString(yaml));
    auto errors = Configuration::getInstance().getValidationErrors();
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(Configuration::getInstance().loadFromString("tollgate: [unclosed"));
}

TEST_F(ConfigurationTest, MissingRootSectionKeepsDefaults) {
    EXPECT_TRUE(Configuration::getInstance().loadFromString("other:\n  key: 1\n"));
    EXPECT_EQ(GetConfig().lock.max_retries.get(), 20);
}

TEST_F(ConfigurationTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(Configuration::getInstance().loadFromString("tollgate:\n  lock:\n    max_retries: 7\n"));
    EXPECT_EQ(GetConfig().lock.max_retries.get(), 7);

    setenv("TOLLGATE_LOCK_MAX_RETRIES", "2", 1);
    setenv("TOLLGATE_RETRY_EXPONENTIAL", "off", 1);
    EXPECT_EQ(GetConfig().lock.max_retries.get(), 2);
    EXPECT_FALSE(GetConfig().resilience.exponential_backoff.get());
}

TEST_F(ConfigurationTest, UnparsableEnvironmentValueIsIgnored) {
    setenv("TOLLGATE_LOCK_MAX_RETRIES", "many", 1);
    EXPECT_EQ(GetConfig().lock.max_retries.get(), 20);
}
