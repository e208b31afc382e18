#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include <cstdlib>

using namespace Pushline;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("PUSHLINE_BATCH_SIZE");
        Configuration::getInstance().reset();
    }
};

TEST_F(ConfigurationTest, Defaults) {
    const auto& config = GetConfig().config();
    EXPECT_EQ(config.pipeline.queue_size.get(), 10u);
    EXPECT_EQ(config.pipeline.batch_size.get(), 1000u);
    EXPECT_DOUBLE_EQ(config.pipeline.batch_timeout.get(), 0.1);
    EXPECT_DOUBLE_EQ(config.pipeline.interrupt_interval.get(), 1.0);
    EXPECT_EQ(config.associate.retries.get(), 2);
    EXPECT_EQ(config.remote.rpm_upload_repo.get(), "all-rpm-content");
    EXPECT_TRUE(config.remote.shared_client.get());
    EXPECT_TRUE(GetConfig().validate());
}

TEST_F(ConfigurationTest, LoadFromString) {
    auto& configuration = Configuration::getInstance();
    ASSERT_TRUE(configuration.loadFromString(R"(
pushline:
  pipeline:
    queue_size: 4
    batch_timeout: 0.5
  associate:
    retries: 0
  remote:
    shared_client: false
  publish:
    clean: true
)"));
    const auto& config = configuration.config();
    EXPECT_EQ(config.pipeline.queue_size.get(), 4u);
    EXPECT_DOUBLE_EQ(config.pipeline.batch_timeout.get(), 0.5);
    EXPECT_EQ(config.associate.retries.get(), 0);
    EXPECT_FALSE(config.remote.shared_client.get());
    EXPECT_TRUE(config.publish.clean.get());
    // Untouched values keep their defaults
    EXPECT_EQ(config.pipeline.batch_size.get(), 1000u);
}

TEST_F(ConfigurationTest, InvalidValuesAreReported) {
    auto& configuration = Configuration::getInstance();
    EXPECT_FALSE(configuration.loadFromString(R"(
pushline:
  pipeline:
    queue_size: 0
    batch_timeout: 5
    batch_max_timeout: 1
)"));
    auto errors = configuration.getValidationErrors();
    EXPECT_EQ(errors.size(), 2u);
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(Configuration::getInstance().loadFromString("pushline: [unterminated"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    auto& configuration = Configuration::getInstance();
    ASSERT_TRUE(configuration.loadFromString("pushline:\n  pipeline:\n    batch_size: 50\n"));
    EXPECT_EQ(configuration.config().pipeline.batch_size.get(), 50u);

    setenv("PUSHLINE_BATCH_SIZE", "7", 1);
    EXPECT_EQ(configuration.config().pipeline.batch_size.get(), 7u);
}
