/**
 * @file test_client_types.cpp
 * @brief Unit tests for client configuration and API routes
 */

#include <gtest/gtest.h>

#include <cavesync/remote_project/client/client_types.h>

#include <cstdlib>

namespace cavesync::remote_project::test {

class ClientConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        ::unsetenv("CAVESYNC_ARCHIVE_ROOT");
        ::unsetenv("CAVESYNC_INSTANCE");
        ::unsetenv("CAVESYNC_LOG_LEVEL");
    }

    static void expect_invalid(const client_config& config) {
        auto r = config.validate();
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, error_code::invalid_configuration);
    }
};

TEST_F(ClientConfigTest, DefaultsAreValid) {
    client_config config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.archive_extension, "tml");
    EXPECT_EQ(config.request_timeout, std::chrono::milliseconds(60000));
    EXPECT_EQ(config.download_timeout, std::chrono::milliseconds(120000));
    EXPECT_EQ(config.lock_lease, std::chrono::minutes(30));
    EXPECT_EQ(config.retry.max_attempts, 3u);
    EXPECT_EQ(config.archive_root.filename(), ".ariane");
}

TEST_F(ClientConfigTest, RejectsBadFields) {
    client_config config;

    config.archive_root.clear();
    expect_invalid(config);

    config = client_config{};
    config.archive_extension = ".tml";
    expect_invalid(config);
    config.archive_extension = "a/b";
    expect_invalid(config);

    config = client_config{};
    config.request_timeout = std::chrono::milliseconds(0);
    expect_invalid(config);

    config = client_config{};
    config.lock_lease = std::chrono::seconds(-1);
    expect_invalid(config);

    config = client_config{};
    config.retry.max_attempts = 0;
    expect_invalid(config);

    config = client_config{};
    config.retry.base_delay = std::chrono::milliseconds(5000);
    config.retry.max_delay = std::chrono::milliseconds(1000);
    expect_invalid(config);
}

TEST_F(ClientConfigTest, EnvironmentOverlay) {
    ::setenv("CAVESYNC_ARCHIVE_ROOT", "/tmp/caves", 1);
    ::setenv("CAVESYNC_INSTANCE", "speleo.example.org", 1);
    ::setenv("CAVESYNC_LOG_LEVEL", "Debug", 1);

    auto config = client_config::from_environment();
    EXPECT_EQ(config.archive_root, std::filesystem::path("/tmp/caves"));
    EXPECT_EQ(config.default_instance, "speleo.example.org");
    EXPECT_EQ(config.min_log_level, log_level::debug);
}

TEST_F(ClientConfigTest, UnknownLogLevelKeepsDefault) {
    ::setenv("CAVESYNC_LOG_LEVEL", "chatty", 1);
    auto config = client_config::from_environment();
    EXPECT_EQ(config.min_log_level, log_level::info);
    EXPECT_FALSE(config.default_instance.has_value());
}

TEST(ApiRoutesTest, ProjectRoutes) {
    EXPECT_EQ(api_routes::acquire("p1"), "/api/v1/projects/p1/acquire/");
    EXPECT_EQ(api_routes::release("p1"), "/api/v1/projects/p1/release/");
    EXPECT_EQ(api_routes::upload_archive("p1"), "/api/v1/projects/p1/upload/ariane_tml/");
    EXPECT_EQ(api_routes::download_archive("p1"), "/api/v1/projects/p1/download/ariane_tml/");
}

TEST(ApiRoutesTest, IdsArePercentEncoded) {
    EXPECT_EQ(api_routes::acquire("a b/c"), "/api/v1/projects/a%20b%2Fc/acquire/");
    EXPECT_EQ(api_routes::acquire("3f2a-x_y.z~"), "/api/v1/projects/3f2a-x_y.z~/acquire/");
}

}  // namespace cavesync::remote_project::test
