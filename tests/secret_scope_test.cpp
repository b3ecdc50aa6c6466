/**
 * @file secret_scope_test.cpp
 * @brief Tests for scoped export of secret environment variables.
 */
#include "secret_scope.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {
constexpr const char* kName = "SNAPVAULT_TEST_SECRET";
constexpr const char* kOther = "SNAPVAULT_TEST_SECRET_2";
}

class SecretScopeTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(kName);
        unsetenv(kOther);
    }

    void TearDown() override {
        unsetenv(kName);
        unsetenv(kOther);
    }
};

TEST_F(SecretScopeTest, ExportsOnlyWhileInScope) {
    ASSERT_FALSE(GetEnv(kName));
    {
        SecretScope scope({{kName, "value"}, {kOther, "other"}});
        EXPECT_EQ(GetEnv(kName), "value");
        EXPECT_EQ(GetEnv(kOther), "other");
    }
    EXPECT_FALSE(GetEnv(kName));
    EXPECT_FALSE(GetEnv(kOther));
}

TEST_F(SecretScopeTest, RestoresPreviousValue) {
    setenv(kName, "original", 1);
    {
        SecretScope scope(std::map<std::string, std::string>{{kName, "temporary"}});
        EXPECT_EQ(GetEnv(kName), "temporary");
    }
    EXPECT_EQ(GetEnv(kName), "original");
}

TEST_F(SecretScopeTest, ReleasedWhenBodyThrows) {
    EXPECT_THROW(withSecrets({{kName, "value"}}, []() -> int { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    EXPECT_FALSE(GetEnv(kName));
}

TEST_F(SecretScopeTest, WithSecretsReturnsBodyValue) {
    auto seen = withSecrets({{kName, "value"}}, [] { return GetEnv(kName); });
    EXPECT_EQ(seen, "value");
    EXPECT_FALSE(GetEnv(kName));
}
