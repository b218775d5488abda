#include "config/Settings.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace pve::config;

namespace {

void clear_pve_env() {
    unsetenv("PVE_ENV");
    unsetenv("PVE_CARD_NUMBER_MAX_LENGTH");
    unsetenv("PVE_CVV_MIN_LENGTH");
    unsetenv("PVE_CVV_MAX_LENGTH");
    unsetenv("PVE_PASSWORD_MIN_LENGTH");
    unsetenv("PVE_PASSWORD_REQUIRE_UPPER");
    unsetenv("PVE_PASSWORD_REQUIRE_LOWER");
    unsetenv("PVE_PASSWORD_REQUIRE_DIGIT");
    unsetenv("PVE_PASSWORD_REQUIRE_SYMBOL");
}

} // namespace

TEST(Settings, DefaultsAreReasonable) {
    Settings s;
    EXPECT_EQ(s.environment, "development");
    EXPECT_EQ(s.validation.card.number_max_length, 19u);
    EXPECT_EQ(s.validation.card.cvv_min_length, 3u);
    EXPECT_EQ(s.validation.card.cvv_max_length, 4u);
    EXPECT_EQ(s.validation.password.min_length, 12u);
    EXPECT_TRUE(s.validation.password.require_symbol);
}

TEST(Settings, DevelopmentPreset) {
    auto s = Settings::development();
    EXPECT_EQ(s.environment, "development");
    EXPECT_EQ(s.validation.password.min_length, 12u);
}

TEST(Settings, ProductionPreset) {
    auto s = Settings::production();
    EXPECT_EQ(s.environment, "production");
    EXPECT_EQ(s.validation.password.min_length, 16u);
    EXPECT_EQ(s.validation.card, pve::domain::CardPolicy{});
}

TEST(Settings, FromEnvironmentDefaultsToDevelopment) {
    clear_pve_env();
    auto s = Settings::from_environment();
    auto dev = Settings::development();
    EXPECT_EQ(s.environment, dev.environment);
    EXPECT_EQ(s.validation.password, dev.validation.password);
    EXPECT_EQ(s.validation.card, dev.validation.card);
}

TEST(Settings, FromEnvironmentSelectsProductionPreset) {
    clear_pve_env();
    setenv("PVE_ENV", "production", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.environment, "production");
    EXPECT_EQ(s.validation.password.min_length, 16u);

    clear_pve_env();
}

TEST(Settings, FromEnvironmentReadsEnvVars) {
    clear_pve_env();
    setenv("PVE_CARD_NUMBER_MAX_LENGTH", "16", 1);
    setenv("PVE_CVV_MIN_LENGTH", "4", 1);
    setenv("PVE_CVV_MAX_LENGTH", "4", 1);
    setenv("PVE_PASSWORD_MIN_LENGTH", "8", 1);
    setenv("PVE_PASSWORD_REQUIRE_SYMBOL", "false", 1);
    setenv("PVE_PASSWORD_REQUIRE_UPPER", "0", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.validation.card.number_max_length, 16u);
    EXPECT_EQ(s.validation.card.cvv_min_length, 4u);
    EXPECT_EQ(s.validation.card.cvv_max_length, 4u);
    EXPECT_EQ(s.validation.password.min_length, 8u);
    EXPECT_FALSE(s.validation.password.require_symbol);
    EXPECT_FALSE(s.validation.password.require_upper);
    EXPECT_TRUE(s.validation.password.require_lower);

    clear_pve_env();
}

TEST(Settings, FromEnvironmentHandlesInvalidValues) {
    clear_pve_env();
    setenv("PVE_PASSWORD_MIN_LENGTH", "not_a_number", 1);
    setenv("PVE_CVV_MIN_LENGTH", "-3", 1);
    setenv("PVE_PASSWORD_REQUIRE_DIGIT", "maybe", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.validation.password.min_length, 12u);  // Falls back to dev preset default
    EXPECT_EQ(s.validation.card.cvv_min_length, 3u);
    EXPECT_TRUE(s.validation.password.require_digit);

    clear_pve_env();
}

TEST(Settings, FromEnvironmentRejectsUnsatisfiableCardBounds) {
    clear_pve_env();
    setenv("PVE_CVV_MIN_LENGTH", "5", 1);
    setenv("PVE_CVV_MAX_LENGTH", "4", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.validation.card, pve::domain::CardPolicy{});

    clear_pve_env();
    setenv("PVE_CARD_NUMBER_MAX_LENGTH", "0", 1);
    s = Settings::from_environment();
    EXPECT_EQ(s.validation.card.number_max_length, 19u);

    clear_pve_env();
}
