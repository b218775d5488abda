#include "domain/value_objects/FutureDate.hpp"

#include <gtest/gtest.h>

using namespace pve::domain;
using namespace std::chrono;

TEST(FutureDate, AcceptsLaterDate) {
    auto r = FutureDate::validate(2024y / August / 2, "delivery date", 2024y / August / 1);
    ASSERT_TRUE(r.is_success());
    EXPECT_EQ(r.value().to_string(), "2024-08-02");
}

TEST(FutureDate, SameDayIsNotAfter) {
    auto r = FutureDate::validate(2024y / August / 1, "delivery date", 2024y / August / 1);
    ASSERT_TRUE(r.is_failure());
    EXPECT_TRUE(std::holds_alternative<TemporalError>(r.error()));
    EXPECT_EQ(message_of(r.error()), "delivery date must be after 2024-08-01");
}

TEST(FutureDate, InvalidCalendarDateIsShapeError) {
    auto r = FutureDate::validate(2025y / February / 30, "delivery date", 2024y / August / 1);
    ASSERT_TRUE(r.is_failure());
    EXPECT_EQ(rule_of(r.error()), ValidationRule::InvalidDate);
}
