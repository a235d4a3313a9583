#include <gtest/gtest.h>

#include "ingest/value_parsers.hpp"

using namespace stmt;

namespace {

std::string iso(const std::string& text) {
    auto t = parse_date(text);
    return t ? format_iso_utc(*t) : std::string("<none>");
}

} // namespace

TEST(ParseDate, DayFirstSlash) {
    EXPECT_EQ(iso("15/02/2024"), "2024-02-15T00:00:00");
    EXPECT_EQ(iso("1/2/2024"), "2024-02-01T00:00:00");
    EXPECT_EQ(iso("15/02/2024 9:05"), "2024-02-15T09:05:00");
    EXPECT_EQ(iso("15/02/2024 23:59:30"), "2024-02-15T23:59:30");
}

TEST(ParseDate, DayFirstDash) {
    EXPECT_EQ(iso("20-03-2024"), "2024-03-20T00:00:00");
    EXPECT_EQ(iso(" 20-03-2024 10:15 "), "2024-03-20T10:15:00");
}

TEST(ParseDate, TwoDigitYearIsTwentyFirstCentury) {
    EXPECT_EQ(iso("15/02/24"), "2024-02-15T00:00:00");
    EXPECT_EQ(iso("01-12-99"), "2099-12-01T00:00:00");
}

TEST(ParseDate, LongFormWithTime) {
    EXPECT_EQ(iso("15 Feb 2024, 10:30"), "2024-02-15T10:30:00");
    EXPECT_EQ(iso("5 Sept 2023, 18:45"), "2023-09-05T18:45:00");
}

TEST(ParseDate, GenericForms) {
    EXPECT_EQ(iso("2024-02-15"), "2024-02-15T00:00:00");
    EXPECT_EQ(iso("2024-02-15T10:30:00Z"), "2024-02-15T10:30:00");
    EXPECT_EQ(iso("2024-02-15T10:30:00.123Z"), "2024-02-15T10:30:00");
    EXPECT_EQ(iso("2024-02-15T10:30:00+05:30"), "2024-02-15T05:00:00");
    EXPECT_EQ(iso("2024-02-15 10:30:00"), "2024-02-15T10:30:00");
    EXPECT_EQ(iso("2024/02/15"), "2024-02-15T00:00:00");
    EXPECT_EQ(iso("15-Feb-2024"), "2024-02-15T00:00:00");
    EXPECT_EQ(iso("15 February 2024"), "2024-02-15T00:00:00");
    EXPECT_EQ(iso("Feb 15, 2024"), "2024-02-15T00:00:00");
    EXPECT_EQ(iso("September 5, 2023"), "2023-09-05T00:00:00");
    EXPECT_EQ(iso("Sept 5, 2023"), "2023-09-05T00:00:00");
}

TEST(ParseDate, RejectsInvalidDates) {
    EXPECT_FALSE(parse_date("").has_value());
    EXPECT_FALSE(parse_date("   ").has_value());
    EXPECT_FALSE(parse_date("not a date").has_value());
    EXPECT_FALSE(parse_date("31/02/2024").has_value());
    EXPECT_FALSE(parse_date("29/02/2023").has_value());
    EXPECT_FALSE(parse_date("15/13/2024").has_value());
    EXPECT_FALSE(parse_date("15/02/2024 25:00").has_value());
    EXPECT_TRUE(parse_date("29/02/2024").has_value());
}

TEST(ParseAmount, StripsCurrencyMarkersAndSeparators) {
    EXPECT_DOUBLE_EQ(*parse_amount("1,234.50"), 1234.5);
    EXPECT_DOUBLE_EQ(*parse_amount("INR 500"), 500.0);
    EXPECT_DOUBLE_EQ(*parse_amount("inr1,00,000"), 100000.0);
    EXPECT_DOUBLE_EQ(*parse_amount("\xE2\x82\xB9 2,500.75"), 2500.75);
    EXPECT_DOUBLE_EQ(*parse_amount("\xC2\xA0" "42"), 42.0);
    EXPECT_DOUBLE_EQ(*parse_amount("-250.75"), -250.75);
    EXPECT_DOUBLE_EQ(*parse_amount(".5"), 0.5);
    EXPECT_DOUBLE_EQ(*parse_amount("0"), 0.0);
}

TEST(ParseAmount, ParenthesesDoNotNegate) {
    EXPECT_DOUBLE_EQ(*parse_amount("(100.00)"), 100.0);
}

TEST(ParseAmount, TrailingDebitCreditMarkers) {
    EXPECT_DOUBLE_EQ(*parse_amount("500.00 Dr"), -500.0);
    EXPECT_DOUBLE_EQ(*parse_amount("1,200 Cr"), 1200.0);
    EXPECT_DOUBLE_EQ(*parse_amount("75CR."), 75.0);
    EXPECT_DOUBLE_EQ(*parse_amount("-40 cr"), 40.0);
    EXPECT_EQ(amount_marker(" 500.00 Dr "), AmountMarker::DEBIT);
    EXPECT_EQ(amount_marker("1,200 Cr"), AmountMarker::CREDIT);
    EXPECT_EQ(amount_marker("500"), AmountMarker::NONE);
    EXPECT_FALSE(parse_amount("Dr").has_value());
    EXPECT_FALSE(parse_amount("Cr.").has_value());
}

TEST(ParseAmount, RejectsNonNumericText) {
    EXPECT_FALSE(parse_amount("").has_value());
    EXPECT_FALSE(parse_amount("INR").has_value());
    EXPECT_FALSE(parse_amount("abc").has_value());
    EXPECT_FALSE(parse_amount("12abc").has_value());
    EXPECT_FALSE(parse_amount("1.2.3").has_value());
    EXPECT_FALSE(parse_amount("-").has_value());
}

TEST(Calendar, CivilConversions) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
    EXPECT_EQ(format_iso_utc(0), "1970-01-01T00:00:00");
    EXPECT_EQ(format_iso_utc(-1), "1969-12-31T23:59:59");
    EXPECT_EQ(format_iso_utc(1707955200), "2024-02-15T00:00:00");
    EXPECT_TRUE(is_leap_year(2000));
    EXPECT_FALSE(is_leap_year(1900));
    EXPECT_EQ(days_in_month(2024, 2), 29u);
    EXPECT_EQ(days_in_month(2023, 2), 28u);
    EXPECT_EQ(days_in_month(2023, 13), 0u);
}
