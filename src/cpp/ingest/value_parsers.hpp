#pragma once
// Locale-tolerant date and amount parsing for statement cells.
// All wall-clock values are taken as UTC.
#include <cstdint>
#include <optional>
#include <string>

namespace stmt {

// Seconds since 1970-01-01T00:00:00Z
using UnixSeconds = int64_t;

// Tries, in order: D/M/Y[ H:MM[:SS]], D-M-Y[ H:MM[:SS]], "D Mon YYYY, H:MM",
// then the generic ISO / month-name forms. Two-digit years mean 20yy.
std::optional<UnixSeconds> parse_date(const std::string& text);

enum class AmountMarker { NONE, DEBIT, CREDIT };

// Trailing "Dr" / "Cr" on an amount cell ("500.00 Dr", "1,200Cr.")
AmountMarker amount_marker(const std::string& text);

// Strips currency markers, separators and parentheses; sign is kept as written
// unless a Dr (negative) or Cr (positive) marker says otherwise
std::optional<double> parse_amount(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS"
std::string format_iso_utc(UnixSeconds t);

// Proleptic Gregorian day count relative to 1970-01-01
int64_t days_from_civil(int64_t y, unsigned m, unsigned d);

bool is_leap_year(int64_t y);
unsigned days_in_month(int64_t y, unsigned m);

} // namespace stmt
