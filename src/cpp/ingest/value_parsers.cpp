#include "value_parsers.hpp"
#include "../utils/text.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <regex>

namespace stmt {

bool is_leap_year(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) return 0;
    if (m == 2 && is_leap_year(y)) return 29;
    return days[m - 1];
}

int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::string format_iso_utc(UnixSeconds t) {
    int64_t days = t / 86400;
    int64_t secs = t % 86400;
    if (secs < 0) {
        secs += 86400;
        days -= 1;
    }

    // civil_from_days
    int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    if (m <= 2) ++y;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d",
        static_cast<long long>(y), m, d,
        static_cast<int>(secs / 3600), static_cast<int>((secs / 60) % 60),
        static_cast<int>(secs % 60));
    return buf;
}

namespace {

// Wall-clock components before validation
struct DateParts {
    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    int64_t offset_seconds = 0;   // east of UTC
};

std::optional<UnixSeconds> to_unix(const DateParts& p) {
    if (p.month < 1 || p.month > 12) return std::nullopt;
    if (p.day < 1 || p.day > days_in_month(p.year, p.month)) return std::nullopt;
    if (p.hour > 23 || p.minute > 59 || p.second > 59) return std::nullopt;
    return days_from_civil(p.year, p.month, p.day) * 86400
        + p.hour * 3600 + p.minute * 60 + p.second
        - p.offset_seconds;
}

unsigned to_uint(const std::ssub_match& m) {
    if (!m.matched || m.length() == 0) return 0;
    return static_cast<unsigned>(std::strtoul(m.str().c_str(), nullptr, 10));
}

// "jan", "january", "sept", ... -> 1..12, 0 when unknown
unsigned month_from_name(const std::string& name) {
    static const char* months[12] = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"};
    const std::string lower = text::to_lower(name);
    if (lower == "sept") return 9;
    if (lower.size() < 3) return 0;
    for (unsigned i = 0; i < 12; ++i) {
        std::string full(months[i]);
        if (lower.size() <= full.size() && full.compare(0, lower.size(), lower) == 0) {
            return i + 1;
        }
    }
    return 0;
}

// D/M/Y or D-M-Y with an optional time of day
std::optional<UnixSeconds> parse_day_first(const std::string& s, const std::regex& re) {
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;
    DateParts p;
    p.day = to_uint(m[1]);
    p.month = to_uint(m[2]);
    p.year = to_uint(m[3]);
    if (m[3].length() == 2) p.year += 2000;
    p.hour = to_uint(m[4]);
    p.minute = to_uint(m[5]);
    p.second = to_uint(m[6]);
    return to_unix(p);
}

std::optional<UnixSeconds> parse_google_like(const std::string& s) {
    static const std::regex re(R"(^(\d{1,2})\s+([A-Za-z]+)\s+(\d{4}),\s*(\d{1,2}):(\d{2})$)");
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;
    DateParts p;
    p.day = to_uint(m[1]);
    p.month = month_from_name(m[2].str());
    p.year = to_uint(m[3]);
    p.hour = to_uint(m[4]);
    p.minute = to_uint(m[5]);
    return to_unix(p);
}

int64_t parse_offset(const std::string& tz) {
    if (tz.empty() || tz == "Z" || tz == "z") return 0;
    int sign = tz[0] == '-' ? -1 : 1;
    std::string digits;
    for (char c : tz) {
        if (c >= '0' && c <= '9') digits += c;
    }
    if (digits.size() != 4) return 0;
    int64_t hh = std::stoi(digits.substr(0, 2));
    int64_t mm = std::stoi(digits.substr(2, 2));
    return sign * (hh * 3600 + mm * 60);
}

std::optional<UnixSeconds> parse_generic_once(const std::string& s) {
    static const std::regex iso(
        R"(^(\d{4})-(\d{1,2})-(\d{1,2})(?:T(\d{1,2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?)?\s*(Z|z|[+-]\d{2}:?\d{2})?$)");
    static const std::regex ymd_slash(
        R"(^(\d{4})\/(\d{1,2})\/(\d{1,2})(?:[T\s]+(\d{1,2}):(\d{2})(?::(\d{2}))?)?$)");
    static const std::regex day_month_name(
        R"(^(\d{1,2})[\s-]+([A-Za-z]+)\.?[\s-]+(\d{4})(?:,?[T\s]+(\d{1,2}):(\d{2})(?::(\d{2}))?)?$)");
    static const std::regex month_name_day(
        R"(^([A-Za-z]+)\.?\s+(\d{1,2}),?\s+(\d{4})(?:,?[T\s]+(\d{1,2}):(\d{2})(?::(\d{2}))?)?$)");

    std::smatch m;
    DateParts p;
    if (std::regex_match(s, m, iso)) {
        p.year = to_uint(m[1]);
        p.month = to_uint(m[2]);
        p.day = to_uint(m[3]);
        p.hour = to_uint(m[4]);
        p.minute = to_uint(m[5]);
        p.second = to_uint(m[6]);
        p.offset_seconds = parse_offset(m[7].str());
        return to_unix(p);
    }
    if (std::regex_match(s, m, ymd_slash)) {
        p.year = to_uint(m[1]);
        p.month = to_uint(m[2]);
        p.day = to_uint(m[3]);
        p.hour = to_uint(m[4]);
        p.minute = to_uint(m[5]);
        p.second = to_uint(m[6]);
        return to_unix(p);
    }
    if (std::regex_match(s, m, day_month_name)) {
        p.day = to_uint(m[1]);
        p.month = month_from_name(m[2].str());
        p.year = to_uint(m[3]);
        p.hour = to_uint(m[4]);
        p.minute = to_uint(m[5]);
        p.second = to_uint(m[6]);
        return to_unix(p);
    }
    if (std::regex_match(s, m, month_name_day)) {
        p.month = month_from_name(m[1].str());
        p.day = to_uint(m[2]);
        p.year = to_uint(m[3]);
        p.hour = to_uint(m[4]);
        p.minute = to_uint(m[5]);
        p.second = to_uint(m[6]);
        return to_unix(p);
    }
    return std::nullopt;
}

std::optional<UnixSeconds> parse_generic(std::string s) {
    static const std::regex sept(R"(\bSept\b)", std::regex::icase);
    s = std::regex_replace(s, sept, "Sep");

    if (auto t = parse_generic_once(s)) return t;

    auto sp = s.find(' ');
    if (sp != std::string::npos) {
        std::string with_t = s;
        with_t[sp] = 'T';
        if (auto t = parse_generic_once(with_t)) return t;
    }
    return std::nullopt;
}

} // namespace

std::optional<UnixSeconds> parse_date(const std::string& text) {
    static const std::regex slash_form(
        R"(^\s*(\d{1,2})\/(\d{1,2})\/(\d{2,4})(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?\s*$)");
    static const std::regex dash_form(
        R"(^\s*(\d{1,2})-(\d{1,2})-(\d{2,4})(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?\s*$)");

    const std::string s = text::trim(text);
    if (s.empty()) return std::nullopt;

    if (auto t = parse_day_first(s, slash_form)) return t;
    if (auto t = parse_day_first(s, dash_form)) return t;
    if (auto t = parse_google_like(s)) return t;
    return parse_generic(s);
}

namespace {

// Length of a trailing "Dr" / "Cr" marker (with optional '.'), 0 when absent.
// The marker must follow a digit or a space so "Dr" alone is not an amount.
size_t marker_length(const std::string& text, AmountMarker& marker) {
    marker = AmountMarker::NONE;
    size_t end = text.size();
    if (end > 0 && text[end - 1] == '.') --end;
    if (end < 3) return 0;

    const char a = static_cast<char>(std::tolower(static_cast<unsigned char>(text[end - 2])));
    const char b = static_cast<char>(std::tolower(static_cast<unsigned char>(text[end - 1])));
    const char before = text[end - 3];
    if (b != 'r' || (a != 'd' && a != 'c')) return 0;
    if (!std::isdigit(static_cast<unsigned char>(before)) && !text::is_space(before)) return 0;

    marker = a == 'd' ? AmountMarker::DEBIT : AmountMarker::CREDIT;
    return text.size() - (end - 2);
}

} // namespace

AmountMarker amount_marker(const std::string& text) {
    AmountMarker marker;
    marker_length(text::trim(text), marker);
    return marker;
}

std::optional<double> parse_amount(const std::string& raw) {
    static const std::regex number(R"(^[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?$)");

    AmountMarker marker;
    std::string text = text::trim(raw);
    text.resize(text.size() - marker_length(text, marker));

    std::string s;
    s.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        // INR, any case
        if (i + 2 < text.size() && (c == 'I' || c == 'i') &&
            (text[i + 1] == 'N' || text[i + 1] == 'n') &&
            (text[i + 2] == 'R' || text[i + 2] == 'r')) {
            i += 2;
            continue;
        }
        // U+20B9 rupee sign
        if (c == 0xE2 && i + 2 < text.size() &&
            static_cast<unsigned char>(text[i + 1]) == 0x82 &&
            static_cast<unsigned char>(text[i + 2]) == 0xB9) {
            i += 2;
            continue;
        }
        // U+00A0 no-break space
        if (c == 0xC2 && i + 1 < text.size() &&
            static_cast<unsigned char>(text[i + 1]) == 0xA0) {
            i += 1;
            continue;
        }
        if (c == ',' || c == '(' || c == ')' || text::is_space(static_cast<char>(c))) continue;
        s += static_cast<char>(c);
    }

    if (s.empty() || !std::regex_match(s, number)) return std::nullopt;

    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
    if (marker == AmountMarker::DEBIT) return -std::fabs(v);
    if (marker == AmountMarker::CREDIT) return std::fabs(v);
    return v;
}

} // namespace stmt
