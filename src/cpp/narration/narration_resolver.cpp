#include "narration_resolver.hpp"
#include "known_merchants.hpp"
#include "../utils/logger.hpp"
#include "../utils/text.hpp"

#include <regex>
#include <set>

namespace stmt {
namespace narration {

namespace {

constexpr size_t kMaxDescriptionLen = 64;

const std::regex::flag_type kIcase = std::regex::ECMAScript | std::regex::icase;

// Known merchant if the name mentions one, otherwise the name title-cased
std::string merchant_or_title(const std::string& name) {
    if (auto m = match_known_merchant(name)) return *m;
    return text::title_case(name);
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

std::optional<std::string> known_merchant(const std::string& s) {
    return match_known_merchant(s);
}

std::optional<std::string> upi_transfer(const std::string& s) {
    static const std::regex re(
        R"((?:UPI|UPVDR|UPS|IMPS|NEFT)(?:\/|-)(?:DR|CR)?(?:\/|-)?\d+(?:\/|-)([^/]+)(?:\/|-))", kIcase);
    static const std::regex trailing_id(R"([0-9._-]+$)");

    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;

    std::string name = text::trim(std::regex_replace(m[1].str(), trailing_id, ""));
    if (name.size() <= 2 || all_digits(name)) return std::nullopt;
    return merchant_or_title(name);
}

std::optional<std::string> pos_purchase(const std::string& s) {
    static const std::regex re(
        R"(POS\s+ATM\s+PURCH\s+\w+\s+\d+\s*\n?\s*\d*([A-Za-z*]+[A-Za-z\s]*))", kIcase);
    static const std::regex leading_digits(R"(^\d+)");
    static const std::regex star(R"(\*)");
    static const std::regex trailing_id(R"(\s+\d+$)");

    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;

    std::string name = std::regex_replace(m[1].str(), leading_digits, "");
    name = text::trim(std::regex_replace(name, star, ""));
    name = text::trim(std::regex_replace(name, trailing_id, ""));
    if (name.size() <= 2) return std::nullopt;
    return merchant_or_title(name);
}

std::optional<std::string> card_refund(const std::string& s) {
    static const std::regex re(R"(DEP\s+TFR\s+VISA-IN-RMT:[0-9]+([A-Za-z]+))", kIcase);
    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;

    const std::string name = m[1].str();
    if (auto known = match_known_merchant(name)) return known;
    if (name.size() > 2) return text::title_case(name);
    return std::nullopt;
}

std::optional<std::string> atm_withdrawal(const std::string& s) {
    static const std::regex re(R"(ATM\s+WDL)", kIcase);
    if (std::regex_search(s, re)) return std::string("ATM Withdrawal");
    return std::nullopt;
}

std::optional<std::string> cash_deposit(const std::string& s) {
    static const std::regex plain(R"(CASH\s+DEPOSIT)", kIcase);
    static const std::regex cdm(R"(CEMTEX\s+DEP)", kIcase);
    static const std::regex numbers(R"(\b\d+\b)");

    if (std::regex_search(s, plain)) return std::string("Cash Deposit");
    if (!std::regex_search(s, cdm)) return std::nullopt;

    std::string rest = std::regex_replace(s, cdm, " ");
    rest = text::collapse_whitespace(std::regex_replace(rest, numbers, " "));
    if (rest.size() > 2) return merchant_or_title(rest);
    return std::string("Cash Deposit");
}

std::optional<std::string> internet_banking(const std::string& s) {
    static const std::regex marker(R"(\bINB\b)", kIcase);
    static const std::regex tokens(R"(\b(WDL|TFR|INB)\b)", kIcase);
    static const std::regex branch_suffix(R"(\bAT\s+\d+.*)", kIcase);

    if (!std::regex_search(s, marker)) return std::nullopt;

    std::string rest = std::regex_replace(s, tokens, " ");
    rest = text::collapse_whitespace(std::regex_replace(rest, branch_suffix, ""));
    if (rest.size() <= 2) return std::nullopt;
    return merchant_or_title(rest);
}

bool is_noise_segment(const std::string& segment) {
    static const std::regex long_code(R"(^[A-Z0-9._-]{10,}$)");
    static const std::regex long_number(R"(^[0-9]{6,}$)");
    static const std::regex icici_ref(R"(^ICI[A-Z0-9]+$)");
    static const std::regex prefixed_id(R"(^[A-Z]{2,5}\d{6,}$)");
    static const std::set<std::string> noise_words = {
        "UPI", "IMPS", "NEFT", "RTGS", "ACH", "NACH", "CREDIT", "DEBIT",
        "PAYMENT", "TRANSFER", "BANK", "AXIS BANK", "HDFC BANK", "SBI",
        "ICICI", "YES BANK", "KOTAK", "WDL", "TFR", "POS", "MB"};

    const std::string upper = text::to_upper(segment);
    if (std::regex_match(upper, long_code)) return true;
    if (std::regex_match(upper, long_number)) return true;
    if (std::regex_match(upper, icici_ref)) return true;
    if (std::regex_match(upper, prefixed_id)) return true;
    return noise_words.count(upper) > 0;
}

std::optional<std::string> slash_segments(const std::string& s) {
    static const std::regex separators(R"([._-]+)");

    if (s.find('/') == std::string::npos) return std::nullopt;

    for (const auto& piece : text::split_any(s, "/|>")) {
        const std::string seg = text::trim(piece);
        if (seg.size() < 3) continue;
        if (seg.find('@') != std::string::npos) continue;
        if (is_noise_segment(seg)) continue;
        std::string readable = text::collapse_whitespace(std::regex_replace(seg, separators, " "));
        if (readable.empty()) continue;
        return text::title_case(readable);
    }
    return std::nullopt;
}

std::optional<std::string> card_code(const std::string& s) {
    static const std::regex re(R"(^[A-Z]{2,5}\.[A-Z0-9-]{8,}$)", kIcase);
    if (std::regex_match(text::trim(s), re)) return std::string("Card/UPI transaction");
    return std::nullopt;
}

std::optional<std::string> aggressive_cleanup(const std::string& s) {
    static const std::regex type_tokens(
        R"(\b(UPI|IMPS|NEFT|RTGS|ACH|NACH|WDL|TFR|POS|MB|DR|CR|DEP|OTHPG|SBIPG|PURCH|ATM)\b)", kIcase);
    static const std::regex digits(R"([0-9]+)");
    static const std::regex non_letters(R"([^A-Za-z]+)");

    std::string cleaned = std::regex_replace(s, type_tokens, " ");
    cleaned = std::regex_replace(cleaned, digits, " ");
    cleaned = std::regex_replace(cleaned, non_letters, " ");
    cleaned = text::collapse_whitespace(cleaned);

    if (cleaned.empty()) return std::string(kImportedTransaction);
    if (cleaned.size() <= kMaxDescriptionLen) return text::title_case(cleaned);
    return text::title_case(text::trim(cleaned.substr(0, kMaxDescriptionLen - 3))) + "...";
}

} // namespace narration

NarrationResolver::NarrationResolver() : strategies_(default_strategies()) {}

std::vector<NarrationStrategy> NarrationResolver::default_strategies() {
    return {
        {"known_merchant",     narration::known_merchant},
        {"upi_transfer",       narration::upi_transfer},
        {"pos_purchase",       narration::pos_purchase},
        {"card_refund",        narration::card_refund},
        {"atm_withdrawal",     narration::atm_withdrawal},
        {"cash_deposit",       narration::cash_deposit},
        {"internet_banking",   narration::internet_banking},
        {"slash_segments",     narration::slash_segments},
        {"card_code",          narration::card_code},
        {"aggressive_cleanup", narration::aggressive_cleanup},
    };
}

std::string NarrationResolver::resolve(const std::string& narration) const {
    const std::string source = text::trim(narration);
    if (source.empty()) return kImportedTransaction;

    for (const auto& strategy : strategies_) {
        auto out = strategy.fn(source);
        if (out && !out->empty()) {
            LOG_DBG("[narration] %s -> '%s'", strategy.name.c_str(), out->c_str());
            return *out;
        }
    }
    return source;
}

} // namespace stmt
