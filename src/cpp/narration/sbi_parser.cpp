#include "sbi_parser.hpp"
#include "../utils/text.hpp"

#include <regex>

namespace stmt {

namespace {

struct SbiMerchant {
    const char* name;
    std::vector<std::string> aliases;   // empty: the lower-cased name
};

const std::vector<SbiMerchant>& sbi_merchants() {
    static const std::vector<SbiMerchant> table = {
        {"Swiggy Instamart", {"swiggy instamart", "instamart"}},
        {"Swiggy",           {"swiggy"}},
        {"Zomato",           {"zomato", "zomatofo", "payzomato", "zomatofood", "zomato-ord"}},
        {"Uber",             {"uber"}},
        {"Ola",              {"ola", "olacabs", "olamon"}},
        {"Rapido",           {}},
        {"Blinkit",          {}},
        {"Zepto",            {"zepto", "zeptonow"}},
        {"BigBasket",        {}},
        {"Amazon",           {"amazon", "amzn", "amazonpay"}},
        {"Flipkart",         {}},
        {"Myntra",           {}},
        {"Netflix",          {}},
        {"Spotify",          {}},
        {"YouTube",          {"youtube", "google"}},
        {"Jio",              {"jio", "reliance"}},
        {"Airtel",           {}},
        {"PhonePe",          {"phonepe", "phonpe"}},
        {"Paytm",            {"paytm", "one97communica", "one97"}},
        {"Google Pay",       {"googlepay", "gpay"}},
        {"CRED",             {"cred"}},
        {"Dunzo",            {}},
        {"Dream11",          {}},
        {"Groww",            {}},
        {"Zerodha",          {}},
        {"Slice",            {}},
        {"Meesho",           {}},
        {"Nykaa",            {}},
        {"BookMyShow",       {}},
        {"IRCTC",            {}},
        {"MakeMyTrip",       {}},
        {"Ixigo",            {}},
        {"BESCOM",           {}},
        {"Domino's",         {"dominos", "domino"}},
        {"McDonald's",       {"mcdonalds", "mcdonald"}},
        {"KFC",              {}},
        {"Starbucks",        {}},
        {"Burger King",      {"burgerking", "burger king"}},
    };
    return table;
}

std::optional<std::string> lookup(const std::string& haystack) {
    for (const auto& m : sbi_merchants()) {
        if (m.aliases.empty()) {
            if (text::contains(haystack, text::to_lower(m.name))) return std::string(m.name);
            continue;
        }
        for (const auto& alias : m.aliases) {
            if (text::contains(haystack, alias)) return std::string(m.name);
        }
    }
    return std::nullopt;
}

std::string join(const std::vector<std::string>& parts, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to && i < parts.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += parts[i];
    }
    return out;
}

std::vector<std::string> words(const std::string& s) {
    std::vector<std::string> out;
    for (auto& w : text::split_any(text::collapse_whitespace(s), " ")) {
        if (!w.empty()) out.push_back(std::move(w));
    }
    return out;
}

} // namespace

std::optional<std::string> SbiNarrationParser::match_merchant(const std::vector<std::string>& fields) {
    std::string joined;
    for (const auto& f : fields) {
        if (!joined.empty()) joined += ' ';
        joined += f;
    }

    std::string compact;
    for (char c : joined) {
        if (!text::is_space(c)) compact += c;
    }
    if (auto m = lookup(text::to_lower(compact))) return m;
    return lookup(text::to_lower(joined));
}

std::string SbiNarrationParser::clean_name(const std::string& name) {
    static const std::regex double_space(R"(\s{2,})");
    static const std::regex trailing_punct(R"([._-]+$)");
    std::string out = std::regex_replace(name, double_space, " ");
    out = std::regex_replace(out, trailing_punct, "");
    return text::trim(out);
}

std::optional<DescriptionParseResult> SbiNarrationParser::parse_upi(const std::string& s) {
    static const std::regex re(
        R"(^(WDL|DEP) TFR\s+UPI\/(DR|CR)\/([^\/]+)\/([^\/]+)\/([^\/]+)\/([^\/]+)\/([^\s\/]+))");
    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;

    const std::string mode = m[2].str();
    const std::string name = clean_name(m[4].str());
    const std::string app = clean_name(m[7].str());

    DescriptionParseResult r;
    r.type = NarrationType::UPI;
    r.merchant = match_merchant({name, m[6].str(), m[7].str()}).value_or(name);
    r.clean_description = (mode == "CR" ? "UPI Received from " : "UPI Transfer to ") + r.merchant;
    r.meta = {{"utr", m[3].str()}, {"bank", m[5].str()}, {"mode", mode}, {"app", app}};
    return r;
}

std::optional<DescriptionParseResult> SbiNarrationParser::parse_pos(const std::string& s) {
    static const std::regex re(R"(^POS ATM PURCH\s+(\S+)\s+(\S+)\s+(.*)$)");
    static const std::regex card_prefix(R"(^\d+[a-zA-Z0-9]*\*)");
    static const std::regex star_prefix(R"(^\*)");
    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;

    auto parts = words(m[3].str());
    std::string location;
    if (parts.size() > 1) {
        location = parts.back();
        parts.pop_back();
    }
    const std::string merchant_raw = join(parts, 0, parts.size());
    std::string name = std::regex_replace(merchant_raw, card_prefix, "");
    name = text::trim(std::regex_replace(name, star_prefix, ""));

    DescriptionParseResult r;
    r.type = NarrationType::POS;
    r.merchant = match_merchant({name, merchant_raw}).value_or(name);
    r.clean_description = "POS Purchase at " + r.merchant;
    if (!location.empty()) r.clean_description += " (" + location + ")";
    r.meta = {{"ref", m[2].str()}, {"location", location}, {"gateway", m[1].str()}};
    return r;
}

std::optional<DescriptionParseResult> SbiNarrationParser::parse_atm(const std::string& s) {
    static const std::regex re(R"(^ATM WDL\s+ATM CASH\s+(.*)$)");
    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;

    const auto parts = words(m[1].str());
    std::string atm_id;
    std::string location;
    if (parts.size() > 1 && parts[1].size() <= 3) {
        atm_id = parts[0] + " " + parts[1];
        location = join(parts, 2, parts.size());
    } else {
        atm_id = parts.empty() ? std::string() : parts[0];
        location = join(parts, 1, parts.size());
    }

    DescriptionParseResult r;
    r.type = NarrationType::ATM;
    r.merchant = "ATM Withdrawal";
    r.clean_description = "ATM Cash Withdrawal";
    if (!location.empty()) r.clean_description += " at " + location;
    r.meta = {{"atmId", atm_id}, {"location", location}};
    return r;
}

std::optional<DescriptionParseResult> SbiNarrationParser::parse_inb(const std::string& s) {
    static const std::regex re(R"(^WDL TFR\s+INB\s+(.*?)(?:\.\.\.|\s+AT\s+\d+))");
    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;

    const std::string name = clean_name(m[1].str());

    DescriptionParseResult r;
    r.type = NarrationType::INB;
    r.merchant = match_merchant({name}).value_or(name);
    r.clean_description = text::starts_with(r.merchant, "Gift")
        ? "Online Transfer: " + r.merchant
        : "Online Transfer to " + r.merchant;
    return r;
}

std::optional<DescriptionParseResult> SbiNarrationParser::parse_self_deposit(const std::string& s) {
    static const std::regex prefix(R"(^CASH DEPOSIT SELF\s+AT\s*)");
    if (!text::starts_with(s, "CASH DEPOSIT SELF")) return std::nullopt;

    std::string branch = std::regex_replace(s, prefix, "");
    if (text::starts_with(branch, "CASH DEPOSIT SELF")) branch = branch.substr(17);
    branch = text::trim(branch);

    DescriptionParseResult r;
    r.type = NarrationType::CASH_DEPOSIT;
    r.merchant = "Self Deposit";
    r.clean_description = branch.empty() ? "Cash Deposit" : "Cash Deposit at " + branch;
    r.meta = {{"branch", branch}};
    return r;
}

std::optional<DescriptionParseResult> SbiNarrationParser::parse_cdm(const std::string& s) {
    static const std::regex re(R"(^CEMTEX DEP\s+(\S+))");
    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;

    const std::string ref = m[1].str();
    DescriptionParseResult r;
    r.type = NarrationType::CASH_DEPOSIT;
    if (auto known = match_merchant({s})) {
        r.merchant = *known;
        r.clean_description = "CDM Deposit via " + *known + " (Ref: " + ref + ")";
    } else {
        r.merchant = "Cash Deposit Machine";
        r.clean_description = "CDM Deposit (Ref: " + ref + ")";
    }
    r.meta = {{"ref", ref}};
    return r;
}

std::optional<DescriptionParseResult> SbiNarrationParser::parse_known_transfer(const std::string& s) {
    static const std::regex dep(R"(^DEP TFR\s+(.*))");
    static const std::regex wdl(R"(^WDL TFR\s+(.*))");
    std::smatch m;

    const bool is_dep = std::regex_search(s, m, dep);
    if (!is_dep && !std::regex_search(s, m, wdl)) return std::nullopt;

    auto known = match_merchant({m[1].str()});
    if (!known) return std::nullopt;

    DescriptionParseResult r;
    r.type = NarrationType::UPI;
    r.merchant = *known;
    r.clean_description = (is_dep ? "Refund from " : "Payment to ") + *known;
    return r;
}

DescriptionParseResult SbiNarrationParser::parse(const std::string& narration) const {
    static const Strategy strategies[] = {
        &SbiNarrationParser::parse_upi,
        &SbiNarrationParser::parse_pos,
        &SbiNarrationParser::parse_atm,
        &SbiNarrationParser::parse_inb,
        &SbiNarrationParser::parse_self_deposit,
        &SbiNarrationParser::parse_cdm,
        &SbiNarrationParser::parse_known_transfer,
    };

    const std::string s = text::trim(narration);
    if (!s.empty()) {
        for (auto strategy : strategies) {
            if (auto r = strategy(s)) return *r;
        }
    }

    DescriptionParseResult unknown;
    unknown.merchant = "Unknown";
    unknown.clean_description = narration;
    return unknown;
}

} // namespace stmt
