#pragma once
// =============================================================================
// SBI narration parser
//
// State Bank of India statements use a fixed set of narration layouts:
//   WDL TFR UPI/DR/<utr>/<name>/<bank>/<upi id>/<app> AT <branch>
//   POS ATM PURCH <gateway> <ref> <merchant> <location>
//   ATM WDL ATM CASH <atm id> [code] <location>
//   WDL TFR INB <purpose>... AT <branch>
//   CASH DEPOSIT SELF AT <branch>
//   CEMTEX DEP <ref> ...
// A result whose type is not UNKNOWN is authoritative for the description
// and the merchant.
// =============================================================================

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stmt {

enum class NarrationType { UPI, POS, ATM, INB, CASH_DEPOSIT, UNKNOWN };

inline const char* narration_type_str(NarrationType t) {
    switch (t) {
        case NarrationType::UPI:          return "upi";
        case NarrationType::POS:          return "pos";
        case NarrationType::ATM:          return "atm";
        case NarrationType::INB:          return "inb";
        case NarrationType::CASH_DEPOSIT: return "cash_deposit";
        case NarrationType::UNKNOWN:      return "unknown";
    }
    return "unknown";
}

struct DescriptionParseResult {
    std::string merchant;
    std::string clean_description;
    NarrationType type = NarrationType::UNKNOWN;
    // utr, bank, mode, app, ref, location, gateway, atmId, branch
    std::map<std::string, std::string> meta;

    [[nodiscard]] bool resolved() const { return type != NarrationType::UNKNOWN; }
};

class SbiNarrationParser {
public:
    [[nodiscard]] DescriptionParseResult parse(const std::string& narration) const;

    // Merchant table lookup across several narration fields. First pass
    // matches on the fields with all whitespace removed, second pass on the
    // space-joined text.
    static std::optional<std::string> match_merchant(const std::vector<std::string>& fields);

    // Collapses double spaces and drops trailing ._- runs
    static std::string clean_name(const std::string& name);

private:
    using Strategy = std::optional<DescriptionParseResult> (*)(const std::string&);

    static std::optional<DescriptionParseResult> parse_upi(const std::string& s);
    static std::optional<DescriptionParseResult> parse_pos(const std::string& s);
    static std::optional<DescriptionParseResult> parse_atm(const std::string& s);
    static std::optional<DescriptionParseResult> parse_inb(const std::string& s);
    static std::optional<DescriptionParseResult> parse_self_deposit(const std::string& s);
    static std::optional<DescriptionParseResult> parse_cdm(const std::string& s);
    static std::optional<DescriptionParseResult> parse_known_transfer(const std::string& s);
};

} // namespace stmt
