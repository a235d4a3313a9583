#pragma once
// Canonical transaction record produced by the row normalizer
#include <cmath>
#include <string>
#include <nlohmann/json.hpp>

#include "value_parsers.hpp"

namespace stmt {

enum class TxType { CREDIT, DEBIT };

inline const char* tx_type_str(TxType t) {
    return t == TxType::CREDIT ? "credit" : "debit";
}

inline constexpr const char* kUncategorized = "Uncategorized";
inline constexpr const char* kUnknownMerchant = "Unknown";

class CanonicalTransaction {
public:
    std::string id;                  // caller-assigned handle (fingerprint by default)
    UnixSeconds date = 0;
    std::string currency = "INR";
    std::string description;
    std::string merchant = kUnknownMerchant;
    std::string category = kUncategorized;
    std::string original_category;
    std::string payment_method = "unknown";
    std::string status = "completed";
    std::string fingerprint;
    nlohmann::json raw_data = nlohmann::json::object();

    [[nodiscard]] double amount() const { return amount_; }
    [[nodiscard]] TxType type() const { return type_; }

    // The only way to change the amount: type always follows the sign
    void set_amount(double amount) {
        amount_ = amount;
        type_ = amount >= 0 ? TxType::CREDIT : TxType::DEBIT;
    }

    // Moves the record to a new category. Entering "income" makes the amount
    // positive, leaving it makes the amount negative. Returns true when the
    // category actually changed.
    bool apply_category_correction(const std::string& new_category);

    // Body sent to the import endpoint
    [[nodiscard]] nlohmann::json to_wire_json() const;

    // Full record, for --print
    [[nodiscard]] nlohmann::json to_json() const;

private:
    double amount_ = 0.0;
    TxType type_ = TxType::CREDIT;
};

inline bool is_income_category(const std::string& category) {
    if (category.size() != 6) return false;
    static const char income[] = "income";
    for (size_t i = 0; i < 6; ++i) {
        char c = category[i];
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        if (c != income[i]) return false;
    }
    return true;
}

inline bool CanonicalTransaction::apply_category_correction(const std::string& new_category) {
    if (new_category == category) return false;

    if (original_category.empty()) original_category = category;

    const bool to_income = is_income_category(new_category);
    const bool from_income = is_income_category(category);
    if (to_income && amount_ < 0) {
        set_amount(std::fabs(amount_));
    } else if (!to_income && from_income && amount_ > 0) {
        set_amount(-std::fabs(amount_));
    }
    category = new_category;
    return true;
}

inline nlohmann::json CanonicalTransaction::to_wire_json() const {
    return {
        {"transaction_date", format_iso_utc(date) + ".000Z"},
        {"amount", amount_},
        {"currency", currency},
        {"description", description},
        {"merchant_name", merchant},
        {"category", category},
        {"payment_method", payment_method},
        {"status", status},
        {"raw_data", raw_data},
    };
}

inline nlohmann::json CanonicalTransaction::to_json() const {
    nlohmann::json j = to_wire_json();
    j["type"] = tx_type_str(type_);
    j["fingerprint"] = fingerprint;
    if (!original_category.empty()) j["original_category"] = original_category;
    return j;
}

} // namespace stmt
