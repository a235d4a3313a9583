#include "row_normalizer.hpp"
#include "value_parsers.hpp"
#include "../narration/known_merchants.hpp"
#include "../utils/text.hpp"

#include <cmath>
#include <initializer_list>
#include <map>

namespace stmt {

namespace {

// Normalized header key -> cell text (first column wins on collisions)
class ColumnLookup {
public:
    explicit ColumnLookup(const RawRow& row) {
        for (const auto& [key, value] : row.cells) {
            values_.emplace(text::alnum_key(key), cell_to_string(value));
        }
    }

    [[nodiscard]] bool has(const char* key) const { return values_.count(key) > 0; }

    // First alias with non-blank text
    [[nodiscard]] std::string first(std::initializer_list<const char*> aliases) const {
        for (const char* a : aliases) {
            auto it = values_.find(a);
            if (it == values_.end()) continue;
            std::string v = text::trim(it->second);
            if (!v.empty()) return v;
        }
        return "";
    }

    // First alias whose text parses as an amount
    [[nodiscard]] std::optional<double> first_amount(std::initializer_list<const char*> aliases) const {
        for (const char* a : aliases) {
            auto it = values_.find(a);
            if (it == values_.end()) continue;
            if (auto v = parse_amount(it->second)) return v;
        }
        return std::nullopt;
    }

private:
    std::map<std::string, std::string> values_;
};

double resolve_amount(const ColumnLookup& cols) {
    const auto withdrawal = cols.first_amount(
        {"withdrawal", "withdrawalamt", "withdrawalamount", "debit", "debitamount"});
    const auto deposit = cols.first_amount(
        {"deposit", "depositamt", "depositamount", "credit", "creditamount"});

    const double w = withdrawal.value_or(0.0);
    const double d = deposit.value_or(0.0);
    if (w != 0.0 || d != 0.0) {
        return d > 0.0 ? std::fabs(d) : -std::fabs(w);
    }

    const double direct = cols.first_amount({"amount"}).value_or(0.0);
    if (cols.has("type")) {
        const std::string type = text::to_lower(cols.first({"type"}));
        if (!type.empty()) {
            const bool incoming = text::contains(type, "income") ||
                                  text::contains(type, "credit") ||
                                  text::contains(type, "deposit");
            return incoming ? std::fabs(direct) : -std::fabs(direct);
        }
    }
    // no direction column: an expense export, except refunds and Cr-marked cells
    if (amount_marker(cols.first({"amount"})) == AmountMarker::CREDIT) return std::fabs(direct);
    if (normalize_status(cols.first({"status"})) == "refunded") return std::fabs(direct);
    return -std::fabs(direct);
}

} // namespace

std::string normalize_status(const std::string& status) {
    const std::string s = text::to_lower(text::trim(status));
    if (s.empty()) return "completed";
    if (text::contains(s, "refund")) return "refunded";
    if (text::contains(s, "cancel")) return "cancelled";
    if (text::contains(s, "fail")) return "failed";
    if (text::contains(s, "complete") || text::contains(s, "success")) return "completed";
    return s;
}

std::string infer_payment_method(const std::string& narration) {
    const std::string s = text::to_lower(narration);
    if (text::contains_word(s, "upi") || text::contains(s, "upvdr") || text::contains(s, "upi/")) return "upi";
    if (text::contains_word(s, "pos") || text::contains(s, "pos atm")) return "pos";
    if (text::contains_word(s, "atm") || text::contains(s, "atm wdl") || text::contains(s, "atm cash")) return "atm";
    if (text::contains(s, "neft")) return "neft";
    if (text::contains(s, "imps")) return "imps";
    if (text::contains_word(s, "inb") || text::contains(s, "internet banking")) return "inb";
    if (text::contains(s, "visa") || text::contains(s, "mastercard") || text::contains(s, "rupay")) return "card";
    return "unknown";
}

std::optional<CanonicalTransaction> RowNormalizer::normalize(const RawRow& row) const {
    const ColumnLookup cols(row);

    std::optional<UnixSeconds> date;
    for (const char* alias : {"date", "transactiondate", "txndate", "valuedate"}) {
        date = parse_date(cols.first({alias}));
        if (date) break;
    }
    if (!date) return std::nullopt;

    CanonicalTransaction tx;
    tx.date = *date;
    tx.set_amount(resolve_amount(cols));

    std::string narration = text::collapse_whitespace(
        cols.first({"description", "details", "narration", "particulars", "remarks"}));
    if (narration.empty()) narration = "Imported";

    const DescriptionParseResult sbi = sbi_.parse(narration);
    tx.description = sbi.resolved() ? sbi.clean_description : resolver_.resolve(narration);
    if (tx.description.empty()) tx.description = narration;

    const std::string merchant_col = cols.first(
        {"merchant", "merchantname", "product", "merchantcategory", "seller", "vendor"});
    if (sbi.resolved() && sbi.merchant != kUnknownMerchant) {
        tx.merchant = sbi.merchant;
    } else if (!merchant_col.empty()) {
        tx.merchant = merchant_col;
    } else if (auto known = match_known_merchant(tx.description)) {
        tx.merchant = *known;
    } else {
        tx.merchant = kUnknownMerchant;
    }

    const std::string payment_col = cols.first({"paymentmethod", "mode", "paymenttype"});
    if (!payment_col.empty()) {
        tx.payment_method = text::to_lower(payment_col);
    } else if (sbi.resolved()) {
        tx.payment_method = narration_type_str(sbi.type);
    } else {
        tx.payment_method = infer_payment_method(narration);
    }

    const std::string currency = cols.first({"currency"});
    tx.currency = currency.empty() ? default_currency_ : text::to_upper(currency);
    tx.status = normalize_status(cols.first({"status"}));

    tx.raw_data = row.to_json();
    for (const auto& [k, v] : sbi.meta) tx.raw_data[k] = v;
    tx.raw_data["sbi_type"] = narration_type_str(sbi.type);
    return tx;
}

} // namespace stmt
