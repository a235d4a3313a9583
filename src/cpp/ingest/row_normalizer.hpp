#pragma once
// =============================================================================
// Row Normalizer: RawRow -> CanonicalTransaction
//
// Header keys are matched in normalized form (lower-case, alphanumerics
// only), so "Txn Date", "txn_date" and "TXNDATE" are the same column.
// Rows without a parseable date are rejected (caller counts them).
// =============================================================================

#include <optional>
#include <string>
#include <utility>

#include "raw_row.hpp"
#include "transaction.hpp"
#include "../narration/narration_resolver.hpp"
#include "../narration/sbi_parser.hpp"

namespace stmt {

// refunded / cancelled / failed / completed; anything else lower-cased
std::string normalize_status(const std::string& status);

// upi, pos, atm, neft, imps, inb, card or unknown
std::string infer_payment_method(const std::string& narration);

class RowNormalizer {
public:
    explicit RowNormalizer(std::string default_currency = "INR")
        : default_currency_(std::move(default_currency)) {}

    RowNormalizer(NarrationResolver resolver, std::string default_currency)
        : resolver_(std::move(resolver)), default_currency_(std::move(default_currency)) {}

    // nullopt when no date alias holds a parseable date. The amount may be
    // zero; zero rows are filtered by the batch.
    [[nodiscard]] std::optional<CanonicalTransaction> normalize(const RawRow& row) const;

private:
    NarrationResolver resolver_;
    SbiNarrationParser sbi_;
    std::string default_currency_;
};

} // namespace stmt
