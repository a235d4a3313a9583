#pragma once
// =============================================================================
// Transaction fingerprints and in-import deduplication
//
// fingerprint = hex SHA-256 of
//   "<YYYY-MM-DDTHH:MM:SS>|<amount %.2f>|MERCHANT|DESCRIPTION|PAYMENT|REFERENCE"
// Text fields are trimmed, whitespace runs collapsed and upper-cased, so
// cosmetic differences between two exports of the same statement do not
// defeat deduplication. Currency is not part of the key.
// =============================================================================

#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "transaction.hpp"

namespace stmt {

struct FingerprintFields {
    UnixSeconds date = 0;
    double amount = 0.0;
    std::string merchant;
    std::string description;
    std::string payment_method;
    std::string reference;
};

// raw_data.reference, else raw_data.ref, else ""
std::string reference_of(const nlohmann::json& raw_data);

FingerprintFields fingerprint_fields(const CanonicalTransaction& tx);

// Pre-hash text, exposed for debugging duplicate reports
std::string fingerprint_payload(const FingerprintFields& f);

std::string compute_fingerprint(const FingerprintFields& f);
std::string compute_fingerprint(const CanonicalTransaction& tx);

// Accepted rows of one import plus the fingerprints they are checked against.
// Single owner; not thread-safe.
class ImportBatch {
public:
    enum class Admission { ACCEPTED, DUPLICATE, ZERO_AMOUNT };

    ImportBatch() = default;
    explicit ImportBatch(std::unordered_set<std::string> known_fingerprints)
        : known_(std::move(known_fingerprints)) {}

    // Fingerprints tx (when it has none yet) and accepts it unless the amount
    // is zero or the fingerprint was already stored or seen in this batch
    Admission admit(CanonicalTransaction tx);

    void count_no_date() { ++skipped_no_date_; }

    [[nodiscard]] const std::vector<CanonicalTransaction>& rows() const { return rows_; }
    [[nodiscard]] std::vector<CanonicalTransaction>& rows() { return rows_; }
    std::vector<CanonicalTransaction> take_rows() { return std::move(rows_); }

    [[nodiscard]] int64_t skipped_duplicates() const { return skipped_duplicates_; }
    [[nodiscard]] int64_t skipped_zero_amount() const { return skipped_zero_amount_; }
    [[nodiscard]] int64_t skipped_no_date() const { return skipped_no_date_; }

private:
    std::unordered_set<std::string> known_;
    std::unordered_set<std::string> seen_;
    std::vector<CanonicalTransaction> rows_;
    int64_t skipped_duplicates_ = 0;
    int64_t skipped_zero_amount_ = 0;
    int64_t skipped_no_date_ = 0;
};

} // namespace stmt
