#include "fingerprint.hpp"
#include "../utils/sha256.hpp"
#include "../utils/text.hpp"

#include <cstdio>

namespace stmt {

namespace {

std::string canonical_text(const std::string& s) {
    return text::to_upper(text::collapse_whitespace(s));
}

std::string json_scalar_text(const nlohmann::json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

} // namespace

std::string reference_of(const nlohmann::json& raw_data) {
    if (!raw_data.is_object()) return "";
    for (const char* key : {"reference", "ref"}) {
        auto it = raw_data.find(key);
        if (it == raw_data.end()) continue;
        std::string v = json_scalar_text(*it);
        if (!v.empty()) return v;
    }
    return "";
}

FingerprintFields fingerprint_fields(const CanonicalTransaction& tx) {
    FingerprintFields f;
    f.date = tx.date;
    f.amount = tx.amount();
    f.merchant = tx.merchant;
    f.description = tx.description;
    f.payment_method = tx.payment_method;
    f.reference = reference_of(tx.raw_data);
    return f;
}

std::string fingerprint_payload(const FingerprintFields& f) {
    char amount[64];
    std::snprintf(amount, sizeof(amount), "%.2f", f.amount);

    std::string payload = format_iso_utc(f.date).substr(0, 19);
    payload += '|';
    payload += amount;
    payload += '|';
    payload += canonical_text(f.merchant);
    payload += '|';
    payload += canonical_text(f.description);
    payload += '|';
    payload += canonical_text(f.payment_method);
    payload += '|';
    payload += canonical_text(f.reference);
    return payload;
}

std::string compute_fingerprint(const FingerprintFields& f) {
    return SHA256::hex(fingerprint_payload(f));
}

std::string compute_fingerprint(const CanonicalTransaction& tx) {
    return compute_fingerprint(fingerprint_fields(tx));
}

ImportBatch::Admission ImportBatch::admit(CanonicalTransaction tx) {
    if (tx.amount() == 0.0) {
        ++skipped_zero_amount_;
        return Admission::ZERO_AMOUNT;
    }

    if (tx.fingerprint.empty()) tx.fingerprint = compute_fingerprint(tx);
    if (known_.count(tx.fingerprint) || !seen_.insert(tx.fingerprint).second) {
        ++skipped_duplicates_;
        return Admission::DUPLICATE;
    }

    if (tx.id.empty()) tx.id = tx.fingerprint;
    rows_.push_back(std::move(tx));
    return Admission::ACCEPTED;
}

} // namespace stmt
