#include <gtest/gtest.h>

#include "ingest/fingerprint.hpp"
#include "utils/sha256.hpp"

using namespace stmt;

namespace {

CanonicalTransaction make_tx(double amount, const std::string& description = "Swiggy order",
                             const std::string& merchant = "Swiggy") {
    CanonicalTransaction tx;
    tx.date = 1707955200;   // 2024-02-15T00:00:00Z
    tx.set_amount(amount);
    tx.description = description;
    tx.merchant = merchant;
    tx.payment_method = "upi";
    return tx;
}

} // namespace

TEST(Fingerprint, PayloadLayout) {
    auto tx = make_tx(-500);
    EXPECT_EQ(fingerprint_payload(fingerprint_fields(tx)),
              "2024-02-15T00:00:00|-500.00|SWIGGY|SWIGGY ORDER|UPI|");
    EXPECT_EQ(compute_fingerprint(tx), SHA256::hex("2024-02-15T00:00:00|-500.00|SWIGGY|SWIGGY ORDER|UPI|"));
    EXPECT_EQ(compute_fingerprint(tx).size(), 64u);
}

TEST(Fingerprint, CosmeticDifferencesDoNotMatter) {
    auto a = make_tx(-500, "Swiggy  order ", "swiggy");
    auto b = make_tx(-500, "SWIGGY ORDER", "Swiggy");
    b.currency = "USD";
    b.category = "Food";
    EXPECT_EQ(compute_fingerprint(a), compute_fingerprint(b));
}

TEST(Fingerprint, IdentityFieldsChangeTheHash) {
    const auto base = compute_fingerprint(make_tx(-500));
    EXPECT_NE(compute_fingerprint(make_tx(-500.01)), base);
    EXPECT_NE(compute_fingerprint(make_tx(500)), base);
    EXPECT_NE(compute_fingerprint(make_tx(-500, "Swiggy order 2")), base);

    auto later = make_tx(-500);
    later.date += 1;
    EXPECT_NE(compute_fingerprint(later), base);

    auto referenced = make_tx(-500);
    referenced.raw_data["reference"] = "REF123";
    EXPECT_NE(compute_fingerprint(referenced), base);
}

TEST(Fingerprint, ReferenceLookup) {
    EXPECT_EQ(reference_of(nlohmann::json{{"reference", "A1"}, {"ref", "B2"}}), "A1");
    EXPECT_EQ(reference_of(nlohmann::json{{"reference", ""}, {"ref", "B2"}}), "B2");
    EXPECT_EQ(reference_of(nlohmann::json{{"ref", 42}}), "42");
    EXPECT_EQ(reference_of(nlohmann::json::object()), "");
    EXPECT_EQ(reference_of(nlohmann::json::array()), "");
}

TEST(ImportBatch, ZeroAmountRowsAreNeverAccepted) {
    ImportBatch batch;
    EXPECT_EQ(batch.admit(make_tx(0.0)), ImportBatch::Admission::ZERO_AMOUNT);
    EXPECT_EQ(batch.skipped_zero_amount(), 1);
    EXPECT_TRUE(batch.rows().empty());
}

TEST(ImportBatch, DuplicatesWithinOneImport) {
    ImportBatch batch;
    EXPECT_EQ(batch.admit(make_tx(-500)), ImportBatch::Admission::ACCEPTED);
    EXPECT_EQ(batch.admit(make_tx(-500)), ImportBatch::Admission::DUPLICATE);
    EXPECT_EQ(batch.admit(make_tx(-501)), ImportBatch::Admission::ACCEPTED);
    EXPECT_EQ(batch.rows().size(), 2u);
    EXPECT_EQ(batch.skipped_duplicates(), 1);
}

TEST(ImportBatch, KnownFingerprintsAreSkipped) {
    const auto stored = compute_fingerprint(make_tx(-500));
    ImportBatch batch({stored});
    EXPECT_EQ(batch.admit(make_tx(-500)), ImportBatch::Admission::DUPLICATE);
    EXPECT_EQ(batch.admit(make_tx(-20)), ImportBatch::Admission::ACCEPTED);
    EXPECT_EQ(batch.skipped_duplicates(), 1);
}

TEST(ImportBatch, AcceptedRowsCarryFingerprintAndId) {
    ImportBatch batch;
    batch.admit(make_tx(-500));

    auto preset = make_tx(-7);
    preset.id = "row-7";
    batch.admit(preset);

    auto rows = batch.take_rows();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].fingerprint, compute_fingerprint(make_tx(-500)));
    EXPECT_EQ(rows[0].id, rows[0].fingerprint);
    EXPECT_EQ(rows[1].id, "row-7");
}

TEST(ImportBatch, AcceptedFingerprintsAreUnique) {
    ImportBatch batch;
    for (int i = 0; i < 50; ++i) batch.admit(make_tx(-(i % 10) - 1.0));
    std::unordered_set<std::string> seen;
    for (const auto& r : batch.rows()) {
        EXPECT_NE(r.amount(), 0.0);
        EXPECT_TRUE(seen.insert(r.fingerprint).second);
    }
    EXPECT_EQ(batch.rows().size(), 10u);
    EXPECT_EQ(batch.skipped_duplicates(), 40);
}

TEST(ImportBatch, NoDateCounter) {
    ImportBatch batch;
    batch.count_no_date();
    batch.count_no_date();
    EXPECT_EQ(batch.skipped_no_date(), 2);
}
