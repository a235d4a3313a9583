#include <gtest/gtest.h>

#include "classify/fallback_classifier.hpp"
#include "classify/keyword_classifier.hpp"
#include "fakes.hpp"
#include "ingest/import_pipeline.hpp"
#include "utils/sha256.hpp"

using namespace stmt;
using namespace stmt::testing;

namespace {

const char* kStatementCsv =
    "Date,Description,Amount\n"
    "15/02/2024,SOME SHOP,-500\n"
    "16/02/2024,UBER TRIP,-250\n"
    "17/02/2024,SOME SHOP,-75\n"
    "not a date,BROKEN ROW,10\n"
    "18/02/2024,NOTHING,0\n"
    "15/02/2024,SOME SHOP,-500\n";

std::vector<char> ole2_bytes() {
    return {'\xD0', '\xCF', '\x11', '\xE0', '\xA1', '\xB1', '\x1A', '\xE1', 'x', 'y'};
}

} // namespace

class ImportPipelineTest : public ::testing::Test {
protected:
    ImportPipelineTest() {
        cfg.upload.chunk_size = 2;
        cfg.upload.concurrency = 2;
    }

    ImportPipeline make(Classifier& c, Decryptor* decryptor = nullptr) {
        return ImportPipeline(cfg, sheets, pdf, c, decryptor, &sink);
    }

    IngestConfig cfg;
    FakeSpreadsheetReader sheets;
    FakePdfReader pdf;
    ThrowingClassifier remote;
    KeywordClassifier keywords;
    FallbackClassifier fallback{remote, keywords};
    MemorySink sink;
};

TEST_F(ImportPipelineTest, CsvStatementEndToEnd) {
    auto pipeline = make(fallback);
    const auto bytes = bytes_of(kStatementCsv);

    ImportResult r = pipeline.run(bytes, "/tmp/uploads/feb.csv", "", {});
    const ImportSummary& s = r.summary;

    EXPECT_EQ(s.filename, "feb.csv");
    EXPECT_EQ(s.file_kind, FileKind::CSV);
    EXPECT_EQ(s.file_hash, SHA256::hex(bytes));
    EXPECT_EQ(s.rows_parsed, 6);
    EXPECT_EQ(s.skipped_no_date, 1);
    EXPECT_EQ(s.skipped_zero_amount, 1);
    EXPECT_EQ(s.skipped_duplicates, 1);
    EXPECT_EQ(s.accepted, 3);
    EXPECT_EQ(s.imported, 3);
    EXPECT_EQ(s.classifier_used, "keywords");
    EXPECT_EQ(remote.calls, 1);

    ASSERT_EQ(r.rows.size(), 3u);
    EXPECT_EQ(r.rows[1].category, "Transport");
    EXPECT_EQ(r.rows[0].category, "Uncategorized");
    EXPECT_DOUBLE_EQ(r.rows[0].amount(), -500.0);

    EXPECT_EQ(sink.stored.size(), 3u);
    ASSERT_FALSE(sink.files.empty());
    EXPECT_EQ(sink.files[0].filename, "feb.csv");
    EXPECT_EQ(sink.files[0].file_hash, s.file_hash);
}

TEST_F(ImportPipelineTest, ReimportWithKnownFingerprintsAcceptsNothing) {
    auto pipeline = make(fallback);
    const auto bytes = bytes_of(kStatementCsv);
    pipeline.run(bytes, "feb.csv", "", {});
    const int classify_calls = remote.calls;

    ImportResult again = pipeline.run(bytes, "feb.csv", "", sink.fingerprints);
    EXPECT_EQ(again.summary.accepted, 0);
    EXPECT_EQ(again.summary.imported, 0);
    EXPECT_EQ(again.summary.skipped_duplicates, 4);
    EXPECT_EQ(again.summary.classifier_used, "none");
    EXPECT_EQ(remote.calls, classify_calls);
    EXPECT_EQ(sink.stored.size(), 3u);
}

TEST_F(ImportPipelineTest, SinkReportedDuplicatesAreAddedToTheSummary) {
    auto pipeline = make(fallback);
    const auto bytes = bytes_of(kStatementCsv);
    pipeline.run(bytes, "feb.csv", "", {});

    // no known set: the store's unique constraint catches the repeats
    ImportResult again = pipeline.run(bytes, "feb.csv", "", {});
    EXPECT_EQ(again.summary.accepted, 3);
    EXPECT_EQ(again.summary.imported, 0);
    EXPECT_EQ(again.summary.skipped_duplicates, 1 + 3);
}

TEST_F(ImportPipelineTest, ScriptedClassifierCategorizesEveryRowOfAGroup) {
    ScriptedClassifier scripted(std::map<std::string, std::string>{{"Some Shop", "Shopping"}});
    auto pipeline = make(scripted);

    ImportResult r = pipeline.run(bytes_of(kStatementCsv), "feb.csv", "", {}, false);
    EXPECT_EQ(r.summary.classifier_used, "scripted");
    ASSERT_EQ(scripted.requests.size(), 1u);
    EXPECT_EQ(scripted.requests[0].size(), 2u);
    EXPECT_EQ(r.rows[0].category, "Shopping");
    EXPECT_EQ(r.rows[2].category, "Shopping");
}

TEST_F(ImportPipelineTest, UploadCanBeSkipped) {
    auto pipeline = make(fallback);
    ImportResult r = pipeline.run(bytes_of(kStatementCsv), "feb.csv", "", {}, false);
    EXPECT_EQ(r.summary.accepted, 3);
    EXPECT_EQ(r.summary.imported, 0);
    EXPECT_TRUE(sink.stored.empty());
}

TEST_F(ImportPipelineTest, ProgressEndsAtOneHundred) {
    auto pipeline = make(fallback);
    std::vector<int> seen;
    pipeline.run(bytes_of(kStatementCsv), "feb.csv", "", {}, true,
                 [&](int percent) { seen.push_back(percent); });
    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_EQ(seen.back(), 100);
}

TEST_F(ImportPipelineTest, ByteOrderMarkIsIgnored) {
    auto pipeline = make(fallback);
    ImportResult r = pipeline.run(bytes_of("\xEF\xBB\xBF" "Date,Description,Amount\n15/02/2024,SOME SHOP,-5\n"),
                                  "bom.csv", "", {}, false);
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_EQ(format_iso_utc(r.rows[0].date), "2024-02-15T00:00:00");
}

TEST_F(ImportPipelineTest, JsonTransactionsObject) {
    auto pipeline = make(fallback);
    ImportResult r = pipeline.run(
        bytes_of(R"({"transactions": [{"date": "2024-02-15", "description": "Groceries", "amount": -250}]})"),
        "export.json", "", {}, false);
    EXPECT_EQ(r.summary.file_kind, FileKind::JSON);
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_DOUBLE_EQ(r.rows[0].amount(), -250.0);
}

TEST_F(ImportPipelineTest, EmptyFileHasNoRows) {
    auto pipeline = make(fallback);
    try {
        pipeline.run(bytes_of("Date,Amount\n"), "/x/empty.csv", "", {});
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_STREQ(e.what(), "No rows found in empty.csv");
    }
}

TEST_F(ImportPipelineTest, UnsupportedExtension) {
    auto pipeline = make(fallback);
    EXPECT_THROW(pipeline.run(bytes_of("abc"), "notes.docx", "", {}), FormatError);
}

TEST_F(ImportPipelineTest, SpreadsheetGoesThroughTheReader) {
    sheets.grid = {
        {"STATE BANK OF INDIA", "", ""},
        {"Txn Date", "Description", "Debit"},
        {"15/02/2024", "SOME SHOP", "500"},
    };
    auto pipeline = make(fallback);
    const auto bytes = bytes_of("PK\x03\x04workbook");

    ImportResult r = pipeline.run(bytes, "statement.xlsx", "", {}, false);
    EXPECT_EQ(r.summary.file_kind, FileKind::EXCEL);
    EXPECT_EQ(sheets.calls, 1);
    EXPECT_EQ(sheets.last_extension, "xlsx");
    EXPECT_EQ(sheets.last_bytes, bytes);
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_DOUBLE_EQ(r.rows[0].amount(), -500.0);
}

TEST_F(ImportPipelineTest, PdfNeedsItsSignature) {
    auto pipeline = make(fallback);
    EXPECT_THROW(pipeline.run(bytes_of("not really"), "statement.pdf", "", {}), FormatError);

    pdf.text = "Date\tDescription\tAmount\n15/02/2024\tSOME SHOP\t-42\n";
    ImportResult r = pipeline.run(bytes_of("%PDF-1.7\n..."), "statement.pdf", "", {}, false);
    EXPECT_EQ(r.summary.file_kind, FileKind::PDF);
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_DOUBLE_EQ(r.rows[0].amount(), -42.0);
}

TEST_F(ImportPipelineTest, EncryptedWorkbookNeedsAPassword) {
    sheets.grid = {{"Date", "Description", "Amount"}, {"15/02/2024", "SOME SHOP", "-1"}};
    const std::vector<char> plain = bytes_of("PK\x03\x04plain");
    FakeDecryptor decryptor("hunter2", plain);

    {
        auto no_service = make(fallback, nullptr);
        EXPECT_THROW(no_service.run(ole2_bytes(), "locked.xlsx", "hunter2", {}), EncryptionError);
    }

    auto pipeline = make(fallback, &decryptor);
    EXPECT_THROW(pipeline.run(ole2_bytes(), "locked.xlsx", "", {}), EncryptionError);
    EXPECT_EQ(decryptor.calls, 0);

    try {
        pipeline.run(ole2_bytes(), "locked.xlsx", "wrong", {});
        FAIL() << "expected EncryptionError";
    } catch (const EncryptionError& e) {
        EXPECT_STREQ(e.what(), "Incorrect password");
    }

    ImportResult r = pipeline.run(ole2_bytes(), "locked.xlsx", "hunter2", {}, false);
    EXPECT_EQ(sheets.last_bytes, plain);
    EXPECT_EQ(r.rows.size(), 1u);
    EXPECT_EQ(r.summary.file_hash, SHA256::hex(ole2_bytes()));
}

TEST_F(ImportPipelineTest, OldExcelIsNeverDecrypted) {
    sheets.grid = {{"Date", "Description", "Amount"}, {"15/02/2024", "SOME SHOP", "-1"}};
    FakeDecryptor decryptor("pw", {});
    auto pipeline = make(fallback, &decryptor);

    // .xls files are OLE2 containers by nature
    ImportResult r = pipeline.run(ole2_bytes(), "old.xls", "", {}, false);
    EXPECT_EQ(decryptor.calls, 0);
    EXPECT_EQ(sheets.last_extension, "xls");
    EXPECT_EQ(r.rows.size(), 1u);
}
