#pragma once
// =============================================================================
// Import Pipeline: file bytes -> deduplicated, categorized, uploaded rows
//
//   detect kind -> (decrypt) -> extract rows -> normalize -> fingerprint/dedup
//   -> classify -> upload
//
// Everything except the upload runs on the caller's thread. Known
// fingerprints are supplied by the caller (see TransactionCache); imports for
// the same user must not overlap.
// =============================================================================

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "batch_uploader.hpp"
#include "fingerprint.hpp"
#include "format_detector.hpp"
#include "row_normalizer.hpp"
#include "spreadsheet_reader.hpp"
#include "../classify/classifier.hpp"
#include "../config.hpp"
#include "../connectors/import_sink.hpp"

namespace stmt {

struct StageTimings {
    int64_t extract_ms = 0;
    int64_t normalize_ms = 0;
    int64_t classify_ms = 0;
    int64_t upload_ms = 0;
};

struct ImportSummary {
    std::string filename;
    FileKind file_kind = FileKind::UNKNOWN;
    std::string file_hash;
    int64_t rows_parsed = 0;
    int64_t skipped_no_date = 0;
    int64_t skipped_zero_amount = 0;
    int64_t skipped_duplicates = 0;
    int64_t accepted = 0;         // rows that survived local dedup
    int64_t imported = 0;         // rows the sink reports as inserted
    std::string classifier_used;
    StageTimings timings;
};

struct ImportResult {
    ImportSummary summary;
    std::vector<CanonicalTransaction> rows;
};

class ImportPipeline {
public:
    // decryptor and sink may be null: encrypted files are then rejected and
    // nothing is uploaded
    ImportPipeline(const IngestConfig& cfg,
                   SpreadsheetReader& sheets,
                   PdfTextReader& pdf,
                   Classifier& classifier,
                   Decryptor* decryptor,
                   ImportSink* sink);

    // Stages 1-2. Throws FormatError / EncryptionError.
    std::vector<RawRow> extract_rows(const std::vector<char>& bytes,
                                     const std::string& filename,
                                     const std::string& password,
                                     FileKind& kind_out);

    // Full run. upload=false stops after classification (--print).
    ImportResult run(const std::vector<char>& bytes,
                     const std::string& filename,
                     const std::string& password,
                     const std::unordered_set<std::string>& known_fingerprints,
                     bool upload = true,
                     const ProgressFn& on_progress = {});

private:
    const IngestConfig& cfg_;
    SpreadsheetReader& sheets_;
    PdfTextReader& pdf_;
    Classifier& classifier_;
    Decryptor* decryptor_;
    ImportSink* sink_;
    RowNormalizer normalizer_;

    std::vector<char> unlock_workbook(const std::vector<char>& bytes,
                                      const std::string& filename,
                                      const std::string& password);
};

// Reads a whole file; throws FormatError when it cannot be opened
std::vector<char> read_file_bytes(const std::string& path);

} // namespace stmt
