#include "import_pipeline.hpp"
#include "table_extractor.hpp"
#include "../classify/classification_resolver.hpp"
#include "../errors.hpp"
#include "../utils/logger.hpp"
#include "../utils/sha256.hpp"
#include "../utils/timer.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace stmt {

namespace {

// Text view of the bytes without a UTF-8 byte-order mark
std::string as_text(const std::vector<char>& bytes) {
    size_t skip = 0;
    if (bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xEF &&
        static_cast<unsigned char>(bytes[1]) == 0xBB && static_cast<unsigned char>(bytes[2]) == 0xBF) {
        skip = 3;
    }
    return std::string(bytes.begin() + static_cast<std::ptrdiff_t>(skip), bytes.end());
}

std::string base_name(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

} // namespace

std::vector<char> read_file_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw FormatError("Cannot open " + path);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

ImportPipeline::ImportPipeline(const IngestConfig& cfg,
                               SpreadsheetReader& sheets,
                               PdfTextReader& pdf,
                               Classifier& classifier,
                               Decryptor* decryptor,
                               ImportSink* sink)
    : cfg_(cfg), sheets_(sheets), pdf_(pdf), classifier_(classifier),
      decryptor_(decryptor), sink_(sink), normalizer_(cfg.default_currency) {}

std::vector<char> ImportPipeline::unlock_workbook(const std::vector<char>& bytes,
                                                  const std::string& filename,
                                                  const std::string& password) {
    if (password.empty()) {
        throw EncryptionError("This file is password protected: password required");
    }
    if (!decryptor_) {
        throw EncryptionError("This file is password protected and no decryption service is configured");
    }

    std::vector<char> plain = decryptor_->decrypt(bytes, filename, password);
    if (has_ole2_signature(plain)) {
        throw EncryptionError("Incorrect password");
    }
    LOG_INF("[import] %s decrypted (%zu bytes)", filename.c_str(), plain.size());
    return plain;
}

std::vector<RawRow> ImportPipeline::extract_rows(const std::vector<char>& bytes,
                                                 const std::string& filename,
                                                 const std::string& password,
                                                 FileKind& kind_out) {
    const FileKind kind = detect_file_kind(filename);
    kind_out = kind;
    const std::string ext = file_extension(filename);

    switch (kind) {
        case FileKind::CSV:
        case FileKind::TEXT:
            return extract_delimited(as_text(bytes));

        case FileKind::JSON:
            return extract_json(as_text(bytes));

        case FileKind::PDF:
            if (!has_pdf_signature(bytes)) {
                throw FormatError(filename + " is not a PDF document");
            }
            return extract_delimited(pdf_.read_text(bytes));

        case FileKind::EXCEL: {
            const bool encrypted = (ext == "xlsx" || ext == "xlsm") && has_ole2_signature(bytes);
            if (encrypted) {
                std::vector<char> plain = unlock_workbook(bytes, filename, password);
                return extract_grid(sheets_.read_first_sheet(plain, ext));
            }
            return extract_grid(sheets_.read_first_sheet(bytes, ext));
        }

        case FileKind::UNKNOWN:
            break;
    }
    throw FormatError("Unsupported file type: " + filename);
}

ImportResult ImportPipeline::run(const std::vector<char>& bytes,
                                 const std::string& filename,
                                 const std::string& password,
                                 const std::unordered_set<std::string>& known_fingerprints,
                                 bool upload,
                                 const ProgressFn& on_progress) {
    ImportResult result;
    ImportSummary& s = result.summary;
    s.filename = base_name(filename);
    s.file_hash = SHA256::hex(bytes);

    // 1-2: detect and extract
    std::vector<RawRow> raw;
    {
        ScopedStageTimer t(s.timings.extract_ms);
        raw = extract_rows(bytes, filename, password, s.file_kind);
    }
    if (raw.empty()) {
        throw FormatError("No rows found in " + s.filename);
    }
    s.rows_parsed = static_cast<int64_t>(raw.size());
    LOG_INF("[import] %s: %zu %s rows", s.filename.c_str(), raw.size(), file_kind_str(s.file_kind));

    // 3-6: normalize, fingerprint, dedup
    ImportBatch batch(known_fingerprints);
    {
        ScopedStageTimer t(s.timings.normalize_ms);
        for (const auto& row : raw) {
            auto tx = normalizer_.normalize(row);
            if (!tx) {
                batch.count_no_date();
                continue;
            }
            batch.admit(std::move(*tx));
        }
    }
    s.skipped_no_date = batch.skipped_no_date();
    s.skipped_zero_amount = batch.skipped_zero_amount();
    s.skipped_duplicates = batch.skipped_duplicates();
    result.rows = batch.take_rows();
    s.accepted = static_cast<int64_t>(result.rows.size());

    LOG_INF("[import] accepted %lld (no date %lld, zero %lld, duplicate %lld)",
        static_cast<long long>(s.accepted), static_cast<long long>(s.skipped_no_date),
        static_cast<long long>(s.skipped_zero_amount), static_cast<long long>(s.skipped_duplicates));

    if (result.rows.empty()) {
        s.classifier_used = "none";
        return result;
    }

    // 7: classify
    {
        ScopedStageTimer t(s.timings.classify_ms);
        ClassificationResolver resolver(classifier_);
        s.classifier_used = resolver.classify(result.rows).classifier_used;
    }

    // 8: upload
    if (upload && sink_) {
        ScopedStageTimer t(s.timings.upload_ms);
        BatchUploader uploader(*sink_, cfg_.upload.chunk_size, cfg_.upload.concurrency,
                               cfg_.upload.progress_base);
        InsertCounts counts = uploader.upload(result.rows, BatchFile{s.filename, s.file_hash}, on_progress);
        s.imported = counts.inserted;
        s.skipped_duplicates += counts.skipped_duplicates;
        s.skipped_zero_amount += counts.skipped_zero_amount;
    }
    return result;
}

} // namespace stmt
