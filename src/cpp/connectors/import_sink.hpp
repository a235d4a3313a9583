#pragma once
// Boundary contracts of the external collaborators: persistence, file
// decryption and category feedback.
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../ingest/transaction.hpp"
#include "../utils/logger.hpp"

namespace stmt {

// Per-request outcome reported by a sink
struct InsertCounts {
    int64_t inserted = 0;
    int64_t skipped_duplicates = 0;
    int64_t skipped_zero_amount = 0;

    InsertCounts& operator+=(const InsertCounts& o) {
        inserted += o.inserted;
        skipped_duplicates += o.skipped_duplicates;
        skipped_zero_amount += o.skipped_zero_amount;
        return *this;
    }
};

// Source file a batch came from
struct BatchFile {
    std::string filename;
    std::string file_hash;   // hex SHA-256 of the uploaded bytes
};

// Persistence store. Implementations must accept concurrent calls.
class ImportSink {
public:
    virtual ~ImportSink() = default;

    virtual InsertCounts insert_batch(const std::vector<CanonicalTransaction>& records,
                                      const BatchFile& file) = 0;

    [[nodiscard]] virtual const char* sink_name() const = 0;
};

// Turns a password-protected workbook into a plain one
class Decryptor {
public:
    virtual ~Decryptor() = default;

    virtual std::vector<char> decrypt(const std::vector<char>& bytes,
                                      const std::string& filename,
                                      const std::string& password) = 0;
};

// Receives description -> category corrections
class FeedbackSink {
public:
    virtual ~FeedbackSink() = default;

    virtual void submit(const std::map<std::string, std::string>& corrections) = 0;
};

// --dry-run: logs what would be written and reports every row as inserted
class DryRunSink : public ImportSink {
public:
    InsertCounts insert_batch(const std::vector<CanonicalTransaction>& records,
                              const BatchFile& file) override {
        LOG_INF("[dry-run] would insert %zu rows from %s (%s)",
            records.size(), file.filename.c_str(), file.file_hash.substr(0, 12).c_str());
        InsertCounts c;
        c.inserted = static_cast<int64_t>(records.size());
        return c;
    }

    [[nodiscard]] const char* sink_name() const override { return "dry-run"; }
};

} // namespace stmt
