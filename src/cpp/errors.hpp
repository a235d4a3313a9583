#pragma once
// Import failure taxonomy. Row-level defects are counted, never thrown;
// everything here is fatal to the import in progress.
#include <cstdint>
#include <stdexcept>
#include <string>

namespace stmt {

class ImportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// File content cannot be turned into rows (malformed JSON, no rows, converter failure)
class FormatError : public ImportError {
public:
    using ImportError::ImportError;
};

// Spreadsheet is password protected and no (or a wrong) password was supplied
class EncryptionError : public ImportError {
public:
    using ImportError::ImportError;
};

// Transport failure or unexpected HTTP status from a collaborator
class NetworkError : public ImportError {
public:
    explicit NetworkError(const std::string& msg, long http_status = 0)
        : ImportError(msg), http_status_(http_status) {}

    [[nodiscard]] long http_status() const noexcept { return http_status_; }

private:
    long http_status_;
};

// A remote call exceeded its deadline
class TimeoutError : public NetworkError {
public:
    explicit TimeoutError(const std::string& msg) : NetworkError(msg, 0) {}
};

// One upload chunk failed; chunks that already succeeded stay committed
class ChunkUploadError : public ImportError {
public:
    ChunkUploadError(const std::string& msg, size_t chunk_index, int64_t committed_rows)
        : ImportError(msg), chunk_index_(chunk_index), committed_rows_(committed_rows) {}

    [[nodiscard]] size_t chunk_index() const noexcept { return chunk_index_; }
    [[nodiscard]] int64_t committed_rows() const noexcept { return committed_rows_; }

private:
    size_t chunk_index_;
    int64_t committed_rows_;
};

} // namespace stmt
