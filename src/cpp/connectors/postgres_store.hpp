#pragma once
// PostgreSQL-backed ImportSink (libpq C API)
//
// Tables (in the configured schema):
//   transactions   -- UNIQUE(user_id, fingerprint) makes re-imports idempotent
//   uploaded_files -- one row per (user_id, file_hash)
// One connection per store; a mutex serializes it so uploader chunks may call
// insert_batch concurrently.
#include "import_sink.hpp"
#include "../config.hpp"

#include <mutex>
#include <unordered_set>
#include <libpq-fe.h>

namespace stmt {

class PostgresStore : public ImportSink {
public:
    PostgresStore(PostgresConfig cfg, std::string user_id, long statement_timeout_ms = 30000);
    ~PostgresStore() override { disconnect(); }

    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

    // Throws NetworkError when the server is unreachable
    void connect();
    void disconnect();
    [[nodiscard]] bool is_connected() const;

    // CREATE SCHEMA / TABLE IF NOT EXISTS
    void ensure_schema();

    // Zero amounts and in-request repeats are skipped; rows hitting the unique
    // key count as duplicates. All rows of one call commit together.
    InsertCounts insert_batch(const std::vector<CanonicalTransaction>& records,
                              const BatchFile& file) override;

    // Fingerprints already stored for a user
    std::unordered_set<std::string> load_fingerprints(const std::string& user_id);

    [[nodiscard]] const char* sink_name() const override { return "postgres"; }

    // Schema names are interpolated into DDL, so only [A-Za-z0-9_] is accepted
    static bool valid_identifier(const std::string& name);

private:
    PostgresConfig cfg_;
    std::string user_id_;
    long statement_timeout_ms_;
    PGconn* conn_ = nullptr;
    std::mutex mu_;

    // Execute SQL with error checking, returns true on success
    bool exec(const char* sql);
    void exec_or_throw(const char* sql);
    // Parameterized statement; returns affected row count or -1 on error
    int64_t exec_params(const char* sql, const std::vector<std::string>& params);
};

} // namespace stmt
