#include "postgres_store.hpp"
#include "../errors.hpp"
#include "../ingest/value_parsers.hpp"
#include "../utils/timer.hpp"

#include <cstdio>
#include <cstdlib>

namespace stmt {

PostgresStore::PostgresStore(PostgresConfig cfg, std::string user_id, long statement_timeout_ms)
    : cfg_(std::move(cfg)), user_id_(std::move(user_id)), statement_timeout_ms_(statement_timeout_ms) {
    if (!valid_identifier(cfg_.schema)) {
        throw ImportError("Invalid postgres schema name: " + cfg_.schema);
    }
}

bool PostgresStore::valid_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return !(name[0] >= '0' && name[0] <= '9');
}

void PostgresStore::connect() {
    char conninfo[512];
    std::snprintf(conninfo, sizeof(conninfo),
        "host=%s port=%u dbname=%s user=%s password=%s "
        "connect_timeout=10 application_name=stmt-ingest",
        cfg_.host.c_str(), cfg_.port, cfg_.database.c_str(),
        cfg_.user.c_str(), cfg_.password.c_str());

    conn_ = PQconnectdb(conninfo);
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string err = PQerrorMessage(conn_);
        LOG_ERR("[postgres] Connection failed: %s", err.c_str());
        PQfinish(conn_);
        conn_ = nullptr;
#ifdef STMT_DRY_RUN
        LOG_INF("[postgres] DRY RUN: simulating connection");
        return;
#endif
        throw NetworkError("Postgres connection failed: " + err);
    }

    LOG_INF("[postgres] Connected to %s:%u/%s (server %s)",
        cfg_.host.c_str(), cfg_.port, cfg_.database.c_str(),
        PQparameterStatus(conn_, "server_version"));

    char sql[96];
    std::snprintf(sql, sizeof(sql), "SET statement_timeout = %ld", statement_timeout_ms_);
    exec_or_throw(sql);
}

void PostgresStore::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresStore::is_connected() const {
#ifdef STMT_DRY_RUN
    return true;
#endif
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PostgresStore::exec(const char* sql) {
#ifdef STMT_DRY_RUN
    LOG_DBG("[postgres] DRY RUN SQL: %s", sql);
    return true;
#endif
    if (!conn_) return false;
    PGresult* res = PQexec(conn_, sql);
    bool ok = (PQresultStatus(res) == PGRES_COMMAND_OK ||
               PQresultStatus(res) == PGRES_TUPLES_OK);
    if (!ok) {
        LOG_ERR("[postgres] SQL error: %s\n  SQL: %s", PQerrorMessage(conn_), sql);
    }
    PQclear(res);
    return ok;
}

void PostgresStore::exec_or_throw(const char* sql) {
    if (!exec(sql)) {
        throw NetworkError(std::string("Postgres statement failed: ") +
                           (conn_ ? PQerrorMessage(conn_) : "not connected"));
    }
}

int64_t PostgresStore::exec_params(const char* sql, const std::vector<std::string>& params) {
#ifdef STMT_DRY_RUN
    LOG_DBG("[postgres] DRY RUN SQL: %s (%zu params)", sql, params.size());
    return 1;
#endif
    if (!conn_) return -1;

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p.c_str());

    PGresult* res = PQexecParams(conn_, sql, static_cast<int>(values.size()),
        nullptr, values.data(), nullptr, nullptr, 0);
    if (PQresultStatus(res) != PGRES_COMMAND_OK) {
        LOG_ERR("[postgres] Insert error: %s", PQerrorMessage(conn_));
        PQclear(res);
        return -1;
    }
    int64_t affected = std::strtoll(PQcmdTuples(res), nullptr, 10);
    PQclear(res);
    return affected;
}

void PostgresStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mu_);
    const char* schema = cfg_.schema.c_str();
    LOG_INF("[postgres] Ensuring schema %s", schema);

    char sql[1024];
    std::snprintf(sql, sizeof(sql), "CREATE SCHEMA IF NOT EXISTS %s", schema);
    exec_or_throw(sql);

    std::snprintf(sql, sizeof(sql),
        "CREATE TABLE IF NOT EXISTS %s.transactions ("
        "  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),"
        "  user_id TEXT NOT NULL,"
        "  transaction_date TIMESTAMPTZ NOT NULL,"
        "  amount NUMERIC(12,2) NOT NULL CHECK (amount <> 0),"
        "  currency VARCHAR(8) NOT NULL DEFAULT 'INR',"
        "  description TEXT NOT NULL,"
        "  merchant_name TEXT,"
        "  category TEXT,"
        "  original_category TEXT,"
        "  payment_method TEXT,"
        "  status TEXT NOT NULL DEFAULT 'completed',"
        "  type TEXT NOT NULL,"
        "  fingerprint TEXT NOT NULL,"
        "  raw_data JSONB,"
        "  created_at TIMESTAMPTZ DEFAULT now(),"
        "  UNIQUE (user_id, fingerprint)"
        ")", schema);
    exec_or_throw(sql);

    std::snprintf(sql, sizeof(sql),
        "CREATE TABLE IF NOT EXISTS %s.uploaded_files ("
        "  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),"
        "  user_id TEXT NOT NULL,"
        "  file_hash TEXT NOT NULL,"
        "  filename TEXT,"
        "  upload_type TEXT NOT NULL DEFAULT 'import',"
        "  uploaded_at TIMESTAMPTZ DEFAULT now(),"
        "  UNIQUE (user_id, file_hash)"
        ")", schema);
    exec_or_throw(sql);
}

InsertCounts PostgresStore::insert_batch(const std::vector<CanonicalTransaction>& records,
                                         const BatchFile& file) {
    std::lock_guard<std::mutex> lock(mu_);
    Timer timer;
    InsertCounts counts;

    const std::string insert_sql =
        "INSERT INTO " + cfg_.schema + ".transactions "
        "(user_id, transaction_date, amount, currency, description, merchant_name, category, "
        " original_category, payment_method, status, type, fingerprint, raw_data) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, NULLIF($8, ''), $9, $10, $11, $12, $13::jsonb) "
        "ON CONFLICT (user_id, fingerprint) DO NOTHING";
    const std::string file_sql =
        "INSERT INTO " + cfg_.schema + ".uploaded_files (user_id, file_hash, filename, upload_type) "
        "VALUES ($1, $2, $3, 'import') ON CONFLICT (user_id, file_hash) DO NOTHING";

    exec_or_throw("BEGIN");

    std::unordered_set<std::string> seen;
    for (const auto& r : records) {
        if (r.amount() == 0.0) {
            ++counts.skipped_zero_amount;
            continue;
        }
        if (!seen.insert(r.fingerprint).second) {
            ++counts.skipped_duplicates;
            continue;
        }

        char amount[64];
        std::snprintf(amount, sizeof(amount), "%.2f", r.amount());
        const int64_t n = exec_params(insert_sql.c_str(), {
            user_id_, format_iso_utc(r.date) + "Z", amount, r.currency, r.description,
            r.merchant, r.category, r.original_category, r.payment_method, r.status,
            tx_type_str(r.type()), r.fingerprint, r.raw_data.dump()});
        if (n < 0) {
            std::string err = conn_ ? PQerrorMessage(conn_) : "not connected";
            exec("ROLLBACK");
            throw NetworkError("Postgres insert failed: " + err);
        }
        if (n == 0) {
            ++counts.skipped_duplicates;
        } else {
            ++counts.inserted;
        }
    }

    if (!file.file_hash.empty() &&
        exec_params(file_sql.c_str(), {user_id_, file.file_hash, file.filename}) < 0) {
        std::string err = conn_ ? PQerrorMessage(conn_) : "not connected";
        exec("ROLLBACK");
        throw NetworkError("Postgres file record failed: " + err);
    }

    exec_or_throw("COMMIT");

    LOG_INF("[postgres] Batch: %lld inserted, %lld duplicates, %lld zero, %lld ms",
        static_cast<long long>(counts.inserted), static_cast<long long>(counts.skipped_duplicates),
        static_cast<long long>(counts.skipped_zero_amount), static_cast<long long>(timer.elapsed_ms()));
    return counts;
}

std::unordered_set<std::string> PostgresStore::load_fingerprints(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mu_);
    std::unordered_set<std::string> out;

#ifdef STMT_DRY_RUN
    LOG_DBG("[postgres] DRY RUN: no stored fingerprints for %s", user_id.c_str());
    return out;
#endif
    if (!conn_) throw NetworkError("Postgres not connected");

    const std::string sql = "SELECT fingerprint FROM " + cfg_.schema + ".transactions WHERE user_id = $1";
    const char* params[1] = {user_id.c_str()};
    PGresult* res = PQexecParams(conn_, sql.c_str(), 1, nullptr, params, nullptr, nullptr, 0);
    if (PQresultStatus(res) != PGRES_TUPLES_OK) {
        std::string err = PQerrorMessage(conn_);
        PQclear(res);
        throw NetworkError("Loading fingerprints failed: " + err);
    }

    const int nrows = PQntuples(res);
    out.reserve(static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; ++i) out.emplace(PQgetvalue(res, i, 0));
    PQclear(res);

    LOG_DBG("[postgres] %d stored fingerprints for %s", nrows, user_id.c_str());
    return out;
}

} // namespace stmt
