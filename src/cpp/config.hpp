#pragma once
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace stmt {

// Where accepted rows are written
enum class SinkKind { API, POSTGRES };

inline const char* sink_kind_str(SinkKind s) {
    switch (s) {
        case SinkKind::API:      return "api";
        case SinkKind::POSTGRES: return "postgres";
    }
    return "??";
}

inline SinkKind parse_sink_kind(const std::string& s) {
    if (s == "postgres") return SinkKind::POSTGRES;
    return SinkKind::API;
}

// Classifier / feedback gateway
struct ApiEndpoints {
    std::string base_url = "http://localhost:8000";
    std::string classify_path = "/api/v1/classify";
    std::string feedback_path = "/api/v1/feedback";
};

// Web backend hosting the import and decrypt routes
struct WebEndpoints {
    std::string base_url = "http://localhost:3000";
    std::string import_path = "/api/import";
    std::string decrypt_path = "/api/decrypt-xlsx";
};

struct AuthConfig {
    std::string access_token;
    std::string user_id;
};

// Per logical operation deadlines
struct TimeoutConfig {
    long classify_ms = 30000;
    long feedback_ms = 15000;
    long decrypt_ms = 30000;
    long import_ms = 60000;
    long db_statement_ms = 30000;
};

struct UploadConfig {
    size_t chunk_size = 2500;
    size_t concurrency = 3;
    int progress_base = 10;
};

struct PostgresConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user = "postgres";
    std::string password;
    std::string database = "postgres";
    std::string schema = "public";
};

// External converters for formats we do not parse byte-level
struct ToolPaths {
    std::string xlsx2csv = "xlsx2csv";
    std::string xls2csv = "xls2csv";
    std::string pdftotext = "pdftotext";
};

struct IngestConfig {
    ApiEndpoints api;
    WebEndpoints web;
    AuthConfig auth;
    TimeoutConfig timeouts;
    UploadConfig upload;
    PostgresConfig postgres;
    ToolPaths tools;

    SinkKind sink = SinkKind::API;
    std::string default_currency = "INR";
    int64_t cache_ttl_ms = 60 * 1000;
    bool dry_run = false;

    static IngestConfig from_json(const std::string& path);
    static IngestConfig from_json_value(const nlohmann::json& j);

    // STMT_API_URL, STMT_WEB_URL, STMT_ACCESS_TOKEN, STMT_USER_ID
    void apply_env_overrides();
};

inline IngestConfig IngestConfig::from_json(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return IngestConfig{};
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        throw FormatError("Invalid config file " + path + ": " + e.what());
    }
    return from_json_value(j);
}

inline IngestConfig IngestConfig::from_json_value(const nlohmann::json& j) {
    IngestConfig cfg;

    if (j.contains("api")) {
        const auto& a = j["api"];
        cfg.api.base_url = a.value("base_url", cfg.api.base_url);
        cfg.api.classify_path = a.value("classify_path", cfg.api.classify_path);
        cfg.api.feedback_path = a.value("feedback_path", cfg.api.feedback_path);
    }

    if (j.contains("web")) {
        const auto& w = j["web"];
        cfg.web.base_url = w.value("base_url", cfg.web.base_url);
        cfg.web.import_path = w.value("import_path", cfg.web.import_path);
        cfg.web.decrypt_path = w.value("decrypt_path", cfg.web.decrypt_path);
    }

    if (j.contains("auth")) {
        cfg.auth.access_token = j["auth"].value("access_token", cfg.auth.access_token);
        cfg.auth.user_id = j["auth"].value("user_id", cfg.auth.user_id);
    }

    if (j.contains("timeouts_ms")) {
        const auto& t = j["timeouts_ms"];
        cfg.timeouts.classify_ms = t.value("classify", cfg.timeouts.classify_ms);
        cfg.timeouts.feedback_ms = t.value("feedback", cfg.timeouts.feedback_ms);
        cfg.timeouts.decrypt_ms = t.value("decrypt", cfg.timeouts.decrypt_ms);
        cfg.timeouts.import_ms = t.value("import", cfg.timeouts.import_ms);
        cfg.timeouts.db_statement_ms = t.value("db_statement", cfg.timeouts.db_statement_ms);
    }

    if (j.contains("upload")) {
        const auto& u = j["upload"];
        cfg.upload.chunk_size = u.value("chunk_size", cfg.upload.chunk_size);
        cfg.upload.concurrency = u.value("concurrency", cfg.upload.concurrency);
        cfg.upload.progress_base = u.value("progress_base", cfg.upload.progress_base);
    }
    if (cfg.upload.chunk_size == 0) cfg.upload.chunk_size = 1;
    if (cfg.upload.concurrency == 0) cfg.upload.concurrency = 1;

    if (j.contains("postgres")) {
        const auto& p = j["postgres"];
        cfg.postgres.host = p.value("host", cfg.postgres.host);
        cfg.postgres.port = p.value("port", cfg.postgres.port);
        cfg.postgres.user = p.value("user", cfg.postgres.user);
        cfg.postgres.password = p.value("password", cfg.postgres.password);
        cfg.postgres.database = p.value("database", cfg.postgres.database);
        cfg.postgres.schema = p.value("schema", cfg.postgres.schema);
    }

    if (j.contains("tools")) {
        const auto& t = j["tools"];
        cfg.tools.xlsx2csv = t.value("xlsx2csv", cfg.tools.xlsx2csv);
        cfg.tools.xls2csv = t.value("xls2csv", cfg.tools.xls2csv);
        cfg.tools.pdftotext = t.value("pdftotext", cfg.tools.pdftotext);
    }

    cfg.sink = parse_sink_kind(j.value("sink", std::string(sink_kind_str(cfg.sink))));
    cfg.default_currency = j.value("default_currency", cfg.default_currency);
    cfg.cache_ttl_ms = j.value("cache_ttl_ms", cfg.cache_ttl_ms);
    cfg.dry_run = j.value("dry_run", cfg.dry_run);

    return cfg;
}

inline void IngestConfig::apply_env_overrides() {
    if (const char* v = std::getenv("STMT_API_URL"); v && *v) api.base_url = v;
    if (const char* v = std::getenv("STMT_WEB_URL"); v && *v) web.base_url = v;
    if (const char* v = std::getenv("STMT_ACCESS_TOKEN"); v && *v) auth.access_token = v;
    if (const char* v = std::getenv("STMT_USER_ID"); v && *v) auth.user_id = v;
}

} // namespace stmt
