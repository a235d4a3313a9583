// =============================================================================
// stmt-ingest -- bank statement import
//
// Reads one statement export (CSV/TSV, XLS/XLSX, JSON, TXT or PDF), turns each
// row into a canonical transaction, drops rows already stored, categorizes
// the rest and uploads them to the web backend or straight into PostgreSQL.
//
// External tools: xlsx2csv, xls2csv, pdftotext (only for those formats).
// =============================================================================

#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <unordered_set>

#include <curl/curl.h>

#include "config.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"
#include "classify/fallback_classifier.hpp"
#include "classify/keyword_classifier.hpp"
#include "classify/remote_classifier.hpp"
#include "connectors/decrypt_client.hpp"
#include "connectors/http_client.hpp"
#include "connectors/import_api_client.hpp"
#include "connectors/postgres_store.hpp"
#include "ingest/import_pipeline.hpp"
#include "ingest/transaction_cache.hpp"

namespace {

// Process-wide libcurl state
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s --file PATH [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --file PATH         Statement export to import (required)\n"
        "  --config PATH       JSON config file (default: built-in defaults)\n"
        "  --password PW       Password for an encrypted .xlsx workbook\n"
        "  --sink api|postgres Where accepted rows are written (default: api)\n"
        "  --user ID           User the rows belong to (postgres sink)\n"
        "  --keywords-only     Classify with the local keyword table only\n"
        "  --dry-run           Run every stage but log instead of writing\n"
        "  --print             Write canonical rows as JSON to stdout, no upload\n"
        "  --verbose           Enable debug logging\n"
        "  --log-level LEVEL   debug, info, warn or error (default: info)\n"
        "  --help              Show this help\n"
        "\n"
        "Environment: STMT_API_URL, STMT_WEB_URL, STMT_ACCESS_TOKEN, STMT_USER_ID\n"
        "Exit codes: 0 ok, 1 usage, 2 import failed, 3 password required/incorrect\n",
        prog);
}

void print_summary(const stmt::ImportSummary& s) {
    std::printf("\n%-28s %s\n", "File", s.filename.c_str());
    std::printf("%-28s %s\n", "Kind", stmt::file_kind_str(s.file_kind));
    std::printf("%-28s %.16s...\n", "SHA-256", s.file_hash.c_str());
    std::printf("%.48s\n", "------------------------------------------------");
    std::printf("%-28s %10lld\n", "Rows parsed", static_cast<long long>(s.rows_parsed));
    std::printf("%-28s %10lld\n", "Skipped (no date)", static_cast<long long>(s.skipped_no_date));
    std::printf("%-28s %10lld\n", "Skipped (zero amount)", static_cast<long long>(s.skipped_zero_amount));
    std::printf("%-28s %10lld\n", "Skipped (duplicate)", static_cast<long long>(s.skipped_duplicates));
    std::printf("%-28s %10lld\n", "Imported", static_cast<long long>(s.imported));
    std::printf("%-28s %10s\n", "Classifier", s.classifier_used.c_str());
    std::printf("%.48s\n", "------------------------------------------------");
    std::printf("%-28s %7lld ms\n", "Extract", static_cast<long long>(s.timings.extract_ms));
    std::printf("%-28s %7lld ms\n", "Normalize + dedup", static_cast<long long>(s.timings.normalize_ms));
    std::printf("%-28s %7lld ms\n", "Classify", static_cast<long long>(s.timings.classify_ms));
    std::printf("%-28s %7lld ms\n", "Upload", static_cast<long long>(s.timings.upload_ms));
}

} // namespace

int main(int argc, char* argv[]) {
    std::string file_path;
    std::string config_path;
    std::string password;
    std::string sink_name;
    std::string user_id;
    bool dry_run = false;
    bool print_only = false;
    bool keywords_only = false;

#ifdef STMT_DRY_RUN
    dry_run = true;
#endif

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            file_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--password") == 0 && i + 1 < argc) {
            password = argv[++i];
        } else if (std::strcmp(argv[i], "--sink") == 0 && i + 1 < argc) {
            sink_name = argv[++i];
            if (sink_name != "api" && sink_name != "postgres") {
                std::fprintf(stderr, "Invalid sink: %s\n", sink_name.c_str());
                return 1;
            }
        } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            user_id = argv[++i];
        } else if (std::strcmp(argv[i], "--keywords-only") == 0) {
            keywords_only = true;
        } else if (std::strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (std::strcmp(argv[i], "--print") == 0) {
            print_only = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            stmt::g_log_level = stmt::LogLevel::DEBUG;
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            stmt::g_log_level = stmt::parse_log_level(argv[++i]);
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (file_path.empty()) {
        std::fprintf(stderr, "Missing --file\n");
        print_usage(argv[0]);
        return 1;
    }

    stmt::IngestConfig cfg;
    try {
        if (!config_path.empty()) cfg = stmt::IngestConfig::from_json(config_path);
    } catch (const stmt::ImportError& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    cfg.apply_env_overrides();
    if (!sink_name.empty()) cfg.sink = stmt::parse_sink_kind(sink_name);
    if (!user_id.empty()) cfg.auth.user_id = user_id;
    if (dry_run) cfg.dry_run = true;

    if (cfg.sink == stmt::SinkKind::POSTGRES && cfg.auth.user_id.empty() && !print_only) {
        std::fprintf(stderr, "The postgres sink needs --user (or STMT_USER_ID)\n");
        return 1;
    }

    LOG_INF("=== stmt-ingest ===");
    LOG_INF("File: %s, sink: %s%s", file_path.c_str(), stmt::sink_kind_str(cfg.sink),
        cfg.dry_run ? " (dry run)" : "");

    CurlGlobal curl_global;
    stmt::CurlHttpClient http;

    stmt::RemoteClassifier remote(http, cfg);
    stmt::KeywordClassifier keywords;
    stmt::FallbackClassifier fallback(remote, keywords);
    stmt::Classifier& classifier = keywords_only
        ? static_cast<stmt::Classifier&>(keywords)
        : static_cast<stmt::Classifier&>(fallback);

    stmt::DecryptClient decryptor(http, cfg);
    stmt::ConverterSpreadsheetReader sheets(cfg.tools);
    stmt::PdftotextReader pdf(cfg.tools.pdftotext);
    stmt::TransactionCache cache(std::chrono::milliseconds(cfg.cache_ttl_ms));

    try {
        std::unique_ptr<stmt::ImportSink> sink;
        stmt::PostgresStore* store = nullptr;
        std::unordered_set<std::string> known;

        if (print_only) {
            // nothing is written
        } else if (cfg.dry_run) {
            sink = std::make_unique<stmt::DryRunSink>();
        } else if (cfg.sink == stmt::SinkKind::POSTGRES) {
            auto pg = std::make_unique<stmt::PostgresStore>(
                cfg.postgres, cfg.auth.user_id, cfg.timeouts.db_statement_ms);
            pg->connect();
            pg->ensure_schema();
            store = pg.get();
            sink = std::move(pg);
        } else {
            sink = std::make_unique<stmt::ImportApiClient>(http, cfg);
        }

        if (store) {
            if (auto cached = cache.get(cfg.auth.user_id)) {
                known = std::move(*cached);
            } else {
                known = store->load_fingerprints(cfg.auth.user_id);
                cache.put(cfg.auth.user_id, known);
            }
        }

        stmt::ImportPipeline pipeline(cfg, sheets, pdf, classifier, &decryptor, sink.get());
        const std::vector<char> bytes = stmt::read_file_bytes(file_path);

        stmt::ImportResult result = pipeline.run(bytes, file_path, password, known, !print_only,
            [](int pct) { LOG_INF("Upload progress: %d%%", pct); });
        cache.invalidate(cfg.auth.user_id);

        if (print_only) {
            nlohmann::json rows = nlohmann::json::array();
            for (const auto& r : result.rows) rows.push_back(r.to_json());
            std::printf("%s\n", rows.dump(2).c_str());
        } else {
            print_summary(result.summary);
        }
    } catch (const stmt::EncryptionError& e) {
        LOG_ERR("%s", e.what());
        return 3;
    } catch (const stmt::ChunkUploadError& e) {
        LOG_ERR("%s (%lld rows already committed)", e.what(),
            static_cast<long long>(e.committed_rows()));
        return 2;
    } catch (const stmt::ImportError& e) {
        LOG_ERR("Import failed: %s", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERR("Unexpected error: %s", e.what());
        return 2;
    }

    LOG_INF("=== IMPORT COMPLETE ===");
    return 0;
}
