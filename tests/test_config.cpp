#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include "config.hpp"

using namespace stmt;

TEST(Config, DefaultsWhenFileMissing) {
    auto cfg = IngestConfig::from_json("/nonexistent/stmt-ingest.json");
    EXPECT_EQ(cfg.sink, SinkKind::API);
    EXPECT_EQ(cfg.default_currency, "INR");
    EXPECT_EQ(cfg.upload.chunk_size, 2500u);
    EXPECT_EQ(cfg.upload.concurrency, 3u);
    EXPECT_EQ(cfg.upload.progress_base, 10);
    EXPECT_EQ(cfg.timeouts.classify_ms, 30000);
    EXPECT_EQ(cfg.web.import_path, "/api/import");
    EXPECT_EQ(cfg.cache_ttl_ms, 60000);
    EXPECT_FALSE(cfg.dry_run);
}

TEST(Config, SectionsOverrideDefaults) {
    auto j = nlohmann::json::parse(R"({
        "sink": "postgres",
        "default_currency": "USD",
        "api": {"base_url": "http://classifier:9000"},
        "upload": {"chunk_size": 100, "concurrency": 5},
        "timeouts_ms": {"import": 1234},
        "postgres": {"host": "db", "port": 6543, "schema": "ledger"},
        "tools": {"pdftotext": "/opt/poppler/bin/pdftotext"},
        "dry_run": true
    })");
    auto cfg = IngestConfig::from_json_value(j);
    EXPECT_EQ(cfg.sink, SinkKind::POSTGRES);
    EXPECT_EQ(cfg.default_currency, "USD");
    EXPECT_EQ(cfg.api.base_url, "http://classifier:9000");
    EXPECT_EQ(cfg.api.classify_path, "/api/v1/classify");
    EXPECT_EQ(cfg.upload.chunk_size, 100u);
    EXPECT_EQ(cfg.upload.concurrency, 5u);
    EXPECT_EQ(cfg.timeouts.import_ms, 1234);
    EXPECT_EQ(cfg.timeouts.decrypt_ms, 30000);
    EXPECT_EQ(cfg.postgres.host, "db");
    EXPECT_EQ(cfg.postgres.port, 6543);
    EXPECT_EQ(cfg.postgres.schema, "ledger");
    EXPECT_EQ(cfg.tools.pdftotext, "/opt/poppler/bin/pdftotext");
    EXPECT_EQ(cfg.tools.xlsx2csv, "xlsx2csv");
    EXPECT_TRUE(cfg.dry_run);
}

TEST(Config, ZeroChunkSizeAndConcurrencyClampToOne) {
    auto cfg = IngestConfig::from_json_value(
        nlohmann::json::parse(R"({"upload": {"chunk_size": 0, "concurrency": 0}})"));
    EXPECT_EQ(cfg.upload.chunk_size, 1u);
    EXPECT_EQ(cfg.upload.concurrency, 1u);
}

TEST(Config, MalformedFileThrowsFormatError) {
    const std::string path = ::testing::TempDir() + "stmt_bad_config.json";
    {
        std::ofstream out(path);
        out << "{ \"sink\": ";
    }
    EXPECT_THROW(IngestConfig::from_json(path), FormatError);
    std::remove(path.c_str());
}

TEST(Config, EnvironmentOverrides) {
    setenv("STMT_WEB_URL", "https://app.example", 1);
    setenv("STMT_ACCESS_TOKEN", "tok-123", 1);
    IngestConfig cfg;
    cfg.apply_env_overrides();
    EXPECT_EQ(cfg.web.base_url, "https://app.example");
    EXPECT_EQ(cfg.auth.access_token, "tok-123");
    unsetenv("STMT_WEB_URL");
    unsetenv("STMT_ACCESS_TOKEN");
}

TEST(Config, SinkKindNames) {
    EXPECT_STREQ(sink_kind_str(SinkKind::POSTGRES), "postgres");
    EXPECT_EQ(parse_sink_kind("api"), SinkKind::API);
    EXPECT_EQ(parse_sink_kind("anything"), SinkKind::API);
}
