#include <gtest/gtest.h>

#include "connectors/decrypt_client.hpp"
#include "connectors/feedback_client.hpp"
#include "connectors/import_api_client.hpp"
#include "connectors/postgres_store.hpp"
#include "fakes.hpp"

using namespace stmt;
using namespace stmt::testing;

namespace {

CanonicalTransaction make_tx(double amount) {
    CanonicalTransaction tx;
    tx.date = 1707955200;
    tx.set_amount(amount);
    tx.description = "Swiggy order";
    tx.merchant = "Swiggy";
    tx.category = "Food";
    tx.fingerprint = "fp";
    return tx;
}

IngestConfig config_with_token() {
    IngestConfig cfg;
    cfg.auth.access_token = "secret";
    cfg.web.base_url = "https://app.example/";
    return cfg;
}

} // namespace

TEST(HttpHelpers, JoinUrl) {
    EXPECT_EQ(join_url("http://h", "/p"), "http://h/p");
    EXPECT_EQ(join_url("http://h/", "/p"), "http://h/p");
    EXPECT_EQ(join_url("http://h", "p"), "http://h/p");
    EXPECT_EQ(join_url("http://h/", "p"), "http://h/p");
    EXPECT_EQ(join_url("", "/p"), "/p");
}

TEST(HttpHelpers, BearerHeaders) {
    EXPECT_TRUE(bearer_headers("").empty());
    ASSERT_EQ(bearer_headers("t").size(), 1u);
    EXPECT_EQ(bearer_headers("t")[0], "Authorization: Bearer t");
}

TEST(ImportApiClient, BodyCarriesWireRowsAndFile) {
    auto body = ImportApiClient::build_body({make_tx(-42)}, BatchFile{"s.csv", "abc"});
    EXPECT_EQ(body["filename"], "s.csv");
    EXPECT_EQ(body["file_hash"], "abc");
    ASSERT_EQ(body["transactions"].size(), 1u);
    EXPECT_EQ(body["transactions"][0]["amount"], -42.0);
    EXPECT_EQ(body["transactions"][0]["merchant_name"], "Swiggy");
    EXPECT_EQ(body["transactions"][0]["transaction_date"], "2024-02-15T00:00:00.000Z");
}

TEST(ImportApiClient, PostsChunkAndReturnsServerCounts) {
    FakeHttpTransport http;
    http.responses.push_back({200, R"({"inserted": 1, "skipped_duplicates": 2})"});
    ImportApiClient client(http, config_with_token());

    auto counts = client.insert_batch({make_tx(-1), make_tx(-2), make_tx(-3)}, BatchFile{"s.csv", "h"});
    EXPECT_EQ(counts.inserted, 1);
    EXPECT_EQ(counts.skipped_duplicates, 2);
    EXPECT_EQ(counts.skipped_zero_amount, 0);

    ASSERT_EQ(http.requests.size(), 1u);
    EXPECT_EQ(http.requests[0].url, "https://app.example/api/import");
    EXPECT_EQ(http.requests[0].timeout_ms, 60000);
    EXPECT_EQ(http.requests[0].headers[0], "Authorization: Bearer secret");
    EXPECT_EQ(nlohmann::json::parse(http.requests[0].body)["transactions"].size(), 3u);
}

TEST(ImportApiClient, ErrorStatuses) {
    {
        FakeHttpTransport http;
        http.responses.push_back({401, ""});
        ImportApiClient client(http, config_with_token());
        try {
            client.insert_batch({make_tx(-1)}, BatchFile{});
            FAIL() << "expected NetworkError";
        } catch (const NetworkError& e) {
            EXPECT_EQ(e.http_status(), 401);
            EXPECT_STREQ(e.what(), "Import rejected: not authenticated");
        }
    }
    {
        FakeHttpTransport http;
        http.responses.push_back({500, R"({"error": "database is down"})"});
        ImportApiClient client(http, config_with_token());
        try {
            client.insert_batch({make_tx(-1)}, BatchFile{});
            FAIL() << "expected NetworkError";
        } catch (const NetworkError& e) {
            EXPECT_EQ(e.http_status(), 500);
            EXPECT_STREQ(e.what(), "Import failed (HTTP 500): database is down");
        }
    }
    {
        FakeHttpTransport http;
        http.responses.push_back({200, "<html>"});
        ImportApiClient client(http, config_with_token());
        EXPECT_THROW(client.insert_batch({make_tx(-1)}, BatchFile{}), NetworkError);
    }
}

TEST(ImportApiClient, ErrorMessageFromBody) {
    EXPECT_EQ(error_message_from_body(R"({"message": "bad"})"), "bad");
    EXPECT_EQ(error_message_from_body("plain text"), "plain text");
    EXPECT_EQ(error_message_from_body(std::string(300, 'x')).size(), 203u);
}

TEST(DecryptClient, SendsFileAndPassword) {
    FakeHttpTransport http;
    http.responses.push_back({200, "PK\x03\x04plain"});
    DecryptClient client(http, config_with_token());

    auto plain = client.decrypt(bytes_of("encrypted"), "book.xlsx", "pw");
    EXPECT_EQ(std::string(plain.begin(), plain.end()), "PK\x03\x04plain");

    ASSERT_EQ(http.requests.size(), 1u);
    const auto& req = http.requests[0];
    EXPECT_EQ(req.url, "https://app.example/api/decrypt-xlsx");
    ASSERT_EQ(req.fields.size(), 2u);
    EXPECT_EQ(req.fields[0].name, "file");
    EXPECT_EQ(req.fields[0].filename, "book.xlsx");
    EXPECT_EQ(req.fields[0].value, "encrypted");
    EXPECT_EQ(req.fields[1].name, "password");
    EXPECT_EQ(req.fields[1].value, "pw");
}

TEST(DecryptClient, WrongPasswordIsEncryptionError) {
    FakeHttpTransport http;
    http.responses.push_back({400, R"({"error": "Incorrect password"})"});
    DecryptClient client(http, config_with_token());
    EXPECT_THROW(client.decrypt(bytes_of("x"), "b.xlsx", "nope"), EncryptionError);
}

TEST(DecryptClient, ServerFailureIsNetworkError) {
    FakeHttpTransport http;
    http.responses.push_back({502, "bad gateway"});
    DecryptClient client(http, config_with_token());
    try {
        client.decrypt(bytes_of("x"), "b.xlsx", "pw");
        FAIL() << "expected NetworkError";
    } catch (const EncryptionError&) {
        FAIL() << "a gateway failure is not a password problem";
    } catch (const NetworkError& e) {
        EXPECT_EQ(e.http_status(), 502);
    }
}

TEST(FeedbackClient, PostsCorrections) {
    FakeHttpTransport http;
    http.responses.push_back({204, ""});
    IngestConfig cfg;
    FeedbackClient client(http, cfg);

    client.submit({{"Swiggy order", "Food"}});
    ASSERT_EQ(http.requests.size(), 1u);
    EXPECT_EQ(http.requests[0].url, "http://localhost:8000/api/v1/feedback");
    EXPECT_TRUE(http.requests[0].headers.empty());
    auto body = nlohmann::json::parse(http.requests[0].body);
    EXPECT_EQ(body["corrections"]["Swiggy order"], "Food");
}

TEST(FeedbackClient, EmptyCorrectionsAreNotSent) {
    FakeHttpTransport http;
    FeedbackClient client(http, IngestConfig{});
    client.submit({});
    EXPECT_TRUE(http.requests.empty());
}

TEST(FeedbackClient, RejectedFeedbackThrows) {
    FakeHttpTransport http;
    http.responses.push_back({500, ""});
    FeedbackClient client(http, IngestConfig{});
    EXPECT_THROW(client.submit({{"a", "b"}}), NetworkError);
}

TEST(DryRunSink, ReportsEveryRowAsInserted) {
    DryRunSink sink;
    auto counts = sink.insert_batch({make_tx(-1), make_tx(-2)}, BatchFile{"f.csv", "0123456789abcdef"});
    EXPECT_EQ(counts.inserted, 2);
    EXPECT_STREQ(sink.sink_name(), "dry-run");
}

TEST(InsertCounts, Accumulate) {
    InsertCounts total;
    InsertCounts a;
    a.inserted = 2;
    a.skipped_duplicates = 1;
    InsertCounts b;
    b.inserted = 3;
    b.skipped_zero_amount = 4;
    total += a;
    total += b;
    EXPECT_EQ(total.inserted, 5);
    EXPECT_EQ(total.skipped_duplicates, 1);
    EXPECT_EQ(total.skipped_zero_amount, 4);
}

TEST(PostgresStore, SchemaNameValidation) {
    EXPECT_TRUE(PostgresStore::valid_identifier("public"));
    EXPECT_TRUE(PostgresStore::valid_identifier("ledger_2024"));
    EXPECT_FALSE(PostgresStore::valid_identifier(""));
    EXPECT_FALSE(PostgresStore::valid_identifier("1abc"));
    EXPECT_FALSE(PostgresStore::valid_identifier("public; DROP TABLE x"));
    EXPECT_FALSE(PostgresStore::valid_identifier(std::string(64, 'a')));

    PostgresConfig bad;
    bad.schema = "my-schema";
    EXPECT_THROW(PostgresStore(bad, "user"), ImportError);
}

TEST(PostgresStore, ConstructionDoesNotConnect) {
    PostgresConfig cfg;
    cfg.host = "stmt-unreachable.invalid";
    PostgresStore store(cfg, "user");
    EXPECT_STREQ(store.sink_name(), "postgres");
}
