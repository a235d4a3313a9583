#pragma once
// In-memory collaborators for tests: no network, database or converters.
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "classify/classifier.hpp"
#include "connectors/http_client.hpp"
#include "connectors/import_sink.hpp"
#include "errors.hpp"
#include "ingest/spreadsheet_reader.hpp"

namespace stmt::testing {

// Stores rows keyed by fingerprint, like the real unique constraint
class MemorySink : public ImportSink {
public:
    InsertCounts insert_batch(const std::vector<CanonicalTransaction>& records,
                              const BatchFile& file) override {
        std::lock_guard<std::mutex> lock(mu_);
        InsertCounts c;
        files.push_back(file);
        for (const auto& r : records) {
            if (r.amount() == 0.0) {
                ++c.skipped_zero_amount;
            } else if (!fingerprints.insert(r.fingerprint).second) {
                ++c.skipped_duplicates;
            } else {
                stored.push_back(r);
                ++c.inserted;
            }
        }
        return c;
    }

    [[nodiscard]] const char* sink_name() const override { return "memory"; }

    std::unordered_set<std::string> fingerprints;
    std::vector<CanonicalTransaction> stored;
    std::vector<BatchFile> files;

private:
    std::mutex mu_;
};

// Tracks how many insert_batch calls overlap; optionally fails one chunk
class ConcurrencyProbeSink : public ImportSink {
public:
    explicit ConcurrencyProbeSink(int fail_on_call = -1) : fail_on_call_(fail_on_call) {}

    InsertCounts insert_batch(const std::vector<CanonicalTransaction>& records,
                              const BatchFile&) override {
        const int call = calls.fetch_add(1);
        const int now = in_flight.fetch_add(1) + 1;
        {
            std::lock_guard<std::mutex> lock(mu_);
            max_in_flight = std::max(max_in_flight, now);
            chunk_sizes.push_back(records.size());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        in_flight.fetch_sub(1);

        if (call == fail_on_call_) throw NetworkError("chunk rejected", 500);

        InsertCounts c;
        c.inserted = static_cast<int64_t>(records.size());
        return c;
    }

    [[nodiscard]] const char* sink_name() const override { return "probe"; }

    std::atomic<int> calls{0};
    std::atomic<int> in_flight{0};
    int max_in_flight = 0;
    std::vector<size_t> chunk_sizes;

private:
    int fail_on_call_;
    std::mutex mu_;
};

class ThrowingClassifier : public Classifier {
public:
    ClassifierOutput classify(const std::vector<ClassifyItem>&) override {
        ++calls;
        throw TimeoutError("classifier timed out");
    }
    [[nodiscard]] const char* name() const override { return "throwing"; }

    int calls = 0;
};

// Answers from a fixed description -> category map and records the request
class ScriptedClassifier : public Classifier {
public:
    explicit ScriptedClassifier(std::map<std::string, std::string> answers)
        : answers_(std::move(answers)) {}

    ClassifierOutput classify(const std::vector<ClassifyItem>& items) override {
        requests.push_back(items);
        ClassifierOutput out;
        out.source = name();
        for (const auto& item : items) {
            auto it = answers_.find(item.description);
            if (it != answers_.end()) out.predictions[item.description] = it->second;
        }
        return out;
    }
    [[nodiscard]] const char* name() const override { return "scripted"; }

    std::vector<std::vector<ClassifyItem>> requests;

private:
    std::map<std::string, std::string> answers_;
};

class FakeSpreadsheetReader : public SpreadsheetReader {
public:
    explicit FakeSpreadsheetReader(Grid grid = {}) : grid(std::move(grid)) {}

    Grid read_first_sheet(const std::vector<char>& bytes, const std::string& extension) override {
        last_bytes = bytes;
        last_extension = extension;
        ++calls;
        return grid;
    }

    Grid grid;
    std::vector<char> last_bytes;
    std::string last_extension;
    int calls = 0;
};

class FakePdfReader : public PdfTextReader {
public:
    explicit FakePdfReader(std::string text = {}) : text(std::move(text)) {}

    std::string read_text(const std::vector<char>&) override { return text; }

    std::string text;
};

// Accepts one password and returns fixed plain bytes for it
class FakeDecryptor : public Decryptor {
public:
    FakeDecryptor(std::string password, std::vector<char> plain)
        : password_(std::move(password)), plain_(std::move(plain)) {}

    std::vector<char> decrypt(const std::vector<char>& bytes,
                              const std::string&,
                              const std::string& password) override {
        ++calls;
        if (password == password_) return plain_;
        return bytes;   // still encrypted
    }

    int calls = 0;

private:
    std::string password_;
    std::vector<char> plain_;
};

class RecordingFeedbackSink : public FeedbackSink {
public:
    explicit RecordingFeedbackSink(bool fail = false) : fail_(fail) {}

    void submit(const std::map<std::string, std::string>& corrections) override {
        submissions.push_back(corrections);
        if (fail_) throw NetworkError("feedback endpoint down", 503);
    }

    std::vector<std::map<std::string, std::string>> submissions;

private:
    bool fail_;
};

// Replays canned responses and records every request
class FakeHttpTransport : public HttpTransport {
public:
    struct Request {
        std::string url;
        std::string body;
        std::vector<std::string> headers;
        std::vector<MultipartField> fields;
        long timeout_ms = 0;
    };

    HttpResponse post_json(const std::string& url, const std::string& body,
                           const std::vector<std::string>& headers, long timeout_ms) override {
        requests.push_back({url, body, headers, {}, timeout_ms});
        return next();
    }

    HttpResponse post_multipart(const std::string& url, const std::vector<MultipartField>& fields,
                                const std::vector<std::string>& headers, long timeout_ms) override {
        requests.push_back({url, "", headers, fields, timeout_ms});
        return next();
    }

    std::vector<HttpResponse> responses;
    std::vector<Request> requests;
    bool timeout = false;

private:
    size_t served_ = 0;

    HttpResponse next() {
        if (timeout) throw TimeoutError("deadline exceeded");
        if (served_ >= responses.size()) throw NetworkError("no scripted response");
        return responses[served_++];
    }
};

inline std::vector<char> bytes_of(const std::string& s) {
    return std::vector<char>(s.begin(), s.end());
}

} // namespace stmt::testing
