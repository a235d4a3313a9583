#include "batch_uploader.hpp"
#include "../errors.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>

namespace stmt {

int BatchUploader::progress_after(size_t window_start_chunk, size_t total_rows) const {
    if (total_rows == 0) return 100;
    const size_t done = std::min((window_start_chunk + concurrency_) * chunk_size_, total_rows);
    const double frac = static_cast<double>(done) / static_cast<double>(total_rows);
    return progress_base_ + static_cast<int>(std::lround(frac * (100 - progress_base_)));
}

InsertCounts BatchUploader::upload(const std::vector<CanonicalTransaction>& rows,
                                   const BatchFile& file,
                                   const ProgressFn& on_progress) {
    InsertCounts total;
    if (rows.empty()) return total;

    Timer timer;
    const size_t n_chunks = (rows.size() + chunk_size_ - 1) / chunk_size_;
    LOG_INF("[upload] %zu rows -> %zu chunks of <= %zu via %s (concurrency %zu)",
        rows.size(), n_chunks, chunk_size_, sink_.sink_name(), concurrency_);

    for (size_t i = 0; i < n_chunks; i += concurrency_) {
        const size_t window_end = std::min(i + concurrency_, n_chunks);

        std::vector<std::future<InsertCounts>> window;
        window.reserve(window_end - i);
        for (size_t c = i; c < window_end; ++c) {
            const size_t begin = c * chunk_size_;
            const size_t end = std::min(begin + chunk_size_, rows.size());
            std::vector<CanonicalTransaction> chunk(rows.begin() + begin, rows.begin() + end);
            window.push_back(std::async(std::launch::async,
                [this, chunk = std::move(chunk), &file]() {
                    return sink_.insert_batch(chunk, file);
                }));
        }

        // drain the whole window before reporting a failure
        bool failed = false;
        size_t failed_chunk = 0;
        std::string failure;
        for (size_t k = 0; k < window.size(); ++k) {
            try {
                total += window[k].get();
            } catch (const std::exception& e) {
                LOG_ERR("[upload] chunk %zu/%zu failed: %s", i + k + 1, n_chunks, e.what());
                if (!failed) {
                    failed = true;
                    failed_chunk = i + k;
                    failure = e.what();
                }
            }
        }
        if (failed) {
            throw ChunkUploadError("Upload failed at chunk " + std::to_string(failed_chunk + 1) +
                                   " of " + std::to_string(n_chunks) + ": " + failure,
                                   failed_chunk, total.inserted);
        }

        const int pct = progress_after(i, rows.size());
        LOG_DBG("[upload] window %zu-%zu done, progress %d%%", i + 1, window_end, pct);
        if (on_progress) on_progress(pct);
    }

    LOG_INF("[upload] done in %lld ms: %lld inserted, %lld duplicates, %lld zero-amount",
        static_cast<long long>(timer.elapsed_ms()), static_cast<long long>(total.inserted),
        static_cast<long long>(total.skipped_duplicates),
        static_cast<long long>(total.skipped_zero_amount));
    return total;
}

} // namespace stmt
