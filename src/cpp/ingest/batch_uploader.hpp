#pragma once
// =============================================================================
// Batch Uploader
//
// Rows are cut into fixed-size chunks and sent in windows of at most
// `concurrency` chunks, each on its own std::async task. A window is always
// drained before the next starts; the first failure in a window is rethrown
// as ChunkUploadError once the window completes. Chunks that succeeded stay
// committed (no rollback, no retry).
// =============================================================================

#include <functional>

#include "../connectors/import_sink.hpp"

namespace stmt {

// Percentage in [base, 100], reported after every window
using ProgressFn = std::function<void(int percent)>;

class BatchUploader {
public:
    BatchUploader(ImportSink& sink, size_t chunk_size = 2500, size_t concurrency = 3, int progress_base = 10)
        : sink_(sink),
          chunk_size_(chunk_size ? chunk_size : 1),
          concurrency_(concurrency ? concurrency : 1),
          progress_base_(progress_base) {}

    InsertCounts upload(const std::vector<CanonicalTransaction>& rows,
                        const BatchFile& file,
                        const ProgressFn& on_progress = {});

    [[nodiscard]] size_t chunk_size() const { return chunk_size_; }
    [[nodiscard]] size_t concurrency() const { return concurrency_; }

    // base + round(min((window_start + C) * chunk, total) / total * (100 - base))
    [[nodiscard]] int progress_after(size_t window_start_chunk, size_t total_rows) const;

private:
    ImportSink& sink_;
    size_t chunk_size_;
    size_t concurrency_;
    int progress_base_;
};

} // namespace stmt
