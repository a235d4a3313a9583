#pragma once
// Stage timing for import logs (steady_clock)
#include <chrono>
#include <cstdint>

namespace stmt {

class Timer {
public:
    Timer() noexcept : start_(std::chrono::steady_clock::now()) {}

    void restart() noexcept { start_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// RAII stage timer -- adds elapsed milliseconds to a counter on destruction
class ScopedStageTimer {
public:
    explicit ScopedStageTimer(int64_t& out_ms) noexcept : out_ms_(out_ms) {}

    ~ScopedStageTimer() noexcept { out_ms_ += timer_.elapsed_ms(); }

    ScopedStageTimer(const ScopedStageTimer&) = delete;
    ScopedStageTimer& operator=(const ScopedStageTimer&) = delete;

private:
    int64_t& out_ms_;
    Timer timer_;
};

} // namespace stmt
