#pragma once
// =============================================================================
// Narration Resolver: bank narration -> readable description
//
// An ordered list of independent strategies; the first one that produces a
// non-empty description wins. The default list ends with an aggressive
// cleanup that always yields something readable.
// =============================================================================

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stmt {

using NarrationStrategyFn = std::function<std::optional<std::string>(const std::string&)>;

struct NarrationStrategy {
    std::string name;
    NarrationStrategyFn fn;
};

inline constexpr const char* kImportedTransaction = "Imported transaction";

namespace narration {

std::optional<std::string> known_merchant(const std::string& s);
std::optional<std::string> upi_transfer(const std::string& s);
std::optional<std::string> pos_purchase(const std::string& s);
std::optional<std::string> card_refund(const std::string& s);
std::optional<std::string> atm_withdrawal(const std::string& s);
std::optional<std::string> cash_deposit(const std::string& s);
std::optional<std::string> internet_banking(const std::string& s);
std::optional<std::string> slash_segments(const std::string& s);
std::optional<std::string> card_code(const std::string& s);
std::optional<std::string> aggressive_cleanup(const std::string& s);

// True for reference numbers, bank names and channel codes
bool is_noise_segment(const std::string& segment);

} // namespace narration

class NarrationResolver {
public:
    NarrationResolver();
    explicit NarrationResolver(std::vector<NarrationStrategy> strategies)
        : strategies_(std::move(strategies)) {}

    static std::vector<NarrationStrategy> default_strategies();

    // Falls back to the trimmed input when no strategy answers, and to
    // "Imported transaction" for empty input
    [[nodiscard]] std::string resolve(const std::string& narration) const;

    // Evaluation order
    [[nodiscard]] const std::vector<NarrationStrategy>& strategies() const { return strategies_; }

private:
    std::vector<NarrationStrategy> strategies_;
};

} // namespace stmt
