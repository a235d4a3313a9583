#pragma once
// Table of well-known merchants and the spellings banks use for them
#include <optional>
#include <string>
#include <vector>

namespace stmt {

struct MerchantAliases {
    std::string name;
    std::vector<std::string> aliases;   // lower-case
};

// Generic table; order matters (first match wins)
const std::vector<MerchantAliases>& known_merchants();

// Case-insensitive alias search. Aliases of two characters or fewer must
// stand alone as a word, longer ones may appear anywhere.
std::optional<std::string> match_known_merchant(const std::string& text);

} // namespace stmt
