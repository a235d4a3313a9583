#include "known_merchants.hpp"
#include "../utils/text.hpp"

namespace stmt {

const std::vector<MerchantAliases>& known_merchants() {
    static const std::vector<MerchantAliases> table = {
        {"Swiggy Instamart", {"swiggy instamart", "instamart"}},
        {"Swiggy",           {"swiggy"}},
        {"Zomato",           {"zomato", "zomatofo"}},
        {"Uber",             {"uber", "uber india"}},
        {"Ola",              {"ola", "olacabs"}},
        {"Rapido",           {"rapido"}},
        {"Blinkit",          {"blinkit", "grofers"}},
        {"Zepto",            {"zepto"}},
        {"BigBasket",        {"bigbasket", "big basket"}},
        {"Amazon",           {"amazon", "amzn"}},
        {"Flipkart",         {"flipkart"}},
        {"Myntra",           {"myntra"}},
        {"Ajio",             {"ajio"}},
        {"Netflix",          {"netflix"}},
        {"Spotify",          {"spotify"}},
        {"Youtube",          {"youtube", "google oct"}},
        {"Apple",            {"apple.com", "itunes"}},
        {"Google",           {"google"}},
        {"Jio",              {"jio", "reliance jio"}},
        {"Airtel",           {"airtel"}},
        {"Vodafone",         {"vi", "vodafone"}},
        {"Mcdonalds",        {"mcdonalds", "mcdonald"}},
        {"Starbucks",        {"starbucks"}},
        {"KFC",              {"kfc"}},
        {"Burger King",      {"burger king"}},
        {"Domino's",         {"dominos", "domino's"}},
        {"Pizza Hut",        {"pizza hut"}},
        {"Subway",           {"subway"}},
    };
    return table;
}

std::optional<std::string> match_known_merchant(const std::string& source) {
    const std::string lower = text::to_lower(source);
    if (lower.empty()) return std::nullopt;

    for (const auto& entry : known_merchants()) {
        for (const auto& alias : entry.aliases) {
            const bool hit = alias.size() <= 2 ? text::contains_word(lower, alias)
                                               : text::contains(lower, alias);
            if (hit) return entry.name;
        }
    }
    return std::nullopt;
}

} // namespace stmt
