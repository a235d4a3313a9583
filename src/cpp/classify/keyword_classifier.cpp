#include "keyword_classifier.hpp"
#include "../ingest/transaction.hpp"
#include "../utils/text.hpp"

namespace stmt {

namespace {
constexpr size_t kWordMatchMaxLen = 4;
}

const std::vector<CategoryKeywords>& KeywordClassifier::default_table() {
    static const std::vector<CategoryKeywords> table = {
        {"Food", {"swiggy", "zomato", "food", "restaurant", "dining", "blinkit", "zepto",
                  "bigbasket", "grofers", "mcdonalds", "starbucks", "kfc", "burger king",
                  "dominos", "pizza hut", "subway", "grocery", "groceries"}},
        {"Transport", {"uber", "ola", "rapido", "taxi", "cab", "bus", "train", "metro",
                       "fuel", "petrol", "diesel", "parking"}},
        {"Utilities", {"electricity", "water", "gas", "airtel", "jio", "vodafone",
                       "broadband", "wifi", "bescom", "bill", "recharge"}},
        {"Shopping", {"amazon", "flipkart", "myntra", "ajio", "shopping", "clothing", "meesho"}},
        {"Entertainment", {"netflix", "spotify", "youtube", "hotstar", "prime video", "movie",
                           "cinema", "gaming", "xbox", "playstation"}},
        {"Health", {"medical", "doctor", "pharmacy", "hospital", "gym", "apollo", "health"}},
        {"Education", {"course", "tuition", "school", "college", "udemy", "coursera", "education"}},
        {"Finance", {"investment", "loan", "insurance", "mutual fund", "zerodha", "groww", "emi", "sip"}},
        {"People", {"sent to", "received from", "upi transfer", "upi received", "transfer to",
                    "friend", "family"}},
    };
    return table;
}

KeywordClassifier::KeywordClassifier() : table_(default_table()) {}

std::string KeywordClassifier::categorize(const std::string& description, const std::string& merchant) const {
    const std::string haystack = text::to_lower(description + " " + merchant);
    for (const auto& entry : table_) {
        for (const auto& kw : entry.keywords) {
            const bool hit = kw.size() <= kWordMatchMaxLen ? text::contains_word(haystack, kw)
                                                           : text::contains(haystack, kw);
            if (hit) return entry.category;
        }
    }
    return kUncategorized;
}

ClassifierOutput KeywordClassifier::classify(const std::vector<ClassifyItem>& items) {
    ClassifierOutput out;
    out.source = name();
    out.per_row = [this](const std::string& description, const std::string& merchant) {
        return categorize(description, merchant);
    };
    for (const auto& item : items) {
        std::string category = categorize(item.description, item.merchant);
        if (category != kUncategorized) out.predictions[item.description] = std::move(category);
    }
    return out;
}

} // namespace stmt
