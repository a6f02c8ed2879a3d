/**
 * @file gazetteer_model_detector.cpp
 * @brief Implementation of the built-in lexicon tagger
 */

#include "piiguard/detection/gazetteer_model_detector.hpp"

#include "piiguard/core/text_utils.hpp"

#include <algorithm>

namespace piiguard::detection {

namespace {

constexpr auto rule_flags = std::regex::ECMAScript | std::regex::optimize;

auto escape_regex(const std::string& word) -> std::string {
    static const std::string special = R"(\^$.|?*+()[]{}/)";
    std::string escaped;
    escaped.reserve(word.size() * 2);
    for (char c : word) {
        if (c == ' ') {
            escaped += R"([ \t]+)";
            continue;
        }
        if (special.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

/// Alternation of the words, longest first so that "New York City" wins over "New York"
auto word_alternation(std::vector<std::string> words) -> std::string {
    std::sort(words.begin(), words.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });

    std::string alternation;
    for (const auto& word : words) {
        if (!alternation.empty()) {
            alternation.push_back('|');
        }
        alternation += escape_regex(word);
    }
    return alternation;
}

} // namespace

auto gazetteer::defaults() -> gazetteer {
    gazetteer lexicon;
    lexicon.given_names = {
        "James", "John", "Robert", "Michael", "William", "David", "Richard",
        "Joseph", "Thomas", "Charles", "Daniel", "Matthew", "Anthony",
        "Steven", "Paul", "Andrew", "Joshua", "Kevin", "Brian", "George", "Peter",
        "Mary", "Patricia", "Jennifer", "Linda", "Elizabeth", "Barbara", "Susan",
        "Jessica", "Sarah", "Karen", "Nancy", "Lisa", "Margaret", "Emily", "Emma",
        "Olivia", "Sophia", "Anna", "Laura", "Rachel", "Maria", "Priya", "Rahul",
        "Amit", "Ananya", "Hiroshi", "Yuki", "Mohammed", "Ahmed",
        "Fatima", "Carlos", "Juan", "Sofia", "Lucas", "Pierre", "Hans", "Olga",
        "Ivan", "Jane", "Alice", "Bob"};
    lexicon.places = {
        "New York", "New York City", "Los Angeles", "San Francisco", "Chicago",
        "Houston", "Boston", "Seattle", "Miami", "Washington", "London",
        "Paris", "Berlin", "Madrid", "Rome", "Tokyo", "Beijing", "Shanghai",
        "Mumbai", "Delhi", "Bangalore", "Sydney", "Toronto", "Vancouver",
        "Dubai", "Singapore", "Hong Kong", "Seoul", "California", "Texas",
        "Florida", "Ontario", "United States", "United Kingdom", "USA", "UK",
        "Canada", "Mexico", "Brazil", "France", "Germany", "Spain", "Italy",
        "India", "China", "Japan", "Australia", "Russia"};
    lexicon.organizations = {
        "Google", "Microsoft", "Apple", "Amazon", "Meta", "Facebook", "IBM",
        "Intel", "Oracle", "Netflix", "Tesla", "Walmart", "JPMorgan", "Chase",
        "Wells Fargo", "Citibank", "Goldman Sachs", "Deloitte", "Accenture",
        "FBI", "CIA", "NASA", "WHO", "United Nations", "Red Cross", "IRS"};
    lexicon.nationalities = {
        "American", "British", "Canadian", "Mexican", "Brazilian", "French",
        "German", "Italian", "Spanish", "Indian", "Chinese", "Japanese", "Korean",
        "Australian", "Russian", "Muslim", "Christian", "Jewish", "Hindu",
        "Buddhist", "Democrat", "Democrats", "Republican", "Republicans"};
    lexicon.languages = {"English", "Mandarin", "Hindi", "Arabic", "Portuguese", "Swahili"};
    return lexicon;
}

gazetteer_model_detector::gazetteer_model_detector(const gazetteer& lexicon) {
    auto add = [this](std::string category, const std::string& pattern) {
        rules_.push_back(category_rule{std::move(category), std::regex(pattern, rule_flags)});
    };

    if (!lexicon.given_names.empty()) {
        add("PERSON", R"(\b(?:)" + word_alternation(lexicon.given_names) +
                          R"()(?:[ \t]+[A-Z][a-z]+(?:-[A-Z][a-z]+)?)?\b)");
    }
    if (!lexicon.places.empty()) {
        add("GPE", R"(\b(?:)" + word_alternation(lexicon.places) + R"()\b)");
    }
    if (!lexicon.organizations.empty()) {
        add("ORG", R"(\b(?:)" + word_alternation(lexicon.organizations) + R"()\b)");
    }
    if (!lexicon.nationalities.empty()) {
        add("NORP", R"(\b(?:)" + word_alternation(lexicon.nationalities) + R"()\b)");
    }
    if (!lexicon.languages.empty()) {
        add("LANGUAGE", R"(\b(?:)" + word_alternation(lexicon.languages) + R"()\b)");
    }

    add("DATE",
        R"(\b(?:January|February|March|April|May|June|July|August|September|October|November|December)[ \t]+\d{4}\b)");
    add("DATE", R"(\b(?:(?:last|next|this)[ \t]+)?(?:Monday|Tuesday|Wednesday|Thursday|Friday|Saturday|Sunday)\b)");
    add("TIME", R"(\b\d{1,2}[ \t]*(?:am|pm|AM|PM)\b)");
    add("MONEY",
        R"((?:\$|€|£|¥)[ \t]?\d{1,3}(?:,\d{3})*(?:\.\d{1,2})?\b|\b\d+(?:\.\d{1,2})?[ \t]+(?:dollars|USD|EUR|euros|pounds|GBP)\b)");
    add("FAC",
        R"(\b(?:[A-Z][a-z]+[ \t]+){1,3}(?:Airport|Bridge|Stadium|Tower|Station|Mall|Arena)\b)");
    add("EVENT",
        R"(\b(?:[A-Z][a-z]+[ \t]+){1,3}(?:Conference|Summit|Festival|Olympics|Championship|Expo)\b)");
    add("LAW", R"(\b(?:[A-Z][a-z]+[ \t]+){1,4}Act\b(?:[ \t]+of[ \t]+\d{4})?)");
}

auto gazetteer_model_detector::detect(std::string_view text) -> Result<std::vector<model_span>> {
    std::vector<model_span> spans;
    if (text.empty()) {
        return spans;
    }

    const auto scan = core::shield_long_runs(text);
    const char* first = scan.data();
    const char* last = first + scan.size();
    for (const auto& rule : rules_) {
        for (std::cregex_iterator it(first, last, rule.expression), end; it != end; ++it) {
            const auto& match = *it;
            if (match.length(0) == 0) {
                continue;
            }
            const auto start = static_cast<std::size_t>(match.position(0));
            spans.push_back(model_span{
                core::span{start, start + static_cast<std::size_t>(match.length(0))},
                rule.category});
        }
    }
    return spans;
}

} // namespace piiguard::detection
