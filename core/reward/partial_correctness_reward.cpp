#include "reward/partial_correctness_reward.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace atdd {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::optional<double> toNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

size_t levenshtein(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); j++) prev[j] = j;
    for (size_t i = 1; i <= a.size(); i++) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); j++) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

std::optional<std::pair<std::string, std::string>>
PartialCorrectnessReward::extractValues(const std::string& message) {
    static const RE2 expected_got("(?i)Expected[:\\s]+(.+?)[\\s|]+(?:but got|Actual:)\\s+(.+?)(?:\\n|$)");
    static const RE2 assert_eq("assert\\s+(.+?)\\s*==\\s*(.+?)(?:\\n|$)");
    static const RE2 not_equal("(\\d+(?:\\.\\d+)?)\\s*!=\\s*(\\d+(?:\\.\\d+)?)");

    std::string first, second;
    if (RE2::PartialMatch(message, expected_got, &first, &second)) {
        return std::make_pair(trim(first), trim(second));
    }
    if (RE2::PartialMatch(message, assert_eq, &first, &second)) {
        return std::make_pair(trim(second), trim(first));
    }
    if (RE2::PartialMatch(message, not_equal, &first, &second)) {
        return std::make_pair(first, second);
    }
    return std::nullopt;
}

double PartialCorrectnessReward::similarity(const std::string& expected, const std::string& actual) {
    auto e = toNumber(expected);
    auto a = toNumber(actual);
    if (e && a) {
        if (*e == 0.0) return *a == 0.0 ? 1.0 : 0.0;
        return std::max(0.0, 1.0 - std::fabs(*e - *a) / std::fabs(*e));
    }

    std::string x = lower(expected);
    std::string y = lower(actual);
    if (x.empty() && y.empty()) return 1.0;
    if (x.empty() || y.empty()) return 0.0;
    size_t longest = std::max(x.size(), y.size());
    return 1.0 - static_cast<double>(levenshtein(x, y)) / static_cast<double>(longest);
}

DimensionScore PartialCorrectnessReward::compute(const RewardContext& context) const {
    DimensionScore score;
    score.max_reward = max_reward_;

    const auto& failures = context.outcome.failures;
    if (failures.empty()) {
        score.note = "No failures to analyze";
        return score;
    }

    double sum = 0.0;
    int parsed = 0;
    for (const auto& failure : failures) {
        auto values = extractValues(failure.message);
        if (!values) continue;
        double s = similarity(values->first, values->second);
        sum += s;
        parsed++;
        if (s >= 0.8) score.tags.push_back("close:" + failure.test_name);
    }

    score.metrics["failures"] = static_cast<double>(failures.size());
    score.metrics["parsed"] = parsed;
    if (parsed == 0) {
        score.note = "No expected/actual values found in failure messages";
        return score;
    }

    double average = sum / parsed;
    score.metrics["average_similarity"] = average;
    score.reward = average * max_reward_;
    score.note = "Average similarity " + std::to_string(average) + " over " +
                 std::to_string(parsed) + " comparable failures";
    return score;
}

std::string PartialCorrectnessReward::name() const { return "partial_correctness"; }

} // namespace atdd
