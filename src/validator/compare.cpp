#include "validator/compare.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <unordered_map>
#include <vector>
#include "common/io_utils.hpp"

namespace validator {
using namespace std;

// clang-format off
static const unordered_map<comparison_mode, const char *> mode_string = boost::assign::map_list_of
    (comparison_mode::EXACT, "exact")
    (comparison_mode::TRIMMED_LINES, "trimmed_lines")
    (comparison_mode::TOKEN_SEQUENCE, "tokens")
    (comparison_mode::NUMERIC_TOLERANCE, "numeric");
// clang-format on

const char *get_display_message(comparison_mode mode) {
    return mode_string.at(mode);
}

comparison_mode parse_comparison_mode(const string &name) {
    string lower = boost::algorithm::to_lower_copy(name);
    boost::algorithm::erase_all(lower, "_");
    if (lower == "exact") return comparison_mode::EXACT;
    if (lower == "trimmedlines" || lower == "lines") return comparison_mode::TRIMMED_LINES;
    if (lower == "tokens" || lower == "tokensequence") return comparison_mode::TOKEN_SEQUENCE;
    if (lower == "numeric" || lower == "numerictolerance") return comparison_mode::NUMERIC_TOLERANCE;
    throw invalid_argument("unknown comparison mode " + name);
}

static string quote(const string &text, size_t limit) {
    return "\"" + excerpt(text, limit) + "\"";
}

static vector<string> split_lines(const string &text) {
    vector<string> lines;
    boost::algorithm::split(lines, text, boost::is_any_of("\n"));
    return lines;
}

static vector<string> split_tokens(const string &text) {
    vector<string> tokens;
    string trimmed = boost::algorithm::trim_copy(text);
    if (trimmed.empty()) return tokens;
    boost::algorithm::split(tokens, trimmed, boost::is_any_of(" \t\r\n\v\f"), boost::token_compress_on);
    return tokens;
}

/**
 * @brief 找出两组行或单词中第一个不同的位置
 * @param unit 位置的名称，"line" 或者 "token"
 */
template <typename Equal>
static comparison_result first_difference(const vector<string> &expected, const vector<string> &actual,
                                          const char *unit, size_t limit, Equal equal) {
    size_t count = max(expected.size(), actual.size());
    for (size_t i = 0; i < count; ++i) {
        if (i >= actual.size())
            return {false, fmt::format("{} {}: expected {}, got end of output", unit, i + 1, quote(expected[i], limit))};
        if (i >= expected.size())
            return {false, fmt::format("{} {}: expected end of output, got {}", unit, i + 1, quote(actual[i], limit))};
        if (!equal(expected[i], actual[i]))
            return {false, fmt::format("{} {}: expected {}, got {}", unit, i + 1, quote(expected[i], limit), quote(actual[i], limit))};
    }
    return {true, ""};
}

static bool string_equal(const string &a, const string &b) {
    return a == b;
}

static string strip_final_newline(const string &text) {
    if (!text.empty() && text.back() == '\n') return text.substr(0, text.size() - 1);
    return text;
}

static comparison_result compare_exact(const string &expected, const string &actual, size_t limit) {
    string lhs = strip_final_newline(expected), rhs = strip_final_newline(actual);
    if (lhs == rhs) return {true, ""};
    return first_difference(split_lines(lhs), split_lines(rhs), "line", limit, string_equal);
}

static vector<string> trimmed_lines(const string &text) {
    vector<string> lines = split_lines(text);
    for (auto &line : lines) boost::algorithm::trim_right(line);
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    return lines;
}

static comparison_result compare_trimmed_lines(const string &expected, const string &actual, size_t limit) {
    return first_difference(trimmed_lines(expected), trimmed_lines(actual), "line", limit, string_equal);
}

static comparison_result compare_tokens(const string &expected, const string &actual, size_t limit) {
    return first_difference(split_tokens(expected), split_tokens(actual), "token", limit, string_equal);
}

static bool parse_number(const string &token, double &value) {
    try {
        value = boost::lexical_cast<double>(token);
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
    return isfinite(value);
}

static comparison_result compare_numeric(const string &expected, const string &actual, double epsilon, size_t limit) {
    vector<string> lhs = split_tokens(expected), rhs = split_tokens(actual);
    if (lhs.size() != rhs.size())
        return {false, fmt::format("expected {} tokens, got {} tokens", lhs.size(), rhs.size())};

    return first_difference(lhs, rhs, "token", limit, [epsilon](const string &a, const string &b) {
        double x, y;
        if (parse_number(a, x) && parse_number(b, y))
            return fabs(x - y) <= epsilon + 1e-12;  // 1e-12 容忍十进制转换的舍入误差
        return a == b;
    });
}

comparison_result compare_output(const string &expected, const string &actual,
                                  const comparison_policy &policy, size_t excerpt_limit) {
    switch (policy.mode) {
        case comparison_mode::EXACT:
            return compare_exact(expected, actual, excerpt_limit);
        case comparison_mode::TRIMMED_LINES:
            return compare_trimmed_lines(expected, actual, excerpt_limit);
        case comparison_mode::TOKEN_SEQUENCE:
            return compare_tokens(expected, actual, excerpt_limit);
        case comparison_mode::NUMERIC_TOLERANCE:
            return compare_numeric(expected, actual, policy.epsilon, excerpt_limit);
        default:
            throw invalid_argument("unknown comparison mode");
    }
}

}  // namespace validator
