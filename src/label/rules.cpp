#include "label/rules.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace cw::label::rules {

namespace {

using svmatch = std::match_results<std::string_view::const_iterator>;

std::optional<std::string> firstCapture(const std::string_view text, const std::regex& re) {
    svmatch m;
    if (!std::regex_search(text.begin(), text.end(), m, re)) return std::nullopt;
    return m[1].str();
}

std::string collapseWhitespace(const std::string& s) {
    std::vector<std::string> words;
    const auto trimmed = boost::algorithm::trim_copy(s);
    if (trimmed.empty()) return {};
    boost::algorithm::split(words, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return boost::algorithm::join(words, " ");
}

bool isNumericWord(const std::string& word) {
    std::string digits;
    std::remove_copy(word.begin(), word.end(), std::back_inserter(digits), '-');
    return !digits.empty() && std::all_of(digits.begin(), digits.end(), [](const unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

bool isStructural(const std::string& word) {
    return word == "]" || word == "[[" || word == "]]" || word == "|" || word == "--";
}

}

std::optional<std::string> kindAfterCodeMarker(const std::string_view text) {
    static const std::regex re(R"(--\s+\d+:\s+([A-Za-z_0-9]+))");
    return firstCapture(text, re);
}

std::optional<std::string> kindAfterDigits(const std::string_view text) {
    static const std::regex re(R"(\d+\s+([A-Za-z_][A-Za-z_0-9]*(?:\s+\d+)?))");
    auto kind = firstCapture(text, re);
    if (kind) boost::algorithm::trim(*kind);
    return kind;
}

std::optional<std::string> firstPlainWord(const std::string_view text) {
    std::vector<std::string> words;
    const auto trimmed = boost::algorithm::trim_copy(std::string(text));
    if (trimmed.empty()) return std::nullopt;
    boost::algorithm::split(words, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);

    for (const auto& word : words)
        if (!word.empty() && !isNumericWord(word) && !isStructural(word)) return word;

    return std::nullopt;
}

std::optional<std::string> payloadAfterCode(const std::string_view text) {
    static const std::regex re(R"(\d+:\s*\|([^|(]*))");
    const auto payload = firstCapture(text, re);
    if (!payload) return std::nullopt;
    return collapseWhitespace(*payload);
}

std::optional<std::string> payloadAfterPipe(const std::string_view text) {
    static const std::regex re(R"(\|([^|(]+))");
    const auto payload = firstCapture(text, re);
    if (!payload) return std::nullopt;
    return collapseWhitespace(*payload);
}

}
