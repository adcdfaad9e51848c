#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace cw::label::rules {

// A heuristic step: returns a value when the text has the shape it looks for.
using Rule = std::optional<std::string> (*)(std::string_view text);

// "... -- 00010829: Titulo ..." -> "Titulo"
std::optional<std::string> kindAfterCodeMarker(std::string_view text);

// "10 QR -- ..." -> "QR", "3 Titulo 2 | ..." -> "Titulo 2"
std::optional<std::string> kindAfterDigits(std::string_view text);

// First word that is neither numeric nor structural punctuation.
std::optional<std::string> firstPlainWord(std::string_view text);

// "... 00013523: |Hola Mundo(" -> "Hola Mundo", "... 00013523: |" -> ""
std::optional<std::string> payloadAfterCode(std::string_view text);

// "... |Hola Mundo| ..." -> "Hola Mundo"
std::optional<std::string> payloadAfterPipe(std::string_view text);

inline constexpr std::array<Rule, 3> KIND_RULES = {
    kindAfterCodeMarker,
    kindAfterDigits,
    firstPlainWord,
};

inline constexpr std::array<Rule, 2> PAYLOAD_RULES = {
    payloadAfterCode,
    payloadAfterPipe,
};

// Runs rules in order, returning the first result. A rule may report an empty
// value, which ends the chain (an explicitly empty payload).
template <size_t N>
std::optional<std::string> firstOf(const std::array<Rule, N>& chain, const std::string_view text) {
    for (const auto rule : chain)
        if (auto value = rule(text)) return value;
    return std::nullopt;
}

}
