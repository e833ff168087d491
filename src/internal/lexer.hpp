#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pycomp::internal {

    enum class token_kind : uint8_t { name, number, string, op };

    struct token {
        token_kind kind{token_kind::op};
        std::string text{};
        size_t offset{};
    };

    // One Python logical line: physical lines [first, last] joined, comments removed,
    // backslash continuations folded into a space.
    struct logical_line {
        size_t first{};
        size_t last{};
        size_t indent{};
        std::string text{};
    };

    // Returns one past the closing quote of the literal whose opening quote is at `quote_pos`,
    // or npos when the literal is unterminated.
    size_t scan_string_literal(std::string_view text, size_t quote_pos);

    // Length of a string prefix (r, b, u, f, rb, br, ...) starting at `pos` that is directly
    // followed by a quote; 0 when there is none.
    size_t string_prefix_length(std::string_view text, size_t pos);

    std::vector<logical_line> split_logical_lines(std::string_view source);

    std::vector<token> tokenize_expression(std::string_view text);

    // Decodes a (possibly prefixed, possibly implicitly concatenated) string token.
    // f-strings and bytes literals yield nullopt.
    std::optional<std::string> decode_string_literal(std::string_view literal);

}  // namespace pycomp::internal
