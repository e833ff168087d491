#include "lexer.hpp"

#include "pycomp/errors.hpp"
#include "pycomp/format.hpp"
#include "pycomp/utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

using namespace pycomp::literals;

namespace pycomp::internal {
    namespace detail {

        using namespace std::string_view_literals;

        static constexpr std::array three_char_ops{"**="sv, "//="sv, ">>="sv, "<<="sv, "..."sv};
        static constexpr std::array two_char_ops{"->"sv, "**"sv, "//"sv, "=="sv, "!="sv, "<="sv, ">="sv, ":="sv,
                                                 "<<"sv, ">>"sv, "+="sv, "-="sv, "*="sv, "/="sv, "%="sv, "&="sv,
                                                 "|="sv, "^="sv, "@="sv};

        static constexpr bool is_quote(char c) {
            return c == '\'' || c == '"';
        }

        static constexpr bool is_ident_start(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
                   static_cast<unsigned char>(c) >= 0x80U;
        }

        static constexpr bool is_ident_char(char c) {
            return is_ident_start(c) || (c >= '0' && c <= '9');
        }

        static constexpr bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }

        static constexpr int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            auto lower = utils::char_tolower(c);
            if (lower >= 'a' && lower <= 'f') {
                return lower - 'a' + 10;
            }
            return -1;
        }

        static void append_utf8(std::string& out, uint32_t cp) {
            if (cp < 0x80U) {
                out.push_back(static_cast<char>(cp));
            }
            else if (cp < 0x800U) {
                out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
                out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
            }
            else if (cp < 0x10000U) {
                out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
                out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
                out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
            }
            else {
                out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
                out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
                out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
                out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
            }
        }

        static std::optional<uint32_t> parse_hex_digits(std::string_view body, size_t pos, size_t count) {
            if (pos + count > body.size()) {
                return std::nullopt;
            }
            uint32_t value = 0U;
            for (size_t i = 0U; i < count; ++i) {
                auto digit = hex_value(body[pos + i]);
                if (digit < 0) {
                    return std::nullopt;
                }
                value = (value << 4U) | static_cast<uint32_t>(digit);
            }
            return value;
        }

        static std::string unescape(std::string_view body) {
            std::string out{};
            out.reserve(body.size());
            for (size_t i = 0U; i < body.size(); ++i) {
                char c = body[i];
                if (c != '\\' || i + 1U >= body.size()) {
                    out.push_back(c);
                    continue;
                }
                char next = body[++i];
                switch (next) {
                    case '\n':
                        break;
                    case '\\':
                        out.push_back('\\');
                        break;
                    case '\'':
                        out.push_back('\'');
                        break;
                    case '"':
                        out.push_back('"');
                        break;
                    case 'a':
                        out.push_back('\a');
                        break;
                    case 'b':
                        out.push_back('\b');
                        break;
                    case 'f':
                        out.push_back('\f');
                        break;
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'v':
                        out.push_back('\v');
                        break;
                    case 'x':
                    case 'u':
                    case 'U': {
                        size_t count = next == 'x' ? 2U : (next == 'u' ? 4U : 8U);
                        if (auto cp = parse_hex_digits(body, i + 1U, count)) {
                            append_utf8(out, *cp);
                            i += count;
                        }
                        else {
                            out.push_back('\\');
                            out.push_back(next);
                        }
                        break;
                    }
                    default:
                        if (next >= '0' && next <= '7') {
                            uint32_t value = static_cast<uint32_t>(next - '0');
                            size_t used = 1U;
                            while (used < 3U && i + 1U < body.size() && body[i + 1U] >= '0' && body[i + 1U] <= '7') {
                                value = value * 8U + static_cast<uint32_t>(body[++i] - '0');
                                ++used;
                            }
                            append_utf8(out, value);
                        }
                        else {
                            out.push_back('\\');
                            out.push_back(next);
                        }
                        break;
                }
            }
            return out;
        }

    }  // namespace detail

    size_t scan_string_literal(std::string_view text, size_t quote_pos) {
        if (quote_pos >= text.size() || !detail::is_quote(text[quote_pos])) {
            return std::string_view::npos;
        }
        char quote = text[quote_pos];
        bool triple = quote_pos + 2U < text.size() && text[quote_pos + 1U] == quote && text[quote_pos + 2U] == quote;
        size_t i = quote_pos + (triple ? 3U : 1U);
        while (i < text.size()) {
            char c = text[i];
            if (c == '\\') {
                i += 2U;
                continue;
            }
            if (triple) {
                if (c == quote && i + 2U < text.size() && text[i + 1U] == quote && text[i + 2U] == quote) {
                    return i + 3U;
                }
            }
            else {
                if (c == quote) {
                    return i + 1U;
                }
                if (c == '\n') {
                    return std::string_view::npos;
                }
            }
            ++i;
        }
        return std::string_view::npos;
    }

    size_t string_prefix_length(std::string_view text, size_t pos) {
        for (size_t len = 2U; len >= 1U; --len) {
            if (pos + len >= text.size() || !detail::is_quote(text[pos + len])) {
                continue;
            }
            auto prefix = text.substr(pos, len);
            auto valid_letter = [](char c) {
                auto lower = utils::char_tolower(c);
                return lower == 'r' || lower == 'b' || lower == 'u' || lower == 'f';
            };
            if (!std::ranges::all_of(prefix, valid_letter)) {
                return 0U;
            }
            if (len == 2U) {
                auto a = utils::char_tolower(prefix[0]);
                auto b = utils::char_tolower(prefix[1]);
                bool valid = (a == 'r' && (b == 'b' || b == 'f')) || ((a == 'b' || a == 'f') && b == 'r');
                return valid ? len : 0U;
            }
            return len;
        }
        return 0U;
    }

    std::vector<logical_line> split_logical_lines(std::string_view source) {
        std::vector<logical_line> out{};
        logical_line current{};
        bool in_line = false;
        int depth = 0;
        size_t line_no = 0U;
        size_t i = 0U;

        while (i < source.size()) {
            if (!in_line) {
                auto line_end = source.find('\n', i);
                if (line_end == std::string_view::npos) {
                    line_end = source.size();
                }
                auto line = source.substr(i, line_end - i);
                auto indent = utils::leading_whitespace(line);
                auto rest = utils::trim_view(line.substr(indent));
                if (rest.empty() || rest.front() == '#') {
                    i = line_end == source.size() ? source.size() : line_end + 1U;
                    ++line_no;
                    continue;
                }
                current = logical_line{};
                current.first = line_no;
                current.indent = indent;
                in_line = true;
                depth = 0;
                i += indent;
                continue;
            }

            char c = source[i];
            if (c == '#') {
                while (i < source.size() && source[i] != '\n') {
                    ++i;
                }
                continue;
            }
            if (c == '\\' && i + 1U < source.size() && (source[i + 1U] == '\n' || source[i + 1U] == '\r')) {
                i += source[i + 1U] == '\r' && i + 2U < source.size() && source[i + 2U] == '\n' ? 3U : 2U;
                current.text.push_back(' ');
                ++line_no;
                continue;
            }
            if (detail::is_quote(c)) {
                auto end = scan_string_literal(source, i);
                if (end == std::string_view::npos) {
                    throw source_error("unterminated string literal at line {}"_format(line_no + 1U));
                }
                auto literal = source.substr(i, end - i);
                line_no += static_cast<size_t>(std::ranges::count(literal, '\n'));
                current.text.append(literal);
                i = end;
                continue;
            }
            if (c == '(' || c == '[' || c == '{') {
                ++depth;
            }
            else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
                --depth;
            }
            if (c == '\r') {
                ++i;
                continue;
            }
            if (c == '\n') {
                ++i;
                if (depth > 0) {
                    current.text.push_back('\n');
                    ++line_no;
                    continue;
                }
                current.last = line_no;
                out.push_back(std::move(current));
                in_line = false;
                ++line_no;
                continue;
            }
            current.text.push_back(c);
            ++i;
        }

        if (in_line) {
            current.last = line_no;
            out.push_back(std::move(current));
        }
        return out;
    }

    std::vector<token> tokenize_expression(std::string_view text) {
        std::vector<token> tokens{};
        size_t i = 0U;
        while (i < text.size()) {
            char c = text[i];
            if (utils::is_space(c) || c == '\\') {
                ++i;
                continue;
            }
            if (c == '#') {
                while (i < text.size() && text[i] != '\n') {
                    ++i;
                }
                continue;
            }

            auto prefix = detail::is_ident_start(c) ? string_prefix_length(text, i) : 0U;
            if (detail::is_quote(c) || prefix > 0U) {
                auto end = scan_string_literal(text, i + prefix);
                if (end == std::string_view::npos) {
                    throw source_error("unterminated string literal in expression: {}"_format(text));
                }
                tokens.push_back(token{token_kind::string, std::string{text.substr(i, end - i)}, i});
                i = end;
                continue;
            }

            if (detail::is_ident_start(c)) {
                auto start = i;
                while (i < text.size() && detail::is_ident_char(text[i])) {
                    ++i;
                }
                tokens.push_back(token{token_kind::name, std::string{text.substr(start, i - start)}, start});
                continue;
            }

            if (detail::is_digit(c) || (c == '.' && i + 1U < text.size() && detail::is_digit(text[i + 1U]))) {
                auto start = i;
                bool hex = c == '0' && i + 1U < text.size() && utils::char_tolower(text[i + 1U]) == 'x';
                while (i < text.size()) {
                    char d = text[i];
                    if (!hex && (d == 'e' || d == 'E') && i + 1U < text.size() &&
                        (text[i + 1U] == '+' || text[i + 1U] == '-')) {
                        i += 2U;
                        continue;
                    }
                    if (detail::is_ident_char(d) || d == '.') {
                        ++i;
                        continue;
                    }
                    break;
                }
                tokens.push_back(token{token_kind::number, std::string{text.substr(start, i - start)}, start});
                continue;
            }

            auto matched = false;
            for (auto op : detail::three_char_ops) {
                if (text.substr(i, 3U) == op) {
                    tokens.push_back(token{token_kind::op, std::string{op}, i});
                    i += 3U;
                    matched = true;
                    break;
                }
            }
            if (matched) {
                continue;
            }
            for (auto op : detail::two_char_ops) {
                if (text.substr(i, 2U) == op) {
                    tokens.push_back(token{token_kind::op, std::string{op}, i});
                    i += 2U;
                    matched = true;
                    break;
                }
            }
            if (matched) {
                continue;
            }
            tokens.push_back(token{token_kind::op, std::string(1U, c), i});
            ++i;
        }
        return tokens;
    }

    std::optional<std::string> decode_string_literal(std::string_view literal) {
        size_t prefix_len = 0U;
        while (prefix_len < literal.size() && !detail::is_quote(literal[prefix_len])) {
            ++prefix_len;
        }
        if (prefix_len >= literal.size()) {
            return std::nullopt;
        }
        bool raw = false;
        for (auto p : literal.substr(0U, prefix_len)) {
            auto lower = utils::char_tolower(p);
            if (lower == 'f' || lower == 'b') {
                return std::nullopt;
            }
            if (lower == 'r') {
                raw = true;
            }
        }

        auto quoted = literal.substr(prefix_len);
        char quote = quoted.front();
        size_t quote_len = quoted.size() >= 6U && quoted[1] == quote && quoted[2] == quote ? 3U : 1U;
        if (quoted.size() < quote_len * 2U) {
            return std::nullopt;
        }
        auto body = quoted.substr(quote_len, quoted.size() - quote_len * 2U);
        if (raw) {
            return std::string{body};
        }
        return detail::unescape(body);
    }

}  // namespace pycomp::internal
