#include "pycomp/python.hpp"

#include "internal/lexer.hpp"

#include "pycomp/errors.hpp"
#include "pycomp/format.hpp"
#include "pycomp/utils.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace pycomp::literals;

namespace pycomp {
    namespace detail {

        using namespace std::string_view_literals;
        using internal::token;
        using internal::token_kind;

        static constexpr std::array typing_aliases{"Any"sv,
                                                   "Callable"sv,
                                                   "Dict"sv,
                                                   "FrozenSet"sv,
                                                   "Iterable"sv,
                                                   "List"sv,
                                                   "Mapping"sv,
                                                   "Optional"sv,
                                                   "Sequence"sv,
                                                   "Set"sv,
                                                   "Tuple"sv,
                                                   "Type"sv,
                                                   "Union"sv};

        static constexpr std::array binary_operators{"|"sv,  "&"sv,  "^"sv,  "+"sv,  "-"sv,  "*"sv,  "/"sv,
                                                     "//"sv, "%"sv,  "**"sv, "@"sv,  "<<"sv, ">>"sv, "<"sv,
                                                     ">"sv,  "=="sv, "!="sv, "<="sv, ">="sv};

        static constexpr std::array binary_keywords{"or"sv, "and"sv, "if"sv, "else"sv, "in"sv, "is"sv, "not"sv};

        static constexpr std::array reserved_atoms{"lambda"sv, "yield"sv, "await"sv, "for"sv};

        struct parse_failure {};

        class expr_parser {
          public:
            explicit expr_parser(std::string_view text) : text_{text}, tokens_{internal::tokenize_expression(text)} {}

            py_expr parse() {
                if (tokens_.empty()) {
                    throw parse_failure{};
                }
                auto expr = parse_test();
                if (pos_ != tokens_.size()) {
                    throw parse_failure{};
                }
                return expr;
            }

          private:
            std::string_view text_;
            std::vector<token> tokens_;
            size_t pos_{0U};

            const token* peek(size_t ahead = 0U) const {
                auto index = pos_ + ahead;
                return index < tokens_.size() ? &tokens_[index] : nullptr;
            }

            bool peek_op(std::string_view op, size_t ahead = 0U) const {
                auto* t = peek(ahead);
                return t != nullptr && t->kind == token_kind::op && t->text == op;
            }

            bool accept_op(std::string_view op) {
                if (peek_op(op)) {
                    ++pos_;
                    return true;
                }
                return false;
            }

            void expect_op(std::string_view op) {
                if (!accept_op(op)) {
                    throw parse_failure{};
                }
            }

            std::string slice(size_t first_token) const {
                auto start = tokens_[first_token].offset;
                const auto& last = tokens_[pos_ - 1U];
                auto end = last.offset + last.text.size();
                return std::string{text_.substr(start, end - start)};
            }

            static bool is_binary_op(const token& t) {
                if (t.kind == token_kind::op) {
                    return std::ranges::find(binary_operators, std::string_view{t.text}) != binary_operators.end();
                }
                if (t.kind == token_kind::name) {
                    return std::ranges::find(binary_keywords, std::string_view{t.text}) != binary_keywords.end();
                }
                return false;
            }

            py_expr parse_test() {
                auto first = pos_;
                auto expr = parse_unary();
                bool combined = false;
                while (auto* t = peek()) {
                    if (!is_binary_op(*t)) {
                        break;
                    }
                    while (peek() != nullptr && is_binary_op(*peek())) {
                        ++pos_;
                    }
                    (void)parse_unary();
                    combined = true;
                }
                if (combined) {
                    py_expr opaque{};
                    opaque.kind = expr_kind::opaque;
                    opaque.source = slice(first);
                    return opaque;
                }
                return expr;
            }

            py_expr parse_unary() {
                auto first = pos_;
                if (accept_op("-"sv)) {
                    py_expr negated{};
                    negated.kind = expr_kind::unary_minus;
                    negated.value = "-";
                    negated.args.push_back(parse_unary());
                    negated.source = slice(first);
                    return negated;
                }
                if (accept_op("+"sv)) {
                    auto operand = parse_unary();
                    operand.source = slice(first);
                    return operand;
                }
                if (auto* t = peek(); t != nullptr && t->kind == token_kind::name && t->text == "not"sv) {
                    ++pos_;
                    (void)parse_unary();
                    py_expr opaque{};
                    opaque.source = slice(first);
                    return opaque;
                }
                return parse_postfix();
            }

            py_expr parse_postfix() {
                auto first = pos_;
                auto expr = parse_atom();
                while (true) {
                    if (accept_op("."sv)) {
                        auto* t = peek();
                        if (t == nullptr || t->kind != token_kind::name) {
                            throw parse_failure{};
                        }
                        ++pos_;
                        if (expr.kind == expr_kind::name) {
                            expr.value += '.';
                            expr.value += t->text;
                        }
                        else {
                            expr.kind = expr_kind::opaque;
                        }
                        expr.source = slice(first);
                        continue;
                    }
                    if (accept_op("("sv)) {
                        py_expr call{};
                        call.kind = expr.kind == expr_kind::name ? expr_kind::call : expr_kind::opaque;
                        call.value = expr.kind == expr_kind::name ? expr.value : std::string{};
                        parse_call_args(call);
                        call.source = slice(first);
                        expr = std::move(call);
                        continue;
                    }
                    if (accept_op("["sv)) {
                        py_expr subscript{};
                        subscript.kind = expr.kind == expr_kind::name ? expr_kind::subscript : expr_kind::opaque;
                        subscript.value = expr.kind == expr_kind::name ? expr.value : std::string{};
                        parse_subscript_items(subscript);
                        subscript.source = slice(first);
                        expr = std::move(subscript);
                        continue;
                    }
                    break;
                }
                return expr;
            }

            void parse_call_args(py_expr& call) {
                if (accept_op(")"sv)) {
                    return;
                }
                while (true) {
                    auto* t = peek();
                    if (t == nullptr) {
                        throw parse_failure{};
                    }
                    if (t->kind == token_kind::name && peek_op("="sv, 1U)) {
                        call.keyword_names.push_back(t->text);
                        pos_ += 2U;
                        call.keyword_values.push_back(parse_test());
                    }
                    else if (peek_op("*"sv) || peek_op("**"sv)) {
                        throw parse_failure{};
                    }
                    else {
                        call.args.push_back(parse_test());
                    }
                    if (accept_op(","sv)) {
                        if (accept_op(")"sv)) {
                            return;
                        }
                        continue;
                    }
                    expect_op(")"sv);
                    return;
                }
            }

            void parse_subscript_items(py_expr& subscript) {
                while (true) {
                    if (accept_op("]"sv)) {
                        return;
                    }
                    subscript.args.push_back(parse_test());
                    if (peek_op(":"sv)) {
                        throw parse_failure{};
                    }
                    if (accept_op(","sv)) {
                        continue;
                    }
                    expect_op("]"sv);
                    return;
                }
            }

            void parse_sequence_items(py_expr& sequence, std::string_view close) {
                while (!accept_op(close)) {
                    sequence.args.push_back(parse_test());
                    if (!accept_op(","sv)) {
                        expect_op(close);
                        return;
                    }
                }
            }

            py_expr parse_atom() {
                auto* t = peek();
                if (t == nullptr) {
                    throw parse_failure{};
                }
                auto first = pos_;
                py_expr expr{};

                switch (t->kind) {
                    case token_kind::name:
                        if (std::ranges::find(reserved_atoms, std::string_view{t->text}) != reserved_atoms.end()) {
                            throw parse_failure{};
                        }
                        ++pos_;
                        expr.kind = expr_kind::name;
                        expr.value = t->text;
                        expr.source = t->text;
                        return expr;
                    case token_kind::number:
                        ++pos_;
                        expr.kind = expr_kind::number;
                        expr.value = t->text;
                        expr.source = t->text;
                        return expr;
                    case token_kind::string: {
                        bool decodable = true;
                        while (peek() != nullptr && peek()->kind == token_kind::string) {
                            if (auto decoded = internal::decode_string_literal(peek()->text)) {
                                expr.value += *decoded;
                            }
                            else {
                                decodable = false;
                            }
                            ++pos_;
                        }
                        expr.kind = decodable ? expr_kind::string : expr_kind::opaque;
                        expr.source = slice(first);
                        return expr;
                    }
                    case token_kind::op:
                        break;
                }

                if (accept_op("("sv)) {
                    if (accept_op(")"sv)) {
                        expr.kind = expr_kind::tuple;
                        expr.source = slice(first);
                        return expr;
                    }
                    auto inner = parse_test();
                    if (accept_op(","sv)) {
                        expr.kind = expr_kind::tuple;
                        expr.args.push_back(std::move(inner));
                        parse_sequence_items(expr, ")"sv);
                        expr.source = slice(first);
                        return expr;
                    }
                    expect_op(")"sv);
                    return inner;
                }
                if (accept_op("["sv)) {
                    expr.kind = expr_kind::list;
                    parse_sequence_items(expr, "]"sv);
                    expr.source = slice(first);
                    return expr;
                }
                if (accept_op("{"sv)) {
                    expr.kind = expr_kind::dict;
                    while (!accept_op("}"sv)) {
                        expr.args.push_back(parse_test());
                        expect_op(":"sv);
                        expr.args.push_back(parse_test());
                        if (!accept_op(","sv)) {
                            expect_op("}"sv);
                            break;
                        }
                    }
                    expr.source = slice(first);
                    return expr;
                }
                if (accept_op("..."sv)) {
                    expr.kind = expr_kind::name;
                    expr.value = "...";
                    expr.source = "...";
                    return expr;
                }
                throw parse_failure{};
            }
        };

        // Index of `target` outside brackets and string literals, or npos.
        static size_t find_top_level(std::string_view text, char target, size_t start = 0U) {
            int depth = 0;
            size_t i = start;
            while (i < text.size()) {
                char c = text[i];
                if (c == '\'' || c == '"') {
                    auto end = internal::scan_string_literal(text, i);
                    if (end == std::string_view::npos) {
                        return std::string_view::npos;
                    }
                    i = end;
                    continue;
                }
                if (depth == 0 && c == target) {
                    return i;
                }
                if (c == '(' || c == '[' || c == '{') {
                    ++depth;
                }
                else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
                    --depth;
                }
                ++i;
            }
            return std::string_view::npos;
        }

        // Plain assignment '=' (not ==, <=, >=, !=, :=) at top level.
        static size_t find_top_level_assignment(std::string_view text) {
            size_t pos = 0U;
            while ((pos = find_top_level(text, '=', pos)) != std::string_view::npos) {
                char prev = pos > 0U ? text[pos - 1U] : '\0';
                char next = pos + 1U < text.size() ? text[pos + 1U] : '\0';
                if (next == '=') {
                    pos += 2U;
                    continue;
                }
                if (prev == '=' || prev == '!' || prev == '<' || prev == '>' || prev == ':') {
                    ++pos;
                    continue;
                }
                return pos;
            }
            return std::string_view::npos;
        }

        static std::vector<std::string_view> split_top_level(std::string_view text, char delimiter) {
            std::vector<std::string_view> pieces{};
            size_t start = 0U;
            while (true) {
                auto pos = find_top_level(text, delimiter, start);
                if (pos == std::string_view::npos) {
                    pieces.push_back(text.substr(start));
                    break;
                }
                pieces.push_back(text.substr(start, pos - start));
                start = pos + 1U;
            }
            return pieces;
        }

        static size_t find_matching_bracket(std::string_view text, size_t open_pos) {
            int depth = 0;
            size_t i = open_pos;
            while (i < text.size()) {
                char c = text[i];
                if (c == '\'' || c == '"') {
                    auto end = internal::scan_string_literal(text, i);
                    if (end == std::string_view::npos) {
                        return std::string_view::npos;
                    }
                    i = end;
                    continue;
                }
                if (c == '(' || c == '[' || c == '{') {
                    ++depth;
                }
                else if (c == ')' || c == ']' || c == '}') {
                    if (--depth == 0) {
                        return i;
                    }
                }
                ++i;
            }
            return std::string_view::npos;
        }

        static constexpr bool is_identifier_char(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                   static_cast<unsigned char>(c) >= 0x80U;
        }

        static size_t identifier_length(std::string_view text) {
            size_t n = 0U;
            while (n < text.size() && is_identifier_char(text[n])) {
                ++n;
            }
            if (n > 0U && text[0] >= '0' && text[0] <= '9') {
                return 0U;
            }
            return n;
        }

        static bool is_identifier(std::string_view text) {
            return !text.empty() && identifier_length(text) == text.size();
        }

        static bool starts_with_keyword(std::string_view text, std::string_view keyword) {
            return text.starts_with(keyword) &&
                   (text.size() == keyword.size() || !is_identifier_char(text[keyword.size()]));
        }

        static int64_t parse_int_literal(std::string_view literal) {
            std::string digits{};
            for (char c : literal) {
                if (c != '_') {
                    digits.push_back(c);
                }
            }
            int base = 10;
            std::string_view body{digits};
            if (body.size() > 2U && body[0] == '0') {
                auto marker = utils::char_tolower(body[1]);
                if (marker == 'x') {
                    base = 16;
                }
                else if (marker == 'o') {
                    base = 8;
                }
                else if (marker == 'b') {
                    base = 2;
                }
                if (base != 10) {
                    body.remove_prefix(2U);
                }
            }
            auto parsed = utils::parse_arithmetic<int64_t>(body, base);
            if (!parsed) {
                throw configuration_error("integer literal out of range or malformed: {}"_format(literal));
            }
            return *parsed;
        }

        static bool is_float_literal(std::string_view literal) {
            if (literal.size() > 1U && literal[0] == '0' && utils::char_tolower(literal[1]) == 'x') {
                return false;
            }
            return literal.find_first_of(".eE") != std::string_view::npos;
        }

        static double parse_float_literal(std::string_view literal) {
            std::string digits{};
            for (char c : literal) {
                if (c != '_') {
                    digits.push_back(c);
                }
            }
            auto parsed = utils::parse_arithmetic<double>(digits);
            if (!parsed) {
                throw configuration_error("malformed float literal: {}"_format(literal));
            }
            return *parsed;
        }

        static py_value make_value(auto&& alternative) {
            py_value value{};
            value.data = std::forward<decltype(alternative)>(alternative);
            return value;
        }

        static std::string repr_joined(const std::vector<py_value>& items) {
            std::vector<std::string> parts{};
            parts.reserve(items.size());
            for (const auto& item : items) {
                parts.push_back(py_repr(item));
            }
            return utils::join_with_separator(parts, ", "sv);
        }

        // Module-level NamedTuple / namedtuple declarations, later declarations win.
        struct tuple_declaration {
            std::string name{};
            named_tuple_shape shape{};
        };

        static std::optional<named_tuple_shape> shape_from_call(const py_expr& call) {
            if (call.is_call_to("NamedTuple"sv)) {
                named_tuple_shape shape{};
                if (!call.args.empty() && call.args[0].kind == expr_kind::string) {
                    shape.type_name = call.args[0].value;
                }
                if (call.args.size() >= 2U) {
                    const auto& field_list = call.args[1];
                    if (field_list.kind != expr_kind::list && field_list.kind != expr_kind::tuple) {
                        return std::nullopt;
                    }
                    for (const auto& item : field_list.args) {
                        if (item.kind != expr_kind::tuple || item.args.size() != 2U ||
                            item.args[0].kind != expr_kind::string) {
                            return std::nullopt;
                        }
                        shape.fields.push_back(named_tuple_field{item.args[0].value, item.args[1]});
                    }
                }
                for (size_t i = 0U; i < call.keyword_names.size(); ++i) {
                    shape.fields.push_back(named_tuple_field{call.keyword_names[i], call.keyword_values[i]});
                }
                return shape;
            }

            if (call.is_call_to("namedtuple"sv)) {
                named_tuple_shape shape{};
                if (!call.args.empty() && call.args[0].kind == expr_kind::string) {
                    shape.type_name = call.args[0].value;
                }
                const py_expr* field_spec = call.args.size() >= 2U ? &call.args[1] : call.keyword("field_names"sv);
                if (field_spec == nullptr) {
                    return std::nullopt;
                }
                if (field_spec->kind == expr_kind::string) {
                    auto names = utils::replace_all(field_spec->value, ","sv, " "sv);
                    std::string_view rest{names};
                    while (!(rest = utils::trim_view(rest)).empty()) {
                        auto end = rest.find_first_of(" \t\n"sv);
                        shape.fields.push_back(named_tuple_field{std::string{rest.substr(0U, end)}, std::nullopt});
                        if (end == std::string_view::npos) {
                            break;
                        }
                        rest.remove_prefix(end);
                    }
                    return shape;
                }
                if (field_spec->kind == expr_kind::list || field_spec->kind == expr_kind::tuple) {
                    for (const auto& item : field_spec->args) {
                        if (item.kind != expr_kind::string) {
                            return std::nullopt;
                        }
                        shape.fields.push_back(named_tuple_field{item.value, std::nullopt});
                    }
                    return shape;
                }
            }
            return std::nullopt;
        }

        static std::string join_physical_lines(const std::vector<std::string>& lines, size_t first, size_t last) {
            std::string text{};
            for (size_t i = first; i <= last && i < lines.size(); ++i) {
                text += lines[i];
            }
            if (!text.empty() && text.back() != '\n') {
                text.push_back('\n');
            }
            return text;
        }

        static std::vector<tuple_declaration> collect_tuple_declarations(
                const std::vector<internal::logical_line>& logical, const std::vector<std::string>& lines) {
            std::vector<tuple_declaration> declarations{};

            for (size_t i = 0U; i < logical.size(); ++i) {
                const auto& ll = logical[i];
                if (ll.indent != 0U) {
                    continue;
                }
                auto text = utils::trim_view(ll.text);

                if (starts_with_keyword(text, "class"sv)) {
                    auto rest = utils::trim_view(text.substr(5U));
                    auto name_len = identifier_length(rest);
                    if (name_len == 0U) {
                        continue;
                    }
                    auto name = rest.substr(0U, name_len);
                    auto after = utils::trim_view(rest.substr(name_len));
                    if (!after.starts_with('(')) {
                        continue;
                    }
                    auto close = find_matching_bracket(after, 0U);
                    if (close == std::string_view::npos) {
                        continue;
                    }
                    bool is_named_tuple = false;
                    for (auto base : split_top_level(after.substr(1U, close - 1U), ',')) {
                        auto base_expr = parse_expression(base);
                        if (base_expr.kind == expr_kind::name && base_expr.last_name_component() == "NamedTuple"sv) {
                            is_named_tuple = true;
                        }
                    }
                    if (!is_named_tuple) {
                        continue;
                    }

                    tuple_declaration declaration{};
                    declaration.name = std::string{name};
                    declaration.shape.type_name = declaration.name;
                    auto last_line = ll.last;
                    size_t body_indent = 0U;
                    for (size_t j = i + 1U; j < logical.size() && logical[j].indent > 0U; ++j) {
                        const auto& member = logical[j];
                        last_line = member.last;
                        if (body_indent == 0U) {
                            body_indent = member.indent;
                        }
                        if (member.indent != body_indent) {
                            continue;
                        }
                        auto member_text = utils::trim_view(member.text);
                        auto field_len = identifier_length(member_text);
                        if (field_len == 0U || starts_with_keyword(member_text, "def"sv)) {
                            continue;
                        }
                        auto field_rest = utils::trim_view(member_text.substr(field_len));
                        if (!field_rest.starts_with(':')) {
                            continue;
                        }
                        field_rest.remove_prefix(1U);
                        auto eq = find_top_level_assignment(field_rest);
                        auto annotation = utils::trim_view(field_rest.substr(0U, eq));
                        declaration.shape.fields.push_back(named_tuple_field{
                                std::string{member_text.substr(0U, field_len)}, parse_expression(annotation)});
                    }
                    declaration.shape.declaration_source = join_physical_lines(lines, ll.first, last_line);
                    declarations.push_back(std::move(declaration));
                    continue;
                }

                auto eq = find_top_level_assignment(text);
                if (eq == std::string_view::npos) {
                    continue;
                }
                auto target = utils::trim_view(text.substr(0U, eq));
                if (!is_identifier(target)) {
                    continue;
                }
                auto value = parse_expression(text.substr(eq + 1U));
                if (auto shape = shape_from_call(value)) {
                    tuple_declaration declaration{};
                    declaration.name = std::string{target};
                    declaration.shape = std::move(*shape);
                    declaration.shape.declaration_source = join_physical_lines(lines, ll.first, ll.last);
                    declarations.push_back(std::move(declaration));
                }
            }
            return declarations;
        }

        static std::vector<module_constant> collect_module_constants(
                const std::vector<internal::logical_line>& logical) {
            std::vector<module_constant> constants{};
            for (const auto& ll : logical) {
                if (ll.indent != 0U) {
                    continue;
                }
                auto text = utils::trim_view(ll.text);
                auto eq = find_top_level_assignment(text);
                if (eq == std::string_view::npos) {
                    continue;
                }
                auto target = utils::trim_view(text.substr(0U, eq));
                bool augmented = false;
                while (!target.empty() && "+-*/%&|^@"sv.find(target.back()) != std::string_view::npos) {
                    target.remove_suffix(1U);
                    augmented = true;
                }
                target = utils::trim_view(target.substr(0U, find_top_level(target, ':')));
                if (!is_identifier(target)) {
                    continue;
                }

                std::erase_if(constants, [target](const module_constant& c) { return c.name == target; });
                if (augmented) {
                    continue;
                }
                auto value_expr = parse_expression(text.substr(eq + 1U));
                try {
                    constants.push_back(module_constant{std::string{target}, evaluate_literal(value_expr, constants)});
                } catch (const configuration_error& e) {
                    debug_log("module binding ", target, " is not a constant: ", e.what());
                }
            }
            return constants;
        }

        static std::optional<named_tuple_shape> resolve_return_tuple(
                const py_expr& annotation, const std::vector<tuple_declaration>& declarations) {
            if (annotation.kind == expr_kind::call) {
                return shape_from_call(annotation);
            }
            if (annotation.kind != expr_kind::name) {
                return std::nullopt;
            }
            auto name = annotation.last_name_component();
            for (auto it = declarations.rbegin(); it != declarations.rend(); ++it) {
                if (it->name == name) {
                    return it->shape;
                }
            }
            return std::nullopt;
        }

        static std::optional<std::string> docstring_from_statement(std::string_view statement) {
            statement = utils::trim_view(statement);
            if (statement.empty()) {
                return std::nullopt;
            }
            auto tokens = internal::tokenize_expression(statement);
            std::string doc{};
            for (const auto& t : tokens) {
                if (t.kind != token_kind::string) {
                    return std::nullopt;
                }
                auto decoded = internal::decode_string_literal(t.text);
                if (!decoded) {
                    return std::nullopt;
                }
                doc += *decoded;
            }
            if (tokens.empty()) {
                return std::nullopt;
            }
            return doc;
        }

        static std::optional<std::string> attribute_string(const py_expr& expr, std::string_view attribute) {
            auto value = evaluate_literal(expr);
            if (value.is_none()) {
                return std::nullopt;
            }
            if (!value.is_str()) {
                throw configuration_error(
                        "python_component {} must be a string, got {}"_format(attribute, value.type_name()));
            }
            return std::get<std::string>(value.data);
        }

        static component_attributes parse_component_attributes(const std::vector<std::string>& decorators) {
            static constexpr std::array positional{
                    "name"sv, "description"sv, "base_image"sv, "target_component_file"sv};

            component_attributes attributes{};
            for (const auto& decorator : decorators) {
                auto text = utils::trim_view(decorator);
                text.remove_prefix(1U);
                auto expr = parse_expression(text);
                if (!expr.is_call_to("python_component"sv)) {
                    continue;
                }

                auto assign = [&attributes](std::string_view key, const py_expr& value) {
                    auto parsed = attribute_string(value, key);
                    if (key == "name"sv) {
                        attributes.name = std::move(parsed);
                    }
                    else if (key == "description"sv) {
                        attributes.description = std::move(parsed);
                    }
                    else if (key == "base_image"sv) {
                        attributes.base_image = std::move(parsed);
                    }
                    else if (key == "target_component_file"sv) {
                        attributes.target_component_file = std::move(parsed);
                    }
                    else {
                        throw configuration_error("unknown python_component argument: {}"_format(key));
                    }
                };

                if (expr.args.size() > positional.size()) {
                    throw configuration_error("python_component takes at most {} arguments"_format(positional.size()));
                }
                for (size_t i = 0U; i < expr.args.size(); ++i) {
                    assign(positional[i], expr.args[i]);
                }
                for (size_t i = 0U; i < expr.keyword_names.size(); ++i) {
                    assign(expr.keyword_names[i], expr.keyword_values[i]);
                }
                debug_log("python_component attributes attached from decorator: ", decorator);
            }
            return attributes;
        }

        static py_parameter parse_parameter(std::string_view piece, bool keyword_only) {
            py_parameter parameter{};
            parameter.keyword_only = keyword_only;

            auto eq = find_top_level_assignment(piece);
            auto left = piece.substr(0U, eq);
            if (eq != std::string_view::npos) {
                parameter.default_value = parse_expression(piece.substr(eq + 1U));
            }

            auto colon = find_top_level(left, ':');
            auto name = utils::trim_view(left.substr(0U, colon));
            if (!is_identifier(name)) {
                throw source_error("malformed parameter: {}"_format(utils::trim_view(piece)));
            }
            parameter.name = std::string{name};
            if (colon != std::string_view::npos) {
                auto annotation = utils::trim_view(left.substr(colon + 1U));
                if (annotation.empty()) {
                    throw source_error("empty annotation on parameter {}"_format(name));
                }
                parameter.annotation = parse_expression(annotation);
            }
            return parameter;
        }

        static std::vector<py_parameter> parse_parameters(std::string_view params_text) {
            std::vector<py_parameter> parameters{};
            bool keyword_only = false;
            for (auto raw : split_top_level(params_text, ',')) {
                auto piece = utils::trim_view(raw);
                if (piece.empty()) {
                    continue;
                }
                if (piece == "/"sv) {
                    continue;
                }
                if (piece == "*"sv) {
                    keyword_only = true;
                    continue;
                }
                if (piece.starts_with('*')) {
                    throw configuration_error(
                            "variadic parameter {} is not supported in components"_format(piece.substr(
                                    0U, std::min(piece.size(), find_top_level(piece, ':')))));
                }
                parameters.push_back(parse_parameter(piece, keyword_only));
            }
            return parameters;
        }

        struct function_header {
            std::string name{};
            std::string params_text{};
            std::string return_annotation{};
            std::string inline_body{};
        };

        // Returns the name when the logical line is `[async] def <name>(`.
        static std::optional<std::string_view> defined_function_name(std::string_view text) {
            text = utils::trim_view(text);
            if (starts_with_keyword(text, "async"sv)) {
                text = utils::trim_view(text.substr(5U));
            }
            if (!starts_with_keyword(text, "def"sv)) {
                return std::nullopt;
            }
            text = utils::trim_view(text.substr(3U));
            auto len = identifier_length(text);
            if (len == 0U) {
                return std::nullopt;
            }
            return text.substr(0U, len);
        }

        static function_header parse_header(std::string_view text) {
            text = utils::trim_view(text);
            if (starts_with_keyword(text, "async"sv)) {
                text = utils::trim_view(text.substr(5U));
            }
            text = utils::trim_view(text.substr(3U));
            auto len = identifier_length(text);

            function_header header{};
            header.name = std::string{text.substr(0U, len)};
            auto rest = utils::trim_view(text.substr(len));
            if (!rest.starts_with('(')) {
                throw source_error("malformed header for function {}"_format(header.name));
            }
            auto close = find_matching_bracket(rest, 0U);
            if (close == std::string_view::npos) {
                throw source_error("unbalanced parameter list for function {}"_format(header.name));
            }
            header.params_text = std::string{rest.substr(1U, close - 1U)};

            auto after = utils::trim_view(rest.substr(close + 1U));
            auto colon = find_top_level(after, ':');
            if (colon == std::string_view::npos) {
                throw source_error("missing ':' after header of function {}"_format(header.name));
            }
            auto head = utils::trim_view(after.substr(0U, colon));
            if (head.starts_with("->"sv)) {
                header.return_annotation = std::string{utils::trim_view(head.substr(2U))};
                if (header.return_annotation.empty()) {
                    throw source_error("empty return annotation on function {}"_format(header.name));
                }
            }
            else if (!head.empty()) {
                throw source_error("unexpected text after parameters of function {}: {}"_format(header.name, head));
            }
            header.inline_body = std::string{utils::trim_view(after.substr(colon + 1U))};
            return header;
        }

        static constexpr std::array python_keywords{
                "False"sv,  "None"sv,   "True"sv,  "and"sv,    "as"sv,       "assert"sv, "async"sv,
                "await"sv,  "break"sv,  "class"sv, "continue"sv, "def"sv,    "del"sv,    "elif"sv,
                "else"sv,   "except"sv, "finally"sv, "for"sv,  "from"sv,     "global"sv, "if"sv,
                "import"sv, "in"sv,     "is"sv,    "lambda"sv, "nonlocal"sv, "not"sv,    "or"sv,
                "pass"sv,   "raise"sv,  "return"sv, "try"sv,   "while"sv,    "with"sv,   "yield"sv};

        static constexpr std::array continuation_keywords{"elif"sv, "else"sv, "except"sv, "finally"sv};

        static bool is_string_prefix(std::string_view word) {
            return word.size() <= 2U && std::ranges::all_of(word, [](char c) {
                       return std::string_view{"rRbBuUfF"}.find(c) != std::string_view::npos;
                   });
        }

        // Free names read by `text`; attribute names after '.' and keywords are skipped. f-string
        // bodies are scanned as code.
        static void collect_names(std::string_view text, std::vector<std::string>& names) {
            size_t i = 0U;
            while (i < text.size()) {
                char c = text[i];
                if (c == '#') {
                    auto newline = text.find('\n', i);
                    if (newline == std::string_view::npos) {
                        break;
                    }
                    i = newline;
                    continue;
                }
                if (c == '\'' || c == '"') {
                    auto end = internal::scan_string_literal(text, i);
                    if (end == std::string_view::npos) {
                        break;
                    }
                    i = end;
                    continue;
                }
                if (!is_identifier_char(c)) {
                    ++i;
                    continue;
                }
                if (c >= '0' && c <= '9') {
                    while (i < text.size() && (is_identifier_char(text[i]) || text[i] == '.')) {
                        ++i;
                    }
                    continue;
                }

                auto len = identifier_length(text.substr(i));
                auto word = text.substr(i, len);
                auto next = i + len;
                if (next < text.size() && (text[next] == '\'' || text[next] == '"') && is_string_prefix(word)) {
                    auto end = internal::scan_string_literal(text, next);
                    if (end == std::string_view::npos) {
                        break;
                    }
                    if (word.find_first_of("fF"sv) != std::string_view::npos) {
                        collect_names(text.substr(next + 1U, end - next - 2U), names);
                    }
                    i = end;
                    continue;
                }

                auto before = i;
                while (before > 0U && (text[before - 1U] == ' ' || text[before - 1U] == '\t')) {
                    --before;
                }
                bool attribute = before > 0U && text[before - 1U] == '.';
                if (!attribute && std::ranges::find(python_keywords, word) == python_keywords.end()) {
                    utils::append_unique(names, std::string{word});
                }
                i = next;
            }
        }

        // Names a single top-level line binds: imports, def, class and assignment targets.
        static void collect_bindings(std::string_view text, std::vector<std::string>& names) {
            text = utils::trim_view(text);
            if (starts_with_keyword(text, "import"sv)) {
                for (auto raw : split_top_level(text.substr(6U), ',')) {
                    auto piece = utils::trim_view(raw);
                    if (auto as = piece.find(" as "sv); as != std::string_view::npos) {
                        utils::append_unique(names, std::string{utils::trim_view(piece.substr(as + 4U))});
                    }
                    else {
                        utils::append_unique(names, std::string{piece.substr(0U, piece.find('.'))});
                    }
                }
                return;
            }
            if (starts_with_keyword(text, "from"sv)) {
                auto import_pos = text.find(" import "sv);
                if (import_pos == std::string_view::npos) {
                    return;
                }
                auto imported = utils::trim_view(text.substr(import_pos + 8U));
                if (imported.starts_with('(') && imported.ends_with(')')) {
                    imported = imported.substr(1U, imported.size() - 2U);
                }
                for (auto raw : split_top_level(imported, ',')) {
                    auto piece = utils::trim_view(raw);
                    if (auto as = piece.find(" as "sv); as != std::string_view::npos) {
                        piece = utils::trim_view(piece.substr(as + 4U));
                    }
                    if (is_identifier(piece)) {
                        utils::append_unique(names, std::string{piece});
                    }
                }
                return;
            }
            if (auto defined = defined_function_name(text)) {
                utils::append_unique(names, std::string{*defined});
                return;
            }
            if (starts_with_keyword(text, "class"sv)) {
                auto rest = utils::trim_view(text.substr(5U));
                if (auto len = identifier_length(rest); len > 0U) {
                    utils::append_unique(names, std::string{rest.substr(0U, len)});
                }
                return;
            }

            size_t eq = 0U;
            while ((eq = find_top_level_assignment(text)) != std::string_view::npos) {
                auto target = utils::trim_view(text.substr(0U, eq));
                while (!target.empty() && "+-*/%&|^@"sv.find(target.back()) != std::string_view::npos) {
                    target.remove_suffix(1U);
                }
                target = utils::trim_view(target.substr(0U, find_top_level(target, ':')));
                if ((target.starts_with('(') && target.ends_with(')')) || (target.starts_with('[') && target.ends_with(']'))) {
                    target = target.substr(1U, target.size() - 2U);
                }
                for (auto raw : split_top_level(target, ',')) {
                    auto piece = utils::trim_view(raw);
                    if (piece.starts_with('*')) {
                        piece.remove_prefix(1U);
                    }
                    if (is_identifier(piece)) {
                        utils::append_unique(names, std::string{piece});
                    }
                }
                text = text.substr(eq + 1U);
            }
        }

        struct module_statement {
            // physical lines, inclusive
            size_t first{};
            size_t last{};
            std::vector<std::string> bound{};
            std::vector<std::string> referenced{};
            bool future_import{false};
        };

        // Groups the logical lines of a module into top-level statements. Decorators belong to the
        // def or class below them; `elif`, `else`, `except` and `finally` continue the statement above.
        static std::vector<module_statement> split_module_statements(
                const std::vector<internal::logical_line>& logical) {
            std::vector<module_statement> statements{};
            size_t i = 0U;
            while (i < logical.size()) {
                if (logical[i].indent != 0U) {
                    ++i;
                    continue;
                }
                module_statement statement{};
                statement.first = logical[i].first;

                auto head = i;
                while (head < logical.size() && utils::trim_view(logical[head].text).starts_with('@')) {
                    ++head;
                }
                if (head == logical.size()) {
                    head = logical.size() - 1U;
                }
                auto head_text = utils::trim_view(logical[head].text);
                bool scoped = defined_function_name(head_text).has_value() || starts_with_keyword(head_text, "class"sv);
                statement.future_import = starts_with_keyword(head_text, "from"sv) &&
                                          starts_with_keyword(utils::trim_view(head_text.substr(4U)), "__future__"sv);

                auto end = head + 1U;
                while (end < logical.size()) {
                    if (logical[end].indent > 0U) {
                        ++end;
                        continue;
                    }
                    auto next_text = utils::trim_view(logical[end].text);
                    bool continues = std::ranges::any_of(continuation_keywords, [next_text](std::string_view keyword) {
                        return starts_with_keyword(next_text, keyword);
                    });
                    if (!continues) {
                        break;
                    }
                    ++end;
                }

                statement.last = logical[end - 1U].last;
                for (auto k = i; k < end; ++k) {
                    collect_names(logical[k].text, statement.referenced);
                    if (!scoped || k == head) {
                        collect_bindings(logical[k].text, statement.bound);
                    }
                }
                statements.push_back(std::move(statement));
                i = end;
            }
            return statements;
        }

        static void collect_default_names(const py_expr& expr, std::vector<std::string>& names) {
            if (expr.kind == expr_kind::name && is_identifier(expr.value)) {
                utils::append_unique(names, expr.value);
            }
            for (const auto& arg : expr.args) {
                collect_default_names(arg, names);
            }
            for (const auto& value : expr.keyword_values) {
                collect_default_names(value, names);
            }
        }

    }  // namespace detail

    std::string_view py_value::type_name() const {
        switch (data.index()) {
            case 0:
                return "NoneType"sv;
            case 1:
                return "bool"sv;
            case 2:
                return "int"sv;
            case 3:
                return "float"sv;
            case 4:
                return "str"sv;
            case 5:
                return std::get<py_sequence>(data).is_tuple ? "tuple"sv : "list"sv;
            case 6:
                return "dict"sv;
        }
        return "object"sv;
    }

    py_expr parse_expression(std::string_view text) {
        auto trimmed = utils::trim_view(text);
        try {
            detail::expr_parser parser{trimmed};
            return parser.parse();
        } catch (const detail::parse_failure&) {
            py_expr opaque{};
            opaque.kind = expr_kind::opaque;
            opaque.source = std::string{trimmed};
            return opaque;
        }
    }

    bool is_typing_alias(std::string_view name) {
        return std::ranges::find(detail::typing_aliases, name) != detail::typing_aliases.end();
    }

    std::string render_expr(const py_expr& expr) {
        auto render_all = [](const std::vector<py_expr>& items) {
            std::vector<std::string> parts{};
            parts.reserve(items.size());
            for (const auto& item : items) {
                parts.push_back(render_expr(item));
            }
            return parts;
        };

        switch (expr.kind) {
            case expr_kind::name:
            case expr_kind::number:
                return expr.value;
            case expr_kind::string:
                return py_repr(expr.value);
            case expr_kind::call: {
                auto parts = render_all(expr.args);
                for (size_t i = 0U; i < expr.keyword_names.size(); ++i) {
                    parts.push_back("{}={}"_format(expr.keyword_names[i], render_expr(expr.keyword_values[i])));
                }
                return "{}({})"_format(expr.value, utils::join_with_separator(parts, ", "sv));
            }
            case expr_kind::subscript: {
                auto base = is_typing_alias(expr.value) ? "typing." + expr.value : expr.value;
                return "{}[{}]"_format(base, utils::join_with_separator(render_all(expr.args), ", "sv));
            }
            case expr_kind::tuple: {
                auto inner = utils::join_with_separator(render_all(expr.args), ", "sv);
                return expr.args.size() == 1U ? "({},)"_format(inner) : "({})"_format(inner);
            }
            case expr_kind::list:
                return "[{}]"_format(utils::join_with_separator(render_all(expr.args), ", "sv));
            case expr_kind::dict: {
                std::vector<std::string> parts{};
                for (size_t i = 0U; i + 1U < expr.args.size(); i += 2U) {
                    parts.push_back("{}: {}"_format(render_expr(expr.args[i]), render_expr(expr.args[i + 1U])));
                }
                return "{{{}}}"_format(utils::join_with_separator(parts, ", "sv));
            }
            case expr_kind::unary_minus:
                return "-" + (expr.args.empty() ? std::string{} : render_expr(expr.args[0]));
            case expr_kind::opaque:
                return expr.source;
        }
        return expr.source;
    }

    py_value evaluate_literal(const py_expr& expr, const std::vector<module_constant>& constants) {
        switch (expr.kind) {
            case expr_kind::name:
                if (expr.value == "None"sv) {
                    return py_value{};
                }
                if (expr.value == "True"sv) {
                    return detail::make_value(true);
                }
                if (expr.value == "False"sv) {
                    return detail::make_value(false);
                }
                for (auto it = constants.rbegin(); it != constants.rend(); ++it) {
                    if (it->name == expr.value) {
                        return it->value;
                    }
                }
                break;
            case expr_kind::string:
                return detail::make_value(expr.value);
            case expr_kind::number:
                if (utils::char_tolower(expr.value.back()) == 'j') {
                    break;
                }
                if (detail::is_float_literal(expr.value)) {
                    return detail::make_value(detail::parse_float_literal(expr.value));
                }
                return detail::make_value(detail::parse_int_literal(expr.value));
            case expr_kind::unary_minus: {
                if (expr.args.empty()) {
                    break;
                }
                auto operand = evaluate_literal(expr.args[0], constants);
                if (operand.is_int()) {
                    auto v = std::get<int64_t>(operand.data);
                    if (v == std::numeric_limits<int64_t>::min()) {
                        throw configuration_error("integer literal out of range: {}"_format(expr.source));
                    }
                    return detail::make_value(-v);
                }
                if (operand.is_float()) {
                    return detail::make_value(-std::get<double>(operand.data));
                }
                break;
            }
            case expr_kind::tuple:
            case expr_kind::list: {
                py_sequence sequence{};
                sequence.is_tuple = expr.kind == expr_kind::tuple;
                for (const auto& item : expr.args) {
                    sequence.items.push_back(evaluate_literal(item, constants));
                }
                return detail::make_value(std::move(sequence));
            }
            case expr_kind::dict: {
                py_dict dict{};
                for (size_t i = 0U; i + 1U < expr.args.size(); i += 2U) {
                    dict.keys.push_back(evaluate_literal(expr.args[i], constants));
                    dict.values.push_back(evaluate_literal(expr.args[i + 1U], constants));
                }
                return detail::make_value(std::move(dict));
            }
            case expr_kind::call:
            case expr_kind::subscript:
            case expr_kind::opaque:
                break;
        }
        throw configuration_error("default value is not a literal: {}"_format(render_expr(expr)));
    }

    py_function load_function(std::string_view module_source, std::string_view function_name, std::string_view module_name) {
        auto lines = utils::split_lines_keepends(module_source);
        auto logical = internal::split_logical_lines(module_source);

        std::optional<size_t> top_level{};
        std::optional<size_t> nested{};
        for (size_t i = 0U; i < logical.size(); ++i) {
            auto defined = detail::defined_function_name(logical[i].text);
            if (!defined || *defined != function_name) {
                continue;
            }
            if (logical[i].indent == 0U) {
                top_level = i;
            }
            else if (!nested) {
                nested = i;
            }
        }
        if (!top_level && !nested) {
            throw source_error("function '{}' is not defined in module {}"_format(function_name, module_name));
        }

        auto def_index = top_level ? *top_level : *nested;
        const auto& def_line = logical[def_index];
        auto header = detail::parse_header(def_line.text);

        auto first_index = def_index;
        while (first_index > 0U && logical[first_index - 1U].indent == def_line.indent &&
               utils::trim_view(logical[first_index - 1U].text).starts_with('@')) {
            --first_index;
        }

        auto last_physical = def_line.last;
        auto body_index = def_index + 1U;
        if (header.inline_body.empty()) {
            if (body_index >= logical.size() || logical[body_index].indent <= def_line.indent) {
                throw source_error("function '{}' has no body"_format(function_name));
            }
            for (auto k = body_index; k < logical.size() && logical[k].indent > def_line.indent; ++k) {
                last_physical = logical[k].last;
            }
        }

        py_function function{};
        function.name = header.name;
        function.module_name = std::string{module_name};
        function.module_source = std::string{module_source};
        function.nested = def_line.indent > 0U;

        auto first_physical = logical[first_index].first;
        function.first_line = first_physical;
        function.decorator_line_count = def_line.first - first_physical;
        for (auto i = first_physical; i <= last_physical && i < lines.size(); ++i) {
            function.source_lines.push_back(lines[i]);
        }
        if (!function.source_lines.empty() && !function.source_lines.back().ends_with('\n')) {
            function.source_lines.back().push_back('\n');
        }

        std::vector<std::string> decorators{};
        for (auto i = first_index; i < def_index; ++i) {
            decorators.push_back(logical[i].text);
        }
        function.attributes = detail::parse_component_attributes(decorators);

        function.parameters = detail::parse_parameters(header.params_text);
        function.constants = detail::collect_module_constants(logical);
        if (!header.return_annotation.empty()) {
            function.return_annotation = parse_expression(header.return_annotation);
            auto declarations = detail::collect_tuple_declarations(logical, lines);
            function.return_tuple = detail::resolve_return_tuple(*function.return_annotation, declarations);
        }

        if (!header.inline_body.empty()) {
            auto first_statement = std::string_view{header.inline_body}.substr(
                    0U, detail::find_top_level(header.inline_body, ';'));
            function.docstring = detail::docstring_from_statement(first_statement);
        }
        else {
            function.docstring = detail::docstring_from_statement(logical[body_index].text);
        }

        debug_log("loaded function ", function.name, " (", function.parameters.size(), " parameters, ",
                  function.source_lines.size(), " source lines)");
        return function;
    }

    std::string format_float_repr(double value) {
        if (std::isnan(value)) {
            return "nan";
        }
        if (std::isinf(value)) {
            return value < 0 ? "-inf" : "inf";
        }
        if (value == 0.0) {
            return std::signbit(value) ? "-0.0" : "0.0";
        }

        std::array<char, 64> buffer{};
        auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::scientific);
        if (ec != std::errc{}) {
            return std::to_string(value);
        }
        std::string_view sci{buffer.data(), static_cast<size_t>(end - buffer.data())};

        std::string sign{};
        if (sci.starts_with('-')) {
            sign = "-";
            sci.remove_prefix(1U);
        }
        auto e_pos = sci.find('e');
        auto mantissa = sci.substr(0U, e_pos);
        auto exponent = utils::parse_arithmetic<int>(
                sci[e_pos + 1U] == '+' ? sci.substr(e_pos + 2U) : sci.substr(e_pos + 1U));
        int exp = exponent.value_or(0);

        std::string digits{};
        for (char c : mantissa) {
            if (c != '.') {
                digits.push_back(c);
            }
        }

        if (exp < -4 || exp >= 16) {
            std::string out = sign;
            out.push_back(digits[0]);
            if (digits.size() > 1U) {
                out.push_back('.');
                out.append(digits.substr(1U));
            }
            out += "e{}{:02}"_format(exp < 0 ? '-' : '+', exp < 0 ? -exp : exp);
            return out;
        }

        std::string out = sign;
        if (exp < 0) {
            out += "0.";
            out.append(static_cast<size_t>(-exp - 1), '0');
            out += digits;
            return out;
        }
        auto int_len = static_cast<size_t>(exp) + 1U;
        if (digits.size() <= int_len) {
            out += digits;
            out.append(int_len - digits.size(), '0');
            out += ".0";
            return out;
        }
        out += digits.substr(0U, int_len);
        out.push_back('.');
        out += digits.substr(int_len);
        return out;
    }

    std::string py_repr(std::string_view text) {
        bool has_single = text.find('\'') != std::string_view::npos;
        bool has_double = text.find('"') != std::string_view::npos;
        char quote = has_single && !has_double ? '"' : '\'';

        std::string out{};
        out.reserve(text.size() + 2U);
        out.push_back(quote);
        for (char c : text) {
            auto byte = static_cast<unsigned char>(c);
            if (c == quote || c == '\\') {
                out.push_back('\\');
                out.push_back(c);
            }
            else if (c == '\n') {
                out += "\\n";
            }
            else if (c == '\r') {
                out += "\\r";
            }
            else if (c == '\t') {
                out += "\\t";
            }
            else if (byte < 0x20U || byte == 0x7FU) {
                out += "\\x{:02x}"_format(static_cast<unsigned>(byte));
            }
            else {
                out.push_back(c);
            }
        }
        out.push_back(quote);
        return out;
    }

    std::string py_repr(const py_value& value) {
        if (value.is_str()) {
            return py_repr(std::string_view{std::get<std::string>(value.data)});
        }
        return py_str(value);
    }

    std::string py_str(const py_value& value) {
        return std::visit(
                [](const auto& alternative) -> std::string {
                    using T = std::decay_t<decltype(alternative)>;
                    if constexpr (std::is_same_v<T, py_none>) {
                        return "None";
                    }
                    else if constexpr (std::is_same_v<T, bool>) {
                        return alternative ? "True" : "False";
                    }
                    else if constexpr (std::is_same_v<T, int64_t>) {
                        return std::to_string(alternative);
                    }
                    else if constexpr (std::is_same_v<T, double>) {
                        return format_float_repr(alternative);
                    }
                    else if constexpr (std::is_same_v<T, std::string>) {
                        return alternative;
                    }
                    else if constexpr (std::is_same_v<T, py_sequence>) {
                        auto inner = detail::repr_joined(alternative.items);
                        if (!alternative.is_tuple) {
                            return "[{}]"_format(inner);
                        }
                        return alternative.items.size() == 1U ? "({},)"_format(inner) : "({})"_format(inner);
                    }
                    else {
                        std::vector<std::string> parts{};
                        for (size_t i = 0U; i < alternative.keys.size(); ++i) {
                            parts.push_back(
                                    "{}: {}"_format(py_repr(alternative.keys[i]), py_repr(alternative.values[i])));
                        }
                        return "{{{}}}"_format(utils::join_with_separator(parts, ", "sv));
                    }
                },
                value.data);
    }

    std::string unannotated_function_source(const py_function& function) {
        std::string text{};
        size_t indent = 0U;
        for (auto i = std::min(function.decorator_line_count, function.source_lines.size());
             i < function.source_lines.size();
             ++i) {
            std::string_view line{function.source_lines[i]};
            if (text.empty()) {
                indent = utils::leading_whitespace(line);
            }
            text += line.substr(std::min(indent, utils::leading_whitespace(line)));
        }

        auto lines = utils::split_lines_keepends(text);
        auto logical = internal::split_logical_lines(text);
        if (logical.empty()) {
            throw source_error("function '{}' has no source"_format(function.name));
        }
        auto head_text = utils::trim_view(logical.front().text);
        auto header = detail::parse_header(head_text);

        std::vector<std::string> params{};
        for (auto raw : detail::split_top_level(header.params_text, ',')) {
            auto piece = utils::trim_view(raw);
            if (piece.empty()) {
                continue;
            }
            auto eq = detail::find_top_level_assignment(piece);
            auto left = piece.substr(0U, eq);
            std::string param{utils::trim_view(left.substr(0U, detail::find_top_level(left, ':')))};
            if (eq != std::string_view::npos) {
                param += "=";
                param += utils::trim_view(piece.substr(eq + 1U));
            }
            params.push_back(std::move(param));
        }

        auto source = "{}def {}({}):"_format(
                detail::starts_with_keyword(head_text, "async"sv) ? "async "sv : ""sv,
                header.name,
                utils::join_with_separator(params, ", "sv));
        if (!header.inline_body.empty()) {
            source += " ";
            source += header.inline_body;
        }
        source += "\n";
        for (auto i = logical.front().last + 1U; i < lines.size(); ++i) {
            source += lines[i];
        }
        if (!source.ends_with('\n')) {
            source.push_back('\n');
        }
        return source;
    }

    std::string default_value_bindings(const py_function& function) {
        std::vector<std::string> names{};
        for (const auto& parameter : function.parameters) {
            if (parameter.default_value) {
                detail::collect_default_names(*parameter.default_value, names);
            }
        }

        std::string text{};
        for (const auto& name : names) {
            auto it = std::ranges::find(function.constants.rbegin(), function.constants.rend(), name, &module_constant::name);
            if (it != function.constants.rend()) {
                text += "{} = {}\n"_format(name, py_repr(it->value));
            }
        }
        return text;
    }

    std::string function_dependency_source(const py_function& function) {
        auto lines = utils::split_lines_keepends(function.module_source);
        auto statements = detail::split_module_statements(internal::split_logical_lines(function.module_source));
        auto function_text = unannotated_function_source(function);

        std::optional<size_t> own{};
        if (!function.nested) {
            for (size_t k = 0U; k < statements.size(); ++k) {
                if (statements[k].first <= function.first_line && function.first_line <= statements[k].last) {
                    own = k;
                }
            }
        }

        std::vector<std::string> pending{};
        detail::collect_names(function_text, pending);
        std::erase_if(pending, [&function](const std::string& name) {
            return name == function.name || std::ranges::any_of(function.parameters, [&name](const py_parameter& p) {
                       return p.name == name;
                   });
        });

        std::vector<bool> included(statements.size(), false);
        std::vector<std::string> resolved{};
        while (!pending.empty()) {
            auto name = std::move(pending.back());
            pending.pop_back();
            if (std::ranges::find(resolved, name) != resolved.end()) {
                continue;
            }
            resolved.push_back(name);
            for (size_t k = 0U; k < statements.size(); ++k) {
                if (included[k] || k == own || std::ranges::find(statements[k].bound, name) == statements[k].bound.end()) {
                    continue;
                }
                included[k] = true;
                pending.insert(pending.end(), statements[k].referenced.begin(), statements[k].referenced.end());
            }
        }

        std::vector<std::string> pieces{};
        for (size_t k = 0U; k < statements.size(); ++k) {
            if (k == own) {
                pieces.push_back(function_text);
            }
            else if (included[k] || statements[k].future_import) {
                pieces.push_back(detail::join_physical_lines(lines, statements[k].first, statements[k].last));
            }
        }
        if (!own) {
            pieces.push_back(function_text);
        }

        debug_log("kept ", pieces.size() - 1U, " of ", statements.size(), " module statements for ", function.name);
        return utils::join_with_separator(pieces, "\n"sv);
    }

}  // namespace pycomp
