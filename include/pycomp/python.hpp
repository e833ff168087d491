#pragma once

#include "format.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pycomp {

    using namespace std::string_view_literals;

    enum class expr_kind : uint8_t {
        name,
        string,
        number,
        call,
        subscript,
        tuple,
        list,
        dict,
        unary_minus,
        opaque,
    };

    template <>
    inline constexpr bool enable_enum_format<expr_kind> = true;

    inline constexpr std::string_view to_string(expr_kind kind) {
        switch (kind) {
            case expr_kind::name:
                return "name"sv;
            case expr_kind::string:
                return "string"sv;
            case expr_kind::number:
                return "number"sv;
            case expr_kind::call:
                return "call"sv;
            case expr_kind::subscript:
                return "subscript"sv;
            case expr_kind::tuple:
                return "tuple"sv;
            case expr_kind::list:
                return "list"sv;
            case expr_kind::dict:
                return "dict"sv;
            case expr_kind::unary_minus:
                return "unary_minus"sv;
            case expr_kind::opaque:
                return "opaque"sv;
        }
        return "opaque"sv;
    }

    /*
     * Expression subset found in annotations, defaults and decorators.
     *
     * - name: `value` holds the dotted identifier ("typing.NamedTuple").
     * - string: `value` holds the decoded literal.
     * - number: `value` holds the literal text.
     * - call / subscript: `value` holds the dotted callee (base); `args` the positional
     *   arguments (subscript items); keywords are kept in declaration order.
     * - tuple / list: `args` are the elements.
     * - dict: `args` holds key, value, key, value...
     * - unary_minus: `args[0]` is the operand.
     * - opaque: anything else; only `source` is meaningful.
     */
    struct py_expr {
        expr_kind kind{expr_kind::opaque};
        std::string value{};
        std::vector<py_expr> args{};
        std::vector<std::string> keyword_names{};
        std::vector<py_expr> keyword_values{};
        std::string source{};

        std::string_view last_name_component() const {
            auto dot = std::string_view{value}.rfind('.');
            return dot == std::string_view::npos ? std::string_view{value} : std::string_view{value}.substr(dot + 1U);
        }

        bool is_call_to(std::string_view callee) const {
            return kind == expr_kind::call && last_name_component() == callee;
        }

        const py_expr* keyword(std::string_view name) const {
            for (size_t i = 0U; i < keyword_names.size(); ++i) {
                if (keyword_names[i] == name) {
                    return &keyword_values[i];
                }
            }
            return nullptr;
        }
    };

    struct py_value;

    struct py_none {};

    struct py_sequence {
        std::vector<py_value> items{};
        bool is_tuple{false};
    };

    struct py_dict {
        std::vector<py_value> keys{};
        std::vector<py_value> values{};
    };

    // Result of evaluating a literal default value.
    struct py_value {
        std::variant<py_none, bool, int64_t, double, std::string, py_sequence, py_dict> data{};

        bool is_none() const { return std::holds_alternative<py_none>(data); }
        bool is_str() const { return std::holds_alternative<std::string>(data); }
        bool is_bool() const { return std::holds_alternative<bool>(data); }
        bool is_int() const { return std::holds_alternative<int64_t>(data); }
        bool is_float() const { return std::holds_alternative<double>(data); }

        // `type(value).__name__`
        std::string_view type_name() const;
    };

    struct py_parameter {
        std::string name{};
        std::optional<py_expr> annotation{};
        std::optional<py_expr> default_value{};
        bool keyword_only{false};
    };

    struct named_tuple_field {
        std::string name{};
        std::optional<py_expr> type{};
    };

    struct named_tuple_shape {
        std::string type_name{};
        std::vector<named_tuple_field> fields{};
        std::optional<std::string> declaration_source{};
    };

    // Metadata attached by a `@python_component(...)` decorator.
    struct component_attributes {
        std::optional<std::string> name{};
        std::optional<std::string> description{};
        std::optional<std::string> base_image{};
        std::optional<std::string> target_component_file{};
    };

    // Module-level `NAME = <literal>` binding a default value may refer to.
    struct module_constant {
        std::string name{};
        py_value value{};
    };

    struct py_function {
        std::string name{};
        std::string module_name{};
        std::string module_source{};
        // Decorators, header and body as they appear in the module, newline-terminated.
        std::vector<std::string> source_lines{};
        // 0-based module line of source_lines[0]
        size_t first_line{};
        size_t decorator_line_count{};
        std::vector<py_parameter> parameters{};
        std::optional<py_expr> return_annotation{};
        std::optional<named_tuple_shape> return_tuple{};
        std::optional<std::string> docstring{};
        component_attributes attributes{};
        // Literal bindings at module level, in source order.
        std::vector<module_constant> constants{};
        bool nested{false};
    };

    py_expr parse_expression(std::string_view text);

    // Names that `from typing import ...` brings in and that print as "typing.<name>".
    bool is_typing_alias(std::string_view name);

    // Text of the annotation the way `str(annotation)` prints it.
    std::string render_expr(const py_expr& expr);

    // Bare names other than None/True/False resolve through `constants`, the last binding wins.
    py_value evaluate_literal(const py_expr& expr, const std::vector<module_constant>& constants = {});

    py_function load_function(
            std::string_view module_source, std::string_view function_name, std::string_view module_name = "__main__"sv);

    // The def without decorators or annotations, dedented to column 0.
    std::string unannotated_function_source(const py_function& function);

    // `NAME = <repr>` lines for the module constants the parameter defaults name.
    std::string default_value_bindings(const py_function& function);

    /*
     * The part of the defining module the function needs at call time: `from __future__` imports
     * plus every top-level import, def, class or assignment that binds a name the function reads,
     * followed transitively. Other top-level statements are dropped. The function appears as
     * `unannotated_function_source`, in its own place or last when it is nested.
     */
    std::string function_dependency_source(const py_function& function);

    std::string format_float_repr(double value);

    std::string py_repr(std::string_view text);
    std::string py_repr(const py_value& value);
    std::string py_str(const py_value& value);

}  // namespace pycomp
