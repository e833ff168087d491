#pragma once

#include "python.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pycomp {

    enum class value_codec : uint8_t { string, integer, floating, boolean, json, base64_pickle };

    template <>
    inline constexpr bool enable_enum_format<value_codec> = true;

    inline constexpr std::string_view to_string(value_codec codec) {
        switch (codec) {
            case value_codec::string:
                return "string"sv;
            case value_codec::integer:
                return "integer"sv;
            case value_codec::floating:
                return "floating"sv;
            case value_codec::boolean:
                return "boolean"sv;
            case value_codec::json:
                return "json"sv;
            case value_codec::base64_pickle:
                return "base64_pickle"sv;
        }
        return "string"sv;
    }

    /*
     * One registry entry: the type names it answers to (first is canonical), the Python
     * builtin it is registered for (if any), and the shim-side encode/decode code.
     *
     * - serializer_name / serializer_source: function applied to a return value before it is
     *   written; the source is emitted into the shim.
     * - deserializer_code: expression used as the argparse `type=` of a by-value input.
     * - deserializer_definition: text the deserializer needs at module level (may be empty).
     */
    struct type_converter {
        std::vector<std::string_view> type_names{};
        std::string_view builtin_type{};
        value_codec codec{value_codec::string};
        std::string_view serializer_name{};
        std::string_view serializer_source{};
        std::string_view deserializer_code{};
        std::string_view deserializer_definition{};

        std::string_view canonical_name() const { return type_names.front(); }
    };

    const std::vector<type_converter>& type_converters();

    // Converter registered under `type_name`, or nullptr.
    const type_converter* find_converter(std::string_view type_name);

    // Canonical name for a Python builtin type ("int" -> "Integer"), or nullopt.
    std::optional<std::string_view> builtin_type_name(std::string_view builtin);

    // Type Mapper: annotation -> canonical type name; nullopt when untyped.
    std::optional<std::string> resolve_type_name(const std::optional<py_expr>& annotation);

    // `json.dumps(value, sort_keys=True)`
    std::string json_dumps(const py_value& value);

    // `base64.b64encode(pickle.dumps(value)).decode('ascii')`
    std::string base64_pickle(const py_value& value);

    /*
     * Serializes a compile-time value to the text form the registered codec of `type_name`
     * expects. Strings are assumed to be already serialized and pass through unchanged.
     * Inferred type names and unregistered types are reported through `warnings`.
     * Throws serialization_error when the value does not fit the type.
     */
    std::string serialize_value(
            const py_value& value,
            const std::optional<std::string>& type_name,
            std::vector<std::string>* warnings = nullptr);

}  // namespace pycomp
