#include "pycomp/data_passing.hpp"

#include "internal/base64.hpp"
#include "internal/pickle.hpp"

#include "pycomp/errors.hpp"
#include "pycomp/format.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

using namespace pycomp::literals;

namespace pycomp {
    namespace detail {

        static constexpr auto serialize_str_source = R"py(def _serialize_str(str_value: str) -> str:
    if not isinstance(str_value, str):
        raise TypeError('Value "{}" has type "{}" instead of str.'.format(str(str_value), str(type(str_value))))
    return str_value
)py"sv;

        static constexpr auto serialize_int_source = R"py(def _serialize_int(int_value: int) -> str:
    if isinstance(int_value, str):
        return int_value
    if not isinstance(int_value, int):
        raise TypeError('Value "{}" has type "{}" instead of int.'.format(str(int_value), str(type(int_value))))
    return str(int_value)
)py"sv;

        static constexpr auto serialize_float_source = R"py(def _serialize_float(float_value: float) -> str:
    if isinstance(float_value, str):
        return float_value
    if not isinstance(float_value, (float, int)):
        raise TypeError('Value "{}" has type "{}" instead of float.'.format(str(float_value), str(type(float_value))))
    return str(float_value)
)py"sv;

        static constexpr auto serialize_bool_source = R"py(def _serialize_bool(bool_value: bool) -> str:
    if isinstance(bool_value, str):
        return bool_value
    if not isinstance(bool_value, bool):
        raise TypeError('Value "{}" has type "{}" instead of bool.'.format(str(bool_value), str(type(bool_value))))
    return str(bool_value)
)py"sv;

        static constexpr auto deserialize_bool_source = R"py(def _deserialize_bool(s) -> bool:
    from distutils.util import strtobool
    return strtobool(s) == 1
)py"sv;

        static constexpr auto serialize_json_source = R"py(def _serialize_json(obj) -> str:
    if isinstance(obj, str):
        return obj
    import json
    def default_serializer(obj):
        if hasattr(obj, 'to_struct'):
            return obj.to_struct()
        else:
            raise TypeError("Object of type '%s' is not JSON serializable and does not have .to_struct() method." % obj.__class__.__name__)
    return json.dumps(obj, default=default_serializer, sort_keys=True)
)py"sv;

        static constexpr auto serialize_base64_pickle_source = R"py(def _serialize_base64_pickle(obj) -> str:
    if isinstance(obj, str):
        return obj
    import base64
    import pickle
    return base64.b64encode(pickle.dumps(obj)).decode('ascii')
)py"sv;

        static constexpr auto deserialize_base64_pickle_source = R"py(def _deserialize_base64_pickle(s):
    import base64
    import pickle
    return pickle.loads(base64.b64decode(s))
)py"sv;

        // String-keyed aliases resolved after the annotation has been rendered.
        static constexpr std::pair<std::string_view, std::string_view> type_name_overrides[]{
                {"str"sv, "String"sv},
                {"int"sv, "Integer"sv},
                {"float"sv, "Float"sv},
                {"bool"sv, "Boolean"sv},
                {"list"sv, "JsonArray"sv},
                {"dict"sv, "JsonObject"sv},
                {"typing.List"sv, "JsonArray"sv},
                {"typing.Dict"sv, "JsonObject"sv},
        };

        static std::vector<type_converter> make_converters() {
            std::vector<type_converter> converters{};
            converters.push_back(type_converter{
                    {"String"sv, "str"sv},
                    "str"sv,
                    value_codec::string,
                    "_serialize_str"sv,
                    serialize_str_source,
                    "str"sv,
                    {}});
            converters.push_back(type_converter{
                    {"Integer"sv, "int"sv},
                    "int"sv,
                    value_codec::integer,
                    "_serialize_int"sv,
                    serialize_int_source,
                    "int"sv,
                    {}});
            converters.push_back(type_converter{
                    {"Float"sv, "float"sv},
                    "float"sv,
                    value_codec::floating,
                    "_serialize_float"sv,
                    serialize_float_source,
                    "float"sv,
                    {}});
            converters.push_back(type_converter{
                    {"Boolean"sv, "bool"sv},
                    "bool"sv,
                    value_codec::boolean,
                    "_serialize_bool"sv,
                    serialize_bool_source,
                    "_deserialize_bool"sv,
                    deserialize_bool_source});
            converters.push_back(type_converter{
                    {"JsonArray"sv, "List"sv, "list"sv},
                    "list"sv,
                    value_codec::json,
                    "_serialize_json"sv,
                    serialize_json_source,
                    "json.loads"sv,
                    "import json"sv});
            converters.push_back(type_converter{
                    {"JsonObject"sv, "Dict"sv, "dict"sv},
                    "dict"sv,
                    value_codec::json,
                    "_serialize_json"sv,
                    serialize_json_source,
                    "json.loads"sv,
                    "import json"sv});
            converters.push_back(type_converter{
                    {"Base64Pickle"sv},
                    {},
                    value_codec::base64_pickle,
                    "_serialize_base64_pickle"sv,
                    serialize_base64_pickle_source,
                    "_deserialize_base64_pickle"sv,
                    deserialize_base64_pickle_source});
            return converters;
        }

        // Decodes one UTF-8 sequence starting at `i`; invalid bytes decode as themselves.
        static uint32_t next_code_point(std::string_view text, size_t& i) {
            auto lead = static_cast<uint8_t>(text[i]);
            size_t extra = 0U;
            uint32_t cp = lead;
            if (lead >= 0xF0U) {
                extra = 3U;
                cp = lead & 0x07U;
            }
            else if (lead >= 0xE0U) {
                extra = 2U;
                cp = lead & 0x0FU;
            }
            else if (lead >= 0xC0U) {
                extra = 1U;
                cp = lead & 0x1FU;
            }
            if (i + extra >= text.size()) {
                ++i;
                return lead;
            }
            for (size_t k = 1U; k <= extra; ++k) {
                auto cont = static_cast<uint8_t>(text[i + k]);
                if ((cont & 0xC0U) != 0x80U) {
                    ++i;
                    return lead;
                }
                cp = (cp << 6U) | (cont & 0x3FU);
            }
            i += extra + 1U;
            return cp;
        }

        static void append_json_string(std::string& out, std::string_view text) {
            out.push_back('"');
            size_t i = 0U;
            while (i < text.size()) {
                auto cp = next_code_point(text, i);
                switch (cp) {
                    case '"':
                        out += "\\\"";
                        break;
                    case '\\':
                        out += "\\\\";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    case '\b':
                        out += "\\b";
                        break;
                    case '\f':
                        out += "\\f";
                        break;
                    default:
                        if (cp < 0x20U || cp >= 0x80U) {
                            if (cp >= 0x10000U) {
                                auto v = cp - 0x10000U;
                                out += "\\u{:04x}\\u{:04x}"_format(0xD800U + (v >> 10U), 0xDC00U + (v & 0x3FFU));
                            }
                            else {
                                out += "\\u{:04x}"_format(cp);
                            }
                        }
                        else {
                            out.push_back(static_cast<char>(cp));
                        }
                }
            }
            out.push_back('"');
        }

        static std::string json_float(double d) {
            if (std::isnan(d)) {
                return "NaN";
            }
            if (std::isinf(d)) {
                return d < 0 ? "-Infinity" : "Infinity";
            }
            return format_float_repr(d);
        }

        static std::string json_key(const py_value& key) {
            if (key.is_str()) {
                return std::get<std::string>(key.data);
            }
            if (key.is_bool()) {
                return std::get<bool>(key.data) ? "true" : "false";
            }
            if (key.is_int()) {
                return std::to_string(std::get<int64_t>(key.data));
            }
            if (key.is_float()) {
                return json_float(std::get<double>(key.data));
            }
            if (key.is_none()) {
                return "null";
            }
            throw serialization_error("keys must be str, int, float, bool or None, not {}"_format(key.type_name()));
        }

        static double numeric_key(const py_value& key) {
            if (key.is_bool()) {
                return std::get<bool>(key.data) ? 1.0 : 0.0;
            }
            if (key.is_int()) {
                return static_cast<double>(std::get<int64_t>(key.data));
            }
            return std::get<double>(key.data);
        }

        static void append_json(std::string& out, const py_value& value);

        static void append_json_dict(std::string& out, const py_dict& dict) {
            std::vector<size_t> order(dict.keys.size());
            std::iota(order.begin(), order.end(), 0U);

            bool all_strings = std::ranges::all_of(dict.keys, [](const py_value& k) { return k.is_str(); });
            bool all_numbers = std::ranges::all_of(
                    dict.keys, [](const py_value& k) { return k.is_int() || k.is_float() || k.is_bool(); });
            if (all_strings) {
                std::ranges::stable_sort(order, [&dict](size_t a, size_t b) {
                    return std::get<std::string>(dict.keys[a].data) < std::get<std::string>(dict.keys[b].data);
                });
            }
            else if (all_numbers) {
                std::ranges::stable_sort(order, [&dict](size_t a, size_t b) {
                    return numeric_key(dict.keys[a]) < numeric_key(dict.keys[b]);
                });
            }
            else if (dict.keys.size() > 1U) {
                throw serialization_error("dict keys of mixed types cannot be sorted");
            }

            out.push_back('{');
            bool first = true;
            for (auto index : order) {
                if (!first) {
                    out += ", ";
                }
                first = false;
                append_json_string(out, json_key(dict.keys[index]));
                out += ": ";
                append_json(out, dict.values[index]);
            }
            out.push_back('}');
        }

        static void append_json(std::string& out, const py_value& value) {
            std::visit(
                    [&out](const auto& alternative) {
                        using T = std::decay_t<decltype(alternative)>;
                        if constexpr (std::is_same_v<T, py_none>) {
                            out += "null";
                        }
                        else if constexpr (std::is_same_v<T, bool>) {
                            out += alternative ? "true" : "false";
                        }
                        else if constexpr (std::is_same_v<T, int64_t>) {
                            out += std::to_string(alternative);
                        }
                        else if constexpr (std::is_same_v<T, double>) {
                            out += json_float(alternative);
                        }
                        else if constexpr (std::is_same_v<T, std::string>) {
                            append_json_string(out, alternative);
                        }
                        else if constexpr (std::is_same_v<T, py_sequence>) {
                            out.push_back('[');
                            for (size_t i = 0U; i < alternative.items.size(); ++i) {
                                if (i > 0U) {
                                    out += ", ";
                                }
                                append_json(out, alternative.items[i]);
                            }
                            out.push_back(']');
                        }
                        else {
                            append_json_dict(out, alternative);
                        }
                    },
                    value.data);
        }

        static std::string inferred_type_name(const py_value& value) {
            if (value.is_bool()) {
                return "Boolean";
            }
            if (value.is_int()) {
                return "Integer";
            }
            if (value.is_float()) {
                return "Float";
            }
            if (std::holds_alternative<py_dict>(value.data)) {
                return "JsonObject";
            }
            if (auto* seq = std::get_if<py_sequence>(&value.data); seq != nullptr && !seq->is_tuple) {
                return "JsonArray";
            }
            return std::string{value.type_name()};
        }

        [[noreturn]] static void throw_type_mismatch(
                const py_value& value, std::string_view type_name, std::string_view expected) {
            throw serialization_error(
                    "Failed to serialize the value \"{0}\" of type \"{1}\" to type \"{2}\". Exception: Value \"{0}\" has type \"<class '{1}'>\" instead of {3}."_format(
                            py_str(value), value.type_name(), type_name, expected));
        }

    }  // namespace detail

    const std::vector<type_converter>& type_converters() {
        static const std::vector<type_converter> converters = detail::make_converters();
        return converters;
    }

    const type_converter* find_converter(std::string_view type_name) {
        for (const auto& converter : type_converters()) {
            if (std::ranges::find(converter.type_names, type_name) != converter.type_names.end()) {
                return &converter;
            }
        }
        return nullptr;
    }

    std::optional<std::string_view> builtin_type_name(std::string_view builtin) {
        for (const auto& converter : type_converters()) {
            if (!converter.builtin_type.empty() && converter.builtin_type == builtin) {
                return converter.canonical_name();
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> resolve_type_name(const std::optional<py_expr>& annotation) {
        if (!annotation) {
            return std::nullopt;
        }

        std::string type_name{};
        switch (annotation->kind) {
            case expr_kind::name: {
                const auto& name = annotation->value;
                if (name == "None"sv || name.empty()) {
                    return std::nullopt;
                }
                if (auto builtin = builtin_type_name(name)) {
                    return std::string{*builtin};
                }
                auto last = annotation->last_name_component();
                bool typing_qualified = name.find('.') == std::string::npos || name == "typing.{}"_format(last);
                if (typing_qualified && is_typing_alias(last)) {
                    type_name = "typing.{}"_format(last);
                }
                else {
                    // classes print through `__name__`
                    type_name = std::string{last};
                }
                break;
            }
            case expr_kind::string:
                // forward reference
                if (annotation->value.empty()) {
                    return std::nullopt;
                }
                type_name = annotation->value;
                break;
            case expr_kind::call:
                if (annotation->is_call_to("ForwardRef"sv) || annotation->is_call_to("_ForwardRef"sv)) {
                    if (!annotation->args.empty() && annotation->args[0].kind == expr_kind::string) {
                        type_name = annotation->args[0].value;
                        break;
                    }
                }
                type_name = render_expr(*annotation);
                break;
            default:
                type_name = render_expr(*annotation);
                break;
        }

        for (const auto& [alias, canonical] : detail::type_name_overrides) {
            if (type_name == alias) {
                return std::string{canonical};
            }
        }
        return type_name;
    }

    std::string json_dumps(const py_value& value) {
        std::string out{};
        detail::append_json(out, value);
        return out;
    }

    std::string base64_pickle(const py_value& value) {
        auto bytes = internal::pickle_writer{}.value(value).finish();
        return internal::base64_encode(bytes);
    }

    std::string serialize_value(
            const py_value& value, const std::optional<std::string>& type_name, std::vector<std::string>* warnings) {
        if (value.is_str()) {
            return std::get<std::string>(value.data);
        }

        std::string resolved{};
        if (type_name) {
            resolved = *type_name;
        }
        else {
            resolved = detail::inferred_type_name(value);
            if (warnings != nullptr) {
                warnings->push_back(
                        "Missing type name was inferred as \"{}\" based on the value \"{}\"."_format(
                                resolved, py_str(value)));
            }
        }

        if (const auto* converter = find_converter(resolved)) {
            switch (converter->codec) {
                case value_codec::string:
                    detail::throw_type_mismatch(value, resolved, "str");
                case value_codec::integer:
                    if (!value.is_int() && !value.is_bool()) {
                        detail::throw_type_mismatch(value, resolved, "int");
                    }
                    return py_str(value);
                case value_codec::floating:
                    if (!value.is_float() && !value.is_int() && !value.is_bool()) {
                        detail::throw_type_mismatch(value, resolved, "float");
                    }
                    return py_str(value);
                case value_codec::boolean:
                    if (!value.is_bool()) {
                        detail::throw_type_mismatch(value, resolved, "bool");
                    }
                    return py_str(value);
                case value_codec::json:
                    return json_dumps(value);
                case value_codec::base64_pickle:
                    return base64_pickle(value);
            }
        }

        auto serialized = py_str(value);
        if (warnings != nullptr) {
            warnings->push_back(
                    "There are no registered serializers from type \"{}\" to type \"{}\", so the value will be serialized as string \"{}\"."_format(
                            value.type_name(), resolved, serialized));
        }
        return serialized;
    }

}  // namespace pycomp
