#include "pycomp/signature.hpp"

#include "pycomp/data_passing.hpp"
#include "pycomp/errors.hpp"

using namespace pycomp::literals;

namespace pycomp {
    namespace detail {

        static std::optional<std::string> component_description(const py_function& function) {
            std::optional<std::string> description{};
            if (function.attributes.description && !function.attributes.description->empty()) {
                description = function.attributes.description;
            }
            else {
                description = function.docstring;
            }
            if (description && !description->empty()) {
                description = "{}\n"_format(utils::trim_view(*description));
            }
            return description;
        }

        static void analyze_return_annotation(
                const py_function& function, component_spec& spec, std::vector<std::string>& output_names) {
            if (function.return_tuple) {
                for (const auto& field : function.return_tuple->fields) {
                    output_spec output{};
                    output.name = make_name_unique(field.name, output_names);
                    output.type = resolve_type_name(field.type);
                    output.style = passing_style::return_value;
                    output.return_field_name = field.name;
                    output_names.push_back(output.name);
                    spec.outputs.push_back(std::move(output));
                }
                return;
            }

            const auto& annotation = function.return_annotation;
            if (!annotation || (annotation->kind == expr_kind::name && annotation->value == "None"sv)) {
                return;
            }

            output_spec output{};
            output.name = make_name_unique(single_output_name, output_names);
            output.type = resolve_type_name(annotation);
            output.style = passing_style::return_value;
            output_names.push_back(output.name);
            spec.outputs.push_back(std::move(output));
        }

    }  // namespace detail

    parameter_marker classify_annotation(const std::optional<py_expr>& annotation) {
        parameter_marker marker{};
        marker.type_annotation = annotation;
        if (!annotation || annotation->kind != expr_kind::call) {
            return marker;
        }

        auto style = try_parse_marker_class(annotation->last_name_component());
        if (!style) {
            return marker;
        }

        marker.style = *style;
        marker.type_annotation.reset();
        const py_expr* type = nullptr;
        if (!annotation->args.empty()) {
            type = &annotation->args.front();
        }
        else {
            type = annotation->keyword("type"sv);
        }
        if (type != nullptr && !(type->kind == expr_kind::name && type->value == "None"sv)) {
            marker.type_annotation = *type;
        }
        return marker;
    }

    std::string function_name_to_component_name(std::string_view function_name) {
        auto spaced = utils::replace_all(function_name, "_"sv, " "sv);

        std::string collapsed{};
        collapsed.reserve(spaced.size());
        for (char c : spaced) {
            if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ') {
                continue;
            }
            collapsed.push_back(c);
        }

        std::string name{utils::trim_chars(collapsed, ' ')};
        for (size_t i = 0U; i < name.size(); ++i) {
            if (i == 0U) {
                if (name[i] >= 'a' && name[i] <= 'z') {
                    name[i] = static_cast<char>(name[i] - ('a' - 'A'));
                }
            }
            else {
                name[i] = utils::char_tolower(name[i]);
            }
        }
        return name;
    }

    std::string external_io_name(std::string_view parameter_name, passing_style style) {
        if (!is_file_style(style)) {
            return std::string{parameter_name};
        }
        if (is_path_style(style) && parameter_name.ends_with("_path"sv)) {
            parameter_name.remove_suffix(5U);
        }
        if (parameter_name.ends_with("_file"sv)) {
            parameter_name.remove_suffix(5U);
        }
        return std::string{parameter_name};
    }

    component_spec analyze_signature(const py_function& function, std::vector<std::string>* warnings) {
        component_spec spec{};
        std::vector<std::string> input_names{};
        std::vector<std::string> output_names{};

        for (const auto& parameter : function.parameters) {
            auto marker = classify_annotation(parameter.annotation);
            if (is_file_style(marker.style) && parameter.default_value) {
                throw configuration_error(
                        "Default values for file inputs/outputs are not supported (parameter '{}' of {})"_format(
                                parameter.name, function.name));
            }

            auto io_name = external_io_name(parameter.name, marker.style);
            auto type = resolve_type_name(marker.type_annotation);

            if (is_output_style(marker.style)) {
                output_spec output{};
                output.name = make_name_unique(io_name, output_names);
                output.type = std::move(type);
                output.style = marker.style;
                output.parameter_name = parameter.name;
                output_names.push_back(output.name);
                spec.outputs.push_back(std::move(output));
                continue;
            }

            input_spec input{};
            input.name = make_name_unique(io_name, input_names);
            input.type = std::move(type);
            input.style = marker.style;
            input.parameter_name = parameter.name;
            if (parameter.default_value) {
                input.optional = true;
                auto value = evaluate_literal(*parameter.default_value, function.constants);
                if (!value.is_none()) {
                    input.default_value = serialize_value(value, input.type, warnings);
                }
            }
            input_names.push_back(input.name);
            spec.inputs.push_back(std::move(input));
        }

        detail::analyze_return_annotation(function, spec, output_names);

        if (function.attributes.name && !function.attributes.name->empty()) {
            spec.name = *function.attributes.name;
        }
        else {
            spec.name = function_name_to_component_name(function.name);
        }
        spec.description = detail::component_description(function);

        debug_log("analyzed ", function.name, ": ", spec.inputs.size(), " inputs, ", spec.outputs.size(), " outputs");
        return spec;
    }

}  // namespace pycomp
