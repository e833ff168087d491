#pragma once

#include "component.hpp"
#include "python.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pycomp {

    inline constexpr auto single_output_name = "Output"sv;

    struct parameter_marker {
        passing_style style{passing_style::by_value};
        // Annotation with the marker unwrapped: `InputPath(float)` -> `float`.
        std::optional<py_expr> type_annotation{};
    };

    // Recognizes `InputPath(...)`, `OutputTextFile(...)`, ... (any dotted prefix).
    parameter_marker classify_annotation(const std::optional<py_expr>& annotation);

    // "my_func__name" -> "My func name"
    std::string function_name_to_component_name(std::string_view function_name);

    // `model_file_path` with a path style -> `model`; `_file` is stripped for every file style.
    std::string external_io_name(std::string_view parameter_name, passing_style style);

    /*
     * Walks the parameters and return annotation of `function` and produces the name,
     * description, inputs and outputs of its component. The implementation is left empty.
     *
     * Throws configuration_error when a file-style parameter declares a default or a default
     * is not a literal; serialization_error when a default does not fit its type.
     */
    component_spec analyze_signature(const py_function& function, std::vector<std::string>* warnings = nullptr);

}  // namespace pycomp
