#pragma once

#include "component.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pycomp {

    struct shim_block {
        std::string_view name{};
        std::string text{};
    };

    /*
     * In-container program, kept as named blocks until rendered.
     *
     * - support_definitions: marker classes, parent-directory factories, serializer and
     *   deserializer helpers; each distinct text once, in first-request order.
     * - extra_code: caller preamble, passed through unchanged.
     * - function_code: capture fragment binding the function under its own name.
     * - argument_parser: argparse scaffold ending with `_parsed_args` / `_output_files`.
     * - invocation: call plus result normalization.
     * - output_serializers: one encoder expression per return-style output.
     * - epilogue: writes every serialized output to its destination path.
     */
    struct shim_program {
        std::vector<std::string> support_definitions{};
        std::string extra_code{};
        std::string function_code{};
        std::vector<std::string> argument_parser{};
        std::string invocation{};
        std::vector<std::string> output_serializers{};
        std::string epilogue{};

        std::vector<shim_block> blocks() const;

        // Blocks joined by blank lines, runs of blank lines collapsed, single trailing newline.
        std::string render() const;
    };

    // argparse `type=` expression for a file-style input or output, registering the support
    // definitions it relies on.
    std::string argparse_type_for_style(passing_style style, std::vector<std::string>& support_definitions);

    // argparse `type=` expression decoding a by-value input of `type_name`; "str" when unregistered.
    std::string argparse_type_for_value(
            const std::optional<std::string>& type_name, std::vector<std::string>& support_definitions);

    // Encoder applied to a return-style output of `type_name`; "str" when unregistered.
    std::string serializer_for_output(
            const std::optional<std::string>& type_name, std::vector<std::string>& support_definitions);

    std::string collapse_blank_lines(std::string_view text);

    /*
     * Builds the shim for the analyzed `spec` (name, description, inputs, outputs) of the
     * function `function_name`, whose definition is provided by `function_code`.
     */
    shim_program build_shim(
            const component_spec& spec,
            std::string_view function_name,
            std::string function_code,
            std::string extra_code = {});

}  // namespace pycomp
