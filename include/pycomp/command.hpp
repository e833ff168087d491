#pragma once

#include "component.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pycomp {

    // Shared flag receiving every return-style output path, in output order.
    inline constexpr auto output_paths_flag = "----output-paths"sv;
    inline constexpr auto output_paths_dest = "_output_paths"sv;

    struct output_partition {
        // Bound to their own flags, in declaration order.
        std::vector<const output_spec*> file_outputs{};
        // Written by the shim from the function result, in output order.
        std::vector<const output_spec*> return_outputs{};
    };

    output_partition partition_outputs(const std::vector<output_spec>& outputs);

    // "--" + name with '_' replaced by '-'
    std::string command_flag(std::string_view io_name);

    // Flag + placeholder pair of one input or file-style output; optional inputs are wrapped
    // in an `if` guarded by `isPresent`.
    command_line argument_for_input(const input_spec& input);
    command_line argument_for_output(const output_spec& output);

    /*
     * Builds the `args` template: inputs in declaration order, then file-style outputs in
     * declaration order, then the shared return-output flag followed by one outputPath per
     * return-style output.
     */
    command_line build_command_args(const std::vector<input_spec>& inputs, const std::vector<output_spec>& outputs);

}  // namespace pycomp
