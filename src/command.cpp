#include "pycomp/command.hpp"

#include "pycomp/errors.hpp"

using namespace pycomp::literals;

namespace pycomp {

    output_partition partition_outputs(const std::vector<output_spec>& outputs) {
        output_partition partition{};
        for (const auto& output : outputs) {
            if (output.style == passing_style::return_value) {
                partition.return_outputs.push_back(&output);
            }
            else {
                partition.file_outputs.push_back(&output);
            }
        }
        return partition;
    }

    std::string command_flag(std::string_view io_name) {
        return "--" + utils::replace_all(io_name, "_"sv, "-"sv);
    }

    command_line argument_for_input(const input_spec& input) {
        auto flag = command_flag(input.name);
        command_line pair{command_node::literal(flag)};

        switch (input.style) {
            case passing_style::by_value:
                pair.push_back(command_node::input_value(input.name));
                break;
            case passing_style::input_path:
            case passing_style::input_text_stream:
            case passing_style::input_binary_stream:
                pair.push_back(command_node::input_path(input.name));
                break;
            case passing_style::return_value:
            case passing_style::output_path:
            case passing_style::output_text_stream:
            case passing_style::output_binary_stream:
                throw unsupported_passing_style_error(
                        "input '{}' carries output passing style {}"_format(input.name, input.style));
        }

        if (!input.optional) {
            return pair;
        }
        return {command_node::if_then(command_node::is_present(input.name), std::move(pair))};
    }

    command_line argument_for_output(const output_spec& output) {
        switch (output.style) {
            case passing_style::output_path:
            case passing_style::output_text_stream:
            case passing_style::output_binary_stream:
                return {command_node::literal(command_flag(output.name)), command_node::output_path(output.name)};
            case passing_style::by_value:
            case passing_style::input_path:
            case passing_style::input_text_stream:
            case passing_style::input_binary_stream:
            case passing_style::return_value:
                break;
        }
        throw unsupported_passing_style_error(
                "output '{}' with passing style {} is not bound to its own flag"_format(output.name, output.style));
    }

    command_line build_command_args(const std::vector<input_spec>& inputs, const std::vector<output_spec>& outputs) {
        command_line args{};
        for (const auto& input : inputs) {
            auto argument = argument_for_input(input);
            args.insert(args.end(), argument.begin(), argument.end());
        }

        auto partition = partition_outputs(outputs);
        for (const auto* output : partition.file_outputs) {
            auto argument = argument_for_output(*output);
            args.insert(args.end(), argument.begin(), argument.end());
        }

        if (!partition.return_outputs.empty()) {
            args.push_back(command_node::literal(std::string{output_paths_flag}));
            for (const auto* output : partition.return_outputs) {
                args.push_back(command_node::output_path(output->name));
            }
        }
        return args;
    }

}  // namespace pycomp
