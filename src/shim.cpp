#include "pycomp/shim.hpp"

#include "pycomp/command.hpp"
#include "pycomp/data_passing.hpp"
#include "pycomp/errors.hpp"
#include "pycomp/python.hpp"

using namespace pycomp::literals;

namespace pycomp {
    namespace detail {

        static constexpr auto input_path_class = R"py(class InputPath:
    '''Parameter annotation: the function receives the path of the input data file.'''
    def __init__(self, type=None):
        self.type = type
)py"sv;

        static constexpr auto input_text_file_class = R"py(class InputTextFile:
    '''Parameter annotation: the function receives the input data as an open text stream.'''
    def __init__(self, type=None):
        self.type = type
)py"sv;

        static constexpr auto input_binary_file_class = R"py(class InputBinaryFile:
    '''Parameter annotation: the function receives the input data as an open binary stream.'''
    def __init__(self, type=None):
        self.type = type
)py"sv;

        static constexpr auto output_path_class = R"py(class OutputPath:
    '''Parameter annotation: the function writes the output data into the file at the given path.'''
    def __init__(self, type=None):
        self.type = type
)py"sv;

        static constexpr auto output_text_file_class = R"py(class OutputTextFile:
    '''Parameter annotation: the function writes the output data into the given open text stream.'''
    def __init__(self, type=None):
        self.type = type
)py"sv;

        static constexpr auto output_binary_file_class = R"py(class OutputBinaryFile:
    '''Parameter annotation: the function writes the output data into the given open binary stream.'''
    def __init__(self, type=None):
        self.type = type
)py"sv;

        static constexpr auto make_parent_dirs_and_return_path = R"py(def _make_parent_dirs_and_return_path(file_path: str):
    import os
    os.makedirs(os.path.dirname(file_path), exist_ok=True)
    return file_path
)py"sv;

        static constexpr auto parent_dirs_maker_that_returns_open_file = R"py(def _parent_dirs_maker_that_returns_open_file(mode: str, encoding: str = None):
    def make_parent_dirs_and_return_path(file_path: str):
        import os
        os.makedirs(os.path.dirname(file_path), exist_ok=True)
        return open(file_path, mode=mode, encoding=encoding)
    return make_parent_dirs_and_return_path
)py"sv;

        static constexpr auto result_normalization = R"py(if not hasattr(_outputs, '__getitem__') or isinstance(_outputs, str):
    _outputs = [_outputs]
)py"sv;

        static constexpr auto output_writer = R"py(import os
for idx, output_file in enumerate(_output_files):
    try:
        os.makedirs(os.path.dirname(output_file))
    except OSError:
        pass
    with open(output_file, 'w') as f:
        f.write(_output_serializers[idx](_outputs[idx]))
)py"sv;

        static std::string_view marker_class_source(passing_style style) {
            switch (style) {
                case passing_style::input_path:
                    return input_path_class;
                case passing_style::input_text_stream:
                    return input_text_file_class;
                case passing_style::input_binary_stream:
                    return input_binary_file_class;
                case passing_style::output_path:
                    return output_path_class;
                case passing_style::output_text_stream:
                    return output_text_file_class;
                case passing_style::output_binary_stream:
                    return output_binary_file_class;
                case passing_style::by_value:
                case passing_style::return_value:
                    break;
            }
            throw unsupported_passing_style_error("no marker class for passing style {}"_format(style));
        }

        static std::string add_argument_line(
                std::string_view io_name, std::string_view parameter_name, std::string_view type, bool required) {
            return "_parser.add_argument(\"{}\", dest=\"{}\", type={}, required={}, default=argparse.SUPPRESS)"_format(
                    command_flag(io_name), parameter_name, type, required ? "True" : "False");
        }

    }  // namespace detail

    std::vector<shim_block> shim_program::blocks() const {
        std::string serializers{};
        if (!output_serializers.empty()) {
            serializers = "\n    {}\n"_format(utils::join_with_separator(output_serializers, ",\n    "sv));
        }
        return {
                {"support_definitions"sv, utils::join_with_separator(support_definitions, "\n"sv)},
                {"extra_code"sv, extra_code},
                {"function_code"sv, function_code},
                {"argument_parser"sv, utils::join_with_separator(argument_parser, "\n"sv)},
                {"invocation"sv, invocation},
                {"output_serializers"sv, "_output_serializers = [{}]"_format(serializers)},
                {"epilogue"sv, epilogue},
        };
    }

    std::string shim_program::render() const {
        std::vector<std::string> texts{};
        for (auto& block : blocks()) {
            texts.push_back(std::move(block.text));
        }
        auto joined = utils::join_with_separator(texts, "\n\n"sv);
        return collapse_blank_lines(joined);
    }

    std::string collapse_blank_lines(std::string_view text) {
        std::string collapsed{};
        collapsed.reserve(text.size());
        size_t newline_run = 0U;
        for (char c : text) {
            if (c == '\n') {
                if (++newline_run > 2U) {
                    continue;
                }
            }
            else {
                newline_run = 0U;
            }
            collapsed.push_back(c);
        }
        auto trimmed = utils::trim_chars(collapsed, '\n');
        return "{}\n"_format(trimmed);
    }

    std::string argparse_type_for_style(passing_style style, std::vector<std::string>& support_definitions) {
        if (!is_file_style(style)) {
            throw unsupported_passing_style_error("passing style {} is not file based"_format(style));
        }
        utils::append_unique(support_definitions, std::string{detail::marker_class_source(style)});

        switch (style) {
            case passing_style::input_path:
                return "str";
            case passing_style::input_text_stream:
                return "argparse.FileType('rt')";
            case passing_style::input_binary_stream:
                return "argparse.FileType('rb')";
            // argparse.FileType does not create parent directories
            case passing_style::output_path:
                utils::append_unique(support_definitions, std::string{detail::make_parent_dirs_and_return_path});
                return "_make_parent_dirs_and_return_path";
            case passing_style::output_text_stream:
                utils::append_unique(
                        support_definitions, std::string{detail::parent_dirs_maker_that_returns_open_file});
                return "_parent_dirs_maker_that_returns_open_file('wt')";
            case passing_style::output_binary_stream:
                utils::append_unique(
                        support_definitions, std::string{detail::parent_dirs_maker_that_returns_open_file});
                return "_parent_dirs_maker_that_returns_open_file('wb')";
            case passing_style::by_value:
            case passing_style::return_value:
                break;
        }
        throw unsupported_passing_style_error("unexpected data passing style: {}"_format(style));
    }

    std::string argparse_type_for_value(
            const std::optional<std::string>& type_name, std::vector<std::string>& support_definitions) {
        if (!type_name) {
            return "str";
        }
        const auto* converter = find_converter(*type_name);
        if (converter == nullptr) {
            return "str";
        }
        utils::append_unique(support_definitions, std::string{converter->deserializer_definition});
        return std::string{converter->deserializer_code};
    }

    std::string serializer_for_output(
            const std::optional<std::string>& type_name, std::vector<std::string>& support_definitions) {
        if (!type_name) {
            return "str";
        }
        const auto* converter = find_converter(*type_name);
        if (converter == nullptr) {
            return "str";
        }
        utils::append_unique(support_definitions, std::string{converter->serializer_source});
        return std::string{converter->serializer_name};
    }

    shim_program build_shim(
            const component_spec& spec, std::string_view function_name, std::string function_code, std::string extra_code) {
        shim_program program{};
        program.extra_code = std::move(extra_code);
        program.function_code = std::move(function_code);

        program.argument_parser.push_back("import argparse");
        program.argument_parser.push_back(
                "_parser = argparse.ArgumentParser(prog={}, description={})"_format(
                        py_repr(spec.name), py_repr(spec.description.value_or(std::string{}))));

        for (const auto& input : spec.inputs) {
            std::string type{};
            switch (input.style) {
                case passing_style::by_value:
                    type = argparse_type_for_value(input.type, program.support_definitions);
                    break;
                case passing_style::input_path:
                case passing_style::input_text_stream:
                case passing_style::input_binary_stream:
                    type = argparse_type_for_style(input.style, program.support_definitions);
                    break;
                case passing_style::return_value:
                case passing_style::output_path:
                case passing_style::output_text_stream:
                case passing_style::output_binary_stream:
                    throw unsupported_passing_style_error(
                            "input '{}' carries output passing style {}"_format(input.name, input.style));
            }
            program.argument_parser.push_back(
                    detail::add_argument_line(input.name, input.parameter_name, type, !input.optional));
        }

        auto partition = partition_outputs(spec.outputs);
        for (const auto* output : partition.file_outputs) {
            auto type = argparse_type_for_style(output->style, program.support_definitions);
            program.argument_parser.push_back(
                    detail::add_argument_line(output->name, output->parameter_name, type, true));
        }

        if (!partition.return_outputs.empty()) {
            program.argument_parser.push_back(
                    "_parser.add_argument(\"{}\", dest=\"{}\", type=str, nargs={})"_format(
                            output_paths_flag, output_paths_dest, partition.return_outputs.size()));
        }
        program.argument_parser.push_back("_parsed_args = vars(_parser.parse_args())");
        program.argument_parser.push_back("_output_files = _parsed_args.pop(\"{}\", [])"_format(output_paths_dest));

        program.invocation = "_outputs = {}(**_parsed_args)\n\n"_format(function_name);
        if (partition.return_outputs.size() == 1U && !partition.return_outputs.front()->return_field_name) {
            program.invocation += "_outputs = [_outputs]\n";
        }
        else {
            program.invocation += detail::result_normalization;
        }

        for (const auto* output : partition.return_outputs) {
            program.output_serializers.push_back(serializer_for_output(output->type, program.support_definitions));
        }
        program.epilogue = std::string{detail::output_writer};

        debug_log("built shim for ", function_name, " with ", program.support_definitions.size(), " support definitions");
        return program;
    }

}  // namespace pycomp
