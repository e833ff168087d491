#pragma once

#include "config.hpp"
#include "format.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pycomp {

    /*
     * How an input or output crosses the container boundary. Resolved once from the
     * parameter annotation; every later stage switches on it.
     */
    enum class passing_style : uint8_t {
        by_value,
        input_path,
        input_text_stream,
        input_binary_stream,
        return_value,
        output_path,
        output_text_stream,
        output_binary_stream,
    };

    template <>
    inline constexpr bool enable_enum_format<passing_style> = true;

    inline constexpr std::string_view to_string(passing_style style) {
        switch (style) {
            case passing_style::by_value:
                return "by_value"sv;
            case passing_style::input_path:
                return "input_path"sv;
            case passing_style::input_text_stream:
                return "input_text_stream"sv;
            case passing_style::input_binary_stream:
                return "input_binary_stream"sv;
            case passing_style::return_value:
                return "return_value"sv;
            case passing_style::output_path:
                return "output_path"sv;
            case passing_style::output_text_stream:
                return "output_text_stream"sv;
            case passing_style::output_binary_stream:
                return "output_binary_stream"sv;
        }
        return "by_value"sv;
    }

    inline constexpr bool is_output_style(passing_style style) {
        return style == passing_style::return_value || style == passing_style::output_path ||
               style == passing_style::output_text_stream || style == passing_style::output_binary_stream;
    }

    // Passed as a file path or an open file rather than inline or through the return value.
    inline constexpr bool is_file_style(passing_style style) {
        return style != passing_style::by_value && style != passing_style::return_value;
    }

    inline constexpr bool is_path_style(passing_style style) {
        return style == passing_style::input_path || style == passing_style::output_path;
    }

    // Annotation marker class for a file style ("InputPath", "OutputBinaryFile", ...); empty otherwise.
    inline constexpr std::string_view marker_class_name(passing_style style) {
        switch (style) {
            case passing_style::input_path:
                return "InputPath"sv;
            case passing_style::input_text_stream:
                return "InputTextFile"sv;
            case passing_style::input_binary_stream:
                return "InputBinaryFile"sv;
            case passing_style::output_path:
                return "OutputPath"sv;
            case passing_style::output_text_stream:
                return "OutputTextFile"sv;
            case passing_style::output_binary_stream:
                return "OutputBinaryFile"sv;
            case passing_style::by_value:
            case passing_style::return_value:
                break;
        }
        return {};
    }

    inline constexpr std::optional<passing_style> try_parse_marker_class(std::string_view name) {
        for (auto style :
             {passing_style::input_path,
              passing_style::input_text_stream,
              passing_style::input_binary_stream,
              passing_style::output_path,
              passing_style::output_text_stream,
              passing_style::output_binary_stream}) {
            if (marker_class_name(style) == name) {
                return style;
            }
        }
        return std::nullopt;
    }

    struct input_spec {
        std::string name{};
        std::optional<std::string> type{};
        bool optional{false};
        std::optional<std::string> default_value{};
        passing_style style{passing_style::by_value};
        // Function parameter the shim binds the value to; may differ from `name`.
        std::string parameter_name{};

        bool operator==(const input_spec&) const = default;
    };

    struct output_spec {
        std::string name{};
        std::optional<std::string> type{};
        passing_style style{passing_style::return_value};
        // Empty for return-style outputs.
        std::string parameter_name{};
        std::optional<std::string> return_field_name{};

        bool operator==(const output_spec&) const = default;
    };

    enum class command_node_kind : uint8_t { literal, input_value, input_path, output_path, is_present, if_then };

    template <>
    inline constexpr bool enable_enum_format<command_node_kind> = true;

    inline constexpr std::string_view to_string(command_node_kind kind) {
        switch (kind) {
            case command_node_kind::literal:
                return "literal"sv;
            case command_node_kind::input_value:
                return "inputValue"sv;
            case command_node_kind::input_path:
                return "inputPath"sv;
            case command_node_kind::output_path:
                return "outputPath"sv;
            case command_node_kind::is_present:
                return "isPresent"sv;
            case command_node_kind::if_then:
                return "if"sv;
        }
        return "literal"sv;
    }

    /*
     * Element of a command template. Placeholders are resolved by the binder that
     * instantiates the component, never here.
     *
     * - literal: `text` is the token.
     * - input_value / input_path / output_path / is_present: `text` is the input/output name.
     * - if_then: `condition` holds exactly one node, `then_branch` the guarded tokens.
     */
    struct command_node {
        command_node_kind kind{command_node_kind::literal};
        std::string text{};
        std::vector<command_node> condition{};
        std::vector<command_node> then_branch{};

        static command_node literal(std::string text) { return {command_node_kind::literal, std::move(text), {}, {}}; }
        static command_node input_value(std::string name) {
            return {command_node_kind::input_value, std::move(name), {}, {}};
        }
        static command_node input_path(std::string name) {
            return {command_node_kind::input_path, std::move(name), {}, {}};
        }
        static command_node output_path(std::string name) {
            return {command_node_kind::output_path, std::move(name), {}, {}};
        }
        static command_node is_present(std::string name) {
            return {command_node_kind::is_present, std::move(name), {}, {}};
        }
        static command_node if_then(command_node condition, std::vector<command_node> then_branch) {
            return {command_node_kind::if_then, {}, {std::move(condition)}, std::move(then_branch)};
        }

        bool operator==(const command_node&) const = default;
    };

    using command_line = std::vector<command_node>;

    struct container_spec {
        std::string image{};
        command_line command{};
        command_line args{};

        bool operator==(const container_spec&) const = default;
    };

    struct component_spec {
        std::string name{};
        std::optional<std::string> description{};
        std::vector<input_spec> inputs{};
        std::vector<output_spec> outputs{};
        container_spec implementation{};

        bool operator==(const component_spec&) const = default;

        const input_spec* find_input(std::string_view input_name) const;
        const output_spec* find_output(std::string_view output_name) const;
    };

    // `name`, else `name<separator>2`, `name<separator>3`, ... whichever is first unused.
    std::string make_name_unique(
            std::string_view name, const std::vector<std::string>& used, std::string_view separator = "_"sv);

    // JSON text of a single command element as it appears in the component document.
    std::string render_command_node(const command_node& node);

    std::string dump_component_spec(const component_spec& spec, output_format format = output_format::yaml);

}  // namespace pycomp
