#pragma once

#include "format.hpp"
#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pycomp {

    using namespace std::string_view_literals;

    /*
     * pycomp Compile Options
     *
     * Program text
     * - extra_code: Python code placed before the function code (opaque passthrough).
     * - capture: How the function body is embedded (source_copy or pickle).
     * - modules_to_capture: Modules captured by value by the pickle strategy; nullopt means
     *   the function's own module.
     * - module_sources: Source text for captured modules other than the function's own.
     * - pickler_python_version: Interpreter version recorded in the pickle loader guard.
     *
     * Container
     * - base_image: Call-site image; must agree with a decorator-attached image.
     * - default_base_image: Per-call replacement for the process-wide default image.
     * - packages_to_install: pip requirement strings installed before the shim runs.
     *
     * pycomp Startup Config Options (CLI)
     * - source_path / function_name: The module file and the function to compile.
     * - output_path: Component file destination; stdout when unset.
     * - format: Rendering of the component document (json or yaml).
     * - extra_code_path: File whose text becomes extra_code.
     * - config_path: JSON settings file read before command-line flags are applied.
     * - print_config / quiet / verbose: Introspection and verbosity knobs.
     */

    enum class capture_strategy : uint8_t { source_copy, pickle };
    enum class output_format : uint8_t { json, yaml };

    template <>
    inline constexpr bool enable_enum_format<capture_strategy> = true;
    template <>
    inline constexpr bool enable_enum_format<output_format> = true;

    inline constexpr std::string_view to_string(capture_strategy strategy) {
        switch (strategy) {
            case capture_strategy::source_copy:
                return "source"sv;
            case capture_strategy::pickle:
                return "pickle"sv;
        }
        return "source"sv;
    }

    inline constexpr bool try_parse_capture_strategy(std::string_view text, capture_strategy& out) {
        if (utils::str_case_eq(text, "source"sv) || utils::str_case_eq(text, "source_copy"sv)) {
            out = capture_strategy::source_copy;
            return true;
        }
        if (utils::str_case_eq(text, "pickle"sv) || utils::str_case_eq(text, "cloudpickle"sv)) {
            out = capture_strategy::pickle;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(output_format format) {
        switch (format) {
            case output_format::json:
                return "json"sv;
            case output_format::yaml:
                return "yaml"sv;
        }
        return "yaml"sv;
    }

    inline constexpr bool try_parse_output_format(std::string_view text, output_format& out) {
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_format::json;
            return true;
        }
        if (utils::str_case_eq(text, "yaml"sv) || utils::str_case_eq(text, "yml"sv)) {
            out = output_format::yaml;
            return true;
        }
        return false;
    }

    struct python_version {
        int major{3};
        int minor{7};
        int micro{0};
        std::string release_level{"final"};
        int serial{0};

        bool operator==(const python_version&) const = default;

        // Rendered the way `tuple(sys.version_info)` prints.
        std::string to_tuple_repr() const {
            return std::format("({}, {}, {}, '{}', {})", major, minor, micro, release_level, serial);
        }
    };

    // Accepts "3", "3.7" and "3.7.3".
    inline bool try_parse_python_version(std::string_view text, python_version& out) {
        text = utils::trim_view(text);
        python_version parsed{};
        parsed.minor = 0;
        int* parts[] = {&parsed.major, &parsed.minor, &parsed.micro};
        size_t index = 0U;
        while (!text.empty()) {
            if (index >= std::size(parts)) {
                return false;
            }
            auto dot = text.find('.');
            auto piece = text.substr(0U, dot);
            auto value = utils::parse_arithmetic<int>(piece);
            if (!value || *value < 0) {
                return false;
            }
            *parts[index++] = *value;
            if (dot == std::string_view::npos) {
                break;
            }
            text.remove_prefix(dot + 1U);
            if (text.empty()) {
                return false;
            }
        }
        if (index == 0U) {
            return false;
        }
        out = parsed;
        return true;
    }

    // A plain image name or a zero-argument factory evaluated lazily at assembly time.
    using image_source = std::variant<std::string, std::function<std::string()>>;

    inline constexpr auto builtin_default_base_image = "tensorflow/tensorflow:1.13.2-py3"sv;

    struct module_source {
        std::string name{};
        std::string file_name{};
        std::string text{};
    };

    struct compile_options {
        std::string extra_code{};
        std::optional<std::string> base_image{};
        std::optional<image_source> default_base_image{};
        std::vector<std::string> packages_to_install{};
        std::optional<std::vector<std::string>> modules_to_capture{};
        std::vector<module_source> module_sources{};
        capture_strategy capture{capture_strategy::source_copy};
        python_version pickler_python_version{};
    };

    struct startup_config {
        std::filesystem::path source_path{};
        std::string function_name{};
        std::optional<std::string> module_name{};
        std::optional<std::filesystem::path> output_path{};
        std::optional<std::filesystem::path> extra_code_path{};
        std::optional<std::filesystem::path> config_path{};
        output_format format{output_format::yaml};

        std::optional<std::string> base_image{};
        std::vector<std::string> packages_to_install{};
        std::optional<std::vector<std::string>> modules_to_capture{};
        capture_strategy capture{capture_strategy::source_copy};
        python_version pickler_python_version{};

        bool print_config{false};
        bool quiet{false};
        bool verbose{false};
    };

}  // namespace pycomp
