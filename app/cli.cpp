#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pycomp::cli {

    namespace detail {

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

        static void print_summary(const component_spec& spec, const startup_config& cfg, std::ostream& os) {
            os << "component: " << spec.name << '\n';
            os << "image: " << spec.implementation.image << '\n';
            os << "capture: " << to_string(cfg.capture) << '\n';
            os << "inputs:";
            for (const auto& input : spec.inputs) {
                os << ' ' << input.name << '(' << to_string(input.style) << ')';
            }
            os << '\n';
            os << "outputs:";
            for (const auto& output : spec.outputs) {
                os << ' ' << output.name << '(' << to_string(output.style) << ')';
            }
            os << '\n';
        }

    }  // namespace detail

    int run_compile(const startup_config& cfg) {
        auto function = load_function_file(cfg);
        auto options = make_compile_options(cfg);

        auto result = compile_function(function, options);
        auto text = dump_component_spec(result.spec, cfg.format);

        if (!cfg.quiet) {
            for (const auto& warning : result.warnings) {
                std::cerr << "warning: " << warning << '\n';
            }
        }
        if (cfg.verbose) {
            detail::print_summary(result.spec, cfg, std::cerr);
        }

        std::optional<std::filesystem::path> destination = cfg.output_path;
        if (!destination && function.attributes.target_component_file) {
            destination = std::filesystem::path{*function.attributes.target_component_file};
        }

        if (!destination) {
            std::cout << text;
            return 0;
        }

        write_text_file(*destination, text);
        if (!cfg.quiet) {
            std::cerr << "wrote " << destination->string() << '\n';
        }
        return 0;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"pycomp"};

        bool show_version = false;
        std::string source_arg{};
        std::string function_arg{};
        std::string module_arg{};
        std::string output_arg{};
        std::string format_arg{};
        std::string extra_code_arg{};
        std::string config_arg{};
        std::string base_image_arg{};
        std::string python_version_arg{};
        std::vector<std::string> package_args{};
        std::vector<std::string> capture_module_args{};
        bool use_code_pickling = false;

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("source", source_arg, "Python module file defining the function");
        app.add_option("-f,--function", function_arg, "Name of the function to compile");
        app.add_option("--module-name", module_arg, "Module name the source is imported under");
        app.add_option("-o,--output", output_arg, "Component file to write (stdout when unset)");
        app.add_option("--format", format_arg, "Output format: json (indented) | yaml (compact JSON)");
        app.add_option("--extra-code-file", extra_code_arg, "File whose text is placed before the function code");
        app.add_option("--config", config_arg, "JSON settings file applied before flags");
        app.add_option("--base-image", base_image_arg, "Container image");
        app.add_option("--package", package_args, "pip requirement to install (repeatable)");
        app.add_flag("--use-code-pickling", use_code_pickling, "Embed the function as a serialized closure");
        app.add_option("--capture-module", capture_module_args, "Module captured by value when pickling (repeatable)");
        app.add_option("--python-version", python_version_arg, "Interpreter version recorded by the pickle loader");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress warnings and status output");
        app.add_flag("--verbose", cfg.verbose, "Print a summary of the compiled component");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (show_version) {
            std::cout << "pycomp 0.1.0\n";
            return std::optional<int>{0};
        }

        if (auto config_path = detail::normalize_optional(config_arg)) {
            cfg.config_path = *config_path;
            try {
                apply_settings(read_settings_file(*cfg.config_path), cfg);
            } catch (const std::exception& e) {
                std::cerr << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        if (app.get_option("--format")->count() > 0U && !try_parse_output_format(format_arg, cfg.format)) {
            std::cerr << "invalid --format value: " << format_arg << " (expected json|yaml)\n";
            return std::optional<int>{2};
        }
        if (app.get_option("--python-version")->count() > 0U &&
            !try_parse_python_version(python_version_arg, cfg.pickler_python_version)) {
            std::cerr << "invalid --python-version value: " << python_version_arg << " (expected 3[.7[.0]])\n";
            return std::optional<int>{2};
        }

        if (auto base_image = detail::normalize_optional(base_image_arg)) {
            cfg.base_image = std::move(base_image);
        }
        for (const auto& package : package_args) {
            utils::append_unique(cfg.packages_to_install, package);
        }
        if (!capture_module_args.empty()) {
            auto modules = cfg.modules_to_capture.value_or(std::vector<std::string>{});
            for (const auto& name : capture_module_args) {
                utils::append_unique(modules, name);
            }
            cfg.modules_to_capture = std::move(modules);
        }
        if (use_code_pickling) {
            cfg.capture = capture_strategy::pickle;
        }

        cfg.module_name = detail::normalize_optional(module_arg);
        if (auto output = detail::normalize_optional(output_arg)) {
            cfg.output_path = *output;
        }
        if (auto extra_code = detail::normalize_optional(extra_code_arg)) {
            cfg.extra_code_path = *extra_code;
        }

        if (cfg.print_config) {
            std::cout << write_settings_json(settings_from_config(cfg)) << '\n';
            return std::optional<int>{0};
        }

        if (source_arg.empty() || function_arg.empty()) {
            std::cerr << "a source file and --function are required\n" << app.help();
            return std::optional<int>{2};
        }
        cfg.source_path = source_arg;
        cfg.function_name = function_arg;

        return std::nullopt;
    }

}  // namespace pycomp::cli
