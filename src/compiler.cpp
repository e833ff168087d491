#include "pycomp/compiler.hpp"

#include "pycomp/capture.hpp"
#include "pycomp/command.hpp"
#include "pycomp/errors.hpp"
#include "pycomp/settings.hpp"
#include "pycomp/signature.hpp"

using namespace pycomp::literals;

namespace pycomp {
    namespace detail {

        static image_source& default_base_image_slot() {
            static image_source image{std::string{builtin_default_base_image}};
            return image;
        }

        static std::string evaluate_image_source(const image_source& source) {
            if (const auto* image = std::get_if<std::string>(&source)) {
                return *image;
            }
            const auto& factory = std::get<std::function<std::string()>>(source);
            if (!factory) {
                throw configuration_error("default base image factory is empty");
            }
            return factory();
        }

    }  // namespace detail

    image_source get_default_base_image() {
        return detail::default_base_image_slot();
    }

    void set_default_base_image(image_source image) {
        detail::default_base_image_slot() = std::move(image);
    }

    std::string resolve_base_image(const py_function& function, const compile_options& options) {
        if (const auto& attached = function.attributes.base_image) {
            if (options.base_image && *options.base_image != *attached) {
                throw configuration_error(
                        "base_image ({}) conflicts with the decorator-specified base image metadata ({})"_format(
                                *options.base_image, *attached));
            }
            return *attached;
        }
        if (options.base_image) {
            return *options.base_image;
        }
        if (options.default_base_image) {
            return detail::evaluate_image_source(*options.default_base_image);
        }
        return detail::evaluate_image_source(detail::default_base_image_slot());
    }

    command_line package_install_command(const std::vector<std::string>& packages) {
        if (packages.empty()) {
            return {};
        }
        std::vector<std::string> quoted{};
        quoted.reserve(packages.size());
        for (const auto& package : packages) {
            quoted.push_back(py_repr(package));
        }
        auto pip_install =
                "PIP_DISABLE_PIP_VERSION_CHECK=1 python3 -m pip install --quiet --no-warn-script-location {}"_format(
                        utils::join_with_separator(quoted, " "sv));
        return {command_node::literal("sh"),
                command_node::literal("-c"),
                command_node::literal("({0} || {0} --user) && \"$0\" \"$@\""_format(pip_install))};
    }

    compilation compile_function(const py_function& function, const compile_options& options) {
        compilation result{};
        auto image = resolve_base_image(function, options);

        result.spec = analyze_signature(function, &result.warnings);

        auto capture = make_code_capture(options);
        auto function_code = capture->capture(function);
        result.shim = build_shim(result.spec, function.name, std::move(function_code), options.extra_code);

        auto& container = result.spec.implementation;
        container.image = std::move(image);
        container.command = package_install_command(options.packages_to_install);
        container.command.push_back(command_node::literal("python3"));
        container.command.push_back(command_node::literal("-u"));
        container.command.push_back(command_node::literal("-c"));
        container.command.push_back(command_node::literal(result.shim.render()));
        container.args = build_command_args(result.spec.inputs, result.spec.outputs);

        debug_log("compiled ", function.name, " with ", to_string(capture->kind()), " capture into image ", container.image);
        return result;
    }

    component_spec func_to_component_spec(
            const py_function& function, const compile_options& options, std::vector<std::string>* warnings) {
        auto result = compile_function(function, options);
        if (warnings != nullptr) {
            warnings->insert(warnings->end(), result.warnings.begin(), result.warnings.end());
        }
        return std::move(result.spec);
    }

    std::string func_to_component_text(
            const py_function& function,
            const compile_options& options,
            output_format format,
            std::vector<std::string>* warnings) {
        return dump_component_spec(func_to_component_spec(function, options, warnings), format);
    }

    void func_to_component_file(
            const py_function& function,
            const std::filesystem::path& output_path,
            const compile_options& options,
            output_format format,
            std::vector<std::string>* warnings) {
        write_text_file(output_path, func_to_component_text(function, options, format, warnings));
    }

}  // namespace pycomp
