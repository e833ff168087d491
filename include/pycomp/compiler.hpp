#pragma once

#include "component.hpp"
#include "config.hpp"
#include "python.hpp"
#include "shim.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pycomp {

    /*
     * Process-wide default image used when neither the call site nor the function names one.
     * Last write wins; the setter is not synchronized, so concurrent compilations that also
     * set it race. Prefer `compile_options::default_base_image` for per-call overrides.
     */
    image_source get_default_base_image();
    void set_default_base_image(image_source image);

    // Call-site image > decorator-attached image > per-call default > process-wide default.
    // Throws configuration_error when the call-site and attached images differ.
    std::string resolve_base_image(const py_function& function, const compile_options& options);

    // `sh -c '(pip install ... || pip install ... --user) && "$0" "$@"'`; empty without packages.
    command_line package_install_command(const std::vector<std::string>& packages);

    struct compilation {
        component_spec spec{};
        shim_program shim{};
        std::vector<std::string> warnings{};
    };

    compilation compile_function(const py_function& function, const compile_options& options = {});

    component_spec func_to_component_spec(
            const py_function& function, const compile_options& options = {}, std::vector<std::string>* warnings = nullptr);

    std::string func_to_component_text(
            const py_function& function,
            const compile_options& options = {},
            output_format format = output_format::yaml,
            std::vector<std::string>* warnings = nullptr);

    void func_to_component_file(
            const py_function& function,
            const std::filesystem::path& output_path,
            const compile_options& options = {},
            output_format format = output_format::yaml,
            std::vector<std::string>* warnings = nullptr);

}  // namespace pycomp
