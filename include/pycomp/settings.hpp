#pragma once

#include "config.hpp"
#include "python.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pycomp {

    namespace fs = std::filesystem;

    inline constexpr int supported_settings_schema_version = 1;

    // JSON settings file (`--config`); every member is optional.
    struct settings_file {
        int schema_version{supported_settings_schema_version};
        std::optional<std::string> base_image{};
        std::optional<std::vector<std::string>> packages_to_install{};
        std::optional<std::vector<std::string>> modules_to_capture{};
        std::optional<bool> use_code_pickling{};
        std::optional<std::string> python_version{};
        std::optional<std::string> format{};
    };

    std::string read_text_file(const fs::path& path);
    void write_text_file(const fs::path& path, std::string_view text);

    settings_file read_settings_file(const fs::path& path);

    std::string write_settings_json(const settings_file& settings);

    // Copies every member present in `settings` onto `cfg`.
    void apply_settings(const settings_file& settings, startup_config& cfg);

    // Settings equivalent of the resolved configuration (for `--print-config`).
    settings_file settings_from_config(const startup_config& cfg);

    // Module name a source file is imported under: its stem.
    std::string module_name_for(const fs::path& source_path);

    /*
     * Locates `a.b` next to the input file as `<dir>/a/b.py` or `<dir>/a/b/__init__.py`.
     * Throws configuration_error when neither exists.
     */
    module_source resolve_module_source(const fs::path& search_dir, std::string_view module_name);

    // Reads extra code and captured module sources referenced by `cfg`.
    compile_options make_compile_options(const startup_config& cfg);

    py_function load_function_file(const startup_config& cfg);

}  // namespace pycomp
