#include "pycomp/settings.hpp"

#include "pycomp/errors.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <sstream>

using namespace pycomp::literals;

namespace glz {

    template <>
    struct meta<pycomp::settings_file> {
        using T = pycomp::settings_file;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "base_image",
                       &T::base_image,
                       "packages_to_install",
                       &T::packages_to_install,
                       "modules_to_capture",
                       &T::modules_to_capture,
                       "use_code_pickling",
                       &T::use_code_pickling,
                       "python_version",
                       &T::python_version,
                       "format",
                       &T::format);
    };

}  // namespace glz

namespace pycomp {

    std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << text;
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

    settings_file read_settings_file(const fs::path& path) {
        settings_file settings{};
        auto json = read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(settings, json);
        if (ec) {
            throw configuration_error("failed to parse settings file {}"_format(path.string()));
        }
        if (settings.schema_version > supported_settings_schema_version) {
            throw configuration_error(
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), settings.schema_version, supported_settings_schema_version));
        }
        return settings;
    }

    std::string write_settings_json(const settings_file& settings) {
        std::string json{};
        auto ec = glz::write<glz::opts{.prettify = true}>(settings, json);
        if (ec) {
            throw serialization_error("failed to serialize settings");
        }
        return json;
    }

    void apply_settings(const settings_file& settings, startup_config& cfg) {
        if (settings.base_image) {
            cfg.base_image = settings.base_image;
        }
        if (settings.packages_to_install) {
            cfg.packages_to_install = *settings.packages_to_install;
        }
        if (settings.modules_to_capture) {
            cfg.modules_to_capture = settings.modules_to_capture;
        }
        if (settings.use_code_pickling) {
            cfg.capture = *settings.use_code_pickling ? capture_strategy::pickle : capture_strategy::source_copy;
        }
        if (settings.python_version &&
            !try_parse_python_version(*settings.python_version, cfg.pickler_python_version)) {
            throw configuration_error("invalid python_version in settings: {}"_format(*settings.python_version));
        }
        if (settings.format && !try_parse_output_format(*settings.format, cfg.format)) {
            throw configuration_error("invalid format in settings: {} (expected json|yaml)"_format(*settings.format));
        }
    }

    settings_file settings_from_config(const startup_config& cfg) {
        settings_file settings{};
        settings.base_image = cfg.base_image;
        settings.packages_to_install = cfg.packages_to_install;
        settings.modules_to_capture = cfg.modules_to_capture;
        settings.use_code_pickling = cfg.capture == capture_strategy::pickle;
        const auto& v = cfg.pickler_python_version;
        settings.python_version = "{}.{}.{}"_format(v.major, v.minor, v.micro);
        settings.format = std::string{to_string(cfg.format)};
        return settings;
    }

    std::string module_name_for(const fs::path& source_path) {
        return source_path.stem().string();
    }

    module_source resolve_module_source(const fs::path& search_dir, std::string_view module_name) {
        fs::path relative{};
        std::string_view rest{module_name};
        while (!rest.empty()) {
            auto dot = rest.find('.');
            relative /= std::string{rest.substr(0U, dot)};
            if (dot == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(dot + 1U);
        }

        for (auto candidate : {search_dir / fs::path{relative.string() + ".py"}, search_dir / relative / "__init__.py"}) {
            std::error_code ec{};
            if (fs::is_regular_file(candidate, ec)) {
                debug_log("resolved module ", module_name, " to ", candidate.string());
                return module_source{std::string{module_name}, candidate.filename().string(), read_text_file(candidate)};
            }
        }
        throw configuration_error(
                "module '{}' listed for capture was not found under {}"_format(module_name, search_dir.string()));
    }

    compile_options make_compile_options(const startup_config& cfg) {
        compile_options options{};
        options.base_image = cfg.base_image;
        options.packages_to_install = cfg.packages_to_install;
        options.modules_to_capture = cfg.modules_to_capture;
        options.capture = cfg.capture;
        options.pickler_python_version = cfg.pickler_python_version;

        if (cfg.extra_code_path) {
            options.extra_code = read_text_file(*cfg.extra_code_path);
        }

        auto defining_module = cfg.module_name.value_or(module_name_for(cfg.source_path));
        options.module_sources.push_back(module_source{
                defining_module, cfg.source_path.filename().string(), read_text_file(cfg.source_path)});

        if (cfg.capture == capture_strategy::pickle && cfg.modules_to_capture) {
            auto search_dir = cfg.source_path.parent_path();
            for (const auto& name : *cfg.modules_to_capture) {
                if (name == defining_module) {
                    continue;
                }
                options.module_sources.push_back(resolve_module_source(search_dir, name));
            }
        }
        return options;
    }

    py_function load_function_file(const startup_config& cfg) {
        auto text = read_text_file(cfg.source_path);
        auto module_name = cfg.module_name.value_or(module_name_for(cfg.source_path));
        return load_function(text, cfg.function_name, module_name);
    }

}  // namespace pycomp
