#include "pycomp/capture.hpp"

#include "internal/base64.hpp"
#include "internal/pickle.hpp"

#include "pycomp/errors.hpp"

#include <algorithm>

using namespace pycomp::literals;

namespace pycomp {
    namespace detail {

        static constexpr auto cloudpickle_install_text = R"py(import sys
try:
    import cloudpickle as _cloudpickle
except ImportError:
    import subprocess
    try:
        print("cloudpickle is not installed. Installing it globally", file=sys.stderr)
        subprocess.run([sys.executable, "-m", "pip", "install", "cloudpickle==1.1.1", "--quiet"], env={"PIP_DISABLE_PIP_VERSION_CHECK": "1"}, check=True)
        print("Installed cloudpickle globally", file=sys.stderr)
    except:
        print("Failed to install cloudpickle globally. Installing for the current user.", file=sys.stderr)
        subprocess.run([sys.executable, "-m", "pip", "install", "cloudpickle==1.1.1", "--user", "--quiet"], env={"PIP_DISABLE_PIP_VERSION_CHECK": "1"}, check=True)
        print("Installed cloudpickle for the current user", file=sys.stderr)
        # Python does not add the user site directory to sys.path if it was empty at start.
        import site
        sys.path.append(site.getusersitepackages())
    import cloudpickle as _cloudpickle
    print("cloudpickle loaded successfully after installing.", file=sys.stderr)
)py"sv;

        static constexpr auto version_guard_text = R"py(
current_python_version = tuple(sys.version_info)
if (
    current_python_version[0] != pickler_python_version[0] or
    current_python_version[1] < pickler_python_version[1] or
    current_python_version[0] == 3 and ((pickler_python_version[1] < 6) != (current_python_version[1] < 6))
    ):
    raise RuntimeError("Incompatible python versions: " + str(current_python_version) + " instead of " + str(pickler_python_version))

if current_python_version != pickler_python_version:
    print("Warning!: Different python versions. The code may crash! Current environment python version: " + str(current_python_version) + ". Component code python version: " + str(pickler_python_version), file=sys.stderr)

import base64
import pickle

)py"sv;

        // Imports a copied module-level tuple declaration needs besides `NamedTuple`.
        static std::string declaration_imports(std::string_view declaration) {
            std::string imports{};
            if (declaration.find("typing."sv) != std::string_view::npos) {
                imports += "import typing\n";
            }
            if (declaration.find("collections."sv) != std::string_view::npos) {
                imports += "import collections\n";
            }
            else if (declaration.find("namedtuple("sv) != std::string_view::npos) {
                imports += "from collections import namedtuple\n";
            }
            return imports;
        }

        // Module name the rebuilt namespace runs under; `__main__` would trigger main guards.
        static std::string namespace_module_name(std::string_view module_name) {
            if (module_name == "__main__"sv) {
                return "__mp_main__";
            }
            return std::string{module_name};
        }

        static std::string compile_and_exec(std::string_view source, std::string_view file_name, std::string_view ns) {
            return "exec(compile({}, {}, 'exec'), {})"_format(py_repr(source), py_repr(file_name), ns);
        }

    }  // namespace detail

    std::vector<std::string> dedented_function_lines(const py_function& function) {
        std::vector<std::string> lines{};
        auto first = std::min(function.decorator_line_count, function.source_lines.size());
        for (auto i = first; i < function.source_lines.size(); ++i) {
            lines.push_back(function.source_lines[i]);
        }
        if (lines.empty()) {
            return lines;
        }

        auto indent = utils::leading_whitespace(lines.front());
        for (auto& line : lines) {
            auto strip = std::min(indent, utils::leading_whitespace(line));
            line.erase(0U, strip);
        }
        return lines;
    }

    std::string source_copy_capture::capture(const py_function& function) const {
        std::string text{};
        if (function.return_tuple) {
            text += "from typing import NamedTuple\n";
            text += "\n";
            if (const auto& declaration = function.return_tuple->declaration_source) {
                text += detail::declaration_imports(*declaration);
                text += *declaration;
                text += "\n";
            }
        }
        if (auto bindings = default_value_bindings(function); !bindings.empty()) {
            text += bindings;
            text += "\n";
        }
        for (const auto& line : dedented_function_lines(function)) {
            text += line;
        }
        return text;
    }

    pickle_capture::pickle_capture(
            std::optional<std::vector<std::string>> modules_to_capture,
            std::vector<module_source> module_sources,
            python_version pickler_version)
            : modules_to_capture_{std::move(modules_to_capture)},
              module_sources_{std::move(module_sources)},
              pickler_version_{std::move(pickler_version)} {}

    const module_source* pickle_capture::find_module_source(std::string_view name) const {
        auto it = std::ranges::find(module_sources_, name, &module_source::name);
        return it == module_sources_.end() ? nullptr : &*it;
    }

    std::string pickle_capture::pickle_function(const py_function& function) const {
        std::vector<std::string> modules{};
        if (modules_to_capture_) {
            for (const auto& name : *modules_to_capture_) {
                utils::append_unique(modules, name);
            }
        }
        else {
            modules.push_back(function.module_name);
        }

        std::vector<std::string> steps{};
        bool defining_module_captured = false;
        for (const auto& name : modules) {
            if (name == function.module_name) {
                defining_module_captured = true;
                continue;
            }
            const auto* source = find_module_source(name);
            if (source == nullptr) {
                throw configuration_error("module '{}' is listed for capture but its source is unavailable"_format(name));
            }
            auto file_name = source->file_name.empty() ? "{}.py"_format(name) : source->file_name;
            steps.push_back(
                    "(lambda _m: (_sys.modules.__setitem__({0}, _m), _m.__dict__.__setitem__('__file__', {1}), {2}))(_types.ModuleType({0}))"_format(
                            py_repr(name),
                            py_repr(file_name),
                            detail::compile_and_exec(source->text, file_name, "_m.__dict__"sv)));
        }

        std::string defining_file{};
        if (const auto* source = find_module_source(function.module_name); source != nullptr && !source->file_name.empty()) {
            defining_file = source->file_name;
        }
        else {
            defining_file = "{}.py"_format(function.module_name);
        }

        auto defining_text = defining_module_captured
                                   ? function_dependency_source(function)
                                   : default_value_bindings(function) + unannotated_function_source(function);
        steps.push_back(detail::compile_and_exec(defining_text, defining_file, "_ns"sv));

        auto expression =
                "(lambda _sys, _types, _ns: ([{}], _ns[{}])[1])(__import__('sys'), __import__('types'), {{'__name__': {}, '__builtins__': __builtins__}})"_format(
                        utils::join_with_separator(steps, ", "sv),
                        py_repr(function.name),
                        py_repr(detail::namespace_module_name(function.module_name)));

        debug_log("pickling ", function.name, " with ", modules.size(), " captured module(s)");
        return internal::pickle_writer{}
                .call("builtins"sv,
                      "eval"sv,
                      2U,
                      [&expression](internal::pickle_writer& w) {
                          w.str(expression);
                          w.empty_dict();
                      })
                .finish();
    }

    std::string pickle_capture::capture(const py_function& function) const {
        auto blob = internal::base64_encode(pickle_function(function));
        return pickle_loader_text(function.name, blob, pickler_version_);
    }

    std::string pickle_loader_text(
            std::string_view function_name, std::string_view base64_blob, const python_version& pickler_version) {
        std::string text{detail::cloudpickle_install_text};
        text += "\npickler_python_version = ";
        text += pickler_version.to_tuple_repr();
        text += detail::version_guard_text;
        text += "{} = pickle.loads(base64.b64decode(b'{}'))\n"_format(function_name, base64_blob);
        return text;
    }

    std::unique_ptr<code_capture> make_code_capture(const compile_options& options) {
        switch (options.capture) {
            case capture_strategy::source_copy:
                return std::make_unique<source_copy_capture>();
            case capture_strategy::pickle:
                return std::make_unique<pickle_capture>(
                        options.modules_to_capture, options.module_sources, options.pickler_python_version);
        }
        throw configuration_error("unknown capture strategy");
    }

}  // namespace pycomp
