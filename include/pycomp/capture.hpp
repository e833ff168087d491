#pragma once

#include "config.hpp"
#include "python.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pycomp {

    /*
     * Produces the program fragment that defines the function under its own name inside
     * the shim. Implementations differ in how the body travels: copied as source text or
     * serialized into an opaque blob with a loader.
     */
    class code_capture {
      public:
        virtual ~code_capture() = default;

        virtual capture_strategy kind() const = 0;

        virtual std::string capture(const py_function& function) const = 0;
    };

    class source_copy_capture final : public code_capture {
      public:
        capture_strategy kind() const override { return capture_strategy::source_copy; }

        std::string capture(const py_function& function) const override;
    };

    class pickle_capture final : public code_capture {
      public:
        pickle_capture(
                std::optional<std::vector<std::string>> modules_to_capture,
                std::vector<module_source> module_sources,
                python_version pickler_version);

        capture_strategy kind() const override { return capture_strategy::pickle; }

        std::string capture(const py_function& function) const override;

        // Protocol 2 pickle that rebuilds the captured modules and returns the function.
        std::string pickle_function(const py_function& function) const;

      private:
        std::optional<std::vector<std::string>> modules_to_capture_{};
        std::vector<module_source> module_sources_{};
        python_version pickler_version_{};

        const module_source* find_module_source(std::string_view name) const;
    };

    std::unique_ptr<code_capture> make_code_capture(const compile_options& options);

    // Function source without decorators, dedented to column zero.
    std::vector<std::string> dedented_function_lines(const py_function& function);

    // Loader text: cloudpickle self-install, interpreter version guard, then
    // `<function_name> = pickle.loads(base64.b64decode(b'<blob>'))`.
    std::string pickle_loader_text(
            std::string_view function_name, std::string_view base64_blob, const python_version& pickler_version);

}  // namespace pycomp
