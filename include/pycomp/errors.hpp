#pragma once

#include <stdexcept>
#include <string>

namespace pycomp {

    // Invalid combination of user-supplied settings: a default on a file-style parameter,
    // conflicting images, an unsupported default expression.
    struct configuration_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // A passing style outside the closed set reached a code generator.
    struct unsupported_passing_style_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // The Python source could not be understood (missing function, malformed header).
    struct source_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // A compile-time value could not be serialized to the requested type.
    struct serialization_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

}  // namespace pycomp
