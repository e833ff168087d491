#pragma once

#include "pycomp.hpp"

#include <optional>

namespace pycomp::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    int run_compile(const startup_config& cfg);

}  // namespace pycomp::cli
