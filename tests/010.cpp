#include "utils.hpp"

#include "cli.hpp"

namespace pycomp::test {
    using namespace std::string_view_literals;

    namespace detail {
        static constexpr auto steps_module =
                "import helpers\n"
                "\n"
                "def scale(a: float, factor: int = 10) -> float:\n"
                "    '''Scales a value.'''\n"
                "    return helpers.mul(a, factor)\n"sv;

        static constexpr auto helpers_module = "def mul(a, b):\n    return a * b\n"sv;
    }  // namespace detail

    TEST_CASE("010: settings files", "[010][settings]") {
        detail::temp_dir dir{"pycomp_010_settings"};
        auto path = dir.path / "pycomp.json";
        detail::write_file(
                path,
                R"({"schema_version":1,"base_image":"img:cfg","packages_to_install":["numpy"],)"
                R"("use_code_pickling":true,"python_version":"3.8","format":"json","comment":"ignored"})");

        auto settings = read_settings_file(path);
        CHECK(settings.base_image == "img:cfg");
        CHECK(settings.packages_to_install == std::vector<std::string>{"numpy"});
        CHECK_FALSE(settings.modules_to_capture.has_value());

        startup_config cfg{};
        apply_settings(settings, cfg);
        CHECK(cfg.base_image == "img:cfg");
        CHECK(cfg.packages_to_install == std::vector<std::string>{"numpy"});
        CHECK(cfg.capture == capture_strategy::pickle);
        CHECK(cfg.pickler_python_version == python_version{3, 8, 0, "final", 0});
        CHECK(cfg.format == output_format::json);

        auto printed = write_settings_json(settings_from_config(cfg));
        CHECK(detail::contains(printed, R"("use_code_pickling": true)"));
        CHECK(detail::contains(printed, R"("python_version": "3.8.0")"));
        CHECK(detail::contains(printed, R"("format": "json")"));
        CHECK_FALSE(detail::contains(printed, "modules_to_capture"));

        detail::write_file(path, R"({"schema_version":2})");
        CHECK_THROWS_AS(read_settings_file(path), configuration_error);
        detail::write_file(path, R"({"schema_version":)");
        CHECK_THROWS_AS(read_settings_file(path), configuration_error);
        CHECK_THROWS_AS(read_settings_file(dir.path / "absent.json"), std::runtime_error);

        settings_file bad_version{};
        bad_version.python_version = "three";
        CHECK_THROWS_AS(apply_settings(bad_version, cfg), configuration_error);
        settings_file bad_format{};
        bad_format.format = "xml";
        CHECK_THROWS_AS(apply_settings(bad_format, cfg), configuration_error);
    }

    TEST_CASE("010: module sources resolve next to the input file", "[010][settings]") {
        detail::temp_dir dir{"pycomp_010_modules"};
        fs::create_directories(dir.path / "pkg");
        fs::create_directories(dir.path / "helpers");
        detail::write_file(dir.path / "pkg" / "util.py", "X = 1\n");
        detail::write_file(dir.path / "helpers" / "__init__.py", detail::helpers_module);

        auto util = resolve_module_source(dir.path, "pkg.util"sv);
        CHECK(util.name == "pkg.util");
        CHECK(util.file_name == "util.py");
        CHECK(util.text == "X = 1\n");

        auto package = resolve_module_source(dir.path, "helpers"sv);
        CHECK(package.file_name == "__init__.py");
        CHECK(package.text == detail::helpers_module);

        CHECK_THROWS_AS(resolve_module_source(dir.path, "absent"sv), configuration_error);
        CHECK(module_name_for("a/b/steps.py") == "steps");
    }

    TEST_CASE("010: compile options from the startup config", "[010][settings]") {
        detail::temp_dir dir{"pycomp_010_options"};
        detail::write_file(dir.path / "steps.py", detail::steps_module);
        detail::write_file(dir.path / "helpers.py", detail::helpers_module);
        detail::write_file(dir.path / "preamble.py", "import os\n");

        startup_config cfg{};
        cfg.source_path = dir.path / "steps.py";
        cfg.function_name = "scale";
        cfg.base_image = "python:3.8";
        cfg.extra_code_path = dir.path / "preamble.py";

        auto function = load_function_file(cfg);
        CHECK(function.module_name == "steps");
        CHECK(function.parameters.size() == 2U);

        auto options = make_compile_options(cfg);
        CHECK(options.extra_code == "import os\n");
        CHECK(options.base_image == "python:3.8");
        REQUIRE(options.module_sources.size() == 1U);
        CHECK(options.module_sources[0].name == "steps");
        CHECK(options.module_sources[0].file_name == "steps.py");

        cfg.capture = capture_strategy::pickle;
        cfg.modules_to_capture = std::vector<std::string>{"steps", "helpers"};
        cfg.module_name = "pipeline.steps";
        options = make_compile_options(cfg);
        REQUIRE(options.module_sources.size() == 3U);
        CHECK(options.module_sources[0].name == "pipeline.steps");
        CHECK(options.module_sources[1].name == "steps");
        CHECK(options.module_sources[2].text == detail::helpers_module);
        CHECK(load_function_file(cfg).module_name == "pipeline.steps");

        cfg.modules_to_capture = std::vector<std::string>{"missing"};
        CHECK_THROWS_AS(make_compile_options(cfg), configuration_error);
    }

    TEST_CASE("010: command line parsing", "[010][cli]") {
        {
            startup_config cfg{};
            detail::cli_args args{"--version"};
            CHECK(cli::parse_cli(args.argc(), args.data(), cfg) == 0);
        }
        {
            startup_config cfg{};
            detail::cli_args args{"--quiet", "--verbose"};
            CHECK(cli::parse_cli(args.argc(), args.data(), cfg) == 2);
        }
        {
            startup_config cfg{};
            detail::cli_args args{"m.py", "-f", "add", "--format", "xml"};
            CHECK(cli::parse_cli(args.argc(), args.data(), cfg) == 2);
        }
        {
            startup_config cfg{};
            detail::cli_args args{"m.py", "-f", "add", "--python-version", "3.x"};
            CHECK(cli::parse_cli(args.argc(), args.data(), cfg) == 2);
        }
        {
            startup_config cfg{};
            detail::cli_args args{"m.py"};
            CHECK(cli::parse_cli(args.argc(), args.data(), cfg) == 2);
        }
        {
            startup_config cfg{};
            detail::cli_args args{"--no-such-flag"};
            auto rc = cli::parse_cli(args.argc(), args.data(), cfg);
            REQUIRE(rc.has_value());
            CHECK(*rc != 0);
        }
        {
            startup_config cfg{};
            detail::cli_args args{"--print-config", "--use-code-pickling"};
            CHECK(cli::parse_cli(args.argc(), args.data(), cfg) == 0);
            CHECK(cfg.capture == capture_strategy::pickle);
        }
        {
            startup_config cfg{};
            detail::cli_args args{
                    "steps.py",
                    "--function",
                    "scale",
                    "--module-name",
                    "pipeline.steps",
                    "-o",
                    "scale.yaml",
                    "--use-code-pickling",
                    "--capture-module",
                    "helpers",
                    "--capture-module",
                    "helpers",
                    "--python-version",
                    "3.9",
                    "--package",
                    "numpy"};
            CHECK_FALSE(cli::parse_cli(args.argc(), args.data(), cfg).has_value());
            CHECK(cfg.source_path == "steps.py");
            CHECK(cfg.function_name == "scale");
            CHECK(cfg.module_name == "pipeline.steps");
            CHECK(cfg.output_path == fs::path{"scale.yaml"});
            CHECK(cfg.capture == capture_strategy::pickle);
            CHECK(cfg.modules_to_capture == std::vector<std::string>{"helpers"});
            CHECK(cfg.pickler_python_version.minor == 9);
            CHECK(cfg.packages_to_install == std::vector<std::string>{"numpy"});
            CHECK(cfg.format == output_format::yaml);
        }
    }

    TEST_CASE("010: command line flags override the settings file", "[010][cli]") {
        detail::temp_dir dir{"pycomp_010_config"};
        auto path = dir.path / "pycomp.json";
        detail::write_file(
                path, R"({"base_image":"img:cfg","packages_to_install":["numpy"],"format":"json"})");

        startup_config cfg{};
        auto config_arg = path.string();
        detail::cli_args args{
                "m.py", "-f", "add", "--config", config_arg, "--base-image", "img:flag", "--package", "numpy",
                "--package", "scipy"};
        CHECK_FALSE(cli::parse_cli(args.argc(), args.data(), cfg).has_value());
        CHECK(cfg.config_path == path);
        CHECK(cfg.base_image == "img:flag");
        CHECK(cfg.packages_to_install == std::vector<std::string>{"numpy", "scipy"});
        CHECK(cfg.format == output_format::json);

        startup_config missing{};
        auto missing_arg = (dir.path / "absent.json").string();
        detail::cli_args missing_args{"m.py", "-f", "add", "--config", missing_arg};
        CHECK(cli::parse_cli(missing_args.argc(), missing_args.data(), missing) == 2);
    }

    TEST_CASE("010: pycomp executable compiles a module file", "[010][cli]") {
        detail::temp_dir dir{"pycomp_010_exec"};
        auto source = dir.path / "steps.py";
        auto output = dir.path / "scale.json";
        detail::write_file(source, detail::steps_module);

        auto written = detail::run_pycomp(
                {source.string(), "-f", "scale", "--format", "json", "--base-image", "python:3.8", "-o", output.string()});
        CHECK(written.exit_code == 0);
        CHECK(written.out.empty());
        CHECK(detail::contains(written.err, "wrote " + output.string()));
        auto document = detail::read_file(output);
        CHECK(detail::contains(document, R"("name": "Scale")"));
        CHECK(detail::contains(document, R"("image": "python:3.8")"));

        auto conflicting = detail::run_pycomp({source.string(), "-f", "scale", "--quiet", "--verbose"});
        CHECK(conflicting.exit_code == 2);

        auto streamed = detail::run_pycomp({source.string(), "-f", "scale", "--verbose"});
        CHECK(streamed.exit_code == 0);
        CHECK(streamed.out.starts_with(R"({"name":"Scale")"));
        CHECK(detail::contains(streamed.err, "component: Scale\n"));
        CHECK(detail::contains(streamed.err, "inputs: a(by_value) factor(by_value)\n"));
        CHECK(detail::contains(streamed.err, "outputs: Output(return_value)\n"));

        auto help = detail::run_pycomp({"--help"});
        CHECK(help.exit_code == 0);
        CHECK(detail::contains(help.out, "yaml (compact JSON)"));

        auto failed = detail::run_pycomp({source.string(), "-f", "missing"});
        CHECK(failed.exit_code == 1);
        CHECK(failed.err.starts_with("fatal: "));
    }
}  // namespace pycomp::test
