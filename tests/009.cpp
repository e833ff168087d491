#include "utils.hpp"

namespace pycomp::test {
    using namespace std::string_view_literals;

    namespace detail {
        static constexpr auto adder_module =
                "def add(a: float, b: float = 2.0) -> float:\n"
                "    '''Adds two numbers.'''\n"
                "    return a + b\n"sv;

        // Restores the process-wide default image when the test scope ends.
        struct default_image_guard {
            image_source saved{get_default_base_image()};
            ~default_image_guard() { set_default_base_image(std::move(saved)); }
        };

        static std::vector<std::string> render_all(const command_line& line) {
            std::vector<std::string> rendered{};
            for (const auto& node : line) {
                rendered.push_back(render_command_node(node));
            }
            return rendered;
        }
    }  // namespace detail

    TEST_CASE("009: base image precedence", "[009][compiler]") {
        detail::default_image_guard guard{};
        auto plain = load_function(detail::adder_module, "add"sv);
        auto decorated = load_function(
                "@python_component(base_image='python:3.7')\ndef f():\n    pass\n"sv, "f"sv);

        compile_options options{};
        CHECK(resolve_base_image(plain, options) == builtin_default_base_image);

        set_default_base_image(std::string{"custom:1"});
        CHECK(resolve_base_image(plain, options) == "custom:1");
        set_default_base_image(std::function<std::string()>{[] { return std::string{"lazy:2"}; }});
        CHECK(resolve_base_image(plain, options) == "lazy:2");

        options.default_base_image = image_source{std::string{"per-call:3"}};
        CHECK(resolve_base_image(plain, options) == "per-call:3");

        options.base_image = "site:4";
        CHECK(resolve_base_image(plain, options) == "site:4");

        compile_options matching{};
        matching.base_image = "python:3.7";
        CHECK(resolve_base_image(decorated, matching) == "python:3.7");
        CHECK(resolve_base_image(decorated, compile_options{}) == "python:3.7");

        try {
            (void)resolve_base_image(decorated, options);
            FAIL("expected configuration_error");
        } catch (const configuration_error& e) {
            CHECK(std::string_view{e.what()} ==
                  "base_image (site:4) conflicts with the decorator-specified base image metadata (python:3.7)");
        }

        compile_options empty_factory{};
        empty_factory.default_base_image = image_source{std::function<std::string()>{}};
        CHECK_THROWS_AS(resolve_base_image(plain, empty_factory), configuration_error);
    }

    TEST_CASE("009: package install wrapper", "[009][compiler]") {
        CHECK(package_install_command({}).empty());

        auto command = package_install_command({"numpy", "pandas==1.0"});
        REQUIRE(command.size() == 3U);
        CHECK(command[0] == command_node::literal("sh"));
        CHECK(command[1] == command_node::literal("-c"));
        CHECK(command[2].text ==
              "(PIP_DISABLE_PIP_VERSION_CHECK=1 python3 -m pip install --quiet --no-warn-script-location 'numpy' "
              "'pandas==1.0' || PIP_DISABLE_PIP_VERSION_CHECK=1 python3 -m pip install --quiet "
              "--no-warn-script-location 'numpy' 'pandas==1.0' --user) && \"$0\" \"$@\"");
    }

    TEST_CASE("009: compile_function assembles the container", "[009][compiler]") {
        auto function = load_function(detail::adder_module, "add"sv);
        compile_options options{};
        options.base_image = "python:3.8";
        options.packages_to_install = {"numpy"};
        options.extra_code = "import math\n";

        auto result = compile_function(function, options);
        CHECK(result.warnings.empty());
        CHECK(result.spec.name == "Add");
        CHECK(result.spec.description == "Adds two numbers.\n");

        const auto& container = result.spec.implementation;
        CHECK(container.image == "python:3.8");
        REQUIRE(container.command.size() == 7U);
        CHECK(container.command[0].text == "sh");
        CHECK(container.command[3].text == "python3");
        CHECK(container.command[4].text == "-u");
        CHECK(container.command[5].text == "-c");
        CHECK(container.command[6].text == result.shim.render());
        CHECK(detail::contains(container.command[6].text, "import math\n"));
        CHECK(detail::contains(container.command[6].text, "def add(a: float, b: float = 2.0) -> float:\n"));

        CHECK(detail::render_all(container.args) ==
              std::vector<std::string>{
                      R"("--a")",
                      R"({"inputValue":"a"})",
                      R"({"if":{"cond":{"isPresent":"b"},"then":["--b",{"inputValue":"b"}]}})",
                      R"("----output-paths")",
                      R"({"outputPath":"Output"})",
              });

        auto without_packages = compile_function(function, compile_options{.base_image = "python:3.8"});
        REQUIRE(without_packages.spec.implementation.command.size() == 4U);
        CHECK(without_packages.spec.implementation.command[0].text == "python3");

        CHECK(func_to_component_spec(function, options) == result.spec);
        CHECK(func_to_component_text(function, options) == func_to_component_text(function, options));
    }

    TEST_CASE("009: component documents", "[009][compiler]") {
        component_spec spec{};
        spec.name = "Echo";
        spec.inputs.push_back(input_spec{"text", "String", false, std::nullopt, passing_style::by_value, "text"});
        spec.implementation.image = "alpine";
        spec.implementation.command = {command_node::literal("echo")};
        spec.implementation.args = {command_node::input_value("text")};

        CHECK(dump_component_spec(spec) ==
              R"({"name":"Echo","inputs":[{"name":"text","type":"String"}],)"
              R"("implementation":{"container":{"image":"alpine","command":["echo"],"args":[{"inputValue":"text"}]}}})"
              "\n");

        spec.inputs.push_back(input_spec{"n", "Integer", true, "3", passing_style::by_value, "n"});
        auto json = dump_component_spec(spec, output_format::json);
        CHECK(json.ends_with("}\n"));
        CHECK(detail::contains(json, R"("name": "Echo")"));
        CHECK(detail::contains(json, R"("default": "3")"));
        CHECK(detail::count_occurrences(json, R"("optional": true)"sv) == 1U);
        CHECK_FALSE(detail::contains(json, "\"outputs\""));
        CHECK_FALSE(detail::contains(json, "\"description\""));
    }

    TEST_CASE("009: func_to_component_file writes the document", "[009][compiler]") {
        detail::temp_dir dir{"pycomp_009"};
        auto function = load_function(detail::adder_module, "add"sv);
        compile_options options{.base_image = "python:3.8"};

        auto path = dir.path / "add.component.json";
        std::vector<std::string> warnings{};
        func_to_component_file(function, path, options, output_format::json, &warnings);
        CHECK(warnings.empty());
        CHECK(detail::read_file(path) == func_to_component_text(function, options, output_format::json));

        CHECK_THROWS_AS(
                func_to_component_file(function, dir.path / "missing" / "add.yaml", options), std::runtime_error);
    }
}  // namespace pycomp::test
