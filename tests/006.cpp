#include "utils.hpp"

namespace pycomp::test {
    using namespace std::string_view_literals;

    namespace detail {
        static input_spec make_input(std::string name, passing_style style, bool optional = false) {
            input_spec input{};
            input.parameter_name = name;
            input.name = std::move(name);
            input.style = style;
            input.optional = optional;
            return input;
        }

        static output_spec make_output(std::string name, passing_style style) {
            output_spec output{};
            output.name = std::move(name);
            output.style = style;
            if (style != passing_style::return_value) {
                output.parameter_name = output.name + "_path";
            }
            return output;
        }

        static std::vector<std::string> render_all(const command_line& line) {
            std::vector<std::string> rendered{};
            for (const auto& node : line) {
                rendered.push_back(render_command_node(node));
            }
            return rendered;
        }
    }  // namespace detail

    TEST_CASE("006: command flags", "[006][command]") {
        CHECK(command_flag("learning_rate"sv) == "--learning-rate");
        CHECK(command_flag("Output"sv) == "--Output");
        CHECK(command_flag("a__b"sv) == "--a--b");
        CHECK(output_paths_flag == "----output-paths"sv);
    }

    TEST_CASE("006: input and output arguments", "[006][command]") {
        auto by_value = argument_for_input(detail::make_input("epochs", passing_style::by_value));
        CHECK(by_value == command_line{command_node::literal("--epochs"), command_node::input_value("epochs")});

        auto by_path = argument_for_input(detail::make_input("data", passing_style::input_binary_stream));
        CHECK(by_path == command_line{command_node::literal("--data"), command_node::input_path("data")});

        auto optional = argument_for_input(detail::make_input("label_name", passing_style::by_value, true));
        REQUIRE(optional.size() == 1U);
        CHECK(optional[0] ==
              command_node::if_then(
                      command_node::is_present("label_name"),
                      {command_node::literal("--label-name"), command_node::input_value("label_name")}));

        auto output = argument_for_output(detail::make_output("model", passing_style::output_text_stream));
        CHECK(output == command_line{command_node::literal("--model"), command_node::output_path("model")});

        CHECK_THROWS_AS(
                argument_for_input(detail::make_input("x", passing_style::output_path)), unsupported_passing_style_error);
        CHECK_THROWS_AS(
                argument_for_output(detail::make_output("x", passing_style::return_value)),
                unsupported_passing_style_error);
    }

    TEST_CASE("006: args template ordering", "[006][command]") {
        std::vector<input_spec> inputs{
                detail::make_input("a", passing_style::by_value),
                detail::make_input("b_in", passing_style::input_path, true),
        };
        std::vector<output_spec> outputs{
                detail::make_output("sum", passing_style::return_value),
                detail::make_output("report", passing_style::output_path),
                detail::make_output("product", passing_style::return_value),
        };

        auto partition = partition_outputs(outputs);
        REQUIRE(partition.file_outputs.size() == 1U);
        CHECK(partition.file_outputs[0]->name == "report");
        REQUIRE(partition.return_outputs.size() == 2U);
        CHECK(partition.return_outputs[1]->name == "product");

        auto args = detail::render_all(build_command_args(inputs, outputs));
        CHECK(args == std::vector<std::string>{
                              R"("--a")",
                              R"({"inputValue":"a"})",
                              R"({"if":{"cond":{"isPresent":"b_in"},"then":["--b-in",{"inputPath":"b_in"}]}})",
                              R"("--report")",
                              R"({"outputPath":"report"})",
                              R"("----output-paths")",
                              R"({"outputPath":"sum"})",
                              R"({"outputPath":"product"})",
                      });

        CHECK(build_command_args({}, {}).empty());
        auto only_files = build_command_args({}, {detail::make_output("out", passing_style::output_path)});
        CHECK(only_files.size() == 2U);
    }

    TEST_CASE("006: command nodes render as placeholders", "[006][command]") {
        CHECK(render_command_node(command_node::literal("say \"hi\"\n")) == R"("say \"hi\"\n")");
        CHECK(render_command_node(command_node::input_path("x")) == R"({"inputPath":"x"})");
        CHECK(render_command_node(command_node::is_present("x")) == R"({"isPresent":"x"})");

        command_node broken{};
        broken.kind = command_node_kind::if_then;
        CHECK_THROWS_AS(render_command_node(broken), serialization_error);
    }
}  // namespace pycomp::test
