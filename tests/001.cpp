#include "utils.hpp"

namespace pycomp::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: capture strategy and output format parsing", "[001][config]") {
        capture_strategy strategy = capture_strategy::source_copy;
        output_format format = output_format::yaml;

        REQUIRE(try_parse_capture_strategy("Pickle"sv, strategy));
        CHECK(strategy == capture_strategy::pickle);
        REQUIRE(try_parse_capture_strategy("source"sv, strategy));
        CHECK(strategy == capture_strategy::source_copy);
        REQUIRE(try_parse_capture_strategy("cloudpickle"sv, strategy));
        CHECK(strategy == capture_strategy::pickle);
        CHECK_FALSE(try_parse_capture_strategy("bytes"sv, strategy));
        CHECK(strategy == capture_strategy::pickle);

        REQUIRE(try_parse_output_format("JSON"sv, format));
        CHECK(format == output_format::json);
        REQUIRE(try_parse_output_format("yml"sv, format));
        CHECK(format == output_format::yaml);
        CHECK_FALSE(try_parse_output_format("xml"sv, format));
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(capture_strategy::source_copy) == "source"sv);
        CHECK(to_string(capture_strategy::pickle) == "pickle"sv);
        CHECK(to_string(output_format::json) == "json"sv);
        CHECK(to_string(output_format::yaml) == "yaml"sv);

        CHECK(to_string(passing_style::input_text_stream) == "input_text_stream"sv);
        CHECK(to_string(command_node_kind::input_value) == "inputValue"sv);
        CHECK(std::format("{}", passing_style::output_path) == "output_path");
        CHECK(std::format("{}", value_codec::base64_pickle) == "base64_pickle");
    }

    TEST_CASE("001: python version parsing", "[001][config]") {
        python_version version{};
        CHECK(version.to_tuple_repr() == "(3, 7, 0, 'final', 0)");

        REQUIRE(try_parse_python_version("3.8"sv, version));
        CHECK(version.major == 3);
        CHECK(version.minor == 8);
        CHECK(version.micro == 0);
        CHECK(version.to_tuple_repr() == "(3, 8, 0, 'final', 0)");

        REQUIRE(try_parse_python_version(" 3.6.9 "sv, version));
        CHECK(version.to_tuple_repr() == "(3, 6, 9, 'final', 0)");

        REQUIRE(try_parse_python_version("3"sv, version));
        CHECK(version.minor == 0);

        CHECK_FALSE(try_parse_python_version(""sv, version));
        CHECK_FALSE(try_parse_python_version("3."sv, version));
        CHECK_FALSE(try_parse_python_version("3.x"sv, version));
        CHECK_FALSE(try_parse_python_version("3.7.1.2"sv, version));
        CHECK(version.major == 3);
    }

    TEST_CASE("001: passing style classification", "[001][config]") {
        CHECK(is_output_style(passing_style::return_value));
        CHECK(is_output_style(passing_style::output_binary_stream));
        CHECK_FALSE(is_output_style(passing_style::input_path));

        CHECK(is_file_style(passing_style::input_text_stream));
        CHECK_FALSE(is_file_style(passing_style::by_value));
        CHECK_FALSE(is_file_style(passing_style::return_value));

        CHECK(is_path_style(passing_style::output_path));
        CHECK_FALSE(is_path_style(passing_style::output_text_stream));

        CHECK(marker_class_name(passing_style::input_binary_stream) == "InputBinaryFile"sv);
        CHECK(marker_class_name(passing_style::by_value).empty());
        CHECK(try_parse_marker_class("OutputTextFile"sv) == passing_style::output_text_stream);
        CHECK_FALSE(try_parse_marker_class("OutputFile"sv).has_value());
    }

    TEST_CASE("001: string utilities", "[001][utils]") {
        CHECK(utils::str_case_eq("Yaml"sv, "YAML"sv));
        CHECK_FALSE(utils::str_case_eq("yaml"sv, "yam"sv));
        CHECK(utils::trim_view("  a b \n"sv) == "a b"sv);
        CHECK(utils::trim_chars("\n\nbody\n"sv, '\n') == "body"sv);
        CHECK(utils::leading_whitespace("\t  x = 1"sv) == 3U);
        CHECK(utils::replace_all("a_b__c"sv, "_"sv, "-"sv) == "a-b--c");
        CHECK(utils::join_with_separator({"x", "y", "z"}, ", "sv) == "x, y, z");
        CHECK(utils::join_with_separator({}, ", "sv).empty());

        auto lines = utils::split_lines_keepends("one\ntwo\n\nlast"sv);
        REQUIRE(lines.size() == 4U);
        CHECK(lines[0] == "one\n");
        CHECK(lines[2] == "\n");
        CHECK(lines[3] == "last");

        std::vector<std::string> values{};
        utils::append_unique(values, "a");
        utils::append_unique(values, "");
        utils::append_unique(values, "b");
        utils::append_unique(values, "a");
        CHECK(values == std::vector<std::string>{"a", "b"});

        CHECK(utils::parse_arithmetic<int>("42"sv) == 42);
        CHECK_FALSE(utils::parse_arithmetic<int>("4x"sv).has_value());
    }
}  // namespace pycomp::test
