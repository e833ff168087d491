#include "utils.hpp"

namespace pycomp::test {
    using namespace std::string_view_literals;

    TEST_CASE("002: logical lines fold brackets and continuations", "[002][lexer]") {
        auto source =
                "import os\n"
                "\n"
                "# comment\n"
                "def f(a: int,\n"
                "      b: str = 'x') -> int:  # trailing\n"
                "    total = a + \\\n"
                "        1\n"
                "    return total\n"sv;

        auto lines = internal::split_logical_lines(source);
        REQUIRE(lines.size() == 4U);

        CHECK(lines[0].text == "import os");
        CHECK(lines[0].first == 0U);

        CHECK(lines[1].first == 3U);
        CHECK(lines[1].last == 4U);
        CHECK(lines[1].indent == 0U);
        CHECK(lines[1].text.starts_with("def f(a: int,\n"));
        CHECK_FALSE(detail::contains(lines[1].text, "trailing"));

        CHECK(lines[2].indent == 4U);
        CHECK(lines[2].first == 5U);
        CHECK(lines[2].last == 6U);

        CHECK(lines[3].text == "return total");
    }

    TEST_CASE("002: triple quoted strings stay inside one logical line", "[002][lexer]") {
        auto source =
                "def f():\n"
                "    '''Doc\n"
                "\n"
                "  with # no comment\n"
                "    '''\n"
                "    pass\n"sv;

        auto lines = internal::split_logical_lines(source);
        REQUIRE(lines.size() == 3U);
        CHECK(lines[1].first == 1U);
        CHECK(lines[1].last == 4U);
        CHECK(detail::contains(lines[1].text, "# no comment"));
        CHECK(lines[2].text == "pass");

        CHECK_THROWS_AS(internal::split_logical_lines("x = 'open\n"sv), source_error);
    }

    TEST_CASE("002: string literal scanning and decoding", "[002][lexer]") {
        CHECK(internal::scan_string_literal("'a\\'b' + c"sv, 0U) == 6U);
        CHECK(internal::scan_string_literal("\"\"\"x\"y\"\"\" z"sv, 0U) == 9U);
        CHECK(internal::scan_string_literal("'never"sv, 0U) == std::string_view::npos);

        CHECK(internal::string_prefix_length("rb'x'"sv, 0U) == 2U);
        CHECK(internal::string_prefix_length("u\"x\""sv, 0U) == 1U);
        CHECK(internal::string_prefix_length("name"sv, 0U) == 0U);

        CHECK(internal::decode_string_literal("'a\\nb'"sv) == "a\nb");
        CHECK(internal::decode_string_literal("r'a\\nb'"sv) == "a\\nb");
        CHECK(internal::decode_string_literal("'''x'y'''"sv) == "x'y");
        CHECK(internal::decode_string_literal("'\\u00e9'"sv) == "\xc3\xa9");
        CHECK_FALSE(internal::decode_string_literal("f'{x}'"sv).has_value());
        CHECK_FALSE(internal::decode_string_literal("b'raw'"sv).has_value());
    }

    TEST_CASE("002: expression tokenizer", "[002][lexer]") {
        auto tokens = internal::tokenize_expression("foo.bar(1, key='v') -> 2.5e-3"sv);
        std::vector<std::string> texts{};
        for (const auto& t : tokens) {
            texts.push_back(t.text);
        }
        CHECK(texts ==
              std::vector<std::string>{"foo", ".", "bar", "(", "1", ",", "key", "=", "'v'", ")", "->", "2.5e-3"});
        CHECK(tokens[0].kind == internal::token_kind::name);
        CHECK(tokens[4].kind == internal::token_kind::number);
        CHECK(tokens[8].kind == internal::token_kind::string);
        CHECK(tokens[10].kind == internal::token_kind::op);
        CHECK(tokens[2].offset == 4U);
    }

    TEST_CASE("002: annotation expressions parse into structured nodes", "[002][python]") {
        auto call = parse_expression("kfp.components.InputPath('CSV')"sv);
        REQUIRE(call.kind == expr_kind::call);
        CHECK(call.value == "kfp.components.InputPath");
        CHECK(call.last_name_component() == "InputPath"sv);
        CHECK(call.is_call_to("InputPath"sv));
        REQUIRE(call.args.size() == 1U);
        CHECK(call.args[0].kind == expr_kind::string);
        CHECK(call.args[0].value == "CSV");

        auto keyword = parse_expression("OutputPath(type=float)"sv);
        REQUIRE(keyword.keyword("type"sv) != nullptr);
        CHECK(keyword.keyword("type"sv)->value == "float");
        CHECK(keyword.keyword("missing"sv) == nullptr);

        auto subscript = parse_expression("typing.Dict[str, List[int]]"sv);
        REQUIRE(subscript.kind == expr_kind::subscript);
        CHECK(subscript.value == "typing.Dict");
        REQUIRE(subscript.args.size() == 2U);
        CHECK(subscript.args[1].kind == expr_kind::subscript);

        auto tuple = parse_expression("(1, 'a',)"sv);
        CHECK(tuple.kind == expr_kind::tuple);
        CHECK(tuple.args.size() == 2U);

        auto grouped = parse_expression("(  5 )"sv);
        CHECK(grouped.kind == expr_kind::number);

        auto negative = parse_expression("-3"sv);
        REQUIRE(negative.kind == expr_kind::unary_minus);
        CHECK(negative.args[0].value == "3");

        CHECK(parse_expression("a + b"sv).kind == expr_kind::opaque);
        CHECK(parse_expression("a + b"sv).source == "a + b");
        CHECK(parse_expression("lambda x: x"sv).kind == expr_kind::opaque);
        CHECK(parse_expression("f(*args)"sv).kind == expr_kind::opaque);
    }

    TEST_CASE("002: annotations render the way str() prints them", "[002][python]") {
        CHECK(render_expr(parse_expression("List[int]"sv)) == "typing.List[int]");
        CHECK(render_expr(parse_expression("typing.List[int]"sv)) == "typing.List[int]");
        CHECK(render_expr(parse_expression("Dict[str, 'Model']"sv)) == "typing.Dict[str, 'Model']");
        CHECK(render_expr(parse_expression("GcsPath(bucket=\"b\")"sv)) == "GcsPath(bucket='b')");
        CHECK(render_expr(parse_expression("[1, (2,)]"sv)) == "[1, (2,)]");
        CHECK(render_expr(parse_expression("{'a': 1}"sv)) == "{'a': 1}");

        CHECK(is_typing_alias("Optional"sv));
        CHECK_FALSE(is_typing_alias("NamedTuple"sv));
    }

    TEST_CASE("002: type mapper resolves canonical names", "[002][types]") {
        auto resolve = [](std::string_view text) { return resolve_type_name(parse_expression(text)); };

        CHECK_FALSE(resolve_type_name(std::nullopt).has_value());
        CHECK_FALSE(resolve("None"sv).has_value());

        CHECK(resolve("int"sv) == "Integer");
        CHECK(resolve("str"sv) == "String");
        CHECK(resolve("float"sv) == "Float");
        CHECK(resolve("bool"sv) == "Boolean");
        CHECK(resolve("list"sv) == "JsonArray");
        CHECK(resolve("dict"sv) == "JsonObject");
        CHECK(resolve("List"sv) == "JsonArray");
        CHECK(resolve("typing.Dict"sv) == "JsonObject");

        CHECK(resolve("'GcsPath'"sv) == "GcsPath");
        CHECK(resolve("'int'"sv) == "Integer");
        CHECK(resolve("ForwardRef('Model')"sv) == "Model");
        CHECK(resolve("my.pkg.ModelClass"sv) == "ModelClass");
        CHECK(resolve("Optional"sv) == "typing.Optional");

        CHECK(resolve("List[int]"sv) == "typing.List[int]");
        CHECK(resolve("GcsPath(bucket='b')"sv) == "GcsPath(bucket='b')");
    }
}  // namespace pycomp::test
