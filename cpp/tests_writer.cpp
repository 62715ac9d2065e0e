#include "tests.hpp"
#include "writer.hpp"

#include <cmath>
#include <limits>
#include <sstream>

using namespace utfjson;
using namespace utfjson::test;

namespace
{

std::string text_of(const Json& json, WritingOptions options = {})
{
	return std::get<std::string>(encode(json, options));
}

std::string formatted(const Number& number)
{
	return std::get<std::string>(format_number(number));
}

}

TEST_CASE("escaping")
{
	CHECK(escape("plain") == "plain");
	CHECK(escape(R"(a"b)") == R"(a\"b)");
	CHECK(escape(R"(a\b)") == R"(a\\b)");
	CHECK(escape("\b\f\n\r\t") == R"(\b\f\n\r\t)");
	CHECK(escape(std::string_view("a\0b", 3)) == R"(a\u0000b)");
	CHECK(escape("\x07") == R"(\u0007)");
	CHECK(escape("\x0b") == R"(\u000b)");
	CHECK(escape("\x1f") == R"(\u001f)");
	CHECK(escape("a/b") == "a/b");
	CHECK(escape("it's") == "it's");
	CHECK(escape("\x7f") == "\x7f");
	CHECK(escape("caf\xC3\xA9 \xF0\x9F\x8C\x8D") == "caf\xC3\xA9 \xF0\x9F\x8C\x8D");
}

TEST_CASE("number formatting")
{
	CHECK(formatted(Number{0.1}) == "0.1");
	CHECK(formatted(Number{-0.23456789012345}) == "-0.23456789012345");
	CHECK(formatted(Number{1.23456789012345}) == "1.23456789012345");
	CHECK(formatted(Number{1000.0}) == "1000");
	CHECK(formatted(Number{-1.0}) == "-1");
	CHECK(formatted(Number{0.0}) == "0");
	CHECK(formatted(Number{1.0}) == "1");
	CHECK(formatted(Number{-0.0}) == "-0");
	CHECK(formatted(Number{2.5e-3}) == "0.0025");
	CHECK(formatted(Number{1e20}) == "100000000000000000000");
	CHECK(formatted(Number{std::numeric_limits<std::int64_t>::max()}) == "9223372036854775807");

	for (std::int64_t i = -10; i < 10; ++i)
	{
		CAPTURE(i);
		CHECK(formatted(Number{i}) == std::to_string(i));
		CHECK(formatted(Number{static_cast<double>(i)}) == std::to_string(i));
	}

	CHECK(std::get<Err>(format_number(Number{std::nan("")})).code == Error::NonFiniteNumber);
	CHECK(std::get<Err>(format_number(Number{std::numeric_limits<double>::infinity()})).code == Error::NonFiniteNumber);
	CHECK(std::get<Err>(format_number(Number{-std::numeric_limits<double>::infinity()})).code == Error::NonFiniteNumber);
}

TEST_CASE("compact output")
{
	CHECK(text_of(null()) == "null");
	CHECK(text_of(True()) == "true");
	CHECK(text_of(False()) == "false");
	CHECK(text_of(Json{"a\tb"}) == R"("a\tb")");
	CHECK(text_of(Json{Array{}}) == "[]");
	CHECK(text_of(Json{Object{}}) == "{}");
	CHECK(text_of(Json{make_object(std::pair{std::string{"0.1"}, num(0.1)})}) == R"({"0.1":0.1})");
	CHECK(text_of(Json{make_array(num(1), num(1.1), num(0), num(-2))}) == "[1,1.1,0,-2]");
	CHECK(text_of(std::get<Json>(decode("[1, -1, 1.3, -1.3, 1e3, 1E-3]"))) == "[1,-1,1.3,-1.3,1000,0.001]");
	CHECK(text_of(Json{make_array(Json{"x"}, null(), Json{make_array()}, Json{make_object(
		std::pair{std::string{"k\"ey"}, Json{make_array(True(), num(2.5))}}
	)})}) == R"(["x",null,[],{"k\"ey":[true,2.5]}])");
}

TEST_CASE("pretty output")
{
	const WritingOptions pretty{.pretty_printed = true};

	CHECK(text_of(num(3), pretty) == "3");
	CHECK(text_of(Json{Array{}}, pretty) == "[\n  \n]");
	CHECK(text_of(Json{Object{}}, pretty) == "{\n  \n}");
	CHECK(text_of(Json{make_array(num(1), Json{make_array(num(2), num(3))})}, pretty) ==
		"[\n"
		"  1,\n"
		"  [\n"
		"    2,\n"
		"    3\n"
		"  ]\n"
		"]");
	CHECK(text_of(Json{make_object(std::pair{std::string{"a"}, Json{make_object(
		std::pair{std::string{"b"}, Json{Array{}}}
	)}})}, pretty) ==
		"{\n"
		"  \"a\": {\n"
		"    \"b\": [\n"
		"      \n"
		"    ]\n"
		"  }\n"
		"}");
}

TEST_CASE("unencodable trees")
{
	const auto error_of = [](const Json& json) {
		return std::get<Err>(encode(json)).code;
	};

	CHECK(error_of(num(std::numeric_limits<double>::quiet_NaN())) == Error::NonFiniteNumber);
	CHECK(error_of(Json{make_array(num(1), num(std::numeric_limits<double>::infinity()))}) == Error::NonFiniteNumber);
	CHECK(error_of(Json{std::string("\xC3\x28")}) == Error::EncodingError);
	CHECK(error_of(Json{make_object(std::pair{std::string("\xFF"), null()})}) == Error::EncodingError);
}

TEST_CASE("round trips")
{
	const std::string_view text = R"({"name":"café 🌍","tags":["a\/b","\u0001",""],"n":[0,-1,2.5,-0.000125,1e2],"ok":true,"none":null,"deep":[[{}],{"x":[]}]})";
	const Json original = std::get<Json>(decode(text));

	const Json compact = std::get<Json>(decode(text_of(original)));
	CHECK(compact == original);

	const std::string pretty = text_of(original, {.pretty_printed = true});
	const Json reparsed = std::get<Json>(decode(pretty));
	CHECK(reparsed == original);

	const Json list = std::get<Json>(decode(R"([1.5, [true, "x"], [], -3])"));
	const std::string indented = text_of(list, {.pretty_printed = true});
	CHECK(text_of(std::get<Json>(decode(indented)), {.pretty_printed = true}) == indented);
	CHECK(text_of(std::get<Json>(decode(indented))) == R"([1.5,[true,"x"],[],-3])");

	CHECK(*original.find("name")->as_string() == "caf\xC3\xA9 \xF0\x9F\x8C\x8D");
	CHECK(*original.find("tags")->at(0)->as_string() == "a/b");
	CHECK(*original.find("tags")->at(1)->as_string() == std::string("\x01"));
}

TEST_CASE("numbers compare by value")
{
	CHECK(Number{std::int64_t{2}} == Number{2.0});
	CHECK(Number{2.0} == Number{std::int64_t{2}});
	CHECK_FALSE(Number{2.5} == Number{std::int64_t{2}});
	CHECK_FALSE(Number{std::numeric_limits<std::int64_t>::max()} == Number{9223372036854775808.0});
	CHECK_FALSE(Number{std::int64_t{9007199254740993}} == Number{9007199254740992.0});
	CHECK(num(-7) == num(-7.0));

	CHECK(Number{std::int64_t{5}}.is_integer());
	CHECK_FALSE(Number{5.0}.is_integer());
	CHECK(Number{std::int64_t{5}}.as_integer() == 5);
	CHECK_FALSE(Number{5.0}.as_integer());
	CHECK(Number{std::int64_t{5}}.as_double() == 5.0);
	CHECK(Number{std::int64_t{5}}.is_finite());
	CHECK_FALSE(Number{std::numeric_limits<double>::infinity()}.is_finite());
}

TEST_CASE("tree access")
{
	const Json json = std::get<Json>(decode(R"({"a":[1,"two",null,false],"b":{"c":2.5}})"));

	REQUIRE(json.as_object() != nullptr);
	CHECK(json.as_array() == nullptr);
	CHECK(json.find("missing") == nullptr);
	CHECK(json.at(0) == nullptr);

	const Json* a = json.find("a");
	REQUIRE(a != nullptr);
	REQUIRE(a->as_array() != nullptr);
	CHECK(a->as_array()->size() == 4);
	CHECK(*a->at(0)->as_number() == Number{std::int64_t{1}});
	CHECK(*a->at(1)->as_string() == "two");
	CHECK(a->at(2)->is_null());
	CHECK(a->at(3)->as_bool() == false);
	CHECK(a->at(4) == nullptr);
	CHECK(a->find("a") == nullptr);
	CHECK_FALSE(a->at(1)->as_bool());
	CHECK(a->at(0)->as_string() == nullptr);

	CHECK(json.find("b")->find("c")->as_number()->as_double() == 2.5);

	const Json copy = clone(json);
	CHECK(copy == json);
	CHECK(copy.find("a") != json.find("a"));
}

TEST_CASE("stream adapters")
{
	std::istringstream in(R"( [1, {"a": "b"}] )");
	const Json json = std::get<Json>(decode(in));
	CHECK(json == Json{make_array(num(1), Json{make_object(std::pair{std::string{"a"}, Json{"b"}})})});

	std::istringstream wide(std::string("\xFF\xFE[\0]\0", 6));
	CHECK(std::get<Json>(decode(wide)) == Json{Array{}});

	std::istringstream broken("[]");
	broken.setstate(std::ios::failbit);
	CHECK(std::get<Err>(decode(broken)).code == Error::StreamError);

	std::ostringstream out;
	const auto written = write(Json{make_object(std::pair{std::string{"a"}, Json{make_object(
		std::pair{std::string{"b"}, num(1)}
	)}})}, out);
	CHECK(std::get<std::size_t>(written) == 13);
	CHECK(out.str() == R"({"a":{"b":1}})");

	std::ostringstream closed;
	closed.setstate(std::ios::badbit);
	CHECK(std::get<Err>(write(null(), closed)).code == Error::StreamError);

	std::ostringstream unwritten;
	CHECK(std::get<Err>(write(num(std::nan("")), unwritten)).code == Error::NonFiniteNumber);
	CHECK(unwritten.str().empty());
}

TEST_CASE("diagnostics")
{
	const auto printed = [](const auto& value) {
		std::ostringstream o;
		o << value;
		return o.str();
	};

	CHECK(printed(Encoding::Utf16LE) == "UTF-16LE");
	CHECK(printed(Encoding::Utf32BE) == "UTF-32BE");
	CHECK(printed(Error::MalformedArray) == "MalformedArray");
	CHECK(printed(Err{Error::MalformedArray, "badly formed array", 3}) == "MalformedArray: badly formed array at 3");
	CHECK(printed(Err{Error::StreamError, "input stream is not readable"}) == "StreamError: input stream is not readable");
	CHECK(printed(Json{make_array(num(1), Json{"a\"b"}, null())}) == R"([1, "a\"b", null])");

	const Err err = std::get<Err>(decode("[1 2]"));
	CHECK(printed(err) == "MalformedArray: badly formed array at 3");
}
