#include "tests.hpp"
#include "reader.hpp"

#include <cmath>
#include <limits>

using namespace utfjson;
using namespace utfjson::test;

TEST_CASE("basic cases")
{
	FAILS("", Error::UnexpectedEndOfInput);
	FAILS("x", Error::NotArrayOrObject);
	FAILS("3", Error::NotArrayOrObject);
	FAILS("\"str\"", Error::NotArrayOrObject);
	OK("{}", (Json{Object{}}));
	OK("[]", (Json{Array{}}));
	FAILS("{} x", Error::TrailingGarbage);
	FAILS("[][]", Error::TrailingGarbage);
}

TEST_CASE("literals")
{
	OK("[null]", (Json{make_array(null())}));
	OK("[true]", (Json{make_array(True())}));
	OK("[false]", (Json{make_array(False())}));
	FAILS("[truefalse]", Error::MalformedArray);
	FAILS("[nul]", Error::MalformedArray);
	FAILS("[tru", Error::UnexpectedEndOfInput);
	FAILS("[TRUE]", Error::MalformedArray);
}

TEST_CASE("numbers")
{
	OK("[42]", (Json{make_array(num(42))}));
	OK("[0]", (Json{make_array(num(0))}));
	OK("[-1]", (Json{make_array(num(-1))}));
	OK("[1.23]", (Json{make_array(num(1.23))}));
	OK("[6.999e3]", (Json{make_array(num(6999))}));
	OK("[-1.2e9]", (Json{make_array(num(-1200000000))}));
	OK("[9.8E-1]", (Json{make_array(num(0.98))}));
	OK("[-9223372036854775808]", (Json{make_array(num(std::numeric_limits<std::int64_t>::min()))}));
	OK("[1, -1, 1.3, -1.3, 1e3, 1E-3]", (Json{make_array(
		num(1), num(-1), num(1.3), num(-1.3), num(1000), num(0.001)
	)}));
	FAILS("[2b4]", Error::MalformedArray);
	FAILS("[.x]", Error::MalformedArray);
	FAILS("[-]", Error::MalformedArray);
	FAILS("[1e400]", Error::InvalidNumber);
	FAILS("[-1e400]", Error::InvalidNumber);
	OK("[1e-400]", (Json{make_array(num(0.0))}));
	OK("[-1e-400, 1E-999]", (Json{make_array(num(0.0), num(0.0))}));
}

TEST_CASE("integer and floating scans")
{
	const auto number_at = [](std::string_view text) -> std::optional<std::pair<Number, std::size_t>> {
		const Scanner src{std::span{reinterpret_cast<const std::uint8_t*>(text.data()), text.size()}, Encoding::Utf8};
		auto r = parse_number(src, 0);
		if (auto* parsed = std::get_if<Ok<Number>>(&r)) return *parsed;
		return std::nullopt;
	};

	SECTION("same length keeps the integer")
	{
		const auto r = number_at("1234,");
		REQUIRE(r);
		CHECK(r->first.is_integer());
		CHECK(r->first.as_integer() == 1234);
		CHECK(r->second == 4);
	}
	SECTION("longer floating span keeps the double")
	{
		const auto r = number_at("12.5]");
		REQUIRE(r);
		CHECK(not r->first.is_integer());
		CHECK(r->first.as_double() == 12.5);
		CHECK(r->second == 4);
	}
	SECTION("exponent makes a double")
	{
		const auto r = number_at("2e2");
		REQUIRE(r);
		CHECK(not r->first.is_integer());
		CHECK(r->first == Number{200});
	}
	SECTION("integer overflow falls back to the double")
	{
		const auto r = number_at("99999999999999999999");
		REQUIRE(r);
		CHECK(not r->first.is_integer());
		CHECK(r->first.as_double() == 1e20);
	}
	SECTION("underflow reads as a signed zero")
	{
		const auto r = number_at("-1e-400]");
		REQUIRE(r);
		CHECK(r->first.as_double() == 0.0);
		CHECK(std::signbit(r->first.as_double()));
		CHECK(r->second == 7);
		CHECK_FALSE(std::signbit(number_at("1e-400")->first.as_double()));
	}
	SECTION("stops at the first character the scans reject")
	{
		const auto r = number_at("1.5.3");
		REQUIRE(r);
		CHECK(r->first.as_double() == 1.5);
		CHECK(r->second == 3);
	}
	SECTION("no number characters is no match")
	{
		CHECK_FALSE(number_at("x"));
		CHECK_FALSE(number_at(""));
		CHECK_FALSE(number_at("-"));
	}
}

TEST_CASE("strings")
{
	OK(R"([""])", (Json{make_array(Json{""})}));
	OK(R"(["foobar"])", (Json{make_array(Json{"foobar"})}));
	OK(R"(["a\nb"])", (Json{make_array(Json{"a\nb"})}));
	OK(R"(["foo\\bar"])", (Json{make_array(Json{R"(foo\bar)"})}));
	OK(R"(["foo\/bar"])", (Json{make_array(Json{"foo/bar"})}));
	OK(R"(["foo\"bar"])", (Json{make_array(Json{R"(foo"bar)"})}));
	OK(R"([" a b c "])", (Json{make_array(Json{" a b c "})}));
	OK(R"(["\"", "\\", "\/", "\b", "\f", "\n", "\r", "\t"])", (Json{make_array(
		Json{"\""}, Json{"\\"}, Json{"/"}, Json{"\b"}, Json{"\f"}, Json{"\n"}, Json{"\r"}, Json{"\t"}
	)}));
	OK(R"(["\u2728"])", (Json{make_array(Json{"✨"})}));
	OK(R"(["\u00e9\u00E9"])", (Json{make_array(Json{"éé"})}));
	OK(R"(["foo\u0041bar"])", (Json{make_array(Json{"fooAbar"})}));
	OK("[\"swift\xE2\x9A\xA1\"]", (Json{make_array(Json{"swift⚡"})}));
	OK("[\"unicode\", \"\xC4\xA2\", \"\xF0\x9F\x98\xA2\"]", (Json{make_array(
		Json{"unicode"}, Json{"Ģ"}, Json{"\U0001F622"}
	)}));
	OK("{\"title\" : \" hello world!!\" }", (Json{make_object(
		std::pair{std::string{"title"}, Json{" hello world!!"}}
	)}));
	FAILS(R"(["foobar)", Error::UnexpectedEndOfInput);
	FAILS(R"(["foo\"bar)", Error::UnexpectedEndOfInput);
	FAILS(R"({"})", Error::UnexpectedEndOfInput);
	FAILS(R"(["\)", Error::UnexpectedEndOfInput);
	FAILS(R"(["\e"])", Error::InvalidEscapeSequence);
	FAILS(R"(["\u12cx"])", Error::InvalidEscapeSequence);
	FAILS(R"(["\u12"])", Error::InvalidEscapeSequence);
	FAILS(R"(["\u)", Error::UnexpectedEndOfInput);
	FAILS(R"(["\u00)", Error::UnexpectedEndOfInput);
	FAILS("[\"\xC3\x28\"]", Error::EncodingError);
}

TEST_CASE("surrogate pairs")
{
	OK(R"(["\uD834\uDD1E"])", (Json{make_array(Json{"\U0001D11E"})}));
	OK(R"(["\uD834\udd1E"])", (Json{make_array(Json{"\U0001D11E"})}));
	OK(R"(["a\uD83D\uDE03b"])", (Json{make_array(Json{"a\U0001F603b"})}));
	CHECK(std::get<Json>(decode(R"("\uD834\uDD1E")", {.allow_fragments = true})) == Json{"\U0001D11E"});
	FAILS(R"(["\uD834"])", Error::MissingSurrogatePair);
	FAILS(R"(["\uD834x"])", Error::MissingSurrogatePair);
	FAILS(R"(["\uD834\n"])", Error::MissingSurrogatePair);
	FAILS(R"(["\uD834\u0041"])", Error::MissingSurrogatePair);
	FAILS(R"(["\uDD1E"])", Error::MissingSurrogatePair);
	FAILS(R"(["\uD834)", Error::UnexpectedEndOfInput);
	FAILS(R"(["\uD834\)", Error::UnexpectedEndOfInput);
	FAILS(R"(["\uD834\uDD)", Error::UnexpectedEndOfInput);
}

TEST_CASE("arrays")
{
	OK(R"([[null]])", (Json{make_array(Json{make_array(null())})}));
	OK(R"([true,false])", (Json{make_array(True(), False())}));
	OK(R"([[[]]])", (Json{make_array(Json{make_array(Json{make_array()})})}));
	OK(R"([[["a"]]])", (Json{make_array(Json{make_array(Json{make_array(Json{"a"})})})}));
	OK(R"([1,2,3])", (Json{make_array(num(1), num(2), num(3))}));
	OK(R"([true, false, "hello", null, {}, []])", (Json{make_array(
		True(), False(), Json{"hello"}, null(), Json{Object{}}, Json{Array{}}
	)}));
	OK(R"([[],[]])", (Json{make_array(Json{make_array()}, Json{make_array()})}));
	FAILS(R"([)", Error::UnexpectedEndOfInput);
	FAILS(R"([[[)", Error::UnexpectedEndOfInput);
	FAILS(R"(])", Error::NotArrayOrObject);
	FAILS(R"(["])", Error::UnexpectedEndOfInput);
	FAILS(R"([,)", Error::MalformedArray);
	FAILS(R"([1 2])", Error::MalformedArray);
	FAILS(R"([1,])", Error::MalformedArray);
	FAILS(R"([1,2,])", Error::MalformedArray);
	FAILS(R"([1,)", Error::UnexpectedEndOfInput);
	FAILS(R"([1)", Error::UnexpectedEndOfInput);
}

TEST_CASE("objects")
{
	OK(R"({"1":1})", (Json{make_object(
		std::pair{std::string{"1"}, num(1)}
	)}));
	OK(R"({"":""})", (Json{make_object(
		std::pair{std::string{""}, Json{""}}
	)}));
	OK(R"({"12":[]})", (Json{make_object(
		std::pair{std::string{"12"}, Json{make_array()}}
	)}));
	OK(R"({"a":1,"b":2,"c":3})", (Json{make_object(
		std::pair{std::string{"a"}, num(1)},
		std::pair{std::string{"b"}, num(2)},
		std::pair{std::string{"c"}, num(3)}
	)}));
	OK(R"({ "hello": "world", "swift": "rocks" })", (Json{make_object(
		std::pair{std::string{"hello"}, Json{"world"}},
		std::pair{std::string{"swift"}, Json{"rocks"}}
	)}));
	OK(R"({"a":1,"a":2})", (Json{make_object(
		std::pair{std::string{"a"}, num(2)}
	)}));
	FAILS(R"({)", Error::UnexpectedEndOfInput);
	FAILS(R"({"1":1)", Error::UnexpectedEndOfInput);
	FAILS(R"({"foo")", Error::UnexpectedEndOfInput);
	FAILS(R"({3})", Error::MissingObjectKey);
	FAILS(R"({a:1})", Error::MissingObjectKey);
	FAILS(R"({"a":1,})", Error::MissingObjectKey);
	FAILS(R"({"missing";})", Error::InvalidSeparator);
	FAILS(R"({"a" 1})", Error::InvalidSeparator);
	FAILS(R"({"a":})", Error::InvalidValue);
	FAILS(R"({"error":})", Error::InvalidValue);
	FAILS(R"({"a":1 "b":2})", Error::MalformedObject);
	FAILS(R"({"a":1]})", Error::MalformedObject);
}

TEST_CASE("values with spaces")
{
	FAILS("   ", Error::UnexpectedEndOfInput);
	FAILS(" [  ", Error::UnexpectedEndOfInput);
	OK("\t\r\n [ true , false , null ] \n", (Json{make_array(True(), False(), null())}));
	OK(R"( { "a" : true , "b" : false , "c" : null } )", (Json{make_object(
		std::pair{std::string{"a"}, True()},
		std::pair{std::string{"b"}, False()},
		std::pair{std::string{"c"}, null()}
	)}));
	OK(R"( {  } )", (Json{Object{}}));
	OK(R"( [  ] )", (Json{Array{}}));
	OK(R"([" \u1234 "])", (Json{make_array(Json{" ሴ "})}));
}

TEST_CASE("fragments")
{
	const ReadingOptions fragments{.allow_fragments = true};
	const auto fragment = [&](std::string_view text) {
		return decode(text, fragments);
	};

	CHECK(std::get<Json>(fragment("3")) == num(3));
	CHECK(std::get<Json>(fragment(" 3 ")) == num(3));
	CHECK(std::get<Json>(fragment("-0.5")) == num(-0.5));
	CHECK(std::get<Json>(fragment("\"str\"")) == Json{"str"});
	CHECK(std::get<Json>(fragment("true")) == True());
	CHECK(std::get<Json>(fragment("null")) == null());
	CHECK(std::get<Json>(fragment("{}")) == Json{Object{}});
	CHECK(std::get<Err>(fragment("3 4")).code == Error::TrailingGarbage);
	CHECK(std::get<Err>(fragment("x")).code == Error::InvalidValue);
	CHECK(std::get<Err>(fragment("")).code == Error::UnexpectedEndOfInput);

	// Only the bytes handed over are read.
	const std::string_view digits = "12345679";
	CHECK(std::get<Json>(fragment(digits.substr(0, 1))) == num(1));
}

TEST_CASE("nesting depth")
{
	const std::string deep = std::string(600, '[') + std::string(600, ']');
	FAILS(deep, Error::NestingTooDeep);

	CHECK(std::holds_alternative<Json>(decode("[[[]]]", {.max_depth = 3})));
	CHECK(std::get<Err>(decode("[[[]]]", {.max_depth = 2})).code == Error::NestingTooDeep);
	CHECK(std::get<Err>(decode(R"({"a":{"b":{}}})", {.max_depth = 2})).code == Error::NestingTooDeep);
}

TEST_CASE("error offsets")
{
	const auto offset_of = [](auto&& bytes) {
		return std::get<Err>(decode(bytes)).offset;
	};

	CHECK(offset_of(R"({3})") == 1);
	CHECK(offset_of(R"({"a" 1})") == 5);
	CHECK(offset_of(R"(["a", "\e"])") == 7);
	CHECK(offset_of("[1 2]") == 3);
	CHECK(offset_of(encoded(U"[1 2]", Encoding::Utf16BE)) == 3);
	CHECK(offset_of(encoded(U"[1 2]", Encoding::Utf32LE, true)) == 3);
}
