#include "tests.hpp"
#include "scanner.hpp"

using namespace utfjson;
using namespace utfjson::test;

namespace
{

Detected detect(std::vector<std::uint8_t> bytes)
{
	return detect_encoding(bytes);
}

}

TEST_CASE("byte order marks")
{
	CHECK(detect({0xEF, 0xBB, 0xBF, 0x7B, 0x7D}) == Detected{Encoding::Utf8, 3});
	CHECK(detect({0xFE, 0xFF, 0x00, 0x7B, 0x00, 0x7D}) == Detected{Encoding::Utf16BE, 2});
	CHECK(detect({0xFF, 0xFE, 0x7B, 0x00, 0x7D, 0x00}) == Detected{Encoding::Utf16LE, 2});
	CHECK(detect({0x00, 0x00, 0xFE, 0xFF, 0x00, 0x00, 0x00, 0x7B}) == Detected{Encoding::Utf32BE, 4});
	CHECK(detect({0xFF, 0xFE, 0x00, 0x00, 0x7B, 0x00, 0x00, 0x00}) == Detected{Encoding::Utf32LE, 4});
	CHECK(detect({0xFF, 0xFE, 0x00}) == Detected{Encoding::Utf16LE, 2});
	CHECK(detect({0xFE, 0xFF}) == Detected{Encoding::Utf16BE, 2});
	CHECK_FALSE(sniff_bom(std::vector<std::uint8_t>{0xEF, 0xBB}));
	CHECK_FALSE(sniff_bom(std::vector<std::uint8_t>{0x7B, 0x7D}));
}

TEST_CASE("encoding heuristic")
{
	CHECK(detect({0x7B, 0x7D}) == Detected{Encoding::Utf8, 0});
	CHECK(detect({0x00, 0x7B, 0x00, 0x7D}) == Detected{Encoding::Utf16BE, 0});
	CHECK(detect({0x7B, 0x00, 0x7D, 0x00}) == Detected{Encoding::Utf16LE, 0});
	CHECK(detect({0x00, 0x00, 0x00, 0x7B}) == Detected{Encoding::Utf32BE, 0});
	CHECK(detect({0x7B, 0x00, 0x00, 0x00}) == Detected{Encoding::Utf32LE, 0});
	CHECK(detect({0x00, 0x33}) == Detected{Encoding::Utf16BE, 0});
	CHECK(detect({0x33, 0x00}) == Detected{Encoding::Utf16LE, 0});
	CHECK(detect({0x00, 0x33, 0x00}) == Detected{Encoding::Utf16BE, 0});
	CHECK(detect({0x33}) == Detected{Encoding::Utf8, 0});
	CHECK(detect({}) == Detected{Encoding::Utf8, 0});
	CHECK(detect({0x5B, 0x31, 0x00, 0x00}) == Detected{Encoding::Utf8, 0});
}

TEST_CASE("ascii fast path")
{
	SECTION("utf-8")
	{
		const std::vector<std::uint8_t> bytes{0x7B, 0xC3, 0xA9};
		const Scanner src{bytes, Encoding::Utf8};
		CHECK(src.take_ascii(0) == std::pair<std::uint8_t, std::size_t>{0x7B, 1});
		CHECK_FALSE(src.take_ascii(1));
		CHECK_FALSE(src.take_ascii(3));
		CHECK(src.distance(3) == 3);
		CHECK(src.encoding() == Encoding::Utf8);
	}
	SECTION("utf-16")
	{
		const auto be = encoded(U"{é", Encoding::Utf16BE);
		const Scanner big{be, Encoding::Utf16BE};
		CHECK(big.take_ascii(0) == std::pair<std::uint8_t, std::size_t>{'{', 2});
		CHECK_FALSE(big.take_ascii(2));

		const auto le = encoded(U"{Ā", Encoding::Utf16LE);
		const Scanner little{le, Encoding::Utf16LE};
		CHECK(little.take_ascii(0) == std::pair<std::uint8_t, std::size_t>{'{', 2});
		CHECK_FALSE(little.take_ascii(2));
		CHECK(little.step() == 2);
		CHECK(little.distance(4) == 2);
	}
	SECTION("utf-32")
	{
		const auto be = encoded(U"[\U0001D11E]", Encoding::Utf32BE);
		const Scanner src{be, Encoding::Utf32BE};
		CHECK(src.take_ascii(0) == std::pair<std::uint8_t, std::size_t>{'[', 4});
		CHECK_FALSE(src.take_ascii(4));
		CHECK(src.take_ascii(8) == std::pair<std::uint8_t, std::size_t>{']', 12});
		CHECK_FALSE(src.take_ascii(12));
		CHECK(src.distance(8) == 2);
	}
	SECTION("a partial trailing unit is not readable")
	{
		const std::vector<std::uint8_t> bytes{0x00, 0x7B, 0x00};
		const Scanner src{bytes, Encoding::Utf16BE};
		CHECK(src.has_next(0));
		CHECK_FALSE(src.has_next(2));
		CHECK_FALSE(src.take_ascii(2));
	}
}

TEST_CASE("span decoding")
{
	const auto decoded = [](const std::vector<std::uint8_t>& bytes, Encoding encoding) {
		const Scanner src{bytes, encoding};
		return src.decode_span(0, bytes.size());
	};
	const std::u32string text = U"héllo € \U0001F30D";
	const std::string utf8 = "h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x8C\x8D";

	for (const auto encoding: {Encoding::Utf8, Encoding::Utf16BE, Encoding::Utf16LE, Encoding::Utf32BE, Encoding::Utf32LE})
	{
		CAPTURE(encoding);
		CHECK(std::get<std::string>(decoded(encoded(text, encoding), encoding)) == utf8);
	}

	CHECK(std::get<Err>(decoded({0xC3, 0x28}, Encoding::Utf8)).code == Error::EncodingError);
	CHECK(std::get<Err>(decoded({0xC0, 0xAF}, Encoding::Utf8)).code == Error::EncodingError);
	CHECK(std::get<Err>(decoded({0xED, 0xA0, 0x80}, Encoding::Utf8)).code == Error::EncodingError);
	CHECK(std::get<Err>(decoded({0xD8, 0x34, 0x00, 0x41}, Encoding::Utf16BE)).code == Error::EncodingError);
	CHECK(std::get<Err>(decoded({0x1E, 0xDD}, Encoding::Utf16LE)).code == Error::EncodingError);
	CHECK(std::get<Err>(decoded({0x00, 0x11, 0x00, 0x00}, Encoding::Utf32BE)).code == Error::EncodingError);
}

TEST_CASE("documents in every encoding")
{
	const std::u32string text = U"{ \"hello\": \"world\", \"swift\": \"rocks\", \"clef\": \"\U0001D11E\" }";
	for (const auto encoding: {Encoding::Utf8, Encoding::Utf16BE, Encoding::Utf16LE, Encoding::Utf32BE, Encoding::Utf32LE})
	{
		for (const bool bom: {false, true})
		{
			CAPTURE(encoding, bom);
			const auto bytes = encoded(text, encoding, bom);
			OK(bytes, (Json{make_object(
				std::pair{std::string{"hello"}, Json{"world"}},
				std::pair{std::string{"swift"}, Json{"rocks"}},
				std::pair{std::string{"clef"}, Json{"\U0001D11E"}}
			)}));
		}
	}
}

TEST_CASE("empty containers in every encoding")
{
	const std::vector<std::vector<std::uint8_t>> objects{
		{0xEF, 0xBB, 0xBF, 0x7B, 0x7D},
		{0xFE, 0xFF, 0x00, 0x7B, 0x00, 0x7D},
		{0xFF, 0xFE, 0x7B, 0x00, 0x7D, 0x00},
		{0x00, 0x00, 0xFE, 0xFF, 0x00, 0x00, 0x00, 0x7B, 0x00, 0x00, 0x00, 0x7D},
		{0xFF, 0xFE, 0x00, 0x00, 0x7B, 0x00, 0x00, 0x00, 0x7D, 0x00, 0x00, 0x00},
		{0x7B, 0x7D},
		{0x00, 0x7B, 0x00, 0x7D},
		{0x7B, 0x00, 0x7D, 0x00},
		{0x00, 0x00, 0x00, 0x7B, 0x00, 0x00, 0x00, 0x7D},
		{0x7B, 0x00, 0x00, 0x00, 0x7D, 0x00, 0x00, 0x00},
	};
	for (const auto& bytes: objects)
	{
		OK(bytes, (Json{Object{}}));
	}

	OK(encoded(U"[]", Encoding::Utf16LE), (Json{Array{}}));
	OK(encoded(U"[ 1, 2.5, true ]", Encoding::Utf32BE), (Json{make_array(num(1), num(2.5), True())}));
}

TEST_CASE("wide fragments")
{
	const auto fragment = [](const std::vector<std::uint8_t>& bytes) {
		return decode(bytes, {.allow_fragments = true});
	};
	CHECK(std::get<Json>(fragment({0x00, 0x33})) == num(3));
	CHECK(std::get<Json>(fragment({0x33, 0x00})) == num(3));
	CHECK(std::get<Json>(fragment(encoded(U"-12.5e1", Encoding::Utf16BE))) == num(-125));
	CHECK(std::get<Json>(fragment(encoded(U"\"\\u00e9\\n\"", Encoding::Utf32LE))) == Json{"é\n"});
}

TEST_CASE("invalid wide text")
{
	// Lone trail surrogate inside a UTF-16 string.
	const std::vector<std::uint8_t> bytes{0x00, 0x5B, 0x00, 0x22, 0xDC, 0x00, 0x00, 0x22, 0x00, 0x5D};
	FAILS(bytes, Error::EncodingError);

	// A stray byte after the last complete code unit.
	const std::vector<std::uint8_t> odd_object{0x00, 0x7B, 0x00, 0x7D, 0x41};
	FAILS(odd_object, Error::EncodingError);
	const std::vector<std::uint8_t> odd_array{0x00, 0x5B, 0x00, 0x31, 0x00, 0x5D, 0xFF};
	FAILS(odd_array, Error::EncodingError);

	auto padded = encoded(U"[1] ", Encoding::Utf32LE);
	padded.push_back(0x20);
	padded.push_back(0x00);
	const auto err = std::get<Err>(decode(padded));
	CHECK(err.code == Error::EncodingError);
	CHECK(err.offset == 4);

	auto trailing = encoded(U"[] x", Encoding::Utf16LE);
	trailing.push_back(0x00);
	CHECK(std::get<Err>(decode(trailing)).code == Error::TrailingGarbage);
}
