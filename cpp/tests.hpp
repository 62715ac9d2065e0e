#pragma once

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "encoding.hpp"
#include "json.hpp"
#include "matching.hpp"

namespace utfjson::test
{

template <typename ...Jsons>
Array make_array(Jsons&&... jsons)
{
	Array arr;
	arr.reserve(sizeof...(jsons));
	(arr.push_back(std::forward<Jsons>(jsons)), ...);
	return arr;
}

template <typename ...Jsons>
Object make_object(std::pair<std::string, Jsons>&&... kvs)
{
	Object obj;
	(obj.insert(std::forward<std::pair<std::string, Jsons>>(kvs)), ...);
	return obj;
}

template <typename T>
Json num(T value)
{
	return Json{Number{value}};
}

// `text` in `encoding`, optionally preceded by its byte-order mark.
inline std::vector<std::uint8_t> encoded(std::u32string_view text, Encoding encoding, bool bom = false)
{
	std::vector<std::uint8_t> out;
	const auto unit16 = [&](char32_t u){
		if (encoding == Encoding::Utf16BE)
		{
			out.push_back(static_cast<std::uint8_t>(u >> 8));
			out.push_back(static_cast<std::uint8_t>(u & 0xFF));
		}
		else
		{
			out.push_back(static_cast<std::uint8_t>(u & 0xFF));
			out.push_back(static_cast<std::uint8_t>(u >> 8));
		}
	};
	const auto unit32 = [&](char32_t u){
		for (int k = 0; k < 4; ++k)
		{
			const int shift = encoding == Encoding::Utf32BE ? 24 - 8 * k : 8 * k;
			out.push_back(static_cast<std::uint8_t>((u >> shift) & 0xFF));
		}
	};
	const auto put = [&](char32_t cp){
		switch (encoding)
		{
			case Encoding::Utf8:
			{
				std::string s;
				append_utf8(s, cp);
				out.insert(out.end(), s.begin(), s.end());
				break;
			}
			case Encoding::Utf16BE:
			case Encoding::Utf16LE:
				if (cp > 0xFFFF)
				{
					unit16(0xD800 + ((cp - 0x10000) >> 10));
					unit16(0xDC00 + ((cp - 0x10000) & 0x3FF));
				}
				else unit16(cp);
				break;
			case Encoding::Utf32BE:
			case Encoding::Utf32LE:
				unit32(cp);
				break;
		}
	};
	if (bom) put(0xFEFF);
	for (const char32_t cp: text) put(cp);
	return out;
}

}

#define FAILS(arg, expected_error) \
	::utfjson::match(::utfjson::decode(arg), \
		[](::utfjson::Json&& actual_json){ \
			CAPTURE(actual_json, expected_error); \
			CHECK(false); \
		}, \
		[](::utfjson::Err&& actual_error){ \
			CAPTURE(actual_error); \
			CHECK(expected_error == actual_error.code); \
		})

#define OK(arg, expected_json) \
	::utfjson::match(::utfjson::decode(arg), \
		[](::utfjson::Json&& actual_json){ \
			CHECK(actual_json == expected_json); \
		}, \
		[](::utfjson::Err&& actual_error){ \
			CAPTURE(actual_error, expected_json); \
			CHECK(false); \
		})
