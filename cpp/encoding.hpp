#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace utfjson
{

enum class Encoding
{
	Utf8,
	Utf16BE,
	Utf16LE,
	Utf32BE,
	Utf32LE,
};

struct Detected
{
	Encoding encoding;
	// Bytes of byte-order mark to skip before the text starts.
	std::size_t bom_length;

	bool operator==(const Detected&) const = default;
};

// Width in bytes of one code unit.
constexpr std::size_t step_width(Encoding encoding)
{
	switch (encoding)
	{
		case Encoding::Utf8: return 1;
		case Encoding::Utf16BE:
		case Encoding::Utf16LE: return 2;
		case Encoding::Utf32BE:
		case Encoding::Utf32LE: return 4;
	}
	return 1;
}

auto sniff_bom(std::span<const std::uint8_t> bytes) -> std::optional<Detected>;

// Guesses from the zero bytes the first (ASCII) character leaves under wide encodings.
auto guess_encoding(std::span<const std::uint8_t> bytes) -> Encoding;

// BOM first, heuristic otherwise. Only the first four bytes are inspected.
auto detect_encoding(std::span<const std::uint8_t> bytes) -> Detected;

// Converts text in `encoding` to UTF-8; nullopt when the bytes are not valid for it.
auto transcode(std::span<const std::uint8_t> bytes, Encoding encoding) -> std::optional<std::string>;

bool is_valid_utf8(std::string_view s);

void append_utf8(std::string& out, char32_t cp);

std::ostream& operator<<(std::ostream& o, Encoding encoding);

}
