#include "encoding.hpp"

#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <stdexcept>

namespace utfjson
{

namespace
{

bool is_lead_surrogate(char32_t cp)
{
	return cp >= 0xD800 and cp <= 0xDBFF;
}

bool is_trail_surrogate(char32_t cp)
{
	return cp >= 0xDC00 and cp <= 0xDFFF;
}

bool is_scalar(char32_t cp)
{
	return cp <= 0x10FFFF and not (cp >= 0xD800 and cp <= 0xDFFF);
}

bool is_continuation(std::uint8_t byte)
{
	return (byte & 0xC0) == 0x80;
}

// Decodes one UTF-8 sequence at `i`, advancing past it. Rejects overlong
// forms, surrogates and values above U+10FFFF.
auto next_utf8(std::span<const std::uint8_t> bytes, std::size_t& i) -> std::optional<char32_t>
{
	const std::uint8_t lead = bytes[i];
	std::size_t length;
	char32_t cp;
	char32_t min;
	switch (lead)
	{
		case 0x00 ... 0x7F: ++i; return lead;
		case 0xC2 ... 0xDF: length = 2; cp = lead & 0x1F; min = 0x80; break;
		case 0xE0 ... 0xEF: length = 3; cp = lead & 0x0F; min = 0x800; break;
		case 0xF0 ... 0xF4: length = 4; cp = lead & 0x07; min = 0x10000; break;
		default: return std::nullopt;
	}
	if (bytes.size() - i < length) return std::nullopt;
	for (std::size_t k = 1; k < length; ++k)
	{
		if (not is_continuation(bytes[i + k])) return std::nullopt;
		cp = (cp << 6) | (bytes[i + k] & 0x3F);
	}
	if (cp < min or not is_scalar(cp)) return std::nullopt;
	i += length;
	return cp;
}

char32_t unit16(std::span<const std::uint8_t> bytes, std::size_t i, bool big_endian)
{
	return big_endian
		? (char32_t(bytes[i]) << 8) | bytes[i + 1]
		: (char32_t(bytes[i + 1]) << 8) | bytes[i];
}

char32_t unit32(std::span<const std::uint8_t> bytes, std::size_t i, bool big_endian)
{
	return big_endian
		? (char32_t(bytes[i]) << 24) | (char32_t(bytes[i + 1]) << 16) | (char32_t(bytes[i + 2]) << 8) | bytes[i + 3]
		: (char32_t(bytes[i + 3]) << 24) | (char32_t(bytes[i + 2]) << 16) | (char32_t(bytes[i + 1]) << 8) | bytes[i];
}

auto transcode_utf8(std::span<const std::uint8_t> bytes) -> std::optional<std::string>
{
	std::size_t i = 0;
	while (i < bytes.size())
	{
		if (not next_utf8(bytes, i)) return std::nullopt;
	}
	return std::string(bytes.begin(), bytes.end());
}

auto transcode_utf16(std::span<const std::uint8_t> bytes, bool big_endian) -> std::optional<std::string>
{
	if (bytes.size() % 2 != 0) return std::nullopt;
	std::string out;
	out.reserve(bytes.size());
	for (std::size_t i = 0; i < bytes.size(); i += 2)
	{
		const char32_t unit = unit16(bytes, i, big_endian);
		if (is_trail_surrogate(unit)) return std::nullopt;
		if (not is_lead_surrogate(unit))
		{
			append_utf8(out, unit);
			continue;
		}
		if (i + 4 > bytes.size()) return std::nullopt;
		const char32_t trail = unit16(bytes, i + 2, big_endian);
		if (not is_trail_surrogate(trail)) return std::nullopt;
		append_utf8(out, ((unit - 0xD800) << 10) + (trail - 0xDC00) + 0x10000);
		i += 2;
	}
	return out;
}

auto transcode_utf32(std::span<const std::uint8_t> bytes, bool big_endian) -> std::optional<std::string>
{
	if (bytes.size() % 4 != 0) return std::nullopt;
	std::string out;
	out.reserve(bytes.size() / 2);
	for (std::size_t i = 0; i < bytes.size(); i += 4)
	{
		const char32_t cp = unit32(bytes, i, big_endian);
		if (not is_scalar(cp)) return std::nullopt;
		append_utf8(out, cp);
	}
	return out;
}

}

auto sniff_bom(std::span<const std::uint8_t> bytes) -> std::optional<Detected>
{
	const auto starts_with = [&](std::initializer_list<std::uint8_t> mark){
		return bytes.size() >= mark.size() and std::equal(mark.begin(), mark.end(), bytes.begin());
	};
	// Four byte marks first: FF FE also prefixes the UTF-32LE mark.
	if (starts_with({0x00, 0x00, 0xFE, 0xFF})) return Detected{Encoding::Utf32BE, 4};
	if (starts_with({0xFF, 0xFE, 0x00, 0x00})) return Detected{Encoding::Utf32LE, 4};
	if (starts_with({0xEF, 0xBB, 0xBF})) return Detected{Encoding::Utf8, 3};
	if (starts_with({0xFE, 0xFF})) return Detected{Encoding::Utf16BE, 2};
	if (starts_with({0xFF, 0xFE})) return Detected{Encoding::Utf16LE, 2};
	return std::nullopt;
}

auto guess_encoding(std::span<const std::uint8_t> b) -> Encoding
{
	if (b.size() >= 4)
	{
		if (b[0] == 0 and b[1] == 0 and b[2] == 0) return Encoding::Utf32BE;
		if (b[1] == 0 and b[2] == 0 and b[3] == 0) return Encoding::Utf32LE;
		if (b[0] == 0 and b[2] == 0) return Encoding::Utf16BE;
		if (b[1] == 0 and b[3] == 0) return Encoding::Utf16LE;
	}
	else if (b.size() >= 2)
	{
		if (b[0] == 0) return Encoding::Utf16BE;
		if (b[1] == 0) return Encoding::Utf16LE;
	}
	return Encoding::Utf8;
}

auto detect_encoding(std::span<const std::uint8_t> bytes) -> Detected
{
	if (auto bom = sniff_bom(bytes)) return *bom;
	return Detected{guess_encoding(bytes), 0};
}

auto transcode(std::span<const std::uint8_t> bytes, Encoding encoding) -> std::optional<std::string>
{
	switch (encoding)
	{
		case Encoding::Utf8: return transcode_utf8(bytes);
		case Encoding::Utf16BE: return transcode_utf16(bytes, true);
		case Encoding::Utf16LE: return transcode_utf16(bytes, false);
		case Encoding::Utf32BE: return transcode_utf32(bytes, true);
		case Encoding::Utf32LE: return transcode_utf32(bytes, false);
	}
	throw std::runtime_error("Invalid Encoding value");
}

bool is_valid_utf8(std::string_view s)
{
	const std::span<const std::uint8_t> bytes{reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
	std::size_t i = 0;
	while (i < bytes.size())
	{
		if (not next_utf8(bytes, i)) return false;
	}
	return true;
}

void append_utf8(std::string& out, char32_t cp)
{
	if (cp <= 0x7F)
	{
		out.push_back(static_cast<char>(cp));
	}
	else if (cp <= 0x7FF)
	{
		out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
	else if (cp <= 0xFFFF)
	{
		out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
	else
	{
		out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
}

std::ostream& operator<<(std::ostream& o, Encoding encoding)
{
	switch (encoding)
	{
		case Encoding::Utf8: return o << "UTF-8";
		case Encoding::Utf16BE: return o << "UTF-16BE";
		case Encoding::Utf16LE: return o << "UTF-16LE";
		case Encoding::Utf32BE: return o << "UTF-32BE";
		case Encoding::Utf32LE: return o << "UTF-32LE";
	}
	throw std::runtime_error("Invalid Encoding value");
}

}
