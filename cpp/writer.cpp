#include <array>
#include <charconv>
#include <system_error>
#include <utility>

#include "writer.hpp"
#include "encoding.hpp"
#include "matching.hpp"

namespace utfjson
{

auto escape(std::string_view str) -> std::string
{
	static constexpr char hex[] = "0123456789abcdef";
	std::string buf;
	buf.reserve(str.length());
	for (const char ch: str)
	{
		switch (ch)
		{
			case '\"': buf += "\\\""; break;
			case '\\': buf += "\\\\"; break;
			case '\b': buf += "\\b"; break;
			case '\f': buf += "\\f"; break;
			case '\n': buf += "\\n"; break;
			case '\r': buf += "\\r"; break;
			case '\t': buf += "\\t"; break;
			case '\x00' ... '\x07':
			case '\x0b':
			case '\x0e' ... '\x1f':
				buf += "\\u00";
				buf += hex[(ch >> 4) & 0xF];
				buf += hex[ch & 0xF];
				break;
			default: buf += ch;
		}
	}
	return buf;
}

auto format_number(const Number& number) -> std::variant<std::string, Err>
{
	// Fixed notation of DBL_MAX is 309 integral digits.
	std::array<char, 400> buf;
	if (const auto integer = number.as_integer())
	{
		const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), *integer);
		return std::string(buf.data(), end);
	}

	if (not number.is_finite())
	{
		return Err{Error::NonFiniteNumber, "number cannot be infinity or NaN"};
	}
	const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), number.as_double(), std::chars_format::fixed, 15);
	if (ec != std::errc{})
	{
		return Err{Error::NonFiniteNumber, "number cannot be formatted"};
	}
	std::string text(buf.data(), end);
	const auto point = text.find('.');
	if (point != std::string::npos)
	{
		const auto last = text.find_last_not_of('0');
		text.erase(last == point ? point : last + 1);
	}
	return text;
}

Writer::Writer(std::string& out, bool pretty)
	: out_(out)
	, pretty_(pretty)
{
}

auto Writer::write(const Json& json) -> std::optional<Err>
{
	return match(json.value,
		[&](const Null&) -> std::optional<Err> {
			out_ += "null";
			return std::nullopt;
		},
		[&](bool b) -> std::optional<Err> {
			out_ += b ? "true" : "false";
			return std::nullopt;
		},
		[&](const Number& number) {
			return write_number(number);
		},
		[&](const std::string& str) {
			return write_string(str);
		},
		[&](const Array& array) {
			return write_array(array);
		},
		[&](const Object& object) {
			return write_object(object);
		});
}

auto Writer::write_string(const std::string& str) -> std::optional<Err>
{
	if (not is_valid_utf8(str))
	{
		return Err{Error::EncodingError, "string is not valid UTF-8"};
	}
	out_ += '"';
	out_ += escape(str);
	out_ += '"';
	return std::nullopt;
}

auto Writer::write_number(const Number& number) -> std::optional<Err>
{
	return match(format_number(number),
		[&](std::string&& text) -> std::optional<Err> {
			out_ += text;
			return std::nullopt;
		},
		[](Err&& e) -> std::optional<Err> {
			return std::move(e);
		});
}

auto Writer::write_array(const Array& array) -> std::optional<Err>
{
	open('[');
	bool first = true;
	for (const auto& elem: array)
	{
		separate(first);
		first = false;
		if (auto e = write(elem)) return e;
	}
	close(']');
	return std::nullopt;
}

auto Writer::write_object(const Object& object) -> std::optional<Err>
{
	open('{');
	bool first = true;
	for (const auto& [key, value]: object)
	{
		separate(first);
		first = false;
		if (auto e = write_string(key)) return e;
		out_ += pretty_ ? ": " : ":";
		if (auto e = write(value)) return e;
	}
	close('}');
	return std::nullopt;
}

void Writer::separate(bool first)
{
	if (first) return;
	if (pretty_)
	{
		out_ += ",\n";
		write_indent();
	}
	else out_ += ',';
}

void Writer::open(char bracket)
{
	out_ += bracket;
	if (pretty_)
	{
		out_ += '\n';
		indent_ += indent_amount;
		write_indent();
	}
}

void Writer::close(char bracket)
{
	if (pretty_)
	{
		out_ += '\n';
		indent_ -= indent_amount;
		write_indent();
	}
	out_ += bracket;
}

void Writer::write_indent()
{
	out_.append(indent_, ' ');
}

}
