#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include "reader.hpp"
#include "encoding.hpp"
#include "matching.hpp"

namespace utfjson
{

namespace
{

template<typename T>
Result<T> ok(T val, std::size_t pos)
{
	return Ok<T>{std::move(val), pos};
}

Err fail(const Scanner& src, Error e, std::string message, std::size_t pos)
{
	return Err{e, std::move(message), src.distance(pos)};
}

// Re-types a result that is known not to be Ok.
template<typename T, typename U>
Result<T> pass(Result<U>&& r)
{
	if (auto* e = std::get_if<Err>(&r)) return std::move(*e);
	return NoMatch{};
}

template<typename T>
bool matched(const Result<T>& r)
{
	return std::holds_alternative<Ok<T>>(r);
}

bool is_ws(std::uint8_t c)
{
	switch (c)
	{
		case ' ':
		case '\t':
		case '\n':
		case '\r':
			return true;
		default:
			return false;
	}
}

bool is_hex(std::uint8_t ch)
{
	switch (ch)
	{
		case '0'...'9': return true;
		case 'a'...'f': return true;
		case 'A'...'F': return true;
		default: return false;
	}
}

int hex_value(std::uint8_t ch)
{
	switch (ch)
	{
		case '0'...'9': return ch - '0';
		case 'a'...'f': return ch - 'a' + 10;
		case 'A'...'F': return ch - 'A' + 10;
		default: return -1;
	}
}

bool is_number_char(std::uint8_t ch)
{
	switch (ch)
	{
		case '0'...'9':
		case '.':
		case '-':
		case '+':
		case 'e':
		case 'E':
			return true;
		default:
			return false;
	}
}

// An out of range literal is too small rather than too large when its
// exponent is negative.
bool underflows(std::string_view literal)
{
	const auto e = literal.find_first_of("eE");
	return e != std::string_view::npos and e + 1 < literal.size() and literal[e + 1] == '-';
}

bool is_lead_surrogate(char32_t cu)
{
	return cu >= 0xD800 and cu <= 0xDBFF;
}

bool is_trail_surrogate(char32_t cu)
{
	return cu >= 0xDC00 and cu <= 0xDFFF;
}

auto skip_ws(const Scanner& src, std::size_t pos) -> std::size_t
{
	while (true)
	{
		const auto ascii = src.take_ascii(pos);
		if (not ascii or not is_ws(ascii->first)) return pos;
		pos = ascii->second;
	}
}

// Running out of input where a character is required is a hard error; any
// other character is just not a match.
auto consume_ascii(const Scanner& src, std::size_t pos, char expected) -> Result<char>
{
	return match(src.take_ascii(pos),
		[&](std::uint8_t ch, std::size_t next) -> Result<char> {
			if (ch == static_cast<std::uint8_t>(expected)) return ok(expected, next);
			return NoMatch{};
		},
		[&](std::nullopt_t) -> Result<char> {
			if (not src.has_next(pos)) return fail(src, Error::UnexpectedEndOfInput, "unexpected end of input", pos);
			return NoMatch{};
		});
}

// `expected` surrounded by optional whitespace.
auto consume_structure(const Scanner& src, std::size_t pos, char expected) -> Result<char>
{
	auto r = consume_ascii(src, skip_ws(src, pos), expected);
	if (auto* c = std::get_if<Ok<char>>(&r)) c->second = skip_ws(src, c->second);
	return r;
}

auto parse_literal(const Scanner& src, std::size_t pos, std::string_view word, Json&& value) -> Result<Json>
{
	for (const char ch: word)
	{
		auto r = consume_ascii(src, pos, ch);
		if (not matched(r)) return pass<Json>(std::move(r));
		pos = std::get<Ok<char>>(r).second;
	}
	return ok(std::move(value), pos);
}

// Four hex digits. NoMatch on the first character that is not one.
auto parse_code_unit(const Scanner& src, std::size_t pos) -> Result<char32_t>
{
	char32_t cu = 0;
	for (int k = 0; k < 4; ++k)
	{
		const auto ascii = src.take_ascii(pos);
		if (not ascii and not src.has_next(pos))
		{
			return fail(src, Error::UnexpectedEndOfInput, "unexpected end of input in unicode escape sequence", pos);
		}
		if (not ascii or not is_hex(ascii->first)) return NoMatch{};
		cu = (cu << 4) | hex_value(ascii->first);
		pos = ascii->second;
	}
	return ok(cu, pos);
}

// After "\u". NoMatch when the four hex digits are missing.
auto parse_unicode_escape(const Scanner& src, std::size_t pos) -> Result<std::string>
{
	auto lead = parse_code_unit(src, pos);
	if (not matched(lead)) return pass<std::string>(std::move(lead));
	const auto [cu, next] = std::get<Ok<char32_t>>(lead);

	std::string out;
	if (is_trail_surrogate(cu))
	{
		return fail(src, Error::MissingSurrogatePair, "unpaired trailing surrogate in unicode escape sequence", pos);
	}
	if (not is_lead_surrogate(cu))
	{
		append_utf8(out, cu);
		return ok(std::move(out), next);
	}

	const auto missing = [&]{
		return fail(src, Error::MissingSurrogatePair, "unable to convert unicode escape sequence (no low-surrogate code point)", pos);
	};
	auto backslash = consume_ascii(src, next, '\\');
	if (std::holds_alternative<Err>(backslash)) return pass<std::string>(std::move(backslash));
	if (not matched(backslash)) return missing();
	auto u = consume_ascii(src, std::get<Ok<char>>(backslash).second, 'u');
	if (std::holds_alternative<Err>(u)) return pass<std::string>(std::move(u));
	if (not matched(u)) return missing();
	auto trail = parse_code_unit(src, std::get<Ok<char>>(u).second);
	if (std::holds_alternative<Err>(trail)) return pass<std::string>(std::move(trail));
	if (not matched(trail)) return missing();
	const auto [lo, after] = std::get<Ok<char32_t>>(trail);
	if (not is_trail_surrogate(lo)) return missing();

	append_utf8(out, ((cu - 0xD800) << 10) + (lo - 0xDC00) + 0x10000);
	return ok(std::move(out), after);
}

// After the backslash. NoMatch when the escape is not recognised.
auto parse_escape(const Scanner& src, std::size_t pos) -> Result<std::string>
{
	const auto ascii = src.take_ascii(pos);
	if (not ascii)
	{
		if (not src.has_next(pos)) return fail(src, Error::UnexpectedEndOfInput, "unexpected end of input in escape sequence", pos);
		return NoMatch{};
	}
	const auto [ch, next] = *ascii;
	switch (ch)
	{
		case '"': return ok(std::string("\""), next);
		case '\\': return ok(std::string("\\"), next);
		case '/': return ok(std::string("/"), next);
		case 'b': return ok(std::string("\b"), next);
		case 'f': return ok(std::string("\f"), next);
		case 'n': return ok(std::string("\n"), next);
		case 'r': return ok(std::string("\r"), next);
		case 't': return ok(std::string("\t"), next);
		case 'u': return parse_unicode_escape(src, next);
		default: return NoMatch{};
	}
}

auto parse_member(const Scanner& src, std::size_t pos, std::size_t depth) -> Result<std::pair<std::string, Json>>
{
	using Member = std::pair<std::string, Json>;

	auto key = parse_string(src, pos);
	if (std::holds_alternative<NoMatch>(key))
	{
		return fail(src, Error::MissingObjectKey, "missing object key", skip_ws(src, pos));
	}
	if (not matched(key)) return pass<Member>(std::move(key));
	auto&& [name, after_key] = std::get<Ok<std::string>>(key);

	auto separator = consume_structure(src, after_key, ':');
	if (std::holds_alternative<NoMatch>(separator))
	{
		return fail(src, Error::InvalidSeparator, "invalid separator", skip_ws(src, after_key));
	}
	if (not matched(separator)) return pass<Member>(std::move(separator));
	const std::size_t after_separator = std::get<Ok<char>>(separator).second;

	auto value = parse_value(src, after_separator, depth);
	if (std::holds_alternative<NoMatch>(value))
	{
		return fail(src, Error::InvalidValue, "invalid value", after_separator);
	}
	if (not matched(value)) return pass<Member>(std::move(value));
	auto&& [json, end] = std::get<Ok<Json>>(value);

	return ok(Member{std::move(name), std::move(json)}, end);
}

template<typename T>
auto lift(Result<T>&& r) -> Result<Json>
{
	return match(std::move(r),
		[](T&& value, std::size_t next) -> Result<Json> {
			return ok(Json{std::move(value)}, next);
		},
		[](NoMatch) -> Result<Json> {
			return NoMatch{};
		},
		[](Err&& e) -> Result<Json> {
			return std::move(e);
		});
}

auto finish(const Scanner& src, Ok<Json>&& parsed) -> Decoded
{
	const std::size_t end = skip_ws(src, parsed.second);
	if (src.has_next(end)) return fail(src, Error::TrailingGarbage, "garbage after JSON text", end);
	if (end != src.size()) return fail(src, Error::EncodingError, "incomplete code unit at end of input", end);
	return std::move(parsed.first);
}

}

auto parse_string(const Scanner& src, std::size_t input) -> Result<std::string>
{
	const std::size_t begin = skip_ws(src, input);
	auto quote = consume_ascii(src, begin, '"');
	if (not matched(quote)) return pass<std::string>(std::move(quote));

	std::size_t chunk = std::get<Ok<char>>(quote).second;
	std::size_t current = chunk;
	std::string out;

	// Appends the raw bytes between `chunk` and `current`.
	const auto flush = [&]() -> std::optional<Err> {
		return match(src.decode_span(chunk, current),
			[&](std::string&& text) -> std::optional<Err> {
				out += text;
				return std::nullopt;
			},
			[](Err&& e) -> std::optional<Err> {
				return std::move(e);
			});
	};

	while (src.has_next(current))
	{
		const auto ascii = src.take_ascii(current);
		if (not ascii)
		{
			current += src.step();
			continue;
		}
		const auto [ch, next] = *ascii;
		switch (ch)
		{
			case '"':
				if (auto e = flush()) return std::move(*e);
				return ok(std::move(out), next);
			case '\\':
			{
				if (auto e = flush()) return std::move(*e);
				auto escaped = parse_escape(src, next);
				if (std::holds_alternative<NoMatch>(escaped))
				{
					return fail(src, Error::InvalidEscapeSequence, "invalid escape sequence", current);
				}
				if (not matched(escaped)) return escaped;
				auto&& [text, after] = std::get<Ok<std::string>>(escaped);
				out += text;
				chunk = current = after;
				break;
			}
			default:
				current = next;
		}
	}
	return fail(src, Error::UnexpectedEndOfInput, "unterminated string", begin);
}

auto parse_number(const Scanner& src, std::size_t input) -> Result<Number>
{
	std::string run;
	std::size_t pos = input;
	while (true)
	{
		const auto ascii = src.take_ascii(pos);
		if (not ascii or not is_number_char(ascii->first)) break;
		run.push_back(static_cast<char>(ascii->first));
		pos = ascii->second;
	}
	if (run.empty()) return NoMatch{};

	const char* const first = run.data();
	const char* const last = run.data() + run.size();

	std::int64_t integer = 0;
	const auto [int_end, int_ec] = std::from_chars(first, last, integer, 10);
	const std::size_t int_length = int_ec == std::errc{} ? static_cast<std::size_t>(int_end - first) : 0;

	double floating = 0.0;
	const auto [double_end, double_ec] = std::from_chars(first, last, floating);
	const std::size_t double_length = double_end - first;

	const auto advance = [&](std::size_t length){
		return input + length * src.step();
	};

	if (int_length > 0 and int_length == double_length)
	{
		return ok(Number{integer}, advance(int_length));
	}
	if (double_ec == std::errc::result_out_of_range and underflows(std::string_view(run).substr(0, double_length)))
	{
		return ok(Number{run.front() == '-' ? -0.0 : 0.0}, advance(double_length));
	}
	if (double_ec == std::errc::result_out_of_range)
	{
		return fail(src, Error::InvalidNumber, "number " + run.substr(0, double_length) + " is out of range", input);
	}
	if (double_ec == std::errc{} and double_length > int_length)
	{
		return ok(Number{floating}, advance(double_length));
	}
	if (int_length > 0)
	{
		return ok(Number{integer}, advance(int_length));
	}
	return NoMatch{};
}

auto parse_object(const Scanner& src, std::size_t input, std::size_t depth) -> Result<Object>
{
	auto open = consume_structure(src, input, '{');
	if (not matched(open)) return pass<Object>(std::move(open));
	std::size_t pos = std::get<Ok<char>>(open).second;
	if (depth == 0) return fail(src, Error::NestingTooDeep, "nesting too deep", input);

	Object buf;
	auto close = consume_structure(src, pos, '}');
	if (matched(close)) return ok(std::move(buf), std::get<Ok<char>>(close).second);
	if (std::holds_alternative<Err>(close)) return pass<Object>(std::move(close));

	while (true)
	{
		auto member = parse_member(src, pos, depth - 1);
		if (not matched(member)) return pass<Object>(std::move(member));
		auto&& [kv, after] = std::get<Ok<std::pair<std::string, Json>>>(member);
		buf.insert_or_assign(std::move(kv.first), std::move(kv.second));

		auto end = consume_structure(src, after, '}');
		if (matched(end)) return ok(std::move(buf), std::get<Ok<char>>(end).second);
		if (std::holds_alternative<Err>(end)) return pass<Object>(std::move(end));

		auto comma = consume_structure(src, after, ',');
		if (matched(comma))
		{
			pos = std::get<Ok<char>>(comma).second;
			continue;
		}
		if (std::holds_alternative<Err>(comma)) return pass<Object>(std::move(comma));
		return fail(src, Error::MalformedObject, "expected ',' or '}' after object member", skip_ws(src, after));
	}
}

auto parse_array(const Scanner& src, std::size_t input, std::size_t depth) -> Result<Array>
{
	auto open = consume_structure(src, input, '[');
	if (not matched(open)) return pass<Array>(std::move(open));
	std::size_t pos = std::get<Ok<char>>(open).second;
	if (depth == 0) return fail(src, Error::NestingTooDeep, "nesting too deep", input);

	Array buf;
	auto close = consume_structure(src, pos, ']');
	if (matched(close)) return ok(std::move(buf), std::get<Ok<char>>(close).second);
	if (std::holds_alternative<Err>(close)) return pass<Array>(std::move(close));

	while (true)
	{
		auto value = parse_value(src, pos, depth - 1);
		if (std::holds_alternative<NoMatch>(value))
		{
			return fail(src, Error::MalformedArray, "badly formed array", pos);
		}
		if (not matched(value)) return pass<Array>(std::move(value));
		auto&& [json, after] = std::get<Ok<Json>>(value);
		buf.push_back(std::move(json));

		auto end = consume_structure(src, after, ']');
		if (matched(end)) return ok(std::move(buf), std::get<Ok<char>>(end).second);
		if (std::holds_alternative<Err>(end)) return pass<Array>(std::move(end));

		auto comma = consume_structure(src, after, ',');
		if (matched(comma))
		{
			pos = std::get<Ok<char>>(comma).second;
			continue;
		}
		if (std::holds_alternative<Err>(comma)) return pass<Array>(std::move(comma));
		return fail(src, Error::MalformedArray, "badly formed array", skip_ws(src, after));
	}
}

auto parse_value(const Scanner& src, std::size_t input, std::size_t depth) -> Result<Json>
{
	const std::size_t pos = skip_ws(src, input);

	// Number last, as the catch-all.
	if (auto r = lift(parse_string(src, pos)); not std::holds_alternative<NoMatch>(r)) return r;
	if (auto r = parse_literal(src, pos, "true", True()); not std::holds_alternative<NoMatch>(r)) return r;
	if (auto r = parse_literal(src, pos, "false", False()); not std::holds_alternative<NoMatch>(r)) return r;
	if (auto r = parse_literal(src, pos, "null", null()); not std::holds_alternative<NoMatch>(r)) return r;
	if (auto r = lift(parse_object(src, pos, depth)); not std::holds_alternative<NoMatch>(r)) return r;
	if (auto r = lift(parse_array(src, pos, depth)); not std::holds_alternative<NoMatch>(r)) return r;
	return lift(parse_number(src, pos));
}

auto parse_document(const Scanner& src, const ReadingOptions& options) -> Decoded
{
	const auto decided = [&](Result<Json>&& r) -> std::optional<Decoded> {
		if (auto* parsed = std::get_if<Ok<Json>>(&r)) return finish(src, std::move(*parsed));
		if (auto* e = std::get_if<Err>(&r)) return Decoded{std::move(*e)};
		return std::nullopt;
	};

	if (auto d = decided(lift(parse_object(src, 0, options.max_depth)))) return std::move(*d);
	if (auto d = decided(lift(parse_array(src, 0, options.max_depth)))) return std::move(*d);
	if (options.allow_fragments)
	{
		if (auto d = decided(parse_value(src, 0, options.max_depth))) return std::move(*d);
		return fail(src, Error::InvalidValue, "JSON text did not start with a value", skip_ws(src, 0));
	}
	return fail(src, Error::NotArrayOrObject, "JSON text did not start with array or object and option to allow fragments not set", 0);
}

}
