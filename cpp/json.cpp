#include <cmath>
#include <ostream>
#include <stdexcept>
#include <utility>

#include "json.hpp"
#include "encoding.hpp"
#include "matching.hpp"
#include "reader.hpp"
#include "scanner.hpp"
#include "writer.hpp"

namespace utfjson
{

std::optional<std::int64_t> Number::as_integer() const
{
	if (const auto* i = std::get_if<std::int64_t>(&value)) return *i;
	return std::nullopt;
}

double Number::as_double() const
{
	return match(value,
		[](std::int64_t i) { return static_cast<double>(i); },
		[](double d) { return d; });
}

bool Number::is_finite() const
{
	return match(value,
		[](std::int64_t) { return true; },
		[](double d) { return static_cast<bool>(std::isfinite(d)); });
}

bool Number::operator==(const Number& other) const
{
	// 2^63, exactly representable.
	constexpr double limit = 9223372036854775808.0;
	const auto same = [=](std::int64_t i, double d){
		return d == std::trunc(d) and d >= -limit and d < limit and static_cast<std::int64_t>(d) == i;
	};
	return match(value,
		[&](std::int64_t i) {
			return match(other.value,
				[=](std::int64_t j) { return i == j; },
				[&](double d) { return same(i, d); });
		},
		[&](double d) {
			return match(other.value,
				[&](std::int64_t j) { return same(j, d); },
				[=](double e) { return d == e; });
		});
}

std::optional<bool> Json::as_bool() const
{
	if (const auto* b = std::get_if<bool>(&value)) return *b;
	return std::nullopt;
}

const Json* Json::find(const std::string& key) const
{
	const auto* obj = as_object();
	if (obj == nullptr) return nullptr;
	const auto it = obj->find(key);
	return it == obj->end() ? nullptr : &it->second;
}

const Json* Json::at(std::size_t index) const
{
	const auto* arr = as_array();
	if (arr == nullptr or index >= arr->size()) return nullptr;
	return &(*arr)[index];
}

Json clone(const Json& json)
{
	return match(json.value,
		[](const Array& arr) {
			Array copy;
			copy.reserve(arr.size());
			for (const auto& elem: arr) copy.push_back(clone(elem));
			return Json{std::move(copy)};
		},
		[](const Object& obj) {
			Object copy;
			copy.reserve(obj.size());
			for (const auto& [key, value]: obj) copy.emplace(key, clone(value));
			return Json{std::move(copy)};
		},
		[](const Null& n) { return Json{n}; },
		[](bool b) { return Json{b}; },
		[](const Number& n) { return Json{n}; },
		[](const std::string& s) { return Json{s}; });
}

auto decode(std::span<const std::uint8_t> bytes, ReadingOptions options) -> Decoded
{
	const Detected detected = detect_encoding(bytes);
	const Scanner src{bytes.subspan(detected.bom_length), detected.encoding};
	return parse_document(src, options);
}

auto decode(std::string_view bytes, ReadingOptions options) -> Decoded
{
	return decode(std::span{reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()}, options);
}

auto encode(const Json& json, WritingOptions options) -> Encoded
{
	std::string out;
	Writer writer{out, options.pretty_printed};
	if (auto e = writer.write(json)) return std::move(*e);
	return out;
}

std::ostream& operator<<(std::ostream& o, Null)
{
	return o << "null";
}

std::ostream& operator<<(std::ostream& o, const Number& num)
{
	return match(num.value,
		[&](std::int64_t i) -> std::ostream& { return o << i; },
		[&](double d) -> std::ostream& { return o << d; });
}

std::ostream& operator<<(std::ostream& o, const Array& arr)
{
	o << '[';
	for (auto it = std::begin(arr); it != std::end(arr); ++it)
	{
		if (it != std::begin(arr)) o << ", ";
		o << *it;
	}
	o << ']';
	return o;
}

std::ostream& operator<<(std::ostream& o, const Object& obj)
{
	o << '{';
	for (auto it = std::begin(obj); it != std::end(obj); ++it)
	{
		auto& [key, value] = *it;
		if (it != std::begin(obj)) o << ", ";
		o << '"' << escape(key) << "\": " << value;
	}
	o << '}';
	return o;
}

std::ostream& operator<<(std::ostream& o, const Json& json)
{
	return match(json.value,
		[&](const std::string& str) -> std::ostream& {
			return o << '"' << escape(str) << '"';
		},
		[&](bool b) -> std::ostream& {
			return o << (b ? "true" : "false");
		},
		[&](const Null& n) -> std::ostream& { return o << n; },
		[&](const Number& n) -> std::ostream& { return o << n; },
		[&](const Array& a) -> std::ostream& { return o << a; },
		[&](const Object& obj) -> std::ostream& { return o << obj; });
}

std::ostream& operator<<(std::ostream& o, const Error& error)
{
	switch (error)
	{
		case Error::EncodingError: return o << "EncodingError";
		case Error::UnexpectedEndOfInput: return o << "UnexpectedEndOfInput";
		case Error::InvalidEscapeSequence: return o << "InvalidEscapeSequence";
		case Error::MissingSurrogatePair: return o << "MissingSurrogatePair";
		case Error::MissingObjectKey: return o << "MissingObjectKey";
		case Error::InvalidSeparator: return o << "InvalidSeparator";
		case Error::InvalidValue: return o << "InvalidValue";
		case Error::MalformedObject: return o << "MalformedObject";
		case Error::MalformedArray: return o << "MalformedArray";
		case Error::InvalidNumber: return o << "InvalidNumber";
		case Error::NotArrayOrObject: return o << "NotArrayOrObject";
		case Error::TrailingGarbage: return o << "TrailingGarbage";
		case Error::NestingTooDeep: return o << "NestingTooDeep";
		case Error::NonFiniteNumber: return o << "NonFiniteNumber";
		case Error::StreamError: return o << "StreamError";
	}
	throw std::runtime_error("Invalid Error value");
}

std::ostream& operator<<(std::ostream& o, const Err& err)
{
	o << err.code << ": " << err.message;
	if (err.offset) o << " at " << *err.offset;
	return o;
}

}
