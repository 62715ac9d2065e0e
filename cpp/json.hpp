#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace utfjson
{

struct Null
{
	bool operator==(const Null&) const = default;
};

// Either an exact 64-bit integer or a double. Equality compares magnitudes,
// so Number{2} == Number{2.0}.
struct Number
{
	std::variant<std::int64_t, double> value;

	bool is_integer() const { return std::holds_alternative<std::int64_t>(value); }
	std::optional<std::int64_t> as_integer() const;
	double as_double() const;
	bool is_finite() const;

	bool operator==(const Number& other) const;
};

struct Json;

using Array = std::vector<Json>;
using Object = std::unordered_map<std::string, Json>;

struct NonCopyable
{
	constexpr NonCopyable() noexcept = default;
	NonCopyable(const NonCopyable&) = delete;
	constexpr NonCopyable(NonCopyable&&) noexcept = default;

	NonCopyable& operator=(NonCopyable&&) = default;
	NonCopyable& operator=(const NonCopyable&) = delete;
};

struct Json
{
	using t = std::variant<Null, bool, Number, std::string, Array, Object>;

	bool operator==(const Json& other) const {return value == other.value;};

	bool is_null() const { return std::holds_alternative<Null>(value); }
	const Number* as_number() const { return std::get_if<Number>(&value); }
	std::optional<bool> as_bool() const;
	const std::string* as_string() const { return std::get_if<std::string>(&value); }
	const Object* as_object() const { return std::get_if<Object>(&value); }
	const Array* as_array() const { return std::get_if<Array>(&value); }

	// Member lookup; nullptr unless this is an object holding `key`.
	const Json* find(const std::string& key) const;
	// Element lookup; nullptr unless this is an array longer than `index`.
	const Json* at(std::size_t index) const;

	t value;
	[[no_unique_address]] NonCopyable _n = {};
};

static_assert(std::is_nothrow_move_constructible_v<Json>);
static_assert(std::is_aggregate_v<Json>);
static_assert(not std::is_copy_constructible_v<Json>);

// Deep copy. Trees are move-only, so duplicating one is always explicit.
Json clone(const Json& json);

inline Json null()
{
	return Json{Null{}};
}

inline Json True()
{
	return Json{true};
}

inline Json False()
{
	return Json{false};
}

enum class Error
{
	EncodingError,
	UnexpectedEndOfInput,
	InvalidEscapeSequence,
	MissingSurrogatePair,
	MissingObjectKey,
	InvalidSeparator,
	InvalidValue,
	MalformedObject,
	MalformedArray,
	InvalidNumber,
	NotArrayOrObject,
	TrailingGarbage,
	NestingTooDeep,
	NonFiniteNumber,
	StreamError,
};

struct Err
{
	Error code;
	std::string message;
	// Code units from the start of the text, when the failure has a position.
	std::optional<std::size_t> offset = std::nullopt;
};

// A production either matched (value and the byte position after it), did
// not apply at this position, or committed and then hit malformed input.
template<typename T>
using Ok = std::pair<T, std::size_t>;

struct NoMatch
{
};

template<typename T>
using Result = std::variant<Ok<T>, NoMatch, Err>;

using Decoded = std::variant<Json, Err>;
using Encoded = std::variant<std::string, Err>;

struct ReadingOptions
{
	bool allow_fragments = false;
	std::size_t max_depth = 512;
};

struct WritingOptions
{
	bool pretty_printed = false;
};

// Decodes UTF-8, UTF-16 or UTF-32 text (either byte order, BOM optional).
auto decode(std::span<const std::uint8_t> bytes, ReadingOptions options = {}) -> Decoded;
auto decode(std::string_view bytes, ReadingOptions options = {}) -> Decoded;
auto decode(std::istream& in, ReadingOptions options = {}) -> Decoded;

// Produces UTF-8 text. Fails on NaN/infinity and on strings that are not valid UTF-8.
auto encode(const Json& json, WritingOptions options = {}) -> Encoded;
auto write(const Json& json, std::ostream& out, WritingOptions options = {}) -> std::variant<std::size_t, Err>;

std::ostream& operator<<(std::ostream& o, const Json& json);
std::ostream& operator<<(std::ostream& o, const Error& error);
std::ostream& operator<<(std::ostream& o, const Err& err);

}
