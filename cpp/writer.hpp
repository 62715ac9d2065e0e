#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "json.hpp"

namespace utfjson
{

// Body of a JSON string literal, without the quotes. Only '"', '\' and
// control characters are escaped; '/' is left alone.
auto escape(std::string_view str) -> std::string;

// Integers as is; doubles in plain decimal with at most 15 fractional
// digits and no trailing zeros. Independent of the global locale.
auto format_number(const Number& number) -> std::variant<std::string, Err>;

// Appends the text of a tree to a string, depth first.
class Writer
{
public:
	Writer(std::string& out, bool pretty);

	auto write(const Json& json) -> std::optional<Err>;

private:
	auto write_string(const std::string& str) -> std::optional<Err>;
	auto write_number(const Number& number) -> std::optional<Err>;
	auto write_array(const Array& array) -> std::optional<Err>;
	auto write_object(const Object& object) -> std::optional<Err>;

	// Between two siblings, and after the opening bracket when pretty.
	void separate(bool first);
	void open(char bracket);
	void close(char bracket);
	void write_indent();

	static constexpr int indent_amount = 2;

	std::string& out_;
	const bool pretty_;
	int indent_ = 0;
};

}
