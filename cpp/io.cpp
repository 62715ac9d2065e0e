#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "json.hpp"
#include "matching.hpp"

namespace utfjson
{

namespace
{

auto read_all(std::istream& in) -> std::variant<std::string, Err>
{
	if (not in)
	{
		return Err{Error::StreamError, "input stream is not readable"};
	}
	std::string contents{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
	if (in.bad())
	{
		return Err{Error::StreamError, "unable to read from input stream"};
	}
	return contents;
}

}

auto decode(std::istream& in, ReadingOptions options) -> Decoded
{
	return match(read_all(in),
		[&](std::string&& contents) {
			return decode(std::string_view(contents), options);
		},
		[](Err&& e) {
			return Decoded{std::move(e)};
		});
}

auto write(const Json& json, std::ostream& out, WritingOptions options) -> std::variant<std::size_t, Err>
{
	using Written = std::variant<std::size_t, Err>;
	return match(encode(json, options),
		[&](std::string&& text) {
			out.write(text.data(), static_cast<std::streamsize>(text.size()));
			if (not out) return Written{Err{Error::StreamError, "unable to write to output stream"}};
			return Written{text.size()};
		},
		[](Err&& e) {
			return Written{std::move(e)};
		});
}

}
