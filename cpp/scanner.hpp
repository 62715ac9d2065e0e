#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>

#include "encoding.hpp"
#include "json.hpp"

namespace utfjson
{

// Read-only view of encoded text. Positions are byte offsets that always
// fall on a code unit boundary.
class Scanner
{
public:
	Scanner(std::span<const std::uint8_t> buffer, Encoding encoding);

	// The code unit at `pos` if it is ASCII, with the position of the next unit.
	auto take_ascii(std::size_t pos) const -> std::optional<std::pair<std::uint8_t, std::size_t>>;

	// UTF-8 rendering of the bytes in [begin, end).
	auto decode_span(std::size_t begin, std::size_t end) const -> std::variant<std::string, Err>;

	bool has_next(std::size_t pos) const { return pos + step_ <= buffer_.size(); }
	std::size_t distance(std::size_t pos) const { return pos / step_; }
	std::size_t step() const { return step_; }
	std::size_t size() const { return buffer_.size(); }
	Encoding encoding() const { return encoding_; }

private:
	std::span<const std::uint8_t> buffer_;
	Encoding encoding_;
	std::size_t step_;
};

}
