#include "scanner.hpp"

namespace utfjson
{

Scanner::Scanner(std::span<const std::uint8_t> buffer, Encoding encoding)
	: buffer_(buffer)
	, encoding_(encoding)
	, step_(step_width(encoding))
{
}

auto Scanner::take_ascii(std::size_t pos) const -> std::optional<std::pair<std::uint8_t, std::size_t>>
{
	if (not has_next(pos)) return std::nullopt;

	const auto& b = buffer_;
	std::size_t index;
	switch (encoding_)
	{
		case Encoding::Utf8:
			index = pos;
			break;
		case Encoding::Utf16BE:
			if (b[pos] != 0) return std::nullopt;
			index = pos + 1;
			break;
		case Encoding::Utf16LE:
			if (b[pos + 1] != 0) return std::nullopt;
			index = pos;
			break;
		case Encoding::Utf32BE:
			if (b[pos] != 0 or b[pos + 1] != 0 or b[pos + 2] != 0) return std::nullopt;
			index = pos + 3;
			break;
		case Encoding::Utf32LE:
			if (b[pos + 1] != 0 or b[pos + 2] != 0 or b[pos + 3] != 0) return std::nullopt;
			index = pos;
			break;
		default:
			return std::nullopt;
	}
	if (b[index] >= 0x80) return std::nullopt;
	return std::pair{b[index], pos + step_};
}

auto Scanner::decode_span(std::size_t begin, std::size_t end) const -> std::variant<std::string, Err>
{
	if (begin > end or end > buffer_.size())
	{
		return Err{Error::UnexpectedEndOfInput, "span outside of the buffer", distance(begin)};
	}
	if (auto text = transcode(buffer_.subspan(begin, end - begin), encoding_))
	{
		return std::move(*text);
	}
	return Err{Error::EncodingError, "unable to convert data to a string using the detected encoding", distance(begin)};
}

}
