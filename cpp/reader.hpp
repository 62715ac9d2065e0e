#pragma once

#include <cstddef>
#include <string>

#include "json.hpp"
#include "scanner.hpp"

namespace utfjson
{

// Recursive descent over a Scanner. Every production returns Ok with the
// position after it, NoMatch when the input does not start with it, or Err
// once the input committed to it and turned out malformed. Leading
// whitespace is skipped by the production itself.

auto parse_string(const Scanner& src, std::size_t pos) -> Result<std::string>;

// Reads the run of number characters both as an integer and as a double and
// keeps the integer when both consume the same span.
auto parse_number(const Scanner& src, std::size_t pos) -> Result<Number>;

// `depth` is the number of container levels still allowed below this point.
auto parse_object(const Scanner& src, std::size_t pos, std::size_t depth) -> Result<Object>;
auto parse_array(const Scanner& src, std::size_t pos, std::size_t depth) -> Result<Array>;
auto parse_value(const Scanner& src, std::size_t pos, std::size_t depth) -> Result<Json>;

// A whole document: object or array, or any value with allow_fragments,
// followed by nothing but whitespace.
auto parse_document(const Scanner& src, const ReadingOptions& options) -> Decoded;

}
