#ifndef QSNEST_CONFIG_H
#define QSNEST_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qsnest/value.hpp"

namespace qsnest
{

enum class Charset
{
	utf8,
	iso_8859_1,
};

enum class ArrayFormat
{
	indices,	// a[0]=b&a[1]=c
	brackets,	// a[]=b&a[]=c
	repeat,		// a=b&a=c
	comma,		// a=b,c
};

// Accepts "utf-8"/"utf8" and "iso-8859-1"/"latin1", any case.
// Throws config_error otherwise.
Charset charset_from_string(std::string_view);
std::string_view to_string(Charset);

// Throws config_error for names other than indices, brackets, repeat, comma
ArrayFormat array_format_from_string(std::string_view);
std::string_view to_string(ArrayFormat);

// The notation dialect, shared by the parser and the stringifier.
struct Config
{
	// Nesting levels below the base key before the rest of the key is
	// folded into one literal key.
	std::size_t depth = 5;

	// Distinct top-level keys admitted per parse
	std::size_t parameter_limit = 1000;

	bool allow_dots = false;

	// Serialize arrays as lists with null holes instead of integer keyed
	// mappings.
	bool allow_sparse = false;

	std::int64_t array_limit = 20;
	bool parse_arrays = false;
	bool allow_empty = false;
	bool comma = false;
};

struct ParseOptions
{
	// Only parse what follows the '?' of the input
	bool from_url = false;

	std::string delimiter{"&"};
	bool delimiter_is_regex = false;

	Charset charset = Charset::utf8;
	bool charset_sentinel = false;
	bool interpret_numeric_entities = false;

	bool parse_primitive = false;
	bool primitive_strict = true;
};

struct StringifyOptions
{
	bool encode = true;
	bool encode_values_only = false;
	std::string delimiter{"&"};
	ArrayFormat array_format = ArrayFormat::indices;
	bool sort = false;
	bool sort_reverse = false;
	Charset charset = Charset::utf8;
	bool charset_sentinel = false;

	// Keys admitted at any level; integers select array elements
	std::optional<std::vector<Key>> filter;
};

} // namespace qsnest

#endif // QSNEST_CONFIG_H
