#ifndef QSNEST_NOTATION_H
#define QSNEST_NOTATION_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "qsnest/config.hpp"
#include "qsnest/node.hpp"
#include "qsnest/value.hpp"

namespace qsnest::notation
{

// "a[b][c]" or "a.b.c" split into the base key and its sub-tokens
struct KeyPath
{
	std::string base;
	std::vector<std::string> tokens;
};

// Validate brackets and split a decoded key. Nested, stray or unclosed
// brackets throw parse_error(unbalanced_brackets); anything but '[' (or
// '.' with allow_dots) after a ']' throws parse_error(malformed_input).
KeyPath split_key(std::string_view key, bool allow_dots);

// A run of digits
bool is_index_token(std::string_view);

// Some sub-token is an index or an empty "[]"
bool has_array_tokens(const KeyPath&);

// Literal key made of the tokens that do not fit in the depth limit
std::string fold_tokens(std::vector<std::string>::const_iterator first,
	std::vector<std::string>::const_iterator last, bool allow_dots);

// Translate array notation into a node spine. Digits become indices,
// "[]" becomes a pending index, anything else a named key. Tokens past
// the depth limit fold into one literal key as in lhs_parse. Throws
// parse_error(array_limit_exceeded) for an index above array_limit.
QsNode array_parse(const KeyPath&, Value, const Config&);

// Translate bracket/dot notation into a node spine of named keys, folding
// whatever is nested deeper than the depth limit into one literal key.
QsNode lhs_parse(const KeyPath&, Value, const Config&);

} // namespace qsnest::notation

#endif // QSNEST_NOTATION_H
