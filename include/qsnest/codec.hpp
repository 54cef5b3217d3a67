#ifndef QSNEST_CODEC_H
#define QSNEST_CODEC_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "qsnest/config.hpp"
#include "qsnest/value.hpp"

namespace qsnest::codec
{

// Raw key of the charset sentinel parameter
inline constexpr std::string_view sentinel_key{"utf8"};

// "✓" as it is sent by a UTF-8 and by a latin-1 form
inline constexpr std::string_view utf8_sentinel{"%E2%9C%93"};
inline constexpr std::string_view iso_sentinel{"%26%2310003%3B"};

// Split "key=value" on the first '='. A token without '=' is all key.
std::tuple<std::string, std::string> split_by_eq(std::string_view);

// Percent-decode and turn '+' into a space. The decoded bytes are read in
// the given charset and returned as UTF-8. In strict mode a bad escape
// throws parse_error(malformed_input), otherwise it is kept literally.
std::string unquote(std::string_view, Charset, bool strict = true);

// Percent-encode everything except RFC 3986 unreserved characters.
// Input is UTF-8. Under latin-1, characters beyond U+00FF are written as
// numeric character references first.
std::string quote(std::string_view, Charset);

// Replace "&#NNN;" and "&#xHH;" references with their UTF-8 encoding
std::string resolve_numeric_entities(std::string_view);

// Charset announced by the raw value of a utf8= parameter, if any
std::optional<Charset> detect_charset(std::string_view raw_value);

// Flat, order-preserving multi-valued view of a query: raw keys mapped to
// lists of leniently decoded values.
Mapping parse_qsl(const std::vector<std::string>& tokens, Charset, bool keep_blank_values);

// UTF-8 helpers
std::u32string decode_utf8(std::string_view);
void append_utf8(std::string&, char32_t);

} // namespace qsnest::codec

#endif // QSNEST_CODEC_H
