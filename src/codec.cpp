#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "qsnest/codec.hpp"
#include "qsnest/errors.hpp"

namespace qsnest::codec
{

static inline bool
is_hex(char c)
{
	return std::isdigit(static_cast<unsigned char>(c)) ||
		(c >= 'a' && c <= 'f') ||
		(c >= 'A' && c <= 'F');
}

static inline char
from_hex(char c)
{
	return std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : std::tolower(c) - 'a' + 10;
}

static inline bool
is_unreserved(unsigned char c)
{
	return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

static inline void
append_escape(std::string& out, unsigned char c)
{
	static constexpr char hex[] = "0123456789ABCDEF";
	out += '%';
	out += hex[c >> 4];
	out += hex[c & 0xF];
}

std::tuple<std::string, std::string>
split_by_eq(std::string_view str)
{
	std::string k;
	std::string v;
	size_t pos = str.find('=');

	if(pos == std::string_view::npos)
	{
		// Only a key was found
		k = str;
	}
	else
	{
		k = str.substr(0, pos);
		v = str.substr(pos + 1);
	}

	return std::make_tuple(k, v);
}

std::u32string
decode_utf8(std::string_view str)
{
	std::u32string out;
	out.reserve(str.size());

	for(std::size_t i = 0; i < str.size();)
	{
		unsigned char c = str[i];
		std::size_t len;
		char32_t cp;

		if(c < 0x80)
		{
			out += c;
			i++;
			continue;
		}
		else if((c & 0xE0) == 0xC0)
		{
			len = 2;
			cp = c & 0x1F;
		}
		else if((c & 0xF0) == 0xE0)
		{
			len = 3;
			cp = c & 0x0F;
		}
		else if((c & 0xF8) == 0xF0)
		{
			len = 4;
			cp = c & 0x07;
		}
		else
		{
			// Stray continuation byte or invalid lead byte
			out += U'\uFFFD';
			i++;
			continue;
		}

		std::size_t j = 1;
		for(; j < len && i + j < str.size(); j++)
		{
			unsigned char cc = str[i + j];
			if((cc & 0xC0) != 0x80)
				break;
			cp = (cp << 6) | (cc & 0x3F);
		}

		static constexpr char32_t min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
		if(j != len || cp < min_cp[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
		{
			out += U'\uFFFD';
			i += j;
			continue;
		}

		out += cp;
		i += len;
	}

	return out;
}

void
append_utf8(std::string& out, char32_t cp)
{
	if(cp < 0x80)
	{
		out += static_cast<char>(cp);
	}
	else if(cp < 0x800)
	{
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	else if(cp < 0x10000)
	{
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	else
	{
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

std::string
unquote(std::string_view str, Charset charset, bool strict)
{
	std::string bytes;
	bytes.reserve(str.size());

	for(std::size_t i = 0; i < str.size(); i++)
	{
		char c = str[i];

		switch(c)
		{
		case '%':
			if(i + 2 < str.size() && is_hex(str[i + 1]) && is_hex(str[i + 2]))
			{
				bytes += static_cast<char>(from_hex(str[i + 1]) << 4 | from_hex(str[i + 2]));
				i += 2;
			}
			else if(strict)
			{
				throw parse_error(error_kind::malformed_input,
					"Bad percent-encoding in '" + std::string(str) + "'");
			}
			else
			{
				bytes += c;
			}
			break;
		case '+':
			bytes += ' ';
			break;
		default:
			bytes += c;
			break;
		}
	}

	std::string unquoted;
	unquoted.reserve(bytes.size());
	if(charset == Charset::iso_8859_1)
	{
		for(unsigned char b : bytes)
			append_utf8(unquoted, b);
	}
	else
	{
		// Invalid sequences become U+FFFD
		for(char32_t cp : decode_utf8(bytes))
			append_utf8(unquoted, cp);
	}

	return unquoted;
}

std::string
quote(std::string_view str, Charset charset)
{
	std::string quoted;
	quoted.reserve(str.size() * 3);

	if(charset == Charset::utf8)
	{
		for(unsigned char c : str)
		{
			if(is_unreserved(c))
				quoted += static_cast<char>(c);
			else
				append_escape(quoted, c);
		}
		return quoted;
	}

	for(char32_t cp : decode_utf8(str))
	{
		if(cp < 0x80 && is_unreserved(static_cast<unsigned char>(cp)))
		{
			quoted += static_cast<char>(cp);
		}
		else if(cp <= 0xFF)
		{
			append_escape(quoted, static_cast<unsigned char>(cp));
		}
		else
		{
			// Not representable in latin-1
			quoted += "%26%23";
			quoted += std::to_string(static_cast<std::uint32_t>(cp));
			quoted += "%3B";
		}
	}

	return quoted;
}

std::string
resolve_numeric_entities(std::string_view str)
{
	std::string out;
	out.reserve(str.size());

	std::size_t i = 0;
	while(i < str.size())
	{
		if(str[i] != '&' || i + 2 >= str.size() || str[i + 1] != '#')
		{
			out += str[i++];
			continue;
		}

		std::size_t j = i + 2;
		bool hex = false;
		if(str[j] == 'x' || str[j] == 'X')
		{
			hex = true;
			j++;
		}

		std::uint32_t cp = 0;
		std::size_t digits = 0;
		for(; j < str.size(); j++, digits++)
		{
			char c = str[j];
			if(hex ? !is_hex(c) : !std::isdigit(static_cast<unsigned char>(c)))
				break;
			cp = hex ? cp * 16 + from_hex(c) : cp * 10 + (c - '0');
			if(cp > 0x10FFFF)
				break;
		}

		if(digits == 0 || j >= str.size() || str[j] != ';' ||
			cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
		{
			out += str[i++];
			continue;
		}

		append_utf8(out, cp);
		i = j + 1;
	}

	return out;
}

std::optional<Charset>
detect_charset(std::string_view raw_value)
{
	if(boost::iequals(raw_value, utf8_sentinel))
		return Charset::utf8;

	// Some browsers drop the trailing ';'
	if(boost::iequals(raw_value, iso_sentinel) ||
		boost::iequals(raw_value, iso_sentinel.substr(0, iso_sentinel.size() - 3)))
		return Charset::iso_8859_1;

	return std::nullopt;
}

Mapping
parse_qsl(const std::vector<std::string>& tokens, Charset charset, bool keep_blank_values)
{
	Mapping qsm;
	for(auto& kv : tokens)
	{
		if(kv.find('=') == std::string::npos)
			// Ignore tokens without a value
			continue;

		std::tuple kvt = split_by_eq(kv);
		const std::string& k = std::get<0>(kvt);
		const std::string& raw = std::get<1>(kvt);
		if(raw.empty() && !keep_blank_values)
			continue;

		Value v{unquote(raw, charset, false)};
		auto it = std::find_if(qsm.begin(), qsm.end(),
			[&k](const auto& entry)
			{
				return std::get<std::string>(entry.first) == k;
			});

		if(it == qsm.end())
			qsm.emplace_back(k, List{std::move(v)});
		else
			it->second.as_list().push_back(std::move(v));
	}

	return qsm;
}

} // namespace qsnest::codec
