#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qsnest/errors.hpp"
#include "qsnest/notation.hpp"

namespace qsnest::notation
{

static void
check_empty(std::string_view token, const Config& config, std::string_view key)
{
	if(token.empty() && !config.allow_empty)
		throw parse_error(error_kind::empty_key, "Empty key in '" + std::string(key) + "'");
}

static std::int64_t
parse_index(std::string_view token, std::int64_t array_limit)
{
	std::int64_t index = 0;
	auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), index);

	if(ec == std::errc::result_out_of_range || index > array_limit)
	{
		throw parse_error(error_kind::array_limit_exceeded,
			"Array index " + std::string(token) + " is above the limit of " +
			std::to_string(array_limit));
	}

	return index;
}

KeyPath
split_key(std::string_view key, bool allow_dots)
{
	KeyPath path;

	std::size_t pos = allow_dots ? key.find_first_of("[.") : key.find('[');
	path.base = key.substr(0, pos);
	if(path.base.find(']') != std::string::npos)
	{
		throw parse_error(error_kind::unbalanced_brackets,
			"Closing bracket without an opening one in '" + std::string(key) + "'");
	}

	while(pos < key.size())
	{
		if(key[pos] == '[')
		{
			std::size_t end = key.find_first_of("[]", pos + 1);
			if(end == std::string_view::npos)
			{
				throw parse_error(error_kind::unbalanced_brackets,
					"Unclosed bracket in '" + std::string(key) + "'");
			}
			if(key[end] == '[')
			{
				throw parse_error(error_kind::unbalanced_brackets,
					"Nested bracket in '" + std::string(key) + "'");
			}

			path.tokens.emplace_back(key.substr(pos + 1, end - pos - 1));
			pos = end + 1;
		}
		else if(allow_dots && key[pos] == '.')
		{
			std::size_t end = key.find_first_of("[.", pos + 1);
			std::string_view segment = end == std::string_view::npos ?
				key.substr(pos + 1) : key.substr(pos + 1, end - pos - 1);

			if(segment.find(']') != std::string_view::npos)
			{
				throw parse_error(error_kind::unbalanced_brackets,
					"Closing bracket without an opening one in '" + std::string(key) + "'");
			}

			path.tokens.emplace_back(segment);
			pos = end;
		}
		else if(key[pos] == ']')
		{
			throw parse_error(error_kind::unbalanced_brackets,
				"Closing bracket without an opening one in '" + std::string(key) + "'");
		}
		else
		{
			throw parse_error(error_kind::malformed_input,
				"Trailing characters after ']' in '" + std::string(key) + "'");
		}
	}

	return path;
}

bool
is_index_token(std::string_view token)
{
	return !token.empty() && std::all_of(token.begin(), token.end(),
		[](char c)
		{
			return std::isdigit(static_cast<unsigned char>(c));
		});
}

bool
has_array_tokens(const KeyPath& path)
{
	return std::any_of(path.tokens.begin(), path.tokens.end(),
		[](const std::string& token)
		{
			return token.empty() || is_index_token(token);
		});
}

std::string
fold_tokens(std::vector<std::string>::const_iterator first,
	std::vector<std::string>::const_iterator last, bool allow_dots)
{
	std::vector<std::string> rest{first, last};

	if(allow_dots)
		return boost::algorithm::join(rest, ".");

	return "[" + boost::algorithm::join(rest, "][") + "]";
}

QsNode
array_parse(const KeyPath& path, Value value, const Config& config)
{
	check_empty(path.base, config, path.base);

	const std::vector<std::string>& tokens = path.tokens;
	std::size_t nested = std::min(tokens.size(), config.depth);

	// Built from the innermost token outwards
	std::optional<QsNode> inner;
	auto wrap = [&inner, &value](NodeKey key)
	{
		if(inner)
			inner = QsNode(std::move(key), std::move(*inner));
		else
			inner = QsNode(std::move(key), std::move(value));
	};

	if(tokens.size() > nested)
		wrap(fold_tokens(tokens.begin() + nested, tokens.end(), config.allow_dots));

	for(auto it = tokens.rend() - static_cast<std::ptrdiff_t>(nested); it != tokens.rend(); ++it)
	{
		const std::string& token = *it;

		if(is_index_token(token))
		{
			wrap(parse_index(token, config.array_limit));
		}
		else if(token.empty())
		{
			// "a[][1]" is the same element as "a[1]"
			if(inner && (inner->has_int_key() || inner->has_pending_key()))
				continue;
			wrap(pending);
		}
		else
		{
			wrap(token);
		}
	}

	if(!inner)
		return QsNode(path.base, std::move(value));

	return QsNode(path.base, std::move(*inner));
}

QsNode
lhs_parse(const KeyPath& path, Value value, const Config& config)
{
	check_empty(path.base, config, path.base);

	const std::vector<std::string>& tokens = path.tokens;
	std::size_t nested = std::min(tokens.size(), config.depth);

	for(std::size_t i = 0; i < nested; i++)
		check_empty(tokens[i], config, path.base);

	if(tokens.empty())
		return QsNode(path.base, std::move(value));

	std::optional<QsNode> inner;
	std::size_t i = nested;
	if(tokens.size() > nested)
	{
		inner = QsNode(fold_tokens(tokens.begin() + nested, tokens.end(), config.allow_dots),
			std::move(value));
	}
	else
	{
		inner = QsNode(tokens[--i], std::move(value));
	}

	while(i > 0)
	{
		--i;
		inner = QsNode(tokens[i], std::move(*inner));
	}

	return QsNode(path.base, std::move(*inner));
}

} // namespace qsnest::notation
