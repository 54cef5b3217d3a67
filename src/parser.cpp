#include <syslog.h>

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "qsnest/codec.hpp"
#include "qsnest/errors.hpp"
#include "qsnest/notation.hpp"
#include "qsnest/parser.hpp"

namespace qsnest
{

static std::string_view
query_component(std::string_view url)
{
	std::size_t pos = url.find('?');
	if(pos == std::string_view::npos)
		return {};

	std::string_view query = url.substr(pos + 1);
	return query.substr(0, query.find('#'));
}

static std::optional<Scalar>
to_number(std::string_view s)
{
	if(!s.empty() && s.front() == '+')
		s.remove_prefix(1);

	if(s.empty())
		return std::nullopt;

	const char* first = s.data();
	const char* last = first + s.size();

	std::int64_t i = 0;
	auto ir = std::from_chars(first, last, i);
	if(ir.ec == std::errc{} && ir.ptr == last)
		return Scalar{i};

	// from_chars would also take "inf" and "nan"
	bool numeric = std::all_of(s.begin(), s.end(),
		[](char c)
		{
			return std::isdigit(static_cast<unsigned char>(c)) ||
				c == '.' || c == 'e' || c == 'E' || c == '-' || c == '+';
		});
	if(!numeric)
		return std::nullopt;

	double d = 0;
	auto dr = std::from_chars(first, last, d);
	if(dr.ec == std::errc{} && dr.ptr == last)
		return Scalar{d};

	return std::nullopt;
}

Parser::Parser(const Config& config, const ParseOptions& options)
	: config_(config)
	, options_(options)
{
	if(options_.delimiter.empty())
		throw config_error("Empty delimiter");

	if(options_.delimiter_is_regex)
	{
		try
		{
			delimiter_re_.emplace(options_.delimiter);
		}
		catch(const std::regex_error& e)
		{
			throw config_error("Bad delimiter pattern " + options_.delimiter + ": " + e.what());
		}
	}
}

std::vector<std::string>
Parser::tokenize(std::string_view query) const
{
	std::vector<std::string> qsv;

	if(delimiter_re_)
	{
		std::copy(
			std::cregex_token_iterator(query.data(), query.data() + query.size(), *delimiter_re_, -1),
			std::cregex_token_iterator(),
			std::back_inserter(qsv));
	}
	else
	{
		boost::algorithm::iter_split(qsv, query, boost::algorithm::first_finder(options_.delimiter));
	}

	// Ignore empty parameters
	qsv.erase(std::remove(qsv.begin(), qsv.end(), std::string{}), qsv.end());
	return qsv;
}

Scalar
Parser::coerce(std::string s) const
{
	if(!options_.parse_primitive)
		return s;

	if(options_.primitive_strict)
	{
		if(s == "true")
			return true;
		if(s == "false")
			return false;
		if(s == "null" || s == "None")
			return nullptr;
	}
	else
	{
		if(boost::iequals(s, "true"))
			return true;
		if(boost::iequals(s, "false"))
			return false;
		if(boost::iequals(s, "null") || boost::iequals(s, "none"))
			return nullptr;
	}

	if(std::optional<Scalar> number = to_number(s))
		return *number;

	return s;
}

Value
Parser::parse_value(const std::string& raw) const
{
	std::vector<std::string> parts;

	if(raw.size() >= 2 && raw.front() == '[' && raw.back() == ']')
	{
		// "[a,b]" is always a list
		std::string_view inner{raw.data() + 1, raw.size() - 2};
		List items;
		if(!inner.empty())
		{
			boost::split(parts, inner, boost::is_any_of(","));
			for(auto& part : parts)
				items.emplace_back(coerce(std::move(part)));
		}
		return Value{std::move(items)};
	}

	if(config_.comma && raw.find(',') != std::string::npos)
	{
		boost::split(parts, raw, boost::is_any_of(","));
		List items;
		for(auto& part : parts)
			items.emplace_back(coerce(std::move(part)));
		return Value{std::move(items)};
	}

	return Value{coerce(raw)};
}

void
Parser::demote(state& st, const std::string& base, QsNode* existing) const
{
	syslog(LOG_DEBUG, "Key '%s' no longer parsed as an array", base.c_str());

	st.demoted.insert(base);
	if(existing)
		existing->to_object_notation();
}

QsNode
Parser::build_spine(state& st, const notation::KeyPath& path, Value value, QsNode* existing) const
{
	bool array_mode = config_.parse_arrays &&
		st.demoted.count(path.base) == 0 &&
		notation::has_array_tokens(path);

	if(array_mode)
	{
		try
		{
			QsNode spine = notation::array_parse(path, value, config_);
			spine.set_index(existing, config_.array_limit);
			return spine;
		}
		catch(const parse_error& e)
		{
			if(!e.recoverable())
				throw;

			syslog(LOG_DEBUG, "%s", e.what());
		}

		demote(st, path.base, existing);
	}

	return notation::lhs_parse(path, std::move(value), config_);
}

void
Parser::parse_token(state& st, const std::string& token, Charset charset) const
{
	if(std::count(token.begin(), token.end(), '=') != 1)
	{
		throw parse_error(error_kind::malformed_input,
			"Expected exactly one '=' in '" + token + "'");
	}

	std::tuple kvt = codec::split_by_eq(token);
	std::string key = codec::unquote(std::get<0>(kvt), charset);
	std::string value = codec::unquote(std::get<1>(kvt), charset);

	if(options_.interpret_numeric_entities)
	{
		key = codec::resolve_numeric_entities(key);
		value = codec::resolve_numeric_entities(value);
	}

	notation::KeyPath path = notation::split_key(key, config_.allow_dots);

	auto found = st.index.find(path.base);
	if(found == st.index.end() && st.groups.size() >= config_.parameter_limit)
		// Parameter limit reached, unseen keys are dropped
		return;

	QsNode* existing = found == st.index.end() ? nullptr : &st.groups[found->second];
	QsNode spine = build_spine(st, path, parse_value(value), existing);

	if(!existing)
	{
		st.index.emplace(path.base, st.groups.size());
		st.groups.push_back(std::move(spine));
		return;
	}

	existing->update(std::move(spine));
	if(existing->is_mixed())
		// Indices next to named keys: the whole group becomes an object
		demote(st, path.base, existing);
}

Mapping
Parser::parse(std::string_view input) const
{
	std::string_view query = options_.from_url ? query_component(input) : input;
	std::vector<std::string> tokens = tokenize(query);
	Charset charset = options_.charset;

	try
	{
		auto sentinel = tokens.end();
		if(options_.charset_sentinel)
		{
			sentinel = std::find_if(tokens.begin(), tokens.end(),
				[](const std::string& token)
				{
					return std::get<0>(codec::split_by_eq(token)) == codec::sentinel_key;
				});

			if(sentinel != tokens.end())
			{
				std::string raw = std::get<1>(codec::split_by_eq(*sentinel));
				std::optional<Charset> detected = codec::detect_charset(raw);
				if(!detected)
				{
					throw parse_error(error_kind::malformed_input,
						"Unknown charset sentinel '" + raw + "'");
				}
				charset = *detected;
			}
		}

		state st;
		for(auto it = tokens.begin(); it != tokens.end(); ++it)
		{
			if(it != sentinel)
				parse_token(st, *it, charset);
		}

		Mapping result;
		result.reserve(st.groups.size());
		for(auto& node : st.groups)
			result.emplace_back(to_string(node.key()), node.serialize(config_.allow_sparse));

		return result;
	}
	catch(const parse_error& e)
	{
		syslog(LOG_DEBUG, "Falling back to flat parsing (%s): %s",
			std::string(to_string(e.kind())).c_str(), e.what());
	}

	return codec::parse_qsl(tokens, charset, config_.allow_empty);
}

Mapping
parse(std::string_view input, const Config& config, const ParseOptions& options)
{
	return Parser{config, options}.parse(input);
}

} // namespace qsnest
