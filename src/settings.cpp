#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

#include "qsnest/errors.hpp"
#include "qsnest/settings.hpp"

namespace qsnest
{

Settings::Settings(const toml::table& tbl)
	: tbl_(tbl)
{
}

const toml::table& Settings::get_config_table() const
{
	return tbl_;
}

template<class T>
T Settings::get_value(std::string_view section, std::string_view key, T fallback) const
{
	toml::node_view<const toml::node> node = tbl_[section][key];
	if(!node)
		return fallback;

	std::optional<T> cfg_value = node.value<T>();
	if(!cfg_value)
	{
		throw config_error("Bad value for " + std::string(section) + "." +
			std::string(key));
	}

	return *cfg_value;
}

std::size_t Settings::get_size(std::string_view section, std::string_view key, std::size_t fallback) const
{
	std::int64_t cfg_size = get_value<std::int64_t>(section, key, static_cast<std::int64_t>(fallback));
	if(cfg_size < 0)
	{
		throw config_error(std::string(section) + "." + std::string(key) +
			" must not be negative");
	}

	return static_cast<std::size_t>(cfg_size);
}

Charset Settings::get_charset(std::string_view section) const
{
	std::optional<std::string_view> cfg_charset = tbl_[section]["charset"].value<std::string_view>();
	if(!cfg_charset)
		return Charset::utf8;

	return charset_from_string(*cfg_charset);
}

Config Settings::get_config() const
{
	Config config;
	config.depth = get_size("dialect", "depth", config.depth);
	config.parameter_limit = get_size("dialect", "parameter_limit", config.parameter_limit);
	config.allow_dots = get_value("dialect", "allow_dots", config.allow_dots);
	config.allow_sparse = get_value("dialect", "allow_sparse", config.allow_sparse);
	config.array_limit = get_value("dialect", "array_limit", config.array_limit);
	config.parse_arrays = get_value("dialect", "parse_arrays", config.parse_arrays);
	config.allow_empty = get_value("dialect", "allow_empty", config.allow_empty);
	config.comma = get_value("dialect", "comma", config.comma);
	return config;
}

ParseOptions Settings::get_parse_options() const
{
	ParseOptions options;
	options.from_url = get_value("parse", "from_url", options.from_url);
	options.delimiter = get_value("parse", "delimiter", options.delimiter);
	options.delimiter_is_regex = get_value("parse", "delimiter_is_regex", options.delimiter_is_regex);
	options.charset = get_charset("parse");
	options.charset_sentinel = get_value("parse", "charset_sentinel", options.charset_sentinel);
	options.interpret_numeric_entities = get_value("parse", "interpret_numeric_entities",
		options.interpret_numeric_entities);
	options.parse_primitive = get_value("parse", "parse_primitive", options.parse_primitive);
	options.primitive_strict = get_value("parse", "primitive_strict", options.primitive_strict);
	return options;
}

StringifyOptions Settings::get_stringify_options() const
{
	StringifyOptions options;
	options.encode = get_value("stringify", "encode", options.encode);
	options.encode_values_only = get_value("stringify", "encode_values_only", options.encode_values_only);
	options.delimiter = get_value("stringify", "delimiter", options.delimiter);
	options.sort = get_value("stringify", "sort", options.sort);
	options.sort_reverse = get_value("stringify", "sort_reverse", options.sort_reverse);
	options.charset = get_charset("stringify");
	options.charset_sentinel = get_value("stringify", "charset_sentinel", options.charset_sentinel);

	std::optional<std::string_view> cfg_format = tbl_["stringify"]["array_format"].value<std::string_view>();
	if(cfg_format)
		options.array_format = array_format_from_string(*cfg_format);

	if(const toml::array* cfg_filter = tbl_["stringify"]["filter"].as_array())
	{
		std::vector<Key> filter;
		for(const toml::node& item : *cfg_filter)
		{
			if(std::optional<std::string> name = item.value<std::string>())
				filter.emplace_back(std::move(*name));
			else if(std::optional<std::int64_t> index = item.value<std::int64_t>())
				filter.emplace_back(*index);
			else
				throw config_error("stringify.filter entries must be strings or integers");
		}
		options.filter = std::move(filter);
	}

	return options;
}

std::string_view Settings::get_log_level() const
{
	std::optional<std::string_view> cfg_loglevel = tbl_["log"]["level"].value<std::string_view>();
	if(!cfg_loglevel)
		return "info";

	return *cfg_loglevel;
}

} // namespace qsnest
