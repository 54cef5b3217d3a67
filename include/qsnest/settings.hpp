#ifndef QSNEST_SETTINGS_H
#define QSNEST_SETTINGS_H

#include <cstdint>
#include <string_view>

#include <toml++/toml.h>

#include "qsnest/config.hpp"

namespace qsnest
{

// Option values read from a TOML table. Missing keys take the library
// defaults; present keys of the wrong type or range throw config_error.
class Settings
{
public:
	explicit Settings(const toml::table&);

	const toml::table& get_config_table() const;

	Config get_config() const;
	ParseOptions get_parse_options() const;
	StringifyOptions get_stringify_options() const;
	std::string_view get_log_level() const;
private:
	template<class T>
	T get_value(std::string_view section, std::string_view key, T fallback) const;

	std::size_t get_size(std::string_view section, std::string_view key, std::size_t fallback) const;
	Charset get_charset(std::string_view section) const;

	toml::table tbl_;
};

} // namespace qsnest

#endif // QSNEST_SETTINGS_H
