#include <string>
#include <string_view>

#include <boost/algorithm/string.hpp>

#include "qsnest/config.hpp"
#include "qsnest/errors.hpp"

namespace qsnest
{

Charset
charset_from_string(std::string_view name)
{
	if(boost::iequals(name, "utf-8") || boost::iequals(name, "utf8"))
		return Charset::utf8;

	if(boost::iequals(name, "iso-8859-1") || boost::iequals(name, "latin1"))
		return Charset::iso_8859_1;

	throw config_error("Unknown charset " + std::string(name));
}

std::string_view
to_string(Charset charset)
{
	switch(charset)
	{
	case Charset::utf8:
		return "utf-8";
	case Charset::iso_8859_1:
		return "iso-8859-1";
	}

	throw config_error("Invalid charset value");
}

ArrayFormat
array_format_from_string(std::string_view name)
{
	if(boost::iequals(name, "indices"))
		return ArrayFormat::indices;
	else if(boost::iequals(name, "brackets"))
		return ArrayFormat::brackets;
	else if(boost::iequals(name, "repeat"))
		return ArrayFormat::repeat;
	else if(boost::iequals(name, "comma"))
		return ArrayFormat::comma;

	throw config_error("Unknown array format " + std::string(name));
}

std::string_view
to_string(ArrayFormat format)
{
	switch(format)
	{
	case ArrayFormat::indices:
		return "indices";
	case ArrayFormat::brackets:
		return "brackets";
	case ArrayFormat::repeat:
		return "repeat";
	case ArrayFormat::comma:
		return "comma";
	}

	throw config_error("Invalid array format value");
}

std::string_view
to_string(error_kind kind)
{
	switch(kind)
	{
	case error_kind::malformed_input:
		return "malformed input";
	case error_kind::array_limit_exceeded:
		return "array limit exceeded";
	case error_kind::unbalanced_brackets:
		return "unbalanced brackets";
	case error_kind::empty_key:
		return "empty key";
	}

	return "unknown error";
}

} // namespace qsnest
