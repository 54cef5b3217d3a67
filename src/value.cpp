#include <algorithm>
#include <charconv>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>

#include "qsnest/value.hpp"

namespace qsnest
{

namespace
{

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string
format_double(double d)
{
	char buf[32];
	auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
	if(ec != std::errc{})
		return "nan";

	return std::string(buf, end);
}

void
quote(std::ostream& os, std::string_view s)
{
	os << '"';
	for(char c : s)
	{
		switch(c)
		{
		case '"':
			os << "\\\"";
			break;
		case '\\':
			os << "\\\\";
			break;
		case '\n':
			os << "\\n";
			break;
		default:
			os << c;
			break;
		}
	}
	os << '"';
}

void
write_repr(std::ostream& os, const Value& v)
{
	std::visit(overloaded{
		[&os](const Scalar& s)
		{
			if(std::holds_alternative<std::string>(s))
				quote(os, std::get<std::string>(s));
			else
				os << to_string(s);
		},
		[&os](const List& l)
		{
			os << '[';
			for(std::size_t i = 0; i < l.size(); i++)
			{
				if(i)
					os << ", ";
				write_repr(os, l[i]);
			}
			os << ']';
		},
		[&os](const Mapping& m)
		{
			os << '{';
			for(std::size_t i = 0; i < m.size(); i++)
			{
				if(i)
					os << ", ";
				if(std::holds_alternative<std::string>(m[i].first))
					quote(os, std::get<std::string>(m[i].first));
				else
					os << std::get<std::int64_t>(m[i].first);
				os << ": ";
				write_repr(os, m[i].second);
			}
			os << '}';
		},
	}, v.data());
}

} // namespace

bool
Value::is_null() const
{
	return is_scalar() && std::holds_alternative<std::nullptr_t>(as_scalar());
}

bool
Value::is_string() const
{
	return is_scalar() && std::holds_alternative<std::string>(as_scalar());
}

const std::string&
Value::as_string() const
{
	return std::get<std::string>(as_scalar());
}

const Value*
Value::find(const Key& key) const
{
	if(!is_mapping())
		return nullptr;

	for(auto& [k, v] : as_mapping())
	{
		if(k == key)
			return &v;
	}

	return nullptr;
}

bool
operator==(const Value& a, const Value& b)
{
	if(a.data().index() != b.data().index())
		return false;

	if(a.is_scalar())
		return a.as_scalar() == b.as_scalar();

	if(a.is_list())
		return a.as_list() == b.as_list();

	const Mapping& ma = a.as_mapping();
	const Mapping& mb = b.as_mapping();
	if(ma.size() != mb.size())
		return false;

	return std::all_of(ma.begin(), ma.end(),
		[&b](const auto& entry)
		{
			const Value* other = b.find(entry.first);
			return other && *other == entry.second;
		});
}

std::string
to_string(const Scalar& s)
{
	return std::visit(overloaded{
		[](std::nullptr_t) -> std::string { return "null"; },
		[](bool b) -> std::string { return b ? "true" : "false"; },
		[](std::int64_t i) -> std::string { return std::to_string(i); },
		[](double d) -> std::string { return format_double(d); },
		[](const std::string& str) -> std::string { return str; },
	}, s);
}

std::string
to_string(const Value& v)
{
	if(v.is_scalar())
		return to_string(v.as_scalar());

	if(v.is_list())
	{
		std::string out{"["};
		const List& l = v.as_list();
		for(std::size_t i = 0; i < l.size(); i++)
		{
			if(i)
				out += ',';
			out += to_string(l[i]);
		}
		out += ']';
		return out;
	}

	return to_repr(v);
}

std::string
to_string(const Key& k)
{
	if(std::holds_alternative<std::int64_t>(k))
		return std::to_string(std::get<std::int64_t>(k));

	return std::get<std::string>(k);
}

std::string
to_repr(const Value& v)
{
	std::ostringstream ss;
	write_repr(ss, v);
	return ss.str();
}

std::ostream&
operator<<(std::ostream& os, const Value& v)
{
	write_repr(os, v);
	return os;
}

} // namespace qsnest
