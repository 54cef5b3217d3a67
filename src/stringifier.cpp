#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "qsnest/codec.hpp"
#include "qsnest/errors.hpp"
#include "qsnest/stringifier.hpp"

namespace qsnest
{

// Text of a leaf value; null is empty, lists are comma joined
static std::string
value_text(const Value& v)
{
	if(v.is_null())
		return std::string{};

	if(v.is_list())
	{
		std::vector<std::string> items;
		for(auto& item : v.as_list())
			items.push_back(value_text(item));
		return boost::algorithm::join(items, ",");
	}

	return to_string(v);
}

Stringifier::Stringifier(const Config& config, const StringifyOptions& options)
	: config_(config)
	, options_(options)
{
	// Both throw config_error for values outside their enum
	to_string(options_.array_format);
	to_string(options_.charset);
}

void
Stringifier::flatten(const QsNode& node, std::vector<NodeKey>& path, std::vector<flat_pair>& out) const
{
	path.push_back(node.key());

	if(node.is_leaf())
	{
		// A leaf without a value yields nothing
		if(node.value())
		{
			const Value& v = *node.value();
			if(v.is_list())
			{
				for(auto& item : v.as_list())
					out.push_back(flat_pair{path, value_text(item)});
			}
			else
			{
				out.push_back(flat_pair{path, value_text(v)});
			}
		}
	}
	else if(options_.array_format == ArrayFormat::comma && node.is_default_array())
	{
		std::vector<std::string> items;
		for(auto& child : node.children())
		{
			if(child.value())
				items.push_back(value_text(*child.value()));
		}
		out.push_back(flat_pair{path, boost::algorithm::join(items, ",")});
	}
	else
	{
		for(auto& child : node.children())
			flatten(child, path, out);
	}

	path.pop_back();
}

std::string
Stringifier::format_key(const std::vector<NodeKey>& path) const
{
	std::string key = to_string(path.front());

	for(auto it = path.begin() + 1; it != path.end(); ++it)
	{
		if(std::holds_alternative<std::int64_t>(*it))
		{
			switch(options_.array_format)
			{
			case ArrayFormat::indices:
			case ArrayFormat::comma:
				key += "[" + to_string(*it) + "]";
				break;
			case ArrayFormat::brackets:
				key += "[]";
				break;
			case ArrayFormat::repeat:
				break;
			}
		}
		else if(config_.allow_dots)
		{
			key += "." + to_string(*it);
		}
		else
		{
			key += "[" + to_string(*it) + "]";
		}
	}

	return key;
}

std::vector<std::pair<std::string, std::string>>
Stringifier::combine(std::vector<flat_pair>&& pairs) const
{
	std::vector<std::pair<std::string, std::vector<std::string>>> grouped;
	std::unordered_map<std::string, std::size_t> index;

	for(auto& p : pairs)
	{
		std::string key = format_key(p.path);
		auto found = index.find(key);
		if(found == index.end())
		{
			index.emplace(key, grouped.size());
			grouped.emplace_back(std::move(key), std::vector<std::string>{std::move(p.value)});
		}
		else
		{
			grouped[found->second].second.push_back(std::move(p.value));
		}
	}

	bool repeat_keys = options_.array_format == ArrayFormat::repeat ||
		options_.array_format == ArrayFormat::brackets;

	std::vector<std::pair<std::string, std::string>> combined;
	for(auto& [key, values] : grouped)
	{
		if(repeat_keys)
		{
			for(auto& v : values)
				combined.emplace_back(key, std::move(v));
		}
		else
		{
			combined.emplace_back(key, boost::algorithm::join(values, ","));
		}
	}

	return combined;
}

std::string
Stringifier::stringify(const Mapping& data) const
{
	const std::vector<Key>* filter = options_.filter ? &*options_.filter : nullptr;

	std::vector<flat_pair> pairs;
	std::vector<NodeKey> path;
	for(auto& [k, v] : data)
	{
		NodeKey key;
		if(std::holds_alternative<std::int64_t>(k))
			key = std::get<std::int64_t>(k);
		else
			key = std::get<std::string>(k);

		std::optional<QsNode> node = QsNode::load(std::move(key), v, filter);
		if(node)
			flatten(*node, path, pairs);
	}

	std::vector<std::pair<std::string, std::string>> combined = combine(std::move(pairs));

	if(options_.sort)
	{
		std::stable_sort(combined.begin(), combined.end(),
			[reverse = options_.sort_reverse](const auto& a, const auto& b)
			{
				return reverse ? b.first < a.first : a.first < b.first;
			});
	}

	bool encode_keys = options_.encode && !options_.encode_values_only;
	bool encode_values = options_.encode || options_.encode_values_only;

	std::vector<std::string> out;
	out.reserve(combined.size() + 1);

	if(options_.charset_sentinel)
	{
		std::string sentinel{codec::sentinel_key};
		sentinel += '=';
		sentinel += options_.charset == Charset::utf8 ? codec::utf8_sentinel : codec::iso_sentinel;
		out.push_back(std::move(sentinel));
	}

	for(auto& [key, value] : combined)
	{
		std::string pair = encode_keys ? codec::quote(key, options_.charset) : key;
		pair += '=';
		pair += encode_values ? codec::quote(value, options_.charset) : value;
		out.push_back(std::move(pair));
	}

	return boost::algorithm::join(out, options_.delimiter);
}

std::string
stringify(const Mapping& data, const Config& config, const StringifyOptions& options)
{
	return Stringifier{config, options}.stringify(data);
}

} // namespace qsnest
