#include <algorithm>
#include <array>
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "qsnest/errors.hpp"
#include "qsnest/model.hpp"
#include "qsnest/notation.hpp"

namespace qsnest::model
{

static constexpr std::array<std::string_view, 11> operators{
	"eq", "ne", "neq", "gt", "ge", "gte", "lt", "le", "lte", "in", "nin",
};

SortItem
parse_sort_item(std::string_view item)
{
	static const std::regex signed_re{R"(^([+-]?)(\w+)$)"};
	static const std::regex call_re{R"(^(asc|desc)\((\w+)\)$)"};
	static const std::regex suffix_re{R"(^(\w+)\.(asc|desc)$)"};

	std::cmatch m;
	const char* first = item.data();
	const char* last = first + item.size();

	if(std::regex_match(first, last, m, signed_re))
	{
		return SortItem{m.str(1) == "-" ? SortDirection::descending : SortDirection::ascending,
			m.str(2)};
	}

	if(std::regex_match(first, last, m, call_re))
	{
		return SortItem{m.str(1) == "desc" ? SortDirection::descending : SortDirection::ascending,
			m.str(2)};
	}

	if(std::regex_match(first, last, m, suffix_re))
	{
		return SortItem{m.str(2) == "desc" ? SortDirection::descending : SortDirection::ascending,
			m.str(1)};
	}

	throw validation_error("Invalid sort item " + std::string(item));
}

bool
is_operator(std::string_view op)
{
	return std::find(operators.begin(), operators.end(), op) != operators.end();
}

// Non-negative integer, given as a number or as its digits
static bool
is_count(const Value& v)
{
	if(!v.is_scalar())
		return false;

	const Scalar& s = v.as_scalar();
	if(const std::int64_t* i = std::get_if<std::int64_t>(&s))
		return *i >= 0;
	if(const std::string* str = std::get_if<std::string>(&s))
		return notation::is_index_token(*str);

	return false;
}

OutputModel::OutputModel(std::string name, std::map<std::string, FieldTraits> fields)
	: name_(std::move(name))
	, fields_(std::move(fields))
{
}

bool
OutputModel::is_sortable(const std::string& field) const
{
	auto it = fields_.find(field);
	return it != fields_.end() && it->second.sortable;
}

bool
OutputModel::is_filterable(const std::string& field) const
{
	auto it = fields_.find(field);
	return it != fields_.end() && it->second.filterable;
}

std::vector<SortItem>
OutputModel::sort_items(const Mapping& query) const
{
	std::vector<SortItem> items;

	auto it = std::find_if(query.begin(), query.end(),
		[](const auto& entry)
		{
			const std::string* k = std::get_if<std::string>(&entry.first);
			return k && *k == "sort_by";
		});
	if(it == query.end())
		return items;

	auto add = [this, &items](const Value& v)
	{
		if(!v.is_string())
			throw validation_error("sort_by entries of " + name_ + " must be strings");

		SortItem item = parse_sort_item(v.as_string());
		if(!is_sortable(item.field))
			throw validation_error("Field " + item.field + " of " + name_ + " is not sortable");

		items.push_back(std::move(item));
	};

	const Value& sort_by = it->second;
	if(sort_by.is_list())
	{
		for(auto& v : sort_by.as_list())
			add(v);
	}
	else if(sort_by.is_mapping())
	{
		// sort_by[]=a&sort_by[]=b without sparse lists
		for(auto& [k, v] : sort_by.as_mapping())
		{
			if(!std::holds_alternative<std::int64_t>(k))
				throw validation_error("sort_by of " + name_ + " must be a string or a list");
			add(v);
		}
	}
	else
	{
		add(sort_by);
	}

	return items;
}

void
OutputModel::validate(const Mapping& query) const
{
	sort_items(query);

	for(auto& [k, v] : query)
	{
		if(!std::holds_alternative<std::string>(k))
			throw validation_error("Unexpected index " + to_string(k) + " in query for " + name_);

		const std::string& key = std::get<std::string>(k);
		if(key == "sort_by")
			continue;

		if(key == "limit" || key == "offset")
		{
			if(!is_count(v))
				throw validation_error(key + " must be a non-negative integer");
			continue;
		}

		if(!is_filterable(key))
			throw validation_error("Field " + key + " of " + name_ + " is not filterable");

		if(!v.is_mapping())
			throw validation_error("Filter on " + key + " must map operators to values");

		for(auto& [op, operand] : v.as_mapping())
		{
			if(!std::holds_alternative<std::string>(op) || !is_operator(std::get<std::string>(op)))
				throw validation_error("Invalid operator " + to_string(op) + " on " + key);
		}
	}
}

} // namespace qsnest::model
