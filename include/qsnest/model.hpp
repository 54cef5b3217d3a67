#ifndef QSNEST_MODEL_H
#define QSNEST_MODEL_H

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "qsnest/value.hpp"

namespace qsnest::model
{

enum class SortDirection
{
	ascending = 1,
	descending = -1,
};

struct SortItem
{
	SortDirection direction;
	std::string field;

	bool operator==(const SortItem&) const = default;
};

// Accepts "f", "+f", "-f", "asc(f)", "desc(f)", "f.asc" and "f.desc".
// Throws validation_error for anything else.
SortItem parse_sort_item(std::string_view);

// One of eq ne neq gt ge gte lt le lte in nin
bool is_operator(std::string_view);

struct FieldTraits
{
	bool sortable = false;
	bool filterable = false;
};

// The fields a parsed query may sort and filter on.
//
// A query mapping holds the keywords sort_by, limit and offset, and one
// entry per filtered field mapping operators to values:
//   sort_by=-name&limit=10&age[gte]=18
class OutputModel
{
public:
	OutputModel(std::string name, std::map<std::string, FieldTraits> fields);

	const std::string& name() const { return name_; }
	const std::map<std::string, FieldTraits>& fields() const { return fields_; }

	bool is_sortable(const std::string&) const;
	bool is_filterable(const std::string&) const;

	// Throws validation_error when the query does not fit the model
	void validate(const Mapping&) const;

	// The validated sort_by keyword, empty when absent
	std::vector<SortItem> sort_items(const Mapping&) const;
private:
	std::string name_;
	std::map<std::string, FieldTraits> fields_;
};

// Turns a validated query mapping into a backend query
template<class Query>
class FilterFactory
{
public:
	virtual ~FilterFactory() = default;

	virtual Query build_query(const Mapping&, const OutputModel&) const = 0;
};

} // namespace qsnest::model

#endif // QSNEST_MODEL_H
