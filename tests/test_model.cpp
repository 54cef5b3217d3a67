#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "qsnest/errors.hpp"
#include "qsnest/model.hpp"
#include "qsnest/parser.hpp"

using namespace qsnest;
using namespace qsnest::model;

namespace
{

OutputModel
people()
{
	return OutputModel{"person", {
		{"name", FieldTraits{true, true}},
		{"age", FieldTraits{true, true}},
		{"email", FieldTraits{false, true}},
		{"avatar", FieldTraits{false, false}},
	}};
}

Mapping
query(std::string_view q)
{
	Config config;
	config.parse_arrays = true;
	return parse(q, config);
}

// Counts the filters of a query
class CountingFactory : public FilterFactory<std::size_t>
{
public:
	std::size_t build_query(const Mapping& q, const OutputModel& m) const override
	{
		m.validate(q);

		std::size_t filters = 0;
		for(auto& [k, v] : q)
		{
			if(v.is_mapping() && m.is_filterable(to_string(k)))
				filters += v.as_mapping().size();
		}
		return filters;
	}
};

} // namespace

TEST(SortItem, Forms)
{
	EXPECT_EQ(parse_sort_item("name"), (SortItem{SortDirection::ascending, "name"}));
	EXPECT_EQ(parse_sort_item("+name"), (SortItem{SortDirection::ascending, "name"}));
	EXPECT_EQ(parse_sort_item("-name"), (SortItem{SortDirection::descending, "name"}));
	EXPECT_EQ(parse_sort_item("asc(age)"), (SortItem{SortDirection::ascending, "age"}));
	EXPECT_EQ(parse_sort_item("desc(age)"), (SortItem{SortDirection::descending, "age"}));
	EXPECT_EQ(parse_sort_item("age.asc"), (SortItem{SortDirection::ascending, "age"}));
	EXPECT_EQ(parse_sort_item("age.desc"), (SortItem{SortDirection::descending, "age"}));
}

TEST(SortItem, Invalid)
{
	EXPECT_THROW(parse_sort_item(""), validation_error);
	EXPECT_THROW(parse_sort_item("--name"), validation_error);
	EXPECT_THROW(parse_sort_item("up(name)"), validation_error);
	EXPECT_THROW(parse_sort_item("name.up"), validation_error);
	EXPECT_THROW(parse_sort_item("first name"), validation_error);
}

TEST(Operators, Known)
{
	for(auto op : {"eq", "ne", "neq", "gt", "ge", "gte", "lt", "le", "lte", "in", "nin"})
		EXPECT_TRUE(is_operator(op)) << op;

	EXPECT_FALSE(is_operator("like"));
	EXPECT_FALSE(is_operator(""));
}

TEST(OutputModel, ValidQuery)
{
	Mapping q = query("sort_by=-name&limit=10&offset=0&age[gte]=18&email[in][]=a&email[in][]=b");
	EXPECT_NO_THROW(people().validate(q));

	std::vector<SortItem> items = people().sort_items(q);
	ASSERT_EQ(items.size(), 1u);
	EXPECT_EQ(items.front(), (SortItem{SortDirection::descending, "name"}));
}

TEST(OutputModel, SortByList)
{
	Mapping q = query("sort_by[]=name&sort_by[]=age.desc");
	std::vector<SortItem> items = people().sort_items(q);
	ASSERT_EQ(items.size(), 2u);
	EXPECT_EQ(items[0].field, "name");
	EXPECT_EQ(items[1], (SortItem{SortDirection::descending, "age"}));

	EXPECT_TRUE(people().sort_items(query("age[gt]=1")).empty());
}

TEST(OutputModel, Violations)
{
	OutputModel model = people();
	EXPECT_THROW(model.validate(query("sort_by=email")), validation_error);
	EXPECT_THROW(model.validate(query("sort_by=-unknown")), validation_error);
	EXPECT_THROW(model.validate(query("sort_by=na%20me")), validation_error);
	EXPECT_THROW(model.validate(query("limit=-1")), validation_error);
	EXPECT_THROW(model.validate(query("offset=ten")), validation_error);
	EXPECT_THROW(model.validate(query("avatar[eq]=x")), validation_error);
	EXPECT_THROW(model.validate(query("shoe_size[eq]=9")), validation_error);
	EXPECT_THROW(model.validate(query("age=18")), validation_error);
	EXPECT_THROW(model.validate(query("age[like]=18")), validation_error);
}

TEST(OutputModel, PrimitiveLimit)
{
	ParseOptions options;
	options.parse_primitive = true;
	EXPECT_NO_THROW(people().validate(parse("limit=5", Config{}, options)));
	EXPECT_THROW(people().validate(parse("limit=-5", Config{}, options)), validation_error);
	EXPECT_THROW(people().validate(parse("limit=1.5", Config{}, options)), validation_error);
}

TEST(FilterFactory, BuildsFromValidatedQuery)
{
	CountingFactory factory;
	const FilterFactory<std::size_t>& base = factory;

	EXPECT_EQ(base.build_query(query("age[gte]=18&age[lt]=65&name[eq]=x&limit=3"), people()), 3u);
	EXPECT_THROW(base.build_query(query("avatar[eq]=x"), people()), validation_error);
}
