#include <cstdint>
#include <string_view>

#include <gtest/gtest.h>

#include "qsnest/errors.hpp"
#include "qsnest/parser.hpp"

using namespace qsnest;

namespace
{

Value
parsed(std::string_view query, const Config& config = {}, const ParseOptions& options = {})
{
	return Value{parse(query, config, options)};
}

Config
arrays()
{
	Config config;
	config.parse_arrays = true;
	return config;
}

constexpr std::int64_t
operator""_i(unsigned long long i)
{
	return static_cast<std::int64_t>(i);
}

} // namespace

TEST(Parse, PlainKeys)
{
	EXPECT_EQ(parsed("a=b"), Value(Mapping{{"a", "b"}}));
	EXPECT_EQ(parsed("a=b&c=d"), Value(Mapping{{"a", "b"}, {"c", "d"}}));
	EXPECT_EQ(parsed("a.b=c"), Value(Mapping{{"a.b", "c"}}));
	EXPECT_EQ(parsed(""), Value(Mapping{}));
}

TEST(Parse, DecodesKeysAndValues)
{
	EXPECT_EQ(parsed("a%5Bb%5D=c+d%21"), Value(Mapping{{"a", Mapping{{"b", "c d!"}}}}));
}

TEST(Parse, RepeatedKeysAccumulate)
{
	EXPECT_EQ(parsed("a=b&a=c&a=d"), Value(Mapping{{"a", List{"b", "c", "d"}}}));
}

TEST(Parse, Nested)
{
	EXPECT_EQ(parsed("a[b][c]=d&a[e]=f"),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"c", "d"}}}, {"e", "f"}}}}));
}

TEST(Parse, DepthFold)
{
	Config config;
	EXPECT_EQ(parsed("a[b][c][d][e][f][g][h][i]=j", config),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"c", Mapping{{"d", Mapping{{"e",
			Mapping{{"f", Mapping{{"[g][h][i]", "j"}}}}}}}}}}}}}}));

	config.depth = 1;
	EXPECT_EQ(parsed("a[b][c][d][e][f][g][h][i]=j", config),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"[c][d][e][f][g][h][i]", "j"}}}}}}));
}

TEST(Parse, DotsWithDepthFold)
{
	Config config;
	config.allow_dots = true;
	config.depth = 1;
	EXPECT_EQ(parsed("a.b.c.d=e", config),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"c.d", "e"}}}}}}));

	config.depth = 5;
	EXPECT_EQ(parsed("a.b=c&a[d]=e", config),
		Value(Mapping{{"a", Mapping{{"b", "c"}, {"d", "e"}}}}));
}

TEST(Parse, ArrayIndexAssignment)
{
	Value expected{Mapping{{"a", Mapping{{0_i, "b"}, {1_i, "c"}}}}};
	EXPECT_EQ(parsed("a[]=b&a[]=c", arrays()), expected);
	EXPECT_EQ(parsed("a[1]=c&a[0]=b", arrays()), expected);
	EXPECT_EQ(parsed("a[0]=b&a[]=c", arrays()), expected);
}

TEST(Parse, SparseArraysAsLists)
{
	Config config = arrays();
	config.allow_sparse = true;
	EXPECT_EQ(parsed("a[1]=b&a[3]=c", config), Value(Mapping{{"a", List{nullptr, "b", nullptr, "c"}}}));
	EXPECT_EQ(parsed("a[]=b&a[]=c", config), Value(Mapping{{"a", List{"b", "c"}}}));
}

TEST(Parse, NestedArrays)
{
	EXPECT_EQ(parsed("a[][b]=c", arrays()),
		Value(Mapping{{"a", Mapping{{0_i, Mapping{{"b", "c"}}}}}}));
	EXPECT_EQ(parsed("a[][1]=c", arrays()), Value(Mapping{{"a", Mapping{{1_i, "c"}}}}));
	EXPECT_EQ(parsed("a[0][]=b&a[0][]=c", arrays()),
		Value(Mapping{{"a", Mapping{{0_i, Mapping{{0_i, "b"}, {1_i, "c"}}}}}}));
}

TEST(Parse, ArrayLimitDowngrade)
{
	EXPECT_EQ(parsed("a[100]=b", arrays()), Value(Mapping{{"a", Mapping{{"100", "b"}}}}));

	Config config = arrays();
	config.array_limit = 0;
	EXPECT_EQ(parsed("a[1]=b", config), Value(Mapping{{"a", Mapping{{"1", "b"}}}}));
	EXPECT_EQ(parsed("a[0]=b", config), Value(Mapping{{"a", Mapping{{0_i, "b"}}}}));
}

TEST(Parse, DowngradeIsPerKeyGroup)
{
	EXPECT_EQ(parsed("a[0]=b&c[100]=d&a[1]=e", arrays()),
		Value(Mapping{
			{"a", Mapping{{0_i, "b"}, {1_i, "e"}}},
			{"c", Mapping{{"100", "d"}}}}));
}

TEST(Parse, DowngradedGroupStaysObject)
{
	EXPECT_EQ(parsed("a[100]=b&a[1]=c", arrays()),
		Value(Mapping{{"a", Mapping{{"100", "b"}, {"1", "c"}}}}));
}

TEST(Parse, MixedArrayAndObjectKeys)
{
	EXPECT_EQ(parsed("a[]=b&a[c]=d", arrays()),
		Value(Mapping{{"a", Mapping{{"0", "b"}, {"c", "d"}}}}));
}

TEST(Parse, DemotionMergesFlagWithIndex)
{
	EXPECT_EQ(parsed("a=0&a[0]=x", arrays()),
		Value(Mapping{{"a", Mapping{{"0", List{true, "x"}}}}}));
	EXPECT_EQ(parsed("a[b]=0&a[b][0]=x", arrays()),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"0", List{true, "x"}}}}}}}));
	EXPECT_EQ(parsed("a=0&a[0]=x&a[1]=y", arrays()),
		Value(Mapping{{"a", Mapping{{"0", List{true, "x"}}, {"1", "y"}}}}));

	// The same keys without array parsing
	EXPECT_EQ(parsed("a=0&a[0]=x"), Value(Mapping{{"a", Mapping{{"0", List{true, "x"}}}}}));

	Mapping result = parse("a[b]=0&a[b][0]=x", arrays());
	ASSERT_EQ(result.size(), 1u);
	const Value* b = result.front().second.find("b");
	ASSERT_NE(b, nullptr);
	EXPECT_EQ(b->as_mapping().size(), 1u);
}

TEST(Parse, DeepKeyKeepsArrayGroup)
{
	EXPECT_EQ(parsed("a[0]=x&a[0][b][c][d][e][f]=y", arrays()),
		Value(Mapping{{"a", Mapping{{0_i, Mapping{
			{"x", true},
			{"b", Mapping{{"c", Mapping{{"d", Mapping{{"e", Mapping{{"[f]", "y"}}}}}}}}}}}}}}));

	Config config = arrays();
	config.depth = 1;
	EXPECT_EQ(parsed("a[]=b&a[0][c][d]=e", config),
		Value(Mapping{{"a", Mapping{{0_i, Mapping{{"b", true}, {"[c][d]", "e"}}}}}}));
}

TEST(Parse, ArraysOff)
{
	EXPECT_EQ(parsed("a[0]=b&a[1]=c"),
		Value(Mapping{{"a", Mapping{{"0", "b"}, {"1", "c"}}}}));

	// Empty brackets are empty keys without array parsing
	EXPECT_EQ(parsed("a[]=b&a[]=c&"), Value(Mapping{{"a[]", List{"b", "c"}}}));
}

TEST(Parse, AllowEmpty)
{
	Config config;
	config.allow_empty = true;
	EXPECT_EQ(parsed("a[]=&b[]=", config),
		Value(Mapping{{"a", Mapping{{"", ""}}}, {"b", Mapping{{"", ""}}}}));

	config.parse_arrays = true;
	EXPECT_EQ(parsed("a[]=&a[]=b", config), Value(Mapping{{"a", Mapping{{0_i, ""}, {1_i, "b"}}}}));
}

TEST(Parse, MergeConflicts)
{
	EXPECT_EQ(parsed("a[b]=c&a[b][d]=e"),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"d", "e"}, {"c", true}}}}}}));

	EXPECT_EQ(parsed("a[b]=c&a[b][c]=d"),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"c", List{true, "d"}}}}}}}));

	EXPECT_EQ(parsed("a[b]=c&a[b]=f&a[b][d]=e"),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"[c,f]", true}, {"d", "e"}}}}}}));

	EXPECT_EQ(parsed("a[b][d]=e&a[b]=c"),
		Value(Mapping{{"a", Mapping{{"b", Mapping{{"d", "e"}, {"c", true}}}}}}));
}

TEST(Parse, ParameterLimit)
{
	Config config;
	config.parameter_limit = 1;
	EXPECT_EQ(parsed("a=b&c=d", config), Value(Mapping{{"a", "b"}}));
	EXPECT_EQ(parsed("a=b&a=c", config), Value(Mapping{{"a", List{"b", "c"}}}));
	EXPECT_EQ(parsed("a[b]=c&d=e&a[f]=g", config),
		Value(Mapping{{"a", Mapping{{"b", "c"}, {"f", "g"}}}}));
}

TEST(Parse, MalformedFallsBackToFlat)
{
	EXPECT_EQ(parsed("a[b=c"), Value(Mapping{{"a[b", List{"c"}}}));
	EXPECT_EQ(parsed("a[b]c=d&e=f"), Value(Mapping{{"a[b]c", List{"d"}}, {"e", List{"f"}}}));
	EXPECT_EQ(parsed("a=%zz&b=c"), Value(Mapping{{"a", List{"%zz"}}, {"b", List{"c"}}}));
	EXPECT_EQ(parsed("a=b=c"), Value(Mapping{{"a", List{"b=c"}}}));
	EXPECT_EQ(parsed("this_is_unparsable"), Value(Mapping{}));
}

TEST(Parse, FromUrl)
{
	ParseOptions options;
	options.from_url = true;
	EXPECT_EQ(parsed("https://example.com/path?a=b&c=d#top", {}, options),
		Value(Mapping{{"a", "b"}, {"c", "d"}}));
	EXPECT_EQ(parsed("https://example.com/path", {}, options), Value(Mapping{}));
}

TEST(Parse, Delimiters)
{
	ParseOptions options;
	options.delimiter = ";";
	EXPECT_EQ(parsed("a=b;c=d", {}, options), Value(Mapping{{"a", "b"}, {"c", "d"}}));

	options.delimiter = "[;,]";
	options.delimiter_is_regex = true;
	EXPECT_EQ(parsed("a=b;c=d,e=f", {}, options),
		Value(Mapping{{"a", "b"}, {"c", "d"}, {"e", "f"}}));
}

TEST(Parse, BadDelimiters)
{
	ParseOptions options;
	options.delimiter = "";
	EXPECT_THROW((Parser{Config{}, options}), config_error);

	options.delimiter = "[";
	options.delimiter_is_regex = true;
	EXPECT_THROW((Parser{Config{}, options}), config_error);
}

TEST(Parse, Comma)
{
	Config config;
	config.comma = true;
	EXPECT_EQ(parsed("a=b,c", config), Value(Mapping{{"a", List{"b", "c"}}}));
	EXPECT_EQ(parsed("a=b,c"), Value(Mapping{{"a", "b,c"}}));
}

TEST(Parse, BracketedListValues)
{
	EXPECT_EQ(parsed("a=[b,c]"), Value(Mapping{{"a", List{"b", "c"}}}));
	EXPECT_EQ(parsed("a=[]"), Value(Mapping{{"a", List{}}}));
}

TEST(Parse, Primitives)
{
	ParseOptions options;
	options.parse_primitive = true;
	EXPECT_EQ(parsed("a=[1,a,true,null]", {}, options),
		Value(Mapping{{"a", List{1, "a", true, nullptr}}}));
	EXPECT_EQ(parsed("a=1.5&b=-2&c=1e3&d=inf&e=False", {}, options),
		Value(Mapping{{"a", 1.5}, {"b", -2}, {"c", 1000.0}, {"d", "inf"}, {"e", "False"}}));

	options.primitive_strict = false;
	EXPECT_EQ(parsed("a=False&b=NULL&c=none", {}, options),
		Value(Mapping{{"a", false}, {"b", nullptr}, {"c", nullptr}}));

	EXPECT_EQ(parsed("a=1&b=true"), Value(Mapping{{"a", "1"}, {"b", "true"}}));
}

TEST(Parse, CharsetSentinel)
{
	ParseOptions options;
	options.charset = Charset::iso_8859_1;
	options.charset_sentinel = true;
	EXPECT_EQ(parsed("utf8=%E2%9C%93&a=%C3%B8", {}, options), Value(Mapping{{"a", "\xC3\xB8"}}));

	options.charset = Charset::utf8;
	EXPECT_EQ(parsed("a=%A7&utf8=%26%2310003", {}, options), Value(Mapping{{"a", "\xC2\xA7"}}));
}

TEST(Parse, UnknownSentinelFallsBack)
{
	ParseOptions options;
	options.charset_sentinel = true;
	EXPECT_EQ(parsed("utf8=%2BJxM-&a=b", {}, options),
		Value(Mapping{{"a", List{"b"}}, {"utf8", List{"+JxM-"}}}));
}

TEST(Parse, SentinelIgnoredWhenOff)
{
	EXPECT_EQ(parsed("utf8=%E2%9C%93&a=b"),
		Value(Mapping{{"utf8", "\xE2\x9C\x93"}, {"a", "b"}}));
}

TEST(Parse, NumericEntities)
{
	ParseOptions options;
	options.charset = Charset::iso_8859_1;
	options.interpret_numeric_entities = true;
	EXPECT_EQ(parsed("a=%26%239786%3B", {}, options), Value(Mapping{{"a", "\xE2\x98\xBA"}}));

	options.interpret_numeric_entities = false;
	EXPECT_EQ(parsed("a=%26%239786%3B", {}, options), Value(Mapping{{"a", "&#9786;"}}));
}

TEST(Parse, ParserIsReusable)
{
	Parser parser{arrays(), ParseOptions{}};
	EXPECT_EQ(Value{parser.parse("a[]=b")}, Value(Mapping{{"a", Mapping{{0_i, "b"}}}}));
	EXPECT_EQ(Value{parser.parse("a[]=c")}, Value(Mapping{{"a", Mapping{{0_i, "c"}}}}));
}
