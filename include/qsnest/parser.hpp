#ifndef QSNEST_PARSER_H
#define QSNEST_PARSER_H

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "qsnest/config.hpp"
#include "qsnest/node.hpp"
#include "qsnest/notation.hpp"
#include "qsnest/value.hpp"

namespace qsnest
{

// Turns a query string into a nested Mapping. A Parser holds no per-call
// state and can be reused.
class Parser
{
public:
	// Throws config_error for an empty delimiter or an invalid delimiter
	// regular expression.
	Parser(const Config&, const ParseOptions&);

	// Never throws parse_error: input that cannot be parsed structurally
	// comes back as a flat mapping of raw keys to lists of values.
	Mapping parse(std::string_view) const;

	const Config& config() const { return config_; }
	const ParseOptions& options() const { return options_; }
private:
	// Top-level groups of one parse() call
	struct state
	{
		std::vector<QsNode> groups;
		std::unordered_map<std::string, std::size_t> index;

		// Groups that fell back from array to object notation
		std::unordered_set<std::string> demoted;
	};

	std::vector<std::string> tokenize(std::string_view) const;
	Value parse_value(const std::string&) const;
	Scalar coerce(std::string) const;

	void parse_token(state&, const std::string&, Charset) const;
	QsNode build_spine(state&, const notation::KeyPath&, Value, QsNode* existing) const;
	void demote(state&, const std::string& base, QsNode* existing) const;

	Config config_;
	ParseOptions options_;
	std::optional<std::regex> delimiter_re_;
};

Mapping parse(std::string_view, const Config& = {}, const ParseOptions& = {});

} // namespace qsnest

#endif // QSNEST_PARSER_H
