#ifndef QSNEST_STRINGIFIER_H
#define QSNEST_STRINGIFIER_H

#include <string>
#include <utility>
#include <vector>

#include "qsnest/config.hpp"
#include "qsnest/node.hpp"
#include "qsnest/value.hpp"

namespace qsnest
{

// Turns a nested Mapping back into a query string
class Stringifier
{
public:
	// Throws config_error for an array format or charset outside the enum
	Stringifier(const Config&, const StringifyOptions&);

	std::string stringify(const Mapping&) const;

	const Config& config() const { return config_; }
	const StringifyOptions& options() const { return options_; }
private:
	// A leaf value and the keys leading to it
	struct flat_pair
	{
		std::vector<NodeKey> path;
		std::string value;
	};

	void flatten(const QsNode&, std::vector<NodeKey>& path, std::vector<flat_pair>& out) const;
	std::string format_key(const std::vector<NodeKey>& path) const;
	std::vector<std::pair<std::string, std::string>> combine(std::vector<flat_pair>&&) const;

	Config config_;
	StringifyOptions options_;
};

std::string stringify(const Mapping&, const Config& = {}, const StringifyOptions& = {});

} // namespace qsnest

#endif // QSNEST_STRINGIFIER_H
