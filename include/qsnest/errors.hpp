#ifndef QSNEST_ERRORS_H
#define QSNEST_ERRORS_H

#include <stdexcept>
#include <string>
#include <string_view>

namespace qsnest
{

// Every way a query string can fail to parse structurally.
enum class error_kind
{
	malformed_input,	// Bad percent-encoding, stray '=', junk after a ']'
	array_limit_exceeded,	// An index above array_limit
	unbalanced_brackets,	// Nested, unmatched or unclosed brackets
	empty_key,		// An empty key where allow_empty is off
};

std::string_view to_string(error_kind);

class parse_error : public std::runtime_error
{
public:
	parse_error(error_kind kind, const std::string& what)
		: std::runtime_error(what)
		, kind_(kind)
	{
	}

	error_kind kind() const { return kind_; }

	// array_limit_exceeded is recovered by demoting the key group;
	// everything else aborts the structural parse.
	bool recoverable() const { return kind_ == error_kind::array_limit_exceeded; }
private:
	error_kind kind_;
};

// Bad option values, raised when the options are built.
class config_error : public std::invalid_argument
{
public:
	using std::invalid_argument::invalid_argument;
};

// A parsed mapping that does not fit an OutputModel.
class validation_error : public std::invalid_argument
{
public:
	using std::invalid_argument::invalid_argument;
};

} // namespace qsnest

#endif // QSNEST_ERRORS_H
