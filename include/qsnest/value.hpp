#ifndef QSNEST_VALUE_H
#define QSNEST_VALUE_H

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace qsnest
{

class Value;

using Scalar = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;
using Key = std::variant<std::string, std::int64_t>;
using List = std::vector<Value>;
using Mapping = std::vector<std::pair<Key, Value>>;

// What parse() returns and stringify() consumes: a scalar, a list or a
// mapping. Mappings keep insertion order and may mix string and integer
// keys.
class Value
{
public:
	using storage_type = std::variant<Scalar, List, Mapping>;

	Value() : data_(Scalar{nullptr}) {}
	Value(std::nullptr_t) : data_(Scalar{nullptr}) {}
	Value(bool b) : data_(Scalar{b}) {}
	Value(int i) : data_(Scalar{static_cast<std::int64_t>(i)}) {}
	Value(std::int64_t i) : data_(Scalar{i}) {}
	Value(double d) : data_(Scalar{d}) {}
	Value(const char* s) : data_(Scalar{std::string{s}}) {}
	Value(std::string s) : data_(Scalar{std::move(s)}) {}
	Value(Scalar s) : data_(std::move(s)) {}
	Value(List l) : data_(std::move(l)) {}
	Value(Mapping m) : data_(std::move(m)) {}

	bool is_scalar() const { return std::holds_alternative<Scalar>(data_); }
	bool is_list() const { return std::holds_alternative<List>(data_); }
	bool is_mapping() const { return std::holds_alternative<Mapping>(data_); }
	bool is_null() const;
	bool is_string() const;

	const Scalar& as_scalar() const { return std::get<Scalar>(data_); }
	const List& as_list() const { return std::get<List>(data_); }
	List& as_list() { return std::get<List>(data_); }
	const Mapping& as_mapping() const { return std::get<Mapping>(data_); }
	Mapping& as_mapping() { return std::get<Mapping>(data_); }
	const std::string& as_string() const;

	// Mapping lookup, nullptr when absent or not a mapping
	const Value* find(const Key&) const;

	const storage_type& data() const { return data_; }
private:
	storage_type data_;
};

// Structural equality; mapping entries compare regardless of order.
bool operator==(const Value&, const Value&);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// String form used for synthetic keys and stringified values:
// "true"/"false", "null", decimal numbers, lists as "[a,b]".
std::string to_string(const Scalar&);
std::string to_string(const Value&);
std::string to_string(const Key&);

// JSON-like rendering for diagnostics and the command line tool.
// Integer mapping keys are printed bare, string keys quoted.
std::string to_repr(const Value&);
std::ostream& operator<<(std::ostream&, const Value&);

} // namespace qsnest

#endif // QSNEST_VALUE_H
