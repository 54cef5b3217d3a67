#ifndef QSNEST_NODE_H
#define QSNEST_NODE_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "qsnest/value.hpp"

namespace qsnest
{

// Key of an "a[]" element whose index is assigned once the node meets the
// tree it is merged into.
struct pending_t
{
	bool operator==(const pending_t&) const = default;
};

inline constexpr pending_t pending{};

using NodeKey = std::variant<std::string, std::int64_t, pending_t>;

std::string to_string(const NodeKey&);
bool key_matches(const NodeKey&, const Key&);

// One level of a query structure. A leaf holds a value (or nothing), an
// internal node holds uniquely keyed children and no value.
class QsNode
{
public:
	explicit QsNode(NodeKey key);
	QsNode(NodeKey key, Value value);
	QsNode(NodeKey key, QsNode child);

	// Build a tree from a nested value. Lists become integer keyed
	// children. With a filter, keys not listed are skipped at every level
	// and nullopt is returned when the key itself is not admitted.
	static std::optional<QsNode> load(NodeKey key, const Value& data,
		const std::vector<Key>* filter = nullptr);

	const NodeKey& key() const { return key_; }
	const std::optional<Value>& value() const { return value_; }
	const std::vector<QsNode>& children() const { return children_; }

	bool is_leaf() const { return children_.empty(); }
	bool is_empty() const { return is_leaf() && !value_; }
	bool has_int_key() const;
	bool has_pending_key() const;

	// Internal node whose children are all integer (or pending) keyed
	bool is_array() const;

	// Array node whose children are all leaves
	bool is_default_array() const;

	// True when this node or a descendant has both integer and string
	// keyed children.
	bool is_mixed() const;

	// Highest child index of an array node, -1 otherwise
	std::int64_t max_index() const;

	QsNode* find(const NodeKey&);
	const QsNode* find(const NodeKey&) const;

	// Merge a node with the same key into this one
	void update(QsNode&& other);

	// Sort array children by index, recursively
	void reorder();

	// Turn every integer key below this node into its string form
	void to_object_notation();

	// Assign indices to pending keys from the matching nodes of base,
	// continuing after the highest index already there. Throws
	// parse_error(array_limit_exceeded) for any index above array_limit.
	void set_index(const QsNode* base, std::int64_t array_limit);

	// Arrays become integer keyed mappings, or lists with null holes when
	// sparse_lists is set.
	Value serialize(bool sparse_lists = false) const;
private:
	void merge_children(std::vector<QsNode>&& incoming);
	void add_flag(std::string key);
	void sort_children();

	NodeKey key_;
	std::optional<Value> value_;
	std::vector<QsNode> children_;
};

} // namespace qsnest

#endif // QSNEST_NODE_H
