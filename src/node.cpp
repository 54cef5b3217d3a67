#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "qsnest/errors.hpp"
#include "qsnest/node.hpp"

namespace qsnest
{

namespace
{

enum class shape
{
	leaf,
	branch,
};

// How update() combines two nodes, by the shape of each side
enum class merge_strategy
{
	accumulate,	// leaf + leaf: collect both values in one list
	demote_self,	// leaf + branch: our value becomes a flag child
	flag_other,	// branch + leaf: their value becomes a flag child
	merge_children,	// branch + branch: merge children by key
};

constexpr merge_strategy merge_table[2][2] =
{
	//			other: leaf			other: branch
	/* this: leaf */	{merge_strategy::accumulate,	merge_strategy::demote_self},
	/* this: branch */	{merge_strategy::flag_other,	merge_strategy::merge_children},
};

shape
shape_of(const QsNode& node)
{
	return node.is_leaf() ? shape::leaf : shape::branch;
}

merge_strategy
select_strategy(const QsNode& self, const QsNode& other)
{
	return merge_table[static_cast<int>(shape_of(self))][static_cast<int>(shape_of(other))];
}

void
append_flattened(List& out, Value&& v)
{
	if(v.is_list())
	{
		for(auto& item : v.as_list())
			out.push_back(std::move(item));
	}
	else
	{
		out.push_back(std::move(v));
	}
}

NodeKey
to_node_key(const Key& k)
{
	if(std::holds_alternative<std::int64_t>(k))
		return std::get<std::int64_t>(k);

	return std::get<std::string>(k);
}

Key
to_value_key(const NodeKey& k)
{
	if(std::holds_alternative<std::int64_t>(k))
		return std::get<std::int64_t>(k);

	return to_string(k);
}

bool
admitted(const NodeKey& key, const std::vector<Key>& filter)
{
	return std::any_of(filter.begin(), filter.end(),
		[&key](const Key& k)
		{
			return key_matches(key, k);
		});
}

} // namespace

std::string
to_string(const NodeKey& key)
{
	if(std::holds_alternative<std::string>(key))
		return std::get<std::string>(key);

	if(std::holds_alternative<std::int64_t>(key))
		return std::to_string(std::get<std::int64_t>(key));

	return std::string{};
}

bool
key_matches(const NodeKey& node_key, const Key& key)
{
	if(std::holds_alternative<std::string>(node_key) && std::holds_alternative<std::string>(key))
		return std::get<std::string>(node_key) == std::get<std::string>(key);

	if(std::holds_alternative<std::int64_t>(node_key) && std::holds_alternative<std::int64_t>(key))
		return std::get<std::int64_t>(node_key) == std::get<std::int64_t>(key);

	return false;
}

QsNode::QsNode(NodeKey key)
	: key_(std::move(key))
{
}

QsNode::QsNode(NodeKey key, Value value)
	: key_(std::move(key))
	, value_(std::move(value))
{
}

QsNode::QsNode(NodeKey key, QsNode child)
	: key_(std::move(key))
{
	children_.push_back(std::move(child));
}

std::optional<QsNode>
QsNode::load(NodeKey key, const Value& data, const std::vector<Key>* filter)
{
	if(filter && !admitted(key, *filter))
		return std::nullopt;

	QsNode root{std::move(key)};
	if(data.is_mapping())
	{
		for(auto& [k, v] : data.as_mapping())
		{
			std::optional<QsNode> child = load(to_node_key(k), v, filter);
			if(child)
				root.children_.push_back(std::move(*child));
		}
	}
	else if(data.is_list())
	{
		const List& items = data.as_list();
		for(std::size_t i = 0; i < items.size(); i++)
		{
			std::optional<QsNode> child = load(static_cast<std::int64_t>(i), items[i], filter);
			if(child)
				root.children_.push_back(std::move(*child));
		}
	}
	else if(!data.is_null())
	{
		// A null leaf is stored without a value
		root.value_ = data;
	}

	return root;
}

bool
QsNode::has_int_key() const
{
	return std::holds_alternative<std::int64_t>(key_);
}

bool
QsNode::has_pending_key() const
{
	return std::holds_alternative<pending_t>(key_);
}

bool
QsNode::is_array() const
{
	if(is_leaf() || value_)
		return false;

	return std::all_of(children_.begin(), children_.end(),
		[](const QsNode& child)
		{
			return child.has_int_key() || child.has_pending_key();
		});
}

bool
QsNode::is_default_array() const
{
	return is_array() && std::all_of(children_.begin(), children_.end(),
		[](const QsNode& child)
		{
			return child.is_leaf();
		});
}

bool
QsNode::is_mixed() const
{
	bool indexed = false;
	bool named = false;
	for(auto& child : children_)
	{
		if(std::holds_alternative<std::string>(child.key_))
			named = true;
		else
			indexed = true;
	}

	if(indexed && named)
		return true;

	return std::any_of(children_.begin(), children_.end(),
		[](const QsNode& child)
		{
			return child.is_mixed();
		});
}

std::int64_t
QsNode::max_index() const
{
	if(!is_array())
		return -1;

	std::int64_t max = -1;
	for(auto& child : children_)
	{
		if(child.has_int_key())
			max = std::max(max, std::get<std::int64_t>(child.key_));
	}

	return max;
}

QsNode*
QsNode::find(const NodeKey& key)
{
	auto it = std::find_if(children_.begin(), children_.end(),
		[&key](const QsNode& child)
		{
			return child.key_ == key;
		});

	return it == children_.end() ? nullptr : &*it;
}

const QsNode*
QsNode::find(const NodeKey& key) const
{
	return const_cast<QsNode*>(this)->find(key);
}

void
QsNode::update(QsNode&& other)
{
	switch(select_strategy(*this, other))
	{
	case merge_strategy::accumulate:
	{
		if(!other.value_)
			return;

		if(!value_)
		{
			value_ = std::move(other.value_);
			return;
		}

		List values;
		append_flattened(values, std::move(*value_));
		append_flattened(values, std::move(*other.value_));
		value_ = Value{std::move(values)};
		return;
	}
	case merge_strategy::demote_self:
		if(value_)
		{
			children_.emplace_back(to_string(*value_), Value{true});
			value_.reset();
		}
		merge_children(std::move(other.children_));
		return;
	case merge_strategy::flag_other:
		if(other.value_)
			add_flag(to_string(*other.value_));
		return;
	case merge_strategy::merge_children:
		merge_children(std::move(other.children_));
		return;
	}
}

void
QsNode::merge_children(std::vector<QsNode>&& incoming)
{
	for(auto& child : incoming)
	{
		QsNode* existing = find(child.key_);
		if(existing)
			existing->update(std::move(child));
		else
			children_.push_back(std::move(child));
	}

	sort_children();
}

void
QsNode::add_flag(std::string key)
{
	QsNode flag{std::move(key), Value{true}};
	QsNode* existing = find(flag.key_);
	if(existing)
		existing->update(std::move(flag));
	else
		children_.push_back(std::move(flag));

	sort_children();
}

void
QsNode::sort_children()
{
	if(!is_array())
		return;

	// Pending keys sort after every index
	std::stable_sort(children_.begin(), children_.end(),
		[](const QsNode& a, const QsNode& b)
		{
			if(!a.has_int_key())
				return false;
			if(!b.has_int_key())
				return true;
			return std::get<std::int64_t>(a.key_) < std::get<std::int64_t>(b.key_);
		});
}

void
QsNode::reorder()
{
	sort_children();
	for(auto& child : children_)
		child.reorder();
}

void
QsNode::to_object_notation()
{
	if(has_int_key())
		key_ = to_string(key_);

	// Index 0 and a "0" flag become the same key and are merged
	std::vector<QsNode> children;
	children.reserve(children_.size());
	for(auto& child : children_)
	{
		child.to_object_notation();

		auto it = std::find_if(children.begin(), children.end(),
			[&child](const QsNode& sibling)
			{
				return sibling.key_ == child.key_;
			});

		if(it != children.end())
			it->update(std::move(child));
		else
			children.push_back(std::move(child));
	}

	children_ = std::move(children);
}

void
QsNode::set_index(const QsNode* base, std::int64_t array_limit)
{
	std::int64_t next = std::max(base ? base->max_index() : -1, max_index()) + 1;

	for(auto& child : children_)
	{
		if(child.has_pending_key())
			child.key_ = next++;

		if(child.has_int_key() && std::get<std::int64_t>(child.key_) > array_limit)
		{
			throw parse_error(error_kind::array_limit_exceeded,
				"Array index " + to_string(child.key_) + " is above the limit of " +
				std::to_string(array_limit));
		}

		child.set_index(base ? base->find(child.key_) : nullptr, array_limit);
	}
}

Value
QsNode::serialize(bool sparse_lists) const
{
	if(is_leaf())
		return value_ ? *value_ : Value{};

	if(sparse_lists && is_array())
	{
		List items(static_cast<std::size_t>(max_index() + 1));
		for(auto& child : children_)
		{
			if(child.has_int_key())
				items[static_cast<std::size_t>(std::get<std::int64_t>(child.key_))] = child.serialize(sparse_lists);
		}
		return Value{std::move(items)};
	}

	Mapping m;
	m.reserve(children_.size());
	for(auto& child : children_)
		m.emplace_back(to_value_key(child.key_), child.serialize(sparse_lists));

	return Value{std::move(m)};
}

} // namespace qsnest
