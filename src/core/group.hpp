#pragma once

#include "core/entry.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lockbox {

class Node;

enum class NodeKind {
    Group,
    Entry
};

[[nodiscard]] constexpr std::string_view kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Group: return "group";
        case NodeKind::Entry: return "entry";
    }
    return "unknown";
}

/**
 * NodePath - Child indices leading from a group to one of its descendants.
 *
 * An empty path designates the group itself. Paths are produced by read-only
 * searches and re-resolved for mutation, so no interior reference has to
 * outlive the search.
 */
using NodePath = std::vector<size_t>;

class NodeRange;

/**
 * Group - A named container of entries and nested groups.
 *
 * A group exclusively owns its children. Identities must be unique within a
 * tree; add_child does not check this (see find_duplicate_id).
 */
struct Group {
    Uuid id;
    std::string name;
    std::string notes;
    Timestamp created_at;
    Timestamp updated_at;
    Timestamp location_changed_at;
    std::vector<Node> children;

    /**
     * Create an empty group with a fresh identity.
     */
    [[nodiscard]] static Group create(std::string name, Timestamp now = Timestamp::now());

    /**
     * Create the root group of a new database.
     */
    [[nodiscard]] static Group root(std::string name = "Root", Timestamp now = Timestamp::now());

    /**
     * Append a child. Precondition: no node in the tree already carries the
     * child's identity (or any identity from its subtree).
     */
    void add_child(Node node);

    /**
     * Pre-order search by identity. Returns the group itself when ids match.
     */
    [[nodiscard]] std::optional<NodePath> locate(const Uuid& id) const;

    /**
     * Node at a non-empty path; nullptr if the path does not resolve.
     */
    [[nodiscard]] const Node* resolve(const NodePath& path) const;
    [[nodiscard]] Node* resolve(const NodePath& path);

    /**
     * Group at a path (empty path is this group); nullptr if the path does not
     * lead to a group.
     */
    [[nodiscard]] const Group* resolve_group(const NodePath& path) const;
    [[nodiscard]] Group* resolve_group(const NodePath& path);

    /**
     * Remove the node at a non-empty path and return it with its subtree.
     * Siblings keep their relative order.
     */
    [[nodiscard]] std::optional<Node> detach(const NodePath& path);

    [[nodiscard]] const Node* find_by_id(const Uuid& id) const;
    [[nodiscard]] Node* find_by_id(const Uuid& id);

    /**
     * Group by identity, including this group itself.
     */
    [[nodiscard]] const Group* find_group(const Uuid& id) const;
    [[nodiscard]] Group* find_group(const Uuid& id);

    /**
     * Resolve a sequence of names. Every segment but the last names a child
     * group; the last may also name an entry by its title. An empty sequence
     * yields this group.
     */
    [[nodiscard]] std::optional<NodePath> locate_path(const std::vector<std::string>& names) const;
    [[nodiscard]] const Node* get(const std::vector<std::string>& names) const;
    [[nodiscard]] Node* get_mut(const std::vector<std::string>& names);

    /**
     * Lazy pre-order traversal of this group and everything below it.
     */
    [[nodiscard]] NodeRange iter() const;

    /**
     * Number of nodes below this group.
     */
    [[nodiscard]] size_t descendant_count() const;

    /**
     * First identity that appears more than once in this tree, if any.
     */
    [[nodiscard]] std::optional<Uuid> find_duplicate_id() const;

    void touch(Timestamp at = Timestamp::now()) {
        if (at > updated_at) updated_at = at;
    }
};

/**
 * Node - A group or an entry, as owned by a parent group.
 */
class Node {
public:
    Node(Entry entry) : value_(std::move(entry)) {}
    Node(Group group) : value_(std::move(group)) {}

    [[nodiscard]] NodeKind kind() const noexcept {
        return std::holds_alternative<Group>(value_) ? NodeKind::Group : NodeKind::Entry;
    }

    [[nodiscard]] bool is_group() const noexcept { return kind() == NodeKind::Group; }
    [[nodiscard]] bool is_entry() const noexcept { return kind() == NodeKind::Entry; }

    [[nodiscard]] const Uuid& id() const noexcept {
        return is_group() ? std::get<Group>(value_).id : std::get<Entry>(value_).id;
    }

    [[nodiscard]] Timestamp updated_at() const noexcept {
        return is_group() ? std::get<Group>(value_).updated_at : std::get<Entry>(value_).updated_at;
    }

    [[nodiscard]] Timestamp location_changed_at() const noexcept {
        return is_group() ? std::get<Group>(value_).location_changed_at
                          : std::get<Entry>(value_).location_changed_at;
    }

    void set_location_changed_at(Timestamp at) noexcept {
        if (is_group()) {
            std::get<Group>(value_).location_changed_at = at;
        } else {
            std::get<Entry>(value_).location_changed_at = at;
        }
    }

    [[nodiscard]] const Group* as_group() const noexcept { return std::get_if<Group>(&value_); }
    [[nodiscard]] Group* as_group() noexcept { return std::get_if<Group>(&value_); }
    [[nodiscard]] const Entry* as_entry() const noexcept { return std::get_if<Entry>(&value_); }
    [[nodiscard]] Entry* as_entry() noexcept { return std::get_if<Entry>(&value_); }

    bool operator==(const Node& other) const;

private:
    std::variant<Entry, Group> value_;
};

bool operator==(const Group& lhs, const Group& rhs);

/**
 * NodeRef - Read-only view of a group or entry yielded by traversal.
 */
class NodeRef {
public:
    explicit NodeRef(const Group& group) noexcept : ptr_(&group) {}
    explicit NodeRef(const Entry& entry) noexcept : ptr_(&entry) {}

    [[nodiscard]] NodeKind kind() const noexcept {
        return std::holds_alternative<const Group*>(ptr_) ? NodeKind::Group : NodeKind::Entry;
    }

    [[nodiscard]] const Uuid& id() const noexcept {
        return kind() == NodeKind::Group ? std::get<const Group*>(ptr_)->id
                                         : std::get<const Entry*>(ptr_)->id;
    }

    /**
     * nullptr when this is not a group.
     */
    [[nodiscard]] const Group* group() const noexcept {
        auto* p = std::get_if<const Group*>(&ptr_);
        return p ? *p : nullptr;
    }

    /**
     * nullptr when this is not an entry.
     */
    [[nodiscard]] const Entry* entry() const noexcept {
        auto* p = std::get_if<const Entry*>(&ptr_);
        return p ? *p : nullptr;
    }

    bool operator==(const NodeRef&) const = default;

private:
    std::variant<const Group*, const Entry*> ptr_;
};

/**
 * NodeIterator - Pre-order depth-first iterator using an explicit stack.
 */
class NodeIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = NodeRef;
    using difference_type = std::ptrdiff_t;
    using pointer = const NodeRef*;
    using reference = const NodeRef&;

    NodeIterator() = default;
    explicit NodeIterator(const Group& root) { stack_.emplace_back(root); }

    reference operator*() const { return stack_.back(); }
    pointer operator->() const { return &stack_.back(); }

    NodeIterator& operator++();

    NodeIterator operator++(int) {
        auto copy = *this;
        ++*this;
        return copy;
    }

    friend bool operator==(const NodeIterator& lhs, const NodeIterator& rhs) {
        if (lhs.stack_.empty() || rhs.stack_.empty()) {
            return lhs.stack_.empty() == rhs.stack_.empty();
        }
        return lhs.stack_ == rhs.stack_;
    }

private:
    std::vector<NodeRef> stack_;
};

/**
 * NodeRange - Restartable traversal; every begin() starts a fresh walk.
 */
class NodeRange {
public:
    explicit NodeRange(const Group& root) noexcept : root_(&root) {}

    [[nodiscard]] NodeIterator begin() const { return NodeIterator(*root_); }
    [[nodiscard]] NodeIterator end() const { return NodeIterator(); }

private:
    const Group* root_;
};

} // namespace lockbox
