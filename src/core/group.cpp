#include "core/group.hpp"

#include <unordered_set>
#include <utility>

namespace lockbox {

Group Group::create(std::string name, Timestamp now) {
    return Group{
        .id = Uuid::generate(),
        .name = std::move(name),
        .notes = {},
        .created_at = now,
        .updated_at = now,
        .location_changed_at = now,
        .children = {}
    };
}

Group Group::root(std::string name, Timestamp now) {
    auto group = create(std::move(name), now);
    group.id = ROOT_GROUP_ID;
    return group;
}

void Group::add_child(Node node) {
    children.push_back(std::move(node));
}

std::optional<NodePath> Group::locate(const Uuid& target) const {
    if (id == target) return NodePath{};

    struct Frame {
        const Group* group;
        size_t next;
    };

    std::vector<Frame> stack{{this, 0}};
    NodePath path;

    while (!stack.empty()) {
        auto& frame = stack.back();
        if (frame.next >= frame.group->children.size()) {
            stack.pop_back();
            if (!path.empty()) path.pop_back();
            continue;
        }

        const size_t index = frame.next++;
        const Node& child = frame.group->children[index];
        path.push_back(index);

        if (child.id() == target) return path;

        if (const auto* group = child.as_group()) {
            stack.push_back({group, 0});
        } else {
            path.pop_back();
        }
    }

    return std::nullopt;
}

const Node* Group::resolve(const NodePath& path) const {
    if (path.empty()) return nullptr;

    const Group* current = this;
    const Node* node = nullptr;
    for (size_t index : path) {
        if (!current || index >= current->children.size()) return nullptr;
        node = &current->children[index];
        current = node->as_group();
    }
    return node;
}

Node* Group::resolve(const NodePath& path) {
    return const_cast<Node*>(std::as_const(*this).resolve(path));
}

const Group* Group::resolve_group(const NodePath& path) const {
    if (path.empty()) return this;
    const auto* node = resolve(path);
    return node ? node->as_group() : nullptr;
}

Group* Group::resolve_group(const NodePath& path) {
    return const_cast<Group*>(std::as_const(*this).resolve_group(path));
}

std::optional<Node> Group::detach(const NodePath& path) {
    if (path.empty()) return std::nullopt;

    NodePath parent_path(path.begin(), path.end() - 1);
    auto* parent = resolve_group(parent_path);
    const size_t index = path.back();
    if (!parent || index >= parent->children.size()) return std::nullopt;

    auto it = parent->children.begin() + static_cast<std::ptrdiff_t>(index);
    Node node = std::move(*it);
    parent->children.erase(it);
    return node;
}

const Node* Group::find_by_id(const Uuid& target) const {
    auto path = locate(target);
    return path ? resolve(*path) : nullptr;
}

Node* Group::find_by_id(const Uuid& target) {
    auto path = locate(target);
    return path ? resolve(*path) : nullptr;
}

const Group* Group::find_group(const Uuid& target) const {
    auto path = locate(target);
    return path ? resolve_group(*path) : nullptr;
}

Group* Group::find_group(const Uuid& target) {
    auto path = locate(target);
    return path ? resolve_group(*path) : nullptr;
}

std::optional<NodePath> Group::locate_path(const std::vector<std::string>& names) const {
    NodePath path;
    const Group* current = this;

    for (size_t i = 0; i < names.size(); ++i) {
        const bool last = i + 1 == names.size();
        const auto& name = names[i];

        std::optional<size_t> match;
        for (size_t c = 0; c < current->children.size(); ++c) {
            const Node& child = current->children[c];
            if (const auto* group = child.as_group(); group && group->name == name) {
                match = c;
                break;
            }
            if (last) {
                if (const auto* entry = child.as_entry(); entry && entry->title() == name) {
                    match = c;
                    break;
                }
            }
        }

        if (!match) return std::nullopt;
        path.push_back(*match);
        if (!last) {
            current = current->children[*match].as_group();
        }
    }

    return path;
}

const Node* Group::get(const std::vector<std::string>& names) const {
    auto path = locate_path(names);
    return path ? resolve(*path) : nullptr;
}

Node* Group::get_mut(const std::vector<std::string>& names) {
    auto path = locate_path(names);
    return path ? resolve(*path) : nullptr;
}

NodeRange Group::iter() const {
    return NodeRange(*this);
}

size_t Group::descendant_count() const {
    size_t count = 0;
    for (const auto& node : iter()) {
        (void)node;
        ++count;
    }
    return count - 1;
}

std::optional<Uuid> Group::find_duplicate_id() const {
    std::unordered_set<Uuid> seen;
    for (const auto& node : iter()) {
        if (!seen.insert(node.id()).second) {
            return node.id();
        }
    }
    return std::nullopt;
}

bool Node::operator==(const Node& other) const {
    return value_ == other.value_;
}

bool operator==(const Group& lhs, const Group& rhs) {
    return lhs.id == rhs.id &&
           lhs.name == rhs.name &&
           lhs.notes == rhs.notes &&
           lhs.created_at == rhs.created_at &&
           lhs.updated_at == rhs.updated_at &&
           lhs.location_changed_at == rhs.location_changed_at &&
           lhs.children == rhs.children;
}

NodeIterator& NodeIterator::operator++() {
    const NodeRef current = stack_.back();
    stack_.pop_back();

    if (const auto* group = current.group()) {
        for (auto it = group->children.rbegin(); it != group->children.rend(); ++it) {
            if (const auto* child_group = it->as_group()) {
                stack_.emplace_back(*child_group);
            } else {
                stack_.emplace_back(*it->as_entry());
            }
        }
    }

    return *this;
}

} // namespace lockbox
