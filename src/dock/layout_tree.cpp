#include <algorithm>
#include <panedock/layout_tree.hpp>
#include <panedock/logger.hpp>
#include <unordered_set>

namespace panedock
{

// ─── LayoutNode ──────────────────────────────────────────────────────────────

std::unique_ptr<LayoutNode> LayoutNode::make_leaf(PaneId id)
{
    auto node     = std::make_unique<LayoutNode>();
    node->type    = NodeType::Leaf;
    node->pane_id = std::move(id);
    return node;
}

std::unique_ptr<LayoutNode> LayoutNode::make_split(Orientation                              orientation,
                                                   std::vector<std::unique_ptr<LayoutNode>> children)
{
    auto node         = std::make_unique<LayoutNode>();
    node->type        = NodeType::Split;
    node->orientation = orientation;
    node->children    = std::move(children);
    return node;
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace
{

// Bottom-up: children first, then splice same-orientation child splits, drop
// empty splits, and collapse single-child splits into their slot.
void normalize_slot(std::unique_ptr<LayoutNode>& slot)
{
    LayoutNode* node = slot.get();
    if (!node->is_split())
        return;

    std::vector<std::unique_ptr<LayoutNode>> kept;
    kept.reserve(node->children.size());
    for (auto& child : node->children)
    {
        if (!child)
            continue;
        normalize_slot(child);
        if (child->is_split() && child->children.empty())
            continue;
        if (child->is_split() && child->orientation == node->orientation)
        {
            for (auto& grandchild : child->children)
                kept.push_back(std::move(grandchild));
        }
        else
        {
            kept.push_back(std::move(child));
        }
    }
    node->children = std::move(kept);

    if (node->children.size() == 1)
    {
        std::unique_ptr<LayoutNode> only = std::move(node->children.front());
        slot                             = std::move(only);
    }
}

void layout_node(LayoutNode& node, const Rect& bounds)
{
    node.bounds = bounds;
    if (!node.is_split() || node.children.empty())
        return;

    const size_t n     = node.children.size();
    const bool   horiz = node.orientation == Orientation::Horizontal;
    const float  total = horiz ? bounds.w : bounds.h;
    const float  start = horiz ? bounds.x : bounds.y;

    for (size_t i = 0; i < n; ++i)
    {
        // Edges from the same formula so neighbours share them exactly.
        float a = start + total * static_cast<float>(i) / static_cast<float>(n);
        float b = (i + 1 == n) ? start + total
                               : start + total * static_cast<float>(i + 1) / static_cast<float>(n);
        Rect child = horiz ? Rect{a, bounds.y, b - a, bounds.h} : Rect{bounds.x, a, bounds.w, b - a};
        layout_node(*node.children[i], child);
    }
}

void collect_leaves(const LayoutNode& node, std::vector<const LayoutNode*>& out)
{
    if (node.is_leaf())
    {
        out.push_back(&node);
        return;
    }
    for (const auto& child : node.children)
        collect_leaves(*child, out);
}

size_t depth_of(const LayoutNode& node)
{
    size_t deepest = 0;
    for (const auto& child : node.children)
        deepest = std::max(deepest, depth_of(*child));
    return deepest + 1;
}

}  // anonymous namespace

// ─── Construction ────────────────────────────────────────────────────────────

LayoutTree::LayoutTree(const PaneId& initial)
    : root_(LayoutNode::make_leaf(initial))
{
    rebuild_index();
}

LayoutTree::LayoutTree(std::unique_ptr<LayoutNode> root)
    : root_(std::move(root))
{
    if (!root_)
        root_ = LayoutNode::make_leaf(PaneId{});
    normalize();
}

void LayoutTree::rebuild_index()
{
    parents_.clear();
    leaves_.clear();
    if (root_)
        index_subtree(root_.get(), nullptr);
}

void LayoutTree::index_subtree(LayoutNode* node, LayoutNode* parent)
{
    parents_[node] = parent;
    if (node->is_leaf())
    {
        leaves_[node->pane_id] = node;
        return;
    }
    for (auto& child : node->children)
        index_subtree(child.get(), node);
}

std::unique_ptr<LayoutNode>& LayoutTree::slot_of(LayoutNode* node)
{
    LayoutNode* parent = parents_.at(node);
    if (!parent)
        return root_;
    return parent->children[index_in_parent(node)];
}

size_t LayoutTree::index_in_parent(const LayoutNode* node) const
{
    const LayoutNode* parent = parent_of(node);
    if (!parent)
        return 0;
    for (size_t i = 0; i < parent->children.size(); ++i)
    {
        if (parent->children[i].get() == node)
            return i;
    }
    return 0;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

const LayoutNode* LayoutTree::find_leaf(const PaneId& id) const
{
    auto it = leaves_.find(id);
    return it == leaves_.end() ? nullptr : it->second;
}

const LayoutNode* LayoutTree::parent_of(const LayoutNode* node) const
{
    auto it = parents_.find(node);
    return it == parents_.end() ? nullptr : it->second;
}

size_t LayoutTree::depth() const
{
    return root_ ? depth_of(*root_) : 0;
}

std::vector<PaneId> LayoutTree::pane_ids() const
{
    std::vector<const LayoutNode*> leaves;
    if (root_)
        collect_leaves(*root_, leaves);

    std::vector<PaneId> ids;
    ids.reserve(leaves.size());
    for (const auto* leaf : leaves)
        ids.push_back(leaf->pane_id);
    return ids;
}

PaneId LayoutTree::first_pane_id() const
{
    const LayoutNode* node = root_.get();
    if (!node)
        return PaneId{};
    while (node->is_split() && !node->children.empty())
        node = node->children.front().get();
    return node->pane_id;
}

// ─── Transforms ──────────────────────────────────────────────────────────────

void LayoutTree::wrap(LayoutNode*                 node,
                      std::unique_ptr<LayoutNode> leaf,
                      Orientation                 orientation,
                      bool                        before)
{
    std::unique_ptr<LayoutNode>& slot     = slot_of(node);
    std::unique_ptr<LayoutNode>  existing = std::move(slot);

    std::vector<std::unique_ptr<LayoutNode>> children;
    children.reserve(2);
    if (before)
    {
        children.push_back(std::move(leaf));
        children.push_back(std::move(existing));
    }
    else
    {
        children.push_back(std::move(existing));
        children.push_back(std::move(leaf));
    }
    slot = LayoutNode::make_split(orientation, std::move(children));
}

bool LayoutTree::split_leaf(const PaneId& existing, const PaneId& new_id, Orientation orientation)
{
    auto it = leaves_.find(existing);
    if (it == leaves_.end() || new_id.empty() || contains(new_id))
        return false;

    LayoutNode* leaf   = it->second;
    LayoutNode* parent = parents_.at(leaf);
    if (parent && parent->orientation == orientation)
    {
        size_t idx = index_in_parent(leaf);
        parent->children.insert(parent->children.begin() + static_cast<std::ptrdiff_t>(idx + 1),
                                LayoutNode::make_leaf(new_id));
    }
    else
    {
        wrap(leaf, LayoutNode::make_leaf(new_id), orientation, false);
    }
    rebuild_index();
    return true;
}

bool LayoutTree::insert_relative(const PaneId& id, const PaneId& target, DropZone zone)
{
    auto orientation = orientation_for_zone(zone);
    auto it          = leaves_.find(target);
    if (!orientation || it == leaves_.end() || id.empty() || contains(id))
        return false;

    const bool  before = zone_inserts_before(zone);
    LayoutNode* leaf   = it->second;
    LayoutNode* parent = parents_.at(leaf);
    if (parent && parent->orientation == *orientation)
    {
        size_t idx = index_in_parent(leaf) + (before ? 0 : 1);
        parent->children.insert(parent->children.begin() + static_cast<std::ptrdiff_t>(idx),
                                LayoutNode::make_leaf(id));
    }
    else
    {
        wrap(leaf, LayoutNode::make_leaf(id), *orientation, before);
    }
    rebuild_index();
    return true;
}

bool LayoutTree::insert_at_root(const PaneId& id, DropZone zone)
{
    auto orientation = orientation_for_zone(zone);
    if (!orientation || id.empty() || contains(id))
        return false;

    const bool before = zone_inserts_before(zone);
    if (!root_)
    {
        root_ = LayoutNode::make_leaf(id);
    }
    else if (root_->is_split() && root_->orientation == *orientation)
    {
        auto pos = before ? root_->children.begin() : root_->children.end();
        root_->children.insert(pos, LayoutNode::make_leaf(id));
    }
    else
    {
        wrap(root_.get(), LayoutNode::make_leaf(id), *orientation, before);
    }
    rebuild_index();
    return true;
}

bool LayoutTree::detach(const PaneId& id)
{
    auto it = leaves_.find(id);
    if (it == leaves_.end() || leaves_.size() < 2)
        return false;

    LayoutNode* leaf   = it->second;
    LayoutNode* parent = parents_.at(leaf);
    if (!parent)
        return false;

    size_t idx = index_in_parent(leaf);
    parents_.erase(leaf);
    leaves_.erase(it);
    parent->children.erase(parent->children.begin() + static_cast<std::ptrdiff_t>(idx));

    trim(parent);
    rebuild_index();
    return true;
}

// Walk upward from a split that just lost a child. Empty splits are removed
// from their parent; a single-child split is replaced by its child, which is
// spliced into the grandparent if both run the same way.
void LayoutTree::trim(LayoutNode* split)
{
    LayoutNode* node = split;
    while (node && node->is_split())
    {
        LayoutNode* parent = parents_.at(node);

        if (node->children.empty())
        {
            if (!parent)
                return;
            size_t idx = index_in_parent(node);
            parents_.erase(node);
            parent->children.erase(parent->children.begin() + static_cast<std::ptrdiff_t>(idx));
            node = parent;
            continue;
        }

        if (node->children.size() == 1)
        {
            std::unique_ptr<LayoutNode>& slot     = slot_of(node);
            std::unique_ptr<LayoutNode>  only     = std::move(node->children.front());
            LayoutNode*                  promoted = only.get();
            parents_.erase(node);
            slot               = std::move(only);
            parents_[promoted] = parent;

            if (parent && promoted->is_split() && promoted->orientation == parent->orientation)
                flatten_child(parent, index_in_parent(promoted));
        }
        return;
    }
}

void LayoutTree::flatten_child(LayoutNode* split, size_t index)
{
    std::unique_ptr<LayoutNode> child = std::move(split->children[index]);
    split->children.erase(split->children.begin() + static_cast<std::ptrdiff_t>(index));

    for (auto& grandchild : child->children)
        parents_[grandchild.get()] = split;
    split->children.insert(split->children.begin() + static_cast<std::ptrdiff_t>(index),
                           std::make_move_iterator(child->children.begin()),
                           std::make_move_iterator(child->children.end()));
    parents_.erase(child.get());
}

bool LayoutTree::swap(const PaneId& a, const PaneId& b)
{
    if (a == b)
        return false;
    auto ia = leaves_.find(a);
    auto ib = leaves_.find(b);
    if (ia == leaves_.end() || ib == leaves_.end())
        return false;

    LayoutNode* na = ia->second;
    LayoutNode* nb = ib->second;
    std::swap(na->pane_id, nb->pane_id);
    leaves_[a] = nb;
    leaves_[b] = na;
    return true;
}

bool LayoutTree::replace_pane(const PaneId& old_id, const PaneId& new_id)
{
    auto it = leaves_.find(old_id);
    if (it == leaves_.end() || new_id.empty() || contains(new_id))
        return false;

    LayoutNode* leaf = it->second;
    leaf->pane_id    = new_id;
    leaves_.erase(it);
    leaves_[new_id] = leaf;
    return true;
}

void LayoutTree::reset(const PaneId& single)
{
    root_ = LayoutNode::make_leaf(single);
    rebuild_index();
}

void LayoutTree::clear()
{
    root_.reset();
    rebuild_index();
}

void LayoutTree::reset(std::unique_ptr<LayoutNode> root)
{
    if (!root)
        return;
    root_ = std::move(root);
    normalize();
}

void LayoutTree::normalize()
{
    if (root_)
        normalize_slot(root_);
    rebuild_index();
}

// ─── Geometry ────────────────────────────────────────────────────────────────

void LayoutTree::compute_bounds(const Rect& workspace)
{
    if (root_)
        layout_node(*root_, workspace);
}

std::optional<Rect> LayoutTree::bounds_of(const PaneId& id) const
{
    const LayoutNode* leaf = find_leaf(id);
    if (!leaf)
        return std::nullopt;
    return leaf->bounds;
}

std::optional<PaneId> LayoutTree::pane_at(Point p) const
{
    std::vector<const LayoutNode*> leaves;
    if (root_)
        collect_leaves(*root_, leaves);
    for (const auto* leaf : leaves)
    {
        if (leaf->bounds.contains(p))
            return leaf->pane_id;
    }
    return std::nullopt;
}

// ─── Debug ───────────────────────────────────────────────────────────────────

bool LayoutTree::check_invariants() const
{
    if (!root_)
        return leaves_.empty() && parents_.empty();

    std::unordered_set<PaneId> seen;
    size_t                     nodes = 0;
    bool                       ok    = true;

    auto visit = [&](auto& self, const LayoutNode* node, const LayoutNode* parent) -> void
    {
        ++nodes;
        if (parent_of(node) != parent || parents_.count(node) == 0)
            ok = false;

        if (node->is_leaf())
        {
            if (!seen.insert(node->pane_id).second || find_leaf(node->pane_id) != node)
                ok = false;
            return;
        }

        if (node->children.size() < 2)
            ok = false;
        for (const auto& child : node->children)
        {
            if (child->is_split() && child->orientation == node->orientation)
                ok = false;
            self(self, child.get(), node);
        }
    };
    visit(visit, root_.get(), nullptr);

    if (seen.empty() || seen.size() != leaves_.size() || nodes != parents_.size())
        ok = false;
    if (!ok)
        PANEDOCK_LOG_ERROR("dock", "layout tree invariant violated ({} leaves, {} nodes)",
                           leaves_.size(), nodes);
    return ok;
}

}  // namespace panedock
