#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <panedock/dock_types.hpp>
#include <panedock/fwd.hpp>
#include <panedock/geometry.hpp>
#include <unordered_map>
#include <vector>

namespace panedock
{

// ─── LayoutNode ──────────────────────────────────────────────────────────────
// A leaf holds one pane id; a split holds two or more children laid out along
// its orientation. Parent links are kept by the owning LayoutTree, not here.

enum class NodeType
{
    Leaf,
    Split
};

struct LayoutNode
{
    NodeType                                 type = NodeType::Leaf;
    PaneId                                   pane_id;                            // Leaf only
    Orientation                              orientation = Orientation::Horizontal;  // Split only
    std::vector<std::unique_ptr<LayoutNode>> children;                           // Split only

    // Filled by LayoutTree::compute_bounds().
    Rect bounds{};

    bool is_leaf() const { return type == NodeType::Leaf; }
    bool is_split() const { return type == NodeType::Split; }

    static std::unique_ptr<LayoutNode> make_leaf(PaneId id);
    static std::unique_ptr<LayoutNode> make_split(Orientation                              orientation,
                                                  std::vector<std::unique_ptr<LayoutNode>> children);
};

// ─── LayoutTree ──────────────────────────────────────────────────────────────
// Owns the node tree plus two side indices (node -> parent, pane id -> leaf).
// Every public mutation leaves the tree trimmed (no split with fewer than two
// children) and flattened (no split directly inside a split of the same
// orientation). The tree holds at least one leaf unless it was emptied with
// clear(); the dock manager does that only while a floating pane exists.

class LayoutTree
{
   public:
    // Single leaf holding `initial`.
    explicit LayoutTree(const PaneId& initial);

    // Adopts `root` and normalizes it. The root must contain at least one leaf.
    explicit LayoutTree(std::unique_ptr<LayoutNode> root);

    ~LayoutTree() = default;

    LayoutTree(const LayoutTree&)            = delete;
    LayoutTree& operator=(const LayoutTree&) = delete;

    // ── Queries ─────────────────────────────────────────────────────────

    // Must not be called on an empty tree.
    const LayoutNode& root() const { return *root_; }
    bool              empty() const { return !root_; }

    const LayoutNode* find_leaf(const PaneId& id) const;
    const LayoutNode* parent_of(const LayoutNode* node) const;
    bool              contains(const PaneId& id) const { return leaves_.count(id) != 0; }
    size_t            leaf_count() const { return leaves_.size(); }
    size_t            node_count() const { return parents_.size(); }
    size_t            depth() const;

    // Leaf pane ids in depth-first, left-to-right order.
    std::vector<PaneId> pane_ids() const;
    PaneId              first_pane_id() const;

    // ── Transforms ──────────────────────────────────────────────────────

    // Put `new_id` next to `existing` along `orientation`. Joins the parent
    // split when it already runs that way, otherwise wraps the leaf.
    bool split_leaf(const PaneId& existing, const PaneId& new_id, Orientation orientation);

    // Insert a leaf for `id` on the `zone` side of `target`. `id` must not be
    // in the tree yet and `zone` must be an edge zone.
    bool insert_relative(const PaneId& id, const PaneId& target, DropZone zone);

    // Insert a leaf for `id` along the `zone` edge of the whole workspace.
    // On an empty tree the leaf becomes the root.
    bool insert_at_root(const PaneId& id, DropZone zone);

    // Remove the leaf for `id` and trim upward. Refuses to remove the last
    // leaf.
    bool detach(const PaneId& id);

    // Exchange the pane ids of two leaves. Shape is unchanged.
    bool swap(const PaneId& a, const PaneId& b);

    // Rename the pane held by a leaf (used when another pane takes over the
    // last docked slot).
    bool replace_pane(const PaneId& old_id, const PaneId& new_id);

    // Drop everything and start over with one leaf.
    void reset(const PaneId& single);

    // Remove every node, leaving an empty tree.
    void clear();

    // Replace the whole tree with `root` (normalized). Ignored if null.
    void reset(std::unique_ptr<LayoutNode> root);

    // Re-establish trimming and flattening over the whole tree.
    void normalize();

    // ── Geometry ────────────────────────────────────────────────────────

    // Equal-share layout: every child of a split gets the same extent along
    // the split's orientation.
    void                compute_bounds(const Rect& workspace);
    std::optional<Rect> bounds_of(const PaneId& id) const;
    std::optional<PaneId> pane_at(Point p) const;

    // ── Debug ───────────────────────────────────────────────────────────

    // True if both indices agree with the tree and the structural
    // invariants hold.
    bool check_invariants() const;

   private:
    std::unique_ptr<LayoutNode>                        root_;
    std::unordered_map<const LayoutNode*, LayoutNode*> parents_;
    std::unordered_map<PaneId, LayoutNode*>            leaves_;

    void                         rebuild_index();
    void                         index_subtree(LayoutNode* node, LayoutNode* parent);
    std::unique_ptr<LayoutNode>& slot_of(LayoutNode* node);
    size_t                       index_in_parent(const LayoutNode* node) const;

    void trim(LayoutNode* split);
    void flatten_child(LayoutNode* split, size_t index);
    void wrap(LayoutNode* node, std::unique_ptr<LayoutNode> leaf, Orientation orientation,
              bool before);
};

}  // namespace panedock
