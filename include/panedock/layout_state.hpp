#pragma once

#include <optional>
#include <panedock/dock_types.hpp>
#include <panedock/fwd.hpp>
#include <panedock/layout_tree.hpp>
#include <vector>

namespace panedock
{

// ─── Serializable layout value ───────────────────────────────────────────────
// Plain mirror of the layout tree, independent of any live manager. Produced
// by DockManager::get_state() and accepted by restore_state().

struct LayoutNodeState
{
    NodeType                     type = NodeType::Leaf;
    PaneId                       pane_id;                                // Leaf only
    Orientation                  orientation = Orientation::Horizontal;  // Split only
    std::vector<LayoutNodeState> children;                               // Split only

    static LayoutNodeState leaf(PaneId id)
    {
        LayoutNodeState s;
        s.type    = NodeType::Leaf;
        s.pane_id = std::move(id);
        return s;
    }

    static LayoutNodeState split(Orientation orientation, std::vector<LayoutNodeState> children)
    {
        LayoutNodeState s;
        s.type        = NodeType::Split;
        s.orientation = orientation;
        s.children    = std::move(children);
        return s;
    }

    bool operator==(const LayoutNodeState&) const = default;
};

struct FloatingPaneState
{
    PaneId pane_id;
    float  x      = 0.0f;
    float  y      = 0.0f;
    float  width  = 0.0f;
    float  height = 0.0f;

    bool operator==(const FloatingPaneState&) const = default;
};

struct LayoutState
{
    // nullopt when every pane floats.
    std::optional<LayoutNodeState> root;
    std::optional<PaneId>          active_pane_id;
    std::vector<FloatingPaneState> floating;  // Creation order

    bool operator==(const LayoutState&) const = default;
};

}  // namespace panedock
