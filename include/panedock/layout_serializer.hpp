#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <panedock/layout_state.hpp>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace panedock
{

// ─── LayoutSerializer ────────────────────────────────────────────────────────
// Converts between the live tree, the LayoutState value and its JSON text.
// All methods are static; none of them throw.
//
// JSON shape:
//   { "root": Node | null, "activePaneId": "pane-1" | null,
//     "floating": [ { "paneId", "x", "y", "width", "height" } ] }
//   Node = { "type": "leaf", "paneId": "pane-1" }
//        | { "type": "split", "orientation": "horizontal" | "vertical",
//            "children": [ Node, ... ] }
// "floating" is only written when at least one pane floats. "root" is null
// when no pane is docked.

class LayoutSerializer
{
   public:
    using FreshIdFn = std::function<PaneId()>;

    // Structural, order-preserving snapshot. Floating panes are taken from
    // the registry in creation order.
    static LayoutState     to_state(const LayoutTree&            tree,
                                    const std::optional<PaneId>& active,
                                    const PaneRegistry&          registry);
    static LayoutNodeState to_node_state(const LayoutNode& node);

    // Non-empty leaf ids in traversal order, first occurrence only.
    static std::vector<PaneId> collect_pane_ids(const LayoutNodeState& state);

    // Rebuild a node tree. A leaf whose id is empty or already in `used` gets
    // `fresh_id()`; a split without children becomes a fresh leaf. The
    // result still needs LayoutTree's normalization (single-child collapse,
    // flattening). `repairs` counts substituted nodes.
    static std::unique_ptr<LayoutNode> build_tree(const LayoutNodeState&      state,
                                                  const FreshIdFn&            fresh_id,
                                                  std::unordered_set<PaneId>& used,
                                                  size_t*                     repairs = nullptr);

    static std::string to_json(const LayoutState& state);

    // nullopt if the text is not JSON or "root" is neither an object nor
    // null. Malformed
    // nodes inside a valid document become leaves with an empty id, which
    // build_tree() replaces with fresh panes.
    static std::optional<LayoutState> from_json(std::string_view text);
};

}  // namespace panedock
