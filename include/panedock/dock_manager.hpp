#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <panedock/dock_config.hpp>
#include <panedock/dock_types.hpp>
#include <panedock/drag_controller.hpp>
#include <panedock/fwd.hpp>
#include <panedock/geometry.hpp>
#include <panedock/layout_state.hpp>
#include <panedock/layout_tree.hpp>
#include <panedock/pane_id_generator.hpp>
#include <panedock/pane_registry.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace panedock
{

// Drag coming from outside the manager (a file, a project tree item). The
// manager only classifies it; what the drop means is up to the host.
struct ExternalDragEvent
{
    Point       position{};
    std::string mime_type;
    std::string payload;
};

struct ExternalDropIndicator
{
    PaneId   pane_id;
    DropZone zone = DropZone::None;
    Rect     rect{};
};

// ─── DockManager ─────────────────────────────────────────────────────────────
// Host-facing API of the docking workspace. Owns the pane registry, the
// layout tree and the drag controller and keeps them consistent:
//   - every live pane is either a leaf of the tree or floating,
//   - the tree is empty only while at least one pane floats,
//   - the active pane is always a live pane.
// Invalid requests are ignored and logged at debug level in "dock"; nothing
// here throws.
//
// Geometry is in workspace coordinates (the rect passed to update_layout()).
// Floating geometry is stored relative to the workspace origin.

class DockManager
{
   public:
    using PaneCallback       = std::function<void(const PaneId& pane_id)>;
    using PaneClosedCallback = std::function<void(const PaneId&                closed,
                                                  const std::optional<PaneId>& next_active)>;
    using LayoutCallback     = std::function<void()>;
    using ContentCallback    = PaneRegistry::ContentCallback;
    using AcceptExternalFn   = std::function<bool(const ExternalDragEvent& event)>;
    using ExternalDropCallback =
        std::function<void(const PaneId& pane_id, DropZone zone, const ExternalDragEvent& event)>;

    // Seeds one empty pane. A null generator means SequentialPaneIdGenerator
    // with the configured prefix.
    explicit DockManager(DockConfig config = {}, std::unique_ptr<PaneIdGenerator> ids = nullptr);
    ~DockManager();

    DockManager(const DockManager&)            = delete;
    DockManager& operator=(const DockManager&) = delete;

    // ── Layout operations ───────────────────────────────────────────────

    // New empty pane beside `pane_id`. nullopt if the pane is unknown or
    // floating. The new pane becomes active.
    std::optional<PaneId> split_pane(const PaneId& pane_id, Orientation orientation);

    // Center on a pane swaps the two panes. Edge zones dock beside the
    // target, or along the workspace edge when target is nullopt. A
    // floating source is docked. Returns true if the layout changed.
    bool move_pane(const PaneId& pane_id, const std::optional<PaneId>& target, DropZone position);

    // Returns the active pane afterwards. The last pane is cleared instead
    // of removed.
    std::optional<PaneId> close_pane(const PaneId& pane_id);

    void                         set_active_pane(const std::optional<PaneId>& pane_id);
    const std::optional<PaneId>& active_pane_id() const { return active_; }

    // Docked panes in tree order, then floating panes in creation order.
    std::vector<PaneId> pane_ids() const;
    std::vector<PaneId> docked_pane_ids() const { return tree_.pane_ids(); }
    std::vector<PaneId> floating_pane_ids() const;

    const Pane* pane(const PaneId& pane_id) const { return registry_.get(pane_id); }
    size_t      pane_count() const { return registry_.size(); }
    size_t      docked_pane_count() const { return tree_.leaf_count(); }
    bool        is_floating(const PaneId& pane_id) const;

    // ── Content ─────────────────────────────────────────────────────────

    bool set_pane_content(const PaneId& pane_id, ContentHandle handle);
    bool clear_pane(const PaneId& pane_id);
    bool set_pane_title(const PaneId& pane_id, const std::string& title);
    bool set_pane_placeholder(const PaneId& pane_id, const std::string& text);

    // ── Persistence ─────────────────────────────────────────────────────

    LayoutState get_state() const;

    // Replaces every pane. Malformed parts are repaired, never rejected.
    void restore_state(const LayoutState& state);

    std::string save_state_json() const;

    // False (layout untouched) if the text is not a layout document.
    bool restore_state_json(std::string_view json);

    // ── Floating panes ──────────────────────────────────────────────────

    // Detach a docked pane into a floating window. `rendered_bounds` is the
    // pane's on-screen rect as drawn by the host; without it the computed
    // bounds are used, then the configured default size. Floating the last
    // docked pane leaves the docked area empty.
    bool float_pane(const PaneId& pane_id, const std::optional<Rect>& rendered_bounds = std::nullopt);

    // Re-dock next to the pane it was floated from, or along the right
    // workspace edge when that neighbour is gone (or nothing is docked).
    bool dock_pane(const PaneId& pane_id);

    bool toggle_floating(const PaneId& pane_id);

    // `geometry` is relative to the workspace origin. Size is clamped to
    // the configured minimum.
    bool set_floating_geometry(const PaneId& pane_id, const Rect& geometry);

    // ── Geometry ────────────────────────────────────────────────────────

    void                  update_layout(const Rect& workspace);
    const Rect&           workspace() const { return workspace_; }
    std::optional<Rect>   pane_bounds(const PaneId& pane_id) const;
    std::optional<Rect>   content_bounds(const PaneId& pane_id) const;
    std::optional<PaneId> pane_at_point(Point p) const;

    // ── External drops ──────────────────────────────────────────────────

    void set_can_accept_external_drop(AcceptExternalFn fn) { can_accept_external_ = std::move(fn); }
    void set_on_external_drop(ExternalDropCallback cb) { on_external_drop_ = std::move(cb); }

    // Classify and highlight. None when the drag is not accepted.
    DropZone external_drag_over(const ExternalDragEvent& event);

    // Activates the target pane and hands the drop to the host callback.
    bool external_drop(const ExternalDragEvent& event);
    void external_drag_leave() { external_indicator_.reset(); }

    const std::optional<ExternalDropIndicator>& external_drop_indicator() const
    {
        return external_indicator_;
    }

    // ── Callbacks ───────────────────────────────────────────────────────

    void set_on_active_pane_changed(PaneCallback cb) { on_active_changed_ = std::move(cb); }
    void set_on_pane_closed(PaneClosedCallback cb) { on_pane_closed_ = std::move(cb); }
    void set_on_layout_changed(LayoutCallback cb) { on_layout_changed_ = std::move(cb); }
    void set_on_content_mounted(ContentCallback cb) { registry_.set_on_mount(std::move(cb)); }
    void set_on_content_unmounted(ContentCallback cb) { registry_.set_on_unmount(std::move(cb)); }

    // ── Components ──────────────────────────────────────────────────────

    DragController&       drag_controller() { return drag_; }
    const DragController& drag_controller() const { return drag_; }
    const LayoutTree&     layout_tree() const { return tree_; }
    const DockConfig&     config() const { return config_; }

   private:
    // Where a floating pane goes back to when docked.
    struct DockHint
    {
        PaneId   neighbour;
        DropZone zone = DropZone::Right;
    };

    DockConfig                       config_;
    std::unique_ptr<PaneIdGenerator> ids_;
    PaneRegistry                     registry_;
    LayoutTree                       tree_;
    DragController                   drag_;

    std::optional<PaneId>                  active_;
    Rect                                   workspace_{};
    bool                                   has_workspace_ = false;
    std::unordered_map<PaneId, DockHint>   dock_hints_;
    std::optional<ExternalDropIndicator>   external_indicator_;

    AcceptExternalFn     can_accept_external_;
    ExternalDropCallback on_external_drop_;
    PaneCallback         on_active_changed_;
    PaneClosedCallback   on_pane_closed_;
    LayoutCallback       on_layout_changed_;

    bool     swap_panes(const PaneId& a, const PaneId& b);
    bool     insert_docked(const PaneId& pane_id, const std::optional<PaneId>& target, DropZone zone);
    DockHint dock_hint_for(const PaneId& pane_id) const;
    void     layout_changed();
    bool     accepts_external(const ExternalDragEvent& event) const;
    std::optional<ExternalDropIndicator> classify_external(Point p) const;
};

}  // namespace panedock
