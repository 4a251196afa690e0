#pragma once

#include <functional>
#include <optional>
#include <panedock/dock_types.hpp>
#include <panedock/fwd.hpp>
#include <panedock/geometry.hpp>
#include <panedock/pane_registry.hpp>
#include <string>
#include <vector>

namespace panedock
{

// One rectangle of the drop-zone overlay. target_pane is nullopt for the
// workspace root edges.
struct DropTarget
{
    std::optional<PaneId> target_pane;
    DropZone              zone = DropZone::None;
    Rect                  rect{};
    bool                  highlighted = false;
};

// Token that follows the pointer while a pane is being dragged.
struct GhostToken
{
    Point       position{};
    std::string title;
};

// ─── DragController ──────────────────────────────────────────────────────────
// Drag session state machine for pane chrome. Native drag-and-drop and plain
// pointer dragging feed the same session through on_move()/on_release().
//
// Dock drag:
//
//   Idle ──pointer_down──► Armed ──move > threshold──► Dragging
//                            │                           │    │
//                         release                  release   cancel /
//                         (click)                  on zone   leave / no zone
//                            │                           │    │
//                            ▼                           ▼    ▼
//                     activate pane               Committed  Cancelled
//                            │                           │    │
//                            └──────────► Idle ◄─────────┴────┘
//
//   begin_native_drag() enters Dragging directly.
//
// Floating move / resize sessions start in Dragging (no threshold) and end on
// release. Committed and Cancelled are transient: the session is gone by the
// time the call returns.

class DragController
{
   public:
    enum class State
    {
        Idle,
        Armed,
        Dragging,
        Committed,
        Cancelled
    };

    enum class Kind
    {
        Dock,
        FloatMove,
        FloatResize
    };

    using StartedCallback   = std::function<void(const PaneId& pane_id)>;
    using CommittedCallback = std::function<void(
        const PaneId& pane_id, const std::optional<PaneId>& target, DropZone zone)>;
    using CancelledCallback = std::function<void(const PaneId& pane_id)>;

    explicit DragController(DockManager& manager);
    ~DragController() = default;

    DragController(const DragController&)            = delete;
    DragController& operator=(const DragController&) = delete;

    // ── Session start ───────────────────────────────────────────────────
    // Each returns false (and leaves any running session alone) if the pane
    // cannot start that kind of session. A successful start cancels the
    // previous session first.

    // Pointer pressed on pane chrome. Docked panes arm a dock drag; floating
    // panes start moving immediately.
    bool pointer_down(const PaneId& pane_id, Point p);

    // Platform drag-and-drop already applied its own threshold. Refused for
    // floating panes and for the only docked pane.
    bool begin_native_drag(const PaneId& pane_id, Point p);

    // Corner handle of a floating pane.
    bool begin_floating_resize(const PaneId& pane_id, Point p);

    // ── Pointer events (routed here while a session is active) ──────────

    void on_move(Point p);
    void on_release(Point p);
    void cancel();
    void on_pointer_leave_workspace();

    // ── Queries ─────────────────────────────────────────────────────────

    State               state() const { return session_ ? session_->state : State::Idle; }
    std::optional<Kind> kind() const;
    bool                is_active() const { return session_.has_value(); }
    bool                is_dragging() const { return state() == State::Dragging; }

    // How the most recent session ended: Committed, Cancelled, or Idle for a
    // click or a finished floating session.
    State last_outcome() const { return last_outcome_; }

    std::optional<PaneId>          source_pane() const;
    const std::vector<DropTarget>& overlay() const;
    const DropTarget*              hovered_target() const;
    std::optional<GhostToken>      ghost() const;

    // ── Callbacks (dock drags only) ─────────────────────────────────────

    void set_on_drag_started(StartedCallback cb) { on_started_ = std::move(cb); }
    void set_on_drag_committed(CommittedCallback cb) { on_committed_ = std::move(cb); }
    void set_on_drag_cancelled(CancelledCallback cb) { on_cancelled_ = std::move(cb); }

   private:
    struct Session
    {
        Kind                      kind  = Kind::Dock;
        State                     state = State::Idle;
        PaneId                    source;
        Point                     origin{};
        Point                     pointer{};
        std::vector<DropTarget>   overlay;
        int                       hovered = -1;
        std::optional<GhostToken> ghost;
        FloatingGeometry          start;  // Floating sessions only
    };

    DockManager&           manager_;
    std::optional<Session> session_;
    State                  last_outcome_ = State::Idle;

    StartedCallback   on_started_;
    CommittedCallback on_committed_;
    CancelledCallback on_cancelled_;

    void enter_dragging(Point p);
    void build_overlay();
    void update_hover(Point p);
    void apply_floating(Point p);
};

}  // namespace panedock
