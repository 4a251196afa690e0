#include <algorithm>
#include <cmath>
#include <panedock/dock_manager.hpp>
#include <panedock/drag_controller.hpp>
#include <panedock/drop_zone.hpp>
#include <panedock/logger.hpp>

namespace panedock
{

DragController::DragController(DockManager& manager)
    : manager_(manager)
{
}

// ─── Session start ───────────────────────────────────────────────────────────

bool DragController::pointer_down(const PaneId& pane_id, Point p)
{
    const Pane* pane = manager_.pane(pane_id);
    if (!pane)
        return false;

    if (session_)
        cancel();

    Session s;
    s.source  = pane_id;
    s.origin  = p;
    s.pointer = p;
    if (pane->floating.is_floating)
    {
        s.kind  = Kind::FloatMove;
        s.state = State::Dragging;
        s.start = pane->floating;
    }
    else
    {
        s.kind  = Kind::Dock;
        s.state = State::Armed;
    }
    session_ = std::move(s);
    PANEDOCK_LOG_TRACE("drag", "pointer down on '{}'", pane_id);
    return true;
}

bool DragController::begin_native_drag(const PaneId& pane_id, Point p)
{
    if (!manager_.pane(pane_id) || manager_.is_floating(pane_id))
    {
        PANEDOCK_LOG_DEBUG("drag", "native drag refused for '{}'", pane_id);
        return false;
    }
    if (manager_.docked_pane_count() < 2)
    {
        PANEDOCK_LOG_DEBUG("drag", "native drag refused: '{}' is the only docked pane", pane_id);
        return false;
    }

    if (session_)
        cancel();

    Session s;
    s.kind    = Kind::Dock;
    s.source  = pane_id;
    s.origin  = p;
    s.pointer = p;
    session_  = std::move(s);
    enter_dragging(p);
    return true;
}

bool DragController::begin_floating_resize(const PaneId& pane_id, Point p)
{
    const Pane* pane = manager_.pane(pane_id);
    if (!pane || !pane->floating.is_floating)
        return false;

    if (session_)
        cancel();

    Session s;
    s.kind    = Kind::FloatResize;
    s.state   = State::Dragging;
    s.source  = pane_id;
    s.origin  = p;
    s.pointer = p;
    s.start   = pane->floating;
    session_  = std::move(s);
    return true;
}

// ─── Pointer events ──────────────────────────────────────────────────────────

void DragController::on_move(Point p)
{
    if (!session_)
        return;
    session_->pointer = p;

    if (session_->kind != Kind::Dock)
    {
        apply_floating(p);
        return;
    }

    if (session_->state == State::Armed)
    {
        float dx = p.x - session_->origin.x;
        float dy = p.y - session_->origin.y;
        if (std::sqrt(dx * dx + dy * dy) <= manager_.config().drag_threshold)
            return;

        if (manager_.docked_pane_count() < 2)
        {
            PANEDOCK_LOG_DEBUG("drag", "no other docked pane to drop '{}' on", session_->source);
            cancel();
            return;
        }
        enter_dragging(p);
        return;
    }

    if (session_->state == State::Dragging)
        update_hover(p);
}

void DragController::on_release(Point p)
{
    if (!session_)
        return;

    if (session_->kind != Kind::Dock)
    {
        PaneId source = session_->source;
        session_.reset();
        last_outcome_ = State::Idle;
        manager_.set_active_pane(source);
        return;
    }

    if (session_->state == State::Armed)
    {
        PaneId source = session_->source;
        session_.reset();
        last_outcome_ = State::Idle;
        manager_.set_active_pane(source);
        return;
    }

    update_hover(p);
    const DropTarget* hit = hovered_target();
    if (!hit)
    {
        cancel();
        return;
    }

    PaneId                source = session_->source;
    std::optional<PaneId> target = hit->target_pane;
    DropZone              zone   = hit->zone;

    // Overlay goes away before the tree changes.
    session_.reset();

    PANEDOCK_LOG_DEBUG("drag", "drop '{}' on {} ({})", source, target.value_or("root"),
                       to_string(zone));
    if (!manager_.move_pane(source, target, zone))
    {
        // The target changed under the drag (closed or floated).
        last_outcome_ = State::Cancelled;
        PANEDOCK_LOG_DEBUG("drag", "drop of '{}' rejected", source);
        if (on_cancelled_)
            on_cancelled_(source);
        return;
    }
    last_outcome_ = State::Committed;
    if (on_committed_)
        on_committed_(source, target, zone);
}

void DragController::cancel()
{
    if (!session_)
        return;

    Session s = std::move(*session_);
    session_.reset();
    last_outcome_ = State::Cancelled;

    if (s.kind != Kind::Dock)
    {
        // Put the floating window back where the session found it.
        manager_.set_floating_geometry(s.source, s.start.rect());
        return;
    }

    PANEDOCK_LOG_DEBUG("drag", "drag of '{}' cancelled", s.source);
    if (s.state == State::Dragging && on_cancelled_)
        on_cancelled_(s.source);
}

void DragController::on_pointer_leave_workspace()
{
    cancel();
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::optional<DragController::Kind> DragController::kind() const
{
    if (!session_)
        return std::nullopt;
    return session_->kind;
}

std::optional<PaneId> DragController::source_pane() const
{
    if (!session_)
        return std::nullopt;
    return session_->source;
}

const std::vector<DropTarget>& DragController::overlay() const
{
    static const std::vector<DropTarget> empty;
    return session_ ? session_->overlay : empty;
}

const DropTarget* DragController::hovered_target() const
{
    if (!session_ || session_->hovered < 0)
        return nullptr;
    return &session_->overlay[static_cast<size_t>(session_->hovered)];
}

std::optional<GhostToken> DragController::ghost() const
{
    if (!session_)
        return std::nullopt;
    return session_->ghost;
}

// ─── Internals ───────────────────────────────────────────────────────────────

void DragController::enter_dragging(Point p)
{
    session_->state = State::Dragging;
    build_overlay();

    GhostToken token;
    token.position = p;
    if (const Pane* pane = manager_.pane(session_->source))
        token.title = pane->title;
    session_->ghost = std::move(token);

    update_hover(p);
    PANEDOCK_LOG_DEBUG("drag", "dragging '{}' ({} drop zones)", session_->source,
                       session_->overlay.size());
    if (on_started_)
        on_started_(session_->source);
}

// Z-order: pane zones first, workspace edges last (topmost).
void DragController::build_overlay()
{
    const DockConfig& cfg = manager_.config();
    auto&             out = session_->overlay;
    out.clear();

    auto add = [&](const std::optional<PaneId>& target,
                   const Rect&                  rect,
                   DropZone                     zone,
                   const DropZoneParams&        params)
    {
        Rect r = zone_rect(rect, zone, params);
        if (r.empty())
            return;
        out.push_back(DropTarget{target, zone, r, false});
    };

    for (const auto& id : manager_.docked_pane_ids())
    {
        if (id == session_->source)
            continue;
        auto bounds = manager_.pane_bounds(id);
        if (!bounds || bounds->empty())
            continue;
        if (cfg.center_drop_swaps)
            add(id, *bounds, DropZone::Center, cfg.pane_zones);
        for (DropZone z : {DropZone::Left, DropZone::Right, DropZone::Top, DropZone::Bottom})
            add(id, *bounds, z, cfg.pane_zones);
    }

    const Rect& ws = manager_.workspace();
    if (!ws.empty())
    {
        for (DropZone z : {DropZone::Left, DropZone::Right, DropZone::Top, DropZone::Bottom})
            add(std::nullopt, ws, z, cfg.root_zones);
    }
}

void DragController::update_hover(Point p)
{
    if (session_->ghost)
        session_->ghost->position = p;

    for (auto& t : session_->overlay)
        t.highlighted = false;
    session_->hovered = -1;

    const DockConfig&     cfg = manager_.config();
    std::optional<PaneId> target;
    DropZone              zone = DropZone::None;

    // Floating windows sit above every drop zone and accept nothing.
    auto under = manager_.pane_at_point(p);
    if (under && manager_.is_floating(*under))
        return;

    DropZone root_zone = classify(p, manager_.workspace(), cfg.root_zones);
    if (is_edge_zone(root_zone))
    {
        zone = root_zone;
    }
    else if (under && *under != session_->source)
    {
        if (auto bounds = manager_.pane_bounds(*under))
        {
            zone = classify(p, *bounds, cfg.pane_zones);
            if (zone == DropZone::Center && !cfg.center_drop_swaps)
                zone = DropZone::None;
            target = under;
        }
    }
    if (zone == DropZone::None)
        return;

    auto& overlay = session_->overlay;
    for (size_t i = 0; i < overlay.size(); ++i)
    {
        if (overlay[i].zone == zone && overlay[i].target_pane == target)
        {
            overlay[i].highlighted = true;
            session_->hovered      = static_cast<int>(i);
            return;
        }
    }
}

void DragController::apply_floating(Point p)
{
    const DockConfig& cfg   = manager_.config();
    const auto&       start = session_->start;
    float             dx    = p.x - session_->origin.x;
    float             dy    = p.y - session_->origin.y;

    Rect geometry = start.rect();
    if (session_->kind == Kind::FloatMove)
    {
        geometry.x = start.x + dx;
        geometry.y = start.y + dy;
    }
    else
    {
        geometry.w = std::max(cfg.floating_min_width, start.width + dx);
        geometry.h = std::max(cfg.floating_min_height, start.height + dy);
    }
    manager_.set_floating_geometry(session_->source, geometry);
}

}  // namespace panedock
