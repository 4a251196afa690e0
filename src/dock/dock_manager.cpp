#include <algorithm>
#include <panedock/dock_manager.hpp>
#include <panedock/drop_zone.hpp>
#include <panedock/layout_serializer.hpp>
#include <panedock/logger.hpp>
#include <unordered_set>

namespace panedock
{

DockManager::DockManager(DockConfig config, std::unique_ptr<PaneIdGenerator> ids)
    : config_(std::move(config)),
      ids_(ids ? std::move(ids)
               : std::make_unique<SequentialPaneIdGenerator>(config_.pane_id_prefix)),
      registry_(*ids_, config_.default_title, config_.default_placeholder),
      tree_(registry_.create_pane()),
      drag_(*this)
{
    active_ = tree_.first_pane_id();
    registry_.refresh_closable();
}

DockManager::~DockManager() = default;

// ─── Layout operations ───────────────────────────────────────────────────────

std::optional<PaneId> DockManager::split_pane(const PaneId& pane_id, Orientation orientation)
{
    if (!tree_.contains(pane_id))
    {
        PANEDOCK_LOG_DEBUG("dock", "split_pane: '{}' is not a docked pane", pane_id);
        return std::nullopt;
    }

    PaneId created = registry_.create_pane();
    if (!tree_.split_leaf(pane_id, created, orientation))
    {
        PANEDOCK_LOG_ERROR("dock", "split_pane: could not split '{}'", pane_id);
        registry_.remove(created);
        return std::nullopt;
    }

    registry_.refresh_closable();
    PANEDOCK_LOG_DEBUG("dock", "split '{}' {} -> '{}'", pane_id, to_string(orientation), created);
    layout_changed();
    set_active_pane(created);
    return created;
}

bool DockManager::move_pane(const PaneId&                pane_id,
                            const std::optional<PaneId>& target,
                            DropZone                     position)
{
    const Pane* source = registry_.get(pane_id);
    if (!source)
    {
        PANEDOCK_LOG_DEBUG("dock", "move_pane: unknown pane '{}'", pane_id);
        return false;
    }
    if (position == DropZone::None)
        return false;

    const bool floating = source->floating.is_floating;

    if (position == DropZone::Center)
    {
        if (!target)
        {
            PANEDOCK_LOG_DEBUG("dock", "move_pane: center of the workspace is not a drop target");
            return false;
        }
        if (floating)
        {
            PANEDOCK_LOG_DEBUG("dock", "move_pane: cannot swap floating pane '{}'", pane_id);
            return false;
        }
        return swap_panes(pane_id, *target);
    }

    // Validate everything before the tree is touched.
    if (target)
    {
        if (*target == pane_id)
        {
            PANEDOCK_LOG_DEBUG("dock", "move_pane: '{}' dropped onto itself", pane_id);
            return false;
        }
        if (!tree_.contains(*target))
        {
            PANEDOCK_LOG_DEBUG("dock", "move_pane: target '{}' is not a docked pane", *target);
            return false;
        }
    }
    else if (!floating && tree_.leaf_count() < 2)
    {
        PANEDOCK_LOG_DEBUG("dock", "move_pane: '{}' is the only docked pane", pane_id);
        return false;
    }

    if (floating)
    {
        registry_.get(pane_id)->floating.is_floating = false;
        dock_hints_.erase(pane_id);
    }
    else
    {
        tree_.detach(pane_id);
    }

    if (!insert_docked(pane_id, target, position))
    {
        // Cannot happen after validation; keep the pane reachable regardless.
        PANEDOCK_LOG_ERROR("dock", "move_pane: re-insert of '{}' failed, docking at the edge",
                           pane_id);
        tree_.insert_at_root(pane_id, DropZone::Right);
    }

    PANEDOCK_LOG_DEBUG("dock", "moved '{}' to {} of {}", pane_id, to_string(position),
                       target.value_or("workspace"));
    layout_changed();
    set_active_pane(pane_id);
    return true;
}

bool DockManager::swap_panes(const PaneId& a, const PaneId& b)
{
    if (a == b || !tree_.contains(a) || !tree_.contains(b))
    {
        PANEDOCK_LOG_DEBUG("dock", "move_pane: cannot swap '{}' with '{}'", a, b);
        return false;
    }

    tree_.swap(a, b);
    layout_changed();
    set_active_pane(a);
    return true;
}

bool DockManager::insert_docked(const PaneId&                pane_id,
                                const std::optional<PaneId>& target,
                                DropZone                     zone)
{
    if (target)
        return tree_.insert_relative(pane_id, *target, zone);
    return tree_.insert_at_root(pane_id, zone);
}

std::optional<PaneId> DockManager::close_pane(const PaneId& pane_id)
{
    if (!registry_.contains(pane_id))
    {
        PANEDOCK_LOG_DEBUG("dock", "close_pane: unknown pane '{}'", pane_id);
        return active_;
    }

    if (registry_.size() == 1)
    {
        registry_.clear_content(pane_id);
        PANEDOCK_LOG_DEBUG("dock", "close_pane: '{}' is the last pane, cleared", pane_id);
        return pane_id;
    }

    drag_.cancel();
    external_indicator_.reset();

    std::optional<PaneId> fallback;
    for (const auto& id : pane_ids())
    {
        if (id != pane_id)
        {
            fallback = id;
            break;
        }
    }

    if (tree_.contains(pane_id))
    {
        if (tree_.leaf_count() == 1)
        {
            // Last docked pane: the oldest floating pane takes its slot.
            PaneId heir = floating_pane_ids().front();
            tree_.replace_pane(pane_id, heir);
            registry_.get(heir)->floating.is_floating = false;
            dock_hints_.erase(heir);
            PANEDOCK_LOG_DEBUG("dock", "close_pane: docking '{}' in place of '{}'", heir, pane_id);
        }
        else
        {
            tree_.detach(pane_id);
        }
    }

    registry_.remove(pane_id);
    dock_hints_.erase(pane_id);
    registry_.refresh_closable();
    layout_changed();

    if (active_ == pane_id)
        set_active_pane(fallback);

    PANEDOCK_LOG_DEBUG("dock", "closed '{}', active '{}'", pane_id, active_.value_or(""));
    if (on_pane_closed_)
        on_pane_closed_(pane_id, active_);
    return active_;
}

void DockManager::set_active_pane(const std::optional<PaneId>& pane_id)
{
    if (!pane_id || !registry_.contains(*pane_id))
    {
        PANEDOCK_LOG_DEBUG("dock", "set_active_pane: ignoring '{}'", pane_id.value_or("(none)"));
        return;
    }
    if (active_ == pane_id)
        return;

    active_ = pane_id;
    if (on_active_changed_)
        on_active_changed_(*active_);
}

std::vector<PaneId> DockManager::pane_ids() const
{
    std::vector<PaneId> ids      = tree_.pane_ids();
    std::vector<PaneId> floating = floating_pane_ids();
    ids.insert(ids.end(), floating.begin(), floating.end());
    return ids;
}

std::vector<PaneId> DockManager::floating_pane_ids() const
{
    std::vector<PaneId> ids;
    for (const auto& id : registry_.ids())
    {
        if (is_floating(id))
            ids.push_back(id);
    }
    return ids;
}

bool DockManager::is_floating(const PaneId& pane_id) const
{
    const Pane* p = registry_.get(pane_id);
    return p && p->floating.is_floating;
}

// ─── Content ─────────────────────────────────────────────────────────────────

bool DockManager::set_pane_content(const PaneId& pane_id, ContentHandle handle)
{
    if (!registry_.set_content(pane_id, handle))
    {
        PANEDOCK_LOG_DEBUG("dock", "set_pane_content: unknown pane '{}'", pane_id);
        return false;
    }
    return true;
}

bool DockManager::clear_pane(const PaneId& pane_id)
{
    if (!registry_.clear_content(pane_id))
    {
        PANEDOCK_LOG_DEBUG("dock", "clear_pane: unknown pane '{}'", pane_id);
        return false;
    }
    return true;
}

bool DockManager::set_pane_title(const PaneId& pane_id, const std::string& title)
{
    if (!registry_.set_title(pane_id, title))
    {
        PANEDOCK_LOG_DEBUG("dock", "set_pane_title: unknown pane '{}'", pane_id);
        return false;
    }
    return true;
}

bool DockManager::set_pane_placeholder(const PaneId& pane_id, const std::string& text)
{
    if (!registry_.set_placeholder(pane_id, text))
    {
        PANEDOCK_LOG_DEBUG("dock", "set_pane_placeholder: unknown pane '{}'", pane_id);
        return false;
    }
    return true;
}

// ─── Persistence ─────────────────────────────────────────────────────────────

LayoutState DockManager::get_state() const
{
    return LayoutSerializer::to_state(tree_, active_, registry_);
}

void DockManager::restore_state(const LayoutState& state)
{
    drag_.cancel();
    external_indicator_.reset();
    registry_.clear();
    dock_hints_.clear();

    // Adopt every usable id first so fresh ids for repaired leaves never
    // collide with one that appears later in the document.
    std::vector<PaneId> tree_ids;
    if (state.root)
        tree_ids = LayoutSerializer::collect_pane_ids(*state.root);
    std::unordered_set<PaneId> in_tree(tree_ids.begin(), tree_ids.end());
    for (const auto& id : tree_ids)
        registry_.create_pane_with_id(id);

    std::vector<const FloatingPaneState*> floating;
    for (const auto& f : state.floating)
    {
        if (f.pane_id.empty() || in_tree.count(f.pane_id) || !registry_.create_pane_with_id(f.pane_id))
        {
            PANEDOCK_LOG_WARN("serializer", "ignoring floating entry '{}'", f.pane_id);
            continue;
        }
        floating.push_back(&f);
    }

    size_t repairs = 0;
    if (state.root)
    {
        std::unordered_set<PaneId> used;
        auto                       root = LayoutSerializer::build_tree(
            *state.root, [this] { return registry_.create_pane(); }, used, &repairs);
        tree_.reset(std::move(root));
    }
    else if (floating.empty())
    {
        PANEDOCK_LOG_WARN("serializer", "layout state has no panes, starting with an empty one");
        tree_.reset(registry_.create_pane());
        ++repairs;
    }
    else
    {
        tree_.clear();
    }

    for (const auto* f : floating)
    {
        Pane* pane               = registry_.get(f->pane_id);
        pane->floating.is_floating = true;
        pane->floating.x           = f->x;
        pane->floating.y           = f->y;
        pane->floating.width       = std::max(config_.floating_min_width, f->width);
        pane->floating.height      = std::max(config_.floating_min_height, f->height);
    }

    registry_.refresh_closable();

    std::optional<PaneId> active;
    if (state.active_pane_id && registry_.contains(*state.active_pane_id))
        active = state.active_pane_id;
    else
        active = pane_ids().front();
    active_.reset();
    set_active_pane(active);

    PANEDOCK_LOG_INFO("dock", "restored layout: {} panes ({} floating, {} repaired)",
                      registry_.size(), floating.size(), repairs);
    layout_changed();
}

std::string DockManager::save_state_json() const
{
    return LayoutSerializer::to_json(get_state());
}

bool DockManager::restore_state_json(std::string_view json)
{
    auto state = LayoutSerializer::from_json(json);
    if (!state)
        return false;
    restore_state(*state);
    return true;
}

// ─── Floating panes ──────────────────────────────────────────────────────────

DockManager::DockHint DockManager::dock_hint_for(const PaneId& pane_id) const
{
    DockHint          hint;
    const LayoutNode* leaf   = tree_.find_leaf(pane_id);
    const LayoutNode* parent = leaf ? tree_.parent_of(leaf) : nullptr;
    if (!parent)
        return hint;

    size_t idx = 0;
    while (idx < parent->children.size() && parent->children[idx].get() != leaf)
        ++idx;

    const bool horiz = parent->orientation == Orientation::Horizontal;
    if (idx > 0)
    {
        // Re-dock after the nearest pane of the previous sibling.
        const LayoutNode* n = parent->children[idx - 1].get();
        while (n->is_split())
            n = n->children.back().get();
        hint.neighbour = n->pane_id;
        hint.zone      = horiz ? DropZone::Right : DropZone::Bottom;
    }
    else if (parent->children.size() > 1)
    {
        const LayoutNode* n = parent->children[1].get();
        while (n->is_split())
            n = n->children.front().get();
        hint.neighbour = n->pane_id;
        hint.zone      = horiz ? DropZone::Left : DropZone::Top;
    }
    return hint;
}

bool DockManager::float_pane(const PaneId& pane_id, const std::optional<Rect>& rendered_bounds)
{
    if (!tree_.contains(pane_id))
    {
        PANEDOCK_LOG_DEBUG("dock", "float_pane: '{}' is not a docked pane", pane_id);
        return false;
    }
    if (drag_.source_pane() == pane_id)
        drag_.cancel();

    Rect geometry;
    if (rendered_bounds && !rendered_bounds->empty())
    {
        geometry = Rect{rendered_bounds->x - workspace_.x, rendered_bounds->y - workspace_.y,
                        rendered_bounds->w, rendered_bounds->h};
    }
    else if (auto b = pane_bounds(pane_id); b && !b->empty())
    {
        geometry = Rect{b->x - workspace_.x, b->y - workspace_.y, b->w, b->h};
    }
    else
    {
        float offset = config_.floating_offset * static_cast<float>(floating_pane_ids().size() + 1);
        geometry     = Rect{offset, offset, config_.floating_default_width,
                        config_.floating_default_height};
    }

    dock_hints_[pane_id] = dock_hint_for(pane_id);
    if (tree_.leaf_count() == 1)
        tree_.clear();  // Docked area stays empty until a pane docks again
    else
        tree_.detach(pane_id);

    Pane* pane                 = registry_.get(pane_id);
    pane->floating.is_floating = true;
    pane->floating.x           = geometry.x;
    pane->floating.y           = geometry.y;
    pane->floating.width       = std::max(config_.floating_min_width, geometry.w);
    pane->floating.height      = std::max(config_.floating_min_height, geometry.h);

    PANEDOCK_LOG_DEBUG("dock", "floated '{}'", pane_id);
    layout_changed();
    set_active_pane(pane_id);
    return true;
}

bool DockManager::dock_pane(const PaneId& pane_id)
{
    if (!is_floating(pane_id))
    {
        PANEDOCK_LOG_DEBUG("dock", "dock_pane: '{}' is not floating", pane_id);
        return false;
    }

    if (drag_.source_pane() == pane_id)
        drag_.cancel();

    auto it = dock_hints_.find(pane_id);
    if (it != dock_hints_.end() && tree_.contains(it->second.neighbour))
        return move_pane(pane_id, it->second.neighbour, it->second.zone);
    return move_pane(pane_id, std::nullopt, DropZone::Right);
}

bool DockManager::toggle_floating(const PaneId& pane_id)
{
    return is_floating(pane_id) ? dock_pane(pane_id) : float_pane(pane_id);
}

bool DockManager::set_floating_geometry(const PaneId& pane_id, const Rect& geometry)
{
    Pane* pane = registry_.get(pane_id);
    if (!pane || !pane->floating.is_floating)
        return false;

    pane->floating.x      = geometry.x;
    pane->floating.y      = geometry.y;
    pane->floating.width  = std::max(config_.floating_min_width, geometry.w);
    pane->floating.height = std::max(config_.floating_min_height, geometry.h);
    return true;
}

// ─── Geometry ────────────────────────────────────────────────────────────────

void DockManager::update_layout(const Rect& workspace)
{
    workspace_     = workspace;
    has_workspace_ = true;
    tree_.compute_bounds(workspace_);
}

std::optional<Rect> DockManager::pane_bounds(const PaneId& pane_id) const
{
    const Pane* pane = registry_.get(pane_id);
    if (!pane)
        return std::nullopt;
    if (pane->floating.is_floating)
    {
        return Rect{workspace_.x + pane->floating.x, workspace_.y + pane->floating.y,
                    pane->floating.width, pane->floating.height};
    }
    if (!has_workspace_)
        return std::nullopt;
    return tree_.bounds_of(pane_id);
}

std::optional<Rect> DockManager::content_bounds(const PaneId& pane_id) const
{
    auto bounds = pane_bounds(pane_id);
    if (!bounds)
        return std::nullopt;
    float header = std::min(config_.pane_header_height, bounds->h);
    return Rect{bounds->x, bounds->y + header, bounds->w, bounds->h - header};
}

std::optional<PaneId> DockManager::pane_at_point(Point p) const
{
    // Floating panes sit above the tree; the newest one is on top.
    auto floating = floating_pane_ids();
    for (auto it = floating.rbegin(); it != floating.rend(); ++it)
    {
        auto bounds = pane_bounds(*it);
        if (bounds && bounds->contains(p))
            return *it;
    }
    if (!has_workspace_)
        return std::nullopt;
    return tree_.pane_at(p);
}

void DockManager::layout_changed()
{
    if (has_workspace_)
        tree_.compute_bounds(workspace_);
    if (on_layout_changed_)
        on_layout_changed_();
}

// ─── External drops ──────────────────────────────────────────────────────────

bool DockManager::accepts_external(const ExternalDragEvent& event) const
{
    if (drag_.is_active() || !can_accept_external_)
        return false;
    return can_accept_external_(event);
}

std::optional<ExternalDropIndicator> DockManager::classify_external(Point p) const
{
    auto pane_id = pane_at_point(p);
    if (!pane_id)
        return std::nullopt;
    auto bounds = content_bounds(*pane_id);
    if (!bounds)
        return std::nullopt;

    DropZone zone = classify(p, *bounds, config_.external_zones);
    if (zone == DropZone::None)
        return std::nullopt;
    return ExternalDropIndicator{*pane_id, zone, zone_rect(*bounds, zone, config_.external_zones)};
}

DropZone DockManager::external_drag_over(const ExternalDragEvent& event)
{
    if (!accepts_external(event))
    {
        external_indicator_.reset();
        return DropZone::None;
    }
    external_indicator_ = classify_external(event.position);
    return external_indicator_ ? external_indicator_->zone : DropZone::None;
}

bool DockManager::external_drop(const ExternalDragEvent& event)
{
    if (!accepts_external(event))
    {
        external_indicator_.reset();
        return false;
    }

    auto hit = classify_external(event.position);
    external_indicator_.reset();
    if (!hit)
        return false;

    set_active_pane(hit->pane_id);
    PANEDOCK_LOG_DEBUG("dock", "external drop on '{}' ({})", hit->pane_id, to_string(hit->zone));
    if (on_external_drop_)
        on_external_drop_(hit->pane_id, hit->zone, event);
    return true;
}

}  // namespace panedock
