#include <algorithm>
#include <panedock/logger.hpp>
#include <panedock/pane_id_generator.hpp>
#include <panedock/pane_registry.hpp>

namespace panedock
{

PaneRegistry::PaneRegistry(PaneIdGenerator& id_generator,
                           std::string      default_title,
                           std::string      default_placeholder)
    : id_generator_(id_generator),
      default_title_(std::move(default_title)),
      default_placeholder_(std::move(default_placeholder))
{
}

// ─── Lifetime ────────────────────────────────────────────────────────────────

PaneId PaneRegistry::create_pane()
{
    static constexpr int MAX_ATTEMPTS = 1024;

    PaneId id;
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt)
    {
        id = id_generator_.next();
        if (!id.empty() && !contains(id))
        {
            insert(id);
            return id;
        }
    }

    // Generator keeps handing out live ids; disambiguate locally.
    PANEDOCK_LOG_WARN("registry", "id generator returned {} taken ids, disambiguating '{}'",
                      MAX_ATTEMPTS, id);
    PaneId base = id.empty() ? PaneId("pane") : id;
    for (size_t n = order_.size() + 1;; ++n)
    {
        PaneId candidate = base + "-" + std::to_string(n);
        if (!contains(candidate))
        {
            insert(candidate);
            return candidate;
        }
    }
}

bool PaneRegistry::create_pane_with_id(const PaneId& id)
{
    if (id.empty() || contains(id))
        return false;
    id_generator_.observe(id);
    insert(id);
    return true;
}

void PaneRegistry::insert(const PaneId& id)
{
    Pane pane;
    pane.id          = id;
    pane.title       = default_title_;
    pane.placeholder = default_placeholder_;
    panes_.emplace(id, std::move(pane));
    order_.push_back(id);
}

bool PaneRegistry::remove(const PaneId& id)
{
    auto it = panes_.find(id);
    if (it == panes_.end())
        return false;

    unmount(it->second);
    panes_.erase(it);
    std::erase(order_, id);
    return true;
}

void PaneRegistry::clear()
{
    for (const auto& id : order_)
    {
        auto it = panes_.find(id);
        if (it != panes_.end())
            unmount(it->second);
    }
    panes_.clear();
    order_.clear();
}

// ─── Lookup ──────────────────────────────────────────────────────────────────

Pane* PaneRegistry::get(const PaneId& id)
{
    auto it = panes_.find(id);
    return it == panes_.end() ? nullptr : &it->second;
}

const Pane* PaneRegistry::get(const PaneId& id) const
{
    auto it = panes_.find(id);
    return it == panes_.end() ? nullptr : &it->second;
}

// ─── Mutation ────────────────────────────────────────────────────────────────

bool PaneRegistry::set_content(const PaneId& id, ContentHandle handle)
{
    Pane* pane = get(id);
    if (!pane)
        return false;

    if (handle == INVALID_CONTENT_HANDLE)
        return clear_content(id);
    if (pane->content == handle)
        return true;

    unmount(*pane);
    pane->content = handle;
    if (on_mount_)
        on_mount_(pane->id, handle);
    return true;
}

bool PaneRegistry::clear_content(const PaneId& id)
{
    Pane* pane = get(id);
    if (!pane)
        return false;
    unmount(*pane);
    return true;
}

bool PaneRegistry::set_title(const PaneId& id, const std::string& title)
{
    Pane* pane = get(id);
    if (!pane)
        return false;
    pane->title = title;
    return true;
}

bool PaneRegistry::set_placeholder(const PaneId& id, const std::string& text)
{
    Pane* pane = get(id);
    if (!pane)
        return false;
    pane->placeholder = text;
    return true;
}

void PaneRegistry::refresh_closable()
{
    bool closable = panes_.size() > 1;
    for (auto& [id, pane] : panes_)
        pane.closable = closable;
}

void PaneRegistry::unmount(Pane& pane)
{
    if (!pane.has_content())
        return;
    ContentHandle old = pane.content;
    pane.content      = INVALID_CONTENT_HANDLE;
    if (on_unmount_)
        on_unmount_(pane.id, old);
}

}  // namespace panedock
