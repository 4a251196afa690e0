#pragma once

#include <functional>
#include <panedock/fwd.hpp>
#include <panedock/geometry.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace panedock
{

// Free-floating placement of a pane detached from the layout tree. x/y are
// relative to the workspace origin.
struct FloatingGeometry
{
    bool  is_floating = false;
    float x           = 0.0f;
    float y           = 0.0f;
    float width       = 0.0f;
    float height      = 0.0f;

    Rect rect() const { return Rect{x, y, width, height}; }
};

struct Pane
{
    PaneId           id;
    std::string      title;
    std::string      placeholder;  // Shown while no content is mounted
    ContentHandle    content  = INVALID_CONTENT_HANDLE;
    bool             closable = false;  // Close affordance hidden when only one pane exists
    FloatingGeometry floating;

    bool has_content() const { return content != INVALID_CONTENT_HANDLE; }
};

// ─── PaneRegistry ────────────────────────────────────────────────────────────
// Owns the set of live panes, keyed by stable id. Knows nothing about the
// layout tree. Unknown ids are ignored (false / nullptr), never thrown on.

class PaneRegistry
{
   public:
    using ContentCallback = std::function<void(const PaneId& pane_id, ContentHandle handle)>;

    PaneRegistry(PaneIdGenerator& id_generator,
                 std::string      default_title,
                 std::string      default_placeholder);
    ~PaneRegistry() = default;

    PaneRegistry(const PaneRegistry&)            = delete;
    PaneRegistry& operator=(const PaneRegistry&) = delete;

    // ── Lifetime ────────────────────────────────────────────────────────

    PaneId create_pane();

    // Adopt an id from a restored layout. False if empty or already live.
    bool create_pane_with_id(const PaneId& id);

    // Unmounts any content first.
    bool remove(const PaneId& id);

    // Removes every pane (unmounting content).
    void clear();

    // ── Lookup ──────────────────────────────────────────────────────────

    Pane*       get(const PaneId& id);
    const Pane* get(const PaneId& id) const;
    bool        contains(const PaneId& id) const { return panes_.count(id) != 0; }
    size_t      size() const { return panes_.size(); }

    // Creation order.
    const std::vector<PaneId>& ids() const { return order_; }

    // ── Mutation ────────────────────────────────────────────────────────

    bool set_content(const PaneId& id, ContentHandle handle);
    bool clear_content(const PaneId& id);
    bool set_title(const PaneId& id, const std::string& title);
    bool set_placeholder(const PaneId& id, const std::string& text);

    // closable = (size() > 1) on every pane.
    void refresh_closable();

    // ── Rendering collaborator ──────────────────────────────────────────

    void set_on_mount(ContentCallback cb) { on_mount_ = std::move(cb); }
    void set_on_unmount(ContentCallback cb) { on_unmount_ = std::move(cb); }

   private:
    PaneIdGenerator& id_generator_;
    std::string      default_title_;
    std::string      default_placeholder_;

    std::unordered_map<PaneId, Pane> panes_;
    std::vector<PaneId>              order_;

    ContentCallback on_mount_;
    ContentCallback on_unmount_;

    void insert(const PaneId& id);
    void unmount(Pane& pane);
};

}  // namespace panedock
