#pragma once

#include <string>

namespace panedock
{

// Edge band sizing for one kind of drop target. The band along each axis is
// clamp(extent * edge_ratio, min_band, max_band).
struct DropZoneParams
{
    float edge_ratio = 0.35f;
    float min_band   = 40.0f;
    float max_band   = 140.0f;

    bool operator==(const DropZoneParams&) const = default;
};

// Tunables for the dock manager. Persisted as JSON next to the user's other
// settings; every field falls back to its default when absent from the file.
struct DockConfig
{
    static constexpr int FORMAT_VERSION = 1;

    // Drop zones for pane targets, the workspace root, and drags that come
    // from outside the manager.
    DropZoneParams pane_zones{0.35f, 40.0f, 140.0f};
    DropZoneParams root_zones{0.35f, 40.0f, 200.0f};
    DropZoneParams external_zones{0.35f, 40.0f, 140.0f};

    // Dropping on the center of another pane swaps the two panes. When
    // false the center region accepts nothing.
    bool center_drop_swaps = true;

    // Pointer travel (px) before a pointer-down on pane chrome becomes a drag.
    float drag_threshold = 4.0f;

    // Height of the pane header strip; content bounds exclude it.
    float pane_header_height = 32.0f;

    float floating_default_width  = 360.0f;
    float floating_default_height = 240.0f;
    float floating_min_width      = 160.0f;
    float floating_min_height     = 100.0f;
    float floating_offset         = 40.0f;  // Cascade offset when no bounds are known

    std::string pane_id_prefix      = "pane-";
    std::string default_title       = "Empty Pane";
    std::string default_placeholder = "Select an item to open it here.";

    std::string serialize() const;

    // Returns false (leaving *this untouched) for malformed JSON or a newer
    // format version.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // $HOME/.config/panedock/dock.json
    static std::string default_path();

    bool operator==(const DockConfig&) const = default;
};

}  // namespace panedock
