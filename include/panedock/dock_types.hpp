#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace panedock
{

// ─── Orientation ─────────────────────────────────────────────────────────────

enum class Orientation
{
    Horizontal,  // Children side by side (left | right)
    Vertical     // Children stacked (top / bottom)
};

// ─── Drop zones ──────────────────────────────────────────────────────────────

enum class DropZone
{
    None,
    Left,
    Right,
    Top,
    Bottom,
    Center  // Swap with the target pane
};

const char* to_string(Orientation orientation);
const char* to_string(DropZone zone);

std::optional<Orientation> orientation_from_string(std::string_view text);
std::optional<DropZone>    drop_zone_from_string(std::string_view text);

// Left/Right dock side by side, Top/Bottom stack. Center and None have no
// orientation.
std::optional<Orientation> orientation_for_zone(DropZone zone);

// True if a pane dropped on this zone goes before the target (Left/Top).
bool zone_inserts_before(DropZone zone);

inline bool is_edge_zone(DropZone zone)
{
    return zone == DropZone::Left || zone == DropZone::Right || zone == DropZone::Top
           || zone == DropZone::Bottom;
}

}  // namespace panedock
