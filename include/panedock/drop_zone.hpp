#pragma once

#include <panedock/dock_config.hpp>
#include <panedock/dock_types.hpp>
#include <panedock/geometry.hpp>

namespace panedock
{

// ─── Drop zone calculator ────────────────────────────────────────────────────
// Pure functions mapping a pointer over a rectangle to a drop zone. Used for
// pane targets, the workspace root, and drags coming from outside.

// Band thickness along each axis: `horizontal` is the width of the Left/Right
// bands, `vertical` the height of the Top/Bottom bands.
struct EdgeBand
{
    float horizontal = 0.0f;
    float vertical   = 0.0f;
};

// clamp(extent * edge_ratio, min_band, max_band), never more than half the
// extent so opposite bands cannot overlap.
EdgeBand edge_band(const Rect& rect, const DropZoneParams& params);

// None outside the rect. Top and Bottom win over Left and Right in the
// corners; anything not in a band is Center.
DropZone classify(Point pointer, const Rect& rect, const DropZoneParams& params);

// Highlight rectangle for a zone. Center covers the whole rect; None gives an
// empty rect at the origin of `rect`.
Rect zone_rect(const Rect& rect, DropZone zone, const DropZoneParams& params);

}  // namespace panedock
