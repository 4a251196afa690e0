#include <algorithm>
#include <panedock/drop_zone.hpp>

namespace panedock
{

static float band_for(float extent, const DropZoneParams& params)
{
    if (extent <= 0.0f)
        return 0.0f;
    float band = std::clamp(extent * params.edge_ratio, params.min_band,
                            std::max(params.min_band, params.max_band));
    return std::min(band, extent * 0.5f);
}

EdgeBand edge_band(const Rect& rect, const DropZoneParams& params)
{
    return EdgeBand{band_for(rect.w, params), band_for(rect.h, params)};
}

DropZone classify(Point pointer, const Rect& rect, const DropZoneParams& params)
{
    if (rect.empty() || !rect.contains(pointer))
        return DropZone::None;

    EdgeBand band = edge_band(rect, params);
    float    dx   = pointer.x - rect.x;
    float    dy   = pointer.y - rect.y;

    if (dy < band.vertical)
        return DropZone::Top;
    if (dy >= rect.h - band.vertical)
        return DropZone::Bottom;
    if (dx < band.horizontal)
        return DropZone::Left;
    if (dx >= rect.w - band.horizontal)
        return DropZone::Right;
    return DropZone::Center;
}

Rect zone_rect(const Rect& rect, DropZone zone, const DropZoneParams& params)
{
    EdgeBand band = edge_band(rect, params);
    switch (zone)
    {
        case DropZone::Left:
            return Rect{rect.x, rect.y, band.horizontal, rect.h};
        case DropZone::Right:
            return Rect{rect.right() - band.horizontal, rect.y, band.horizontal, rect.h};
        case DropZone::Top:
            return Rect{rect.x, rect.y, rect.w, band.vertical};
        case DropZone::Bottom:
            return Rect{rect.x, rect.bottom() - band.vertical, rect.w, band.vertical};
        case DropZone::Center:
            return rect;
        case DropZone::None:
            break;
    }
    return Rect{rect.x, rect.y, 0.0f, 0.0f};
}

}  // namespace panedock
