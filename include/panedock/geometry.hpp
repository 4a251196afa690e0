#pragma once

namespace panedock
{

struct Point
{
    float x = 0.0f;
    float y = 0.0f;
};

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float right() const { return x + w; }
    float bottom() const { return y + h; }
    bool  empty() const { return w <= 0.0f || h <= 0.0f; }

    // Half-open containment: the right and bottom edges belong to the
    // neighbouring rect, so adjacent panes never both claim a pointer.
    bool contains(Point p) const { return p.x >= x && p.x < x + w && p.y >= y && p.y < y + h; }

    bool operator==(const Rect&) const = default;
};

}  // namespace panedock
