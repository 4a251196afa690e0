#include <panedock/dock_types.hpp>

namespace panedock
{

const char* to_string(Orientation orientation)
{
    switch (orientation)
    {
        case Orientation::Horizontal:
            return "horizontal";
        case Orientation::Vertical:
            return "vertical";
    }
    return "horizontal";
}

const char* to_string(DropZone zone)
{
    switch (zone)
    {
        case DropZone::None:
            return "none";
        case DropZone::Left:
            return "left";
        case DropZone::Right:
            return "right";
        case DropZone::Top:
            return "top";
        case DropZone::Bottom:
            return "bottom";
        case DropZone::Center:
            return "center";
    }
    return "none";
}

std::optional<Orientation> orientation_from_string(std::string_view text)
{
    if (text == "horizontal")
        return Orientation::Horizontal;
    if (text == "vertical")
        return Orientation::Vertical;
    return std::nullopt;
}

std::optional<DropZone> drop_zone_from_string(std::string_view text)
{
    if (text == "left")
        return DropZone::Left;
    if (text == "right")
        return DropZone::Right;
    if (text == "top")
        return DropZone::Top;
    if (text == "bottom")
        return DropZone::Bottom;
    if (text == "center")
        return DropZone::Center;
    if (text == "none")
        return DropZone::None;
    return std::nullopt;
}

std::optional<Orientation> orientation_for_zone(DropZone zone)
{
    switch (zone)
    {
        case DropZone::Left:
        case DropZone::Right:
            return Orientation::Horizontal;
        case DropZone::Top:
        case DropZone::Bottom:
            return Orientation::Vertical;
        case DropZone::Center:
        case DropZone::None:
            break;
    }
    return std::nullopt;
}

bool zone_inserts_before(DropZone zone)
{
    return zone == DropZone::Left || zone == DropZone::Top;
}

}  // namespace panedock
