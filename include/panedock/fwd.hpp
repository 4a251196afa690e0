#pragma once

#include <cstdint>
#include <string>

namespace panedock
{

// Stable pane identifier ("pane-1", "pane-2", ...). Independent of the
// pane's position in the layout tree and preserved across save/restore.
using PaneId = std::string;

// Opaque handle to hosted content (an editor, a tool view). The manager never
// dereferences it; it is only forwarded to the mount/unmount callbacks.
using ContentHandle = uint64_t;

// Sentinel value for "no content mounted".
inline constexpr ContentHandle INVALID_CONTENT_HANDLE = 0;

struct Rect;
struct Point;

struct Pane;
struct LayoutNode;
struct LayoutNodeState;
struct LayoutState;
struct DockConfig;

class PaneRegistry;
class PaneIdGenerator;
class LayoutTree;
class DragController;
class DockManager;

}  // namespace panedock
