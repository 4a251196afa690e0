#include <iostream>
#include <panedock/panedock.hpp>
#include <string>

using namespace panedock;

// Prints the docked tree with each leaf's computed bounds.
static void print_node(const LayoutNode& node, int depth)
{
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    if (node.is_leaf())
    {
        std::cout << indent << node.pane_id << "  (" << node.bounds.x << ", " << node.bounds.y
                  << ", " << node.bounds.w << " x " << node.bounds.h << ")\n";
        return;
    }
    std::cout << indent << to_string(node.orientation) << "\n";
    for (const auto& child : node.children)
        print_node(*child, depth + 1);
}

static void print_layout(const DockManager& dm, const char* label)
{
    std::cout << "── " << label << " ──\n";
    if (!dm.layout_tree().empty())
        print_node(dm.layout_tree().root(), 1);
    for (const auto& id : dm.floating_pane_ids())
    {
        auto b = dm.pane_bounds(id);
        std::cout << "  floating " << id << "  (" << b->x << ", " << b->y << ", " << b->w << " x "
                  << b->h << ")\n";
    }
    std::cout << "  active: " << dm.active_pane_id().value_or("(none)") << "\n\n";
}

int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    DockConfig config;
    std::string config_path = argc > 1 ? argv[1] : DockConfig::default_path();
    if (config.load(config_path))
        PANEDOCK_LOG_INFO("config", "loaded dock config from '{}'", config_path);

    DockManager dm(config);
    dm.set_on_active_pane_changed([](const PaneId& id)
                                  { PANEDOCK_LOG_INFO("example", "active pane -> {}", id); });
    dm.set_on_pane_closed(
        [](const PaneId& closed, const std::optional<PaneId>& next)
        { PANEDOCK_LOG_INFO("example", "closed {}, next {}", closed, next.value_or("(none)")); });

    dm.update_layout(Rect{0.0f, 0.0f, 1600.0f, 1000.0f});

    PaneId editor  = "pane-1";
    PaneId netlist = *dm.split_pane(editor, Orientation::Horizontal);
    PaneId waves   = *dm.split_pane(netlist, Orientation::Vertical);
    dm.set_pane_title(editor, "Editor");
    dm.set_pane_title(netlist, "Netlist");
    dm.set_pane_title(waves, "Waveforms");
    dm.set_pane_content(editor, 1);
    print_layout(dm, "after splits");

    // Drag the waveform pane by its header onto the left edge of the editor.
    auto& drag = dm.drag_controller();
    drag.pointer_down(waves, Point{1200.0f, 510.0f});
    drag.on_move(Point{1100.0f, 520.0f});
    drag.on_move(Point{700.0f, 500.0f});
    if (const DropTarget* hit = drag.hovered_target())
        PANEDOCK_LOG_INFO("example", "hovering {} of {}", to_string(hit->zone),
                          hit->target_pane.value_or("workspace"));
    drag.on_release(Point{700.0f, 500.0f});
    print_layout(dm, "after drag");

    dm.float_pane(netlist);
    dm.set_floating_geometry(netlist, Rect{200.0f, 150.0f, 480.0f, 320.0f});
    print_layout(dm, "after float");

    std::string saved = dm.save_state_json();
    std::cout << saved << "\n";

    dm.close_pane(editor);
    dm.dock_pane(netlist);
    print_layout(dm, "after close + dock");

    if (!dm.restore_state_json(saved))
    {
        PANEDOCK_LOG_ERROR("example", "could not restore saved layout");
        return 1;
    }
    print_layout(dm, "restored");
    return 0;
}
