#include <panedock/layout_serializer.hpp>
#include <panedock/logger.hpp>
#include <panedock/pane_registry.hpp>
#include <sstream>

#include "../core/json.hpp"

namespace panedock
{

// ─── Tree → state ────────────────────────────────────────────────────────────

LayoutNodeState LayoutSerializer::to_node_state(const LayoutNode& node)
{
    if (node.is_leaf())
        return LayoutNodeState::leaf(node.pane_id);

    std::vector<LayoutNodeState> children;
    children.reserve(node.children.size());
    for (const auto& child : node.children)
        children.push_back(to_node_state(*child));
    return LayoutNodeState::split(node.orientation, std::move(children));
}

LayoutState LayoutSerializer::to_state(const LayoutTree&            tree,
                                       const std::optional<PaneId>& active,
                                       const PaneRegistry&          registry)
{
    LayoutState state;
    if (!tree.empty())
        state.root = to_node_state(tree.root());
    state.active_pane_id = active;

    for (const auto& id : registry.ids())
    {
        const Pane* pane = registry.get(id);
        if (!pane || !pane->floating.is_floating)
            continue;
        state.floating.push_back(FloatingPaneState{pane->id,
                                                   pane->floating.x,
                                                   pane->floating.y,
                                                   pane->floating.width,
                                                   pane->floating.height});
    }
    return state;
}

// ─── State → tree ────────────────────────────────────────────────────────────

static void collect_ids(const LayoutNodeState&      state,
                        std::vector<PaneId>&        out,
                        std::unordered_set<PaneId>& seen)
{
    if (state.type == NodeType::Leaf)
    {
        if (!state.pane_id.empty() && seen.insert(state.pane_id).second)
            out.push_back(state.pane_id);
        return;
    }
    for (const auto& child : state.children)
        collect_ids(child, out, seen);
}

std::vector<PaneId> LayoutSerializer::collect_pane_ids(const LayoutNodeState& state)
{
    std::vector<PaneId>        ids;
    std::unordered_set<PaneId> seen;
    collect_ids(state, ids, seen);
    return ids;
}

std::unique_ptr<LayoutNode> LayoutSerializer::build_tree(const LayoutNodeState&      state,
                                                         const FreshIdFn&            fresh_id,
                                                         std::unordered_set<PaneId>& used,
                                                         size_t*                     repairs)
{
    auto substitute = [&](const char* why) -> std::unique_ptr<LayoutNode>
    {
        PaneId id = fresh_id();
        used.insert(id);
        if (repairs)
            ++*repairs;
        PANEDOCK_LOG_WARN("serializer", "{}; substituted pane '{}'", why, id);
        return LayoutNode::make_leaf(std::move(id));
    };

    if (state.type == NodeType::Leaf)
    {
        if (state.pane_id.empty())
            return substitute("leaf without pane id");
        if (!used.insert(state.pane_id).second)
            return substitute("duplicate pane id");
        return LayoutNode::make_leaf(state.pane_id);
    }

    if (state.children.empty())
        return substitute("split without children");

    std::vector<std::unique_ptr<LayoutNode>> children;
    children.reserve(state.children.size());
    for (const auto& child : state.children)
        children.push_back(build_tree(child, fresh_id, used, repairs));
    return LayoutNode::make_split(state.orientation, std::move(children));
}

// ─── JSON ────────────────────────────────────────────────────────────────────

static void write_node(std::ostream& os, const LayoutNodeState& node, int indent)
{
    std::string pad(static_cast<size_t>(indent) * 2, ' ');
    if (node.type == NodeType::Leaf)
    {
        os << "{ \"type\": \"leaf\", \"paneId\": \"" << json::escape(node.pane_id) << "\" }";
        return;
    }

    os << "{\n";
    os << pad << "  \"type\": \"split\",\n";
    os << pad << "  \"orientation\": \"" << to_string(node.orientation) << "\",\n";
    os << pad << "  \"children\": [";
    for (size_t i = 0; i < node.children.size(); ++i)
    {
        os << (i == 0 ? "\n" : ",\n") << pad << "    ";
        write_node(os, node.children[i], indent + 2);
    }
    if (!node.children.empty())
        os << "\n" << pad << "  ";
    os << "]\n" << pad << "}";
}

std::string LayoutSerializer::to_json(const LayoutState& state)
{
    std::ostringstream os;
    os << "{\n  \"root\": ";
    if (state.root)
        write_node(os, *state.root, 1);
    else
        os << "null";
    os << ",\n  \"activePaneId\": ";
    if (state.active_pane_id)
        os << "\"" << json::escape(*state.active_pane_id) << "\"";
    else
        os << "null";

    if (!state.floating.empty())
    {
        os << ",\n  \"floating\": [";
        for (size_t i = 0; i < state.floating.size(); ++i)
        {
            const auto& f = state.floating[i];
            os << (i == 0 ? "\n" : ",\n");
            os << "    { \"paneId\": \"" << json::escape(f.pane_id) << "\""
               << ", \"x\": " << json::format_number(f.x)
               << ", \"y\": " << json::format_number(f.y)
               << ", \"width\": " << json::format_number(f.width)
               << ", \"height\": " << json::format_number(f.height) << " }";
        }
        os << "\n  ]";
    }
    os << "\n}\n";
    return os.str();
}

static LayoutNodeState read_node(const json::Value& value)
{
    if (!value.is_object())
    {
        PANEDOCK_LOG_WARN("serializer", "layout node is not an object");
        return LayoutNodeState::leaf(PaneId{});
    }

    auto type = value.string_member("type");
    if (type && *type == "leaf")
    {
        auto id = value.string_member("paneId");
        if (!id)
            PANEDOCK_LOG_WARN("serializer", "leaf node without a string paneId");
        return LayoutNodeState::leaf(id.value_or(PaneId{}));
    }

    if (type && *type == "split")
    {
        auto              orientation_text = value.string_member("orientation");
        auto              orientation      = orientation_text
                                                 ? orientation_from_string(*orientation_text)
                                                 : std::nullopt;
        const json::Value* children        = value.find("children");
        if (!orientation || !children || !children->is_array())
        {
            PANEDOCK_LOG_WARN("serializer", "split node without orientation or children");
            return LayoutNodeState::leaf(PaneId{});
        }

        std::vector<LayoutNodeState> nodes;
        nodes.reserve(children->items().size());
        for (const auto& child : children->items())
            nodes.push_back(read_node(child));
        return LayoutNodeState::split(*orientation, std::move(nodes));
    }

    PANEDOCK_LOG_WARN("serializer", "unknown layout node type '{}'", type.value_or("(missing)"));
    return LayoutNodeState::leaf(PaneId{});
}

std::optional<LayoutState> LayoutSerializer::from_json(std::string_view text)
{
    auto doc = json::Value::parse(text);
    if (!doc || !doc->is_object())
    {
        PANEDOCK_LOG_WARN("serializer", "layout state is not a JSON object");
        return std::nullopt;
    }

    // "root": null means every pane floats.
    const json::Value* root = doc->find("root");
    if (!root || !(root->is_object() || root->is_null()))
    {
        PANEDOCK_LOG_WARN("serializer", "layout state has no root node");
        return std::nullopt;
    }

    LayoutState state;
    if (root->is_object())
        state.root = read_node(*root);
    if (auto active = doc->string_member("activePaneId"))
        state.active_pane_id = *active;

    const json::Value* floating = doc->find("floating");
    if (floating && floating->is_array())
    {
        for (const auto& entry : floating->items())
        {
            auto id = entry.string_member("paneId");
            auto x  = entry.float_member("x");
            auto y  = entry.float_member("y");
            auto w  = entry.float_member("width");
            auto h  = entry.float_member("height");
            if (!id || id->empty() || !x || !y || !w || !h)
            {
                PANEDOCK_LOG_WARN("serializer", "skipping malformed floating pane entry");
                continue;
            }
            state.floating.push_back(FloatingPaneState{*id, *x, *y, *w, *h});
        }
    }
    return state;
}

}  // namespace panedock
