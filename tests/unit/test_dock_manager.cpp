#include <gtest/gtest.h>
#include <memory>
#include <panedock/dock_manager.hpp>
#include <panedock/logger.hpp>
#include <vector>

using namespace panedock;

using Ids = std::vector<PaneId>;

// ─── Construction ────────────────────────────────────────────────────────────

TEST(DockManagerConstruction, SeedsOnePane)
{
    DockManager dm;
    EXPECT_EQ(dm.pane_count(), 1u);
    EXPECT_EQ(dm.pane_ids(), (Ids{"pane-1"}));
    EXPECT_EQ(dm.active_pane_id(), PaneId("pane-1"));

    const Pane* pane = dm.pane("pane-1");
    ASSERT_NE(pane, nullptr);
    EXPECT_EQ(pane->title, "Empty Pane");
    EXPECT_EQ(pane->placeholder, "Select an item to open it here.");
    EXPECT_FALSE(pane->closable);
    EXPECT_TRUE(dm.layout_tree().root().is_leaf());
}

TEST(DockManagerConstruction, ConfigDrivesDefaults)
{
    DockConfig cfg;
    cfg.pane_id_prefix      = "view-";
    cfg.default_title       = "Untitled";
    cfg.default_placeholder = "Drop something here";

    DockManager dm(cfg);
    EXPECT_EQ(dm.pane_ids(), (Ids{"view-1"}));
    EXPECT_EQ(dm.pane("view-1")->title, "Untitled");
    EXPECT_EQ(dm.pane("view-1")->placeholder, "Drop something here");
}

class CountingGenerator : public PaneIdGenerator
{
   public:
    PaneId next() override { return "doc-" + std::to_string(++n); }
    void   observe(const PaneId&) override { ++observed; }

    int n        = 0;
    int observed = 0;
};

TEST(DockManagerConstruction, InjectedGenerator)
{
    auto  gen = std::make_unique<CountingGenerator>();
    auto* raw = gen.get();

    DockManager dm(DockConfig{}, std::move(gen));
    EXPECT_EQ(dm.active_pane_id(), PaneId("doc-1"));
    EXPECT_EQ(dm.split_pane("doc-1", Orientation::Horizontal), PaneId("doc-2"));
    EXPECT_EQ(raw->n, 2);
}

// ─── Split ───────────────────────────────────────────────────────────────────

TEST(DockManagerSplit, NewPaneBecomesActive)
{
    DockManager dm;
    auto        p2 = dm.split_pane("pane-1", Orientation::Horizontal);
    ASSERT_TRUE(p2.has_value());
    EXPECT_EQ(*p2, "pane-2");
    EXPECT_EQ(dm.active_pane_id(), p2);
    EXPECT_EQ(dm.pane_ids(), (Ids{"pane-1", "pane-2"}));
    EXPECT_TRUE(dm.pane("pane-1")->closable);
    EXPECT_TRUE(dm.pane("pane-2")->closable);
}

TEST(DockManagerSplit, UnknownPane)
{
    DockManager dm;
    EXPECT_FALSE(dm.split_pane("missing", Orientation::Vertical).has_value());
    EXPECT_EQ(dm.pane_count(), 1u);
}

TEST(DockManagerSplit, FlatteningSameOrientation)
{
    DockManager dm;
    auto        p2 = dm.split_pane("pane-1", Orientation::Horizontal);
    dm.split_pane(*p2, Orientation::Horizontal);

    const LayoutNode& root = dm.layout_tree().root();
    ASSERT_TRUE(root.is_split());
    EXPECT_EQ(root.orientation, Orientation::Horizontal);
    EXPECT_EQ(root.children.size(), 3u);
    for (const auto& child : root.children)
        EXPECT_TRUE(child->is_leaf());
}

// ─── Move ────────────────────────────────────────────────────────────────────

class DockManagerThreePanes : public ::testing::Test
{
   protected:
    DockManager dm;
    PaneId      p1 = "pane-1";
    PaneId      p2;
    PaneId      p3;

    void SetUp() override
    {
        p2 = *dm.split_pane(p1, Orientation::Horizontal);
        p3 = *dm.split_pane(p2, Orientation::Vertical);
    }
};

TEST_F(DockManagerThreePanes, ScenarioMoveLeftOfFirst)
{
    EXPECT_TRUE(dm.move_pane(p3, p1, DropZone::Left));

    LayoutState state = dm.get_state();
    EXPECT_EQ(state.root, LayoutNodeState::split(Orientation::Horizontal,
                                                 {LayoutNodeState::leaf(p3),
                                                  LayoutNodeState::leaf(p1),
                                                  LayoutNodeState::leaf(p2)}));
    EXPECT_EQ(dm.active_pane_id(), p3);
    EXPECT_TRUE(dm.layout_tree().check_invariants());
}

TEST_F(DockManagerThreePanes, EdgeInsertUnderVerticalSplit)
{
    // H[p1, V[p2, p3]]: drop p1 left of p2 -> V[H[p1, p2], p3] at the root
    EXPECT_TRUE(dm.move_pane(p1, p2, DropZone::Left));

    LayoutState state = dm.get_state();
    EXPECT_EQ(state.root,
              LayoutNodeState::split(Orientation::Vertical,
                                     {LayoutNodeState::split(Orientation::Horizontal,
                                                             {LayoutNodeState::leaf(p1),
                                                              LayoutNodeState::leaf(p2)}),
                                      LayoutNodeState::leaf(p3)}));
}

TEST_F(DockManagerThreePanes, SwapOnCenter)
{
    LayoutState before = dm.get_state();
    EXPECT_TRUE(dm.move_pane(p1, p3, DropZone::Center));

    LayoutState after = dm.get_state();
    EXPECT_EQ(after.root,
              LayoutNodeState::split(Orientation::Horizontal,
                                     {LayoutNodeState::leaf(p3),
                                      LayoutNodeState::split(Orientation::Vertical,
                                                             {LayoutNodeState::leaf(p2),
                                                              LayoutNodeState::leaf(p1)})}));
    EXPECT_EQ(dm.active_pane_id(), p1);

    // Swapping back restores the first shape.
    dm.move_pane(p1, p3, DropZone::Center);
    EXPECT_EQ(dm.get_state().root, before.root);
}

TEST_F(DockManagerThreePanes, RejectedMovesLeaveTreeAlone)
{
    LayoutState before = dm.get_state();

    EXPECT_FALSE(dm.move_pane(p1, p1, DropZone::Center));
    EXPECT_FALSE(dm.move_pane(p1, p1, DropZone::Left));
    EXPECT_FALSE(dm.move_pane("missing", p1, DropZone::Left));
    EXPECT_FALSE(dm.move_pane(p1, PaneId("missing"), DropZone::Right));
    EXPECT_FALSE(dm.move_pane(p1, p2, DropZone::None));
    EXPECT_FALSE(dm.move_pane(p1, std::nullopt, DropZone::Center));

    EXPECT_EQ(dm.get_state(), before);
}

TEST_F(DockManagerThreePanes, MoveToRootEdges)
{
    EXPECT_TRUE(dm.move_pane(p2, std::nullopt, DropZone::Bottom));

    LayoutState state = dm.get_state();
    EXPECT_EQ(state.root,
              LayoutNodeState::split(Orientation::Vertical,
                                     {LayoutNodeState::split(Orientation::Horizontal,
                                                             {LayoutNodeState::leaf(p1),
                                                              LayoutNodeState::leaf(p3)}),
                                      LayoutNodeState::leaf(p2)}));
    EXPECT_EQ(dm.active_pane_id(), p2);

    EXPECT_TRUE(dm.move_pane(p1, std::nullopt, DropZone::Top));
    EXPECT_EQ(dm.pane_ids(), (Ids{p1, p3, p2}));
    EXPECT_TRUE(dm.layout_tree().check_invariants());
}

TEST(DockManagerMove, RootMoveOfTwoPanes)
{
    DockManager dm;
    auto        p2 = *dm.split_pane("pane-1", Orientation::Horizontal);

    EXPECT_TRUE(dm.move_pane(p2, std::nullopt, DropZone::Top));
    LayoutState state = dm.get_state();
    EXPECT_EQ(state.root, LayoutNodeState::split(Orientation::Vertical,
                                                 {LayoutNodeState::leaf(p2),
                                                  LayoutNodeState::leaf("pane-1")}));
    EXPECT_EQ(dm.active_pane_id(), p2);
}

TEST(DockManagerMove, SolePaneCannotMoveToRoot)
{
    DockManager dm;
    EXPECT_FALSE(dm.move_pane("pane-1", std::nullopt, DropZone::Left));
    EXPECT_TRUE(dm.layout_tree().root().is_leaf());
}

// ─── Close ───────────────────────────────────────────────────────────────────

TEST_F(DockManagerThreePanes, CloseCollapsesSplits)
{
    dm.set_active_pane(p3);
    EXPECT_EQ(dm.close_pane(p3), PaneId(p1));
    EXPECT_EQ(dm.pane_ids(), (Ids{p1, p2}));
    EXPECT_EQ(dm.active_pane_id(), p1);

    dm.close_pane(p2);
    EXPECT_EQ(dm.pane_ids(), (Ids{p1}));
    EXPECT_EQ(dm.active_pane_id(), p1);
    EXPECT_EQ(dm.get_state().root->type, NodeType::Leaf);
    EXPECT_FALSE(dm.pane(p1)->closable);
}

TEST_F(DockManagerThreePanes, CloseInactiveKeepsActive)
{
    dm.set_active_pane(p2);
    EXPECT_EQ(dm.close_pane(p1), PaneId(p2));
    EXPECT_EQ(dm.active_pane_id(), p2);
    EXPECT_EQ(dm.pane(p1), nullptr);
}

TEST_F(DockManagerThreePanes, CloseFiresCallback)
{
    PaneId                closed;
    std::optional<PaneId> next;
    dm.set_on_pane_closed(
        [&](const PaneId& c, const std::optional<PaneId>& n)
        {
            closed = c;
            next   = n;
        });

    dm.close_pane(p3);
    EXPECT_EQ(closed, p3);
    EXPECT_EQ(next, PaneId(p1));
}

TEST(DockManagerClose, LastPaneIsClearedNotRemoved)
{
    DockManager dm;
    std::vector<ContentHandle> unmounted;
    dm.set_on_content_unmounted([&](const PaneId&, ContentHandle h) { unmounted.push_back(h); });

    dm.set_pane_content("pane-1", 42);
    EXPECT_EQ(dm.close_pane("pane-1"), PaneId("pane-1"));
    EXPECT_EQ(dm.pane_count(), 1u);
    EXPECT_FALSE(dm.pane("pane-1")->has_content());
    EXPECT_EQ(unmounted, (std::vector<ContentHandle>{42}));
}

TEST(DockManagerClose, UnknownReturnsActive)
{
    DockManager dm;
    dm.split_pane("pane-1", Orientation::Vertical);
    EXPECT_EQ(dm.close_pane("missing"), PaneId("pane-2"));
    EXPECT_EQ(dm.pane_count(), 2u);
}

TEST(DockManagerClose, ClosingDownToOneAlwaysLeavesLeafRoot)
{
    DockManager dm;
    PaneId      last = "pane-1";
    for (int i = 0; i < 6; ++i)
        last = *dm.split_pane(last, i % 2 ? Orientation::Vertical : Orientation::Horizontal);

    while (dm.pane_count() > 1)
    {
        dm.close_pane(dm.pane_ids().back());
        EXPECT_TRUE(dm.layout_tree().check_invariants());
    }
    EXPECT_TRUE(dm.layout_tree().root().is_leaf());
    EXPECT_EQ(dm.active_pane_id(), dm.pane_ids().front());
}

// ─── Active pane ─────────────────────────────────────────────────────────────

TEST(DockManagerActive, IgnoresUnknownAndNull)
{
    DockManager dm;
    dm.split_pane("pane-1", Orientation::Horizontal);

    std::vector<PaneId> changes;
    dm.set_on_active_pane_changed([&](const PaneId& id) { changes.push_back(id); });

    dm.set_active_pane(std::nullopt);
    dm.set_active_pane(PaneId("missing"));
    EXPECT_EQ(dm.active_pane_id(), PaneId("pane-2"));

    dm.set_active_pane(PaneId("pane-1"));
    dm.set_active_pane(PaneId("pane-1"));
    EXPECT_EQ(changes, (std::vector<PaneId>{"pane-1"}));
}

// ─── Content ─────────────────────────────────────────────────────────────────

TEST(DockManagerContent, MountCallbacks)
{
    DockManager dm;
    std::vector<std::string> events;
    dm.set_on_content_mounted([&](const PaneId& id, ContentHandle h)
                              { events.push_back("mount " + id + " " + std::to_string(h)); });
    dm.set_on_content_unmounted([&](const PaneId& id, ContentHandle h)
                                { events.push_back("unmount " + id + " " + std::to_string(h)); });

    EXPECT_TRUE(dm.set_pane_content("pane-1", 1));
    EXPECT_TRUE(dm.set_pane_content("pane-1", 2));
    EXPECT_TRUE(dm.clear_pane("pane-1"));
    EXPECT_FALSE(dm.set_pane_content("missing", 3));

    EXPECT_EQ(events, (std::vector<std::string>{"mount pane-1 1", "unmount pane-1 1",
                                                "mount pane-1 2", "unmount pane-1 2"}));
}

TEST(DockManagerContent, TitleAndPlaceholder)
{
    DockManager dm;
    EXPECT_TRUE(dm.set_pane_title("pane-1", "Schematic"));
    EXPECT_TRUE(dm.set_pane_placeholder("pane-1", "Open a sheet"));
    EXPECT_EQ(dm.pane("pane-1")->title, "Schematic");
    EXPECT_EQ(dm.pane("pane-1")->placeholder, "Open a sheet");
    EXPECT_FALSE(dm.set_pane_title("missing", "x"));
    EXPECT_FALSE(dm.clear_pane("missing"));
}

TEST(DockManagerContent, ContentSurvivesMoves)
{
    DockManager dm;
    auto        p2 = *dm.split_pane("pane-1", Orientation::Horizontal);
    dm.set_pane_content("pane-1", 7);
    dm.move_pane("pane-1", p2, DropZone::Bottom);
    dm.move_pane("pane-1", p2, DropZone::Center);
    EXPECT_EQ(dm.pane("pane-1")->content, 7u);
}

// ─── Persistence ─────────────────────────────────────────────────────────────

TEST_F(DockManagerThreePanes, RoundTripThroughState)
{
    dm.set_active_pane(p1);
    LayoutState state = dm.get_state();

    DockManager restored;
    restored.restore_state(state);
    EXPECT_EQ(restored.get_state(), state);
    EXPECT_EQ(restored.pane_ids(), dm.pane_ids());
    EXPECT_EQ(restored.active_pane_id(), state.active_pane_id);
}

TEST_F(DockManagerThreePanes, RoundTripThroughJson)
{
    std::string json = dm.save_state_json();

    DockManager restored;
    ASSERT_TRUE(restored.restore_state_json(json));
    EXPECT_EQ(restored.get_state(), dm.get_state());
    EXPECT_EQ(restored.save_state_json(), json);
}

TEST(DockManagerPersistence, RestoredIdsSeedGenerator)
{
    LayoutState state;
    state.root = LayoutNodeState::split(
        Orientation::Horizontal, {LayoutNodeState::leaf("pane-4"), LayoutNodeState::leaf("pane-9")});

    DockManager dm;
    dm.restore_state(state);
    EXPECT_EQ(dm.active_pane_id(), PaneId("pane-4"));
    EXPECT_EQ(dm.split_pane("pane-4", Orientation::Vertical), PaneId("pane-10"));
}

TEST(DockManagerPersistence, RepairsMalformedState)
{
    LayoutState state;
    state.root = LayoutNodeState::split(
        Orientation::Horizontal,
        {LayoutNodeState::leaf(""), LayoutNodeState::leaf("pane-3"),
         LayoutNodeState::split(Orientation::Vertical, {LayoutNodeState::leaf("pane-3")}),
         LayoutNodeState::split(Orientation::Horizontal, {})});
    state.active_pane_id = "ghost";

    DockManager dm;
    dm.restore_state(state);

    EXPECT_EQ(dm.pane_count(), 4u);
    EXPECT_EQ(dm.pane_ids(), (Ids{"pane-4", "pane-3", "pane-5", "pane-6"}));
    EXPECT_EQ(dm.layout_tree().root().children.size(), 4u);
    EXPECT_EQ(dm.active_pane_id(), PaneId("pane-4"));
    EXPECT_TRUE(dm.layout_tree().check_invariants());
}

TEST(DockManagerPersistence, RestoreReplacesPanes)
{
    DockManager dm;
    dm.split_pane("pane-1", Orientation::Horizontal);
    dm.set_pane_content("pane-1", 5);

    std::vector<ContentHandle> unmounted;
    dm.set_on_content_unmounted([&](const PaneId&, ContentHandle h) { unmounted.push_back(h); });

    LayoutState state;
    state.root           = LayoutNodeState::leaf("solo");
    state.active_pane_id = "solo";
    dm.restore_state(state);

    EXPECT_EQ(dm.pane_ids(), (Ids{"solo"}));
    EXPECT_EQ(dm.active_pane_id(), PaneId("solo"));
    EXPECT_EQ(unmounted, (std::vector<ContentHandle>{5}));
    EXPECT_FALSE(dm.pane("solo")->closable);
}

TEST(DockManagerPersistence, BadJsonLeavesLayoutAlone)
{
    DockManager dm;
    dm.split_pane("pane-1", Orientation::Horizontal);
    LayoutState before = dm.get_state();

    EXPECT_FALSE(dm.restore_state_json("{ not json"));
    EXPECT_FALSE(dm.restore_state_json(R"({"activePaneId": "pane-1"})"));
    EXPECT_EQ(dm.get_state(), before);
}

// ─── Geometry ────────────────────────────────────────────────────────────────

TEST(DockManagerGeometry, BoundsFollowLayout)
{
    DockManager dm;
    EXPECT_FALSE(dm.pane_bounds("pane-1").has_value());

    dm.update_layout(Rect{0.0f, 0.0f, 800.0f, 600.0f});
    EXPECT_EQ(*dm.pane_bounds("pane-1"), (Rect{0.0f, 0.0f, 800.0f, 600.0f}));
    EXPECT_EQ(*dm.content_bounds("pane-1"), (Rect{0.0f, 32.0f, 800.0f, 568.0f}));

    auto p2 = *dm.split_pane("pane-1", Orientation::Horizontal);
    EXPECT_EQ(*dm.pane_bounds("pane-1"), (Rect{0.0f, 0.0f, 400.0f, 600.0f}));
    EXPECT_EQ(*dm.pane_bounds(p2), (Rect{400.0f, 0.0f, 400.0f, 600.0f}));

    EXPECT_EQ(dm.pane_at_point(Point{100.0f, 100.0f}), PaneId("pane-1"));
    EXPECT_EQ(dm.pane_at_point(Point{500.0f, 100.0f}), p2);
    EXPECT_FALSE(dm.pane_at_point(Point{900.0f, 100.0f}).has_value());
}

TEST(DockManagerGeometry, LayoutChangedCallback)
{
    DockManager dm;
    int         changes = 0;
    dm.set_on_layout_changed([&] { ++changes; });

    auto p2 = *dm.split_pane("pane-1", Orientation::Horizontal);
    dm.move_pane(p2, PaneId("pane-1"), DropZone::Top);
    dm.move_pane(p2, PaneId("pane-1"), DropZone::Center);
    dm.close_pane(p2);
    EXPECT_EQ(changes, 4);

    dm.move_pane("pane-1", PaneId("pane-1"), DropZone::Left);
    EXPECT_EQ(changes, 4);
}

// ─── Logging of rejected operations ──────────────────────────────────────────

TEST(DockManagerLogging, RejectionsAreLoggedAtDebug)
{
    auto& logger = Logger::instance();
    auto  saved  = logger.get_level();
    auto  log    = std::make_shared<std::vector<Logger::LogEntry>>();
    logger.set_level(LogLevel::Debug);
    logger.add_sink(sinks::memory_sink(log));

    DockManager dm;
    dm.move_pane("pane-1", PaneId("pane-1"), DropZone::Left);

    logger.clear_sinks();
    logger.set_level(saved);

    bool found = false;
    for (const auto& e : *log)
    {
        if (e.level == LogLevel::Debug && e.category == "dock"
            && e.message.find("onto itself") != std::string::npos)
            found = true;
    }
    EXPECT_TRUE(found);
}
