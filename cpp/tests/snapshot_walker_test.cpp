#include "tests/test_common.h"
#include "restore/reconstruct/font_resolver.h"
#include "restore/reconstruct/snapshot_walker.h"
#include "restore/reconstruct/warnings.h"
#include <algorithm>
#include <stdexcept>

using namespace restore;
using namespace restore_test;

namespace {

const char* kTwoShapeSvg =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"24\" height=\"24\">"
    "<rect x=\"0\" y=\"0\" width=\"10\" height=\"10\" fill=\"#ff0000\"/>"
    "<circle cx=\"17\" cy=\"17\" r=\"5\" fill=\"#00ff00\"/>"
    "</svg>";

const char* kOneShapeSvg =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"16\" height=\"16\">"
    "<path id=\"check\" d=\"M2 8 L6 12 L14 4\" stroke=\"#000\"/>"
    "</svg>";

class SnapshotWalkerTest : public ::testing::Test {
protected:
    FakeFontService fonts;
    SceneDocument doc{fonts};
    WarningCollector warnings;
    FontResolver resolver{fonts, warnings};
    BuildContext ctx{doc, resolver, warnings, nullptr};
    SnapshotWalker walker{ctx};

    NodeId buildRoot(const SnapshotNode& snap) {
        ctx.total = countSnapshotNodes(snap);
        return walker.build(snap, doc.currentPage(), nullptr);
    }
};

} // namespace

TEST_F(SnapshotWalkerTest, TypelessNodeIsSkippedSilently) {
    SnapshotNode snap;
    snap.name = "ghost";
    EXPECT_EQ(buildRoot(snap), kInvalidNodeId);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(ctx.processed, 0u);
}

TEST_F(SnapshotWalkerTest, UnknownKindWarnsAndSkips) {
    SnapshotNode frame = makeNode("FRAME", "Root", 0, 0, 100, 100);
    frame.children.push_back(makeNode("STICKY", "Note"));
    frame.children.push_back(makeNode("SLICE", ""));
    const NodeId root = buildRoot(frame);

    ASSERT_NE(root, kInvalidNodeId);
    EXPECT_TRUE(doc.getNode(root)->children.empty());
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings.messages()[0], "Unknown node type \"STICKY\" for \"Note\" — skipped");
    EXPECT_EQ(warnings.messages()[1], "Unknown node type \"SLICE\" for \"?\" — skipped");
}

TEST_F(SnapshotWalkerTest, BasicKindsAndRelativePositions) {
    SnapshotNode frame = makeNode("FRAME", "Root", 100, 100, 300, 200);
    frame.children.push_back(makeNode("RECTANGLE", "Rect", 110, 120, 50, 40));
    frame.children.push_back(makeNode("ELLIPSE", "Dot", 200, 150, 20, 20));
    frame.children.push_back(textNode("Label", "Hi", "Inter", 400));
    const NodeId root = buildRoot(frame);

    auto kids = childrenOf(doc, root);
    ASSERT_EQ(kids.size(), 3u);
    EXPECT_EQ(kids[0]->type, SceneNodeType::Rectangle);
    EXPECT_FLOAT_EQ(kids[0]->x, 10.0f);
    EXPECT_FLOAT_EQ(kids[0]->y, 20.0f);
    EXPECT_FLOAT_EQ(kids[0]->width, 50.0f);
    EXPECT_EQ(kids[1]->type, SceneNodeType::Ellipse);
    EXPECT_FLOAT_EQ(kids[1]->x, 100.0f);
    EXPECT_EQ(kids[2]->type, SceneNodeType::Text);
    EXPECT_EQ(kids[2]->characters, "Hi");
    EXPECT_TRUE(warnings.empty());
}

TEST_F(SnapshotWalkerTest, SizeIsAppliedBeforeChildren) {
    class RecordingDoc : public SceneDocument {
    public:
        using SceneDocument::SceneDocument;
        std::vector<std::string> log;
        bool resize(NodeId id, float w, float h) override {
            log.push_back("resize " + std::to_string(id));
            return SceneDocument::resize(id, w, h);
        }
        bool appendChild(NodeId parent, NodeId child) override {
            log.push_back("append under " + std::to_string(parent));
            return SceneDocument::appendChild(parent, child);
        }
    };
    RecordingDoc rec(fonts);
    WarningCollector w;
    FontResolver r(fonts, w);
    BuildContext c{rec, r, w, nullptr};
    SnapshotWalker wk(c);

    SnapshotNode frame = makeNode("FRAME", "Outer", 0, 0, 300, 200);
    frame.children.push_back(makeNode("RECTANGLE", "Inner", 0, 0, 10, 10));
    const NodeId outer = wk.build(frame, rec.currentPage(), nullptr);
    ASSERT_NE(outer, kInvalidNodeId);

    // Outer is resized before Inner is attached under it
    const std::string outerId = std::to_string(outer);
    auto resized = std::find(rec.log.begin(), rec.log.end(), "resize " + outerId);
    auto appended = std::find(rec.log.begin(), rec.log.end(), "append under " + outerId);
    ASSERT_NE(resized, rec.log.end());
    ASSERT_NE(appended, rec.log.end());
    EXPECT_LT(resized - rec.log.begin(), appended - rec.log.begin());
}

TEST_F(SnapshotWalkerTest, InstanceBecomesFrame) {
    SnapshotNode inst = makeNode("INSTANCE", "Button", 0, 0, 80, 32);
    inst.children.push_back(makeNode("RECTANGLE", "bg", 0, 0, 80, 32));
    const NodeId id = buildRoot(inst);

    ASSERT_NE(id, kInvalidNodeId);
    EXPECT_EQ(doc.getNode(id)->type, SceneNodeType::Frame);
    EXPECT_EQ(doc.getNode(id)->children.size(), 1u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings.messages()[0],
        "\"Button\": INSTANCE downgraded to Frame (cannot recreate without original component)");
}

TEST_F(SnapshotWalkerTest, VectorKindsWithoutMarkup) {
    SnapshotNode frame = makeNode("FRAME", "Icons", 0, 0, 100, 100);
    frame.children.push_back(makeNode("STAR", "Star", 10, 10, 24, 24));
    frame.children.push_back(makeNode("BOOLEAN_OPERATION", "", 40, 10, 24, 24));
    frame.children.push_back(makeNode("LINE", "", 0, 50, 100, 0));
    const NodeId root = buildRoot(frame);

    auto kids = childrenOf(doc, root);
    ASSERT_EQ(kids.size(), 3u);
    EXPECT_EQ(kids[0]->type, SceneNodeType::Rectangle);
    EXPECT_FLOAT_EQ(kids[0]->width, 24.0f);
    EXPECT_EQ(kids[1]->type, SceneNodeType::Frame);
    EXPECT_EQ(kids[2]->type, SceneNodeType::Rectangle);
    EXPECT_FLOAT_EQ(kids[2]->height, 1.0f);

    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_EQ(warnings.messages()[0], "\"Star\": STAR replaced with placeholder rectangle (no SVG data)");
    EXPECT_EQ(warnings.messages()[1], "\"BooleanOp\": BOOLEAN_OPERATION downgraded to Frame (no SVG data)");
    EXPECT_EQ(warnings.messages()[2], "\"LINE\": LINE replaced with placeholder rectangle (no SVG data)");
}

TEST_F(SnapshotWalkerTest, SingleShapeSvgIsFlattened) {
    SnapshotNode frame = makeNode("FRAME", "Root", 0, 0, 100, 100);
    SnapshotNode vec = makeNode("VECTOR", "Check", 20, 30, 16, 16);
    vec.svgData = std::string(kOneShapeSvg);
    vec.opacity = 0.5f;
    frame.children.push_back(vec);
    const std::size_t before = doc.nodeCount();
    const NodeId root = buildRoot(frame);

    auto kids = childrenOf(doc, root);
    ASSERT_EQ(kids.size(), 1u);
    EXPECT_EQ(kids[0]->type, SceneNodeType::Vector);
    EXPECT_EQ(kids[0]->name, "Check");
    EXPECT_FLOAT_EQ(kids[0]->x, 20.0f);
    EXPECT_FLOAT_EQ(kids[0]->y, 30.0f);
    EXPECT_FLOAT_EQ(kids[0]->width, 16.0f);
    EXPECT_FLOAT_EQ(kids[0]->opacity, 0.5f);
    // Wrapper removed: only the frame and the vector were added
    EXPECT_EQ(doc.nodeCount(), before + 2);
    EXPECT_TRUE(doc.getNode(doc.currentPage())->children.size() == 1u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings.messages()[0], "\"Check\": reconstructed from SVG");
}

TEST_F(SnapshotWalkerTest, StrokeOnlySvgHasNoFill) {
    SnapshotNode vec = makeNode("VECTOR", "Slash", 0, 0, 24, 24);
    vec.svgData = std::string(
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"24\" height=\"24\">"
        "<path d=\"M0 0L24 24\" fill=\"none\" stroke=\"#ff0000\"/>"
        "</svg>");
    const NodeId id = buildRoot(vec);

    ASSERT_NE(id, kInvalidNodeId);
    const SceneNode* n = doc.getNode(id);
    EXPECT_EQ(n->type, SceneNodeType::Vector);
    EXPECT_TRUE(n->fills.empty());
    ASSERT_EQ(n->strokes.size(), 1u);
    EXPECT_FLOAT_EQ(n->strokes[0].color.r, 1.0f);
    EXPECT_FLOAT_EQ(n->strokes[0].color.g, 0.0f);
}

TEST_F(SnapshotWalkerTest, MultiShapeSvgKeepsWrapper) {
    SnapshotNode vec = makeNode("BOOLEAN_OPERATION", "Logo", 0, 0, 48, 48);
    vec.svgData = std::string(kTwoShapeSvg);
    const NodeId id = buildRoot(vec);

    ASSERT_NE(id, kInvalidNodeId);
    const SceneNode* n = doc.getNode(id);
    EXPECT_EQ(n->type, SceneNodeType::Frame);
    EXPECT_EQ(n->name, "Logo");
    EXPECT_EQ(n->children.size(), 2u);
    EXPECT_FLOAT_EQ(n->width, 48.0f);
    EXPECT_EQ(warnings.messages().back(), "\"Logo\": reconstructed from SVG");
}

TEST_F(SnapshotWalkerTest, BrokenSvgFallsBackToPlaceholder) {
    SnapshotNode vec = makeNode("VECTOR", "Broken", 0, 0, 10, 10);
    vec.svgData = std::string("<svg><path");
    const NodeId id = buildRoot(vec);

    ASSERT_NE(id, kInvalidNodeId);
    EXPECT_EQ(doc.getNode(id)->type, SceneNodeType::Rectangle);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings.messages()[0], "\"Broken\": SVG import failed");
    EXPECT_EQ(warnings.messages()[1], "\"Broken\": VECTOR replaced with placeholder rectangle (no SVG data)");
}

TEST_F(SnapshotWalkerTest, DegenerateGroups) {
    SnapshotNode frame = makeNode("FRAME", "Root", 0, 0, 100, 100);
    frame.children.push_back(makeNode("GROUP", "Empty"));
    SnapshotNode hollow = makeNode("GROUP", "");
    hollow.children.push_back(makeNode("WIDGET", "w"));
    frame.children.push_back(hollow);
    const NodeId root = buildRoot(frame);

    EXPECT_TRUE(doc.getNode(root)->children.empty());
    EXPECT_EQ(doc.groupCallCount(), 0u);
    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_EQ(warnings.messages()[0], "\"Empty\": empty group skipped");
    EXPECT_EQ(warnings.messages()[1], "Unknown node type \"WIDGET\" for \"w\" — skipped");
    EXPECT_EQ(warnings.messages()[2], "\"Group\": no valid children, group skipped");
}

TEST_F(SnapshotWalkerTest, GroupWrapsChildrenAtTheirPlaces) {
    SnapshotNode frame = makeNode("FRAME", "Root", 0, 0, 200, 200);
    SnapshotNode group = makeNode("GROUP", "Pair", 50, 60, 70, 40);
    group.opacity = 0.5f;
    group.children.push_back(makeNode("RECTANGLE", "A", 50, 60, 20, 20));
    group.children.push_back(makeNode("RECTANGLE", "B", 100, 80, 20, 20));
    frame.children.push_back(group);
    const NodeId root = buildRoot(frame);

    auto kids = childrenOf(doc, root);
    ASSERT_EQ(kids.size(), 1u);
    const SceneNode* g = kids[0];
    EXPECT_EQ(g->type, SceneNodeType::Group);
    EXPECT_EQ(g->name, "Pair");
    EXPECT_FLOAT_EQ(g->opacity, 0.5f);
    EXPECT_FLOAT_EQ(g->x, 50.0f);
    EXPECT_FLOAT_EQ(g->y, 60.0f);
    EXPECT_FLOAT_EQ(g->width, 70.0f);
    EXPECT_FLOAT_EQ(g->height, 40.0f);
    EXPECT_EQ(doc.groupCallCount(), 1u);

    auto inner = childrenOf(doc, g->id);
    ASSERT_EQ(inner.size(), 2u);
    EXPECT_FLOAT_EQ(inner[1]->x, 50.0f);
    EXPECT_FLOAT_EQ(inner[1]->y, 20.0f);
    EXPECT_FLOAT_EQ(doc.absolutePosition(inner[1]->id).x, 100.0f);
}

TEST_F(SnapshotWalkerTest, YieldsEveryTenNodes) {
    SnapshotNode frame = makeNode("FRAME", "Root", 0, 0, 100, 100);
    for (int i = 0; i < 24; ++i) {
        frame.children.push_back(makeNode("RECTANGLE", "r" + std::to_string(i), 0, 0, 1, 1));
    }
    std::vector<float> percents;
    ctx.onProgress = [&](const std::string&, float p) { percents.push_back(p); };
    buildRoot(frame);

    // 25 typed nodes: yields after the 10th and 20th
    EXPECT_EQ(ctx.processed, 25u);
    EXPECT_EQ(doc.yieldCount(), 2u);
    ASSERT_EQ(percents.size(), 2u);
    EXPECT_LT(percents[0], percents[1]);
    EXPECT_GT(percents[0], 5.0f);
    EXPECT_LT(percents[1], 95.0f);
}

TEST_F(SnapshotWalkerTest, HostExceptionSkipsOnlyThatSubtree) {
    class FlakyDoc : public SceneDocument {
    public:
        using SceneDocument::SceneDocument;
        bool resize(NodeId id, float w, float h) override {
            if (getNode(id)->type == SceneNodeType::Ellipse) throw std::runtime_error("resize exploded");
            return SceneDocument::resize(id, w, h);
        }
    };
    FlakyDoc flaky(fonts);
    WarningCollector w;
    FontResolver r(fonts, w);
    BuildContext c{flaky, r, w, nullptr};
    SnapshotWalker wk(c);

    SnapshotNode frame = makeNode("FRAME", "Root", 0, 0, 100, 100);
    frame.children.push_back(makeNode("ELLIPSE", "Bad", 0, 0, 10, 10));
    frame.children.push_back(makeNode("RECTANGLE", "Good", 0, 0, 10, 10));
    const NodeId root = wk.build(frame, flaky.currentPage(), nullptr);

    ASSERT_NE(root, kInvalidNodeId);
    auto kids = childrenOf(flaky, root);
    ASSERT_EQ(kids.size(), 1u);
    EXPECT_EQ(kids[0]->name, "Good");
    EXPECT_EQ(flaky.nodeCount(), 2u);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w.messages()[0], "\"Bad\": ELLIPSE could not be created (resize exploded)");
}
