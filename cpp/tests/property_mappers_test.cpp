#include "tests/test_common.h"
#include "restore/reconstruct/property_mappers.h"
#include "restore/reconstruct/warnings.h"

using namespace restore;
using namespace restore_test;

namespace {

class PropertyMappersTest : public ::testing::Test {
protected:
    FakeFontService fonts;
    SceneDocument doc{fonts};
    WarningCollector warnings;

    NodeId attached(SceneNodeType type) {
        const NodeId id = doc.createNode(type);
        doc.appendChild(doc.currentPage(), id);
        return id;
    }
};

} // namespace

TEST_F(PropertyMappersTest, CommonPropertiesSizeAndIdentity) {
    const NodeId id = attached(SceneNodeType::Rectangle);
    SnapshotNode snap = makeNode("RECTANGLE", "Swatch", 0, 0, 0.5f, 24);
    snap.visible = false;
    snap.opacity = 0.4f;
    snap.blendMode = "MULTIPLY";
    snap.fills = std::vector<SnapshotPaint>{solid(1, 0, 0)};
    snap.strokeWeight = 3.0f;
    snap.strokeAlign = "OUTSIDE";

    applyCommonProperties(doc, id, snap, warnings);

    const SceneNode* n = doc.getNode(id);
    EXPECT_EQ(n->name, "Swatch");
    EXPECT_FALSE(n->visible);
    EXPECT_FLOAT_EQ(n->opacity, 0.4f);
    EXPECT_EQ(n->blendMode, BlendMode::Multiply);
    EXPECT_FLOAT_EQ(n->width, 1.0f);
    EXPECT_FLOAT_EQ(n->height, 24.0f);
    ASSERT_EQ(n->fills.size(), 1u);
    EXPECT_FLOAT_EQ(n->fills[0].color.r, 1.0f);
    EXPECT_FLOAT_EQ(n->strokeWeight, 3.0f);
    EXPECT_EQ(n->strokeAlign, StrokeAlign::Outside);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(PropertyMappersTest, InvalidEnumsAndPassThroughAreSkipped) {
    const NodeId id = attached(SceneNodeType::Rectangle);
    SnapshotNode snap = makeNode("RECTANGLE", "R");
    snap.blendMode = "PASS_THROUGH";
    snap.strokeAlign = "SIDEWAYS";

    SceneNode* n = doc.getNode(id);
    n->blendMode = BlendMode::Screen;
    applyCommonProperties(doc, id, snap, warnings);

    n = doc.getNode(id);
    EXPECT_EQ(n->blendMode, BlendMode::Screen);
    EXPECT_EQ(n->strokeAlign, StrokeAlign::Inside);
}

TEST_F(PropertyMappersTest, EmptyConvertedPaintsKeepHostDefault) {
    const NodeId id = attached(SceneNodeType::Rectangle);
    const auto defaults = doc.getNode(id)->fills;
    ASSERT_FALSE(defaults.empty());

    SnapshotNode snap = makeNode("RECTANGLE", "Photo");
    SnapshotPaint image;
    image.type = "IMAGE";
    snap.fills = std::vector<SnapshotPaint>{image};
    applyCommonProperties(doc, id, snap, warnings);

    EXPECT_EQ(doc.getNode(id)->fills.size(), defaults.size());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings.messages()[0], "\"Photo\": image fill dropped (no pixel data in snapshot)");
}

TEST_F(PropertyMappersTest, FrameLayoutModeGatesPadding) {
    const NodeId none = attached(SceneNodeType::Frame);
    SnapshotNode plain = makeNode("FRAME", "Plain");
    plain.paddingTop = 12.0f;
    plain.itemSpacing = 8.0f;
    applyFrameProperties(doc, none, plain);
    EXPECT_EQ(doc.getNode(none)->layoutMode, LayoutMode::None);
    EXPECT_FLOAT_EQ(doc.getNode(none)->paddingTop, 0.0f);

    const NodeId row = attached(SceneNodeType::Frame);
    SnapshotNode al = makeNode("FRAME", "Row");
    al.layoutMode = "VERTICAL";
    al.paddingTop = 12.0f;
    al.paddingLeft = 4.0f;
    al.itemSpacing = 8.0f;
    al.primaryAxisSizingMode = "FIXED";
    al.primaryAxisAlignItems = "SPACE_BETWEEN";
    al.counterAxisAlignItems = "BOGUS";
    al.clipsContent = false;
    applyFrameProperties(doc, row, al);

    const SceneNode* n = doc.getNode(row);
    EXPECT_EQ(n->layoutMode, LayoutMode::Vertical);
    EXPECT_FLOAT_EQ(n->paddingTop, 12.0f);
    EXPECT_FLOAT_EQ(n->paddingLeft, 4.0f);
    EXPECT_FLOAT_EQ(n->itemSpacing, 8.0f);
    EXPECT_EQ(n->primaryAxisSizingMode, AxisSizingMode::Fixed);
    EXPECT_EQ(n->primaryAxisAlignItems, PrimaryAxisAlign::SpaceBetween);
    EXPECT_EQ(n->counterAxisAlignItems, CounterAxisAlign::Min);
    EXPECT_FALSE(n->clipsContent);
}

TEST_F(PropertyMappersTest, CornerRadiusUniformThenOverrides) {
    const NodeId id = attached(SceneNodeType::Rectangle);
    SnapshotNode snap = makeNode("RECTANGLE", "R");
    snap.cornerRadius = 8.0f;
    snap.topLeftRadius = 2.0f;
    applyCornerRadius(doc, id, snap);

    const SceneNode* n = doc.getNode(id);
    EXPECT_FLOAT_EQ(n->cornerRadius, 8.0f);
    EXPECT_FLOAT_EQ(n->topLeftRadius, 2.0f);
    EXPECT_FLOAT_EQ(n->topRightRadius, 8.0f);
    EXPECT_FLOAT_EQ(n->bottomRightRadius, 8.0f);

    // Ellipses have no corners
    const NodeId e = attached(SceneNodeType::Ellipse);
    applyCornerRadius(doc, e, snap);
    EXPECT_FLOAT_EQ(doc.getNode(e)->cornerRadius, 0.0f);
}

TEST_F(PropertyMappersTest, ChildLayoutPositionsOrParticipates) {
    SnapshotNode parent = makeNode("FRAME", "P", 100, 100, 200, 200);
    SnapshotNode child = makeNode("RECTANGLE", "C", 120, 150, 10, 10);
    child.layoutAlign = "STRETCH";
    child.layoutGrow = 1.0f;
    child.layoutSizingHorizontal = "FILL";

    const NodeId free = attached(SceneNodeType::Rectangle);
    applyChildLayoutProperties(doc, free, child, &parent);
    EXPECT_FLOAT_EQ(doc.getNode(free)->x, 20.0f);
    EXPECT_FLOAT_EQ(doc.getNode(free)->y, 50.0f);
    EXPECT_EQ(doc.getNode(free)->layoutAlign, LayoutAlign::Inherit);

    parent.layoutMode = "HORIZONTAL";
    const NodeId flowed = attached(SceneNodeType::Rectangle);
    applyChildLayoutProperties(doc, flowed, child, &parent);
    const SceneNode* n = doc.getNode(flowed);
    EXPECT_FLOAT_EQ(n->x, 0.0f);
    EXPECT_EQ(n->layoutAlign, LayoutAlign::Stretch);
    EXPECT_FLOAT_EQ(n->layoutGrow, 1.0f);
    EXPECT_EQ(n->layoutSizingHorizontal, LayoutSizing::Fill);
    EXPECT_EQ(n->layoutSizingVertical, LayoutSizing::Fixed);

    const NodeId root = attached(SceneNodeType::Rectangle);
    applyChildLayoutProperties(doc, root, child, nullptr);
    EXPECT_FLOAT_EQ(doc.getNode(root)->x, 0.0f);
}

TEST_F(PropertyMappersTest, TextPropertiesInOrder) {
    fonts.install("Roboto", "Bold");
    fonts.loadFontAsync(FontName{"Roboto", "Bold"}).get();

    const NodeId id = attached(SceneNodeType::Text);
    SnapshotNode snap = textNode("Title", "Hello", "Roboto", 700);
    snap.style->fontSize = 20.0f;
    snap.style->textAlignHorizontal = "CENTER";
    snap.style->textAlignVertical = "BOTTOM";
    snap.style->lineHeightPx = 28.0f;
    snap.style->lineHeightPercent = 150.0f;
    snap.style->letterSpacing = 0.5f;
    snap.style->textDecoration = "UNDERLINE";
    snap.style->textCase = "UPPER";
    snap.style->textAutoResize = "WIDTH_AND_HEIGHT";

    applyTextProperties(doc, id, snap, FontName{"Roboto", "Bold"}, warnings);

    const SceneNode* n = doc.getNode(id);
    EXPECT_EQ(n->fontName, (FontName{"Roboto", "Bold"}));
    EXPECT_EQ(n->characters, "Hello");
    EXPECT_FLOAT_EQ(n->fontSize, 20.0f);
    EXPECT_EQ(n->textAlignHorizontal, TextAlignHorizontal::Center);
    EXPECT_EQ(n->textAlignVertical, TextAlignVertical::Bottom);
    EXPECT_EQ(n->lineHeight.unit, LineHeightUnit::Pixels);
    EXPECT_FLOAT_EQ(n->lineHeight.value, 28.0f);
    EXPECT_FLOAT_EQ(n->letterSpacing, 0.5f);
    EXPECT_EQ(n->textDecoration, TextDecoration::Underline);
    EXPECT_EQ(n->textCase, TextCase::Upper);
    EXPECT_EQ(n->textAutoResize, TextAutoResize::WidthAndHeight);
    // 5 bytes * (10 + 0.5), measured after size and spacing were applied
    EXPECT_FLOAT_EQ(n->width, 52.5f);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(PropertyMappersTest, TextFallsBackWhenFontRefused) {
    fonts.loadFontAsync(FontName{"Inter", "Regular"}).get();
    const NodeId id = attached(SceneNodeType::Text);
    SnapshotNode snap = textNode("Body", "Hi", "Nope", 400);
    snap.style->textAlignHorizontal = "MIDDLE";
    snap.style->textDecoration = "OVERLINE";

    applyTextProperties(doc, id, snap, FontName{"Nope", "Regular"}, warnings);

    const SceneNode* n = doc.getNode(id);
    EXPECT_EQ(n->fontName, (FontName{"Inter", "Regular"}));
    EXPECT_EQ(n->characters, "Hi");
    EXPECT_EQ(n->textAlignHorizontal, TextAlignHorizontal::Left);
    EXPECT_EQ(n->textDecoration, TextDecoration::None);
}

TEST_F(PropertyMappersTest, TextWithoutUsableFontWarns) {
    fonts.uninstallAll();
    const NodeId id = attached(SceneNodeType::Text);
    SnapshotNode snap = textNode("Body", "Hi", "Nope", 400);
    applyTextProperties(doc, id, snap, FontName{"Nope", "Regular"}, warnings);
    EXPECT_TRUE(doc.getNode(id)->characters.empty());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings.messages()[0], "\"Body\": text content not set (no usable font)");
}

TEST_F(PropertyMappersTest, RefusedFallbackFontLeavesHostFont) {
    class RefusingFonts : public SceneDocument {
    public:
        using SceneDocument::SceneDocument;
        bool setFontName(NodeId, const FontName& font) override {
            attempts.push_back(font);
            return false;
        }
        std::vector<FontName> attempts;
    };
    fonts.loadFontAsync(FontName{"Inter", "Regular"}).get();
    RefusingFonts host(fonts);
    const NodeId id = host.createNode(SceneNodeType::Text);
    host.appendChild(host.currentPage(), id);
    const FontName before = host.getNode(id)->fontName;

    SnapshotNode snap = textNode("Body", "Hi", "Nope", 400);
    applyTextProperties(host, id, snap, FontName{"Nope", "Regular"}, warnings);

    ASSERT_EQ(host.attempts.size(), 2u);
    EXPECT_EQ(host.attempts[1], (FontName{"Inter", "Regular"}));
    EXPECT_EQ(host.getNode(id)->fontName, before);
}

TEST_F(PropertyMappersTest, ComponentPropertiesSkipVariantDefinitions) {
    const NodeId id = attached(SceneNodeType::Component);
    SnapshotNode snap = makeNode("COMPONENT", "Button");
    snap.componentPropertyDefinitions = {
        {"Label", "TEXT", "Click", {}},
        {"Size", "VARIANT", "Large", {"Small", "Large"}},
        {"Icon", "BOOLEAN", "true", {}},
        {"Weird", "SLOT", "", {}},
    };
    applyComponentProperties(doc, id, snap, warnings);

    const SceneNode* n = doc.getNode(id);
    ASSERT_EQ(n->componentProperties.size(), 2u);
    EXPECT_EQ(n->componentProperties[0].name, "Label");
    EXPECT_EQ(n->componentProperties[0].type, ComponentPropertyType::Text);
    EXPECT_EQ(n->componentProperties[1].name, "Icon");
    EXPECT_EQ(n->componentProperties[1].defaultValue, "true");
    EXPECT_TRUE(warnings.empty());
}
