#ifndef RESTORE_SCENE_TYPES_H
#define RESTORE_SCENE_TYPES_H

#include "restore/core/types.h"
#include "restore/scene/scene_enums.h"
#include "restore/text/font_service.h"
#include <cstdint>
#include <string>
#include <vector>

namespace restore {

enum class SceneNodeType : std::uint8_t {
    Page = 0,
    Frame = 1,
    Rectangle = 2,
    Ellipse = 3,
    Text = 4,
    Group = 5,
    Component = 6,
    ComponentSet = 7,
    Vector = 8,
};

// ============================================================================
// Paints and effects (host-side objects)
// ============================================================================

struct ColorStop {
    float position;
    Color color;
};

struct Paint {
    PaintType type;
    Color color;            // solid paints; alpha stays 1, opacity carries transparency
    float opacity;
    bool visible;
    std::vector<ColorStop> gradientStops;
    Transform2D gradientTransform;
};

struct Effect {
    EffectType type;
    Color color;
    Vec2 offset;
    float radius;
    float spread;
    bool visible;
    BlendMode blendMode;
};

struct LineHeight {
    float value;
    LineHeightUnit unit;
};

struct ComponentProperty {
    std::string name;
    ComponentPropertyType type;
    std::string defaultValue;
};

// ============================================================================
// Live node record
// ============================================================================

// Position is parent-relative. Group and component-set children are rebased
// onto the wrapper's origin when the wrapper is created.
struct SceneNode {
    NodeId id = kInvalidNodeId;
    SceneNodeType type = SceneNodeType::Frame;
    NodeId parent = kInvalidNodeId;
    std::vector<NodeId> children;

    std::string name;
    bool visible = true;
    float opacity = 1.0f;
    BlendMode blendMode = BlendMode::PassThrough;

    float x = 0.0f;
    float y = 0.0f;
    float width = 100.0f;
    float height = 100.0f;

    std::vector<Paint> fills;
    std::vector<Paint> strokes;
    float strokeWeight = 1.0f;
    StrokeAlign strokeAlign = StrokeAlign::Inside;
    std::vector<Effect> effects;

    bool clipsContent = true;

    float cornerRadius = 0.0f;
    float topLeftRadius = 0.0f;
    float topRightRadius = 0.0f;
    float bottomLeftRadius = 0.0f;
    float bottomRightRadius = 0.0f;

    // Auto-layout container
    LayoutMode layoutMode = LayoutMode::None;
    float paddingTop = 0.0f;
    float paddingRight = 0.0f;
    float paddingBottom = 0.0f;
    float paddingLeft = 0.0f;
    float itemSpacing = 0.0f;
    float counterAxisSpacing = 0.0f;
    AxisSizingMode primaryAxisSizingMode = AxisSizingMode::Auto;
    AxisSizingMode counterAxisSizingMode = AxisSizingMode::Auto;
    PrimaryAxisAlign primaryAxisAlignItems = PrimaryAxisAlign::Min;
    CounterAxisAlign counterAxisAlignItems = CounterAxisAlign::Min;

    // Auto-layout participation
    LayoutAlign layoutAlign = LayoutAlign::Inherit;
    float layoutGrow = 0.0f;
    LayoutSizing layoutSizingHorizontal = LayoutSizing::Fixed;
    LayoutSizing layoutSizingVertical = LayoutSizing::Fixed;

    // Text
    FontName fontName{"Inter", "Regular"};
    std::string characters;
    float fontSize = 12.0f;
    TextAlignHorizontal textAlignHorizontal = TextAlignHorizontal::Left;
    TextAlignVertical textAlignVertical = TextAlignVertical::Top;
    LineHeight lineHeight{0.0f, LineHeightUnit::Auto};
    float letterSpacing = 0.0f;
    TextDecoration textDecoration = TextDecoration::None;
    TextCase textCase = TextCase::Original;
    TextAutoResize textAutoResize = TextAutoResize::None;

    // Vector geometry imported from markup (SVG path data)
    std::string vectorPath;

    std::vector<ComponentProperty> componentProperties;
};

// ============================================================================
// Capabilities per node type
// ============================================================================

inline bool isContainerType(SceneNodeType t) {
    switch (t) {
        case SceneNodeType::Page:
        case SceneNodeType::Frame:
        case SceneNodeType::Group:
        case SceneNodeType::Component:
        case SceneNodeType::ComponentSet:
            return true;
        default:
            return false;
    }
}

inline bool supportsGeometryPaints(SceneNodeType t) {
    return t != SceneNodeType::Page && t != SceneNodeType::Group;
}

inline bool supportsCornerRadius(SceneNodeType t) {
    switch (t) {
        case SceneNodeType::Frame:
        case SceneNodeType::Rectangle:
        case SceneNodeType::Component:
        case SceneNodeType::ComponentSet:
            return true;
        default:
            return false;
    }
}

inline bool supportsAutoLayout(SceneNodeType t) {
    return t == SceneNodeType::Frame || t == SceneNodeType::Component || t == SceneNodeType::ComponentSet;
}

inline bool supportsComponentProperties(SceneNodeType t) {
    return t == SceneNodeType::Component || t == SceneNodeType::ComponentSet;
}

} // namespace restore

#endif // RESTORE_SCENE_TYPES_H
