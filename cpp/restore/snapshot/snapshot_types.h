#ifndef RESTORE_SNAPSHOT_TYPES_H
#define RESTORE_SNAPSHOT_TYPES_H

#include "restore/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restore {

// Node kinds carried by a snapshot. Unknown keeps the raw type string in
// SnapshotNode::typeName so it can be reported.
enum class NodeKind : std::uint8_t {
    Unknown = 0,
    Frame,
    Rectangle,
    Ellipse,
    Text,
    Group,
    Component,
    ComponentSet,
    Instance,
    Vector,
    Star,
    RegularPolygon,
    Line,
    BooleanOperation,
};

inline bool isVectorLike(NodeKind kind) {
    switch (kind) {
        case NodeKind::Vector:
        case NodeKind::Star:
        case NodeKind::RegularPolygon:
        case NodeKind::Line:
        case NodeKind::BooleanOperation:
            return true;
        default:
            return false;
    }
}

// Maps the serialized "type" string ("FRAME", "COMPONENT_SET", ...) to a kind.
NodeKind parseNodeKind(std::string_view typeName);
const char* toString(NodeKind kind);

struct SnapshotColor {
    std::optional<float> r, g, b, a;
};

struct GradientStop {
    std::optional<float> position;
    std::optional<SnapshotColor> color;
};

struct HandlePosition {
    std::optional<float> x;
    std::optional<float> y;
};

// Serialized fill/stroke descriptor. The type string is kept raw; unsupported
// kinds are dropped by the converter.
struct SnapshotPaint {
    std::string type;
    bool visible = true;
    std::optional<float> opacity;
    std::optional<SnapshotColor> color;
    std::vector<GradientStop> gradientStops;
    std::vector<HandlePosition> gradientHandlePositions;
    std::string imageRef;
};

struct SnapshotEffect {
    std::string type;
    bool visible = true;
    std::optional<SnapshotColor> color;
    std::optional<HandlePosition> offset;
    std::optional<float> radius;
    std::optional<float> spread;
    std::string blendMode;
};

struct SnapshotTextStyle {
    std::optional<std::string> fontFamily;
    std::optional<float> fontWeight;
    std::optional<float> fontSize;
    std::string textAlignHorizontal;
    std::string textAlignVertical;
    std::optional<float> lineHeightPx;
    std::optional<float> lineHeightPercent;
    std::optional<float> letterSpacing;
    std::string textDecoration;
    std::string textCase;
    std::string textAutoResize;
};

struct ComponentPropertyDefinition {
    std::string name;
    std::string type;          // BOOLEAN, TEXT, INSTANCE_SWAP, VARIANT
    std::string defaultValue;  // booleans are stored as "true" / "false"
    std::vector<std::string> variantOptions;
};

struct SnapshotNode {
    NodeKind kind = NodeKind::Unknown;
    std::string typeName; // raw "type" field, empty when absent

    std::string name;
    bool visible = true;
    std::optional<float> opacity;
    std::string blendMode;

    std::optional<BoundingBox> absoluteBoundingBox;
    std::optional<Vec2> size;

    std::vector<SnapshotNode> children;

    std::optional<std::vector<SnapshotPaint>> fills;
    std::optional<std::vector<SnapshotPaint>> strokes;
    std::optional<float> strokeWeight;
    std::string strokeAlign;
    std::optional<std::vector<SnapshotEffect>> effects;

    std::optional<bool> clipsContent;

    std::optional<float> cornerRadius;
    std::optional<float> topLeftRadius;
    std::optional<float> topRightRadius;
    std::optional<float> bottomLeftRadius;
    std::optional<float> bottomRightRadius;

    // Auto-layout container
    std::string layoutMode;
    std::optional<float> paddingTop;
    std::optional<float> paddingRight;
    std::optional<float> paddingBottom;
    std::optional<float> paddingLeft;
    std::optional<float> itemSpacing;
    std::optional<float> counterAxisSpacing;
    std::string primaryAxisSizingMode;
    std::string counterAxisSizingMode;
    std::string primaryAxisAlignItems;
    std::string counterAxisAlignItems;

    // Auto-layout participation
    std::string layoutAlign;
    std::optional<float> layoutGrow;
    std::string layoutSizingHorizontal;
    std::string layoutSizingVertical;

    // Text
    std::optional<std::string> characters;
    std::optional<SnapshotTextStyle> style;

    std::vector<ComponentPropertyDefinition> componentPropertyDefinitions;

    // Raw vector markup for the vector-import fallback
    std::optional<std::string> svgData;

    bool hasChildren() const { return !children.empty(); }
    bool declaresAutoLayout() const { return !layoutMode.empty() && layoutMode != "NONE"; }
};

struct SnapshotDocument {
    std::string name;
    std::optional<SnapshotNode> document;
};

} // namespace restore

#endif // RESTORE_SNAPSHOT_TYPES_H
