#include "restore/snapshot/snapshot_types.h"

namespace restore {

namespace {
    struct KindName {
        NodeKind kind;
        const char* name;
    };

    constexpr KindName kKindNames[] = {
        {NodeKind::Frame, "FRAME"},
        {NodeKind::Rectangle, "RECTANGLE"},
        {NodeKind::Ellipse, "ELLIPSE"},
        {NodeKind::Text, "TEXT"},
        {NodeKind::Group, "GROUP"},
        {NodeKind::Component, "COMPONENT"},
        {NodeKind::ComponentSet, "COMPONENT_SET"},
        {NodeKind::Instance, "INSTANCE"},
        {NodeKind::Vector, "VECTOR"},
        {NodeKind::Star, "STAR"},
        {NodeKind::RegularPolygon, "REGULAR_POLYGON"},
        {NodeKind::Line, "LINE"},
        {NodeKind::BooleanOperation, "BOOLEAN_OPERATION"},
    };
} // namespace

NodeKind parseNodeKind(std::string_view typeName) {
    for (const KindName& entry : kKindNames) {
        if (typeName == entry.name) return entry.kind;
    }
    return NodeKind::Unknown;
}

const char* toString(NodeKind kind) {
    for (const KindName& entry : kKindNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "UNKNOWN";
}

} // namespace restore
