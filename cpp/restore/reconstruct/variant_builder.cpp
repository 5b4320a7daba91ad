#include "restore/reconstruct/variant_builder.h"
#include "restore/reconstruct/property_mappers.h"
#include "restore/reconstruct/snapshot_walker.h"
#include "restore/reconstruct/warnings.h"
#include "restore/scene/scene_host.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

namespace restore {

namespace {

struct VariantEntry {
    NodeId id;
    const SnapshotNode* snap;
};

// Variants keep their original offsets, normalized so the top-left-most one
// sits at the inset. The set is sized to hug them plus the inset.
void arrangeFromCoordinates(SceneHost& host, NodeId setId, const SnapshotNode& snap,
                            const std::vector<VariantEntry>& entries) {
    std::vector<Vec2> positions;
    positions.reserve(entries.size());
    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    for (const VariantEntry& e : entries) {
        const Vec2 pos{
            e.snap->absoluteBoundingBox->x - snap.absoluteBoundingBox->x,
            e.snap->absoluteBoundingBox->y - snap.absoluteBoundingBox->y,
        };
        minX = std::min(minX, pos.x);
        minY = std::min(minY, pos.y);
        positions.push_back(pos);
    }

    // Manual placement needs auto layout off
    if (SceneNode* set = host.getNode(setId)) set->layoutMode = LayoutMode::None;

    float maxRight = 0.0f;
    float maxBottom = 0.0f;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const float x = kVariantSetInset + positions[i].x - minX;
        const float y = kVariantSetInset + positions[i].y - minY;
        host.setPosition(entries[i].id, x, y);
        const SceneNode* comp = host.getNode(entries[i].id);
        if (!comp) continue;
        maxRight = std::max(maxRight, comp->x + comp->width);
        maxBottom = std::max(maxBottom, comp->y + comp->height);
    }

    host.resize(setId,
        std::max(1.0f, maxRight + kVariantSetInset),
        std::max(1.0f, maxBottom + kVariantSetInset));
}

void arrangeWithAutoLayout(SceneHost& host, NodeId setId, const SnapshotNode& snap) {
    SceneNode* set = host.getNode(setId);
    if (!set) return;
    if (set->layoutMode == LayoutMode::None) set->layoutMode = LayoutMode::Horizontal;
    set->primaryAxisSizingMode = AxisSizingMode::Auto;
    set->counterAxisSizingMode = AxisSizingMode::Auto;
    set->paddingTop = kVariantSetInset;
    set->paddingBottom = kVariantSetInset;
    set->paddingLeft = kVariantSetInset;
    set->paddingRight = kVariantSetInset;
    if (snap.itemSpacing) {
        set->itemSpacing = *snap.itemSpacing;
    } else if (set->itemSpacing == 0.0f) {
        set->itemSpacing = kVariantDefaultItemSpacing;
    }
}

} // namespace

NodeId buildVariantSet(SnapshotWalker& walker, const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    BuildContext& ctx = walker.context();
    SceneHost& host = ctx.host;

    const bool anyComponent = std::any_of(snap.children.begin(), snap.children.end(),
        [](const SnapshotNode& c) { return c.kind == NodeKind::Component; });
    if (!anyComponent) {
        ctx.warnings.addForNode(snap.name, "ComponentSet", "no variants, created as frame");
        return walker.buildFrame(snap, parent, parentSnap);
    }

    // Variants first, as siblings in the intended parent
    std::vector<VariantEntry> entries;
    std::vector<NodeId> outside;
    for (const SnapshotNode& child : snap.children) {
        if (child.kind == NodeKind::Component) {
            const NodeId id = walker.build(child, parent, nullptr);
            if (id == kInvalidNodeId) continue;
            walker.trackCreated(id);
            entries.push_back(VariantEntry{id, &child});
        } else {
            ctx.warnings.addForNode(snap.name, "ComponentSet",
                "non-variant child " + quotedName(child.name, child.typeName) + " built outside the variant group");
            const NodeId id = walker.build(child, parent, parentSnap);
            if (id == kInvalidNodeId) continue;
            walker.trackCreated(id);
            outside.push_back(id);
        }
    }

    if (entries.empty()) {
        // The frame rebuilds every child itself
        for (const NodeId id : outside) host.removeNode(id);
        ctx.warnings.addForNode(snap.name, "ComponentSet", "no component children, created as frame");
        return walker.buildFrame(snap, parent, parentSnap);
    }

    // A single variant stands in for the set
    if (entries.size() == 1) {
        const NodeId comp = entries.front().id;
        if (SceneNode* node = host.getNode(comp)) {
            if (!snap.name.empty()) node->name = snap.name;
        }
        applyChildLayoutProperties(host, comp, snap, parentSnap);
        applyComponentProperties(host, comp, snap, ctx.warnings);
        return comp;
    }

    std::vector<NodeId> components;
    components.reserve(entries.size());
    for (const VariantEntry& e : entries) components.push_back(e.id);

    const NodeId setId = host.combineAsVariants(components, parent);
    if (setId == kInvalidNodeId) {
        throw std::runtime_error("host refused to combine variants");
    }
    walker.trackCreated(setId);

    // Extent comes from the variants, so no resize here
    applyVisualOnlyProperties(host, setId, snap, ctx.warnings);
    applyCornerRadius(host, setId, snap);
    applyComponentProperties(host, setId, snap, ctx.warnings);

    const bool hasCoordinates = snap.absoluteBoundingBox &&
        std::all_of(entries.begin(), entries.end(),
            [](const VariantEntry& e) { return e.snap->absoluteBoundingBox.has_value(); });

    if (hasCoordinates) {
        arrangeFromCoordinates(host, setId, snap, entries);
    } else {
        ctx.warnings.addForNode(snap.name, "ComponentSet", "variant coordinates missing, using auto layout");
        arrangeWithAutoLayout(host, setId, snap);
    }

    applyChildLayoutProperties(host, setId, snap, parentSnap);
    return setId;
}

} // namespace restore
