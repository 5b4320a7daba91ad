#include "restore/reconstruct/property_mappers.h"
#include "restore/reconstruct/font_resolver.h"
#include "restore/reconstruct/geometry.h"
#include "restore/reconstruct/paint_converter.h"
#include "restore/reconstruct/warnings.h"
#include "restore/scene/scene_host.h"
#include "restore/core/logging.h"

namespace restore {

namespace {

void applyIdentity(SceneNode& node, const SnapshotNode& snap) {
    if (!snap.name.empty()) node.name = snap.name;
    if (!snap.visible) node.visible = false;
    if (snap.opacity) node.opacity = *snap.opacity;
    // PASS_THROUGH is the host default
    if (!snap.blendMode.empty() && snap.blendMode != "PASS_THROUGH") {
        if (auto mode = parseBlendMode(snap.blendMode)) node.blendMode = *mode;
    }
}

void applyPaintsAndEffects(SceneNode& node, const SnapshotNode& snap, WarningCollector& warnings) {
    bool imageDropped = false;
    if (supportsGeometryPaints(node.type)) {
        if (snap.fills) {
            imageDropped |= containsImagePaint(*snap.fills);
            auto paints = convertPaints(*snap.fills);
            if (!paints.empty()) node.fills = std::move(paints);
        }
        if (snap.strokes) {
            imageDropped |= containsImagePaint(*snap.strokes);
            auto paints = convertPaints(*snap.strokes);
            if (!paints.empty()) node.strokes = std::move(paints);
        }
        if (snap.strokeWeight) node.strokeWeight = *snap.strokeWeight;
        if (auto align = parseStrokeAlign(snap.strokeAlign)) node.strokeAlign = *align;
    }
    if (snap.effects) {
        auto effects = convertEffects(*snap.effects);
        if (!effects.empty()) node.effects = std::move(effects);
    }
    if (imageDropped) {
        warnings.addForNode(snap.name, snap.typeName, "image fill dropped (no pixel data in snapshot)");
    }
}

} // namespace

void applyCommonProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, WarningCollector& warnings) {
    float width = 0.0f;
    float height = 0.0f;
    if (snapshotSize(snap, width, height)) {
        host.resize(id, width, height);
    }

    SceneNode* node = host.getNode(id);
    if (!node) return;
    applyIdentity(*node, snap);
    applyPaintsAndEffects(*node, snap, warnings);
}

void applyVisualOnlyProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, WarningCollector& warnings) {
    SceneNode* node = host.getNode(id);
    if (!node) return;
    applyIdentity(*node, snap);
    if (snap.clipsContent && supportsAutoLayout(node->type)) node->clipsContent = *snap.clipsContent;
    applyPaintsAndEffects(*node, snap, warnings);
}

void applyFrameProperties(SceneHost& host, NodeId id, const SnapshotNode& snap) {
    SceneNode* node = host.getNode(id);
    if (!node || !supportsAutoLayout(node->type)) return;

    if (snap.clipsContent) node->clipsContent = *snap.clipsContent;

    // Layout mode must be in place before padding and spacing
    const auto mode = parseLayoutMode(snap.layoutMode);
    if (mode && *mode != LayoutMode::None) {
        node->layoutMode = *mode;

        if (snap.paddingTop) node->paddingTop = *snap.paddingTop;
        if (snap.paddingBottom) node->paddingBottom = *snap.paddingBottom;
        if (snap.paddingLeft) node->paddingLeft = *snap.paddingLeft;
        if (snap.paddingRight) node->paddingRight = *snap.paddingRight;

        if (snap.itemSpacing) node->itemSpacing = *snap.itemSpacing;
        if (snap.counterAxisSpacing) node->counterAxisSpacing = *snap.counterAxisSpacing;

        if (auto v = parseAxisSizingMode(snap.primaryAxisSizingMode)) node->primaryAxisSizingMode = *v;
        if (auto v = parseAxisSizingMode(snap.counterAxisSizingMode)) node->counterAxisSizingMode = *v;
        if (auto v = parsePrimaryAxisAlign(snap.primaryAxisAlignItems)) node->primaryAxisAlignItems = *v;
        if (auto v = parseCounterAxisAlign(snap.counterAxisAlignItems)) node->counterAxisAlignItems = *v;
    }

    applyCornerRadius(host, id, snap);
}

void applyCornerRadius(SceneHost& host, NodeId id, const SnapshotNode& snap) {
    SceneNode* node = host.getNode(id);
    if (!node || !supportsCornerRadius(node->type)) return;

    if (snap.cornerRadius) {
        const float r = *snap.cornerRadius;
        node->cornerRadius = r;
        node->topLeftRadius = r;
        node->topRightRadius = r;
        node->bottomLeftRadius = r;
        node->bottomRightRadius = r;
    }
    if (snap.topLeftRadius) node->topLeftRadius = *snap.topLeftRadius;
    if (snap.topRightRadius) node->topRightRadius = *snap.topRightRadius;
    if (snap.bottomLeftRadius) node->bottomLeftRadius = *snap.bottomLeftRadius;
    if (snap.bottomRightRadius) node->bottomRightRadius = *snap.bottomRightRadius;
}

void applyChildLayoutProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, const SnapshotNode* parentSnap) {
    if (!parentSnap) return;

    if (!parentSnap->declaresAutoLayout()) {
        if (snap.absoluteBoundingBox && parentSnap->absoluteBoundingBox) {
            const Vec2 pos = computeRelativePosition(snap, *parentSnap);
            host.setPosition(id, pos.x, pos.y);
        }
        return;
    }

    SceneNode* node = host.getNode(id);
    if (!node) return;
    if (auto v = parseLayoutAlign(snap.layoutAlign)) node->layoutAlign = *v;
    if (snap.layoutGrow) node->layoutGrow = *snap.layoutGrow;
    if (auto v = parseLayoutSizing(snap.layoutSizingHorizontal)) node->layoutSizingHorizontal = *v;
    if (auto v = parseLayoutSizing(snap.layoutSizingVertical)) node->layoutSizingVertical = *v;
}

void applyTextProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, const FontName& font, WarningCollector& warnings) {
    const FontName fallback = FontResolver::fallbackFont();
    if (!host.setFontName(id, font) && font != fallback && !host.setFontName(id, fallback)) {
        RESTORE_LOG_WARN("node %u: host refused fallback font %s %s", static_cast<unsigned>(id),
                         fallback.family.c_str(), fallback.style.c_str());
    }

    if (snap.characters && !host.setCharacters(id, *snap.characters)) {
        warnings.addForNode(snap.name, snap.typeName, "text content not set (no usable font)");
    }

    SceneNode* node = host.getNode(id);
    if (!node) return;

    SnapshotTextStyle style;
    if (snap.style) style = *snap.style;

    if (style.fontSize) node->fontSize = *style.fontSize;
    if (auto v = parseTextAlignHorizontal(style.textAlignHorizontal)) node->textAlignHorizontal = *v;
    if (auto v = parseTextAlignVertical(style.textAlignVertical)) node->textAlignVertical = *v;

    if (style.lineHeightPx) {
        node->lineHeight = LineHeight{*style.lineHeightPx, LineHeightUnit::Pixels};
    } else if (style.lineHeightPercent) {
        node->lineHeight = LineHeight{*style.lineHeightPercent, LineHeightUnit::Percent};
    }
    if (style.letterSpacing) node->letterSpacing = *style.letterSpacing;

    // Only the two drawn decorations are carried over
    const auto decoration = parseTextDecoration(style.textDecoration);
    if (decoration && *decoration != TextDecoration::None) node->textDecoration = *decoration;

    if (auto v = parseTextCase(style.textCase)) node->textCase = *v;

    if (auto v = parseTextAutoResize(style.textAutoResize)) {
        host.setTextAutoResize(id, *v);
    }
}

void applyComponentProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, WarningCollector& warnings) {
    for (const ComponentPropertyDefinition& def : snap.componentPropertyDefinitions) {
        const auto type = parseComponentPropertyType(def.type);
        if (!type || *type == ComponentPropertyType::Variant) continue;

        ComponentProperty property{def.name, *type, def.defaultValue};
        if (!host.addComponentProperty(id, property)) {
            warnings.addForNode(snap.name, snap.typeName, "component property \"" + def.name + "\" could not be declared");
        }
    }
}

} // namespace restore
