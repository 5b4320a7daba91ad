#include "restore/reconstruct/snapshot_walker.h"
#include "restore/reconstruct/font_resolver.h"
#include "restore/reconstruct/property_mappers.h"
#include "restore/reconstruct/variant_builder.h"
#include "restore/reconstruct/warnings.h"
#include "restore/scene/scene_host.h"
#include "restore/core/logging.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace restore {

std::uint32_t countSnapshotNodes(const SnapshotNode& node) {
    if (node.typeName.empty()) return 0;
    std::uint32_t count = 1;
    for (const SnapshotNode& child : node.children) {
        count += countSnapshotNodes(child);
    }
    return count;
}

SnapshotWalker::SnapshotWalker(BuildContext& ctx) : ctx_(ctx) {}

void SnapshotWalker::countProcessed() {
    ++ctx_.processed;
    if (ctx_.processed % kYieldInterval != 0) return;

    ctx_.host.yieldToHost();
    if (ctx_.onProgress) {
        const float total = static_cast<float>(std::max(ctx_.total, ctx_.processed));
        const float share = static_cast<float>(ctx_.processed) / total;
        const float percent = kProgressStart + (kProgressBuildEnd - kProgressStart) * share;
        ctx_.onProgress("Building nodes (" + std::to_string(ctx_.processed) + "/" +
            std::to_string(ctx_.total) + ")...", percent);
    }
}

NodeId SnapshotWalker::build(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    if (snap.typeName.empty()) return kInvalidNodeId;

    countProcessed();

    const std::size_t mark = created_.size();
    try {
        const NodeId id = dispatch(snap, parent, parentSnap);
        created_.resize(mark);
        return id;
    } catch (const std::exception& e) {
        // Undo this node's partial subtree, innermost first
        for (std::size_t i = created_.size(); i > mark; --i) {
            ctx_.host.removeNode(created_[i - 1]);
        }
        created_.resize(mark);
        ctx_.warnings.addForNode(snap.name, snap.typeName,
            snap.typeName + " could not be created (" + e.what() + ")");
        return kInvalidNodeId;
    }
}

NodeId SnapshotWalker::dispatch(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    RESTORE_LOG_DEBUG("build %s \"%s\"", snap.typeName.c_str(), snap.name.c_str());

    switch (snap.kind) {
        case NodeKind::Frame:
            return buildFrame(snap, parent, parentSnap);
        case NodeKind::Rectangle:
            return buildRectangle(snap, parent, parentSnap);
        case NodeKind::Ellipse:
            return buildEllipse(snap, parent, parentSnap);
        case NodeKind::Text:
            return buildText(snap, parent, parentSnap);
        case NodeKind::Group:
            return buildGroup(snap, parent, parentSnap);
        case NodeKind::Component:
            return buildComponent(snap, parent, parentSnap);
        case NodeKind::ComponentSet:
            return buildVariantSet(*this, snap, parent, parentSnap);
        case NodeKind::Instance:
            ctx_.warnings.addForNode(snap.name, "Instance",
                "INSTANCE downgraded to Frame (cannot recreate without original component)");
            return buildFrame(snap, parent, parentSnap);
        case NodeKind::Vector:
        case NodeKind::Star:
        case NodeKind::RegularPolygon:
        case NodeKind::Line:
        case NodeKind::BooleanOperation:
            return buildVectorLike(snap, parent, parentSnap);
        case NodeKind::Unknown:
            break;
    }

    ctx_.warnings.add("Unknown node type \"" + snap.typeName + "\" for \"" +
        (snap.name.empty() ? std::string("?") : snap.name) + "\" — skipped");
    return kInvalidNodeId;
}

NodeId SnapshotWalker::createAttached(SceneNodeType type, NodeId parent) {
    const NodeId id = ctx_.host.createNode(type);
    if (id == kInvalidNodeId) {
        throw std::runtime_error("host refused node creation");
    }
    created_.push_back(id);
    if (!ctx_.host.appendChild(parent, id)) {
        throw std::runtime_error("host refused to attach node");
    }
    return id;
}

void SnapshotWalker::buildChildren(const SnapshotNode& snap, NodeId container) {
    for (const SnapshotNode& child : snap.children) {
        build(child, container, &snap);
    }
}

// =============================================================================
// Containers
// =============================================================================

NodeId SnapshotWalker::buildFrame(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    const NodeId id = createAttached(SceneNodeType::Frame, parent);
    applyCommonProperties(ctx_.host, id, snap, ctx_.warnings);
    applyFrameProperties(ctx_.host, id, snap);
    applyChildLayoutProperties(ctx_.host, id, snap, parentSnap);
    buildChildren(snap, id);
    return id;
}

NodeId SnapshotWalker::buildComponent(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    const NodeId id = createAttached(SceneNodeType::Component, parent);
    applyCommonProperties(ctx_.host, id, snap, ctx_.warnings);
    applyFrameProperties(ctx_.host, id, snap);
    applyChildLayoutProperties(ctx_.host, id, snap, parentSnap);
    applyComponentProperties(ctx_.host, id, snap, ctx_.warnings);
    buildChildren(snap, id);
    return id;
}

NodeId SnapshotWalker::buildGroup(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    if (!snap.hasChildren()) {
        ctx_.warnings.addForNode(snap.name, "Group", "empty group skipped");
        return kInvalidNodeId;
    }

    // Children land in the group's parent first. They are placed against that
    // parent's box, or against the group's own box when there is no manual
    // placement frame (root group, auto-layout parent).
    const SnapshotNode* anchor = (parentSnap && !parentSnap->declaresAutoLayout()) ? parentSnap : &snap;

    std::vector<NodeId> built;
    built.reserve(snap.children.size());
    for (const SnapshotNode& child : snap.children) {
        const NodeId id = build(child, parent, anchor);
        if (id != kInvalidNodeId) built.push_back(id);
    }

    if (built.empty()) {
        ctx_.warnings.addForNode(snap.name, "Group", "no valid children, group skipped");
        return kInvalidNodeId;
    }

    // Built children are owned by this group from here on
    created_.insert(created_.end(), built.begin(), built.end());
    const NodeId group = ctx_.host.group(built, parent);
    if (group == kInvalidNodeId) {
        throw std::runtime_error("host refused grouping");
    }
    created_.push_back(group);

    SceneNode* node = ctx_.host.getNode(group);
    if (node) {
        node->name = snap.name.empty() ? std::string("Group") : snap.name;
        if (!snap.visible) node->visible = false;
        if (snap.opacity) node->opacity = *snap.opacity;
    }
    return group;
}

// =============================================================================
// Leaves
// =============================================================================

NodeId SnapshotWalker::buildRectangle(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    const NodeId id = createAttached(SceneNodeType::Rectangle, parent);
    applyCommonProperties(ctx_.host, id, snap, ctx_.warnings);
    applyCornerRadius(ctx_.host, id, snap);
    applyChildLayoutProperties(ctx_.host, id, snap, parentSnap);
    return id;
}

NodeId SnapshotWalker::buildEllipse(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    const NodeId id = createAttached(SceneNodeType::Ellipse, parent);
    applyCommonProperties(ctx_.host, id, snap, ctx_.warnings);
    applyChildLayoutProperties(ctx_.host, id, snap, parentSnap);
    return id;
}

NodeId SnapshotWalker::buildText(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    const NodeId id = createAttached(SceneNodeType::Text, parent);

    // The font has to be loaded before any characters are assigned
    const FontName font = ctx_.fonts.resolve(snap);

    applyCommonProperties(ctx_.host, id, snap, ctx_.warnings);
    applyTextProperties(ctx_.host, id, snap, font, ctx_.warnings);
    applyChildLayoutProperties(ctx_.host, id, snap, parentSnap);
    return id;
}

// =============================================================================
// Vector kinds
// =============================================================================

NodeId SnapshotWalker::buildVectorLike(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    if (snap.svgData && !snap.svgData->empty()) {
        const NodeId id = buildFromSvg(snap, parent, parentSnap);
        if (id != kInvalidNodeId) return id;
        ctx_.warnings.addForNode(snap.name, snap.typeName, "SVG import failed");
    }
    return buildVectorFallback(snap, parent, parentSnap);
}

NodeId SnapshotWalker::buildVectorFallback(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    if (snap.kind == NodeKind::BooleanOperation) {
        ctx_.warnings.addForNode(snap.name, "BooleanOp", "BOOLEAN_OPERATION downgraded to Frame (no SVG data)");
        return buildFrame(snap, parent, parentSnap);
    }

    ctx_.warnings.addForNode(snap.name, snap.typeName,
        snap.typeName + " replaced with placeholder rectangle (no SVG data)");
    return buildRectangle(snap, parent, parentSnap);
}

NodeId SnapshotWalker::buildFromSvg(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap) {
    SceneHost& host = ctx_.host;
    const NodeId wrapper = host.createNodeFromSvg(*snap.svgData);
    if (wrapper == kInvalidNodeId) return kInvalidNodeId;
    created_.push_back(wrapper);

    const SceneNode* wrapperNode = host.getNode(wrapper);
    if (!wrapperNode) {
        throw std::runtime_error("imported SVG node vanished");
    }

    // A single-shape import is unwrapped
    NodeId result = wrapper;
    if (wrapperNode->children.size() == 1) {
        const NodeId inner = wrapperNode->children.front();
        if (!host.appendChild(parent, inner)) {
            throw std::runtime_error("host refused to attach imported shape");
        }
        created_.push_back(inner);
        host.removeNode(wrapper);
        result = inner;
    } else if (!host.appendChild(parent, wrapper)) {
        throw std::runtime_error("host refused to attach imported SVG");
    }

    SceneNode* node = host.getNode(result);
    if (node && !snap.name.empty()) node->name = snap.name;
    if (snap.absoluteBoundingBox) {
        host.resize(result,
            std::max(1.0f, snap.absoluteBoundingBox->width),
            std::max(1.0f, snap.absoluteBoundingBox->height));
    }
    node = host.getNode(result);
    if (node) {
        if (!snap.visible) node->visible = false;
        if (snap.opacity) node->opacity = *snap.opacity;
    }
    applyChildLayoutProperties(host, result, snap, parentSnap);

    ctx_.warnings.addForNode(snap.name, snap.typeName, "reconstructed from SVG");
    return result;
}

} // namespace restore
