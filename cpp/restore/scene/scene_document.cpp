#include "restore/scene/scene_document.h"
#include "restore/scene/svg_import.h"
#include "restore/reconstruct/geometry.h"
#include "restore/core/logging.h"
#include "restore/core/util.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace restore {

namespace {
    constexpr float kColorByteScale = 1.0f / 255.0f;

    Paint makeSolid(float r, float g, float b) {
        Paint p{};
        p.type = PaintType::Solid;
        p.color = Color{r, g, b, 1.0f};
        p.opacity = 1.0f;
        p.visible = true;
        p.gradientTransform = identityTransform();
        return p;
    }

    // New nodes start with the editor's default paints.
    void applyDefaultPaints(SceneNode& node) {
        switch (node.type) {
            case SceneNodeType::Frame:
            case SceneNodeType::Component:
                node.fills.push_back(makeSolid(1.0f, 1.0f, 1.0f));
                break;
            case SceneNodeType::Rectangle:
            case SceneNodeType::Ellipse:
            case SceneNodeType::Vector: {
                const float grey = 217.0f * kColorByteScale;
                node.fills.push_back(makeSolid(grey, grey, grey));
                break;
            }
            case SceneNodeType::Text:
                node.fills.push_back(makeSolid(0.0f, 0.0f, 0.0f));
                break;
            default:
                break;
        }
    }

    const char* kindName(SceneNodeType type) {
        switch (type) {
            case SceneNodeType::Page: return "PAGE";
            case SceneNodeType::Frame: return "FRAME";
            case SceneNodeType::Rectangle: return "RECTANGLE";
            case SceneNodeType::Ellipse: return "ELLIPSE";
            case SceneNodeType::Text: return "TEXT";
            case SceneNodeType::Group: return "GROUP";
            case SceneNodeType::Component: return "COMPONENT";
            case SceneNodeType::ComponentSet: return "COMPONENT_SET";
            case SceneNodeType::Vector: return "VECTOR";
        }
        return "";
    }

    std::uint64_t hashString(std::uint64_t h, const std::string& s) {
        h = hashU32(h, static_cast<std::uint32_t>(s.size()));
        if (!s.empty()) {
            h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
        }
        return h;
    }

    std::uint64_t hashPaints(std::uint64_t h, const std::vector<Paint>& paints) {
        h = hashU32(h, static_cast<std::uint32_t>(paints.size()));
        for (const Paint& p : paints) {
            h = hashU32(h, static_cast<std::uint32_t>(p.type));
            h = hashF32(h, p.color.r);
            h = hashF32(h, p.color.g);
            h = hashF32(h, p.color.b);
            h = hashF32(h, p.opacity);
            h = hashU32(h, static_cast<std::uint32_t>(p.gradientStops.size()));
            for (int row = 0; row < 2; ++row) {
                for (int col = 0; col < 3; ++col) {
                    h = hashF32(h, p.gradientTransform.m[row][col]);
                }
            }
        }
        return h;
    }

    SnapshotColor toSnapshotColor(const Color& c) {
        SnapshotColor out;
        out.r = c.r;
        out.g = c.g;
        out.b = c.b;
        out.a = c.a;
        return out;
    }

    SnapshotPaint exportPaint(const Paint& paint) {
        SnapshotPaint out;
        out.type = toString(paint.type);
        out.visible = paint.visible;
        out.opacity = paint.opacity;
        if (paint.type == PaintType::Solid) {
            out.color = toSnapshotColor(paint.color);
            return out;
        }
        for (const ColorStop& stop : paint.gradientStops) {
            GradientStop gs;
            gs.position = stop.position;
            gs.color = toSnapshotColor(stop.color);
            out.gradientStops.push_back(gs);
        }
        // Two handles reproduce the transform's origin and direction.
        const Transform2D& t = paint.gradientTransform;
        HandlePosition h0;
        h0.x = t.m[0][2];
        h0.y = t.m[1][2];
        HandlePosition h1;
        h1.x = t.m[0][2] + t.m[0][0];
        h1.y = t.m[1][2] + t.m[0][1];
        out.gradientHandlePositions = {h0, h1};
        return out;
    }

    SnapshotEffect exportEffect(const Effect& effect) {
        SnapshotEffect out;
        out.type = toString(effect.type);
        out.visible = effect.visible;
        out.radius = effect.radius;
        if (effect.type == EffectType::DropShadow || effect.type == EffectType::InnerShadow) {
            out.color = toSnapshotColor(effect.color);
            HandlePosition offset;
            offset.x = effect.offset.x;
            offset.y = effect.offset.y;
            out.offset = offset;
            out.spread = effect.spread;
            out.blendMode = toString(effect.blendMode);
        }
        return out;
    }
} // namespace

SceneDocument::SceneDocument(const FontService& fonts) : fonts_(fonts) {
    clear();
}

void SceneDocument::clear() noexcept {
    nodes_.clear();
    selection_.clear();
    focused_ = kInvalidNodeId;
    yieldCount_ = 0;
    combineCalls_ = 0;
    groupCalls_ = 0;
    nextId_ = kPageId + 1;

    SceneNode page{};
    page.id = kPageId;
    page.type = SceneNodeType::Page;
    page.name = "Page 1";
    nodes_.emplace(kPageId, std::move(page));
}

NodeId SceneDocument::allocate(SceneNodeType type) {
    const NodeId id = nextId_++;
    SceneNode node{};
    node.id = id;
    node.type = type;
    node.name = kindName(type);
    applyDefaultPaints(node);
    nodes_.emplace(id, std::move(node));
    return id;
}

NodeId SceneDocument::createNode(SceneNodeType type) {
    switch (type) {
        case SceneNodeType::Frame:
        case SceneNodeType::Rectangle:
        case SceneNodeType::Ellipse:
        case SceneNodeType::Text:
        case SceneNodeType::Component:
            break;
        default:
            RESTORE_LOG_WARN("createNode: type %s is not directly creatable", kindName(type));
            return kInvalidNodeId;
    }
    const NodeId id = allocate(type);
    if (type == SceneNodeType::Text) {
        SceneNode& text = nodes_.at(id);
        text.width = 0.0f;
        text.height = 0.0f;
        text.textAutoResize = TextAutoResize::WidthAndHeight;
    }
    return id;
}

SceneNode* SceneDocument::getNode(NodeId id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const SceneNode* SceneDocument::getNode(NodeId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

void SceneDocument::detach(SceneNode& node) {
    if (node.parent == kInvalidNodeId) return;
    SceneNode* parent = getNode(node.parent);
    if (parent) {
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), node.id), siblings.end());
    }
    node.parent = kInvalidNodeId;
}

bool SceneDocument::isAncestor(NodeId ancestor, NodeId node) const {
    const SceneNode* cur = getNode(node);
    while (cur && cur->parent != kInvalidNodeId) {
        if (cur->parent == ancestor) return true;
        cur = getNode(cur->parent);
    }
    return false;
}

bool SceneDocument::appendChild(NodeId parentId, NodeId childId) {
    SceneNode* parent = getNode(parentId);
    SceneNode* child = getNode(childId);
    if (!parent || !child || parentId == childId) return false;
    if (!isContainerType(parent->type) || child->type == SceneNodeType::Page) return false;
    if (isAncestor(childId, parentId)) return false;
    detach(*child);
    child->parent = parentId;
    parent->children.push_back(childId);
    return true;
}

void SceneDocument::removeNode(NodeId id) {
    if (id == kPageId) return;
    SceneNode* node = getNode(id);
    if (!node) return;
    detach(*node);

    std::vector<NodeId> pending{id};
    while (!pending.empty()) {
        const NodeId cur = pending.back();
        pending.pop_back();
        auto it = nodes_.find(cur);
        if (it == nodes_.end()) continue;
        pending.insert(pending.end(), it->second.children.begin(), it->second.children.end());
        nodes_.erase(it);
    }
    selection_.erase(std::remove(selection_.begin(), selection_.end(), id), selection_.end());
    if (focused_ == id) focused_ = kInvalidNodeId;
}

bool SceneDocument::resize(NodeId id, float width, float height) {
    SceneNode* node = getNode(id);
    if (!node || node->type == SceneNodeType::Page) return false;
    if (!(width >= 0.01f) || !(height >= 0.01f)) return false;
    node->width = width;
    node->height = height;
    if (node->type == SceneNodeType::Text && node->textAutoResize == TextAutoResize::WidthAndHeight) {
        node->textAutoResize = TextAutoResize::None;
    }
    return true;
}

bool SceneDocument::setPosition(NodeId id, float x, float y) {
    SceneNode* node = getNode(id);
    if (!node || node->type == SceneNodeType::Page) return false;
    if (!std::isfinite(x) || !std::isfinite(y)) return false;
    node->x = x;
    node->y = y;
    return true;
}

bool SceneDocument::setFontName(NodeId id, const FontName& font) {
    SceneNode* node = getNode(id);
    if (!node || node->type != SceneNodeType::Text) return false;
    if (!fonts_.isFontLoaded(font)) {
        RESTORE_LOG_WARN("setFontName: %s %s is not loaded", font.family.c_str(), font.style.c_str());
        return false;
    }
    node->fontName = font;
    return true;
}

bool SceneDocument::setCharacters(NodeId id, std::string_view characters) {
    SceneNode* node = getNode(id);
    if (!node || node->type != SceneNodeType::Text) return false;
    if (!fonts_.isFontLoaded(node->fontName)) {
        RESTORE_LOG_WARN("setCharacters: font %s %s must be loaded first",
            node->fontName.family.c_str(), node->fontName.style.c_str());
        return false;
    }
    node->characters.assign(characters.data(), characters.size());
    fitTextWidth(*node);
    return true;
}

bool SceneDocument::setTextAutoResize(NodeId id, TextAutoResize mode) {
    SceneNode* node = getNode(id);
    if (!node || node->type != SceneNodeType::Text) return false;
    node->textAutoResize = mode;
    fitTextWidth(*node);
    return true;
}

void SceneDocument::fitTextWidth(SceneNode& node) {
    if (node.textAutoResize != TextAutoResize::WidthAndHeight) return;
    const auto width = fonts_.measureTextWidth(node.fontName, node.characters, node.fontSize, node.letterSpacing);
    if (!width) return;
    node.width = std::max(1.0f, *width);
    if (node.height < 1.0f) {
        node.height = node.lineHeight.unit == LineHeightUnit::Pixels ? node.lineHeight.value : node.fontSize * 1.2f;
    }
}

bool SceneDocument::addComponentProperty(NodeId id, const ComponentProperty& property) {
    SceneNode* node = getNode(id);
    if (!node || !supportsComponentProperties(node->type)) return false;
    if (property.name.empty()) return false;
    for (const ComponentProperty& existing : node->componentProperties) {
        if (existing.name == property.name) return false;
    }
    node->componentProperties.push_back(property);
    return true;
}

NodeId SceneDocument::wrapSiblings(SceneNodeType wrapperType, const std::vector<NodeId>& children, NodeId parentId) {
    SceneNode* parent = getNode(parentId);
    if (!parent || !isContainerType(parent->type) || children.empty()) return kInvalidNodeId;

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();
    std::size_t insertAt = parent->children.size();
    for (const NodeId childId : children) {
        const SceneNode* child = getNode(childId);
        if (!child || child->parent != parentId) return kInvalidNodeId;
        minX = std::min(minX, child->x);
        minY = std::min(minY, child->y);
        maxX = std::max(maxX, child->x + child->width);
        maxY = std::max(maxY, child->y + child->height);
        const auto pos = std::find(parent->children.begin(), parent->children.end(), childId);
        insertAt = std::min(insertAt, static_cast<std::size_t>(pos - parent->children.begin()));
    }

    const NodeId wrapperId = allocate(wrapperType);
    {
        SceneNode& wrapper = nodes_.at(wrapperId);
        wrapper.parent = parentId;
        wrapper.x = minX;
        wrapper.y = minY;
        wrapper.width = std::max(0.01f, maxX - minX);
        wrapper.height = std::max(0.01f, maxY - minY);
    }
    // Re-fetch: allocate() may rehash the node table.
    parent = getNode(parentId);
    parent->children.insert(parent->children.begin() + static_cast<std::ptrdiff_t>(insertAt), wrapperId);

    for (const NodeId childId : children) {
        SceneNode& child = nodes_.at(childId);
        detach(child);
        child.parent = wrapperId;
        child.x -= minX;
        child.y -= minY;
        nodes_.at(wrapperId).children.push_back(childId);
    }
    return wrapperId;
}

NodeId SceneDocument::group(const std::vector<NodeId>& children, NodeId parent) {
    ++groupCalls_;
    return wrapSiblings(SceneNodeType::Group, children, parent);
}

NodeId SceneDocument::combineAsVariants(const std::vector<NodeId>& components, NodeId parent) {
    ++combineCalls_;
    if (components.size() < 2) {
        RESTORE_LOG_WARN("combineAsVariants: needs at least two components, got %zu", components.size());
        return kInvalidNodeId;
    }
    for (const NodeId id : components) {
        const SceneNode* node = getNode(id);
        if (!node || node->type != SceneNodeType::Component) return kInvalidNodeId;
    }
    return wrapSiblings(SceneNodeType::ComponentSet, components, parent);
}

NodeId SceneDocument::createNodeFromSvg(std::string_view markup) {
    const auto image = parseSvgMarkup(markup);
    if (!image) return kInvalidNodeId;

    const NodeId wrapperId = allocate(SceneNodeType::Frame);
    {
        SceneNode& wrapper = nodes_.at(wrapperId);
        wrapper.name = "svg";
        wrapper.width = image->width;
        wrapper.height = image->height;
        wrapper.fills.clear();
        wrapper.clipsContent = false;
    }
    appendChild(kPageId, wrapperId);

    for (const SvgShape& shape : image->shapes) {
        const NodeId vectorId = allocate(SceneNodeType::Vector);
        SceneNode& vector = nodes_.at(vectorId);
        vector.name = shape.id.empty() ? shape.element : shape.id;
        vector.x = shape.bounds.x;
        vector.y = shape.bounds.y;
        vector.width = std::max(0.01f, shape.bounds.width);
        vector.height = std::max(0.01f, shape.bounds.height);
        vector.vectorPath = shape.pathData;
        if (shape.fill) {
            vector.fills = {makeSolid(shape.fill->r, shape.fill->g, shape.fill->b)};
        } else if (shape.fillNone) {
            vector.fills.clear();
        }
        if (shape.stroke) {
            vector.strokes = {makeSolid(shape.stroke->r, shape.stroke->g, shape.stroke->b)};
        } else if (shape.strokeNone) {
            vector.strokes.clear();
        }
        if (shape.strokeWidth) vector.strokeWeight = *shape.strokeWidth;
        appendChild(wrapperId, vectorId);
    }
    return wrapperId;
}

void SceneDocument::selectAndFocus(NodeId id) {
    if (!getNode(id)) return;
    selection_ = {id};
    focused_ = id;
}

std::string SceneDocument::formatNodeId(NodeId id) const {
    return std::to_string(kPageId) + ":" + std::to_string(id);
}

Vec2 SceneDocument::absolutePosition(NodeId id) const {
    Vec2 pos{0.0f, 0.0f};
    const SceneNode* cur = getNode(id);
    while (cur && cur->type != SceneNodeType::Page) {
        pos.x += cur->x;
        pos.y += cur->y;
        cur = getNode(cur->parent);
    }
    return pos;
}

// =============================================================================
// Digest
// =============================================================================

std::uint64_t SceneDocument::hashNode(std::uint64_t h, const SceneNode& node) const {
    h = hashU32(h, static_cast<std::uint32_t>(node.type));
    h = hashString(h, node.name);
    h = hashU32(h, node.visible ? 1u : 0u);
    h = hashF32(h, node.opacity);
    h = hashU32(h, static_cast<std::uint32_t>(node.blendMode));
    h = hashF32(h, node.x);
    h = hashF32(h, node.y);
    h = hashF32(h, node.width);
    h = hashF32(h, node.height);
    h = hashPaints(h, node.fills);
    h = hashPaints(h, node.strokes);
    h = hashF32(h, node.strokeWeight);
    h = hashU32(h, static_cast<std::uint32_t>(node.effects.size()));
    h = hashF32(h, node.cornerRadius);
    h = hashU32(h, static_cast<std::uint32_t>(node.layoutMode));
    h = hashF32(h, node.itemSpacing);
    if (node.type == SceneNodeType::Text) {
        h = hashString(h, node.characters);
        h = hashString(h, node.fontName.family);
        h = hashString(h, node.fontName.style);
        h = hashF32(h, node.fontSize);
    }

    h = hashU32(h, static_cast<std::uint32_t>(node.children.size()));
    for (const NodeId childId : node.children) {
        const SceneNode* child = getNode(childId);
        if (!child) continue;
        h = hashNode(h, *child);
    }
    return h;
}

std::uint64_t SceneDocument::digest(NodeId root) const {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, 0x45435353u); // "SSCE" marker
    const SceneNode* node = getNode(root);
    if (!node) return h;
    return hashNode(h, *node);
}

// =============================================================================
// Export
// =============================================================================

SnapshotNode SceneDocument::exportSnapshot(NodeId root) const {
    SnapshotNode out;
    const SceneNode* node = getNode(root);
    if (!node) return out;
    const Vec2 abs = absolutePosition(root);
    exportInto(*node, abs.x, abs.y, out);
    return out;
}

void SceneDocument::exportInto(const SceneNode& node, float absX, float absY, SnapshotNode& out) const {
    out.typeName = kindName(node.type);
    out.kind = parseNodeKind(out.typeName);
    out.name = node.name;
    out.visible = node.visible;
    out.opacity = node.opacity;
    out.blendMode = toString(node.blendMode);
    out.absoluteBoundingBox = BoundingBox{absX, absY, node.width, node.height};

    if (supportsGeometryPaints(node.type)) {
        std::vector<SnapshotPaint> fills;
        for (const Paint& p : node.fills) fills.push_back(exportPaint(p));
        out.fills = std::move(fills);
        std::vector<SnapshotPaint> strokes;
        for (const Paint& p : node.strokes) strokes.push_back(exportPaint(p));
        out.strokes = std::move(strokes);
        out.strokeWeight = node.strokeWeight;
        out.strokeAlign = toString(node.strokeAlign);
    }
    std::vector<SnapshotEffect> effects;
    for (const Effect& e : node.effects) effects.push_back(exportEffect(e));
    out.effects = std::move(effects);

    if (supportsCornerRadius(node.type)) {
        out.cornerRadius = node.cornerRadius;
        out.topLeftRadius = node.topLeftRadius;
        out.topRightRadius = node.topRightRadius;
        out.bottomLeftRadius = node.bottomLeftRadius;
        out.bottomRightRadius = node.bottomRightRadius;
    }

    if (supportsAutoLayout(node.type)) {
        out.clipsContent = node.clipsContent;
        out.layoutMode = toString(node.layoutMode);
        if (node.layoutMode != LayoutMode::None) {
            out.paddingTop = node.paddingTop;
            out.paddingRight = node.paddingRight;
            out.paddingBottom = node.paddingBottom;
            out.paddingLeft = node.paddingLeft;
            out.itemSpacing = node.itemSpacing;
            out.counterAxisSpacing = node.counterAxisSpacing;
            out.primaryAxisSizingMode = toString(node.primaryAxisSizingMode);
            out.counterAxisSizingMode = toString(node.counterAxisSizingMode);
            out.primaryAxisAlignItems = toString(node.primaryAxisAlignItems);
            out.counterAxisAlignItems = toString(node.counterAxisAlignItems);
        }
    }

    const SceneNode* parent = getNode(node.parent);
    if (parent && parent->layoutMode != LayoutMode::None) {
        out.layoutAlign = toString(node.layoutAlign);
        out.layoutGrow = node.layoutGrow;
        out.layoutSizingHorizontal = toString(node.layoutSizingHorizontal);
        out.layoutSizingVertical = toString(node.layoutSizingVertical);
    }

    if (node.type == SceneNodeType::Text) {
        out.characters = node.characters;
        SnapshotTextStyle style;
        style.fontFamily = node.fontName.family;
        style.fontWeight = mapStyleToWeight(node.fontName.style);
        style.fontSize = node.fontSize;
        style.textAlignHorizontal = toString(node.textAlignHorizontal);
        style.textAlignVertical = toString(node.textAlignVertical);
        if (node.lineHeight.unit == LineHeightUnit::Pixels) style.lineHeightPx = node.lineHeight.value;
        if (node.lineHeight.unit == LineHeightUnit::Percent) style.lineHeightPercent = node.lineHeight.value;
        style.letterSpacing = node.letterSpacing;
        style.textDecoration = toString(node.textDecoration);
        style.textCase = toString(node.textCase);
        style.textAutoResize = toString(node.textAutoResize);
        out.style = std::move(style);
    }

    for (const ComponentProperty& prop : node.componentProperties) {
        ComponentPropertyDefinition def;
        def.name = prop.name;
        def.type = toString(prop.type);
        def.defaultValue = prop.defaultValue;
        out.componentPropertyDefinitions.push_back(std::move(def));
    }

    for (const NodeId childId : node.children) {
        const SceneNode* child = getNode(childId);
        if (!child) continue;
        SnapshotNode childOut;
        exportInto(*child, absX + child->x, absY + child->y, childOut);
        out.children.push_back(std::move(childOut));
    }
}

} // namespace restore
