#include "restore/snapshot/snapshot_json.h"
#include "restore/core/logging.h"

#include <nlohmann/json.hpp>

namespace restore {

// Member order is preserved so property definitions keep their declared order.
using json = nlohmann::ordered_json;

namespace {

// =============================================================================
// Decoding helpers
// =============================================================================

std::optional<float> optFloat(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<float>();
}

std::string str(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<std::string> optString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// Only an explicit false hides a node or paint.
bool visibleFlag(const json& j) {
    auto it = j.find("visible");
    return !(it != j.end() && it->is_boolean() && !it->get<bool>());
}

std::optional<SnapshotColor> readColor(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return std::nullopt;
    SnapshotColor c;
    c.r = optFloat(*it, "r");
    c.g = optFloat(*it, "g");
    c.b = optFloat(*it, "b");
    c.a = optFloat(*it, "a");
    return c;
}

std::optional<HandlePosition> readHandle(const json& j) {
    if (!j.is_object()) return std::nullopt;
    HandlePosition h;
    h.x = optFloat(j, "x");
    h.y = optFloat(j, "y");
    return h;
}

SnapshotPaint readPaint(const json& j) {
    SnapshotPaint p;
    p.type = str(j, "type");
    p.visible = visibleFlag(j);
    p.opacity = optFloat(j, "opacity");
    p.color = readColor(j, "color");
    p.imageRef = str(j, "imageRef");

    auto stops = j.find("gradientStops");
    if (stops != j.end() && stops->is_array()) {
        for (const auto& s : *stops) {
            if (!s.is_object()) continue;
            GradientStop gs;
            gs.position = optFloat(s, "position");
            gs.color = readColor(s, "color");
            p.gradientStops.push_back(gs);
        }
    }
    auto handles = j.find("gradientHandlePositions");
    if (handles != j.end() && handles->is_array()) {
        for (const auto& h : *handles) {
            p.gradientHandlePositions.push_back(readHandle(h).value_or(HandlePosition{}));
        }
    }
    return p;
}

std::optional<std::vector<SnapshotPaint>> readPaints(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return std::nullopt;
    std::vector<SnapshotPaint> out;
    for (const auto& p : *it) {
        if (p.is_object()) out.push_back(readPaint(p));
    }
    return out;
}

std::optional<std::vector<SnapshotEffect>> readEffects(const json& j) {
    auto it = j.find("effects");
    if (it == j.end() || !it->is_array()) return std::nullopt;
    std::vector<SnapshotEffect> out;
    for (const auto& e : *it) {
        if (!e.is_object()) continue;
        SnapshotEffect effect;
        effect.type = str(e, "type");
        effect.visible = visibleFlag(e);
        effect.color = readColor(e, "color");
        auto offset = e.find("offset");
        if (offset != e.end()) effect.offset = readHandle(*offset);
        effect.radius = optFloat(e, "radius");
        effect.spread = optFloat(e, "spread");
        effect.blendMode = str(e, "blendMode");
        out.push_back(effect);
    }
    return out;
}

std::optional<SnapshotTextStyle> readStyle(const json& j) {
    auto it = j.find("style");
    if (it == j.end() || !it->is_object()) return std::nullopt;
    const json& s = *it;
    SnapshotTextStyle style;
    style.fontFamily = optString(s, "fontFamily");
    style.fontWeight = optFloat(s, "fontWeight");
    style.fontSize = optFloat(s, "fontSize");
    style.textAlignHorizontal = str(s, "textAlignHorizontal");
    style.textAlignVertical = str(s, "textAlignVertical");
    style.lineHeightPx = optFloat(s, "lineHeightPx");
    style.lineHeightPercent = optFloat(s, "lineHeightPercent");
    style.letterSpacing = optFloat(s, "letterSpacing");
    style.textDecoration = str(s, "textDecoration");
    style.textCase = str(s, "textCase");
    style.textAutoResize = str(s, "textAutoResize");
    return style;
}

void readPropertyDefinitions(const json& j, std::vector<ComponentPropertyDefinition>& out) {
    auto it = j.find("componentPropertyDefinitions");
    if (it == j.end() || !it->is_object()) return;
    for (const auto& [name, def] : it->items()) {
        if (!def.is_object()) continue;
        ComponentPropertyDefinition d;
        d.name = name;
        d.type = str(def, "type");
        auto value = def.find("defaultValue");
        if (value != def.end()) {
            if (value->is_boolean()) d.defaultValue = value->get<bool>() ? "true" : "false";
            else if (value->is_string()) d.defaultValue = value->get<std::string>();
        }
        auto options = def.find("variantOptions");
        if (options != def.end() && options->is_array()) {
            for (const auto& o : *options) {
                if (o.is_string()) d.variantOptions.push_back(o.get<std::string>());
            }
        }
        out.push_back(std::move(d));
    }
}

void readNode(const json& j, SnapshotNode& node) {
    node.typeName = str(j, "type");
    node.kind = parseNodeKind(node.typeName);
    node.name = str(j, "name");
    node.visible = visibleFlag(j);
    node.opacity = optFloat(j, "opacity");
    node.blendMode = str(j, "blendMode");

    auto bb = j.find("absoluteBoundingBox");
    if (bb != j.end() && bb->is_object()) {
        const auto w = optFloat(*bb, "width");
        const auto h = optFloat(*bb, "height");
        // A box without both extents cannot size the node.
        if (w && h) {
            node.absoluteBoundingBox = BoundingBox{
                optFloat(*bb, "x").value_or(0.0f), optFloat(*bb, "y").value_or(0.0f), *w, *h};
        }
    }
    auto size = j.find("size");
    if (size != j.end() && size->is_object()) {
        node.size = Vec2{optFloat(*size, "x").value_or(0.0f), optFloat(*size, "y").value_or(0.0f)};
    }

    node.fills = readPaints(j, "fills");
    node.strokes = readPaints(j, "strokes");
    node.strokeWeight = optFloat(j, "strokeWeight");
    node.strokeAlign = str(j, "strokeAlign");
    node.effects = readEffects(j);

    auto clips = j.find("clipsContent");
    if (clips != j.end() && clips->is_boolean()) node.clipsContent = clips->get<bool>();

    node.cornerRadius = optFloat(j, "cornerRadius");
    node.topLeftRadius = optFloat(j, "topLeftRadius");
    node.topRightRadius = optFloat(j, "topRightRadius");
    node.bottomLeftRadius = optFloat(j, "bottomLeftRadius");
    node.bottomRightRadius = optFloat(j, "bottomRightRadius");

    node.layoutMode = str(j, "layoutMode");
    node.paddingTop = optFloat(j, "paddingTop");
    node.paddingRight = optFloat(j, "paddingRight");
    node.paddingBottom = optFloat(j, "paddingBottom");
    node.paddingLeft = optFloat(j, "paddingLeft");
    node.itemSpacing = optFloat(j, "itemSpacing");
    node.counterAxisSpacing = optFloat(j, "counterAxisSpacing");
    node.primaryAxisSizingMode = str(j, "primaryAxisSizingMode");
    node.counterAxisSizingMode = str(j, "counterAxisSizingMode");
    node.primaryAxisAlignItems = str(j, "primaryAxisAlignItems");
    node.counterAxisAlignItems = str(j, "counterAxisAlignItems");

    node.layoutAlign = str(j, "layoutAlign");
    node.layoutGrow = optFloat(j, "layoutGrow");
    node.layoutSizingHorizontal = str(j, "layoutSizingHorizontal");
    node.layoutSizingVertical = str(j, "layoutSizingVertical");

    auto chars = j.find("characters");
    if (chars != j.end()) {
        if (chars->is_string()) node.characters = chars->get<std::string>();
        else if (chars->is_number()) node.characters = chars->dump();
    }
    node.style = readStyle(j);

    readPropertyDefinitions(j, node.componentPropertyDefinitions);
    node.svgData = optString(j, "_svgData");

    auto children = j.find("children");
    if (children != j.end() && children->is_array()) {
        node.children.reserve(children->size());
        for (const auto& c : *children) {
            SnapshotNode child;
            // Non-object entries become typeless nodes, which are skipped when built.
            if (c.is_object()) readNode(c, child);
            node.children.push_back(std::move(child));
        }
    }
}

// =============================================================================
// Encoding helpers
// =============================================================================

void put(json& j, const char* key, const std::optional<float>& v) {
    if (v) j[key] = *v;
}

void put(json& j, const char* key, const std::string& v) {
    if (!v.empty()) j[key] = v;
}

json writeColor(const SnapshotColor& c) {
    json j = json::object();
    put(j, "r", c.r);
    put(j, "g", c.g);
    put(j, "b", c.b);
    put(j, "a", c.a);
    return j;
}

json writeHandle(const HandlePosition& h) {
    json j = json::object();
    put(j, "x", h.x);
    put(j, "y", h.y);
    return j;
}

json writePaints(const std::vector<SnapshotPaint>& paints) {
    json arr = json::array();
    for (const SnapshotPaint& p : paints) {
        json j;
        j["type"] = p.type;
        if (!p.visible) j["visible"] = false;
        put(j, "opacity", p.opacity);
        if (p.color) j["color"] = writeColor(*p.color);
        if (!p.gradientStops.empty()) {
            json stops = json::array();
            for (const GradientStop& s : p.gradientStops) {
                json stop = json::object();
                put(stop, "position", s.position);
                if (s.color) stop["color"] = writeColor(*s.color);
                stops.push_back(std::move(stop));
            }
            j["gradientStops"] = std::move(stops);
        }
        if (!p.gradientHandlePositions.empty()) {
            json handles = json::array();
            for (const HandlePosition& h : p.gradientHandlePositions) handles.push_back(writeHandle(h));
            j["gradientHandlePositions"] = std::move(handles);
        }
        put(j, "imageRef", p.imageRef);
        arr.push_back(std::move(j));
    }
    return arr;
}

json writeEffects(const std::vector<SnapshotEffect>& effects) {
    json arr = json::array();
    for (const SnapshotEffect& e : effects) {
        json j;
        j["type"] = e.type;
        if (!e.visible) j["visible"] = false;
        if (e.color) j["color"] = writeColor(*e.color);
        if (e.offset) j["offset"] = writeHandle(*e.offset);
        put(j, "radius", e.radius);
        put(j, "spread", e.spread);
        put(j, "blendMode", e.blendMode);
        arr.push_back(std::move(j));
    }
    return arr;
}

json writeNode(const SnapshotNode& node) {
    json j;
    put(j, "type", node.typeName);
    put(j, "name", node.name);
    if (!node.visible) j["visible"] = false;
    put(j, "opacity", node.opacity);
    put(j, "blendMode", node.blendMode);

    if (node.absoluteBoundingBox) {
        const BoundingBox& bb = *node.absoluteBoundingBox;
        j["absoluteBoundingBox"] = {{"x", bb.x}, {"y", bb.y}, {"width", bb.width}, {"height", bb.height}};
    }
    if (node.size) j["size"] = {{"x", node.size->x}, {"y", node.size->y}};

    if (node.fills) j["fills"] = writePaints(*node.fills);
    if (node.strokes) j["strokes"] = writePaints(*node.strokes);
    put(j, "strokeWeight", node.strokeWeight);
    put(j, "strokeAlign", node.strokeAlign);
    if (node.effects) j["effects"] = writeEffects(*node.effects);
    if (node.clipsContent) j["clipsContent"] = *node.clipsContent;

    put(j, "cornerRadius", node.cornerRadius);
    put(j, "topLeftRadius", node.topLeftRadius);
    put(j, "topRightRadius", node.topRightRadius);
    put(j, "bottomLeftRadius", node.bottomLeftRadius);
    put(j, "bottomRightRadius", node.bottomRightRadius);

    put(j, "layoutMode", node.layoutMode);
    put(j, "paddingTop", node.paddingTop);
    put(j, "paddingRight", node.paddingRight);
    put(j, "paddingBottom", node.paddingBottom);
    put(j, "paddingLeft", node.paddingLeft);
    put(j, "itemSpacing", node.itemSpacing);
    put(j, "counterAxisSpacing", node.counterAxisSpacing);
    put(j, "primaryAxisSizingMode", node.primaryAxisSizingMode);
    put(j, "counterAxisSizingMode", node.counterAxisSizingMode);
    put(j, "primaryAxisAlignItems", node.primaryAxisAlignItems);
    put(j, "counterAxisAlignItems", node.counterAxisAlignItems);

    put(j, "layoutAlign", node.layoutAlign);
    put(j, "layoutGrow", node.layoutGrow);
    put(j, "layoutSizingHorizontal", node.layoutSizingHorizontal);
    put(j, "layoutSizingVertical", node.layoutSizingVertical);

    if (node.characters) j["characters"] = *node.characters;
    if (node.style) {
        const SnapshotTextStyle& s = *node.style;
        json style = json::object();
        if (s.fontFamily) style["fontFamily"] = *s.fontFamily;
        put(style, "fontWeight", s.fontWeight);
        put(style, "fontSize", s.fontSize);
        put(style, "textAlignHorizontal", s.textAlignHorizontal);
        put(style, "textAlignVertical", s.textAlignVertical);
        put(style, "lineHeightPx", s.lineHeightPx);
        put(style, "lineHeightPercent", s.lineHeightPercent);
        put(style, "letterSpacing", s.letterSpacing);
        put(style, "textDecoration", s.textDecoration);
        put(style, "textCase", s.textCase);
        put(style, "textAutoResize", s.textAutoResize);
        j["style"] = std::move(style);
    }

    if (!node.componentPropertyDefinitions.empty()) {
        json defs = json::object();
        for (const ComponentPropertyDefinition& d : node.componentPropertyDefinitions) {
            json def;
            def["type"] = d.type;
            if (d.type == "BOOLEAN") def["defaultValue"] = (d.defaultValue == "true");
            else def["defaultValue"] = d.defaultValue;
            if (!d.variantOptions.empty()) def["variantOptions"] = d.variantOptions;
            defs[d.name] = std::move(def);
        }
        j["componentPropertyDefinitions"] = std::move(defs);
    }
    if (node.svgData) j["_svgData"] = *node.svgData;

    if (!node.children.empty()) {
        json children = json::array();
        for (const SnapshotNode& c : node.children) children.push_back(writeNode(c));
        j["children"] = std::move(children);
    }
    return j;
}

} // namespace

const char* toString(SnapshotError error) {
    switch (error) {
        case SnapshotError::Ok: return "ok";
        case SnapshotError::InvalidJson: return "invalid JSON";
        case SnapshotError::MissingDocument: return "missing document";
        case SnapshotError::InvalidNode: return "invalid document node";
    }
    return "unknown";
}

SnapshotError parseSnapshotJson(std::string_view text, SnapshotDocument& out) {
    out = SnapshotDocument{};

    const json root = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded() || !root.is_object()) {
        RESTORE_LOG_WARN("snapshot: input is not a JSON object");
        return SnapshotError::InvalidJson;
    }

    out.name = str(root, "name");

    auto doc = root.find("document");
    if (doc == root.end() || doc->is_null()) {
        return SnapshotError::MissingDocument;
    }
    if (!doc->is_object()) {
        return SnapshotError::InvalidNode;
    }

    SnapshotNode node;
    readNode(*doc, node);
    out.document = std::move(node);
    return SnapshotError::Ok;
}

std::string buildSnapshotJson(const SnapshotDocument& doc, int indent) {
    json root = json::object();
    put(root, "name", doc.name);
    if (doc.document) root["document"] = writeNode(*doc.document);
    return root.dump(indent);
}

} // namespace restore
