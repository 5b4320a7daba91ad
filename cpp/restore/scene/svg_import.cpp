#include "restore/scene/svg_import.h"
#include "restore/core/logging.h"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <memory>

namespace restore {

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

bool nameIs(const xmlNode* node, const char* name) {
    return node->name && xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

std::optional<std::string> attribute(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return std::nullopt;
    std::string out(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return out;
}

// Leading number of a length ("24", "24px", "1.5e2"). Units are ignored.
std::optional<float> numberAttribute(const xmlNode* node, const char* name) {
    const auto raw = attribute(node, name);
    if (!raw || raw->empty()) return std::nullopt;
    char* end = nullptr;
    const float v = std::strtof(raw->c_str(), &end);
    if (end == raw->c_str()) return std::nullopt;
    return v;
}

float numberOr(const xmlNode* node, const char* name, float fallback) {
    return numberAttribute(node, name).value_or(fallback);
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// viewBox="minX minY width height"
bool parseViewBox(const std::string& raw, float& width, float& height) {
    float values[4] = {0.0f, 0.0f, 0.0f, 0.0f};
    const char* p = raw.c_str();
    for (int i = 0; i < 4; ++i) {
        while (*p == ' ' || *p == ',') ++p;
        char* end = nullptr;
        values[i] = std::strtof(p, &end);
        if (end == p) return false;
        p = end;
    }
    width = values[2];
    height = values[3];
    return width > 0.0f && height > 0.0f;
}

BoundingBox pointListBounds(const std::string& points, const BoundingBox& fallback) {
    std::vector<float> coords;
    const char* p = points.c_str();
    while (*p) {
        while (*p == ' ' || *p == ',' || *p == '\n' || *p == '\t') ++p;
        if (!*p) break;
        char* end = nullptr;
        const float v = std::strtof(p, &end);
        if (end == p) break;
        coords.push_back(v);
        p = end;
    }
    if (coords.size() < 2) return fallback;
    float minX = coords[0], maxX = coords[0];
    float minY = coords[1], maxY = coords[1];
    for (std::size_t i = 0; i + 1 < coords.size(); i += 2) {
        minX = std::min(minX, coords[i]);
        maxX = std::max(maxX, coords[i]);
        minY = std::min(minY, coords[i + 1]);
        maxY = std::max(maxY, coords[i + 1]);
    }
    return BoundingBox{minX, minY, maxX - minX, maxY - minY};
}

void collectShapes(const xmlNode* parent, const BoundingBox& canvas, std::vector<SvgShape>& out) {
    for (const xmlNode* node = parent->children; node; node = node->next) {
        if (node->type != XML_ELEMENT_NODE) continue;

        if (nameIs(node, "g")) {
            collectShapes(node, canvas, out);
            continue;
        }

        SvgShape shape{};
        shape.element = reinterpret_cast<const char*>(node->name);
        shape.id = attribute(node, "id").value_or("");
        shape.bounds = canvas;

        if (nameIs(node, "path")) {
            shape.pathData = attribute(node, "d").value_or("");
        } else if (nameIs(node, "rect")) {
            shape.bounds = BoundingBox{
                numberOr(node, "x", 0.0f), numberOr(node, "y", 0.0f),
                numberOr(node, "width", 0.0f), numberOr(node, "height", 0.0f)};
        } else if (nameIs(node, "circle")) {
            const float r = numberOr(node, "r", 0.0f);
            shape.bounds = BoundingBox{
                numberOr(node, "cx", 0.0f) - r, numberOr(node, "cy", 0.0f) - r, 2.0f * r, 2.0f * r};
        } else if (nameIs(node, "ellipse")) {
            const float rx = numberOr(node, "rx", 0.0f);
            const float ry = numberOr(node, "ry", 0.0f);
            shape.bounds = BoundingBox{
                numberOr(node, "cx", 0.0f) - rx, numberOr(node, "cy", 0.0f) - ry, 2.0f * rx, 2.0f * ry};
        } else if (nameIs(node, "line")) {
            const float x1 = numberOr(node, "x1", 0.0f);
            const float y1 = numberOr(node, "y1", 0.0f);
            const float x2 = numberOr(node, "x2", 0.0f);
            const float y2 = numberOr(node, "y2", 0.0f);
            shape.bounds = BoundingBox{
                std::min(x1, x2), std::min(y1, y2), std::abs(x2 - x1), std::abs(y2 - y1)};
        } else if (nameIs(node, "polygon") || nameIs(node, "polyline")) {
            shape.pathData = attribute(node, "points").value_or("");
            shape.bounds = pointListBounds(shape.pathData, canvas);
        } else {
            // defs, clipPath, title, ... carry no drawable geometry of their own
            continue;
        }

        if (const auto fill = attribute(node, "fill")) {
            shape.fillNone = *fill == "none";
            shape.fill = parseSvgColor(*fill);
        }
        if (const auto stroke = attribute(node, "stroke")) {
            shape.strokeNone = *stroke == "none";
            shape.stroke = parseSvgColor(*stroke);
        }
        shape.strokeWidth = numberAttribute(node, "stroke-width");
        out.push_back(std::move(shape));
    }
}

} // namespace

std::optional<Color> parseSvgColor(std::string_view value) {
    if (value.size() != 4 && value.size() != 7) return std::nullopt;
    if (value[0] != '#') return std::nullopt;

    int channels[3] = {0, 0, 0};
    const bool shortForm = value.size() == 4;
    for (int i = 0; i < 3; ++i) {
        if (shortForm) {
            const int d = hexDigit(value[1 + i]);
            if (d < 0) return std::nullopt;
            channels[i] = d * 17;
        } else {
            const int hi = hexDigit(value[1 + 2 * i]);
            const int lo = hexDigit(value[2 + 2 * i]);
            if (hi < 0 || lo < 0) return std::nullopt;
            channels[i] = hi * 16 + lo;
        }
    }
    constexpr float kByteScale = 1.0f / 255.0f;
    return Color{channels[0] * kByteScale, channels[1] * kByteScale, channels[2] * kByteScale, 1.0f};
}

std::optional<SvgImage> parseSvgMarkup(std::string_view markup) {
    if (markup.empty()) return std::nullopt;

    XmlDocPtr doc(xmlReadMemory(
        markup.data(),
        static_cast<int>(markup.size()),
        "inline.svg",
        nullptr,
        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        RESTORE_LOG_WARN("svg import: markup is not well-formed");
        return std::nullopt;
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root || !nameIs(root, "svg")) {
        RESTORE_LOG_WARN("svg import: root element is not <svg>");
        return std::nullopt;
    }

    SvgImage image{};
    image.width = numberOr(root, "width", 0.0f);
    image.height = numberOr(root, "height", 0.0f);
    if (image.width <= 0.0f || image.height <= 0.0f) {
        float vbWidth = 0.0f;
        float vbHeight = 0.0f;
        const auto viewBox = attribute(root, "viewBox");
        if (viewBox && parseViewBox(*viewBox, vbWidth, vbHeight)) {
            image.width = vbWidth;
            image.height = vbHeight;
        }
    }
    image.width = std::max(1.0f, image.width);
    image.height = std::max(1.0f, image.height);

    collectShapes(root, BoundingBox{0.0f, 0.0f, image.width, image.height}, image.shapes);
    return image;
}

} // namespace restore
