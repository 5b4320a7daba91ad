#include "restore/reconstruct/geometry.h"

#include <algorithm>
#include <cmath>

namespace restore {

const char* mapWeightToStyle(float weight) {
    if (weight <= 100.0f) return "Thin";
    if (weight <= 200.0f) return "ExtraLight";
    if (weight <= 300.0f) return "Light";
    if (weight <= 400.0f) return "Regular";
    if (weight <= 500.0f) return "Medium";
    if (weight <= 600.0f) return "SemiBold";
    if (weight <= 700.0f) return "Bold";
    if (weight <= 800.0f) return "ExtraBold";
    return "Black";
}

float mapStyleToWeight(std::string_view style) {
    if (style == "Thin") return 100.0f;
    if (style == "ExtraLight") return 200.0f;
    if (style == "Light") return 300.0f;
    if (style == "Medium") return 500.0f;
    if (style == "SemiBold") return 600.0f;
    if (style == "Bold") return 700.0f;
    if (style == "ExtraBold") return 800.0f;
    if (style == "Black") return 900.0f;
    return 400.0f;
}

Vec2 computeRelativePosition(const SnapshotNode& child, const SnapshotNode& parent) {
    if (!child.absoluteBoundingBox || !parent.absoluteBoundingBox) {
        return Vec2{0.0f, 0.0f};
    }
    return Vec2{
        child.absoluteBoundingBox->x - parent.absoluteBoundingBox->x,
        child.absoluteBoundingBox->y - parent.absoluteBoundingBox->y,
    };
}

Transform2D computeGradientTransform(const std::vector<HandlePosition>& handles) {
    if (handles.size() < 2) {
        return identityTransform();
    }
    const float x0 = handles[0].x.value_or(0.0f);
    const float y0 = handles[0].y.value_or(0.0f);
    const float dx = handles[1].x.value_or(1.0f) - x0;
    const float dy = handles[1].y.value_or(0.0f) - y0;

    float len = std::sqrt(dx * dx + dy * dy);
    if (len == 0.0f) len = 1.0f;
    const float c = dx / len;
    const float s = dy / len;
    return Transform2D{{{c, s, x0}, {-s, c, y0}}};
}

bool snapshotSize(const SnapshotNode& node, float& width, float& height) {
    if (node.absoluteBoundingBox) {
        width = std::max(1.0f, node.absoluteBoundingBox->width);
        height = std::max(1.0f, node.absoluteBoundingBox->height);
        return true;
    }
    if (node.size) {
        // A zero declared extent falls back to 1.
        width = std::max(1.0f, node.size->x != 0.0f ? node.size->x : 1.0f);
        height = std::max(1.0f, node.size->y != 0.0f ? node.size->y : 1.0f);
        return true;
    }
    return false;
}

} // namespace restore
