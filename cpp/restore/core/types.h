#ifndef RESTORE_CORE_TYPES_H
#define RESTORE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by the reconstruction engine and the
// reference scene host.

namespace restore {

// Cooperative scheduling
static constexpr std::uint32_t kYieldInterval = 10; // nodes processed between host yields

// Variant group layout
static constexpr float kVariantSetInset = 16.0f;
static constexpr float kVariantDefaultItemSpacing = 20.0f;

// Fonts
static constexpr const char* kDefaultFontFamily = "Inter";
static constexpr float kDefaultFontWeight = 400.0f;
static constexpr const char* kFallbackFontFamily = "Inter";
static constexpr const char* kFallbackFontStyle = "Regular";

// Effect defaults substituted for missing numeric fields
static constexpr float kDefaultShadowOffsetX = 0.0f;
static constexpr float kDefaultShadowOffsetY = 4.0f;
static constexpr float kDefaultEffectRadius = 4.0f;
static constexpr float kDefaultShadowSpread = 0.0f;
static constexpr float kDefaultShadowAlpha = 0.25f;

// Progress milestones (percent)
static constexpr float kProgressStart = 5.0f;
static constexpr float kProgressBuildEnd = 95.0f;
static constexpr float kProgressDone = 100.0f;

using NodeId = std::uint32_t;
static constexpr NodeId kInvalidNodeId = 0;

struct Vec2 { float x; float y; };

struct BoundingBox {
    float x;
    float y;
    float width;
    float height;
};

struct Color {
    float r, g, b, a;
};

// Row-major 2x3 affine matrix: [[a, b, tx], [c, d, ty]].
struct Transform2D {
    float m[2][3];
};

inline Transform2D identityTransform() {
    return Transform2D{{{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}}};
}

} // namespace restore

#endif // RESTORE_CORE_TYPES_H
