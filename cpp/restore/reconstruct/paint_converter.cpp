#include "restore/reconstruct/paint_converter.h"
#include "restore/reconstruct/geometry.h"

namespace restore {

namespace {
    Color channels(const std::optional<SnapshotColor>& c, float defaultAlpha) {
        if (!c) return Color{0.0f, 0.0f, 0.0f, defaultAlpha};
        return Color{c->r.value_or(0.0f), c->g.value_or(0.0f), c->b.value_or(0.0f), c->a.value_or(1.0f)};
    }
} // namespace

std::optional<Paint> convertPaint(const SnapshotPaint& src) {
    const auto type = parsePaintType(src.type);
    if (!type || *type == PaintType::Image) {
        return std::nullopt;
    }

    Paint paint{};
    paint.type = *type;
    paint.visible = src.visible;
    paint.opacity = src.opacity.value_or(1.0f);
    paint.gradientTransform = identityTransform();

    if (*type == PaintType::Solid) {
        paint.color = channels(src.color, 1.0f);
        paint.color.a = 1.0f;
        return paint;
    }

    if (src.gradientStops.empty()) {
        return std::nullopt;
    }
    paint.color = Color{0.0f, 0.0f, 0.0f, 1.0f};
    paint.gradientStops.reserve(src.gradientStops.size());
    for (const GradientStop& stop : src.gradientStops) {
        paint.gradientStops.push_back(ColorStop{stop.position.value_or(0.0f), channels(stop.color, 1.0f)});
    }
    paint.gradientTransform = computeGradientTransform(src.gradientHandlePositions);
    return paint;
}

std::vector<Paint> convertPaints(const std::vector<SnapshotPaint>& paints) {
    std::vector<Paint> out;
    out.reserve(paints.size());
    for (const SnapshotPaint& p : paints) {
        if (!p.visible) continue;
        if (auto converted = convertPaint(p)) {
            out.push_back(std::move(*converted));
        }
    }
    return out;
}

bool containsImagePaint(const std::vector<SnapshotPaint>& paints) {
    for (const SnapshotPaint& p : paints) {
        if (p.visible && p.type == "IMAGE") return true;
    }
    return false;
}

std::optional<Effect> convertEffect(const SnapshotEffect& src) {
    const auto type = parseEffectType(src.type);
    if (!type) {
        return std::nullopt;
    }

    Effect effect{};
    effect.type = *type;
    effect.visible = src.visible;
    effect.radius = src.radius.value_or(kDefaultEffectRadius);
    effect.blendMode = BlendMode::Normal;

    switch (*type) {
        case EffectType::DropShadow:
        case EffectType::InnerShadow: {
            effect.color = channels(src.color, kDefaultShadowAlpha);
            const std::optional<HandlePosition>& off = src.offset;
            effect.offset.x = off ? off->x.value_or(kDefaultShadowOffsetX) : kDefaultShadowOffsetX;
            effect.offset.y = off ? off->y.value_or(kDefaultShadowOffsetY) : kDefaultShadowOffsetY;
            effect.spread = src.spread.value_or(kDefaultShadowSpread);
            if (auto blend = parseBlendMode(src.blendMode)) effect.blendMode = *blend;
            break;
        }
        case EffectType::LayerBlur:
        case EffectType::BackgroundBlur:
            effect.color = Color{0.0f, 0.0f, 0.0f, 0.0f};
            effect.offset = Vec2{0.0f, 0.0f};
            effect.spread = 0.0f;
            break;
    }
    return effect;
}

std::vector<Effect> convertEffects(const std::vector<SnapshotEffect>& effects) {
    std::vector<Effect> out;
    out.reserve(effects.size());
    for (const SnapshotEffect& e : effects) {
        if (!e.visible) continue;
        if (auto converted = convertEffect(e)) {
            out.push_back(*converted);
        }
    }
    return out;
}

} // namespace restore
