#include "restore/scene/scene_enums.h"

#include <cstddef>

namespace restore {

namespace {

template <typename E>
struct EnumName {
    E value;
    const char* name;
};

template <typename E, std::size_t N>
std::optional<E> lookup(const EnumName<E> (&table)[N], std::string_view s) {
    for (const auto& entry : table) {
        if (s == entry.name) return entry.value;
    }
    return std::nullopt;
}

template <typename E, std::size_t N>
const char* nameOf(const EnumName<E> (&table)[N], E v) {
    for (const auto& entry : table) {
        if (entry.value == v) return entry.name;
    }
    return "";
}

constexpr EnumName<BlendMode> kBlendModes[] = {
    {BlendMode::PassThrough, "PASS_THROUGH"},
    {BlendMode::Normal, "NORMAL"},
    {BlendMode::Darken, "DARKEN"},
    {BlendMode::Multiply, "MULTIPLY"},
    {BlendMode::LinearBurn, "LINEAR_BURN"},
    {BlendMode::ColorBurn, "COLOR_BURN"},
    {BlendMode::Lighten, "LIGHTEN"},
    {BlendMode::Screen, "SCREEN"},
    {BlendMode::LinearDodge, "LINEAR_DODGE"},
    {BlendMode::ColorDodge, "COLOR_DODGE"},
    {BlendMode::Overlay, "OVERLAY"},
    {BlendMode::SoftLight, "SOFT_LIGHT"},
    {BlendMode::HardLight, "HARD_LIGHT"},
    {BlendMode::Difference, "DIFFERENCE"},
    {BlendMode::Exclusion, "EXCLUSION"},
    {BlendMode::Hue, "HUE"},
    {BlendMode::Saturation, "SATURATION"},
    {BlendMode::Color, "COLOR"},
    {BlendMode::Luminosity, "LUMINOSITY"},
};

constexpr EnumName<StrokeAlign> kStrokeAligns[] = {
    {StrokeAlign::Inside, "INSIDE"},
    {StrokeAlign::Outside, "OUTSIDE"},
    {StrokeAlign::Center, "CENTER"},
};

constexpr EnumName<LayoutMode> kLayoutModes[] = {
    {LayoutMode::None, "NONE"},
    {LayoutMode::Horizontal, "HORIZONTAL"},
    {LayoutMode::Vertical, "VERTICAL"},
};

constexpr EnumName<AxisSizingMode> kAxisSizingModes[] = {
    {AxisSizingMode::Fixed, "FIXED"},
    {AxisSizingMode::Auto, "AUTO"},
};

constexpr EnumName<PrimaryAxisAlign> kPrimaryAxisAligns[] = {
    {PrimaryAxisAlign::Min, "MIN"},
    {PrimaryAxisAlign::Center, "CENTER"},
    {PrimaryAxisAlign::Max, "MAX"},
    {PrimaryAxisAlign::SpaceBetween, "SPACE_BETWEEN"},
};

constexpr EnumName<CounterAxisAlign> kCounterAxisAligns[] = {
    {CounterAxisAlign::Min, "MIN"},
    {CounterAxisAlign::Center, "CENTER"},
    {CounterAxisAlign::Max, "MAX"},
    {CounterAxisAlign::Baseline, "BASELINE"},
};

constexpr EnumName<LayoutAlign> kLayoutAligns[] = {
    {LayoutAlign::Min, "MIN"},
    {LayoutAlign::Center, "CENTER"},
    {LayoutAlign::Max, "MAX"},
    {LayoutAlign::Stretch, "STRETCH"},
    {LayoutAlign::Inherit, "INHERIT"},
};

constexpr EnumName<LayoutSizing> kLayoutSizings[] = {
    {LayoutSizing::Fixed, "FIXED"},
    {LayoutSizing::Hug, "HUG"},
    {LayoutSizing::Fill, "FILL"},
};

constexpr EnumName<TextAlignHorizontal> kTextAlignHorizontals[] = {
    {TextAlignHorizontal::Left, "LEFT"},
    {TextAlignHorizontal::Center, "CENTER"},
    {TextAlignHorizontal::Right, "RIGHT"},
    {TextAlignHorizontal::Justified, "JUSTIFIED"},
};

constexpr EnumName<TextAlignVertical> kTextAlignVerticals[] = {
    {TextAlignVertical::Top, "TOP"},
    {TextAlignVertical::Center, "CENTER"},
    {TextAlignVertical::Bottom, "BOTTOM"},
};

constexpr EnumName<TextDecoration> kTextDecorations[] = {
    {TextDecoration::None, "NONE"},
    {TextDecoration::Underline, "UNDERLINE"},
    {TextDecoration::Strikethrough, "STRIKETHROUGH"},
};

constexpr EnumName<TextCase> kTextCases[] = {
    {TextCase::Original, "ORIGINAL"},
    {TextCase::Upper, "UPPER"},
    {TextCase::Lower, "LOWER"},
    {TextCase::Title, "TITLE"},
    {TextCase::SmallCaps, "SMALL_CAPS"},
    {TextCase::SmallCapsForced, "SMALL_CAPS_FORCED"},
};

constexpr EnumName<TextAutoResize> kTextAutoResizes[] = {
    {TextAutoResize::None, "NONE"},
    {TextAutoResize::WidthAndHeight, "WIDTH_AND_HEIGHT"},
    {TextAutoResize::Height, "HEIGHT"},
    {TextAutoResize::Truncate, "TRUNCATE"},
};

constexpr EnumName<PaintType> kPaintTypes[] = {
    {PaintType::Solid, "SOLID"},
    {PaintType::GradientLinear, "GRADIENT_LINEAR"},
    {PaintType::GradientRadial, "GRADIENT_RADIAL"},
    {PaintType::GradientAngular, "GRADIENT_ANGULAR"},
    {PaintType::GradientDiamond, "GRADIENT_DIAMOND"},
    {PaintType::Image, "IMAGE"},
};

constexpr EnumName<EffectType> kEffectTypes[] = {
    {EffectType::DropShadow, "DROP_SHADOW"},
    {EffectType::InnerShadow, "INNER_SHADOW"},
    {EffectType::LayerBlur, "LAYER_BLUR"},
    {EffectType::BackgroundBlur, "BACKGROUND_BLUR"},
};

constexpr EnumName<ComponentPropertyType> kComponentPropertyTypes[] = {
    {ComponentPropertyType::Boolean, "BOOLEAN"},
    {ComponentPropertyType::Text, "TEXT"},
    {ComponentPropertyType::InstanceSwap, "INSTANCE_SWAP"},
    {ComponentPropertyType::Variant, "VARIANT"},
};

} // namespace

std::optional<BlendMode> parseBlendMode(std::string_view s) { return lookup(kBlendModes, s); }
std::optional<StrokeAlign> parseStrokeAlign(std::string_view s) { return lookup(kStrokeAligns, s); }
std::optional<LayoutMode> parseLayoutMode(std::string_view s) { return lookup(kLayoutModes, s); }
std::optional<AxisSizingMode> parseAxisSizingMode(std::string_view s) { return lookup(kAxisSizingModes, s); }
std::optional<PrimaryAxisAlign> parsePrimaryAxisAlign(std::string_view s) { return lookup(kPrimaryAxisAligns, s); }
std::optional<CounterAxisAlign> parseCounterAxisAlign(std::string_view s) { return lookup(kCounterAxisAligns, s); }
std::optional<LayoutAlign> parseLayoutAlign(std::string_view s) { return lookup(kLayoutAligns, s); }
std::optional<LayoutSizing> parseLayoutSizing(std::string_view s) { return lookup(kLayoutSizings, s); }
std::optional<TextAlignHorizontal> parseTextAlignHorizontal(std::string_view s) { return lookup(kTextAlignHorizontals, s); }
std::optional<TextAlignVertical> parseTextAlignVertical(std::string_view s) { return lookup(kTextAlignVerticals, s); }
std::optional<TextDecoration> parseTextDecoration(std::string_view s) { return lookup(kTextDecorations, s); }
std::optional<TextCase> parseTextCase(std::string_view s) { return lookup(kTextCases, s); }
std::optional<TextAutoResize> parseTextAutoResize(std::string_view s) { return lookup(kTextAutoResizes, s); }
std::optional<PaintType> parsePaintType(std::string_view s) { return lookup(kPaintTypes, s); }
std::optional<EffectType> parseEffectType(std::string_view s) { return lookup(kEffectTypes, s); }
std::optional<ComponentPropertyType> parseComponentPropertyType(std::string_view s) { return lookup(kComponentPropertyTypes, s); }

const char* toString(BlendMode v) { return nameOf(kBlendModes, v); }
const char* toString(StrokeAlign v) { return nameOf(kStrokeAligns, v); }
const char* toString(LayoutMode v) { return nameOf(kLayoutModes, v); }
const char* toString(AxisSizingMode v) { return nameOf(kAxisSizingModes, v); }
const char* toString(PrimaryAxisAlign v) { return nameOf(kPrimaryAxisAligns, v); }
const char* toString(CounterAxisAlign v) { return nameOf(kCounterAxisAligns, v); }
const char* toString(LayoutAlign v) { return nameOf(kLayoutAligns, v); }
const char* toString(LayoutSizing v) { return nameOf(kLayoutSizings, v); }
const char* toString(TextAlignHorizontal v) { return nameOf(kTextAlignHorizontals, v); }
const char* toString(TextAlignVertical v) { return nameOf(kTextAlignVerticals, v); }
const char* toString(TextDecoration v) { return nameOf(kTextDecorations, v); }
const char* toString(TextCase v) { return nameOf(kTextCases, v); }
const char* toString(TextAutoResize v) { return nameOf(kTextAutoResizes, v); }
const char* toString(PaintType v) { return nameOf(kPaintTypes, v); }
const char* toString(EffectType v) { return nameOf(kEffectTypes, v); }
const char* toString(ComponentPropertyType v) { return nameOf(kComponentPropertyTypes, v); }

} // namespace restore
