#ifndef RESTORE_SCENE_ENUMS_H
#define RESTORE_SCENE_ENUMS_H

#include <cstdint>
#include <optional>
#include <string_view>

// Enumerated host properties and their legal serialized names.
// parse* returns std::nullopt for any value outside the legal set; callers
// skip the assignment in that case.

namespace restore {

enum class BlendMode : std::uint8_t {
    PassThrough, Normal, Darken, Multiply, LinearBurn, ColorBurn, Lighten, Screen,
    LinearDodge, ColorDodge, Overlay, SoftLight, HardLight, Difference, Exclusion,
    Hue, Saturation, Color, Luminosity,
};

enum class StrokeAlign : std::uint8_t { Inside, Outside, Center };

enum class LayoutMode : std::uint8_t { None, Horizontal, Vertical };

enum class AxisSizingMode : std::uint8_t { Fixed, Auto };

enum class PrimaryAxisAlign : std::uint8_t { Min, Center, Max, SpaceBetween };

enum class CounterAxisAlign : std::uint8_t { Min, Center, Max, Baseline };

enum class LayoutAlign : std::uint8_t { Min, Center, Max, Stretch, Inherit };

enum class LayoutSizing : std::uint8_t { Fixed, Hug, Fill };

enum class TextAlignHorizontal : std::uint8_t { Left, Center, Right, Justified };

enum class TextAlignVertical : std::uint8_t { Top, Center, Bottom };

enum class TextDecoration : std::uint8_t { None, Underline, Strikethrough };

enum class TextCase : std::uint8_t { Original, Upper, Lower, Title, SmallCaps, SmallCapsForced };

enum class TextAutoResize : std::uint8_t { None, WidthAndHeight, Height, Truncate };

enum class LineHeightUnit : std::uint8_t { Auto, Pixels, Percent };

enum class PaintType : std::uint8_t {
    Solid, GradientLinear, GradientRadial, GradientAngular, GradientDiamond, Image,
};

enum class EffectType : std::uint8_t { DropShadow, InnerShadow, LayerBlur, BackgroundBlur };

enum class ComponentPropertyType : std::uint8_t { Boolean, Text, InstanceSwap, Variant };

std::optional<BlendMode> parseBlendMode(std::string_view s);
std::optional<StrokeAlign> parseStrokeAlign(std::string_view s);
std::optional<LayoutMode> parseLayoutMode(std::string_view s);
std::optional<AxisSizingMode> parseAxisSizingMode(std::string_view s);
std::optional<PrimaryAxisAlign> parsePrimaryAxisAlign(std::string_view s);
std::optional<CounterAxisAlign> parseCounterAxisAlign(std::string_view s);
std::optional<LayoutAlign> parseLayoutAlign(std::string_view s);
std::optional<LayoutSizing> parseLayoutSizing(std::string_view s);
std::optional<TextAlignHorizontal> parseTextAlignHorizontal(std::string_view s);
std::optional<TextAlignVertical> parseTextAlignVertical(std::string_view s);
std::optional<TextDecoration> parseTextDecoration(std::string_view s);
std::optional<TextCase> parseTextCase(std::string_view s);
std::optional<TextAutoResize> parseTextAutoResize(std::string_view s);
std::optional<PaintType> parsePaintType(std::string_view s);
std::optional<EffectType> parseEffectType(std::string_view s);
std::optional<ComponentPropertyType> parseComponentPropertyType(std::string_view s);

const char* toString(BlendMode v);
const char* toString(StrokeAlign v);
const char* toString(LayoutMode v);
const char* toString(AxisSizingMode v);
const char* toString(PrimaryAxisAlign v);
const char* toString(CounterAxisAlign v);
const char* toString(LayoutAlign v);
const char* toString(LayoutSizing v);
const char* toString(TextAlignHorizontal v);
const char* toString(TextAlignVertical v);
const char* toString(TextDecoration v);
const char* toString(TextCase v);
const char* toString(TextAutoResize v);
const char* toString(PaintType v);
const char* toString(EffectType v);
const char* toString(ComponentPropertyType v);

} // namespace restore

#endif // RESTORE_SCENE_ENUMS_H
