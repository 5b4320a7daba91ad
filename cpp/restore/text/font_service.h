#ifndef RESTORE_TEXT_FONT_SERVICE_H
#define RESTORE_TEXT_FONT_SERVICE_H

#include <future>
#include <optional>
#include <string>
#include <string_view>

namespace restore {

struct FontName {
    std::string family;
    std::string style;
};

inline bool operator==(const FontName& a, const FontName& b) {
    return a.family == b.family && a.style == b.style;
}
inline bool operator!=(const FontName& a, const FontName& b) {
    return !(a == b);
}

/**
 * FontService: host font-loading collaborator.
 *
 * loadFontAsync() resolves to true once the font can be assigned to text
 * nodes, false if the host has no such font. Callers must wait on the result
 * before assigning characters that use the font.
 */
class FontService {
public:
    virtual ~FontService() = default;

    virtual std::future<bool> loadFontAsync(const FontName& font) = 0;
    virtual bool isFontLoaded(const FontName& font) const = 0;

    /**
     * Advance width of a single line of text, or nullopt when the service
     * cannot shape with this font.
     */
    virtual std::optional<float> measureTextWidth(
        const FontName& font,
        std::string_view text,
        float fontSize,
        float letterSpacing) const {
        (void)font;
        (void)text;
        (void)fontSize;
        (void)letterSpacing;
        return std::nullopt;
    }
};

} // namespace restore

#endif // RESTORE_TEXT_FONT_SERVICE_H
