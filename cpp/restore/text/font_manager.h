#ifndef RESTORE_TEXT_FONT_MANAGER_H
#define RESTORE_TEXT_FONT_MANAGER_H

#include "restore/text/font_service.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace restore::text {

/**
 * FontHandle: a registered face with its FreeType face and HarfBuzz font.
 */
struct FontHandle {
    std::uint32_t id;
    FontName name;

    FT_Face ftFace;
    hb_font_t* hbFont;
    float unitsPerEM;

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: native FontService backed by FreeType and HarfBuzz.
 *
 * Faces are registered from TTF/OTF data and addressed by (family, style).
 * Registration makes a font available; loadFontAsync() marks it loaded so
 * text nodes may use it. Measurement shapes with HarfBuzz at the requested
 * size.
 */
class FontManager : public FontService {
public:
    FontManager();
    ~FontManager() override;

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize the font system. Must be called before any other operations.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Shutdown and cleanup all resources.
     */
    void shutdown();

    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * Register a font from memory.
     * @param fontData Raw TTF/OTF data (copied and owned by FontManager)
     * @param dataSize Size of font data in bytes
     * @param family Family override; the face's family name when empty
     * @param style Style override; the face's style name when empty
     * @return Font ID, or 0 on failure or duplicate (family, style)
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& family = "",
        const std::string& style = ""
    );

    /**
     * Register a font from a file path.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(
        const std::string& filePath,
        const std::string& family = "",
        const std::string& style = ""
    );

    bool unloadFont(std::uint32_t fontId);

    /**
     * Font ID registered for (family, style), or 0.
     */
    std::uint32_t findFont(const FontName& font) const;
    const FontHandle* getFont(std::uint32_t fontId) const;
    std::vector<FontName> getRegisteredFonts() const;

    // =========================================================================
    // FontService
    // =========================================================================

    std::future<bool> loadFontAsync(const FontName& font) override;
    bool isFontLoaded(const FontName& font) const override;
    std::optional<float> measureTextWidth(
        const FontName& font,
        std::string_view text,
        float fontSize,
        float letterSpacing) const override;

private:
    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    std::unordered_set<std::uint32_t> loaded_;
    std::uint32_t nextFontId_ = 1;

    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData,
        FontName name
    );
    void destroyHandle(FontHandle& handle);
    float shapeLineWidth(const FontHandle& handle, std::string_view line, float fontSize, float letterSpacing) const;
};

} // namespace restore::text

#endif // RESTORE_TEXT_FONT_MANAGER_H
