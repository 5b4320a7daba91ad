#include "restore/text/font_manager.h"
#include "restore/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <fstream>

namespace restore::text {

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        RESTORE_LOG_WARN("FreeType init failed (%d)", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& [id, handle] : fonts_) {
        if (handle) destroyHandle(*handle);
    }
    fonts_.clear();
    loaded_.clear();

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

void FontManager::destroyHandle(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& family,
    const std::string& style
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // FreeType reads from this buffer for the lifetime of the face
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,  // face index
        &face
    );

    if (error || !face) {
        return 0;
    }

    FontName name{family, style};
    if (name.family.empty() && face->family_name) name.family = face->family_name;
    if (name.style.empty() && face->style_name) name.style = face->style_name;
    if (name.family.empty()) name.family = "Unknown";
    if (name.style.empty()) name.style = "Regular";

    if (findFont(name) != 0) {
        RESTORE_LOG_WARN("font %s %s already registered", name.family.c_str(), name.style.c_str());
        FT_Done_Face(face);
        return 0;
    }

    std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy), std::move(name));
    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }

    RESTORE_LOG_DEBUG("registered font %u: %s %s", fontId,
        handle->name.family.c_str(), handle->name.style.c_str());
    fonts_[fontId] = std::move(handle);
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(
    const std::string& filePath,
    const std::string& family,
    const std::string& style
) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return 0;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size(), family, style);
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }
    if (it->second) destroyHandle(*it->second);
    fonts_.erase(it);
    loaded_.erase(fontId);
    return true;
}

std::uint32_t FontManager::findFont(const FontName& font) const {
    for (const auto& [id, handle] : fonts_) {
        if (handle && handle->name == font) return id;
    }
    return 0;
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    auto it = fonts_.find(fontId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

std::vector<FontName> FontManager::getRegisteredFonts() const {
    std::vector<FontName> names;
    names.reserve(fonts_.size());
    for (const auto& [id, handle] : fonts_) {
        if (handle) names.push_back(handle->name);
    }
    return names;
}

std::future<bool> FontManager::loadFontAsync(const FontName& font) {
    // Faces are parsed at registration, so the result is ready immediately.
    std::promise<bool> result;
    const std::uint32_t id = findFont(font);
    if (id != 0) loaded_.insert(id);
    result.set_value(id != 0);
    return result.get_future();
}

bool FontManager::isFontLoaded(const FontName& font) const {
    const std::uint32_t id = findFont(font);
    return id != 0 && loaded_.count(id) != 0;
}

std::optional<float> FontManager::measureTextWidth(
    const FontName& font,
    std::string_view text,
    float fontSize,
    float letterSpacing
) const {
    const FontHandle* handle = getFont(findFont(font));
    if (!handle || !handle->hbFont || fontSize <= 0.0f) {
        return std::nullopt;
    }

    // Widest line wins
    float width = 0.0f;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        width = std::max(width, shapeLineWidth(*handle, text.substr(start, end - start), fontSize, letterSpacing));
        start = end + 1;
    }
    return width;
}

float FontManager::shapeLineWidth(
    const FontHandle& handle,
    std::string_view line,
    float fontSize,
    float letterSpacing
) const {
    if (line.empty()) {
        return 0.0f;
    }

    // Char size in 26.6 fixed point at 72 DPI, mirrored on the HarfBuzz scale
    FT_Set_Char_Size(handle.ftFace, 0, static_cast<FT_F26Dot6>(fontSize * 64), 72, 72);
    hb_font_set_scale(handle.hbFont, static_cast<int>(fontSize * 64), static_cast<int>(fontSize * 64));

    hb_buffer_t* buffer = hb_buffer_create();
    hb_buffer_add_utf8(buffer, line.data(), static_cast<int>(line.size()), 0, -1);
    hb_buffer_guess_segment_properties(buffer);
    hb_shape(handle.hbFont, buffer, nullptr, 0);

    unsigned int glyphCount = 0;
    const hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(buffer, &glyphCount);

    const float scale = 1.0f / 64.0f;
    float width = 0.0f;
    for (unsigned int i = 0; glyphPos && i < glyphCount; ++i) {
        width += glyphPos[i].x_advance * scale;
    }
    width += letterSpacing * static_cast<float>(glyphCount);

    hb_buffer_destroy(buffer);
    return std::max(0.0f, width);
}

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData,
    FontName name
) {
    auto handle = std::make_unique<FontHandle>();
    handle->id = id;
    handle->name = std::move(name);
    handle->ftFace = face;
    handle->fontData = std::move(fontData);
    handle->unitsPerEM = face->units_per_EM ? static_cast<float>(face->units_per_EM) : 1000.0f;

    handle->hbFont = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont) {
        return nullptr;
    }
    return handle;
}

} // namespace restore::text
