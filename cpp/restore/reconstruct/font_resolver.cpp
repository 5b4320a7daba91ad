#include "restore/reconstruct/font_resolver.h"
#include "restore/reconstruct/geometry.h"
#include "restore/reconstruct/warnings.h"
#include "restore/core/logging.h"
#include "restore/core/types.h"

#include <exception>

namespace restore {

namespace {
    std::string cacheKey(const FontName& font) {
        return font.family + "::" + font.style;
    }
} // namespace

FontResolver::FontResolver(FontService& fonts, WarningCollector& warnings)
    : fonts_(fonts), warnings_(warnings) {}

FontName FontResolver::requestedFont(const SnapshotNode& node) {
    std::string family = kDefaultFontFamily;
    float weight = kDefaultFontWeight;
    if (node.style) {
        if (node.style->fontFamily && !node.style->fontFamily->empty()) family = *node.style->fontFamily;
        if (node.style->fontWeight) weight = *node.style->fontWeight;
    }
    return FontName{family, mapWeightToStyle(weight)};
}

FontName FontResolver::fallbackFont() {
    return FontName{kFallbackFontFamily, kFallbackFontStyle};
}

bool FontResolver::load(const FontName& font) {
    ++loadRequests_;
    std::future<bool> pending = fonts_.loadFontAsync(font);
    if (!pending.valid()) {
        return false;
    }
    try {
        return pending.get();
    } catch (const std::exception& e) {
        RESTORE_LOG_WARN("font load %s %s failed: %s", font.family.c_str(), font.style.c_str(), e.what());
        return false;
    }
}

FontName FontResolver::resolve(const FontName& font) {
    const std::string key = cacheKey(font);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }

    if (load(font)) {
        cache_.emplace(key, font);
        return font;
    }

    const FontName fallback = fallbackFont();
    if (!fallbackAttempted_) {
        fallbackAttempted_ = true;
        if (font == fallback) {
            fallbackLoaded_ = false;
        } else {
            fallbackLoaded_ = cache_.count(cacheKey(fallback)) != 0 || load(fallback);
        }
        if (!fallbackLoaded_) {
            RESTORE_LOG_WARN("fallback font %s %s could not be loaded", fallback.family.c_str(), fallback.style.c_str());
        }
    }
    warnings_.add("Font \"" + font.family + " " + font.style + "\" unavailable — using " +
                  fallback.family + " " + fallback.style);
    cache_.emplace(key, fallback);
    return fallback;
}

} // namespace restore
