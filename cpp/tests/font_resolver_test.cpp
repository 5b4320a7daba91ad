#include "tests/test_common.h"
#include "restore/reconstruct/font_resolver.h"
#include "restore/reconstruct/warnings.h"

using namespace restore;
using namespace restore_test;

TEST(FontResolverTest, RequestedFontDefaults) {
    SnapshotNode bare = makeNode("TEXT", "t");
    const FontName f = FontResolver::requestedFont(bare);
    EXPECT_EQ(f.family, "Inter");
    EXPECT_EQ(f.style, "Regular");

    SnapshotNode bold = textNode("t", "x", "Roboto", 700);
    const FontName b = FontResolver::requestedFont(bold);
    EXPECT_EQ(b.family, "Roboto");
    EXPECT_EQ(b.style, "Bold");
}

TEST(FontResolverTest, InstalledFontResolvesToItself) {
    FakeFontService fonts;
    fonts.install("Roboto", "Bold");
    WarningCollector warnings;
    FontResolver resolver(fonts, warnings);

    const FontName f = resolver.resolve(FontName{"Roboto", "Bold"});
    EXPECT_EQ(f, (FontName{"Roboto", "Bold"}));
    EXPECT_TRUE(warnings.empty());
    EXPECT_TRUE(fonts.isFontLoaded(f));
}

TEST(FontResolverTest, MissingFontFallsBackWithOneWarningPerPair) {
    FakeFontService fonts;
    WarningCollector warnings;
    FontResolver resolver(fonts, warnings);

    const FontName a = resolver.resolve(FontName{"Brand Sans", "Bold"});
    const FontName b = resolver.resolve(FontName{"Brand Sans", "Bold"});
    const FontName c = resolver.resolve(FontName{"Brand Sans", "Light"});

    EXPECT_EQ(a, FontResolver::fallbackFont());
    EXPECT_EQ(b, FontResolver::fallbackFont());
    EXPECT_EQ(c, FontResolver::fallbackFont());
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings.messages()[0], "Font \"Brand Sans Bold\" unavailable — using Inter Regular");
    EXPECT_EQ(warnings.messages()[1], "Font \"Brand Sans Light\" unavailable — using Inter Regular");
}

TEST(FontResolverTest, EachPairIsRequestedOnce) {
    FakeFontService fonts;
    fonts.install("Roboto", "Regular");
    WarningCollector warnings;
    FontResolver resolver(fonts, warnings);

    resolver.resolve(FontName{"Roboto", "Regular"});
    resolver.resolve(FontName{"Roboto", "Regular"});
    resolver.resolve(FontName{"Missing", "Regular"});
    resolver.resolve(FontName{"Missing", "Regular"});

    // Roboto, Missing, fallback
    EXPECT_EQ(resolver.loadRequestCount(), 3u);
    EXPECT_EQ(fonts.requests.size(), 3u);
}

TEST(FontResolverTest, CacheIsScopedToResolverInstance) {
    FakeFontService fonts;
    WarningCollector first;
    {
        FontResolver resolver(fonts, first);
        resolver.resolve(FontName{"Missing", "Bold"});
    }
    WarningCollector second;
    {
        FontResolver resolver(fonts, second);
        resolver.resolve(FontName{"Missing", "Bold"});
    }
    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(second.size(), 1u);
}

TEST(FontResolverTest, BrokenPromiseCountsAsFailure) {
    class ThrowingFonts : public FakeFontService {
    public:
        std::future<bool> loadFontAsync(const FontName& font) override {
            if (font.family == "Inter") return FakeFontService::loadFontAsync(font);
            std::promise<bool> p;
            return p.get_future(); // destroyed unsatisfied: broken_promise on get()
        }
    };
    ThrowingFonts fonts;
    WarningCollector warnings;
    FontResolver resolver(fonts, warnings);
    EXPECT_EQ(resolver.resolve(FontName{"Roboto", "Bold"}), FontResolver::fallbackFont());
    EXPECT_EQ(warnings.size(), 1u);
}
