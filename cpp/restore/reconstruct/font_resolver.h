#ifndef RESTORE_RECONSTRUCT_FONT_RESOLVER_H
#define RESTORE_RECONSTRUCT_FONT_RESOLVER_H

#include "restore/snapshot/snapshot_types.h"
#include "restore/text/font_service.h"
#include <string>
#include <unordered_map>

namespace restore {

class WarningCollector;

/**
 * FontResolver: turns a text node's style into a font the host has loaded.
 *
 * Lives for one reconstruction call. Each distinct (family, style) pair is
 * requested from the FontService at most once; a pair that fails maps to the
 * Inter Regular fallback and produces exactly one warning.
 */
class FontResolver {
public:
    FontResolver(FontService& fonts, WarningCollector& warnings);

    // Font requested by the node's style block (defaults: Inter, weight 400).
    static FontName requestedFont(const SnapshotNode& node);
    static FontName fallbackFont();

    /**
     * Loads `font` (waiting on the host) and returns the font to assign:
     * `font` itself on success, the fallback otherwise.
     */
    FontName resolve(const FontName& font);
    FontName resolve(const SnapshotNode& node) { return resolve(requestedFont(node)); }

    // Number of load requests issued to the host so far.
    std::size_t loadRequestCount() const { return loadRequests_; }

private:
    FontService& fonts_;
    WarningCollector& warnings_;
    std::unordered_map<std::string, FontName> cache_;
    bool fallbackAttempted_ = false;
    bool fallbackLoaded_ = false;
    std::size_t loadRequests_ = 0;

    bool load(const FontName& font);
};

} // namespace restore

#endif // RESTORE_RECONSTRUCT_FONT_RESOLVER_H
