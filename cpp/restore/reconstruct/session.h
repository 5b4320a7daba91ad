#ifndef RESTORE_RECONSTRUCT_SESSION_H
#define RESTORE_RECONSTRUCT_SESSION_H

#include "restore/core/types.h"
#include "restore/scene/scene_document.h"
#include "restore/text/font_manager.h"
#include <cstdint>
#include <string>

namespace restore {

/**
 * ReconstructSession: self-contained document + font stack driven through
 * strings and raw buffers. This is the surface exported to JavaScript.
 */
class ReconstructSession {
public:
    ReconstructSession();

    // Non-copyable
    ReconstructSession(const ReconstructSession&) = delete;
    ReconstructSession& operator=(const ReconstructSession&) = delete;

    void clear();

    // Scratch memory for passing font blobs across the module boundary.
    std::uintptr_t allocBytes(std::uint32_t byteCount);
    void freeBytes(std::uintptr_t ptr);

    // Registers TTF/OTF data; empty family/style use the face's own names.
    // Returns the font id, or 0 on failure.
    std::uint32_t registerFont(std::uintptr_t ptr, std::uint32_t byteCount,
                               const std::string& family, const std::string& style);

    void setViewportCenter(float x, float y);

    /**
     * Reconstructs a JSON snapshot. Returns {"rootNodeId", "warnings"} as
     * JSON, or {"error": "..."} when the snapshot cannot be built at all.
     */
    std::string reconstructJson(const std::string& snapshotJson, const std::string& rootLabel);

    // Numeric id of the root built by the last successful reconstruction.
    NodeId lastRootId() const { return lastRoot_; }

    // Live subtree exported back to snapshot JSON ("" for an unknown id).
    std::string exportJson(NodeId id) const;

    std::uint32_t nodeCount() const { return static_cast<std::uint32_t>(document_.nodeCount()); }

    const SceneDocument& document() const { return document_; }
    text::FontManager& fonts() { return fonts_; }

private:
    text::FontManager fonts_;
    SceneDocument document_;
    NodeId lastRoot_ = kInvalidNodeId;
};

} // namespace restore

#endif // RESTORE_RECONSTRUCT_SESSION_H
