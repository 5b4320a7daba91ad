#include "restore/reconstruct/session.h"
#include "restore/reconstruct/reconstruct.h"
#include "restore/snapshot/snapshot_json.h"
#include "restore/core/logging.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <stdexcept>

namespace restore {

ReconstructSession::ReconstructSession() : document_(fonts_) {
    if (!fonts_.initialize()) {
        RESTORE_LOG_WARN("font system unavailable; text will use no fonts");
    }
}

void ReconstructSession::clear() {
    document_.clear();
    lastRoot_ = kInvalidNodeId;
}

std::uintptr_t ReconstructSession::allocBytes(std::uint32_t byteCount) {
    void* p = std::malloc(byteCount);
    return reinterpret_cast<std::uintptr_t>(p);
}

void ReconstructSession::freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

std::uint32_t ReconstructSession::registerFont(
    std::uintptr_t ptr,
    std::uint32_t byteCount,
    const std::string& family,
    const std::string& style
) {
    const auto* data = reinterpret_cast<const std::uint8_t*>(ptr);
    return fonts_.loadFontFromMemory(data, byteCount, family, style);
}

void ReconstructSession::setViewportCenter(float x, float y) {
    document_.setViewportCenter(Vec2{x, y});
}

std::string ReconstructSession::reconstructJson(const std::string& snapshotJson, const std::string& rootLabel) {
    nlohmann::json out;
    ReconstructOptions options;
    if (!rootLabel.empty()) options.rootLabel = rootLabel;

    try {
        ReconstructionResult result = reconstructFromJson(snapshotJson, document_, fonts_, options);
        lastRoot_ = document_.selection().empty() ? kInvalidNodeId : document_.selection().front();
        out["rootNodeId"] = result.rootNodeId;
        out["warnings"] = result.warnings;
    } catch (const std::runtime_error& e) {
        lastRoot_ = kInvalidNodeId;
        out["error"] = e.what();
    }
    return out.dump();
}

std::string ReconstructSession::exportJson(NodeId id) const {
    if (!document_.getNode(id)) return {};
    SnapshotDocument doc;
    doc.document = document_.exportSnapshot(id);
    doc.name = doc.document->name;
    return buildSnapshotJson(doc);
}

} // namespace restore
